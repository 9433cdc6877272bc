#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "lifeline/recovery/resume_detector.hpp"
#include "lifeline/storage/sqlite_store.hpp"
#include "fixtures.hpp"

#include <sqlite3.h>

#include <filesystem>

using namespace lifeline::recovery;
using namespace lifeline::testing;
using lifeline::signals::CrashRisk;
using lifeline::storage::SqliteCheckpointStore;
using Catch::Matchers::WithinAbs;
using namespace std::chrono_literals;

namespace {

std::unique_ptr<SqliteCheckpointStore> memory_store() {
    return SqliteCheckpointStore::open(":memory:").value();
}

void corrupt_payload(const std::filesystem::path& db_path, const CheckpointId& id) {
    sqlite3* raw = nullptr;
    REQUIRE(sqlite3_open(db_path.string().c_str(), &raw) == SQLITE_OK);
    std::string sql = "UPDATE checkpoints SET payload = x'00' WHERE id = '" + id + "'";
    REQUIRE(sqlite3_exec(raw, sql.c_str(), nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(raw);
}

}  // namespace

TEST_CASE("Danger checkpoint from seconds ago is a crash to resume", "[resume]") {
    auto store = memory_store();
    auto cp = sample_checkpoint("sess_a", 1, kEpoch, CheckpointTrigger::DangerZone);
    REQUIRE(store->save(cp).is_ok());

    ResumeDetector detector(*store, ResumeConfig{});
    auto decision = detector.check_resume_needed("sess_a", kEpoch + 40s);

    REQUIRE(decision.interruption_reason == InterruptionReason::Crash);
    REQUIRE(decision.should_resume);
    REQUIRE(decision.confidence >= 0.5);
    REQUIRE(decision.time_since_checkpoint == 40s);
    REQUIRE(decision.checkpoint.has_value());
    REQUIRE(decision.checkpoint->id == cp.id);
    REQUIRE(decision.prompt.has_value());
    REQUIRE(decision.prompt->situation.rfind("Session interrupted due to crash", 0) == 0);
}

TEST_CASE("Clean session end is never resumed", "[resume]") {
    auto store = memory_store();
    REQUIRE(store->save(sample_checkpoint("sess_a", 1, kEpoch, CheckpointTrigger::SessionEnd)).is_ok());

    ResumeDetector detector(*store, ResumeConfig{});

    for (auto elapsed : {Duration{10s}, Duration{20min}, Duration{3h}, Duration{72h}}) {
        auto decision = detector.check_resume_needed("sess_a", kEpoch + elapsed);
        REQUIRE(decision.interruption_reason == InterruptionReason::ManualExit);
        REQUIRE_FALSE(decision.should_resume);
        REQUIRE_FALSE(decision.prompt.has_value());
    }
}

TEST_CASE("Sessions without checkpoints get a negative decision", "[resume]") {
    auto store = memory_store();
    ResumeDetector detector(*store, ResumeConfig{});

    auto decision = detector.check_resume_needed("sess_none", kEpoch);

    REQUIRE_FALSE(decision.should_resume);
    REQUIRE_FALSE(decision.checkpoint.has_value());
    REQUIRE(decision.confidence == 0.0);
}

TEST_CASE("Interruption classification", "[resume]") {
    auto store = memory_store();
    ResumeDetector detector(*store, ResumeConfig{});

    auto periodic = sample_checkpoint("sess_a", 1, kEpoch, CheckpointTrigger::TimeInterval);

    SECTION("long quiet gap is a timeout") {
        REQUIRE(detector.classify(periodic, 45min) == InterruptionReason::Timeout);
    }

    SECTION("short gap with safe signals is unknown") {
        REQUIRE(detector.classify(periodic, 5min) == InterruptionReason::Unknown);
        REQUIRE(detector.classify(periodic, 20min) == InterruptionReason::Unknown);
    }

    SECTION("recorded warning inside the crash window is a crash") {
        periodic.signals.crash_risk = CrashRisk::Warning;
        REQUIRE(detector.classify(periodic, 10min) == InterruptionReason::Crash);
        REQUIRE(detector.classify(periodic, 45min) == InterruptionReason::Unknown);
    }
}

TEST_CASE("Confidence combines recency, trigger and completeness", "[resume]") {
    auto store = memory_store();
    ResumeDetector detector(*store, ResumeConfig{});

    auto danger = sample_checkpoint("sess_a", 1, kEpoch, CheckpointTrigger::DangerZone);
    REQUIRE_THAT(detector.confidence(danger, 1min), WithinAbs(1.0, 1e-9));

    auto periodic = sample_checkpoint("sess_a", 1, kEpoch, CheckpointTrigger::ToolCallInterval);
    REQUIRE_THAT(detector.confidence(periodic, 1min), WithinAbs(0.4 + 0.35 * 0.5 + 0.25, 1e-9));

    Checkpoint bare;
    bare.triggered_by = CheckpointTrigger::SessionStart;
    REQUIRE_THAT(detector.confidence(bare, 24h), WithinAbs(0.35 * 0.3, 1e-9));

    // Older is never more confident
    REQUIRE(detector.confidence(periodic, 2h) < detector.confidence(periodic, 1h));
}

TEST_CASE("Stale, thin checkpoints fall below the bar", "[resume]") {
    auto store = memory_store();
    auto cp = sample_checkpoint("sess_a", 1, kEpoch, CheckpointTrigger::SessionStart);
    cp.task = {};
    REQUIRE(store->save(cp).is_ok());

    ResumeDetector detector(*store, ResumeConfig{});
    auto decision = detector.check_resume_needed("sess_a", kEpoch + 23h);

    REQUIRE(decision.interruption_reason == InterruptionReason::Timeout);
    REQUIRE(decision.confidence < 0.5);
    REQUIRE_FALSE(decision.should_resume);
    REQUIRE(decision.checkpoint.has_value());
}

TEST_CASE("Corrupt checkpoints fall back to older ones", "[resume]") {
    auto dir = std::filesystem::temp_directory_path() / ("lifeline_resume_" + UUID::generate().to_string());
    auto path = dir / "lifeline.db";
    auto store = SqliteCheckpointStore::open(path).value();

    std::vector<Checkpoint> cps;
    for (int i = 1; i <= 4; ++i) {
        cps.push_back(sample_checkpoint("sess_a", i, kEpoch + std::chrono::minutes{i},
                                        CheckpointTrigger::WarningZone));
        REQUIRE(store->save(cps.back()).is_ok());
    }

    ResumeDetector detector(*store, ResumeConfig{});

    SECTION("newest corrupt") {
        corrupt_payload(path, cps[3].id);

        auto decision = detector.check_resume_needed("sess_a", kEpoch + 6min);
        REQUIRE(decision.skipped_corrupt == 1);
        REQUIRE(decision.checkpoint.has_value());
        REQUIRE(decision.checkpoint->checkpoint_number == 3);
        REQUIRE(decision.should_resume);
    }

    SECTION("attempts are capped") {
        corrupt_payload(path, cps[3].id);
        corrupt_payload(path, cps[2].id);
        corrupt_payload(path, cps[1].id);

        auto decision = detector.check_resume_needed("sess_a", kEpoch + 6min);
        REQUIRE(decision.skipped_corrupt == 3);
        REQUIRE_FALSE(decision.checkpoint.has_value());
        REQUIRE_FALSE(decision.should_resume);
    }

    store.reset();
    std::filesystem::remove_all(dir);
}

TEST_CASE("Accepting a resume records it once", "[resume]") {
    auto store = memory_store();
    auto cp = sample_checkpoint("sess_a", 1, kEpoch, CheckpointTrigger::DangerZone);
    REQUIRE(store->save(cp).is_ok());

    ResumeDetector detector(*store, ResumeConfig{});
    auto decision = detector.check_resume_needed("sess_a", kEpoch + 40s);
    REQUIRE(decision.should_resume);

    auto event = detector.consume(decision, true, kEpoch + 1min);
    REQUIRE(event.is_ok());
    REQUIRE(event.value().success);
    REQUIRE(event.value().user_confirmed == true);
    REQUIRE(event.value().interruption_reason == InterruptionReason::Crash);
    REQUIRE_THAT(event.value().fidelity_score, WithinAbs(1.0, 1e-9));

    auto stored = store->get_by_id(cp.id).value();
    REQUIRE(stored.is_restored());
    REQUIRE(stored.restore_success == true);

    auto again = detector.consume(decision, true, kEpoch + 2min);
    REQUIRE(again.is_err());
    REQUIRE(again.error().code == ErrorCode::AlreadyRestored);
    REQUIRE(store->list_resume_events("sess_a").value().size() == 1);

    // The consumed checkpoint is not offered again
    auto later = detector.check_resume_needed("sess_a", kEpoch + 3min);
    REQUIRE_FALSE(later.should_resume);
    REQUIRE_FALSE(later.checkpoint.has_value());
}

TEST_CASE("Declining a resume consumes the checkpoint", "[resume]") {
    auto store = memory_store();
    REQUIRE(store->save(sample_checkpoint("sess_a", 1, kEpoch, CheckpointTrigger::DangerZone)).is_ok());

    ResumeDetector detector(*store, ResumeConfig{});
    auto decision = detector.check_resume_needed("sess_a", kEpoch + 40s);

    auto event = detector.consume(decision, false, kEpoch + 1min);
    REQUIRE(event.is_ok());
    REQUIRE_FALSE(event.value().success);
    REQUIRE(event.value().notes == std::optional<std::string>("declined"));
    REQUIRE(event.value().fidelity_score == 0.0);

    auto stored = store->get_by_id(decision.checkpoint->id).value();
    REQUIRE(stored.restore_success == false);

    ResumeDecision empty;
    empty.session_id = "sess_a";
    REQUIRE(detector.consume(empty, true).error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("Restored state returns the checkpoint sections", "[resume]") {
    auto store = memory_store();
    auto cp = sample_checkpoint("sess_a", 1);
    cp.files = {};
    cp.tools = {};
    REQUIRE(store->save(cp).is_ok());

    ResumeDetector detector(*store, ResumeConfig{});
    auto state = detector.restore_state(cp.id);

    REQUIRE(state.is_ok());
    REQUIRE(state.value().conversation == cp.conversation);
    REQUIRE(state.value().task == cp.task);
    REQUIRE(state.value().files.empty());
    REQUIRE(state.value().user_preferences == cp.user_preferences);
    REQUIRE_THAT(state.value().fidelity, WithinAbs(0.7, 1e-9));

    REQUIRE(detector.restore_state("cp_missing").error().code == ErrorCode::CheckpointNotFound);
}
