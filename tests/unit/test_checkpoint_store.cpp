#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "lifeline/storage/sqlite_store.hpp"
#include "fixtures.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <atomic>
#include <thread>

using namespace lifeline::storage;
using namespace lifeline::testing;
using lifeline::signals::CrashRisk;
using Catch::Matchers::WithinAbs;
using namespace std::chrono_literals;

namespace {

std::unique_ptr<SqliteCheckpointStore> memory_store() {
    auto opened = SqliteCheckpointStore::open(":memory:");
    REQUIRE(opened.is_ok());
    return std::move(opened).value();
}

std::filesystem::path temp_db_path() {
    return std::filesystem::temp_directory_path() / ("lifeline_store_" + UUID::generate().to_string()) / "lifeline.db";
}

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

}  // namespace

TEST_CASE("Store creates its schema", "[store]") {
    auto store = memory_store();

    auto tables = store->tables();
    REQUIRE(tables.is_ok());
    REQUIRE(contains(tables.value(), "checkpoints"));
    REQUIRE(contains(tables.value(), "resume_events"));
    REQUIRE(contains(tables.value(), "signal_history"));
    REQUIRE(contains(tables.value(), "schema_version"));

    auto indices = store->indices();
    REQUIRE(indices.is_ok());
    REQUIRE(contains(indices.value(), "idx_checkpoints_session"));
    REQUIRE(contains(indices.value(), "idx_checkpoints_unrestored"));
    REQUIRE(contains(indices.value(), "idx_signal_history_session"));

    REQUIRE(store->schema_version().value() == 1);
    REQUIRE(store->journal_mode().value() == "memory");
}

TEST_CASE("File store uses WAL and survives reopening", "[store]") {
    auto path = temp_db_path();
    auto cp = sample_checkpoint("sess_file", 1);

    {
        auto opened = SqliteCheckpointStore::open(path);
        REQUIRE(opened.is_ok());
        auto store = std::move(opened).value();
        REQUIRE(store->journal_mode().value() == "wal");
        REQUIRE(store->save(cp).is_ok());
    }

    {
        auto opened = SqliteCheckpointStore::open(path);
        REQUIRE(opened.is_ok());
        auto store = std::move(opened).value();
        REQUIRE(store->schema_version().value() == 1);

        auto loaded = store->get_by_id(cp.id);
        REQUIRE(loaded.is_ok());
        REQUIRE(loaded.value() == cp);
    }

    std::filesystem::remove_all(path.parent_path());
}

TEST_CASE("Saved checkpoints load back unchanged", "[store]") {
    auto store = memory_store();
    auto cp = sample_checkpoint("sess_a", 1);
    cp.description = "manual";

    REQUIRE(store->save(cp).is_ok());

    auto loaded = store->get_by_id(cp.id);
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value() == cp);

    auto missing = store->get_by_id("cp_missing");
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == ErrorCode::CheckpointNotFound);

    auto size = store->checkpoint_size(cp.id);
    REQUIRE(size.is_ok());
    REQUIRE(size.value().compressed > 0);
    REQUIRE(size.value().uncompressed > 0);
}

TEST_CASE("Checkpoint numbers are unique per session", "[store]") {
    auto store = memory_store();

    REQUIRE(store->save(sample_checkpoint("sess_a", 1)).is_ok());
    REQUIRE(store->save(sample_checkpoint("sess_b", 1)).is_ok());

    auto duplicate = store->save(sample_checkpoint("sess_a", 1));
    REQUIRE(duplicate.is_err());
    REQUIRE(duplicate.error().code == ErrorCode::DuplicateCheckpointNumber);

    auto cp = sample_checkpoint("sess_a", 2);
    REQUIRE(store->save(cp).is_ok());
    auto same_id = sample_checkpoint("sess_a", 3);
    same_id.id = cp.id;
    REQUIRE(store->save(same_id).error().code == ErrorCode::AlreadyExists);

    REQUIRE(store->count_checkpoints("sess_a").value() == 2);
    REQUIRE(store->next_checkpoint_number("sess_a").value() == 3);
    REQUIRE(store->next_checkpoint_number("sess_new").value() == 1);
}

TEST_CASE("Session queries are ordered", "[store]") {
    auto store = memory_store();
    auto first = sample_checkpoint("sess_a", 1, kEpoch);
    auto second = sample_checkpoint("sess_a", 2, kEpoch + 1min);
    auto third = sample_checkpoint("sess_a", 3, kEpoch + 2min, CheckpointTrigger::DangerZone);
    third.signals.crash_risk = CrashRisk::Danger;

    REQUIRE(store->save(second).is_ok());
    REQUIRE(store->save(third).is_ok());
    REQUIRE(store->save(first).is_ok());

    auto recent = store->get_most_recent("sess_a");
    REQUIRE(recent.is_ok());
    REQUIRE(recent.value()->id == third.id);

    auto listed = store->list_by_session("sess_a");
    REQUIRE(listed.value().size() == 3);
    REQUIRE(listed.value()[0].checkpoint_number == 1);
    REQUIRE(listed.value()[2].checkpoint_number == 3);

    auto headers = store->list_headers("sess_a");
    REQUIRE(headers.value().front().id == third.id);
    REQUIRE(headers.value().front().triggered_by == CheckpointTrigger::DangerZone);
    REQUIRE(headers.value().front().operation == "Migrate queries");
    REQUIRE(headers.value().back().id == first.id);

    auto risky = store->list_by_risk(CrashRisk::Danger);
    REQUIRE(risky.value().size() == 1);
    REQUIRE(risky.value()[0].id == third.id);

    REQUIRE_FALSE(store->get_most_recent("sess_none").value().has_value());
    REQUIRE(store->list_by_session("sess_none").value().empty());
}

TEST_CASE("A checkpoint can be restored once", "[store]") {
    auto store = memory_store();
    auto older = sample_checkpoint("sess_a", 1, kEpoch);
    auto cp = sample_checkpoint("sess_a", 2, kEpoch + 1min);
    REQUIRE(store->save(older).is_ok());
    REQUIRE(store->save(cp).is_ok());

    REQUIRE(store->mark_restored(cp.id, true, 0.9, kEpoch + 5min).is_ok());

    auto again = store->mark_restored(cp.id, false, 0.1, kEpoch + 6min);
    REQUIRE(again.is_err());
    REQUIRE(again.error().code == ErrorCode::AlreadyRestored);

    auto loaded = store->get_by_id(cp.id).value();
    REQUIRE(loaded.restored_at == kEpoch + 5min);
    REQUIRE(loaded.restore_success == true);
    REQUIRE_THAT(*loaded.restore_fidelity, WithinAbs(0.9, 1e-9));

    auto unrestored = store->get_most_recent_unrestored("sess_a");
    REQUIRE(unrestored.value()->id == older.id);

    REQUIRE(store->mark_restored("cp_missing", true, 1.0).error().code == ErrorCode::CheckpointNotFound);
}

TEST_CASE("A failed resume record leaves the checkpoint unrestored", "[store]") {
    auto store = memory_store();
    auto cp = sample_checkpoint("sess_a", 1, kEpoch);
    REQUIRE(store->save(cp).is_ok());

    ResumeEvent event;
    event.id = generate_resume_event_id();
    event.checkpoint_id = cp.id;
    event.session_id = "sess_a";
    event.restored_at = kEpoch + 2min;
    event.interruption_reason = InterruptionReason::Crash;
    event.user_confirmed = true;
    event.success = true;
    event.fidelity_score = 0.8;

    // Same event id already taken, so the insert half fails
    REQUIRE(store->save_resume_event(event).is_ok());
    REQUIRE(store->record_resume(event).is_err());
    REQUIRE_FALSE(store->get_by_id(cp.id).value().is_restored());
    REQUIRE(store->list_resume_events("sess_a").value().size() == 1);

    event.id = generate_resume_event_id();
    REQUIRE(store->record_resume(event).is_ok());
    auto loaded = store->get_by_id(cp.id).value();
    REQUIRE(loaded.restored_at == kEpoch + 2min);
    REQUIRE_THAT(*loaded.restore_fidelity, WithinAbs(0.8, 1e-9));
    REQUIRE(store->list_resume_events("sess_a").value().size() == 2);

    auto again = store->record_resume(event);
    REQUIRE(again.is_err());
    REQUIRE(again.error().code == ErrorCode::AlreadyRestored);
    REQUIRE(store->list_resume_events("sess_a").value().size() == 2);
}

TEST_CASE("Concurrent restores have a single winner", "[store]") {
    auto store = memory_store();
    auto cp = sample_checkpoint("sess_a", 1);
    REQUIRE(store->save(cp).is_ok());

    std::atomic<int> succeeded{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            auto result = store->mark_restored(cp.id, true, 1.0);
            if (result.is_ok()) {
                succeeded++;
            } else if (result.error().code == ErrorCode::AlreadyRestored) {
                rejected++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(succeeded.load() == 1);
    REQUIRE(rejected.load() == 7);
}

TEST_CASE("Retention cleanup keeps the newest checkpoint of every session", "[store]") {
    const TimePoint at = kEpoch + std::chrono::hours{24 * 100};

    for (int days : {0, 1, 7, 30, 99, 365}) {
        auto store = memory_store();

        // sess_a: all ancient. sess_b: mixed ages. sess_c: one checkpoint.
        for (int i = 1; i <= 4; ++i) {
            REQUIRE(store->save(sample_checkpoint("sess_a", i, kEpoch + std::chrono::minutes{i})).is_ok());
        }
        for (int i = 1; i <= 4; ++i) {
            REQUIRE(store->save(sample_checkpoint("sess_b", i, at - std::chrono::hours{24 * 20 * (5 - i)})).is_ok());
        }
        REQUIRE(store->save(sample_checkpoint("sess_c", 1, kEpoch)).is_ok());

        auto newest_a = store->get_most_recent("sess_a").value()->id;
        auto newest_b = store->get_most_recent("sess_b").value()->id;
        auto newest_c = store->get_most_recent("sess_c").value()->id;

        auto deleted = store->cleanup(days, at);
        REQUIRE(deleted.is_ok());

        REQUIRE(store->get_by_id(newest_a).is_ok());
        REQUIRE(store->get_by_id(newest_b).is_ok());
        REQUIRE(store->get_by_id(newest_c).is_ok());

        int remaining = store->count_checkpoints("sess_a").value() +
                        store->count_checkpoints("sess_b").value() +
                        store->count_checkpoints("sess_c").value();
        REQUIRE(remaining + deleted.value() == 9);
    }

    auto store = memory_store();
    REQUIRE(store->cleanup(-1).error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("Cleanup removes only checkpoints past the cutoff", "[store]") {
    auto store = memory_store();
    const TimePoint at = kEpoch + std::chrono::hours{24 * 60};

    REQUIRE(store->save(sample_checkpoint("sess_a", 1, kEpoch)).is_ok());
    REQUIRE(store->save(sample_checkpoint("sess_a", 2, at - std::chrono::hours{24 * 10})).is_ok());
    REQUIRE(store->save(sample_checkpoint("sess_a", 3, at - std::chrono::hours{1})).is_ok());

    REQUIRE(store->cleanup(30, at).value() == 1);

    auto remaining = store->list_by_session("sess_a").value();
    REQUIRE(remaining.size() == 2);
    REQUIRE(remaining[0].checkpoint_number == 2);
}

TEST_CASE("Pruning keeps the newest checkpoints of a session", "[store]") {
    auto store = memory_store();
    for (int i = 1; i <= 6; ++i) {
        REQUIRE(store->save(sample_checkpoint("sess_a", i, kEpoch + std::chrono::minutes{i})).is_ok());
    }
    REQUIRE(store->save(sample_checkpoint("sess_b", 1)).is_ok());

    REQUIRE(store->prune_session("sess_a", 4).value() == 2);

    auto remaining = store->list_by_session("sess_a").value();
    REQUIRE(remaining.size() == 4);
    REQUIRE(remaining.front().checkpoint_number == 3);
    REQUIRE(store->count_checkpoints("sess_b").value() == 1);

    // Never below one
    REQUIRE(store->prune_session("sess_a", 0).value() == 3);
    REQUIRE(store->get_most_recent("sess_a").value()->checkpoint_number == 6);
}

TEST_CASE("Resume events are appended per session", "[store]") {
    auto store = memory_store();

    ResumeEvent event;
    event.id = generate_resume_event_id();
    event.checkpoint_id = "cp_1";
    event.session_id = "sess_a";
    event.restored_at = kEpoch;
    event.interruption_reason = InterruptionReason::Crash;
    event.time_since_checkpoint = 40s;
    event.resume_confidence = 0.95;
    event.user_confirmed = true;
    event.success = true;
    event.fidelity_score = 1.0;

    REQUIRE(store->save_resume_event(event).is_ok());

    auto declined = event;
    declined.id = generate_resume_event_id();
    declined.restored_at = kEpoch + 1min;
    declined.success = false;
    declined.user_confirmed = false;
    declined.notes = "declined";
    REQUIRE(store->save_resume_event(declined).is_ok());

    auto events = store->list_resume_events("sess_a");
    REQUIRE(events.is_ok());
    REQUIRE(events.value().size() == 2);
    REQUIRE(events.value()[0].id == declined.id);
    REQUIRE(events.value()[0].notes == std::optional<std::string>("declined"));
    REQUIRE(events.value()[1].interruption_reason == InterruptionReason::Crash);
    REQUIRE(events.value()[1].time_since_checkpoint == 40s);
    REQUIRE_FALSE(events.value()[1].notes.has_value());

    REQUIRE(store->list_resume_events("sess_b").value().empty());
}

TEST_CASE("Signal history accepts snapshots with invalid UTF-8 text", "[store]") {
    auto store = memory_store();

    SignalSnapshot snapshot;
    snapshot.captured_at = kEpoch;
    snapshot.error_patterns = {"\xff\xfe bad"};

    auto appended = store->append_signal_record("sess_a", snapshot);
    REQUIRE(appended.is_ok());
    REQUIRE(appended.value().snapshot_number == 1);
    REQUIRE(store->count_signal_history("sess_a").value() == 1);
}

TEST_CASE("Signal history is numbered per session", "[store]") {
    auto store = memory_store();

    SignalSnapshot calm;
    calm.captured_at = kEpoch;
    SignalSnapshot tense = calm;
    tense.captured_at = kEpoch + 10min;
    tense.crash_risk = CrashRisk::Danger;
    tense.risk_factors = {"High message count"};

    REQUIRE(store->append_signal_record("sess_a", calm).value().snapshot_number == 1);
    REQUIRE(store->append_signal_record("sess_a", tense).value().snapshot_number == 2);
    REQUIRE(store->append_signal_record("sess_b", calm).value().snapshot_number == 1);

    auto latest = store->latest_signal_record("sess_a");
    REQUIRE(latest.is_ok());
    REQUIRE(latest.value()->snapshot_number == 2);
    REQUIRE(latest.value()->snapshot == tense);
    REQUIRE(latest.value()->crash_risk() == CrashRisk::Danger);

    REQUIRE(store->list_signal_history("sess_a").value().size() == 2);
    REQUIRE(store->signal_history_by_risk(CrashRisk::Danger).value().size() == 1);
    REQUIRE(store->signal_history_between(kEpoch + 5min, kEpoch + 15min).value().size() == 1);
    REQUIRE(store->count_signal_history("sess_a").value() == 2);
    REQUIRE_FALSE(store->latest_signal_record("sess_none").value().has_value());

    REQUIRE(store->cleanup_signal_history(1, kEpoch + std::chrono::hours{24} + 5min).value() == 2);
    REQUIRE(store->count_signal_history("sess_a").value() == 1);

    REQUIRE(store->delete_signal_history("sess_a").is_ok());
    REQUIRE(store->count_signal_history("sess_a").value() == 0);
}

TEST_CASE("Damaged payloads load as CorruptData", "[store]") {
    auto path = temp_db_path();
    auto cp = sample_checkpoint("sess_a", 1);

    auto opened = SqliteCheckpointStore::open(path);
    REQUIRE(opened.is_ok());
    auto store = std::move(opened).value();
    REQUIRE(store->save(cp).is_ok());

    sqlite3* raw = nullptr;
    REQUIRE(sqlite3_open(path.string().c_str(), &raw) == SQLITE_OK);
    REQUIRE(sqlite3_exec(raw, "UPDATE checkpoints SET payload = x'00'", nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(raw);

    auto loaded = store->get_by_id(cp.id);
    REQUIRE(loaded.is_err());
    REQUIRE(loaded.error().code == ErrorCode::CorruptData);
    REQUIRE(loaded.error().context == std::optional<std::string>(cp.id));

    // Headers remain readable
    REQUIRE(store->list_headers("sess_a").value().size() == 1);

    store.reset();
    std::filesystem::remove_all(path.parent_path());
}
