#include "lifeline/session/session_guard.hpp"
#include "lifeline/storage/sqlite_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace lifeline::session {

Json SessionStatus::to_json() const {
    Json j{
        {"session_id", session_id},
        {"checkpoint_count", checkpoint_count},
        {"recovery_available", recovery_available},
        {"latest_risk", std::string(signals::crash_risk_to_string(latest_risk))},
        {"risk_factors", risk_factors},
        {"signal_history_count", signal_history_count}
    };
    if (last_checkpoint) {
        j["last_checkpoint"] = {
            {"id", last_checkpoint->id},
            {"checkpoint_number", last_checkpoint->checkpoint_number},
            {"triggered_by", std::string(checkpoint::trigger_to_string(last_checkpoint->triggered_by))},
            {"created_at", to_millis(last_checkpoint->created_at)},
            {"restored", last_checkpoint->is_restored()}
        };
    }
    if (time_since_last_checkpoint) {
        j["time_since_last_checkpoint"] = recovery::format_duration(*time_since_last_checkpoint);
    }
    return j;
}

Json MaintenanceReport::to_json() const {
    return Json{
        {"checkpoints_deleted", checkpoints_deleted},
        {"signal_records_deleted", signal_records_deleted}
    };
}

SessionGuard::SessionGuard(std::unique_ptr<storage::CheckpointStore> store, const Config& config)
    : config_(config)
    , store_(std::move(store))
    , aggregator_(config.risk, config.checkpoint)
    , manager_(*store_, aggregator_, config)
    , detector_(*store_, config.resume)
{
}

SessionGuard::~SessionGuard() = default;

Result<std::unique_ptr<SessionGuard>, Error> SessionGuard::open(const Config& config) {
    using R = Result<std::unique_ptr<SessionGuard>, Error>;

    auto store = storage::SqliteCheckpointStore::open(config.storage.database_path, config.storage.wal);
    if (store.is_err()) {
        return R::err(std::move(store).error());
    }
    return R::ok(std::make_unique<SessionGuard>(std::move(store).value(), config));
}

void SessionGuard::observe(const SessionId& session_id, const SignalEvent& event) {
    try {
        aggregator_.observe(session_id, event);
    } catch (const std::exception& e) {
        spdlog::warn("Dropped signal event for session {}: {}", session_id, e.what());
    }
}

Result<std::optional<CheckpointResult>, Error> SessionGuard::report_snapshot(CheckpointInput input,
                                                                             TimePoint at) {
    try {
        auto snapshot = aggregator_.assess(input.session_id, at);
        auto recorded = store_->append_signal_record(input.session_id, snapshot);
        if (recorded.is_err()) {
            spdlog::warn("Failed to record signal history for session {}: {}",
                         input.session_id, recorded.error().message);
        }
    } catch (const std::exception& e) {
        spdlog::warn("Failed to record signal history for session {}: {}", input.session_id, e.what());
    }

    return manager_.auto_checkpoint(std::move(input), at);
}

Result<CheckpointResult, Error> SessionGuard::force_checkpoint(CheckpointInput input,
                                                               const std::string& reason,
                                                               TimePoint at) {
    return manager_.force_checkpoint(std::move(input), reason, at);
}

ResumeDecision SessionGuard::on_session_start(const SessionId& session_id, TimePoint at) {
    aggregator_.begin_session(session_id, at);
    return detector_.check_resume_needed(session_id, at);
}

Result<ResumeEvent, Error> SessionGuard::resolve_resume(const ResumeDecision& decision, bool accepted,
                                                        TimePoint at) {
    auto event = detector_.consume(decision, accepted, at);
    if (event.is_err()) {
        spdlog::warn("Resume resolution for session {} failed: {}",
                     decision.session_id, event.error().to_string());
    }
    return event;
}

Result<recovery::RestoredState, Error> SessionGuard::restore_state(const CheckpointId& checkpoint_id) {
    return detector_.restore_state(checkpoint_id);
}

Result<CheckpointResult, Error> SessionGuard::end_session(CheckpointInput final_state, TimePoint at) {
    SessionId session_id = final_state.session_id;
    auto result = manager_.create_checkpoint(std::move(final_state),
                                             checkpoint::CheckpointTrigger::SessionEnd, at);
    if (result.is_err()) {
        spdlog::warn("Final checkpoint for session {} failed: {}", session_id, result.error().to_string());
    }
    aggregator_.end_session(session_id);
    return result;
}

Result<SessionStatus, Error> SessionGuard::session_status(const SessionId& session_id, TimePoint at) {
    try {
        SessionStatus status;
        status.session_id = session_id;

        auto stats = manager_.checkpoint_stats(session_id);
        if (stats.is_err()) {
            return std::move(stats).error();
        }
        status.checkpoint_count = stats.value().count;
        status.last_checkpoint = stats.value().last;

        if (status.last_checkpoint) {
            Duration since = std::max(Duration{0}, at - status.last_checkpoint->created_at);
            status.time_since_last_checkpoint = since;
            status.recovery_available = !status.last_checkpoint->is_restored() &&
                status.last_checkpoint->triggered_by != checkpoint::CheckpointTrigger::SessionEnd &&
                since < std::chrono::hours{config_.resume.recency_horizon_hours};
        }

        if (aggregator_.has_session(session_id)) {
            auto snapshot = aggregator_.assess(session_id, at);
            status.latest_risk = snapshot.crash_risk;
            status.risk_factors = snapshot.risk_factors;
        } else {
            auto latest = store_->latest_signal_record(session_id);
            if (latest.is_ok() && latest.value()) {
                status.latest_risk = latest.value()->snapshot.crash_risk;
                status.risk_factors = latest.value()->snapshot.risk_factors;
            }
        }

        auto history = store_->count_signal_history(session_id);
        if (history.is_err()) {
            return std::move(history).error();
        }
        status.signal_history_count = history.value();

        return status;
    } catch (const std::exception& e) {
        spdlog::error("Status query for session {} failed: {}", session_id, e.what());
        return Error::from_exception(e).with_source("session_guard");
    }
}

Result<MaintenanceReport, Error> SessionGuard::run_maintenance(TimePoint at) {
    try {
        MaintenanceReport report;

        auto checkpoints = store_->cleanup(config_.checkpoint.retention_days, at);
        if (checkpoints.is_err()) {
            return std::move(checkpoints).error();
        }
        report.checkpoints_deleted = checkpoints.value();

        auto history = store_->cleanup_signal_history(config_.checkpoint.retention_days, at);
        if (history.is_err()) {
            return std::move(history).error();
        }
        report.signal_records_deleted = history.value();

        spdlog::info("Maintenance removed {} checkpoints and {} signal records",
                     report.checkpoints_deleted, report.signal_records_deleted);
        return report;
    } catch (const std::exception& e) {
        spdlog::error("Maintenance failed: {}", e.what());
        return Error::from_exception(e).with_source("session_guard");
    }
}

}  // namespace lifeline::session
