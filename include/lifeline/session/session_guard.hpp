#pragma once

#include "lifeline/checkpoint/checkpoint_manager.hpp"
#include "lifeline/core/config.hpp"
#include "lifeline/core/result.hpp"
#include "lifeline/recovery/resume_detector.hpp"
#include "lifeline/signals/risk_signal_aggregator.hpp"
#include "lifeline/storage/checkpoint_store.hpp"

#include <memory>
#include <optional>
#include <string>

namespace lifeline::session {

using namespace lifeline::core;
using checkpoint::CheckpointInput;
using checkpoint::CheckpointResult;
using recovery::ResumeDecision;
using signals::SignalEvent;
using storage::ResumeEvent;

struct SessionStatus {
    SessionId session_id;
    int checkpoint_count = 0;
    std::optional<storage::CheckpointHeader> last_checkpoint;
    std::optional<Duration> time_since_last_checkpoint;
    bool recovery_available = false;
    signals::CrashRisk latest_risk = signals::CrashRisk::Safe;
    std::vector<std::string> risk_factors;
    int signal_history_count = 0;

    Json to_json() const;
};

struct MaintenanceReport {
    int checkpoints_deleted = 0;
    int signal_records_deleted = 0;

    Json to_json() const;
};

// Entry point for a host session: signals in, checkpoints out, resume
// decisions on start. Owns the store and wires the components together.
class SessionGuard {
public:
    SessionGuard(std::unique_ptr<storage::CheckpointStore> store, const Config& config);
    ~SessionGuard();

    // Open the configured SQLite store and build a guard on it
    static Result<std::unique_ptr<SessionGuard>, Error> open(const Config& config);

    // Fire-and-forget signal update
    void observe(const SessionId& session_id, const SignalEvent& event);

    // Record the current signals and checkpoint if the trigger policy fires
    Result<std::optional<CheckpointResult>, Error> report_snapshot(CheckpointInput input,
                                                                   TimePoint at = now());

    Result<CheckpointResult, Error> force_checkpoint(CheckpointInput input,
                                                     const std::string& reason,
                                                     TimePoint at = now());

    // Called once when a session starts
    ResumeDecision on_session_start(const SessionId& session_id, TimePoint at = now());

    // Caller accepted or declined the offered resume
    Result<ResumeEvent, Error> resolve_resume(const ResumeDecision& decision, bool accepted,
                                              TimePoint at = now());

    Result<recovery::RestoredState, Error> restore_state(const CheckpointId& checkpoint_id);

    // Final session_end checkpoint, then the session's counters are dropped
    Result<CheckpointResult, Error> end_session(CheckpointInput final_state, TimePoint at = now());

    Result<SessionStatus, Error> session_status(const SessionId& session_id, TimePoint at = now());

    // Age-based retention for checkpoints and signal history
    Result<MaintenanceReport, Error> run_maintenance(TimePoint at = now());

    storage::CheckpointStore& store() { return *store_; }
    signals::RiskSignalAggregator& aggregator() { return aggregator_; }
    checkpoint::CheckpointManager& manager() { return manager_; }
    recovery::ResumeDetector& detector() { return detector_; }
    const Config& config() const { return config_; }

private:
    Config config_;
    std::unique_ptr<storage::CheckpointStore> store_;
    signals::RiskSignalAggregator aggregator_;
    checkpoint::CheckpointManager manager_;
    recovery::ResumeDetector detector_;
};

}  // namespace lifeline::session
