#pragma once

#include "lifeline/checkpoint/checkpoint.hpp"
#include "lifeline/core/types.hpp"
#include "lifeline/signals/signal_snapshot.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace lifeline::storage {

using namespace lifeline::core;
using checkpoint::Checkpoint;
using checkpoint::CheckpointTrigger;
using signals::CrashRisk;
using signals::SignalSnapshot;

// Likely cause of the previous session ending
enum class InterruptionReason {
    Crash,
    Timeout,
    ManualExit,
    Unknown
};

std::string_view interruption_reason_to_string(InterruptionReason reason);
InterruptionReason interruption_reason_from_string(std::string_view str);

// Queryable columns of a stored checkpoint, available without decoding
struct CheckpointHeader {
    CheckpointId id;
    SessionId session_id;
    int checkpoint_number = 0;
    TimePoint created_at{};
    CheckpointTrigger triggered_by = CheckpointTrigger::ToolCallInterval;
    CrashRisk crash_risk = CrashRisk::Safe;
    std::string operation;
    double progress = 0.0;
    size_t uncompressed_size = 0;
    size_t compressed_size = 0;

    std::optional<TimePoint> restored_at;
    std::optional<bool> restore_success;
    std::optional<double> restore_fidelity;

    bool is_restored() const { return restored_at.has_value(); }
};

struct CheckpointSize {
    size_t uncompressed = 0;
    size_t compressed = 0;
    double compression_ratio = 1.0;
};

// Audit record of one recovery attempt. Append-only.
struct ResumeEvent {
    ResumeEventId id;
    CheckpointId checkpoint_id;
    SessionId session_id;
    TimePoint restored_at{};
    InterruptionReason interruption_reason = InterruptionReason::Unknown;
    Duration time_since_checkpoint{0};
    double resume_confidence = 0.0;
    std::optional<bool> user_confirmed;
    bool success = false;
    double fidelity_score = 0.0;
    std::optional<std::string> notes;

    Json to_json() const;
};

// Diagnostic trail of assessed signals. Append-only.
struct SignalHistoryRecord {
    std::string id;
    SessionId session_id;
    int snapshot_number = 0;  // Assigned by the store
    TimePoint recorded_at{};
    SignalSnapshot snapshot;

    CrashRisk crash_risk() const { return snapshot.crash_risk; }
};

}  // namespace lifeline::storage
