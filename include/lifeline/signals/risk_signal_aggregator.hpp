#pragma once

#include "signal_snapshot.hpp"
#include "trigger_policy.hpp"
#include "lifeline/core/config.hpp"

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace lifeline::signals {

// A single observation reported by the host session
struct SignalEvent {
    enum class Kind {
        Message,
        ToolCall
    };

    Kind kind = Kind::Message;
    std::optional<TimePoint> timestamp;  // Defaults to now

    // Message
    Role role = Role::User;
    std::string content;
    std::optional<int64_t> tokens;  // Estimated from content when absent

    // Tool call
    std::string tool_name;
    bool success = true;
    Duration latency{0};
    std::optional<std::string> error_tag;

    static SignalEvent message(Role role, std::string content) {
        SignalEvent e;
        e.kind = Kind::Message;
        e.role = role;
        e.content = std::move(content);
        return e;
    }

    static SignalEvent tool_call(std::string tool, bool success, Duration latency,
                                 std::optional<std::string> error_tag = std::nullopt) {
        SignalEvent e;
        e.kind = Kind::ToolCall;
        e.tool_name = std::move(tool);
        e.success = success;
        e.latency = latency;
        e.error_tag = std::move(error_tag);
        return e;
    }
};

// Snapshot plus the automatic trigger it implies
struct TriggerEvaluation {
    SignalSnapshot snapshot;
    std::optional<CheckpointTrigger> trigger;
};

// Fill crash_risk, warning_count, danger_count and risk_factors from the
// measured fields of a snapshot. A signal counts against a zone when it
// reaches that zone's threshold.
void assess_risk(SignalSnapshot& snapshot, const RiskConfig& config);

// Classify the slope of a latency series (least squares over the last ten)
LatencyTrend latency_trend(const std::deque<int64_t>& samples_ms);

// Rough token estimate, ~3.5 characters per token
inline int64_t estimate_tokens(const std::string& text) {
    return static_cast<int64_t>(text.length() / 3.5);
}

// Per-session signal counters. Every session owns an independent set of
// counters guarded by its own mutex; the map lock is held only for lookup.
class RiskSignalAggregator {
public:
    RiskSignalAggregator(const RiskConfig& risk, const CheckpointConfig& cadence);

    // Start tracking a session. Implicit on the first observation.
    void begin_session(const SessionId& session_id, TimePoint at = now());

    // Record an event. Malformed events are logged and dropped.
    void observe(const SessionId& session_id, const SignalEvent& event);

    // Derived snapshot for a session. Unknown sessions yield a safe, empty
    // snapshot. Observing a safe level clears the zone latch.
    SignalSnapshot assess(const SessionId& session_id, TimePoint at = now());

    // assess() followed by the trigger policy
    TriggerEvaluation evaluate(const SessionId& session_id, TimePoint at = now());

    // Reset the per-checkpoint counters after a checkpoint was persisted.
    // risk is the level captured in that checkpoint; it becomes the latch.
    void mark_checkpoint(const SessionId& session_id, CrashRisk risk, TimePoint at = now());

    // Drop all state for a session
    void end_session(const SessionId& session_id);

    bool has_session(const SessionId& session_id) const;
    size_t session_count() const;

    const RiskConfig& risk_config() const { return risk_; }
    const CheckpointConfig& cadence() const { return cadence_; }

private:
    struct SessionCounters {
        std::mutex mutex;

        TimePoint session_start{};
        TimePoint last_response{};
        TimePoint last_checkpoint{};

        int message_count = 0;
        int total_tool_calls = 0;
        int tool_calls_since_checkpoint = 0;
        int consecutive_failures = 0;
        int total_failures = 0;
        int64_t estimated_tokens = 0;

        std::deque<int64_t> token_history;
        std::deque<int64_t> latency_samples;
        std::deque<TimePoint> message_timestamps;
        std::deque<bool> tool_results;
        std::deque<std::string> error_patterns;

        CrashRisk latched_risk = CrashRisk::Safe;
        std::optional<TimePoint> tool_interval_reached_at;
    };

    RiskConfig risk_;
    CheckpointConfig cadence_;

    mutable std::mutex map_mutex_;
    std::unordered_map<SessionId, std::shared_ptr<SessionCounters>> sessions_;

    std::shared_ptr<SessionCounters> find(const SessionId& session_id) const;
    std::shared_ptr<SessionCounters> find_or_create(const SessionId& session_id, TimePoint at);

    SignalSnapshot build_snapshot(SessionCounters& counters, TimePoint at) const;
};

}  // namespace lifeline::signals
