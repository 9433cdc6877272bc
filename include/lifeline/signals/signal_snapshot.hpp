#pragma once

#include "lifeline/core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace lifeline::signals {

using namespace lifeline::core;

// Three-level crash risk classification
enum class CrashRisk {
    Safe = 0,
    Warning = 1,
    Danger = 2
};

// Slope of the rolling latency window
enum class LatencyTrend {
    Stable,
    Increasing,
    Decreasing
};

// Absolute responsiveness bucket of the average latency
enum class ResponseLatencyTrend {
    Normal,     // < 2s
    Degrading,  // < 5s
    Critical
};

std::string_view crash_risk_to_string(CrashRisk risk);
CrashRisk crash_risk_from_string(std::string_view str);

std::string_view latency_trend_to_string(LatencyTrend trend);
LatencyTrend latency_trend_from_string(std::string_view str);

std::string_view response_latency_trend_to_string(ResponseLatencyTrend trend);
ResponseLatencyTrend response_latency_trend_from_string(std::string_view str);

// Derived view of a session's counters at one instant
struct SignalSnapshot {
    TimePoint captured_at{};

    // Context window
    int64_t estimated_total_tokens = 0;
    double context_window_usage = 0.0;
    int64_t context_window_remaining = 0;
    double tokens_per_message = 0.0;

    // Conversation
    int message_count = 0;
    double messages_per_minute = 0.0;
    Duration session_duration{0};
    Duration time_since_last_response{0};

    // Latency
    Duration avg_response_latency{0};
    LatencyTrend latency_trend = LatencyTrend::Stable;
    ResponseLatencyTrend response_latency_trend = ResponseLatencyTrend::Normal;

    // Tools
    int total_tool_calls = 0;
    int tool_calls_since_checkpoint = 0;
    Duration time_since_checkpoint{0};
    int consecutive_tool_failures = 0;
    int total_tool_failures = 0;
    double tool_failure_rate = 0.0;
    std::vector<std::string> error_patterns;

    // Assessment
    CrashRisk crash_risk = CrashRisk::Safe;
    int warning_count = 0;
    int danger_count = 0;
    std::vector<std::string> risk_factors;

    Json to_json() const;
    static SignalSnapshot from_json(const Json& j);

    bool operator==(const SignalSnapshot&) const = default;
};

}  // namespace lifeline::signals
