#include "lifeline/signals/signal_snapshot.hpp"

namespace lifeline::signals {

std::string_view crash_risk_to_string(CrashRisk risk) {
    switch (risk) {
        case CrashRisk::Safe: return "safe";
        case CrashRisk::Warning: return "warning";
        case CrashRisk::Danger: return "danger";
    }
    return "safe";
}

CrashRisk crash_risk_from_string(std::string_view str) {
    if (str == "danger") return CrashRisk::Danger;
    if (str == "warning") return CrashRisk::Warning;
    return CrashRisk::Safe;
}

std::string_view latency_trend_to_string(LatencyTrend trend) {
    switch (trend) {
        case LatencyTrend::Stable: return "stable";
        case LatencyTrend::Increasing: return "increasing";
        case LatencyTrend::Decreasing: return "decreasing";
    }
    return "stable";
}

LatencyTrend latency_trend_from_string(std::string_view str) {
    if (str == "increasing") return LatencyTrend::Increasing;
    if (str == "decreasing") return LatencyTrend::Decreasing;
    return LatencyTrend::Stable;
}

std::string_view response_latency_trend_to_string(ResponseLatencyTrend trend) {
    switch (trend) {
        case ResponseLatencyTrend::Normal: return "normal";
        case ResponseLatencyTrend::Degrading: return "degrading";
        case ResponseLatencyTrend::Critical: return "critical";
    }
    return "normal";
}

ResponseLatencyTrend response_latency_trend_from_string(std::string_view str) {
    if (str == "critical") return ResponseLatencyTrend::Critical;
    if (str == "degrading") return ResponseLatencyTrend::Degrading;
    return ResponseLatencyTrend::Normal;
}

Json SignalSnapshot::to_json() const {
    return Json{
        {"captured_at", to_millis(captured_at)},
        {"estimated_total_tokens", estimated_total_tokens},
        {"context_window_usage", context_window_usage},
        {"context_window_remaining", context_window_remaining},
        {"tokens_per_message", tokens_per_message},
        {"message_count", message_count},
        {"messages_per_minute", messages_per_minute},
        {"session_duration_ms", session_duration.count()},
        {"time_since_last_response_ms", time_since_last_response.count()},
        {"avg_response_latency_ms", avg_response_latency.count()},
        {"latency_trend", std::string(latency_trend_to_string(latency_trend))},
        {"response_latency_trend", std::string(response_latency_trend_to_string(response_latency_trend))},
        {"total_tool_calls", total_tool_calls},
        {"tool_calls_since_checkpoint", tool_calls_since_checkpoint},
        {"time_since_checkpoint_ms", time_since_checkpoint.count()},
        {"consecutive_tool_failures", consecutive_tool_failures},
        {"total_tool_failures", total_tool_failures},
        {"tool_failure_rate", tool_failure_rate},
        {"error_patterns", error_patterns},
        {"crash_risk", std::string(crash_risk_to_string(crash_risk))},
        {"warning_count", warning_count},
        {"danger_count", danger_count},
        {"risk_factors", risk_factors}
    };
}

SignalSnapshot SignalSnapshot::from_json(const Json& j) {
    SignalSnapshot s;
    s.captured_at = from_millis(j.value("captured_at", int64_t{0}));
    s.estimated_total_tokens = j.value("estimated_total_tokens", int64_t{0});
    s.context_window_usage = j.value("context_window_usage", 0.0);
    s.context_window_remaining = j.value("context_window_remaining", int64_t{0});
    s.tokens_per_message = j.value("tokens_per_message", 0.0);
    s.message_count = j.value("message_count", 0);
    s.messages_per_minute = j.value("messages_per_minute", 0.0);
    s.session_duration = Duration{j.value("session_duration_ms", int64_t{0})};
    s.time_since_last_response = Duration{j.value("time_since_last_response_ms", int64_t{0})};
    s.avg_response_latency = Duration{j.value("avg_response_latency_ms", int64_t{0})};
    s.latency_trend = latency_trend_from_string(j.value("latency_trend", "stable"));
    s.response_latency_trend = response_latency_trend_from_string(j.value("response_latency_trend", "normal"));
    s.total_tool_calls = j.value("total_tool_calls", 0);
    s.tool_calls_since_checkpoint = j.value("tool_calls_since_checkpoint", 0);
    s.time_since_checkpoint = Duration{j.value("time_since_checkpoint_ms", int64_t{0})};
    s.consecutive_tool_failures = j.value("consecutive_tool_failures", 0);
    s.total_tool_failures = j.value("total_tool_failures", 0);
    s.tool_failure_rate = j.value("tool_failure_rate", 0.0);
    if (j.contains("error_patterns")) {
        s.error_patterns = j["error_patterns"].get<std::vector<std::string>>();
    }
    s.crash_risk = crash_risk_from_string(j.value("crash_risk", "safe"));
    s.warning_count = j.value("warning_count", 0);
    s.danger_count = j.value("danger_count", 0);
    if (j.contains("risk_factors")) {
        s.risk_factors = j["risk_factors"].get<std::vector<std::string>>();
    }
    return s;
}

}  // namespace lifeline::signals
