#include "lifeline/signals/risk_signal_aggregator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace lifeline::signals {

namespace {

constexpr size_t kTokenHistorySize = 20;
constexpr size_t kMessageTimestampHistory = 20;
constexpr size_t kRateWindow = 10;
constexpr size_t kToolResultHistory = 50;
constexpr size_t kErrorPatternHistory = 10;
constexpr size_t kTrendWindow = 10;
constexpr size_t kTrendMinSamples = 5;
constexpr double kTrendSlopeThreshold = 0.1;
constexpr int kConsecutiveFailureFactor = 3;

template<typename T>
void push_bounded(std::deque<T>& queue, T value, size_t max_size) {
    queue.push_back(std::move(value));
    while (queue.size() > max_size) {
        queue.pop_front();
    }
}

int count_exceeding(const SignalSnapshot& s, const ZoneThresholds& zone) {
    int count = 0;
    if (s.context_window_usage >= zone.context_window_usage) count++;
    if (s.message_count >= zone.message_count) count++;
    if (s.session_duration >= zone.session_duration()) count++;
    if (s.tool_calls_since_checkpoint >= zone.tool_calls_since_checkpoint) count++;
    if (s.tool_failure_rate >= zone.tool_failure_rate) count++;
    return count;
}

ResponseLatencyTrend classify_latency(Duration avg) {
    if (avg < std::chrono::milliseconds{2000}) return ResponseLatencyTrend::Normal;
    if (avg < std::chrono::milliseconds{5000}) return ResponseLatencyTrend::Degrading;
    return ResponseLatencyTrend::Critical;
}

}  // namespace

void assess_risk(SignalSnapshot& snapshot, const RiskConfig& config) {
    snapshot.danger_count = count_exceeding(snapshot, config.danger);
    snapshot.warning_count = count_exceeding(snapshot, config.warning);

    if (snapshot.danger_count >= 2) {
        snapshot.crash_risk = CrashRisk::Danger;
    } else if (snapshot.danger_count >= 1 || snapshot.warning_count >= 3) {
        snapshot.crash_risk = CrashRisk::Warning;
    } else {
        snapshot.crash_risk = CrashRisk::Safe;
    }

    snapshot.risk_factors.clear();
    if (snapshot.context_window_usage > config.danger.context_window_usage) {
        snapshot.risk_factors.push_back("Context window usage critical");
    }
    if (snapshot.message_count > config.danger.message_count) {
        snapshot.risk_factors.push_back("High message count");
    }
    if (snapshot.tool_failure_rate > config.danger.tool_failure_rate) {
        snapshot.risk_factors.push_back("High tool failure rate");
    }
    if (snapshot.consecutive_tool_failures >= kConsecutiveFailureFactor) {
        snapshot.risk_factors.push_back("Multiple consecutive tool failures");
    }
    if (snapshot.latency_trend == LatencyTrend::Increasing) {
        snapshot.risk_factors.push_back("Increasing response latency");
    }
}

LatencyTrend latency_trend(const std::deque<int64_t>& samples_ms) {
    if (samples_ms.size() < kTrendMinSamples) {
        return LatencyTrend::Stable;
    }

    size_t start = samples_ms.size() > kTrendWindow ? samples_ms.size() - kTrendWindow : 0;
    double n = static_cast<double>(samples_ms.size() - start);

    double sum_x = n * (n - 1) / 2.0;
    double sum_x2 = n * (n - 1) * (2 * n - 1) / 6.0;
    double sum_y = 0.0;
    double sum_xy = 0.0;
    for (size_t i = start; i < samples_ms.size(); ++i) {
        double x = static_cast<double>(i - start);
        double y = static_cast<double>(samples_ms[i]);
        sum_y += y;
        sum_xy += x * y;
    }

    double slope = (n * sum_xy - sum_x * sum_y) / (n * sum_x2 - sum_x * sum_x);
    if (slope > kTrendSlopeThreshold) return LatencyTrend::Increasing;
    if (slope < -kTrendSlopeThreshold) return LatencyTrend::Decreasing;
    return LatencyTrend::Stable;
}

RiskSignalAggregator::RiskSignalAggregator(const RiskConfig& risk, const CheckpointConfig& cadence)
    : risk_(risk)
    , cadence_(cadence)
{
}

void RiskSignalAggregator::begin_session(const SessionId& session_id, TimePoint at) {
    if (session_id.empty()) {
        spdlog::warn("Ignoring begin_session with empty session id");
        return;
    }
    find_or_create(session_id, at);
}

void RiskSignalAggregator::observe(const SessionId& session_id, const SignalEvent& event) {
    if (session_id.empty()) {
        spdlog::warn("Ignoring signal event without session id");
        return;
    }
    if (event.kind == SignalEvent::Kind::ToolCall) {
        if (event.tool_name.empty()) {
            spdlog::warn("Ignoring tool call event without tool name for session {}", session_id);
            return;
        }
        if (!is_valid_utf8(event.tool_name) ||
            (event.error_tag && !is_valid_utf8(*event.error_tag))) {
            spdlog::warn("Ignoring tool call event with invalid UTF-8 for session {}", session_id);
            return;
        }
        if (event.latency.count() < 0) {
            spdlog::warn("Ignoring tool call event with negative latency for session {}", session_id);
            return;
        }
    } else if (event.tokens && *event.tokens < 0) {
        spdlog::warn("Ignoring message event with negative token count for session {}", session_id);
        return;
    }

    TimePoint at = event.timestamp.value_or(now());
    auto counters = find_or_create(session_id, at);
    std::lock_guard<std::mutex> lock(counters->mutex);

    if (event.kind == SignalEvent::Kind::Message) {
        int64_t tokens = event.tokens.value_or(estimate_tokens(event.content));
        counters->message_count++;
        counters->estimated_tokens += tokens;
        push_bounded(counters->token_history, tokens, kTokenHistorySize);
        push_bounded(counters->message_timestamps, at, kMessageTimestampHistory);
        counters->last_response = std::max(counters->last_response, at);
        return;
    }

    counters->total_tool_calls++;
    counters->tool_calls_since_checkpoint++;
    if (counters->tool_calls_since_checkpoint >= cadence_.tool_call_interval &&
        !counters->tool_interval_reached_at) {
        counters->tool_interval_reached_at = at;
    }

    push_bounded(counters->tool_results, event.success, kToolResultHistory);
    push_bounded(counters->latency_samples, static_cast<int64_t>(event.latency.count()),
                 static_cast<size_t>(risk_.latency_window));

    if (event.success) {
        counters->consecutive_failures = 0;
    } else {
        counters->consecutive_failures++;
        counters->total_failures++;
        if (event.error_tag && !event.error_tag->empty()) {
            auto& patterns = counters->error_patterns;
            if (std::find(patterns.begin(), patterns.end(), *event.error_tag) == patterns.end()) {
                push_bounded(patterns, *event.error_tag, kErrorPatternHistory);
            }
        }
    }

    counters->last_response = std::max(counters->last_response, at);
}

SignalSnapshot RiskSignalAggregator::assess(const SessionId& session_id, TimePoint at) {
    auto counters = find(session_id);
    if (!counters) {
        SignalSnapshot empty;
        empty.captured_at = at;
        empty.context_window_remaining = risk_.context_window_tokens;
        assess_risk(empty, risk_);
        return empty;
    }

    std::lock_guard<std::mutex> lock(counters->mutex);
    SignalSnapshot snapshot = build_snapshot(*counters, at);
    if (snapshot.crash_risk == CrashRisk::Safe) {
        counters->latched_risk = CrashRisk::Safe;
    }
    return snapshot;
}

TriggerEvaluation RiskSignalAggregator::evaluate(const SessionId& session_id, TimePoint at) {
    TriggerEvaluation evaluation;

    auto counters = find(session_id);
    if (!counters) {
        evaluation.snapshot = assess(session_id, at);
        return evaluation;
    }

    std::lock_guard<std::mutex> lock(counters->mutex);
    evaluation.snapshot = build_snapshot(*counters, at);
    if (evaluation.snapshot.crash_risk == CrashRisk::Safe) {
        counters->latched_risk = CrashRisk::Safe;
    }

    TriggerInputs inputs;
    inputs.risk = evaluation.snapshot.crash_risk;
    inputs.latched_risk = counters->latched_risk;
    inputs.tool_calls_since_checkpoint = counters->tool_calls_since_checkpoint;
    inputs.time_since_checkpoint = evaluation.snapshot.time_since_checkpoint;
    if (counters->tool_interval_reached_at) {
        inputs.tool_interval_reached_after = *counters->tool_interval_reached_at - counters->last_checkpoint;
    }

    evaluation.trigger = decide_trigger(inputs, cadence_);
    return evaluation;
}

void RiskSignalAggregator::mark_checkpoint(const SessionId& session_id, CrashRisk risk, TimePoint at) {
    auto counters = find_or_create(session_id, at);
    std::lock_guard<std::mutex> lock(counters->mutex);

    counters->tool_calls_since_checkpoint = 0;
    counters->tool_interval_reached_at.reset();
    counters->last_checkpoint = at;
    counters->latched_risk = std::max(counters->latched_risk, risk);
}

void RiskSignalAggregator::end_session(const SessionId& session_id) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    sessions_.erase(session_id);
}

bool RiskSignalAggregator::has_session(const SessionId& session_id) const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    return sessions_.count(session_id) > 0;
}

size_t RiskSignalAggregator::session_count() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    return sessions_.size();
}

std::shared_ptr<RiskSignalAggregator::SessionCounters>
RiskSignalAggregator::find(const SessionId& session_id) const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto it = sessions_.find(session_id);
    return it != sessions_.end() ? it->second : nullptr;
}

std::shared_ptr<RiskSignalAggregator::SessionCounters>
RiskSignalAggregator::find_or_create(const SessionId& session_id, TimePoint at) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto& slot = sessions_[session_id];
    if (!slot) {
        slot = std::make_shared<SessionCounters>();
        slot->session_start = at;
        slot->last_response = at;
        slot->last_checkpoint = at;
    }
    return slot;
}

SignalSnapshot RiskSignalAggregator::build_snapshot(SessionCounters& c, TimePoint at) const {
    SignalSnapshot s;
    s.captured_at = at;

    s.estimated_total_tokens = c.estimated_tokens;
    s.context_window_usage = static_cast<double>(c.estimated_tokens) /
                             static_cast<double>(risk_.context_window_tokens);
    s.context_window_remaining = std::max<int64_t>(0, risk_.context_window_tokens - c.estimated_tokens);
    if (!c.token_history.empty()) {
        double total = std::accumulate(c.token_history.begin(), c.token_history.end(), 0.0);
        s.tokens_per_message = total / static_cast<double>(c.token_history.size());
    }

    s.message_count = c.message_count;
    if (c.message_timestamps.size() >= 2) {
        size_t start = c.message_timestamps.size() > kRateWindow
            ? c.message_timestamps.size() - kRateWindow : 0;
        size_t count = c.message_timestamps.size() - start;
        auto span = c.message_timestamps.back() - c.message_timestamps[start];
        double minutes = std::chrono::duration<double, std::ratio<60>>(span).count();
        if (minutes > 0.0) {
            s.messages_per_minute = static_cast<double>(count) / minutes;
        }
    }
    s.session_duration = std::max(Duration{0}, at - c.session_start);
    s.time_since_last_response = std::max(Duration{0}, at - c.last_response);

    if (!c.latency_samples.empty()) {
        double total = std::accumulate(c.latency_samples.begin(), c.latency_samples.end(), 0.0);
        s.avg_response_latency = Duration{static_cast<int64_t>(
            std::llround(total / static_cast<double>(c.latency_samples.size())))};
    }
    s.latency_trend = latency_trend(c.latency_samples);
    s.response_latency_trend = classify_latency(s.avg_response_latency);

    s.total_tool_calls = c.total_tool_calls;
    s.tool_calls_since_checkpoint = c.tool_calls_since_checkpoint;
    s.time_since_checkpoint = std::max(Duration{0}, at - c.last_checkpoint);
    s.consecutive_tool_failures = c.consecutive_failures;
    s.total_tool_failures = c.total_failures;
    if (!c.tool_results.empty()) {
        auto failures = std::count(c.tool_results.begin(), c.tool_results.end(), false);
        s.tool_failure_rate = static_cast<double>(failures) /
                              static_cast<double>(c.tool_results.size());
    }
    s.error_patterns.assign(c.error_patterns.begin(), c.error_patterns.end());

    assess_risk(s, risk_);
    return s;
}

}  // namespace lifeline::signals
