#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "lifeline/signals/risk_signal_aggregator.hpp"

using namespace lifeline::signals;
using namespace std::chrono_literals;
using Catch::Matchers::WithinAbs;

namespace {

const TimePoint kStart = from_millis(1700000000000);

SignalEvent message_at(TimePoint at, int64_t tokens) {
    auto event = SignalEvent::message(Role::User, "message");
    event.timestamp = at;
    event.tokens = tokens;
    return event;
}

SignalEvent tool_at(TimePoint at, bool success, Duration latency = 200ms,
                    std::optional<std::string> error_tag = std::nullopt) {
    auto event = SignalEvent::tool_call("bash", success, latency, std::move(error_tag));
    event.timestamp = at;
    return event;
}

CheckpointConfig quiet_cadence() {
    CheckpointConfig cadence;
    cadence.tool_call_interval = 1000;
    cadence.time_interval_minutes = 1000;
    return cadence;
}

}  // namespace

TEST_CASE("Context and message pressure drive the session into danger", "[aggregator]") {
    RiskSignalAggregator aggregator(RiskConfig{}, CheckpointConfig{});
    aggregator.begin_session("s1", kStart);

    // 160000 of 200000 tokens over 55 messages
    for (int i = 0; i < 54; ++i) {
        aggregator.observe("s1", message_at(kStart + std::chrono::seconds{i}, 2000));
    }
    aggregator.observe("s1", message_at(kStart + 54s, 52000));

    auto snapshot = aggregator.assess("s1", kStart + 1min);

    REQUIRE(snapshot.message_count == 55);
    REQUIRE_THAT(snapshot.context_window_usage, WithinAbs(0.80, 1e-9));
    REQUIRE(snapshot.context_window_remaining == 40000);
    REQUIRE(snapshot.danger_count == 2);
    REQUIRE(snapshot.crash_risk == CrashRisk::Danger);
    REQUIRE(snapshot.session_duration == 1min);
    REQUIRE(snapshot.time_since_last_response == 6s);
}

TEST_CASE("Tool counters and derived values", "[aggregator]") {
    RiskSignalAggregator aggregator(RiskConfig{}, quiet_cadence());
    aggregator.begin_session("s1", kStart);

    aggregator.observe("s1", tool_at(kStart + 1s, true, 100ms));
    aggregator.observe("s1", tool_at(kStart + 2s, false, 200ms, "ENOENT"));
    aggregator.observe("s1", tool_at(kStart + 3s, false, 300ms, "ENOENT"));
    aggregator.observe("s1", tool_at(kStart + 4s, false, 400ms, "EACCES"));
    aggregator.observe("s1", tool_at(kStart + 5s, false, 500ms));

    auto snapshot = aggregator.assess("s1", kStart + 10s);

    REQUIRE(snapshot.total_tool_calls == 5);
    REQUIRE(snapshot.tool_calls_since_checkpoint == 5);
    REQUIRE(snapshot.consecutive_tool_failures == 4);
    REQUIRE(snapshot.total_tool_failures == 4);
    REQUIRE_THAT(snapshot.tool_failure_rate, WithinAbs(0.8, 1e-9));
    REQUIRE(snapshot.avg_response_latency == 300ms);
    REQUIRE(snapshot.latency_trend == LatencyTrend::Increasing);
    REQUIRE(snapshot.response_latency_trend == ResponseLatencyTrend::Normal);
    REQUIRE(snapshot.error_patterns == std::vector<std::string>{"ENOENT", "EACCES"});

    aggregator.observe("s1", tool_at(kStart + 6s, true));
    REQUIRE(aggregator.assess("s1", kStart + 10s).consecutive_tool_failures == 0);
}

TEST_CASE("Malformed events are ignored", "[aggregator]") {
    RiskSignalAggregator aggregator(RiskConfig{}, CheckpointConfig{});

    aggregator.observe("", tool_at(kStart, true));
    REQUIRE(aggregator.session_count() == 0);

    aggregator.begin_session("s1", kStart);
    aggregator.observe("s1", SignalEvent::tool_call("", true, 10ms));
    aggregator.observe("s1", SignalEvent::tool_call("bash", true, Duration{-5}));
    aggregator.observe("s1", SignalEvent::tool_call("\xff\xfe", true, 10ms));
    aggregator.observe("s1", tool_at(kStart, false, 10ms, std::string("\xff\xfe bad")));

    auto negative = SignalEvent::message(Role::Assistant, "hello");
    negative.tokens = -10;
    aggregator.observe("s1", negative);

    auto snapshot = aggregator.assess("s1", kStart + 1s);
    REQUIRE(snapshot.total_tool_calls == 0);
    REQUIRE(snapshot.error_patterns.empty());
    REQUIRE(snapshot.message_count == 0);
}

TEST_CASE("Unknown sessions assess as an empty safe snapshot", "[aggregator]") {
    RiskSignalAggregator aggregator(RiskConfig{}, CheckpointConfig{});

    auto snapshot = aggregator.assess("nobody", kStart);

    REQUIRE(snapshot.crash_risk == CrashRisk::Safe);
    REQUIRE(snapshot.message_count == 0);
    REQUIRE(snapshot.context_window_remaining == 200000);
    REQUIRE_FALSE(aggregator.has_session("nobody"));
}

TEST_CASE("Tool-call interval trigger after six calls", "[aggregator]") {
    RiskSignalAggregator aggregator(RiskConfig{}, CheckpointConfig{});
    aggregator.begin_session("s1", kStart);

    for (int i = 0; i < 6; ++i) {
        aggregator.observe("s1", tool_at(kStart + std::chrono::seconds{i}, true));
    }

    auto evaluation = aggregator.evaluate("s1", kStart + 10s);
    REQUIRE(evaluation.snapshot.crash_risk == CrashRisk::Safe);
    REQUIRE(evaluation.trigger == CheckpointTrigger::ToolCallInterval);

    aggregator.mark_checkpoint("s1", evaluation.snapshot.crash_risk, kStart + 10s);
    REQUIRE_FALSE(aggregator.evaluate("s1", kStart + 11s).trigger.has_value());
}

TEST_CASE("Simultaneous periodic triggers resolve by crossing order", "[aggregator]") {
    RiskSignalAggregator aggregator(RiskConfig{}, CheckpointConfig{});

    SECTION("tool interval crossed first") {
        aggregator.begin_session("s1", kStart);
        for (int i = 0; i < 5; ++i) {
            aggregator.observe("s1", tool_at(kStart + 1min, true));
        }
        REQUIRE(aggregator.evaluate("s1", kStart + 11min).trigger == CheckpointTrigger::ToolCallInterval);
    }

    SECTION("time interval crossed first") {
        aggregator.begin_session("s1", kStart);
        for (int i = 0; i < 5; ++i) {
            aggregator.observe("s1", tool_at(kStart + 12min, true));
        }
        REQUIRE(aggregator.evaluate("s1", kStart + 12min).trigger == CheckpointTrigger::TimeInterval);
    }
}

TEST_CASE("One danger entry fires one danger trigger until safe again", "[aggregator]") {
    RiskSignalAggregator aggregator(RiskConfig{}, quiet_cadence());
    aggregator.begin_session("s1", kStart);

    // Fifteen failures: failure rate and calls since checkpoint both at danger
    for (int i = 0; i < 15; ++i) {
        aggregator.observe("s1", tool_at(kStart + 1s, false));
    }
    auto first = aggregator.evaluate("s1", kStart + 1min);
    REQUIRE(first.snapshot.crash_risk == CrashRisk::Danger);
    REQUIRE(first.trigger == CheckpointTrigger::DangerZone);
    aggregator.mark_checkpoint("s1", CrashRisk::Danger, kStart + 1min);

    // Still elevated but no new entry
    auto second = aggregator.evaluate("s1", kStart + 2min);
    REQUIRE(second.snapshot.crash_risk == CrashRisk::Warning);
    REQUIRE_FALSE(second.trigger.has_value());

    // Recover: the failure window fills with successes
    for (int i = 0; i < 50; ++i) {
        aggregator.observe("s1", tool_at(kStart + 3min, true));
    }
    aggregator.mark_checkpoint("s1", CrashRisk::Warning, kStart + 3min);
    auto recovered = aggregator.evaluate("s1", kStart + 4min);
    REQUIRE(recovered.snapshot.crash_risk == CrashRisk::Safe);
    REQUIRE_FALSE(recovered.trigger.has_value());

    // A second entry fires again
    for (int i = 0; i < 15; ++i) {
        aggregator.observe("s1", tool_at(kStart + 5min, false));
    }
    auto again = aggregator.evaluate("s1", kStart + 6min);
    REQUIRE(again.snapshot.crash_risk == CrashRisk::Danger);
    REQUIRE(again.trigger == CheckpointTrigger::DangerZone);
}

TEST_CASE("Ending a session evicts its counters", "[aggregator]") {
    RiskSignalAggregator aggregator(RiskConfig{}, CheckpointConfig{});
    aggregator.observe("s1", tool_at(kStart, true));
    aggregator.observe("s2", tool_at(kStart, true));
    REQUIRE(aggregator.session_count() == 2);

    aggregator.end_session("s1");

    REQUIRE_FALSE(aggregator.has_session("s1"));
    REQUIRE(aggregator.has_session("s2"));
    REQUIRE(aggregator.assess("s1", kStart).total_tool_calls == 0);
}
