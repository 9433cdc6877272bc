#include <catch2/catch_test_macros.hpp>
#include "lifeline/signals/risk_signal_aggregator.hpp"

#include <vector>

using namespace lifeline::signals;

TEST_CASE("Two danger signals classify as danger", "[signals]") {
    RiskConfig config;
    SignalSnapshot snapshot;
    snapshot.context_window_usage = 0.80;
    snapshot.message_count = 55;

    assess_risk(snapshot, config);

    REQUIRE(snapshot.danger_count == 2);
    REQUIRE(snapshot.crash_risk == CrashRisk::Danger);
    REQUIRE(snapshot.risk_factors == std::vector<std::string>{
        "Context window usage critical", "High message count"});
}

TEST_CASE("Risk tiers", "[signals]") {
    RiskConfig config;

    SECTION("one danger signal is a warning") {
        SignalSnapshot s;
        s.message_count = 55;
        assess_risk(s, config);
        REQUIRE(s.danger_count == 1);
        REQUIRE(s.crash_risk == CrashRisk::Warning);
    }

    SECTION("three warning signals are a warning") {
        SignalSnapshot s;
        s.context_window_usage = 0.65;
        s.message_count = 40;
        s.tool_calls_since_checkpoint = 11;
        assess_risk(s, config);
        REQUIRE(s.danger_count == 0);
        REQUIRE(s.warning_count == 3);
        REQUIRE(s.crash_risk == CrashRisk::Warning);
    }

    SECTION("two warning signals are safe") {
        SignalSnapshot s;
        s.context_window_usage = 0.65;
        s.message_count = 40;
        assess_risk(s, config);
        REQUIRE(s.crash_risk == CrashRisk::Safe);
    }

    SECTION("consecutive failures are reported as a factor") {
        SignalSnapshot s;
        s.consecutive_tool_failures = 3;
        assess_risk(s, config);
        REQUIRE(s.crash_risk == CrashRisk::Safe);
        REQUIRE(s.risk_factors == std::vector<std::string>{"Multiple consecutive tool failures"});
    }
}

TEST_CASE("Raising one input never lowers the risk", "[signals]") {
    RiskConfig config;

    // Each base combination holds the other inputs fixed while one input rises
    std::vector<SignalSnapshot> bases(3);
    bases[1].message_count = 40;
    bases[1].tool_failure_rate = 0.16;
    bases[2].context_window_usage = 0.9;
    bases[2].session_duration = std::chrono::minutes{100};

    const std::vector<double> usages{0.0, 0.5, 0.6, 0.7, 0.75, 0.8, 1.0};
    const std::vector<int> counts{0, 20, 35, 49, 50, 80};
    const std::vector<int> minutes{0, 30, 60, 89, 90, 200};
    const std::vector<int> tool_calls{0, 5, 10, 14, 15, 30};
    const std::vector<double> rates{0.0, 0.1, 0.15, 0.19, 0.2, 1.0};

    auto check = [&](const SignalSnapshot& base, auto&& values, auto&& apply) {
        CrashRisk previous = CrashRisk::Safe;
        for (const auto& v : values) {
            SignalSnapshot s = base;
            apply(s, v);
            assess_risk(s, config);
            REQUIRE(s.crash_risk >= previous);
            previous = s.crash_risk;
        }
    };

    for (const auto& base : bases) {
        check(base, usages, [](SignalSnapshot& s, double v) { s.context_window_usage = v; });
        check(base, counts, [](SignalSnapshot& s, int v) { s.message_count = v; });
        check(base, minutes, [](SignalSnapshot& s, int v) { s.session_duration = std::chrono::minutes{v}; });
        check(base, tool_calls, [](SignalSnapshot& s, int v) { s.tool_calls_since_checkpoint = v; });
        check(base, rates, [](SignalSnapshot& s, double v) { s.tool_failure_rate = v; });
    }
}

TEST_CASE("Latency trend classification", "[signals]") {
    REQUIRE(latency_trend({100, 200, 300, 400}) == LatencyTrend::Stable);
    REQUIRE(latency_trend({100, 200, 300, 400, 500}) == LatencyTrend::Increasing);
    REQUIRE(latency_trend({500, 400, 300, 200, 100}) == LatencyTrend::Decreasing);
    REQUIRE(latency_trend({250, 250, 250, 250, 250, 250}) == LatencyTrend::Stable);

    // Only the last ten samples count
    std::deque<int64_t> samples{9000, 8000, 7000, 6000, 5000};
    for (int i = 0; i < 10; ++i) {
        samples.push_back(100 + i * 50);
    }
    REQUIRE(latency_trend(samples) == LatencyTrend::Increasing);
}

TEST_CASE("Snapshot JSON form", "[signals]") {
    SignalSnapshot s;
    s.captured_at = from_millis(1700000000000);
    s.context_window_usage = 0.42;
    s.message_count = 12;
    s.session_duration = std::chrono::minutes{7};
    s.latency_trend = LatencyTrend::Increasing;
    s.response_latency_trend = ResponseLatencyTrend::Degrading;
    s.error_patterns = {"ENOENT", "timeout"};
    s.crash_risk = CrashRisk::Warning;
    s.risk_factors = {"High message count"};

    Json j = s.to_json();
    REQUIRE(j["crash_risk"] == "warning");
    REQUIRE(j["session_duration_ms"] == 420000);
    REQUIRE(j["latency_trend"] == "increasing");

    REQUIRE(SignalSnapshot::from_json(j) == s);
}

TEST_CASE("Risk level strings", "[signals]") {
    REQUIRE(crash_risk_to_string(CrashRisk::Danger) == "danger");
    REQUIRE(crash_risk_from_string("warning") == CrashRisk::Warning);
    REQUIRE(crash_risk_from_string("bogus") == CrashRisk::Safe);
}
