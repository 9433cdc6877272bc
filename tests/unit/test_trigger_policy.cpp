#include <catch2/catch_test_macros.hpp>
#include "lifeline/signals/trigger_policy.hpp"

using namespace lifeline::signals;
using namespace std::chrono_literals;

TEST_CASE("Tool-call interval fires once the count is reached", "[trigger]") {
    CheckpointConfig cadence;
    TriggerInputs inputs;
    inputs.tool_calls_since_checkpoint = 6;
    inputs.time_since_checkpoint = 2min;

    REQUIRE(decide_trigger(inputs, cadence) == CheckpointTrigger::ToolCallInterval);

    inputs.tool_calls_since_checkpoint = 4;
    REQUIRE_FALSE(decide_trigger(inputs, cadence).has_value());
}

TEST_CASE("Time interval fires after the configured minutes", "[trigger]") {
    CheckpointConfig cadence;
    TriggerInputs inputs;
    inputs.time_since_checkpoint = 10min;

    REQUIRE(decide_trigger(inputs, cadence) == CheckpointTrigger::TimeInterval);
}

TEST_CASE("Risk transitions take precedence", "[trigger]") {
    CheckpointConfig cadence;
    TriggerInputs inputs;
    inputs.tool_calls_since_checkpoint = 20;
    inputs.time_since_checkpoint = 30min;

    inputs.risk = CrashRisk::Danger;
    REQUIRE(decide_trigger(inputs, cadence) == CheckpointTrigger::DangerZone);

    inputs.risk = CrashRisk::Warning;
    REQUIRE(decide_trigger(inputs, cadence) == CheckpointTrigger::WarningZone);

    // Already checkpointed at this level: only periodic triggers remain
    inputs.latched_risk = CrashRisk::Warning;
    REQUIRE(decide_trigger(inputs, cadence) == CheckpointTrigger::ToolCallInterval);

    // Warning to danger is a new transition
    inputs.risk = CrashRisk::Danger;
    REQUIRE(decide_trigger(inputs, cadence) == CheckpointTrigger::DangerZone);

    // Falling from danger to warning is not
    inputs.risk = CrashRisk::Warning;
    inputs.latched_risk = CrashRisk::Danger;
    inputs.tool_calls_since_checkpoint = 0;
    inputs.time_since_checkpoint = 1min;
    REQUIRE_FALSE(decide_trigger(inputs, cadence).has_value());
}

TEST_CASE("When both intervals are due the first crossed wins", "[trigger]") {
    CheckpointConfig cadence;
    TriggerInputs inputs;
    inputs.tool_calls_since_checkpoint = 5;
    inputs.time_since_checkpoint = 12min;

    inputs.tool_interval_reached_after = 3min;
    REQUIRE(decide_trigger(inputs, cadence) == CheckpointTrigger::ToolCallInterval);

    inputs.tool_interval_reached_after = 11min;
    REQUIRE(decide_trigger(inputs, cadence) == CheckpointTrigger::TimeInterval);

    inputs.tool_interval_reached_after.reset();
    REQUIRE(decide_trigger(inputs, cadence) == CheckpointTrigger::ToolCallInterval);
}
