#include "lifeline/signals/trigger_policy.hpp"

namespace lifeline::signals {

std::optional<CheckpointTrigger> decide_trigger(const TriggerInputs& inputs,
                                                const CheckpointConfig& cadence) {
    if (inputs.risk > inputs.latched_risk) {
        return inputs.risk == CrashRisk::Danger ? CheckpointTrigger::DangerZone
                                                : CheckpointTrigger::WarningZone;
    }

    bool tool_due = inputs.tool_calls_since_checkpoint >= cadence.tool_call_interval;
    bool time_due = inputs.time_since_checkpoint >= cadence.time_interval();

    if (tool_due && time_due) {
        Duration tool_at = inputs.tool_interval_reached_after.value_or(Duration{0});
        return tool_at <= cadence.time_interval() ? CheckpointTrigger::ToolCallInterval
                                                  : CheckpointTrigger::TimeInterval;
    }
    if (tool_due) {
        return CheckpointTrigger::ToolCallInterval;
    }
    if (time_due) {
        return CheckpointTrigger::TimeInterval;
    }
    return std::nullopt;
}

}  // namespace lifeline::signals
