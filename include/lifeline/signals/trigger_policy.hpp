#pragma once

#include "signal_snapshot.hpp"
#include "lifeline/checkpoint/checkpoint.hpp"
#include "lifeline/core/config.hpp"

#include <optional>

namespace lifeline::signals {

using checkpoint::CheckpointTrigger;

// Everything the policy needs to decide on an automatic checkpoint
struct TriggerInputs {
    CrashRisk risk = CrashRisk::Safe;
    CrashRisk latched_risk = CrashRisk::Safe;  // Highest risk already checkpointed
    int tool_calls_since_checkpoint = 0;
    Duration time_since_checkpoint{0};

    // Offset from the last checkpoint at which the tool-call interval was
    // reached. Unknown offsets count as reached before the time interval.
    std::optional<Duration> tool_interval_reached_after;
};

// Decide whether an automatic checkpoint should be taken now.
//
// Risk transitions win over periodic triggers. A transition fires only when
// risk rises above the latched level, so one entry into a zone produces one
// trigger until the session is observed safe again. When both periodic
// intervals are due, the one that crossed its threshold first wins.
std::optional<CheckpointTrigger> decide_trigger(const TriggerInputs& inputs,
                                                const CheckpointConfig& cadence);

}  // namespace lifeline::signals
