#pragma once

#include "lifeline/checkpoint/checkpoint.hpp"
#include "lifeline/storage/records.hpp"

#include <string>
#include <vector>

namespace lifeline::recovery {

using namespace lifeline::core;
using checkpoint::Checkpoint;
using storage::InterruptionReason;

// "N minutes" below an hour, "H hours, M minutes" above
std::string format_duration(Duration elapsed);

// Structured continuation prompt built from one checkpoint
struct ResumePrompt {
    // Fixed sections
    std::string situation;
    std::string progress;
    std::string context;
    std::string next_steps;
    std::string files;
    std::string tools;
    std::string blockers;

    // Metadata
    CheckpointId checkpoint_id;
    int checkpoint_number = 0;
    InterruptionReason interruption_reason = InterruptionReason::Unknown;
    std::string time_since;
    double task_progress = 0.0;

    static ResumePrompt build(const Checkpoint& checkpoint, InterruptionReason reason, Duration elapsed);

    // User-facing text
    std::string render() const;

    Json to_json() const;
};

}  // namespace lifeline::recovery
