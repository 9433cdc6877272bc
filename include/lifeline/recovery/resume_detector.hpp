#pragma once

#include "resume_prompt.hpp"
#include "lifeline/core/config.hpp"
#include "lifeline/core/result.hpp"
#include "lifeline/storage/checkpoint_store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lifeline::recovery {

using storage::ResumeEvent;

// Outcome of evaluating a session for continuation
struct ResumeDecision {
    SessionId session_id;
    bool should_resume = false;
    InterruptionReason interruption_reason = InterruptionReason::Unknown;
    double confidence = 0.0;
    Duration time_since_checkpoint{0};
    std::optional<Checkpoint> checkpoint;
    std::optional<ResumePrompt> prompt;
    int skipped_corrupt = 0;  // Newer checkpoints that failed to decode

    Json to_json() const;
};

// Sections handed back to the host session when it restores
struct RestoredState {
    CheckpointId checkpoint_id;
    SessionId session_id;
    checkpoint::ConversationState conversation;
    checkpoint::TaskState task;
    checkpoint::FileState files;
    checkpoint::ToolState tools;
    std::optional<checkpoint::UserPreferences> user_preferences;
    double fidelity = 0.0;
};

// Weighted share of the checkpoint sections that carry state
// (conversation 0.3, task 0.4, files 0.2, tools 0.1)
double restore_fidelity(const Checkpoint& checkpoint);

// Looks for an unconsumed checkpoint on session start and decides whether
// to offer continuation. Holds no state between calls.
class ResumeDetector {
public:
    ResumeDetector(storage::CheckpointStore& store, const ResumeConfig& config);

    // Never fails. Missing sessions, store errors and exhausted fallbacks
    // all produce a negative decision.
    ResumeDecision check_resume_needed(const SessionId& session_id, TimePoint at = now());

    // Record the caller's answer. Marks the checkpoint restored first, so a
    // second consumption fails with AlreadyRestored and writes nothing.
    Result<ResumeEvent, Error> consume(const ResumeDecision& decision, bool accepted,
                                       TimePoint at = now());

    Result<RestoredState, Error> restore_state(const CheckpointId& checkpoint_id);

    InterruptionReason classify(const Checkpoint& checkpoint, Duration elapsed) const;
    double confidence(const Checkpoint& checkpoint, Duration elapsed) const;

private:
    storage::CheckpointStore& store_;
    ResumeConfig config_;
};

}  // namespace lifeline::recovery
