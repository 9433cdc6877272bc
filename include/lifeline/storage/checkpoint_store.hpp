#pragma once

#include "records.hpp"
#include "lifeline/checkpoint/checkpoint_codec.hpp"
#include "lifeline/core/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lifeline::storage {

using checkpoint::EncodedCheckpoint;

// Durable storage for checkpoints and the audit trails around them.
//
// Checkpoints are keyed by id and unique per (session_id, checkpoint_number).
// Apart from the three restore fields they are immutable once saved.
class CheckpointStore {
public:
    virtual ~CheckpointStore() = default;

    // Persist an encoded checkpoint. Fails with DuplicateCheckpointNumber
    // when the session already has a checkpoint with that number.
    virtual Result<void, Error> save(const Checkpoint& checkpoint,
                                     const EncodedCheckpoint& encoded) = 0;

    // Encode with compression and persist
    Result<void, Error> save(const Checkpoint& checkpoint);

    virtual Result<Checkpoint, Error> get_by_id(const CheckpointId& id) = 0;
    virtual Result<std::optional<Checkpoint>, Error> get_most_recent(const SessionId& session_id) = 0;
    virtual Result<std::optional<Checkpoint>, Error> get_most_recent_unrestored(const SessionId& session_id) = 0;

    // Ordered by checkpoint number, oldest first
    virtual Result<std::vector<Checkpoint>, Error> list_by_session(const SessionId& session_id) = 0;

    // Newest first, without decoding payloads
    virtual Result<std::vector<CheckpointHeader>, Error> list_headers(const SessionId& session_id) = 0;
    virtual Result<std::vector<CheckpointHeader>, Error> list_by_risk(CrashRisk risk, size_t limit = 100) = 0;

    virtual Result<int, Error> next_checkpoint_number(const SessionId& session_id) = 0;
    virtual Result<int, Error> count_checkpoints(const SessionId& session_id) = 0;
    virtual Result<CheckpointSize, Error> checkpoint_size(const CheckpointId& id) = 0;

    // Write the restore fields once. A second call fails with AlreadyRestored
    // and leaves the stored values untouched.
    virtual Result<void, Error> mark_restored(const CheckpointId& id, bool success,
                                              double fidelity, TimePoint at = now()) = 0;

    // Delete checkpoints older than the retention age, keeping the newest
    // checkpoint of every session. Returns the number deleted.
    virtual Result<int, Error> cleanup(int retention_days, TimePoint at = now()) = 0;

    // Keep at most max_keep checkpoints for a session, dropping the oldest
    virtual Result<int, Error> prune_session(const SessionId& session_id, int max_keep) = 0;

    // Resume events
    virtual Result<void, Error> save_resume_event(const ResumeEvent& event) = 0;

    // Mark the event's checkpoint restored and log the event as one unit.
    // The default runs the two calls in sequence.
    virtual Result<void, Error> record_resume(const ResumeEvent& event);
    virtual Result<std::vector<ResumeEvent>, Error> list_resume_events(const SessionId& session_id) = 0;

    // Signal history
    virtual Result<SignalHistoryRecord, Error> append_signal_record(const SessionId& session_id,
                                                                   const SignalSnapshot& snapshot) = 0;
    virtual Result<std::optional<SignalHistoryRecord>, Error> latest_signal_record(const SessionId& session_id) = 0;
    virtual Result<std::vector<SignalHistoryRecord>, Error> list_signal_history(const SessionId& session_id) = 0;
    virtual Result<std::vector<SignalHistoryRecord>, Error> signal_history_by_risk(CrashRisk risk) = 0;
    virtual Result<std::vector<SignalHistoryRecord>, Error> signal_history_between(TimePoint from, TimePoint to) = 0;
    virtual Result<int, Error> count_signal_history(const SessionId& session_id) = 0;
    virtual Result<int, Error> cleanup_signal_history(int retention_days, TimePoint at = now()) = 0;
    virtual Result<void, Error> delete_signal_history(const SessionId& session_id) = 0;
};

}  // namespace lifeline::storage
