#pragma once

#include "checkpoint_store.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;

namespace lifeline::storage {

namespace fs = std::filesystem;

// CheckpointStore on a single SQLite connection.
//
// All calls are serialized on one mutex. Cross-process races are still
// caught by the table constraints and by the conditional restore update.
class SqliteCheckpointStore : public CheckpointStore {
public:
    ~SqliteCheckpointStore() override;

    SqliteCheckpointStore(const SqliteCheckpointStore&) = delete;
    SqliteCheckpointStore& operator=(const SqliteCheckpointStore&) = delete;

    // Open (creating if needed) and migrate. ":memory:" opens a private
    // in-memory database.
    static Result<std::unique_ptr<SqliteCheckpointStore>, Error> open(const fs::path& path,
                                                                       bool wal = true);

    using CheckpointStore::save;
    Result<void, Error> save(const Checkpoint& checkpoint,
                             const EncodedCheckpoint& encoded) override;

    Result<Checkpoint, Error> get_by_id(const CheckpointId& id) override;
    Result<std::optional<Checkpoint>, Error> get_most_recent(const SessionId& session_id) override;
    Result<std::optional<Checkpoint>, Error> get_most_recent_unrestored(const SessionId& session_id) override;
    Result<std::vector<Checkpoint>, Error> list_by_session(const SessionId& session_id) override;
    Result<std::vector<CheckpointHeader>, Error> list_headers(const SessionId& session_id) override;
    Result<std::vector<CheckpointHeader>, Error> list_by_risk(CrashRisk risk, size_t limit = 100) override;

    Result<int, Error> next_checkpoint_number(const SessionId& session_id) override;
    Result<int, Error> count_checkpoints(const SessionId& session_id) override;
    Result<CheckpointSize, Error> checkpoint_size(const CheckpointId& id) override;

    Result<void, Error> mark_restored(const CheckpointId& id, bool success,
                                      double fidelity, TimePoint at = now()) override;

    Result<int, Error> cleanup(int retention_days, TimePoint at = now()) override;
    Result<int, Error> prune_session(const SessionId& session_id, int max_keep) override;

    Result<void, Error> save_resume_event(const ResumeEvent& event) override;
    Result<void, Error> record_resume(const ResumeEvent& event) override;
    Result<std::vector<ResumeEvent>, Error> list_resume_events(const SessionId& session_id) override;

    Result<SignalHistoryRecord, Error> append_signal_record(const SessionId& session_id,
                                                           const SignalSnapshot& snapshot) override;
    Result<std::optional<SignalHistoryRecord>, Error> latest_signal_record(const SessionId& session_id) override;
    Result<std::vector<SignalHistoryRecord>, Error> list_signal_history(const SessionId& session_id) override;
    Result<std::vector<SignalHistoryRecord>, Error> signal_history_by_risk(CrashRisk risk) override;
    Result<std::vector<SignalHistoryRecord>, Error> signal_history_between(TimePoint from, TimePoint to) override;
    Result<int, Error> count_signal_history(const SessionId& session_id) override;
    Result<int, Error> cleanup_signal_history(int retention_days, TimePoint at = now()) override;
    Result<void, Error> delete_signal_history(const SessionId& session_id) override;

    // Schema introspection
    Result<std::vector<std::string>, Error> tables();
    Result<std::vector<std::string>, Error> indices();
    Result<std::string, Error> journal_mode();
    Result<int, Error> schema_version();

    const fs::path& path() const { return path_; }

private:
    explicit SqliteCheckpointStore(sqlite3* db, fs::path path);

    sqlite3* db_;
    fs::path path_;
    std::mutex mutex_;

    Result<void, Error> exec(const std::string& sql);
    Result<void, Error> migrate(bool wal);

    // Unlocked bodies; callers hold mutex_
    Result<void, Error> update_restored(const CheckpointId& id, bool success,
                                        double fidelity, TimePoint at);
    Result<void, Error> insert_resume_event(const ResumeEvent& event);
    Result<std::vector<std::string>, Error> names_from_master(const char* type);
};

}  // namespace lifeline::storage
