#include "lifeline/storage/sqlite_store.hpp"
#include "lifeline/core/uuid.hpp"

#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include <algorithm>

namespace lifeline::storage {

namespace {

constexpr int kSchemaVersion = 1;
constexpr int kBusyTimeoutMs = 5000;

const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS checkpoints (
    id TEXT PRIMARY KEY,
    session_id TEXT NOT NULL,
    checkpoint_number INTEGER NOT NULL,
    created_at INTEGER NOT NULL,
    triggered_by TEXT NOT NULL,
    description TEXT,
    payload BLOB NOT NULL,

    crash_risk TEXT NOT NULL,
    progress REAL NOT NULL,
    operation TEXT,
    context_window_usage REAL,
    message_count INTEGER,
    tool_call_count INTEGER,

    uncompressed_size INTEGER NOT NULL,
    compressed_size INTEGER NOT NULL,
    compression_ratio REAL NOT NULL,

    restored_at INTEGER,
    restore_success INTEGER,
    restore_fidelity REAL,

    UNIQUE(session_id, checkpoint_number)
);

CREATE INDEX IF NOT EXISTS idx_checkpoints_session
    ON checkpoints(session_id, created_at DESC);

CREATE INDEX IF NOT EXISTS idx_checkpoints_risk
    ON checkpoints(crash_risk, created_at DESC);

CREATE INDEX IF NOT EXISTS idx_checkpoints_unrestored
    ON checkpoints(session_id, created_at DESC)
    WHERE restored_at IS NULL;

CREATE TABLE IF NOT EXISTS resume_events (
    id TEXT PRIMARY KEY,
    checkpoint_id TEXT NOT NULL,
    session_id TEXT NOT NULL,
    restored_at INTEGER NOT NULL,
    interruption_reason TEXT NOT NULL,
    time_since_checkpoint INTEGER NOT NULL,
    resume_confidence REAL NOT NULL,
    user_confirmed INTEGER,
    success INTEGER NOT NULL,
    fidelity_score REAL NOT NULL,
    notes TEXT
);

CREATE INDEX IF NOT EXISTS idx_resume_events_checkpoint
    ON resume_events(checkpoint_id);

CREATE INDEX IF NOT EXISTS idx_resume_events_session
    ON resume_events(session_id, restored_at DESC);

CREATE TABLE IF NOT EXISTS signal_history (
    id TEXT PRIMARY KEY,
    session_id TEXT NOT NULL,
    snapshot_number INTEGER NOT NULL,
    recorded_at INTEGER NOT NULL,
    signals TEXT NOT NULL,
    crash_risk TEXT NOT NULL,
    UNIQUE(session_id, snapshot_number)
);

CREATE INDEX IF NOT EXISTS idx_signal_history_session
    ON signal_history(session_id, recorded_at DESC);

CREATE INDEX IF NOT EXISTS idx_signal_history_risk
    ON signal_history(crash_risk, recorded_at DESC);

CREATE TABLE IF NOT EXISTS schema_version (
    version INTEGER PRIMARY KEY,
    applied_at INTEGER NOT NULL
);
)SQL";

constexpr const char* kHeaderColumns =
    "id, session_id, checkpoint_number, created_at, triggered_by, crash_risk, "
    "operation, progress, uncompressed_size, compressed_size, "
    "restored_at, restore_success, restore_fidelity";

constexpr const char* kCheckpointColumns =
    "id, session_id, checkpoint_number, created_at, triggered_by, crash_risk, "
    "operation, progress, uncompressed_size, compressed_size, "
    "restored_at, restore_success, restore_fidelity, payload";

constexpr int kPayloadColumn = 13;

constexpr const char* kResumeEventColumns =
    "id, checkpoint_id, session_id, restored_at, interruption_reason, "
    "time_since_checkpoint, resume_confidence, user_confirmed, success, "
    "fidelity_score, notes";

constexpr const char* kSignalColumns =
    "id, session_id, snapshot_number, recorded_at, signals";

// Prepared statement, finalized on scope exit
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) {
        rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
    }

    ~Statement() {
        sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return rc_ == SQLITE_OK; }

    void bind_text(int idx, const std::string& value) {
        sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }

    void bind_int64(int idx, int64_t value) {
        sqlite3_bind_int64(stmt_, idx, value);
    }

    void bind_double(int idx, double value) {
        sqlite3_bind_double(stmt_, idx, value);
    }

    void bind_blob(int idx, const std::vector<uint8_t>& value) {
        sqlite3_bind_blob(stmt_, idx, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }

    void bind_null(int idx) {
        sqlite3_bind_null(stmt_, idx);
    }

    void bind_optional_text(int idx, const std::optional<std::string>& value) {
        if (value) {
            bind_text(idx, *value);
        } else {
            bind_null(idx);
        }
    }

    int step() {
        rc_ = sqlite3_step(stmt_);
        return rc_;
    }

    bool is_null(int col) const {
        return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
    }

    std::string column_text(int col) const {
        const unsigned char* text = sqlite3_column_text(stmt_, col);
        if (!text) {
            return {};
        }
        return std::string(reinterpret_cast<const char*>(text),
                           static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
    }

    int64_t column_int64(int col) const {
        return sqlite3_column_int64(stmt_, col);
    }

    double column_double(int col) const {
        return sqlite3_column_double(stmt_, col);
    }

    std::vector<uint8_t> column_blob(int col) const {
        const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, col));
        int size = sqlite3_column_bytes(stmt_, col);
        if (!data || size <= 0) {
            return {};
        }
        return std::vector<uint8_t>(data, data + size);
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
    int rc_ = SQLITE_OK;
};

Error db_error(sqlite3* db, ErrorCode code, const std::string& what) {
    return Error{code, what + ": " + sqlite3_errmsg(db)}.with_source("sqlite_store");
}

Error prepare_error(sqlite3* db) {
    return db_error(db, ErrorCode::DatabaseQueryFailed, "Failed to prepare statement");
}

CheckpointHeader read_header(const Statement& stmt) {
    CheckpointHeader h;
    h.id = stmt.column_text(0);
    h.session_id = stmt.column_text(1);
    h.checkpoint_number = static_cast<int>(stmt.column_int64(2));
    h.created_at = from_millis(stmt.column_int64(3));
    h.triggered_by = checkpoint::trigger_from_string(stmt.column_text(4))
                         .value_or(CheckpointTrigger::ToolCallInterval);
    h.crash_risk = signals::crash_risk_from_string(stmt.column_text(5));
    h.operation = stmt.column_text(6);
    h.progress = stmt.column_double(7);
    h.uncompressed_size = static_cast<size_t>(stmt.column_int64(8));
    h.compressed_size = static_cast<size_t>(stmt.column_int64(9));
    if (!stmt.is_null(10)) {
        h.restored_at = from_millis(stmt.column_int64(10));
    }
    if (!stmt.is_null(11)) {
        h.restore_success = stmt.column_int64(11) != 0;
    }
    if (!stmt.is_null(12)) {
        h.restore_fidelity = stmt.column_double(12);
    }
    return h;
}

// Decode the payload and overlay the mutable restore columns
Result<Checkpoint, Error> read_checkpoint(const Statement& stmt) {
    CheckpointHeader header = read_header(stmt);
    auto decoded = checkpoint::decode(stmt.column_blob(kPayloadColumn));
    if (decoded.is_err()) {
        Error error = std::move(decoded).error();
        error.context = header.id;
        return Result<Checkpoint, Error>::err(std::move(error));
    }

    Checkpoint cp = std::move(decoded).value();
    cp.restored_at = header.restored_at;
    cp.restore_success = header.restore_success;
    cp.restore_fidelity = header.restore_fidelity;
    return Result<Checkpoint, Error>::ok(std::move(cp));
}

ResumeEvent read_resume_event(const Statement& stmt) {
    ResumeEvent e;
    e.id = stmt.column_text(0);
    e.checkpoint_id = stmt.column_text(1);
    e.session_id = stmt.column_text(2);
    e.restored_at = from_millis(stmt.column_int64(3));
    e.interruption_reason = interruption_reason_from_string(stmt.column_text(4));
    e.time_since_checkpoint = Duration{stmt.column_int64(5)};
    e.resume_confidence = stmt.column_double(6);
    if (!stmt.is_null(7)) {
        e.user_confirmed = stmt.column_int64(7) != 0;
    }
    e.success = stmt.column_int64(8) != 0;
    e.fidelity_score = stmt.column_double(9);
    if (!stmt.is_null(10)) {
        e.notes = stmt.column_text(10);
    }
    return e;
}

Result<SignalHistoryRecord, Error> read_signal_record(const Statement& stmt) {
    SignalHistoryRecord r;
    r.id = stmt.column_text(0);
    r.session_id = stmt.column_text(1);
    r.snapshot_number = static_cast<int>(stmt.column_int64(2));
    r.recorded_at = from_millis(stmt.column_int64(3));
    try {
        r.snapshot = SignalSnapshot::from_json(Json::parse(stmt.column_text(4)));
    } catch (const std::exception& e) {
        return Result<SignalHistoryRecord, Error>::err(
            ErrorCode::CorruptData, std::string("Bad signal history row: ") + e.what(), r.id);
    }
    return Result<SignalHistoryRecord, Error>::ok(std::move(r));
}

TimePoint retention_cutoff(int retention_days, TimePoint at) {
    return at - std::chrono::duration_cast<Duration>(std::chrono::hours{24} * retention_days);
}

}  // namespace

SqliteCheckpointStore::SqliteCheckpointStore(sqlite3* db, fs::path path)
    : db_(db)
    , path_(std::move(path))
{
}

SqliteCheckpointStore::~SqliteCheckpointStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

Result<std::unique_ptr<SqliteCheckpointStore>, Error> SqliteCheckpointStore::open(const fs::path& path,
                                                                                   bool wal) {
    using R = Result<std::unique_ptr<SqliteCheckpointStore>, Error>;

    bool in_memory = path.string() == ":memory:";
    if (!in_memory && path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return R::err(ErrorCode::DatabaseOpenFailed,
                          "Failed to create database directory: " + ec.message(),
                          path.parent_path().string());
        }
    }

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.string().c_str(), &db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close(db);
        return R::err(ErrorCode::DatabaseOpenFailed, message, path.string());
    }

    sqlite3_busy_timeout(db, kBusyTimeoutMs);
    sqlite3_extended_result_codes(db, 1);

    std::unique_ptr<SqliteCheckpointStore> store(new SqliteCheckpointStore(db, path));

    auto migrated = store->migrate(wal && !in_memory);
    if (migrated.is_err()) {
        return R::err(std::move(migrated).error());
    }

    spdlog::debug("Opened checkpoint store at {}", path.string());
    return R::ok(std::move(store));
}

Result<void, Error> SqliteCheckpointStore::exec(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string message = err_msg ? err_msg : sqlite3_errstr(rc);
        sqlite3_free(err_msg);
        return Result<void, Error>::err(ErrorCode::DatabaseQueryFailed, message);
    }
    return Result<void, Error>::ok();
}

Result<void, Error> SqliteCheckpointStore::migrate(bool wal) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (wal) {
        auto journal = exec("PRAGMA journal_mode=WAL;");
        if (journal.is_err()) {
            spdlog::warn("Could not enable WAL journal: {}", journal.error().message);
        }
    }

    auto schema = exec(kSchema);
    if (schema.is_err()) {
        Error error = std::move(schema).error();
        error.code = ErrorCode::SchemaFailed;
        return error;
    }

    Statement stmt(db_, "INSERT OR IGNORE INTO schema_version (version, applied_at) VALUES (?, ?)");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }
    stmt.bind_int64(1, kSchemaVersion);
    stmt.bind_int64(2, to_millis(now()));
    if (stmt.step() != SQLITE_DONE) {
        return db_error(db_, ErrorCode::SchemaFailed, "Failed to record schema version");
    }
    return Result<void, Error>::ok();
}

Result<void, Error> SqliteCheckpointStore::save(const Checkpoint& checkpoint,
                                                const EncodedCheckpoint& encoded) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_,
        "INSERT INTO checkpoints ("
        "id, session_id, checkpoint_number, created_at, triggered_by, description, payload, "
        "crash_risk, progress, operation, context_window_usage, message_count, tool_call_count, "
        "uncompressed_size, compressed_size, compression_ratio"
        ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }

    stmt.bind_text(1, checkpoint.id);
    stmt.bind_text(2, checkpoint.session_id);
    stmt.bind_int64(3, checkpoint.checkpoint_number);
    stmt.bind_int64(4, to_millis(checkpoint.created_at));
    stmt.bind_text(5, std::string(checkpoint::trigger_to_string(checkpoint.triggered_by)));
    stmt.bind_optional_text(6, checkpoint.description);
    stmt.bind_blob(7, encoded.bytes);
    stmt.bind_text(8, std::string(signals::crash_risk_to_string(checkpoint.signals.crash_risk)));
    stmt.bind_double(9, checkpoint.task.progress);
    stmt.bind_text(10, checkpoint.task.operation);
    stmt.bind_double(11, checkpoint.signals.context_window_usage);
    stmt.bind_int64(12, checkpoint.signals.message_count);
    stmt.bind_int64(13, checkpoint.signals.total_tool_calls);
    stmt.bind_int64(14, static_cast<int64_t>(encoded.uncompressed_size));
    stmt.bind_int64(15, static_cast<int64_t>(encoded.compressed_size));
    stmt.bind_double(16, encoded.compression_ratio);

    int rc = stmt.step();
    if (rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result<void, Error>::err(
            ErrorCode::DuplicateCheckpointNumber,
            "Checkpoint number " + std::to_string(checkpoint.checkpoint_number) +
                " already exists",
            checkpoint.session_id);
    }
    if (rc == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result<void, Error>::err(ErrorCode::AlreadyExists, "Checkpoint id already exists",
                                        checkpoint.id);
    }
    if (rc != SQLITE_DONE) {
        return db_error(db_, ErrorCode::DatabaseQueryFailed, "Failed to save checkpoint");
    }
    return Result<void, Error>::ok();
}

Result<Checkpoint, Error> SqliteCheckpointStore::get_by_id(const CheckpointId& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, std::string("SELECT ") + kCheckpointColumns + " FROM checkpoints WHERE id = ?");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }
    stmt.bind_text(1, id);

    int rc = stmt.step();
    if (rc == SQLITE_ROW) {
        return read_checkpoint(stmt);
    }
    if (rc == SQLITE_DONE) {
        return Result<Checkpoint, Error>::err(ErrorCode::CheckpointNotFound, "Checkpoint not found", id);
    }
    return db_error(db_, ErrorCode::DatabaseQueryFailed, "Failed to load checkpoint");
}

Result<std::optional<Checkpoint>, Error> SqliteCheckpointStore::get_most_recent(const SessionId& session_id) {
    using R = Result<std::optional<Checkpoint>, Error>;
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, std::string("SELECT ") + kCheckpointColumns +
        " FROM checkpoints WHERE session_id = ?"
        " ORDER BY created_at DESC, checkpoint_number DESC LIMIT 1");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }
    stmt.bind_text(1, session_id);

    int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        return R::ok(std::nullopt);
    }
    if (rc != SQLITE_ROW) {
        return db_error(db_, ErrorCode::DatabaseQueryFailed, "Failed to load most recent checkpoint");
    }

    auto cp = read_checkpoint(stmt);
    if (cp.is_err()) {
        return R::err(std::move(cp).error());
    }
    return R::ok(std::move(cp).value());
}

Result<std::optional<Checkpoint>, Error> SqliteCheckpointStore::get_most_recent_unrestored(
    const SessionId& session_id) {
    using R = Result<std::optional<Checkpoint>, Error>;
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, std::string("SELECT ") + kCheckpointColumns +
        " FROM checkpoints WHERE session_id = ? AND restored_at IS NULL"
        " ORDER BY created_at DESC, checkpoint_number DESC LIMIT 1");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }
    stmt.bind_text(1, session_id);

    int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        return R::ok(std::nullopt);
    }
    if (rc != SQLITE_ROW) {
        return db_error(db_, ErrorCode::DatabaseQueryFailed, "Failed to load unrestored checkpoint");
    }

    auto cp = read_checkpoint(stmt);
    if (cp.is_err()) {
        return R::err(std::move(cp).error());
    }
    return R::ok(std::move(cp).value());
}

Result<std::vector<Checkpoint>, Error> SqliteCheckpointStore::list_by_session(const SessionId& session_id) {
    using R = Result<std::vector<Checkpoint>, Error>;
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, std::string("SELECT ") + kCheckpointColumns +
        " FROM checkpoints WHERE session_id = ? ORDER BY checkpoint_number ASC");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }
    stmt.bind_text(1, session_id);

    std::vector<Checkpoint> checkpoints;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        auto cp = read_checkpoint(stmt);
        if (cp.is_err()) {
            return R::err(std::move(cp).error());
        }
        checkpoints.push_back(std::move(cp).value());
    }
    if (rc != SQLITE_DONE) {
        return db_error(db_, ErrorCode::DatabaseQueryFailed, "Failed to list checkpoints");
    }
    return R::ok(std::move(checkpoints));
}

Result<std::vector<CheckpointHeader>, Error> SqliteCheckpointStore::list_headers(const SessionId& session_id) {
    using R = Result<std::vector<CheckpointHeader>, Error>;
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, std::string("SELECT ") + kHeaderColumns +
        " FROM checkpoints WHERE session_id = ?"
        " ORDER BY created_at DESC, checkpoint_number DESC");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }
    stmt.bind_text(1, session_id);

    std::vector<CheckpointHeader> headers;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        headers.push_back(read_header(stmt));
    }
    if (rc != SQLITE_DONE) {
        return db_error(db_, ErrorCode::DatabaseQueryFailed, "Failed to list checkpoint headers");
    }
    return R::ok(std::move(headers));
}

Result<std::vector<CheckpointHeader>, Error> SqliteCheckpointStore::list_by_risk(CrashRisk risk, size_t limit) {
    using R = Result<std::vector<CheckpointHeader>, Error>;
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, std::string("SELECT ") + kHeaderColumns +
        " FROM checkpoints WHERE crash_risk = ? ORDER BY created_at DESC LIMIT ?");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }
    stmt.bind_text(1, std::string(signals::crash_risk_to_string(risk)));
    stmt.bind_int64(2, static_cast<int64_t>(limit));

    std::vector<CheckpointHeader> headers;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        headers.push_back(read_header(stmt));
    }
    if (rc != SQLITE_DONE) {
        return db_error(db_, ErrorCode::DatabaseQueryFailed, "Failed to list checkpoints by risk");
    }
    return R::ok(std::move(headers));
}

Result<int, Error> SqliteCheckpointStore::next_checkpoint_number(const SessionId& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_,
        "SELECT COALESCE(MAX(checkpoint_number), 0) + 1 FROM checkpoints WHERE session_id = ?");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }
    stmt.bind_text(1, session_id);

    if (stmt.step() != SQLITE_ROW) {
        return db_error(db_, ErrorCode::DatabaseQueryFailed, "Failed to compute next checkpoint number");
    }
    return Result<int, Error>::ok(static_cast<int>(stmt.column_int64(0)));
}

Result<int, Error> SqliteCheckpointStore::count_checkpoints(const SessionId& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "SELECT COUNT(*) FROM checkpoints WHERE session_id = ?");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }
    stmt.bind_text(1, session_id);

    if (stmt.step() != SQLITE_ROW) {
        return db_error(db_, ErrorCode::DatabaseQueryFailed, "Failed to count checkpoints");
    }
    return Result<int, Error>::ok(static_cast<int>(stmt.column_int64(0)));
}

Result<CheckpointSize, Error> SqliteCheckpointStore::checkpoint_size(const CheckpointId& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_,
        "SELECT uncompressed_size, compressed_size, compression_ratio FROM checkpoints WHERE id = ?");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }
    stmt.bind_text(1, id);

    int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        return Result<CheckpointSize, Error>::err(ErrorCode::CheckpointNotFound, "Checkpoint not found", id);
    }
    if (rc != SQLITE_ROW) {
        return db_error(db_, ErrorCode::DatabaseQueryFailed, "Failed to read checkpoint size");
    }

    CheckpointSize size;
    size.uncompressed = static_cast<size_t>(stmt.column_int64(0));
    size.compressed = static_cast<size_t>(stmt.column_int64(1));
    size.compression_ratio = stmt.column_double(2);
    return Result<CheckpointSize, Error>::ok(size);
}

Result<void, Error> SqliteCheckpointStore::mark_restored(const CheckpointId& id, bool success,
                                                         double fidelity, TimePoint at) {
    std::lock_guard<std::mutex> lock(mutex_);
    return update_restored(id, success, fidelity, at);
}

Result<void, Error> SqliteCheckpointStore::update_restored(const CheckpointId& id, bool success,
                                                           double fidelity, TimePoint at) {
    Statement update(db_,
        "UPDATE checkpoints SET restored_at = ?, restore_success = ?, restore_fidelity = ?"
        " WHERE id = ? AND restored_at IS NULL");
    if (!update.ok()) {
        return prepare_error(db_);
    }
    update.bind_int64(1, to_millis(at));
    update.bind_int64(2, success ? 1 : 0);
    update.bind_double(3, fidelity);
    update.bind_text(4, id);

    if (update.step() != SQLITE_DONE) {
        return db_error(db_, ErrorCode::DatabaseQueryFailed, "Failed to mark checkpoint restored");
    }
    if (sqlite3_changes(db_) > 0) {
        return Result<void, Error>::ok();
    }

    // Nothing changed: either the row is missing or it was restored before
    Statement exists(db_, "SELECT 1 FROM checkpoints WHERE id = ?");
    if (!exists.ok()) {
        return prepare_error(db_);
    }
    exists.bind_text(1, id);

    int rc = exists.step();
    if (rc == SQLITE_ROW) {
        return Result<void, Error>::err(ErrorCode::AlreadyRestored, "Checkpoint already restored", id);
    }
    if (rc == SQLITE_DONE) {
        return Result<void, Error>::err(ErrorCode::CheckpointNotFound, "Checkpoint not found", id);
    }
    return db_error(db_, ErrorCode::DatabaseQueryFailed, "Failed to look up checkpoint");
}

Result<int, Error> SqliteCheckpointStore::cleanup(int retention_days, TimePoint at) {
    if (retention_days < 0) {
        return Result<int, Error>::err(ErrorCode::InvalidArgument, "retention_days must not be negative");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_,
        "DELETE FROM checkpoints"
        " WHERE created_at < ?"
        " AND id NOT IN ("
        "   SELECT (SELECT c.id FROM checkpoints c"
        "           WHERE c.session_id = s.session_id"
        "           ORDER BY c.created_at DESC, c.checkpoint_number DESC LIMIT 1)"
        "   FROM (SELECT DISTINCT session_id FROM checkpoints) s"
        " )");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }
    stmt.bind_int64(1, to_millis(retention_cutoff(retention_days, at)));

    if (stmt.step() != SQLITE_DONE) {
        return db_error(db_, ErrorCode::DatabaseQueryFailed, "Failed to clean up checkpoints");
    }

    int deleted = sqlite3_changes(db_);
    if (deleted > 0) {
        spdlog::info("Retention cleanup removed {} checkpoints older than {} days", deleted, retention_days);
    }
    return Result<int, Error>::ok(deleted);
}

Result<int, Error> SqliteCheckpointStore::prune_session(const SessionId& session_id, int max_keep) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_,
        "DELETE FROM checkpoints WHERE session_id = ?1 AND id NOT IN ("
        "  SELECT id FROM checkpoints WHERE session_id = ?1"
        "  ORDER BY created_at DESC, checkpoint_number DESC LIMIT ?2"
        ")");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }
    stmt.bind_text(1, session_id);
    stmt.bind_int64(2, std::max(max_keep, 1));

    if (stmt.step() != SQLITE_DONE) {
        return db_error(db_, ErrorCode::DatabaseQueryFailed, "Failed to prune session checkpoints");
    }
    return Result<int, Error>::ok(sqlite3_changes(db_));
}

Result<void, Error> SqliteCheckpointStore::save_resume_event(const ResumeEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    return insert_resume_event(event);
}

Result<void, Error> SqliteCheckpointStore::record_resume(const ResumeEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    LIFELINE_TRY_VOID(exec("BEGIN IMMEDIATE;"));

    auto restored = update_restored(event.checkpoint_id, event.success,
                                    event.fidelity_score, event.restored_at);
    if (restored.is_ok()) {
        restored = insert_resume_event(event);
    }
    if (restored.is_err()) {
        auto rollback = exec("ROLLBACK;");
        if (rollback.is_err()) {
            spdlog::error("Rollback of resume for checkpoint {} failed: {}",
                          event.checkpoint_id, rollback.error().message);
        }
        return restored;
    }

    auto commit = exec("COMMIT;");
    if (commit.is_err()) {
        auto rollback = exec("ROLLBACK;");
        if (rollback.is_err()) {
            spdlog::error("Rollback of resume for checkpoint {} failed: {}",
                          event.checkpoint_id, rollback.error().message);
        }
        return commit;
    }
    return Result<void, Error>::ok();
}

Result<void, Error> SqliteCheckpointStore::insert_resume_event(const ResumeEvent& event) {
    Statement stmt(db_, std::string("INSERT INTO resume_events (") + kResumeEventColumns +
        ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }

    stmt.bind_text(1, event.id.empty() ? generate_resume_event_id() : event.id);
    stmt.bind_text(2, event.checkpoint_id);
    stmt.bind_text(3, event.session_id);
    stmt.bind_int64(4, to_millis(event.restored_at));
    stmt.bind_text(5, std::string(interruption_reason_to_string(event.interruption_reason)));
    stmt.bind_int64(6, event.time_since_checkpoint.count());
    stmt.bind_double(7, event.resume_confidence);
    if (event.user_confirmed) {
        stmt.bind_int64(8, *event.user_confirmed ? 1 : 0);
    } else {
        stmt.bind_null(8);
    }
    stmt.bind_int64(9, event.success ? 1 : 0);
    stmt.bind_double(10, event.fidelity_score);
    stmt.bind_optional_text(11, event.notes);

    int rc = stmt.step();
    if (rc == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result<void, Error>::err(ErrorCode::AlreadyExists, "Resume event already recorded", event.id);
    }
    if (rc != SQLITE_DONE) {
        return db_error(db_, ErrorCode::DatabaseQueryFailed, "Failed to save resume event");
    }
    return Result<void, Error>::ok();
}

Result<std::vector<ResumeEvent>, Error> SqliteCheckpointStore::list_resume_events(const SessionId& session_id) {
    using R = Result<std::vector<ResumeEvent>, Error>;
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, std::string("SELECT ") + kResumeEventColumns +
        " FROM resume_events WHERE session_id = ? ORDER BY restored_at DESC");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }
    stmt.bind_text(1, session_id);

    std::vector<ResumeEvent> events;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        events.push_back(read_resume_event(stmt));
    }
    if (rc != SQLITE_DONE) {
        return db_error(db_, ErrorCode::DatabaseQueryFailed, "Failed to list resume events");
    }
    return R::ok(std::move(events));
}

Result<SignalHistoryRecord, Error> SqliteCheckpointStore::append_signal_record(const SessionId& session_id,
                                                                              const SignalSnapshot& snapshot) {
    using R = Result<SignalHistoryRecord, Error>;
    std::lock_guard<std::mutex> lock(mutex_);

    SignalHistoryRecord record;
    record.id = generate_signal_record_id();
    record.session_id = session_id;
    record.recorded_at = snapshot.captured_at;
    record.snapshot = snapshot;

    Statement stmt(db_,
        "INSERT INTO signal_history (id, session_id, snapshot_number, recorded_at, signals, crash_risk)"
        " VALUES (?1, ?2,"
        "   (SELECT COALESCE(MAX(snapshot_number), 0) + 1 FROM signal_history WHERE session_id = ?2),"
        "   ?3, ?4, ?5)"
        " RETURNING snapshot_number");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }
    stmt.bind_text(1, record.id);
    stmt.bind_text(2, session_id);
    stmt.bind_int64(3, to_millis(record.recorded_at));
    std::string signals_json;
    try {
        signals_json = snapshot.to_json().dump(-1, ' ', false, Json::error_handler_t::replace);
    } catch (const std::exception& e) {
        return R::err(Error::from_exception(e).with_source("sqlite_store"));
    }
    stmt.bind_text(4, signals_json);
    stmt.bind_text(5, std::string(signals::crash_risk_to_string(snapshot.crash_risk)));

    if (stmt.step() != SQLITE_ROW) {
        return db_error(db_, ErrorCode::DatabaseQueryFailed, "Failed to append signal history");
    }
    record.snapshot_number = static_cast<int>(stmt.column_int64(0));
    if (stmt.step() != SQLITE_DONE) {
        return db_error(db_, ErrorCode::DatabaseQueryFailed, "Failed to append signal history");
    }
    return R::ok(std::move(record));
}

Result<std::optional<SignalHistoryRecord>, Error> SqliteCheckpointStore::latest_signal_record(
    const SessionId& session_id) {
    using R = Result<std::optional<SignalHistoryRecord>, Error>;
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, std::string("SELECT ") + kSignalColumns +
        " FROM signal_history WHERE session_id = ? ORDER BY snapshot_number DESC LIMIT 1");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }
    stmt.bind_text(1, session_id);

    int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        return R::ok(std::nullopt);
    }
    if (rc != SQLITE_ROW) {
        return db_error(db_, ErrorCode::DatabaseQueryFailed, "Failed to read signal history");
    }

    auto record = read_signal_record(stmt);
    if (record.is_err()) {
        return R::err(std::move(record).error());
    }
    return R::ok(std::move(record).value());
}

namespace {

Result<std::vector<SignalHistoryRecord>, Error> collect_signal_records(sqlite3* db, Statement& stmt) {
    using R = Result<std::vector<SignalHistoryRecord>, Error>;

    std::vector<SignalHistoryRecord> records;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        auto record = read_signal_record(stmt);
        if (record.is_err()) {
            return R::err(std::move(record).error());
        }
        records.push_back(std::move(record).value());
    }
    if (rc != SQLITE_DONE) {
        return db_error(db, ErrorCode::DatabaseQueryFailed, "Failed to read signal history");
    }
    return R::ok(std::move(records));
}

}  // namespace

Result<std::vector<SignalHistoryRecord>, Error> SqliteCheckpointStore::list_signal_history(
    const SessionId& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, std::string("SELECT ") + kSignalColumns +
        " FROM signal_history WHERE session_id = ? ORDER BY snapshot_number ASC");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }
    stmt.bind_text(1, session_id);
    return collect_signal_records(db_, stmt);
}

Result<std::vector<SignalHistoryRecord>, Error> SqliteCheckpointStore::signal_history_by_risk(CrashRisk risk) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, std::string("SELECT ") + kSignalColumns +
        " FROM signal_history WHERE crash_risk = ? ORDER BY recorded_at DESC");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }
    stmt.bind_text(1, std::string(signals::crash_risk_to_string(risk)));
    return collect_signal_records(db_, stmt);
}

Result<std::vector<SignalHistoryRecord>, Error> SqliteCheckpointStore::signal_history_between(TimePoint from,
                                                                                             TimePoint to) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, std::string("SELECT ") + kSignalColumns +
        " FROM signal_history WHERE recorded_at >= ? AND recorded_at <= ? ORDER BY recorded_at ASC");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }
    stmt.bind_int64(1, to_millis(from));
    stmt.bind_int64(2, to_millis(to));
    return collect_signal_records(db_, stmt);
}

Result<int, Error> SqliteCheckpointStore::count_signal_history(const SessionId& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "SELECT COUNT(*) FROM signal_history WHERE session_id = ?");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }
    stmt.bind_text(1, session_id);

    if (stmt.step() != SQLITE_ROW) {
        return db_error(db_, ErrorCode::DatabaseQueryFailed, "Failed to count signal history");
    }
    return Result<int, Error>::ok(static_cast<int>(stmt.column_int64(0)));
}

Result<int, Error> SqliteCheckpointStore::cleanup_signal_history(int retention_days, TimePoint at) {
    if (retention_days < 0) {
        return Result<int, Error>::err(ErrorCode::InvalidArgument, "retention_days must not be negative");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "DELETE FROM signal_history WHERE recorded_at < ?");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }
    stmt.bind_int64(1, to_millis(retention_cutoff(retention_days, at)));

    if (stmt.step() != SQLITE_DONE) {
        return db_error(db_, ErrorCode::DatabaseQueryFailed, "Failed to clean up signal history");
    }
    return Result<int, Error>::ok(sqlite3_changes(db_));
}

Result<void, Error> SqliteCheckpointStore::delete_signal_history(const SessionId& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "DELETE FROM signal_history WHERE session_id = ?");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }
    stmt.bind_text(1, session_id);

    if (stmt.step() != SQLITE_DONE) {
        return db_error(db_, ErrorCode::DatabaseQueryFailed, "Failed to delete signal history");
    }
    return Result<void, Error>::ok();
}

Result<std::vector<std::string>, Error> SqliteCheckpointStore::names_from_master(const char* type) {
    using R = Result<std::vector<std::string>, Error>;
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_,
        "SELECT name FROM sqlite_master WHERE type = ? AND name NOT LIKE 'sqlite_%' ORDER BY name");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }
    stmt.bind_text(1, type);

    std::vector<std::string> names;
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        names.push_back(stmt.column_text(0));
    }
    if (rc != SQLITE_DONE) {
        return db_error(db_, ErrorCode::DatabaseQueryFailed, "Failed to read schema");
    }
    return R::ok(std::move(names));
}

Result<std::vector<std::string>, Error> SqliteCheckpointStore::tables() {
    return names_from_master("table");
}

Result<std::vector<std::string>, Error> SqliteCheckpointStore::indices() {
    return names_from_master("index");
}

Result<std::string, Error> SqliteCheckpointStore::journal_mode() {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "PRAGMA journal_mode");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }
    if (stmt.step() != SQLITE_ROW) {
        return db_error(db_, ErrorCode::DatabaseQueryFailed, "Failed to read journal mode");
    }
    return Result<std::string, Error>::ok(stmt.column_text(0));
}

Result<int, Error> SqliteCheckpointStore::schema_version() {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "SELECT MAX(version) FROM schema_version");
    if (!stmt.ok()) {
        return prepare_error(db_);
    }
    if (stmt.step() != SQLITE_ROW) {
        return db_error(db_, ErrorCode::DatabaseQueryFailed, "Failed to read schema version");
    }
    return Result<int, Error>::ok(static_cast<int>(stmt.column_int64(0)));
}

}  // namespace lifeline::storage
