#pragma once

#include "lifeline/checkpoint/checkpoint.hpp"
#include "lifeline/core/uuid.hpp"

namespace lifeline::testing {

using namespace lifeline::checkpoint;

inline const TimePoint kEpoch = from_millis(1700000000000);

// A fully populated caller snapshot
inline CheckpointInput sample_input(const SessionId& session_id) {
    CheckpointInput input;
    input.session_id = session_id;

    input.conversation.summary = "Refactoring the storage layer to use prepared statements";
    input.conversation.key_decisions = {"Keep SQLite", "Store payloads as blobs"};
    input.conversation.current_context = "Working through sqlite_store.cpp";
    input.conversation.recent_messages = {
        {Role::User, "Please migrate the queries", kEpoch},
        {Role::Assistant, "Starting with the checkpoint table", kEpoch + std::chrono::seconds{5}}
    };

    input.task.operation = "Migrate queries";
    input.task.phase = "implementation";
    input.task.progress = 0.4;
    input.task.completed_steps = {"Schema"};
    input.task.next_steps = {"Port list queries", "Run tests"};

    input.files.active_files = {"src/storage/sqlite_store.cpp"};
    input.files.modified_files = {"src/storage/sqlite_store.cpp"};
    input.files.uncommitted_diff = "+ sqlite3_prepare_v2(...)";

    input.tools.active_sessions = {{"term-1", ToolSessionType::Terminal, Json{{"cwd", "/work"}}}};
    input.tools.pending_operations = {
        {"op-1", PendingOperationType::FileWrite, "Write sqlite_store.cpp", "Re-run the edit"}
    };
    input.tools.recent_tool_calls = {
        {"bash", "ls src", "storage", true, Duration{120}, kEpoch}
    };

    input.user_preferences = UserPreferences{"Prefer small commits", {"tabs over spaces"}};
    return input;
}

// A stored-form checkpoint built from sample_input
inline Checkpoint sample_checkpoint(const SessionId& session_id, int number,
                                    TimePoint created_at = kEpoch,
                                    CheckpointTrigger trigger = CheckpointTrigger::ToolCallInterval) {
    auto input = sample_input(session_id);

    Checkpoint cp;
    cp.id = core::generate_checkpoint_id();
    cp.session_id = session_id;
    cp.checkpoint_number = number;
    cp.created_at = created_at;
    cp.triggered_by = trigger;
    cp.conversation = input.conversation;
    cp.task = input.task;
    cp.files = input.files;
    cp.tools = input.tools;
    cp.user_preferences = input.user_preferences;
    cp.signals.captured_at = created_at;
    cp.signals.message_count = 2;
    cp.signals.context_window_usage = 0.1;
    return cp;
}

}  // namespace lifeline::testing
