#pragma once

#include "lifeline/core/types.hpp"
#include "lifeline/signals/signal_snapshot.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lifeline::checkpoint {

using namespace lifeline::core;
using signals::SignalSnapshot;

// Cause recorded on every checkpoint
enum class CheckpointTrigger {
    ToolCallInterval,
    TimeInterval,
    DangerZone,
    WarningZone,
    RiskyOperation,
    Milestone,
    UserRequested,
    SessionStart,
    SessionEnd
};

std::string_view trigger_to_string(CheckpointTrigger trigger);
std::optional<CheckpointTrigger> trigger_from_string(std::string_view str);

// Conversation
struct RecentMessage {
    Role role = Role::User;
    std::string content;
    TimePoint timestamp{};

    Json to_json() const;
    static RecentMessage from_json(const Json& j);

    bool operator==(const RecentMessage&) const = default;
};

struct ConversationState {
    std::string summary;
    std::vector<std::string> key_decisions;
    std::string current_context;
    std::vector<RecentMessage> recent_messages;  // Oldest first

    bool empty() const {
        return summary.empty() && key_decisions.empty() &&
               current_context.empty() && recent_messages.empty();
    }

    Json to_json() const;
    static ConversationState from_json(const Json& j);

    bool operator==(const ConversationState&) const = default;
};

// Task
struct TaskState {
    std::string operation;
    std::string phase;
    double progress = 0.0;  // [0, 1]
    std::vector<std::string> completed_steps;
    std::vector<std::string> next_steps;
    std::vector<std::string> blockers;

    bool empty() const {
        return operation.empty() && phase.empty() && completed_steps.empty() &&
               next_steps.empty() && blockers.empty();
    }

    Json to_json() const;
    static TaskState from_json(const Json& j);

    bool operator==(const TaskState&) const = default;
};

// Files
struct FileState {
    std::vector<std::string> active_files;
    std::vector<std::string> modified_files;
    std::vector<std::string> staged_files;
    std::string uncommitted_diff;

    bool empty() const {
        return active_files.empty() && modified_files.empty() &&
               staged_files.empty() && uncommitted_diff.empty();
    }

    Json to_json() const;
    static FileState from_json(const Json& j);

    bool operator==(const FileState&) const = default;
};

// Tools
enum class ToolSessionType {
    Terminal,
    Browser,
    Search,
    Other
};

enum class PendingOperationType {
    FileWrite,
    Process,
    Search,
    Other
};

std::string_view tool_session_type_to_string(ToolSessionType type);
ToolSessionType tool_session_type_from_string(std::string_view str);

std::string_view pending_operation_type_to_string(PendingOperationType type);
PendingOperationType pending_operation_type_from_string(std::string_view str);

struct ToolSession {
    std::string id;
    ToolSessionType type = ToolSessionType::Other;
    Json state = Json::object();  // Free-form, owned by the tool

    Json to_json() const;
    static ToolSession from_json(const Json& j);

    bool operator==(const ToolSession&) const = default;
};

struct PendingOperation {
    std::string id;
    PendingOperationType type = PendingOperationType::Other;
    std::string description;
    std::string resume_hint;

    Json to_json() const;
    static PendingOperation from_json(const Json& j);

    bool operator==(const PendingOperation&) const = default;
};

struct ToolCallRecord {
    std::string tool_name;
    std::string args;
    std::string result;
    bool success = true;
    Duration latency{0};
    TimePoint timestamp{};

    Json to_json() const;
    static ToolCallRecord from_json(const Json& j);

    bool operator==(const ToolCallRecord&) const = default;
};

struct ToolState {
    std::vector<ToolSession> active_sessions;
    std::vector<PendingOperation> pending_operations;
    std::vector<ToolCallRecord> recent_tool_calls;  // Oldest first

    bool empty() const {
        return active_sessions.empty() && pending_operations.empty() &&
               recent_tool_calls.empty();
    }

    Json to_json() const;
    static ToolState from_json(const Json& j);

    bool operator==(const ToolState&) const = default;
};

struct UserPreferences {
    std::string custom_instructions;
    std::vector<std::string> recent_preferences;

    size_t total_chars() const;

    Json to_json() const;
    static UserPreferences from_json(const Json& j);

    bool operator==(const UserPreferences&) const = default;
};

// Immutable snapshot of a session's working state
struct Checkpoint {
    CheckpointId id;
    SessionId session_id;
    int checkpoint_number = 0;
    TimePoint created_at{};
    CheckpointTrigger triggered_by = CheckpointTrigger::ToolCallInterval;
    std::optional<std::string> description;

    ConversationState conversation;
    TaskState task;
    FileState files;
    ToolState tools;
    SignalSnapshot signals;
    std::optional<UserPreferences> user_preferences;

    // Written once when the checkpoint is consumed by a resume
    std::optional<TimePoint> restored_at;
    std::optional<bool> restore_success;
    std::optional<double> restore_fidelity;

    bool is_restored() const { return restored_at.has_value(); }

    Json to_json() const;
    static Checkpoint from_json(const Json& j);

    bool operator==(const Checkpoint&) const = default;
};

// Caller-supplied state for a new checkpoint. Identity, number, time and
// signals are filled in by the manager.
struct CheckpointInput {
    SessionId session_id;
    ConversationState conversation;
    TaskState task;
    FileState files;
    ToolState tools;
    std::optional<UserPreferences> user_preferences;
    std::optional<std::string> description;
};

}  // namespace lifeline::checkpoint
