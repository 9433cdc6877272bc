#include "lifeline/checkpoint/checkpoint.hpp"

#include <stdexcept>

namespace lifeline::checkpoint {

namespace {

std::vector<std::string> string_list(const Json& j, const char* key) {
    if (j.contains(key)) {
        return j[key].get<std::vector<std::string>>();
    }
    return {};
}

template<typename T>
std::vector<T> object_list(const Json& j, const char* key) {
    std::vector<T> items;
    if (j.contains(key)) {
        for (const auto& item : j[key]) {
            items.push_back(T::from_json(item));
        }
    }
    return items;
}

template<typename T>
Json to_json_array(const std::vector<T>& items) {
    Json arr = Json::array();
    for (const auto& item : items) {
        arr.push_back(item.to_json());
    }
    return arr;
}

}  // namespace

std::string_view trigger_to_string(CheckpointTrigger trigger) {
    switch (trigger) {
        case CheckpointTrigger::ToolCallInterval: return "tool_call_interval";
        case CheckpointTrigger::TimeInterval: return "time_interval";
        case CheckpointTrigger::DangerZone: return "danger_zone";
        case CheckpointTrigger::WarningZone: return "warning_zone";
        case CheckpointTrigger::RiskyOperation: return "risky_operation";
        case CheckpointTrigger::Milestone: return "milestone";
        case CheckpointTrigger::UserRequested: return "user_requested";
        case CheckpointTrigger::SessionStart: return "session_start";
        case CheckpointTrigger::SessionEnd: return "session_end";
    }
    return "unknown";
}

std::optional<CheckpointTrigger> trigger_from_string(std::string_view str) {
    if (str == "tool_call_interval") return CheckpointTrigger::ToolCallInterval;
    if (str == "time_interval") return CheckpointTrigger::TimeInterval;
    if (str == "danger_zone") return CheckpointTrigger::DangerZone;
    if (str == "warning_zone") return CheckpointTrigger::WarningZone;
    if (str == "risky_operation") return CheckpointTrigger::RiskyOperation;
    if (str == "milestone") return CheckpointTrigger::Milestone;
    if (str == "user_requested") return CheckpointTrigger::UserRequested;
    if (str == "session_start") return CheckpointTrigger::SessionStart;
    if (str == "session_end") return CheckpointTrigger::SessionEnd;
    return std::nullopt;
}

std::string_view tool_session_type_to_string(ToolSessionType type) {
    switch (type) {
        case ToolSessionType::Terminal: return "terminal";
        case ToolSessionType::Browser: return "browser";
        case ToolSessionType::Search: return "search";
        case ToolSessionType::Other: return "other";
    }
    return "other";
}

ToolSessionType tool_session_type_from_string(std::string_view str) {
    if (str == "terminal") return ToolSessionType::Terminal;
    if (str == "browser") return ToolSessionType::Browser;
    if (str == "search") return ToolSessionType::Search;
    return ToolSessionType::Other;
}

std::string_view pending_operation_type_to_string(PendingOperationType type) {
    switch (type) {
        case PendingOperationType::FileWrite: return "file_write";
        case PendingOperationType::Process: return "process";
        case PendingOperationType::Search: return "search";
        case PendingOperationType::Other: return "other";
    }
    return "other";
}

PendingOperationType pending_operation_type_from_string(std::string_view str) {
    if (str == "file_write") return PendingOperationType::FileWrite;
    if (str == "process") return PendingOperationType::Process;
    if (str == "search") return PendingOperationType::Search;
    return PendingOperationType::Other;
}

// RecentMessage
Json RecentMessage::to_json() const {
    return Json{
        {"role", std::string(role_to_string(role))},
        {"content", content},
        {"timestamp", to_millis(timestamp)}
    };
}

RecentMessage RecentMessage::from_json(const Json& j) {
    RecentMessage msg;
    msg.role = role_from_string(j.value("role", "user"));
    msg.content = j.value("content", "");
    msg.timestamp = from_millis(j.value("timestamp", int64_t{0}));
    return msg;
}

// ConversationState
Json ConversationState::to_json() const {
    return Json{
        {"summary", summary},
        {"key_decisions", key_decisions},
        {"current_context", current_context},
        {"recent_messages", to_json_array(recent_messages)}
    };
}

ConversationState ConversationState::from_json(const Json& j) {
    ConversationState cs;
    cs.summary = j.value("summary", "");
    cs.key_decisions = string_list(j, "key_decisions");
    cs.current_context = j.value("current_context", "");
    cs.recent_messages = object_list<RecentMessage>(j, "recent_messages");
    return cs;
}

// TaskState
Json TaskState::to_json() const {
    return Json{
        {"operation", operation},
        {"phase", phase},
        {"progress", progress},
        {"completed_steps", completed_steps},
        {"next_steps", next_steps},
        {"blockers", blockers}
    };
}

TaskState TaskState::from_json(const Json& j) {
    TaskState ts;
    ts.operation = j.value("operation", "");
    ts.phase = j.value("phase", "");
    ts.progress = j.value("progress", 0.0);
    ts.completed_steps = string_list(j, "completed_steps");
    ts.next_steps = string_list(j, "next_steps");
    ts.blockers = string_list(j, "blockers");
    return ts;
}

// FileState
Json FileState::to_json() const {
    return Json{
        {"active_files", active_files},
        {"modified_files", modified_files},
        {"staged_files", staged_files},
        {"uncommitted_diff", uncommitted_diff}
    };
}

FileState FileState::from_json(const Json& j) {
    FileState state;
    state.active_files = string_list(j, "active_files");
    state.modified_files = string_list(j, "modified_files");
    state.staged_files = string_list(j, "staged_files");
    state.uncommitted_diff = j.value("uncommitted_diff", "");
    return state;
}

// ToolSession
Json ToolSession::to_json() const {
    return Json{
        {"id", id},
        {"type", std::string(tool_session_type_to_string(type))},
        {"state", state}
    };
}

ToolSession ToolSession::from_json(const Json& j) {
    ToolSession ts;
    ts.id = j.value("id", "");
    ts.type = tool_session_type_from_string(j.value("type", "other"));
    if (j.contains("state")) {
        ts.state = j["state"];
    }
    return ts;
}

// PendingOperation
Json PendingOperation::to_json() const {
    return Json{
        {"id", id},
        {"type", std::string(pending_operation_type_to_string(type))},
        {"description", description},
        {"resume_hint", resume_hint}
    };
}

PendingOperation PendingOperation::from_json(const Json& j) {
    PendingOperation op;
    op.id = j.value("id", "");
    op.type = pending_operation_type_from_string(j.value("type", "other"));
    op.description = j.value("description", "");
    op.resume_hint = j.value("resume_hint", "");
    return op;
}

// ToolCallRecord
Json ToolCallRecord::to_json() const {
    return Json{
        {"tool_name", tool_name},
        {"args", args},
        {"result", result},
        {"success", success},
        {"latency_ms", latency.count()},
        {"timestamp", to_millis(timestamp)}
    };
}

ToolCallRecord ToolCallRecord::from_json(const Json& j) {
    ToolCallRecord rec;
    rec.tool_name = j.value("tool_name", "");
    rec.args = j.value("args", "");
    rec.result = j.value("result", "");
    rec.success = j.value("success", true);
    rec.latency = Duration{j.value("latency_ms", int64_t{0})};
    rec.timestamp = from_millis(j.value("timestamp", int64_t{0}));
    return rec;
}

// ToolState
Json ToolState::to_json() const {
    return Json{
        {"active_sessions", to_json_array(active_sessions)},
        {"pending_operations", to_json_array(pending_operations)},
        {"recent_tool_calls", to_json_array(recent_tool_calls)}
    };
}

ToolState ToolState::from_json(const Json& j) {
    ToolState ts;
    ts.active_sessions = object_list<ToolSession>(j, "active_sessions");
    ts.pending_operations = object_list<PendingOperation>(j, "pending_operations");
    ts.recent_tool_calls = object_list<ToolCallRecord>(j, "recent_tool_calls");
    return ts;
}

// UserPreferences
size_t UserPreferences::total_chars() const {
    size_t total = custom_instructions.size();
    for (const auto& pref : recent_preferences) {
        total += pref.size();
    }
    return total;
}

Json UserPreferences::to_json() const {
    return Json{
        {"custom_instructions", custom_instructions},
        {"recent_preferences", recent_preferences}
    };
}

UserPreferences UserPreferences::from_json(const Json& j) {
    UserPreferences up;
    up.custom_instructions = j.value("custom_instructions", "");
    up.recent_preferences = string_list(j, "recent_preferences");
    return up;
}

// Checkpoint
Json Checkpoint::to_json() const {
    Json j{
        {"id", id},
        {"session_id", session_id},
        {"checkpoint_number", checkpoint_number},
        {"created_at", to_millis(created_at)},
        {"triggered_by", std::string(trigger_to_string(triggered_by))},
        {"conversation", conversation.to_json()},
        {"task", task.to_json()},
        {"files", files.to_json()},
        {"tools", tools.to_json()},
        {"signals", signals.to_json()}
    };
    if (description) {
        j["description"] = *description;
    }
    if (user_preferences) {
        j["user_preferences"] = user_preferences->to_json();
    }
    if (restored_at) {
        j["restored_at"] = to_millis(*restored_at);
    }
    if (restore_success) {
        j["restore_success"] = *restore_success;
    }
    if (restore_fidelity) {
        j["restore_fidelity"] = *restore_fidelity;
    }
    return j;
}

Checkpoint Checkpoint::from_json(const Json& j) {
    Checkpoint cp;
    cp.id = j.at("id").get<std::string>();
    cp.session_id = j.at("session_id").get<std::string>();
    cp.checkpoint_number = j.at("checkpoint_number").get<int>();
    cp.created_at = from_millis(j.at("created_at").get<int64_t>());

    auto trigger = trigger_from_string(j.at("triggered_by").get<std::string>());
    if (!trigger) {
        throw std::invalid_argument("unknown trigger: " + j["triggered_by"].get<std::string>());
    }
    cp.triggered_by = *trigger;

    if (j.contains("description")) {
        cp.description = j["description"].get<std::string>();
    }
    cp.conversation = ConversationState::from_json(j.at("conversation"));
    cp.task = TaskState::from_json(j.at("task"));
    cp.files = FileState::from_json(j.at("files"));
    cp.tools = ToolState::from_json(j.at("tools"));
    cp.signals = SignalSnapshot::from_json(j.at("signals"));
    if (j.contains("user_preferences")) {
        cp.user_preferences = UserPreferences::from_json(j["user_preferences"]);
    }
    if (j.contains("restored_at")) {
        cp.restored_at = from_millis(j["restored_at"].get<int64_t>());
    }
    if (j.contains("restore_success")) {
        cp.restore_success = j["restore_success"].get<bool>();
    }
    if (j.contains("restore_fidelity")) {
        cp.restore_fidelity = j["restore_fidelity"].get<double>();
    }
    return cp;
}

}  // namespace lifeline::checkpoint
