#include "lifeline/recovery/resume_prompt.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace lifeline::recovery {

namespace {

std::string plural(int64_t n, const char* unit) {
    return std::to_string(n) + " " + unit + (n == 1 ? "" : "s");
}

std::string join(const std::vector<std::string>& items, const char* sep = ", ") {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += items[i];
    }
    return out;
}

std::string situation_for(InterruptionReason reason) {
    switch (reason) {
        case InterruptionReason::Crash:
            return "Session interrupted due to crash or context window overflow";
        case InterruptionReason::Timeout:
            return "Session timed out due to inactivity";
        case InterruptionReason::ManualExit:
            return "Session ended manually";
        case InterruptionReason::Unknown:
            return "Session interrupted for unknown reason";
    }
    return "Session interrupted for unknown reason";
}

std::string describe_tools(const checkpoint::ToolState& tools) {
    std::vector<std::string> parts;
    for (const auto& op : tools.pending_operations) {
        std::string text = "pending " + std::string(checkpoint::pending_operation_type_to_string(op.type)) +
                           ": " + op.description;
        if (!op.resume_hint.empty()) {
            text += " (resume: " + op.resume_hint + ")";
        }
        parts.push_back(std::move(text));
    }
    for (const auto& session : tools.active_sessions) {
        parts.push_back(std::string(checkpoint::tool_session_type_to_string(session.type)) +
                        " session " + session.id);
    }
    if (parts.empty()) {
        std::vector<std::string> names;
        for (const auto& call : tools.recent_tool_calls) {
            names.push_back(call.tool_name);
        }
        if (names.empty()) {
            return "No recent tool calls";
        }
        return "Recent tool calls: " + join(names);
    }
    return join(parts, "; ");
}

}  // namespace

std::string format_duration(Duration elapsed) {
    int64_t minutes = std::chrono::duration_cast<std::chrono::minutes>(elapsed).count();
    if (minutes < 0) {
        minutes = 0;
    }
    if (minutes < 60) {
        return plural(minutes, "minute");
    }
    return plural(minutes / 60, "hour") + ", " + plural(minutes % 60, "minute");
}

ResumePrompt ResumePrompt::build(const Checkpoint& cp, InterruptionReason reason, Duration elapsed) {
    ResumePrompt prompt;
    prompt.checkpoint_id = cp.id;
    prompt.checkpoint_number = cp.checkpoint_number;
    prompt.interruption_reason = reason;
    prompt.time_since = format_duration(elapsed);
    prompt.task_progress = cp.task.progress;

    prompt.situation = situation_for(reason) + " (" + prompt.time_since + " ago)";

    long percent = std::lround(cp.task.progress * 100.0);
    if (cp.task.operation.empty()) {
        prompt.progress = "No operation recorded (" + std::to_string(percent) + "% complete)";
    } else {
        prompt.progress = "Operation: " + cp.task.operation;
        if (!cp.task.phase.empty()) {
            prompt.progress += " [" + cp.task.phase + "]";
        }
        prompt.progress += " (" + std::to_string(percent) + "% complete)";
    }

    prompt.context = cp.conversation.summary;
    if (!cp.conversation.current_context.empty()) {
        if (!prompt.context.empty()) {
            prompt.context += "\n";
        }
        prompt.context += cp.conversation.current_context;
    }
    if (prompt.context.empty()) {
        prompt.context = "No summary recorded";
    }

    prompt.next_steps = cp.task.next_steps.empty() ? "No next steps defined" : join(cp.task.next_steps);

    std::vector<std::string> files = cp.files.active_files;
    for (const auto& path : cp.files.modified_files) {
        if (std::find(files.begin(), files.end(), path) == files.end()) {
            files.push_back(path);
        }
    }
    prompt.files = files.empty() ? "No active files" : join(files);

    prompt.tools = describe_tools(cp.tools);
    prompt.blockers = cp.task.blockers.empty() ? "No blockers" : join(cp.task.blockers);

    return prompt;
}

std::string ResumePrompt::render() const {
    std::ostringstream out;
    out << "Resuming from checkpoint #" << checkpoint_number << "\n\n";
    out << "Situation: " << situation << "\n";
    out << "Progress: " << progress << "\n";
    out << "Context: " << context << "\n";
    out << "Next steps: " << next_steps << "\n";
    out << "Files: " << files << "\n";
    out << "Tools: " << tools << "\n";
    out << "Blockers: " << blockers << "\n";
    return out.str();
}

Json ResumePrompt::to_json() const {
    return Json{
        {"sections", {
            {"situation", situation},
            {"progress", progress},
            {"context", context},
            {"next", next_steps},
            {"files", files},
            {"tools", tools},
            {"blockers", blockers}
        }},
        {"checkpoint_id", checkpoint_id},
        {"checkpoint_number", checkpoint_number},
        {"metadata", {
            {"interruption_reason", std::string(storage::interruption_reason_to_string(interruption_reason))},
            {"time_since", time_since},
            {"progress", task_progress}
        }}
    };
}

}  // namespace lifeline::recovery
