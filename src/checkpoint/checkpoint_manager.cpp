#include "lifeline/checkpoint/checkpoint_manager.hpp"
#include "lifeline/core/uuid.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>

namespace lifeline::checkpoint {

namespace {

constexpr size_t kStoreThreads = 2;

template<typename T>
void keep_newest(std::vector<T>& items, size_t max_count) {
    if (items.size() > max_count) {
        items.erase(items.begin(), items.end() - static_cast<std::ptrdiff_t>(max_count));
    }
}

void check_chars(std::vector<std::string>& violations, const char* field,
                 const std::string& value, size_t limit) {
    if (value.size() > limit) {
        violations.push_back(std::string(field) + ": " + std::to_string(value.size()) +
                             " characters exceeds limit of " + std::to_string(limit));
    }
}

template<typename T>
void check_count(std::vector<std::string>& violations, const char* field,
                 const std::vector<T>& items, size_t limit) {
    if (items.size() > limit) {
        violations.push_back(std::string(field) + ": " + std::to_string(items.size()) +
                             " entries exceeds limit of " + std::to_string(limit));
    }
}

void check_utf8(std::vector<std::string>& violations, const std::string& field, const std::string& value) {
    if (!is_valid_utf8(value)) {
        violations.push_back(field + ": invalid UTF-8");
    }
}

void check_utf8(std::vector<std::string>& violations, const std::string& field,
                const std::vector<std::string>& values) {
    for (size_t i = 0; i < values.size(); ++i) {
        check_utf8(violations, field + "[" + std::to_string(i) + "]", values[i]);
    }
}

}  // namespace

Json CheckpointResult::to_json() const {
    return Json{
        {"checkpoint_id", checkpoint_id},
        {"session_id", session_id},
        {"checkpoint_number", checkpoint_number},
        {"trigger", std::string(trigger_to_string(trigger))},
        {"crash_risk", std::string(signals::crash_risk_to_string(crash_risk))},
        {"elapsed_ms", elapsed.count()},
        {"uncompressed_size", uncompressed_size},
        {"compressed_size", compressed_size},
        {"compression_ratio", compression_ratio}
    };
}

void apply_intake_limits(CheckpointInput& input, const LimitsConfig& limits) {
    auto& messages = input.conversation.recent_messages;
    keep_newest(messages, limits.max_recent_messages);
    for (auto& msg : messages) {
        msg.content = truncate_text(msg.content, limits.max_message_chars);
    }

    auto& calls = input.tools.recent_tool_calls;
    keep_newest(calls, limits.max_recent_tool_calls);
    for (auto& call : calls) {
        call.args = truncate_text(call.args, limits.max_tool_text_chars);
        call.result = truncate_text(call.result, limits.max_tool_text_chars);
    }

    double& progress = input.task.progress;
    if (std::isfinite(progress)) {
        progress = std::clamp(progress, 0.0, 1.0);
    } else if (std::isinf(progress)) {
        progress = progress > 0 ? 1.0 : 0.0;
    }
}

std::vector<std::string> validate_input(const CheckpointInput& input, const LimitsConfig& limits) {
    std::vector<std::string> violations;

    if (input.session_id.empty()) {
        violations.push_back("session_id: must not be empty");
    }

    const auto& conv = input.conversation;
    check_chars(violations, "conversation_state.summary", conv.summary, limits.max_summary_chars);
    check_count(violations, "conversation_state.key_decisions", conv.key_decisions, limits.max_key_decisions);
    check_chars(violations, "conversation_state.current_context", conv.current_context,
                limits.max_current_context_chars);
    check_count(violations, "conversation_state.recent_messages", conv.recent_messages,
                limits.max_recent_messages);

    const auto& task = input.task;
    check_chars(violations, "task_state.operation", task.operation, limits.max_operation_chars);
    check_chars(violations, "task_state.phase", task.phase, limits.max_operation_chars);
    if (std::isnan(task.progress)) {
        violations.push_back("task_state.progress: must be a number");
    }
    check_count(violations, "task_state.completed_steps", task.completed_steps, limits.max_completed_steps);
    check_count(violations, "task_state.next_steps", task.next_steps, limits.max_next_steps);
    check_count(violations, "task_state.blockers", task.blockers, limits.max_blockers);

    const auto& files = input.files;
    check_count(violations, "file_state.active_files", files.active_files, limits.max_file_paths);
    check_count(violations, "file_state.modified_files", files.modified_files, limits.max_file_paths);
    check_count(violations, "file_state.staged_files", files.staged_files, limits.max_file_paths);
    if (files.uncommitted_diff.size() > limits.max_diff_bytes) {
        violations.push_back("file_state.uncommitted_diff: " +
                             std::to_string(files.uncommitted_diff.size()) +
                             " bytes exceeds limit of " + std::to_string(limits.max_diff_bytes));
    }

    const auto& tools = input.tools;
    check_count(violations, "tool_state.active_sessions", tools.active_sessions, limits.max_active_sessions);
    check_count(violations, "tool_state.pending_operations", tools.pending_operations,
                limits.max_pending_operations);
    check_count(violations, "tool_state.recent_tool_calls", tools.recent_tool_calls,
                limits.max_recent_tool_calls);

    // Text that is rendered back to the user must be valid UTF-8
    check_utf8(violations, "conversation_state.summary", conv.summary);
    check_utf8(violations, "conversation_state.key_decisions", conv.key_decisions);
    check_utf8(violations, "conversation_state.current_context", conv.current_context);
    for (size_t i = 0; i < conv.recent_messages.size(); ++i) {
        check_utf8(violations, "conversation_state.recent_messages[" + std::to_string(i) + "]",
                   conv.recent_messages[i].content);
    }
    check_utf8(violations, "task_state.operation", task.operation);
    check_utf8(violations, "task_state.phase", task.phase);
    check_utf8(violations, "task_state.next_steps", task.next_steps);
    check_utf8(violations, "task_state.blockers", task.blockers);
    check_utf8(violations, "file_state.active_files", files.active_files);
    check_utf8(violations, "file_state.modified_files", files.modified_files);
    for (size_t i = 0; i < tools.pending_operations.size(); ++i) {
        const auto& op = tools.pending_operations[i];
        std::string field = "tool_state.pending_operations[" + std::to_string(i) + "]";
        check_utf8(violations, field + ".description", op.description);
        check_utf8(violations, field + ".resume_hint", op.resume_hint);
    }
    for (size_t i = 0; i < tools.recent_tool_calls.size(); ++i) {
        const auto& call = tools.recent_tool_calls[i];
        std::string field = "tool_state.recent_tool_calls[" + std::to_string(i) + "]";
        check_utf8(violations, field + ".tool_name", call.tool_name);
        check_utf8(violations, field + ".args", call.args);
        check_utf8(violations, field + ".result", call.result);
    }

    if (input.user_preferences &&
        input.user_preferences->total_chars() > limits.max_user_preferences_chars) {
        violations.push_back("user_preferences: " +
                             std::to_string(input.user_preferences->total_chars()) +
                             " characters exceeds limit of " +
                             std::to_string(limits.max_user_preferences_chars));
    }

    return violations;
}

CheckpointManager::CheckpointManager(storage::CheckpointStore& store,
                                     signals::RiskSignalAggregator& aggregator,
                                     const Config& config)
    : store_(store)
    , aggregator_(aggregator)
    , config_(config.checkpoint)
    , limits_(config.limits)
    , pool_(kStoreThreads)
{
}

CheckpointManager::~CheckpointManager() = default;

template<typename T>
Result<T, Error> CheckpointManager::bounded(std::function<Result<T, Error>()> call, const char* what) {
    auto future = pool_.submit(std::move(call));
    auto timeout = std::chrono::milliseconds{config_.store_timeout_ms};

    if (future.wait_for(timeout) != std::future_status::ready) {
        spdlog::warn("Abandoned {} after {}ms store timeout", what, config_.store_timeout_ms);
        return Error{ErrorCode::Timeout, std::string(what) + " timed out"}.with_source("checkpoint_manager");
    }
    return future.get();
}

Result<CheckpointResult, Error> CheckpointManager::create_checkpoint(CheckpointInput input,
                                                                     CheckpointTrigger trigger,
                                                                     TimePoint at) {
    try {
        auto snapshot = aggregator_.assess(input.session_id, at);
        return create(std::move(input), trigger, snapshot, at);
    } catch (const std::exception& e) {
        spdlog::error("Checkpoint creation failed: {}", e.what());
        return Error::from_exception(e).with_source("checkpoint_manager");
    }
}

Result<CheckpointResult, Error> CheckpointManager::force_checkpoint(CheckpointInput input,
                                                                    const std::string& reason,
                                                                    TimePoint at) {
    if (!reason.empty()) {
        input.description = reason;
    }
    return create_checkpoint(std::move(input), CheckpointTrigger::UserRequested, at);
}

Result<std::optional<CheckpointResult>, Error> CheckpointManager::auto_checkpoint(CheckpointInput input,
                                                                                  TimePoint at) {
    using R = Result<std::optional<CheckpointResult>, Error>;
    try {
        auto evaluation = aggregator_.evaluate(input.session_id, at);
        if (!evaluation.trigger) {
            return R::ok(std::nullopt);
        }

        spdlog::debug("Trigger {} fired for session {}",
                      trigger_to_string(*evaluation.trigger), input.session_id);

        auto result = create(std::move(input), *evaluation.trigger, evaluation.snapshot, at);
        if (result.is_err()) {
            return R::err(std::move(result).error());
        }
        return R::ok(std::move(result).value());
    } catch (const std::exception& e) {
        spdlog::error("Automatic checkpoint failed: {}", e.what());
        return R::err(Error::from_exception(e).with_source("checkpoint_manager"));
    }
}

Result<CheckpointStats, Error> CheckpointManager::checkpoint_stats(const SessionId& session_id) {
    try {
        auto headers = bounded<std::vector<storage::CheckpointHeader>>(
            [this, session_id] { return store_.list_headers(session_id); },
            "checkpoint listing");
        if (headers.is_err()) {
            return std::move(headers).error();
        }

        CheckpointStats stats;
        stats.count = static_cast<int>(headers.value().size());
        if (!headers.value().empty()) {
            stats.last = headers.value().front();
        }
        return stats;
    } catch (const std::exception& e) {
        return Error::from_exception(e).with_source("checkpoint_manager");
    }
}

Result<CheckpointResult, Error> CheckpointManager::create(CheckpointInput input,
                                                          CheckpointTrigger trigger,
                                                          const signals::SignalSnapshot& snapshot,
                                                          TimePoint at) {
    auto started = std::chrono::steady_clock::now();

    apply_intake_limits(input, limits_);

    auto violations = validate_input(input, limits_);
    if (!violations.empty()) {
        spdlog::warn("Rejected checkpoint for session {}: {} violations",
                     input.session_id, violations.size());
        return Error::validation(std::move(violations)).with_source("checkpoint_manager");
    }

    Checkpoint cp;
    cp.id = generate_checkpoint_id();
    cp.session_id = input.session_id;
    cp.created_at = at;
    cp.triggered_by = trigger;
    cp.description = std::move(input.description);
    cp.conversation = std::move(input.conversation);
    cp.task = std::move(input.task);
    cp.files = std::move(input.files);
    cp.tools = std::move(input.tools);
    cp.signals = snapshot;
    cp.user_preferences = std::move(input.user_preferences);

    auto saved = number_and_save(cp);
    if (saved.is_err() && saved.error().is_retriable()) {
        spdlog::info("Checkpoint number {} taken in session {}, retrying",
                     cp.checkpoint_number, cp.session_id);
        saved = number_and_save(cp);
    }
    if (saved.is_err()) {
        if (saved.error().is_caller_error()) {
            spdlog::warn("Rejected checkpoint for session {}: {}",
                         cp.session_id, saved.error().to_string());
        } else {
            spdlog::error("Failed to persist checkpoint for session {}: {}",
                          cp.session_id, saved.error().to_string());
        }
        return std::move(saved).error();
    }

    aggregator_.mark_checkpoint(cp.session_id, snapshot.crash_risk, at);

    int count = 0;
    auto counted = bounded<int>([this, session = cp.session_id] { return store_.count_checkpoints(session); },
                                "checkpoint count");
    if (counted.is_ok()) {
        count = counted.value();
    }
    if (count > config_.max_checkpoints_per_session) {
        auto pruned = bounded<int>(
            [this, session = cp.session_id, keep = config_.max_checkpoints_per_session] {
                return store_.prune_session(session, keep);
            },
            "checkpoint pruning");
        if (pruned.is_err()) {
            spdlog::warn("Failed to prune session {}: {}", cp.session_id, pruned.error().message);
        }
    }

    const auto& encoded = saved.value();

    CheckpointResult result;
    result.checkpoint_id = cp.id;
    result.session_id = cp.session_id;
    result.checkpoint_number = cp.checkpoint_number;
    result.trigger = trigger;
    result.crash_risk = snapshot.crash_risk;
    result.uncompressed_size = encoded.uncompressed_size;
    result.compressed_size = encoded.compressed_size;
    result.compression_ratio = encoded.compression_ratio;
    result.elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started);

    if (result.elapsed.count() > config_.target_latency_ms) {
        spdlog::warn("Checkpoint {} took {}ms (target {}ms)",
                     cp.id, result.elapsed.count(), config_.target_latency_ms);
    }

    spdlog::info("Checkpoint #{} for session {} ({}, {} -> {} bytes)",
                 result.checkpoint_number, result.session_id, trigger_to_string(trigger),
                 result.uncompressed_size, result.compressed_size);

    return result;
}

Result<EncodedCheckpoint, Error> CheckpointManager::number_and_save(Checkpoint& checkpoint) {
    auto number = bounded<int>(
        [this, session = checkpoint.session_id] { return store_.next_checkpoint_number(session); },
        "checkpoint numbering");
    if (number.is_err()) {
        return std::move(number).error();
    }
    checkpoint.checkpoint_number = number.value();

    auto encoded = encode(checkpoint, config_.compression_enabled);
    if (encoded.is_err()) {
        return std::move(encoded).error();
    }
    if (encoded.value().compressed_size > config_.max_encoded_bytes) {
        return Error{ErrorCode::CheckpointTooLarge,
                     "Encoded checkpoint is " + std::to_string(encoded.value().compressed_size) +
                         " bytes, limit " + std::to_string(config_.max_encoded_bytes),
                     checkpoint.id};
    }

    auto saved = bounded<void>(
        [this, checkpoint, bytes = encoded.value()] { return store_.save(checkpoint, bytes); },
        "checkpoint save");
    if (saved.is_err()) {
        return std::move(saved).error();
    }
    return encoded;
}

}  // namespace lifeline::checkpoint
