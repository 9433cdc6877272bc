#include "lifeline/core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <regex>

namespace lifeline::core {

std::string expand_path(const std::string& path) {
    std::string result = path;

    // Expand ~
    if (!result.empty() && result[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            result = std::string(home) + result.substr(1);
        }
    }

    // Expand ${VAR} patterns
    std::regex env_regex(R"(\$\{([^}]+)\})");
    std::smatch match;
    while (std::regex_search(result, match, env_regex)) {
        std::string var_name = match[1].str();
        const char* var_value = std::getenv(var_name.c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    return result;
}

fs::path expand_path(const fs::path& path) {
    return fs::path(expand_path(path.string()));
}

fs::path Config::default_path() {
    return fs::path(expand_path(std::string("~/.lifeline/config.yaml")));
}

void Config::expand_paths() {
    // ":memory:" is a SQLite in-memory database, not a path
    if (storage.database_path != ":memory:") {
        storage.database_path = expand_path(storage.database_path);
    }
    observability.log_path = expand_path(observability.log_path);
}

void Config::apply_env_overrides() {
    if (const char* db = std::getenv("LIFELINE_DB_PATH")) {
        storage.database_path = db;
    }
    if (const char* level = std::getenv("LIFELINE_LOG_LEVEL")) {
        observability.log_level = level;
    }
}

namespace {

Result<void, Error> invalid(std::string message) {
    return Result<void, Error>::err(ErrorCode::ConfigValidationFailed, std::move(message));
}

Result<void, Error> validate_zone(const ZoneThresholds& zone, const std::string& name) {
    if (zone.context_window_usage <= 0.0 || zone.context_window_usage > 1.0) {
        return invalid("risk." + name + ".context_window_usage must be in (0, 1]");
    }
    if (zone.message_count <= 0 || zone.session_duration_minutes <= 0 ||
        zone.tool_calls_since_checkpoint <= 0) {
        return invalid("risk." + name + " counters must be positive");
    }
    if (zone.tool_failure_rate <= 0.0 || zone.tool_failure_rate > 1.0) {
        return invalid("risk." + name + ".tool_failure_rate must be in (0, 1]");
    }
    return Result<void, Error>::ok();
}

}  // namespace

Result<void, Error> Config::validate() const {
    if (checkpoint.tool_call_interval <= 0) {
        return invalid("checkpoint.tool_call_interval must be positive");
    }
    if (checkpoint.time_interval_minutes <= 0) {
        return invalid("checkpoint.time_interval_minutes must be positive");
    }
    if (checkpoint.max_checkpoints_per_session < 1) {
        return invalid("checkpoint.max_checkpoints_per_session must be at least 1");
    }
    if (checkpoint.retention_days < 0) {
        return invalid("checkpoint.retention_days must not be negative");
    }
    if (checkpoint.store_timeout_ms <= 0) {
        return invalid("checkpoint.store_timeout_ms must be positive");
    }

    if (risk.context_window_tokens <= 0) {
        return invalid("risk.context_window_tokens must be positive");
    }
    if (risk.latency_window < 2) {
        return invalid("risk.latency_window must be at least 2");
    }
    LIFELINE_TRY_VOID(validate_zone(risk.warning, "warning"));
    LIFELINE_TRY_VOID(validate_zone(risk.danger, "danger"));

    const auto& w = risk.warning;
    const auto& d = risk.danger;
    if (w.context_window_usage > d.context_window_usage ||
        w.message_count > d.message_count ||
        w.session_duration_minutes > d.session_duration_minutes ||
        w.tool_calls_since_checkpoint > d.tool_calls_since_checkpoint ||
        w.tool_failure_rate > d.tool_failure_rate) {
        return invalid("risk.warning thresholds must not exceed risk.danger thresholds");
    }

    if (limits.max_summary_chars == 0 || limits.max_recent_messages == 0 ||
        limits.max_message_chars == 0 || limits.max_recent_tool_calls == 0 ||
        limits.max_tool_text_chars == 0) {
        return invalid("limits must be positive");
    }

    if (resume.min_confidence < 0.0 || resume.min_confidence > 1.0) {
        return invalid("resume.min_confidence must be in [0, 1]");
    }
    if (resume.max_fallback_attempts < 1) {
        return invalid("resume.max_fallback_attempts must be at least 1");
    }
    if (resume.crash_window_minutes <= 0 || resume.timeout_after_minutes <= 0 ||
        resume.recency_horizon_hours <= 0) {
        return invalid("resume time windows must be positive");
    }
    double weights = resume.recency_weight + resume.trigger_weight + resume.completeness_weight;
    if (std::abs(weights - 1.0) > 1e-6) {
        return invalid("resume weights must sum to 1");
    }

    if (storage.database_path.empty()) {
        return invalid("storage.database_path must be set");
    }

    return Result<void, Error>::ok();
}

namespace {

void parse_zone(const YAML::Node& node, ZoneThresholds& zone) {
    if (!node) {
        return;
    }
    zone.context_window_usage = node["context_window_usage"].as<double>(zone.context_window_usage);
    zone.message_count = node["message_count"].as<int>(zone.message_count);
    zone.session_duration_minutes = node["session_duration_minutes"].as<int>(zone.session_duration_minutes);
    zone.tool_calls_since_checkpoint = node["tool_calls_since_checkpoint"].as<int>(zone.tool_calls_since_checkpoint);
    zone.tool_failure_rate = node["tool_failure_rate"].as<double>(zone.tool_failure_rate);
}

void emit_zone(YAML::Emitter& out, const char* name, const ZoneThresholds& zone) {
    out << YAML::Key << name << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "context_window_usage" << YAML::Value << zone.context_window_usage;
    out << YAML::Key << "message_count" << YAML::Value << zone.message_count;
    out << YAML::Key << "session_duration_minutes" << YAML::Value << zone.session_duration_minutes;
    out << YAML::Key << "tool_calls_since_checkpoint" << YAML::Value << zone.tool_calls_since_checkpoint;
    out << YAML::Key << "tool_failure_rate" << YAML::Value << zone.tool_failure_rate;
    out << YAML::EndMap;
}

}  // namespace

Result<Config, Error> Config::load(const fs::path& path) {
    fs::path expanded = expand_path(path);

    if (!fs::exists(expanded)) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigNotFound,
            "Configuration file not found",
            expanded.string()
        );
    }

    try {
        YAML::Node root = YAML::LoadFile(expanded.string());
        Config config;

        // Parse checkpoint config
        if (auto cp = root["checkpoint"]) {
            config.checkpoint.tool_call_interval = cp["tool_call_interval"].as<int>(config.checkpoint.tool_call_interval);
            config.checkpoint.time_interval_minutes = cp["time_interval_minutes"].as<int>(config.checkpoint.time_interval_minutes);
            config.checkpoint.max_checkpoints_per_session = cp["max_checkpoints_per_session"].as<int>(config.checkpoint.max_checkpoints_per_session);
            config.checkpoint.retention_days = cp["retention_days"].as<int>(config.checkpoint.retention_days);
            config.checkpoint.compression_enabled = cp["compression_enabled"].as<bool>(config.checkpoint.compression_enabled);
            config.checkpoint.target_latency_ms = cp["target_latency_ms"].as<int>(config.checkpoint.target_latency_ms);
            config.checkpoint.store_timeout_ms = cp["store_timeout_ms"].as<int>(config.checkpoint.store_timeout_ms);
            config.checkpoint.max_encoded_bytes = cp["max_encoded_bytes"].as<size_t>(config.checkpoint.max_encoded_bytes);
        }

        // Parse risk config
        if (auto risk = root["risk"]) {
            config.risk.context_window_tokens = risk["context_window_tokens"].as<int64_t>(config.risk.context_window_tokens);
            config.risk.latency_window = risk["latency_window"].as<int>(config.risk.latency_window);
            parse_zone(risk["warning"], config.risk.warning);
            parse_zone(risk["danger"], config.risk.danger);
        }

        // Parse limits
        if (auto lim = root["limits"]) {
            auto& l = config.limits;
            l.max_summary_chars = lim["max_summary_chars"].as<size_t>(l.max_summary_chars);
            l.max_key_decisions = lim["max_key_decisions"].as<size_t>(l.max_key_decisions);
            l.max_current_context_chars = lim["max_current_context_chars"].as<size_t>(l.max_current_context_chars);
            l.max_recent_messages = lim["max_recent_messages"].as<size_t>(l.max_recent_messages);
            l.max_message_chars = lim["max_message_chars"].as<size_t>(l.max_message_chars);
            l.max_operation_chars = lim["max_operation_chars"].as<size_t>(l.max_operation_chars);
            l.max_completed_steps = lim["max_completed_steps"].as<size_t>(l.max_completed_steps);
            l.max_next_steps = lim["max_next_steps"].as<size_t>(l.max_next_steps);
            l.max_blockers = lim["max_blockers"].as<size_t>(l.max_blockers);
            l.max_file_paths = lim["max_file_paths"].as<size_t>(l.max_file_paths);
            l.max_diff_bytes = lim["max_diff_bytes"].as<size_t>(l.max_diff_bytes);
            l.max_active_sessions = lim["max_active_sessions"].as<size_t>(l.max_active_sessions);
            l.max_pending_operations = lim["max_pending_operations"].as<size_t>(l.max_pending_operations);
            l.max_recent_tool_calls = lim["max_recent_tool_calls"].as<size_t>(l.max_recent_tool_calls);
            l.max_tool_text_chars = lim["max_tool_text_chars"].as<size_t>(l.max_tool_text_chars);
            l.max_user_preferences_chars = lim["max_user_preferences_chars"].as<size_t>(l.max_user_preferences_chars);
        }

        // Parse resume config
        if (auto res = root["resume"]) {
            config.resume.min_confidence = res["min_confidence"].as<double>(config.resume.min_confidence);
            config.resume.crash_window_minutes = res["crash_window_minutes"].as<int>(config.resume.crash_window_minutes);
            config.resume.timeout_after_minutes = res["timeout_after_minutes"].as<int>(config.resume.timeout_after_minutes);
            config.resume.recency_horizon_hours = res["recency_horizon_hours"].as<int>(config.resume.recency_horizon_hours);
            config.resume.max_fallback_attempts = res["max_fallback_attempts"].as<int>(config.resume.max_fallback_attempts);

            if (auto weights = res["weights"]) {
                config.resume.recency_weight = weights["recency"].as<double>(config.resume.recency_weight);
                config.resume.trigger_weight = weights["trigger"].as<double>(config.resume.trigger_weight);
                config.resume.completeness_weight = weights["completeness"].as<double>(config.resume.completeness_weight);
            }
        }

        // Parse storage config
        if (auto st = root["storage"]) {
            config.storage.database_path = st["database_path"].as<std::string>(config.storage.database_path.string());
            config.storage.wal = st["wal"].as<bool>(config.storage.wal);
        }

        // Parse observability config
        if (auto obs = root["observability"]) {
            config.observability.log_level = obs["log_level"].as<std::string>(config.observability.log_level);
            config.observability.log_path = obs["log_path"].as<std::string>(config.observability.log_path.string());
            config.observability.log_to_file = obs["log_to_file"].as<bool>(config.observability.log_to_file);
        }

        config.apply_env_overrides();
        config.expand_paths();

        auto validation = config.validate();
        if (validation.is_err()) {
            return Result<Config, Error>::err(std::move(validation).error());
        }

        return Result<Config, Error>::ok(std::move(config));

    } catch (const YAML::Exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            std::string("YAML parse error: ") + e.what(),
            expanded.string()
        );
    } catch (const std::exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            e.what(),
            expanded.string()
        );
    }
}

Config Config::load_or_default(const fs::path& path) {
    auto result = load(path);
    if (result.is_ok()) {
        return std::move(result).value();
    }

    Config config;
    config.apply_env_overrides();
    config.expand_paths();
    return config;
}

Result<void, Error> Config::save(const fs::path& path) const {
    try {
        fs::path expanded = expand_path(path);

        if (expanded.has_parent_path()) {
            fs::create_directories(expanded.parent_path());
        }

        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "checkpoint" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "tool_call_interval" << YAML::Value << checkpoint.tool_call_interval;
        out << YAML::Key << "time_interval_minutes" << YAML::Value << checkpoint.time_interval_minutes;
        out << YAML::Key << "max_checkpoints_per_session" << YAML::Value << checkpoint.max_checkpoints_per_session;
        out << YAML::Key << "retention_days" << YAML::Value << checkpoint.retention_days;
        out << YAML::Key << "compression_enabled" << YAML::Value << checkpoint.compression_enabled;
        out << YAML::Key << "target_latency_ms" << YAML::Value << checkpoint.target_latency_ms;
        out << YAML::Key << "store_timeout_ms" << YAML::Value << checkpoint.store_timeout_ms;
        out << YAML::Key << "max_encoded_bytes" << YAML::Value << checkpoint.max_encoded_bytes;
        out << YAML::EndMap;

        out << YAML::Key << "risk" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "context_window_tokens" << YAML::Value << risk.context_window_tokens;
        out << YAML::Key << "latency_window" << YAML::Value << risk.latency_window;
        emit_zone(out, "warning", risk.warning);
        emit_zone(out, "danger", risk.danger);
        out << YAML::EndMap;

        out << YAML::Key << "limits" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "max_summary_chars" << YAML::Value << limits.max_summary_chars;
        out << YAML::Key << "max_key_decisions" << YAML::Value << limits.max_key_decisions;
        out << YAML::Key << "max_current_context_chars" << YAML::Value << limits.max_current_context_chars;
        out << YAML::Key << "max_recent_messages" << YAML::Value << limits.max_recent_messages;
        out << YAML::Key << "max_message_chars" << YAML::Value << limits.max_message_chars;
        out << YAML::Key << "max_operation_chars" << YAML::Value << limits.max_operation_chars;
        out << YAML::Key << "max_completed_steps" << YAML::Value << limits.max_completed_steps;
        out << YAML::Key << "max_next_steps" << YAML::Value << limits.max_next_steps;
        out << YAML::Key << "max_blockers" << YAML::Value << limits.max_blockers;
        out << YAML::Key << "max_file_paths" << YAML::Value << limits.max_file_paths;
        out << YAML::Key << "max_diff_bytes" << YAML::Value << limits.max_diff_bytes;
        out << YAML::Key << "max_active_sessions" << YAML::Value << limits.max_active_sessions;
        out << YAML::Key << "max_pending_operations" << YAML::Value << limits.max_pending_operations;
        out << YAML::Key << "max_recent_tool_calls" << YAML::Value << limits.max_recent_tool_calls;
        out << YAML::Key << "max_tool_text_chars" << YAML::Value << limits.max_tool_text_chars;
        out << YAML::Key << "max_user_preferences_chars" << YAML::Value << limits.max_user_preferences_chars;
        out << YAML::EndMap;

        out << YAML::Key << "resume" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "min_confidence" << YAML::Value << resume.min_confidence;
        out << YAML::Key << "crash_window_minutes" << YAML::Value << resume.crash_window_minutes;
        out << YAML::Key << "timeout_after_minutes" << YAML::Value << resume.timeout_after_minutes;
        out << YAML::Key << "recency_horizon_hours" << YAML::Value << resume.recency_horizon_hours;
        out << YAML::Key << "max_fallback_attempts" << YAML::Value << resume.max_fallback_attempts;
        out << YAML::Key << "weights" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "recency" << YAML::Value << resume.recency_weight;
        out << YAML::Key << "trigger" << YAML::Value << resume.trigger_weight;
        out << YAML::Key << "completeness" << YAML::Value << resume.completeness_weight;
        out << YAML::EndMap;
        out << YAML::EndMap;

        out << YAML::Key << "storage" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "database_path" << YAML::Value << storage.database_path.string();
        out << YAML::Key << "wal" << YAML::Value << storage.wal;
        out << YAML::EndMap;

        out << YAML::Key << "observability" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "log_level" << YAML::Value << observability.log_level;
        out << YAML::Key << "log_path" << YAML::Value << observability.log_path.string();
        out << YAML::Key << "log_to_file" << YAML::Value << observability.log_to_file;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream file(expanded);
        if (!file) {
            return Result<void, Error>::err(
                ErrorCode::FileWriteFailed,
                "Failed to open config file for writing",
                expanded.string()
            );
        }

        file << out.c_str();
        return Result<void, Error>::ok();

    } catch (const std::exception& e) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            e.what(),
            path.string()
        );
    }
}

}  // namespace lifeline::core
