#pragma once

#include "errors.hpp"
#include "result.hpp"
#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace lifeline::core {

namespace fs = std::filesystem;

// Checkpoint cadence and persistence
struct CheckpointConfig {
    int tool_call_interval = 5;
    int time_interval_minutes = 10;
    int max_checkpoints_per_session = 50;
    int retention_days = 30;
    bool compression_enabled = true;
    int target_latency_ms = 100;     // Logged when exceeded, never enforced
    int store_timeout_ms = 5000;     // Store calls abandoned after this
    size_t max_encoded_bytes = 512 * 1024;

    Duration time_interval() const {
        return std::chrono::minutes{time_interval_minutes};
    }
};

// One set of risk thresholds
struct ZoneThresholds {
    double context_window_usage = 0.0;
    int message_count = 0;
    int session_duration_minutes = 0;
    int tool_calls_since_checkpoint = 0;
    double tool_failure_rate = 0.0;

    Duration session_duration() const {
        return std::chrono::minutes{session_duration_minutes};
    }
};

// Crash risk assessment
struct RiskConfig {
    int64_t context_window_tokens = 200000;
    int latency_window = 20;  // Rolling latency samples kept per session

    ZoneThresholds warning{0.60, 35, 60, 10, 0.15};
    ZoneThresholds danger{0.75, 50, 90, 15, 0.20};
};

// Bounds enforced on every checkpoint before it is accepted
struct LimitsConfig {
    size_t max_summary_chars = 1000;
    size_t max_key_decisions = 20;
    size_t max_current_context_chars = 2000;
    size_t max_recent_messages = 10;       // Intake keeps the newest N
    size_t max_message_chars = 500;        // Intake truncates content
    size_t max_operation_chars = 200;
    size_t max_completed_steps = 50;
    size_t max_next_steps = 20;
    size_t max_blockers = 20;
    size_t max_file_paths = 200;           // Per file list
    size_t max_diff_bytes = 100 * 1024;
    size_t max_active_sessions = 10;
    size_t max_pending_operations = 20;
    size_t max_recent_tool_calls = 20;     // Intake keeps the newest N
    size_t max_tool_text_chars = 200;      // Intake truncates args and result
    size_t max_user_preferences_chars = 2000;
};

// Resume detection
struct ResumeConfig {
    double min_confidence = 0.5;
    int crash_window_minutes = 15;
    int timeout_after_minutes = 30;
    int recency_horizon_hours = 24;
    int max_fallback_attempts = 3;

    double recency_weight = 0.4;
    double trigger_weight = 0.35;
    double completeness_weight = 0.25;
};

struct StorageConfig {
    fs::path database_path = "~/.lifeline/lifeline.db";
    bool wal = true;
};

struct ObservabilityConfig {
    std::string log_level = "info";  // trace, debug, info, warn, error, off
    fs::path log_path = "~/.lifeline/logs/lifeline.log";
    bool log_to_file = false;
};

// Main configuration
struct Config {
    CheckpointConfig checkpoint;
    RiskConfig risk;
    LimitsConfig limits;
    ResumeConfig resume;
    StorageConfig storage;
    ObservabilityConfig observability;

    // Load configuration from file
    static Result<Config, Error> load(const fs::path& path);

    // Load with defaults, falling back if the file doesn't exist or is invalid
    static Config load_or_default(const fs::path& path);

    // Save configuration to file
    Result<void, Error> save(const fs::path& path) const;

    // Get default config path
    static fs::path default_path();

    // Expand ~ and environment variables in paths
    void expand_paths();

    // Apply LIFELINE_* environment overrides
    void apply_env_overrides();

    // Validate configuration
    Result<void, Error> validate() const;
};

// Helper to expand ~ and environment variables in paths
std::string expand_path(const std::string& path);
fs::path expand_path(const fs::path& path);

}  // namespace lifeline::core
