#pragma once

#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lifeline::core {

// Error codes organized by category
enum class ErrorCode {
    // Success
    Ok = 0,

    // General errors (1-99)
    Unknown = 1,
    InvalidArgument = 2,
    AlreadyExists = 4,
    Timeout = 6,
    InternalError = 9,

    // Checkpoint errors (100-199)
    ValidationFailed = 100,
    DuplicateCheckpointNumber = 101,
    AlreadyRestored = 102,
    CorruptData = 103,
    CheckpointNotFound = 104,
    CheckpointTooLarge = 106,

    // Storage errors (200-299)
    DatabaseOpenFailed = 200,
    DatabaseQueryFailed = 201,
    SchemaFailed = 202,

    // Configuration errors (600-699)
    ConfigNotFound = 600,
    ConfigParseFailed = 601,
    ConfigValidationFailed = 602,

    // File system errors (700-799)
    FileWriteFailed = 702,
};

// Get human-readable message for error code
inline std::string_view error_code_message(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::AlreadyExists: return "Already exists";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::InternalError: return "Internal error";

        case ErrorCode::ValidationFailed: return "Checkpoint validation failed";
        case ErrorCode::DuplicateCheckpointNumber: return "Checkpoint number already used in session";
        case ErrorCode::AlreadyRestored: return "Checkpoint already restored";
        case ErrorCode::CorruptData: return "Checkpoint data corrupted";
        case ErrorCode::CheckpointNotFound: return "Checkpoint not found";
        case ErrorCode::CheckpointTooLarge: return "Encoded checkpoint too large";

        case ErrorCode::DatabaseOpenFailed: return "Failed to open database";
        case ErrorCode::DatabaseQueryFailed: return "Database query failed";
        case ErrorCode::SchemaFailed: return "Failed to create database schema";

        case ErrorCode::ConfigNotFound: return "Configuration file not found";
        case ErrorCode::ConfigParseFailed: return "Failed to parse configuration";
        case ErrorCode::ConfigValidationFailed: return "Configuration validation failed";

        case ErrorCode::FileWriteFailed: return "Failed to write file";
    }
    return "Unknown error code";
}

// Errors worth one immediate retry with fresh state. Store timeouts are
// abandoned, not retried.
inline bool is_retriable(ErrorCode code) {
    switch (code) {
        case ErrorCode::DuplicateCheckpointNumber:
            return true;
        default:
            return false;
    }
}

// Errors the caller must act on; retrying the same input will not help
inline bool is_caller_error(ErrorCode code) {
    switch (code) {
        case ErrorCode::ValidationFailed:
        case ErrorCode::CheckpointTooLarge:
        case ErrorCode::AlreadyRestored:
        case ErrorCode::InvalidArgument:
            return true;
        default:
            return false;
    }
}

// Error structure with context
struct Error {
    ErrorCode code;
    std::string message;
    std::optional<std::string> context;  // Additional context (checkpoint id, path, etc.)
    std::optional<std::string> source;   // Component that raised it
    std::vector<std::string> details;    // Individual violations for ValidationFailed

    Error() : code(ErrorCode::Unknown) {}

    Error(ErrorCode c) : code(c), message(std::string(error_code_message(c))) {}

    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    // Factory methods
    static Error from_code(ErrorCode code) {
        return Error{code};
    }

    static Error from_code(ErrorCode code, std::string context) {
        Error e{code};
        e.context = std::move(context);
        return e;
    }

    static Error from_exception(const std::exception& e) {
        return Error{ErrorCode::InternalError, e.what()};
    }

    static Error validation(std::vector<std::string> violations) {
        Error e{ErrorCode::ValidationFailed};
        for (const auto& v : violations) {
            e.message += "; " + v;
        }
        e.details = std::move(violations);
        return e;
    }

    Error& with_source(std::string src) {
        source = std::move(src);
        return *this;
    }

    // Predicates
    bool is_retriable() const { return lifeline::core::is_retriable(code); }
    bool is_caller_error() const { return lifeline::core::is_caller_error(code); }
    bool is_ok() const { return code == ErrorCode::Ok; }

    // Get full error message
    std::string full_message() const {
        std::string result = message;
        if (context) {
            result += " [" + *context + "]";
        }
        if (source) {
            result += " at " + *source;
        }
        return result;
    }

    // For logging
    std::string to_string() const {
        return "[" + std::to_string(static_cast<int>(code)) + "] " + full_message();
    }
};

}  // namespace lifeline::core
