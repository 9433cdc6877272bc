#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace lifeline::core {

// JSON alias
using Json = nlohmann::json;

// Time types. Timestamps are kept at millisecond precision so that they
// survive serialization unchanged.
using Clock = std::chrono::system_clock;
using Duration = std::chrono::milliseconds;
using TimePoint = std::chrono::time_point<Clock, Duration>;

inline TimePoint now() {
    return std::chrono::time_point_cast<Duration>(Clock::now());
}

inline int64_t to_millis(TimePoint tp) {
    return tp.time_since_epoch().count();
}

inline TimePoint from_millis(int64_t ms) {
    return TimePoint{Duration{ms}};
}

// Common type aliases
using SessionId = std::string;
using CheckpointId = std::string;
using ResumeEventId = std::string;

// Message roles recorded in a checkpoint
enum class Role {
    User,
    Assistant
};

inline std::string_view role_to_string(Role role) {
    switch (role) {
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "unknown";
}

inline Role role_from_string(std::string_view str) {
    if (str == "assistant") return Role::Assistant;
    return Role::User;
}

// Strict UTF-8 check: no overlong forms, surrogates or code points above U+10FFFF
inline bool is_valid_utf8(std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
        auto c = static_cast<unsigned char>(text[i]);
        size_t len;
        uint32_t cp;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > text.size()) {
            return false;
        }
        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
            cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

// Truncate text to a byte budget, marking the cut. Never splits a UTF-8
// sequence.
inline std::string truncate_text(const std::string& text, size_t max_chars) {
    if (text.size() <= max_chars) {
        return text;
    }
    static constexpr std::string_view kEllipsis = "...";
    bool marked = max_chars > kEllipsis.size();
    size_t cut = marked ? max_chars - kEllipsis.size() : max_chars;

    // Back off continuation bytes to the start of the split sequence
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }

    std::string out = text.substr(0, cut);
    if (marked) {
        out += kEllipsis;
    }
    return out;
}

}  // namespace lifeline::core
