#pragma once
#include <optional>
#include <string>

namespace campus_rag {

// Audience of an answer; selects the system prompt tone.
enum class ChatMode { kStudent, kStaff };

inline std::string to_string(ChatMode mode) {
    return mode == ChatMode::kStaff ? "staff" : "student";
}

inline std::optional<ChatMode> chat_mode_from_string(const std::string& value) {
    if (value == "student") return ChatMode::kStudent;
    if (value == "staff") return ChatMode::kStaff;
    return std::nullopt;
}

} // namespace campus_rag
