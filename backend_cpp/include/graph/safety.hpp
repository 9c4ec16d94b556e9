#pragma once
#include <optional>
#include <string>

namespace campus_rag {

struct SafetyResult {
    bool escalate = false;
    std::optional<std::string> reason;
};

// Crisis-phrase screen run before any routing or retrieval.
class SafetyGate {
public:
    SafetyResult check(const std::string& question) const;

    // Locale is accepted for future localisation; the message is the same everywhere today.
    std::string escalation_message(const std::string& locale = "IE") const;
};

} // namespace campus_rag
