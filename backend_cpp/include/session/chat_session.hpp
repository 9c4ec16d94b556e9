#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "chat_mode.hpp"
#include "graph/pipeline.hpp"

namespace campus_rag {

enum class TurnRole { kUser, kAssistant };

struct ChatTurn {
    TurnRole role = TurnRole::kUser;
    std::string content;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    std::vector<Citation> citations;
    nlohmann::json meta = nlohmann::json::object();

    nlohmann::json to_json() const;
};

// One conversation over the pipeline with a short memory of previous questions.
// Not thread-safe; callers serialise ask() per session.
class ChatSession {
public:
    static constexpr const char* kEmptyAnswer = "Sorry, I could not generate an answer.";
    // Oldest exchanges are dropped beyond this many turns.
    static constexpr size_t kMaxHistoryTurns = 100;

    explicit ChatSession(std::shared_ptr<const Pipeline> pipeline,
                         ChatMode mode = ChatMode::kStudent,
                         std::string locale = "IE",
                         std::string session_id = "default");

    // Runs the pipeline on the question plus up to two previous user questions
    // and returns the assistant turn appended to the history.
    ChatTurn ask(const std::string& text);

    void reset() { history_.clear(); }
    void set_mode(ChatMode mode) { mode_ = mode; }
    void set_locale(const std::string& locale) { locale_ = locale; }

    ChatMode mode() const { return mode_; }
    const std::string& locale() const { return locale_; }
    const std::string& session_id() const { return session_id_; }
    std::vector<ChatTurn> history() const { return history_; }

    std::string build_query_with_context(const std::string& new_question) const;

private:
    std::shared_ptr<const Pipeline> pipeline_;
    ChatMode mode_;
    std::string locale_;
    std::string session_id_;
    std::vector<ChatTurn> history_;
};

} // namespace campus_rag
