#include "session/chat_session.hpp"
#include <cstddef>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace campus_rag {

using json = nlohmann::json;

namespace {

std::string format_utc(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

} // namespace

json ChatTurn::to_json() const {
    json cites = json::array();
    for (const auto& c : citations) {
        cites.push_back(c.to_json());
    }
    return {
        {"role", role == TurnRole::kUser ? "user" : "assistant"},
        {"content", content},
        {"timestamp", format_utc(timestamp)},
        {"citations", cites},
        {"meta", meta}
    };
}

ChatSession::ChatSession(std::shared_ptr<const Pipeline> pipeline,
                         ChatMode mode,
                         std::string locale,
                         std::string session_id)
    : pipeline_(std::move(pipeline)),
      mode_(mode),
      locale_(std::move(locale)),
      session_id_(session_id.empty() ? "default" : std::move(session_id)) {
    if (!pipeline_) {
        throw std::invalid_argument("ChatSession requires a pipeline");
    }
}

std::string ChatSession::build_query_with_context(const std::string& new_question) const {
    // Most recent first while scanning backwards.
    std::vector<const std::string*> previous;
    for (auto it = history_.rbegin(); it != history_.rend() && previous.size() < 2; ++it) {
        if (it->role == TurnRole::kUser) previous.push_back(&it->content);
    }
    if (previous.empty()) return new_question;

    std::string out;
    if (previous.size() == 1) {
        out = "Previous question: " + *previous[0] + "\n";
    } else {
        out = "Previous questions:\n1) " + *previous[1] + "\n2) " + *previous[0] + "\n";
    }
    return out + "Current question: " + new_question;
}

ChatTurn ChatSession::ask(const std::string& text) {
    // Context comes from earlier turns only, so build it before recording this one.
    const std::string query = build_query_with_context(text);

    ChatTurn user_turn;
    user_turn.role = TurnRole::kUser;
    user_turn.content = text;
    history_.push_back(std::move(user_turn));

    PipelineResult result = pipeline_->run(query, mode_, locale_);

    ChatTurn bot_turn;
    bot_turn.role = TurnRole::kAssistant;
    bot_turn.content = result.answer.empty() ? kEmptyAnswer : std::move(result.answer);
    bot_turn.citations = std::move(result.citations);
    bot_turn.meta = result.meta.is_object() ? std::move(result.meta) : json::object();
    if (result.plan) {
        bot_turn.meta["plan"] = result.plan->to_json();
    }
    history_.push_back(bot_turn);
    if (history_.size() > kMaxHistoryTurns) {
        const auto excess = static_cast<std::ptrdiff_t>(history_.size() - kMaxHistoryTurns);
        history_.erase(history_.begin(), history_.begin() + excess);
    }

    spdlog::debug("Session {}: {} turns", session_id_, history_.size());
    return bot_turn;
}

} // namespace campus_rag
