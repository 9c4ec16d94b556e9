#include "session/chat_session.hpp"
#include "session/session_store.hpp"

#include "../support/fakes.hpp"
#include "../test_logger.hpp"

#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>

namespace {

using campus_rag::TurnRole;
using campus_rag::tests::Require;

struct Harness {
    std::shared_ptr<campus_rag::tests::FakeEmbeddingService> embedder =
        std::make_shared<campus_rag::tests::FakeEmbeddingService>();
    std::shared_ptr<campus_rag::tests::FakeLlmClient> llm =
        std::make_shared<campus_rag::tests::FakeLlmClient>();
    std::shared_ptr<const campus_rag::Pipeline> pipeline;

    Harness() {
        auto index = campus_rag::tests::MakeIndex(
            {campus_rag::tests::MakeChunk("Spring exams begin March 3rd", "https://www.ul.ie/exams"),
             campus_rag::tests::MakeChunk("Exam results are published in June", "https://www.ul.ie/results")},
            *embedder);
        auto retriever = std::make_shared<campus_rag::Retriever>(
            index, embedder, std::make_shared<campus_rag::tests::FakeCrossEncoder>());
        pipeline = std::make_shared<campus_rag::Pipeline>(
            std::make_shared<campus_rag::SafetyGate>(),
            std::make_shared<campus_rag::Router>(llm),
            retriever,
            std::make_shared<campus_rag::Generator>(llm));
    }

    // Router reply first, then the answer.
    void Script(const std::string& answer) {
        llm->push_reply(R"({"query_type":"admin_process","max_chunks":2})");
        llm->push_reply(answer);
    }
};

void ScenarioHistoryAndContext() {
    campus_rag::tests::Log("scenario: history and context");
    Harness h;
    campus_rag::ChatSession session(h.pipeline);

    h.Script("Spring exams begin March 3rd [1].");
    const auto first = session.ask("When do exams start?");
    Require(first.role == TurnRole::kAssistant, "ask returns the assistant turn");
    Require(first.content == "Spring exams begin March 3rd [1].", "answer recorded");
    Require(!first.citations.empty(), "citations recorded");
    Require(first.meta.contains("plan") && first.meta["plan"]["query_type"] == "admin_process", "plan kept in meta");
    Require(h.llm->requests()[0].user_prompt == "USER MESSAGE:\nWhen do exams start?", "first question routed as is");

    h.Script("Results come out in June [1].");
    session.ask("And the results?");
    const auto& routed = h.llm->requests()[2].user_prompt;
    Require(routed == "USER MESSAGE:\nPrevious question: When do exams start?\nCurrent question: And the results?",
            "follow-up carries the previous question");

    const auto history = session.history();
    Require(history.size() == 4, "two exchanges recorded");
    Require(history[0].role == TurnRole::kUser && history[1].role == TurnRole::kAssistant &&
                history[2].role == TurnRole::kUser && history[3].role == TurnRole::kAssistant,
            "turns alternate user then assistant");
    Require(history[2].content == "And the results?", "user turns store the raw question");

    Require(session.build_query_with_context("Where do I sit them?") ==
                "Previous questions:\n1) When do exams start?\n2) And the results?\nCurrent question: Where do I sit them?",
            "two previous questions, oldest first");

    const auto j = history[1].to_json();
    Require(j["role"] == "assistant" && j["content"] == first.content, "turn serialised");
    const std::string ts = j["timestamp"].get<std::string>();
    Require(ts.size() == 20 && ts.back() == 'Z', "timestamp is ISO-8601 UTC");
}

void ScenarioEmptyAnswer() {
    campus_rag::tests::Log("scenario: empty answer");
    Harness h;
    campus_rag::ChatSession session(h.pipeline);
    h.Script("");
    const auto turn = session.ask("When do exams start?");
    Require(turn.content == campus_rag::ChatSession::kEmptyAnswer, "empty model output is replaced");
}

void ScenarioResetAndSettings() {
    campus_rag::tests::Log("scenario: reset and settings");
    Harness h;
    campus_rag::ChatSession session(h.pipeline, campus_rag::ChatMode::kStudent, "IE", "");
    Require(session.session_id() == "default", "empty id becomes default");

    h.Script("Answer.");
    session.ask("When do exams start?");
    session.reset();
    Require(session.history().empty(), "reset clears history");
    Require(session.build_query_with_context("Next?") == "Next?", "no context after reset");

    session.set_mode(campus_rag::ChatMode::kStaff);
    session.set_locale("UK");
    h.Script("Staff answer.");
    session.ask("When do exams start?");
    Require(session.mode() == campus_rag::ChatMode::kStaff && session.locale() == "UK", "settings stick");
    Require(h.llm->requests().back().system_prompt.find("staff") != std::string::npos, "staff prompt used after switch");
}

void ScenarioHistoryIsBounded() {
    campus_rag::tests::Log("scenario: history is bounded");
    Harness h;
    campus_rag::ChatSession session(h.pipeline);
    const size_t exchanges = campus_rag::ChatSession::kMaxHistoryTurns / 2 + 5;
    for (size_t i = 0; i < exchanges; ++i) {
        session.ask("question " + std::to_string(i));
    }
    const auto history = session.history();
    Require(history.size() == campus_rag::ChatSession::kMaxHistoryTurns, "history stops growing at the cap");
    Require(history.front().role == TurnRole::kUser && history.front().content == "question 5",
            "oldest exchanges are dropped whole");
    Require(history.back().role == TurnRole::kAssistant, "latest answer is kept");
}

void ScenarioSessionStoreReuse() {
    campus_rag::tests::Log("scenario: session store reuse");
    Harness h;
    campus_rag::SessionStore store(h.pipeline, 10);
    auto first = store.acquire("alice", campus_rag::ChatMode::kStaff, "IE");
    auto again = store.acquire("alice", campus_rag::ChatMode::kStudent, "UK");
    Require(first == again, "same id gives the same session");
    Require(again->session->mode() == campus_rag::ChatMode::kStaff, "existing session keeps its settings");
    Require(store.acquire("", campus_rag::ChatMode::kStudent, "IE")->session->session_id() == "default",
            "empty id maps to default");
    Require(store.size() == 2, "two live sessions");

    Require(store.erase("alice") && !store.erase("alice"), "erase removes once");
    Require(store.acquire("alice", campus_rag::ChatMode::kStudent, "IE") != first, "erased id starts fresh");
}

void ScenarioSessionStoreBounds() {
    campus_rag::tests::Log("scenario: session store bounds");
    Harness h;
    campus_rag::SessionStore store(h.pipeline, 2);
    auto a = store.acquire("a", campus_rag::ChatMode::kStudent, "IE");
    store.acquire("b", campus_rag::ChatMode::kStudent, "IE");
    store.acquire("a", campus_rag::ChatMode::kStudent, "IE");
    store.acquire("c", campus_rag::ChatMode::kStudent, "IE");
    Require(store.size() == 2, "capacity caps live sessions");
    Require(store.acquire("a", campus_rag::ChatMode::kStudent, "IE") == a, "recently used session survives");

    campus_rag::SessionStore idle(h.pipeline, 10, std::chrono::seconds(0));
    auto stale = idle.acquire("x", campus_rag::ChatMode::kStudent, "IE");
    stale->session->ask("When do exams start?");
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    auto fresh = idle.acquire("x", campus_rag::ChatMode::kStudent, "IE");
    Require(fresh != stale && fresh->session->history().empty(), "idle session expires");
}

}  // namespace

int main() {
    try {
        campus_rag::tests::ConfigureLibraryLogging();
        campus_rag::tests::Log("chat_session_test: start");
        ScenarioHistoryAndContext();
        ScenarioEmptyAnswer();
        ScenarioResetAndSettings();
        ScenarioHistoryIsBounded();
        ScenarioSessionStoreReuse();
        ScenarioSessionStoreBounds();
        campus_rag::tests::Log("chat_session_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        campus_rag::tests::LogError(ex.what());
        return EXIT_FAILURE;
    }
}
