#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "chat_mode.hpp"
#include "graph/query_plan.hpp"
#include "graph/router.hpp"
#include "graph/safety.hpp"
#include "llm/generator.hpp"
#include "retrieval/retriever.hpp"

namespace campus_rag {

struct PipelineState {
    std::string question;
    ChatMode mode = ChatMode::kStudent;
    std::string locale = "IE";
    std::optional<QueryPlan> plan;
    std::vector<RetrievedDoc> docs;
    std::optional<std::string> answer;
    std::vector<Citation> citations;
    nlohmann::json meta = nlohmann::json::object();
};

struct PipelineResult {
    std::string answer;
    std::vector<Citation> citations;
    ChatMode mode = ChatMode::kStudent;
    nlohmann::json meta = nlohmann::json::object();
    std::optional<QueryPlan> plan;

    // {answer, citations, mode, meta, plan|null}
    nlohmann::json to_json() const;
};

// Safety -> Route -> Retrieve -> Generate, one pass per question.
// Each node takes the state by value and returns the next state; once an answer
// is set the remaining nodes pass it through untouched.
class Pipeline {
public:
    Pipeline(std::shared_ptr<SafetyGate> safety,
             std::shared_ptr<Router> router,
             std::shared_ptr<Retriever> retriever,
             std::shared_ptr<Generator> generator);

    PipelineResult run(const std::string& question,
                       ChatMode mode = ChatMode::kStudent,
                       const std::string& locale = "IE") const;

    // Same pass as run() but returns the final state, docs included.
    PipelineState run_state(const std::string& question,
                            ChatMode mode = ChatMode::kStudent,
                            const std::string& locale = "IE") const;

    PipelineState safety_node(PipelineState state) const;
    PipelineState route_node(PipelineState state) const;
    PipelineState retrieve_node(PipelineState state) const;
    PipelineState generate_node(PipelineState state) const;

private:
    std::shared_ptr<SafetyGate> safety_;
    std::shared_ptr<Router> router_;
    std::shared_ptr<Retriever> retriever_;
    std::shared_ptr<Generator> generator_;
};

} // namespace campus_rag
