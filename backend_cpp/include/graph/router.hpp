#pragma once
#include <memory>
#include <string>
#include "graph/query_plan.hpp"
#include "llm/llm_client.hpp"

namespace campus_rag {

struct RouterConfig {
    int default_max_chunks = 6;
    int max_chunks_cap = 20;
    std::string staff_directory_domain = "pure.ul.ie";
    std::string main_site_domain = "ul.ie";
};

// Classifies a question into a QueryPlan with one LLM call.
// Any failure falls back to default_plan(); route() never throws.
class Router {
public:
    explicit Router(std::shared_ptr<LlmClient> llm, RouterConfig config = {});

    QueryPlan route(const std::string& question) const;

    // Keyword-only plan used when no classifier is available.
    QueryPlan default_plan(const std::string& question) const;

    // Throws RouterParseError when no JSON object can be recovered.
    QueryPlan parse_plan(const std::string& content) const;

    static const std::string& system_prompt();

private:
    int coerce_max_chunks(const nlohmann::json& value) const;
    void apply_domain_defaults(QueryPlan& plan) const;

    std::shared_ptr<LlmClient> llm_;
    RouterConfig config_;
};

} // namespace campus_rag
