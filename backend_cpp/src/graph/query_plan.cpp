#include "graph/query_plan.hpp"
#include <utility>

namespace campus_rag {

namespace {

const std::pair<QueryType, const char*> kQueryTypeNames[] = {
    {QueryType::kWhoIs, "who_is"},
    {QueryType::kProgrammeOrModule, "programme_or_module"},
    {QueryType::kCampusDirections, "campus_directions"},
    {QueryType::kAdminProcess, "admin_process"},
    {QueryType::kResearch, "research"},
    {QueryType::kGeneral, "general"},
    {QueryType::kChitchat, "chitchat"},
    {QueryType::kNonsense, "nonsense"},
};

} // namespace

std::string to_string(QueryType type) {
    for (const auto& [value, name] : kQueryTypeNames) {
        if (value == type) return name;
    }
    return "general";
}

std::optional<QueryType> query_type_from_string(const std::string& name) {
    for (const auto& [value, label] : kQueryTypeNames) {
        if (name == label) return value;
    }
    return std::nullopt;
}

nlohmann::json QueryPlan::to_json() const {
    nlohmann::json j = {
        {"query_type", to_string(query_type)},
        {"topic", topic},
        {"needs_multi_hop", needs_multi_hop},
        {"retrieval_mode", to_string(retrieval_mode)},
        {"max_chunks", max_chunks},
        {"domain_hint", nullptr}
    };
    if (domain_hint) j["domain_hint"] = *domain_hint;
    return j;
}

} // namespace campus_rag
