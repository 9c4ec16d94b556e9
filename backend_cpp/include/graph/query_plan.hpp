#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "retrieval/retrieval_types.hpp"

namespace campus_rag {

enum class QueryType {
    kWhoIs,
    kProgrammeOrModule,
    kCampusDirections,
    kAdminProcess,
    kResearch,
    kGeneral,
    kChitchat,
    kNonsense
};

std::string to_string(QueryType type);
std::optional<QueryType> query_type_from_string(const std::string& name);

// Chitchat and nonsense are answered without retrieval.
inline bool is_conversational(QueryType type) {
    return type == QueryType::kChitchat || type == QueryType::kNonsense;
}

struct QueryPlan {
    QueryType query_type = QueryType::kGeneral;
    std::string topic;
    bool needs_multi_hop = false;
    RetrievalMode retrieval_mode = RetrievalMode::kHybrid;
    int max_chunks = 6;
    std::optional<std::string> domain_hint;

    nlohmann::json to_json() const;
};

} // namespace campus_rag
