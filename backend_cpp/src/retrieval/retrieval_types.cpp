#include "retrieval/retrieval_types.hpp"
#include <algorithm>
#include <cmath>

namespace campus_rag {

std::string to_string(RetrievalMode mode) {
    switch (mode) {
        case RetrievalMode::kHybrid: return "hybrid";
        case RetrievalMode::kDenseOnly: return "dense_only";
        case RetrievalMode::kSparseOnly: return "sparse_only";
    }
    return "hybrid";
}

std::optional<RetrievalMode> retrieval_mode_from_string(const std::string& value) {
    if (value == "hybrid") return RetrievalMode::kHybrid;
    if (value == "dense_only") return RetrievalMode::kDenseOnly;
    if (value == "sparse_only") return RetrievalMode::kSparseOnly;
    return std::nullopt;
}

void sort_ranked(std::vector<ScoredChunk>& ranked) {
    std::sort(ranked.begin(), ranked.end(), [](const ScoredChunk& lhs, const ScoredChunk& rhs) {
        const double l = std::isnan(lhs.score) ? 0.0 : lhs.score;
        const double r = std::isnan(rhs.score) ? 0.0 : rhs.score;
        if (l != r) return l > r;
        return lhs.index < rhs.index;
    });
}

nlohmann::json RetrievedDoc::to_json() const {
    return {
        {"text", text},
        {"meta", meta.to_json()},
        {"score", score},
        {"rank", rank}
    };
}

} // namespace campus_rag
