#include "retrieval/sparse_searcher.hpp"

namespace campus_rag {

std::vector<ScoredChunk> SparseSearcher::search(const CorpusIndex& index, const std::string& query, int k) const {
    if (index.empty() || k <= 0) return {};

    const auto tokens = Bm25Model::tokenize(query);
    if (tokens.empty()) return {};

    std::vector<ScoredChunk> ranked;
    for (const auto& [doc, score] : index.sparse_model().score_matches(tokens)) {
        ranked.push_back({doc, score});
    }
    sort_ranked(ranked);

    if (ranked.size() > static_cast<size_t>(k)) {
        ranked.resize(static_cast<size_t>(k));
    }
    return ranked;
}

} // namespace campus_rag
