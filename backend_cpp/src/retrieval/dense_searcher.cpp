#include "retrieval/dense_searcher.hpp"
#include <faiss/utils/distances.h>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace campus_rag {

std::vector<ScoredChunk> DenseSearcher::search(const CorpusIndex& index, const std::string& query, int k) const {
    if (index.empty() || k <= 0) return {};
    return rank(index, embedder_->generate_embedding(query), k);
}

std::vector<ScoredChunk> DenseSearcher::rank(const CorpusIndex& index, std::vector<float> query_vector, int k) {
    if (index.empty() || k <= 0) return {};

    const size_t d = static_cast<size_t>(index.dimension());
    if (query_vector.size() != d) {
        throw std::runtime_error("Query embedding has dimension " + std::to_string(query_vector.size()) +
                                 ", index expects " + std::to_string(d));
    }

    faiss::fvec_renorm_L2(d, 1, query_vector.data());

    std::vector<float> scores(index.size());
    faiss::fvec_inner_products_ny(scores.data(), query_vector.data(), index.embedding_data(), d, index.size());

    std::vector<ScoredChunk> ranked;
    ranked.reserve(scores.size());
    for (size_t i = 0; i < scores.size(); ++i) {
        ranked.push_back({i, static_cast<double>(scores[i])});
    }
    sort_ranked(ranked);

    if (ranked.size() > static_cast<size_t>(k)) {
        ranked.resize(static_cast<size_t>(k));
    }
    return ranked;
}

} // namespace campus_rag
