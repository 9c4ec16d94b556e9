#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "corpus_index.hpp"
#include "embedding_service.hpp"
#include "retrieval/dense_searcher.hpp"
#include "retrieval/fusion.hpp"
#include "retrieval/reranker.hpp"
#include "retrieval/retrieval_types.hpp"
#include "retrieval/sparse_searcher.hpp"

namespace campus_rag {

struct RetrieverConfig {
    int rrf_k = kDefaultRrfK;
    int candidate_multiplier = 8;
    double domain_bias = kDefaultDomainBias;
};

// Dense + sparse search, reciprocal-rank fusion, cross-encoder rerank.
class Retriever {
public:
    Retriever(std::shared_ptr<const CorpusIndex> index,
              std::shared_ptr<EmbeddingService> embedder,
              std::shared_ptr<CrossEncoder> cross_encoder,
              RetrieverConfig config = {});

    std::vector<RetrievedDoc> retrieve(const std::string& query,
                                       int max_chunks = 6,
                                       const std::optional<std::string>& domain_hint = std::nullopt,
                                       RetrievalMode mode = RetrievalMode::kHybrid) const;

    // Swaps in a freshly loaded index. In-flight retrievals keep the snapshot they started with.
    void replace_index(std::shared_ptr<const CorpusIndex> index);
    std::shared_ptr<const CorpusIndex> index() const;

    const RetrieverConfig& config() const { return config_; }

private:
    std::shared_ptr<const CorpusIndex> index_;
    DenseSearcher dense_;
    SparseSearcher sparse_;
    Reranker reranker_;
    RetrieverConfig config_;
};

} // namespace campus_rag
