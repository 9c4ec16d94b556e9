#pragma once
#include <memory>
#include <string>
#include <vector>
#include "corpus_index.hpp"
#include "embedding_service.hpp"
#include "retrieval/retrieval_types.hpp"

namespace campus_rag {

// Cosine similarity between the query embedding and every chunk embedding.
class DenseSearcher {
public:
    explicit DenseSearcher(std::shared_ptr<EmbeddingService> embedder) : embedder_(std::move(embedder)) {}

    std::vector<ScoredChunk> search(const CorpusIndex& index, const std::string& query, int k) const;

    // Same ranking over an already computed query vector.
    static std::vector<ScoredChunk> rank(const CorpusIndex& index, std::vector<float> query_vector, int k);

private:
    std::shared_ptr<EmbeddingService> embedder_;
};

} // namespace campus_rag
