#include "retrieval/retriever.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "text_utils.hpp"

namespace campus_rag {

Retriever::Retriever(std::shared_ptr<const CorpusIndex> index,
                     std::shared_ptr<EmbeddingService> embedder,
                     std::shared_ptr<CrossEncoder> cross_encoder,
                     RetrieverConfig config)
    : index_(std::move(index)),
      dense_(std::move(embedder)),
      reranker_(std::move(cross_encoder), config.domain_bias),
      config_(config) {
    if (!index_) {
        throw std::invalid_argument("Retriever requires a loaded CorpusIndex");
    }
    spdlog::info("Retriever initialised with {} chunks", index_->size());
}

std::shared_ptr<const CorpusIndex> Retriever::index() const {
    return std::atomic_load(&index_);
}

void Retriever::replace_index(std::shared_ptr<const CorpusIndex> index) {
    if (!index) {
        throw std::invalid_argument("Cannot replace the index with null");
    }
    const size_t count = index->size();
    std::atomic_store(&index_, std::shared_ptr<const CorpusIndex>(std::move(index)));
    spdlog::info("Retriever index replaced ({} chunks)", count);
}

std::vector<RetrievedDoc> Retriever::retrieve(const std::string& query,
                                              int max_chunks,
                                              const std::optional<std::string>& domain_hint,
                                              RetrievalMode mode) const {
    if (is_blank(query) || max_chunks <= 0) return {};

    auto start = std::chrono::steady_clock::now();
    const auto corpus = index();
    if (corpus->empty()) return {};

    // Counts are bounded by the corpus size.
    const size_t wanted = std::min(static_cast<size_t>(max_chunks), corpus->size());
    const size_t multiplier = static_cast<size_t>(std::max(1, config_.candidate_multiplier));
    const int k_candidates = static_cast<int>(std::min(wanted * multiplier, corpus->size()));

    // 1. Dense + sparse
    std::vector<ScoredChunk> dense;
    std::vector<ScoredChunk> sparse;
    if (mode != RetrievalMode::kSparseOnly) {
        try {
            dense = dense_.search(*corpus, query, k_candidates);
        } catch (const std::exception& e) {
            spdlog::warn("Dense search failed, continuing with lexical results: {}", e.what());
        }
    }
    if (mode != RetrievalMode::kDenseOnly) {
        sparse = sparse_.search(*corpus, query, k_candidates);
    }

    // 2. Fuse
    auto fused = rrf_fuse(dense, sparse, config_.rrf_k);
    if (fused.size() > static_cast<size_t>(k_candidates)) {
        fused.resize(static_cast<size_t>(k_candidates));
    }

    std::vector<RerankCandidate> candidates;
    candidates.reserve(fused.size());
    for (size_t idx : fused) {
        const auto& chunk = corpus->chunk(idx);
        candidates.push_back({chunk.text, chunk.meta});
    }

    // 3. Rerank with domain bias
    auto reranked = reranker_.rerank(query, candidates, domain_hint);

    std::vector<RetrievedDoc> docs;
    const size_t limit = std::min(reranked.size(), wanted);
    docs.reserve(limit);
    for (size_t i = 0; i < limit; ++i) {
        auto& item = reranked[i];
        docs.push_back({std::move(item.text), std::move(item.meta), item.score, static_cast<int>(i + 1)});
    }

    double duration = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    spdlog::debug("Retriever: {} docs (dense={}, sparse={}, fused={}) in {:.2f} ms for query='{}'",
                  docs.size(), dense.size(), sparse.size(), fused.size(), duration, query);
    return docs;
}

} // namespace campus_rag
