#pragma once
#include <vector>
#include "retrieval/retrieval_types.hpp"

namespace campus_rag {

constexpr int kDefaultRrfK = 60;

// Reciprocal-rank fusion: each list contributes 1 / (k_rrf + rank) with 1-based rank.
// Result is ordered by descending fused score, ties by ascending chunk index.
std::vector<ScoredChunk> rrf_fuse_scored(const std::vector<ScoredChunk>& dense,
                                         const std::vector<ScoredChunk>& sparse,
                                         int k_rrf = kDefaultRrfK);

std::vector<size_t> rrf_fuse(const std::vector<ScoredChunk>& dense,
                             const std::vector<ScoredChunk>& sparse,
                             int k_rrf = kDefaultRrfK);

} // namespace campus_rag
