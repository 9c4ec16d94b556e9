#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "corpus_index.hpp"

namespace campus_rag {

enum class RetrievalMode {
    kHybrid,
    kDenseOnly,
    kSparseOnly,
};

std::string to_string(RetrievalMode mode);
std::optional<RetrievalMode> retrieval_mode_from_string(const std::string& value);

// One ranked hit from a single searcher, keyed by position in the CorpusIndex.
struct ScoredChunk {
    size_t index;
    double score;
};

// Orders by descending score, then ascending chunk index.
void sort_ranked(std::vector<ScoredChunk>& ranked);

struct RetrievedDoc {
    std::string text;
    ChunkMeta meta;
    double score = 0.0;
    int rank = 0;

    nlohmann::json to_json() const;
};

} // namespace campus_rag
