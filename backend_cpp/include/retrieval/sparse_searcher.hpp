#pragma once
#include <string>
#include <vector>
#include "corpus_index.hpp"
#include "retrieval/retrieval_types.hpp"

namespace campus_rag {

// BM25 over the index's sparse model. Only chunks sharing a query term are returned.
class SparseSearcher {
public:
    std::vector<ScoredChunk> search(const CorpusIndex& index, const std::string& query, int k) const;
};

} // namespace campus_rag
