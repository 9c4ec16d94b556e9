#include "retrieval/fusion.hpp"
#include <unordered_map>

namespace campus_rag {

std::vector<ScoredChunk> rrf_fuse_scored(const std::vector<ScoredChunk>& dense,
                                         const std::vector<ScoredChunk>& sparse,
                                         int k_rrf) {
    const double base = static_cast<double>(k_rrf <= 0 ? kDefaultRrfK : k_rrf);
    std::unordered_map<size_t, double> fused;

    auto apply_list = [&](const std::vector<ScoredChunk>& list) {
        for (size_t i = 0; i < list.size(); ++i) {
            const double rank = static_cast<double>(i + 1);
            fused[list[i].index] += 1.0 / (base + rank);
        }
    };
    apply_list(dense);
    apply_list(sparse);

    std::vector<ScoredChunk> out;
    out.reserve(fused.size());
    for (const auto& [index, score] : fused) {
        out.push_back({index, score});
    }
    sort_ranked(out);
    return out;
}

std::vector<size_t> rrf_fuse(const std::vector<ScoredChunk>& dense,
                             const std::vector<ScoredChunk>& sparse,
                             int k_rrf) {
    std::vector<size_t> order;
    for (const auto& item : rrf_fuse_scored(dense, sparse, k_rrf)) {
        order.push_back(item.index);
    }
    return order;
}

} // namespace campus_rag
