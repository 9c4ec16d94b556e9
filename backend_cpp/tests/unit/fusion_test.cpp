#include "retrieval/fusion.hpp"

#include "../test_logger.hpp"

#include <cmath>
#include <cstdlib>
#include <vector>

namespace {

using campus_rag::ScoredChunk;
using campus_rag::tests::Require;

void ScenarioOverlapWins() {
    campus_rag::tests::Log("scenario: overlap wins");
    const std::vector<ScoredChunk> dense = {{3, 0.9}, {1, 0.8}, {7, 0.1}};
    const std::vector<ScoredChunk> sparse = {{1, 12.0}, {2, 4.0}};

    const auto fused = campus_rag::rrf_fuse_scored(dense, sparse, 60);
    Require(fused.size() == 4, "union of both lists expected");
    Require(fused[0].index == 1, "chunk present in both lists should rank first");
    Require(std::fabs(fused[0].score - (1.0 / 62.0 + 1.0 / 61.0)) < 1e-12, "rrf uses 1-based ranks");

    const auto order = campus_rag::rrf_fuse(dense, sparse, 60);
    Require(order.size() == fused.size() && order[0] == 1, "index-only fusion matches the scored variant");
}

void ScenarioDeterministicTies() {
    campus_rag::tests::Log("scenario: deterministic ties");
    const std::vector<ScoredChunk> dense = {{5, 0.3}};
    const std::vector<ScoredChunk> sparse = {{2, 1.0}};

    const auto first = campus_rag::rrf_fuse(dense, sparse);
    const auto second = campus_rag::rrf_fuse(dense, sparse);
    Require(first == second, "same inputs must give the same order");
    Require(first.size() == 2 && first[0] == 2 && first[1] == 5, "equal fused scores break ties by ascending index");
}

void ScenarioEmptyAndDefaults() {
    campus_rag::tests::Log("scenario: empty and defaults");
    Require(campus_rag::rrf_fuse({}, {}).empty(), "no inputs, no output");

    const auto only_sparse = campus_rag::rrf_fuse({}, {{4, 1.0}, {9, 0.5}});
    Require(only_sparse.size() == 2 && only_sparse[0] == 4, "a single list keeps its order");

    const auto fused = campus_rag::rrf_fuse_scored({{0, 1.0}}, {}, 0);
    Require(std::fabs(fused[0].score - 1.0 / 61.0) < 1e-12, "non-positive k falls back to the default constant");
}

}  // namespace

int main() {
    try {
        campus_rag::tests::ConfigureLibraryLogging();
        campus_rag::tests::Log("fusion_test: start");
        ScenarioOverlapWins();
        ScenarioDeterministicTies();
        ScenarioEmptyAndDefaults();
        campus_rag::tests::Log("fusion_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        campus_rag::tests::LogError(ex.what());
        return EXIT_FAILURE;
    }
}
