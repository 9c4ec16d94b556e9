#include "retrieval/retriever.hpp"

#include "../support/fakes.hpp"
#include "../test_logger.hpp"

#include <cstdlib>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace {

using campus_rag::tests::Require;

struct Fixture {
    std::shared_ptr<campus_rag::tests::FakeEmbeddingService> embedder =
        std::make_shared<campus_rag::tests::FakeEmbeddingService>();
    std::shared_ptr<campus_rag::tests::FakeCrossEncoder> cross_encoder =
        std::make_shared<campus_rag::tests::FakeCrossEncoder>();
    std::shared_ptr<campus_rag::Retriever> retriever;

    explicit Fixture(campus_rag::RetrieverConfig config = {}) {
        auto index = campus_rag::tests::MakeIndex(
            {campus_rag::tests::MakeChunk("Spring exams begin March 3rd", "https://www.ul.ie/exams"),
             campus_rag::tests::MakeChunk("Autumn exams begin in December", "https://www.ul.ie/exams/autumn"),
             campus_rag::tests::MakeChunk("Dr Smith is a lecturer in CSIS", "https://www.ul.ie/csis/staff"),
             campus_rag::tests::MakeChunk("Dr Smith research profile", "https://pure.ul.ie/en/persons/smith"),
             campus_rag::tests::MakeChunk("Campus map and parking information", "https://www.ul.ie/map"),
             campus_rag::tests::MakeChunk("Library opening hours", "https://www.ul.ie/library")},
            *embedder);
        retriever = std::make_shared<campus_rag::Retriever>(index, embedder, cross_encoder, config);
    }
};

void ScenarioBlankQuery() {
    campus_rag::tests::Log("scenario: blank query");
    Fixture f;
    Require(f.retriever->retrieve("", 5).empty(), "empty query returns nothing");
    Require(f.retriever->retrieve("   \n", 5).empty(), "blank query returns nothing");
    Require(f.embedder->embed_calls() == 0 && f.cross_encoder->calls() == 0, "blank query searches nothing");
}

void ScenarioBoundedAndRanked() {
    campus_rag::tests::Log("scenario: bounded and ranked");
    Fixture f;
    for (int n : {1, 2, 4}) {
        const auto docs = f.retriever->retrieve("when do spring exams begin", n);
        Require(static_cast<int>(docs.size()) <= n, "never more than max_chunks docs");
        for (size_t i = 0; i < docs.size(); ++i) {
            Require(docs[i].rank == static_cast<int>(i + 1), "ranks are 1..N");
        }
    }
    const auto docs = f.retriever->retrieve("when do spring exams begin", 3);
    Require(!docs.empty() && docs[0].text == "Spring exams begin March 3rd", "best match ranks first");
    Require(docs[0].meta.source_url == "https://www.ul.ie/exams", "metadata travels with the doc");
}

void ScenarioDomainHint() {
    campus_rag::tests::Log("scenario: domain hint");
    Fixture f;
    const auto plain = f.retriever->retrieve("dr smith", 2);
    Require(plain.size() == 2, "both Smith chunks expected");
    const auto hinted = f.retriever->retrieve("dr smith", 2, std::string("pure.ul.ie"));
    Require(hinted[0].meta.source_url == "https://pure.ul.ie/en/persons/smith", "hinted domain should rank first");
}

void ScenarioModes() {
    campus_rag::tests::Log("scenario: retrieval modes");
    Fixture f;
    const auto sparse = f.retriever->retrieve("library hours", 2, std::nullopt, campus_rag::RetrievalMode::kSparseOnly);
    Require(!sparse.empty() && sparse[0].text == "Library opening hours", "sparse_only finds the lexical match");
    Require(f.embedder->embed_calls() == 0, "sparse_only never embeds the query");

    const auto dense = f.retriever->retrieve("library opening hours", 2, std::nullopt, campus_rag::RetrievalMode::kDenseOnly);
    Require(!dense.empty() && dense[0].text == "Library opening hours", "dense_only finds the semantic match");
    Require(f.embedder->embed_calls() == 1, "dense_only embeds the query once");
}

void ScenarioDenseFailureDegrades() {
    campus_rag::tests::Log("scenario: dense failure degrades");
    Fixture f;
    f.embedder->set_fail(true);
    const auto docs = f.retriever->retrieve("spring exams", 2);
    Require(!docs.empty(), "sparse results survive an embedding outage");
    Require(docs[0].text == "Spring exams begin March 3rd", "lexical best match still ranks first");
}

void ScenarioCandidateOverFetch() {
    campus_rag::tests::Log("scenario: candidate over-fetch");
    Fixture wide;
    const auto docs = wide.retriever->retrieve("exams", 1);
    Require(docs.size() == 1, "only max_chunks docs come back");
    Require(wide.cross_encoder->last_batch_size() == 6, "8x over-fetch sends the whole small corpus to the reranker");

    campus_rag::RetrieverConfig narrow_config;
    narrow_config.candidate_multiplier = 1;
    Fixture narrow(narrow_config);
    narrow.retriever->retrieve("dr smith exams begin", 2);
    Require(narrow.cross_encoder->last_batch_size() == 2, "fused list is truncated to max_chunks x multiplier");
}

void ScenarioHugeMaxChunks() {
    campus_rag::tests::Log("scenario: huge max_chunks");
    Fixture f;
    const auto docs = f.retriever->retrieve("exams", std::numeric_limits<int>::max());
    Require(docs.size() == 6, "result size is bounded by the corpus");
    Require(f.cross_encoder->last_batch_size() == 6, "candidate count is bounded by the corpus");
}

void ScenarioReplaceIndex() {
    campus_rag::tests::Log("scenario: replace index");
    Fixture f;
    auto snapshot = f.retriever->index();
    auto replacement = campus_rag::tests::MakeIndex(
        {campus_rag::tests::MakeChunk("Accommodation applications open in May", "https://www.ul.ie/accommodation")},
        *f.embedder);
    f.retriever->replace_index(replacement);

    Require(f.retriever->index()->size() == 1, "retriever serves the new index");
    Require(snapshot->size() == 6, "an old snapshot stays valid after the swap");
    const auto docs = f.retriever->retrieve("accommodation applications", 3);
    Require(docs.size() == 1 && docs[0].meta.source_url == "https://www.ul.ie/accommodation",
            "results come from the new index");
}

}  // namespace

int main() {
    try {
        campus_rag::tests::ConfigureLibraryLogging();
        campus_rag::tests::Log("retriever_test: start");
        ScenarioBlankQuery();
        ScenarioBoundedAndRanked();
        ScenarioDomainHint();
        ScenarioModes();
        ScenarioDenseFailureDegrades();
        ScenarioCandidateOverFetch();
        ScenarioHugeMaxChunks();
        ScenarioReplaceIndex();
        campus_rag::tests::Log("retriever_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        campus_rag::tests::LogError(ex.what());
        return EXIT_FAILURE;
    }
}
