#include "corpus_index.hpp"
#include "errors.hpp"

#include "../support/fakes.hpp"
#include "../test_logger.hpp"

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

namespace {

namespace fs = std::filesystem;
using campus_rag::tests::Require;

fs::path TempDir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("campus_rag_index_" + name);
    fs::remove_all(dir);
    return dir;
}

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
    try {
        fn();
    } catch (const Exception&) {
        return true;
    }
    return false;
}

void ScenarioMetaNormalisation() {
    campus_rag::tests::Log("scenario: meta normalisation");
    const auto chunk = campus_rag::Chunk::from_json(nlohmann::json::parse(R"({
        "content": "Library opening hours",
        "metadata": {"url": "https://www.UL.ie/library/hours", "file_path": "lib.md", "title": "Library"}
    })"));
    Require(chunk.text == "Library opening hours", "content should map to text");
    Require(chunk.meta.source_url == "https://www.UL.ie/library/hours", "url should map to source_url");
    Require(chunk.meta.host == "www.ul.ie", "host should be derived from the url");
    Require(chunk.meta.path == "lib.md", "file_path should map to path");

    const auto page = campus_rag::Chunk::from_json(nlohmann::json::parse(
        R"({"page_content": "x", "meta": {"source_host": "pure.ul.ie", "source": "web"}})"));
    Require(page.text == "x", "page_content should map to text");
    Require(page.meta.host == "pure.ul.ie", "source_host should map to host");

    const auto empty = campus_rag::Chunk::from_json(nlohmann::json::parse(R"({"meta": {}})"));
    Require(empty.text.empty(), "chunk without text keeps an empty text");
}

void ScenarioBestSource() {
    campus_rag::tests::Log("scenario: best source");
    campus_rag::ChunkMeta meta;
    Require(meta.best_source() == "document", "empty meta falls back to document");
    meta.source = "md";
    Require(meta.best_source() == "md", "source is the third choice");
    meta.path = "docs/exams.md";
    Require(meta.best_source() == "docs/exams.md", "path beats source");
    meta.source_url = "https://www.ul.ie/exams";
    Require(meta.best_source() == "https://www.ul.ie/exams", "source_url beats everything");
}

void ScenarioFromPartsValidation() {
    campus_rag::tests::Log("scenario: from_parts validation");
    std::vector<campus_rag::Chunk> chunks = {campus_rag::tests::MakeChunk("a"), campus_rag::tests::MakeChunk("b")};
    Require(Throws<campus_rag::IndexCorrupt>([&] {
                campus_rag::CorpusIndex::from_parts(chunks, std::vector<float>(3 * 4, 1.0F), 4, "m");
            }),
            "embedding rows != chunk count should be IndexCorrupt");
    Require(Throws<campus_rag::IndexCorrupt>([&] {
                campus_rag::CorpusIndex::from_parts(chunks, {}, 0, "m");
            }),
            "non-positive dimension should be IndexCorrupt");

    auto index = campus_rag::CorpusIndex::from_parts(chunks, {3.0F, 4.0F, 0.0F, 2.0F}, 2, "m");
    Require(index->size() == 2, "two chunks expected");
    Require(index->sparse_model().size() == 2, "sparse model must align with chunks");
    const float* row0 = index->embedding_data();
    Require(std::fabs(row0[0] - 0.6F) < 1e-5F && std::fabs(row0[1] - 0.8F) < 1e-5F,
            "embeddings should be L2-normalised");

    auto empty = campus_rag::CorpusIndex::from_parts({}, {}, 8, "m");
    Require(empty->empty() && empty->dimension() == 8, "empty index keeps its dimension");
}

void ScenarioSaveAndLoad() {
    campus_rag::tests::Log("scenario: save and load");
    campus_rag::tests::FakeEmbeddingService embedder;
    auto index = campus_rag::tests::MakeIndex(
        {campus_rag::tests::MakeChunk("Spring exams begin March 3rd", "https://www.ul.ie/exams"),
         campus_rag::tests::MakeChunk("Lero is the SFI Research Centre for Software")},
        embedder);

    const fs::path dir = TempDir("roundtrip");
    index->save(dir.string());
    Require(fs::exists(dir / "faiss.index") && fs::exists(dir / "chunks.json"), "both artifact files written");

    auto loaded = campus_rag::CorpusIndex::load(dir.string());
    Require(loaded->size() == 2, "chunk count survives reload");
    Require(loaded->dimension() == embedder.dims(), "dimension survives reload");
    Require(loaded->embed_model() == "fake-embedder", "embed model survives reload");
    Require(loaded->chunk(0).meta.host == "www.ul.ie", "meta survives reload");
    Require(loaded->chunk(1).text == "Lero is the SFI Research Centre for Software", "text survives reload");
    fs::remove_all(dir);
}

void ScenarioLoadFailures() {
    campus_rag::tests::Log("scenario: load failures");
    const fs::path missing = TempDir("missing");
    Require(Throws<campus_rag::IndexNotFound>([&] { campus_rag::CorpusIndex::load(missing.string()); }),
            "missing directory should be IndexNotFound");

    fs::create_directories(missing);
    { std::ofstream(missing / "chunks.json") << R"({"chunks": []})"; }
    Require(Throws<campus_rag::IndexNotFound>([&] { campus_rag::CorpusIndex::load(missing.string()); }),
            "missing faiss.index should be IndexNotFound");
    fs::remove_all(missing);

    campus_rag::tests::FakeEmbeddingService embedder;
    auto index = campus_rag::tests::MakeIndex(
        {campus_rag::tests::MakeChunk("one"), campus_rag::tests::MakeChunk("two")}, embedder);

    const fs::path bad_json = TempDir("bad_json");
    index->save(bad_json.string());
    { std::ofstream(bad_json / "chunks.json", std::ios::trunc) << "{ broken"; }
    Require(Throws<campus_rag::IndexCorrupt>([&] { campus_rag::CorpusIndex::load(bad_json.string()); }),
            "malformed chunks.json should be IndexCorrupt");
    fs::remove_all(bad_json);

    const fs::path mismatch = TempDir("mismatch");
    index->save(mismatch.string());
    {
        std::ofstream(mismatch / "chunks.json", std::ios::trunc)
            << R"({"embed_model": "fake-embedder", "chunks": [{"text": "one", "meta": {}}]})";
    }
    Require(Throws<campus_rag::IndexCorrupt>([&] { campus_rag::CorpusIndex::load(mismatch.string()); }),
            "vector count != chunk count should be IndexCorrupt");
    fs::remove_all(mismatch);

    const fs::path bad_faiss = TempDir("bad_faiss");
    index->save(bad_faiss.string());
    { std::ofstream(bad_faiss / "faiss.index", std::ios::trunc | std::ios::binary) << "garbage bytes"; }
    Require(Throws<campus_rag::IndexCorrupt>([&] { campus_rag::CorpusIndex::load(bad_faiss.string()); }),
            "unreadable faiss.index should be IndexCorrupt");
    fs::remove_all(bad_faiss);
}

}  // namespace

int main() {
    try {
        campus_rag::tests::ConfigureLibraryLogging();
        campus_rag::tests::Log("corpus_index_test: start");
        ScenarioMetaNormalisation();
        ScenarioBestSource();
        ScenarioFromPartsValidation();
        ScenarioSaveAndLoad();
        ScenarioLoadFailures();
        campus_rag::tests::Log("corpus_index_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        campus_rag::tests::LogError(ex.what());
        return EXIT_FAILURE;
    }
}
