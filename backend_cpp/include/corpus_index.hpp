#pragma once

#include <string>
#include <vector>
#include <memory>
#include <nlohmann/json.hpp>
#include "errors.hpp"
#include "retrieval/bm25_model.hpp"

// Forward declare FAISS Index
namespace faiss { struct IndexFlat; }

namespace campus_rag {

struct ChunkMeta {
    std::string source_url;
    std::string host;
    std::string path;
    std::string title;
    std::string source;

    // First non-empty of source_url, path, source; "document" otherwise.
    std::string best_source() const;

    nlohmann::json to_json() const;
    // Accepts the alternate key spellings older corpora use (url, source_host, file_path).
    static ChunkMeta from_json(const nlohmann::json& j);
};

struct Chunk {
    std::string text;
    ChunkMeta meta;

    nlohmann::json to_json() const;
    // text | content | page_content, meta | metadata. A chunk without text keeps its slot.
    static Chunk from_json(const nlohmann::json& j);
};

// Immutable corpus: chunks, unit-normalised embeddings (FAISS flat inner-product storage)
// and the BM25 model over the chunk texts. Row i of every part describes chunk i.
class CorpusIndex {
public:
    ~CorpusIndex();
    CorpusIndex(const CorpusIndex&) = delete;
    CorpusIndex& operator=(const CorpusIndex&) = delete;

    // Directory containing faiss.index and chunks.json.
    // Throws IndexNotFound when absent, IndexCorrupt when inconsistent.
    static std::shared_ptr<const CorpusIndex> load(const std::string& path);

    // embeddings is row-major, chunks.size() * dimension floats.
    static std::shared_ptr<const CorpusIndex> from_parts(std::vector<Chunk> chunks,
                                                         std::vector<float> embeddings,
                                                         int dimension,
                                                         std::string embed_model);

    void save(const std::string& path) const;

    size_t size() const { return chunks_.size(); }
    bool empty() const { return chunks_.empty(); }
    int dimension() const;
    const std::vector<Chunk>& chunks() const { return chunks_; }
    const Chunk& chunk(size_t i) const { return chunks_.at(i); }
    const std::string& embed_model() const { return embed_model_; }
    const Bm25Model& sparse_model() const { return sparse_model_; }

    // Row-major size() x dimension() block.
    const float* embedding_data() const;

private:
    CorpusIndex(std::unique_ptr<faiss::IndexFlat> index, std::vector<Chunk> chunks, std::string embed_model);

    std::unique_ptr<faiss::IndexFlat> index_;
    std::vector<Chunk> chunks_;
    std::string embed_model_;
    Bm25Model sparse_model_;
};

} // namespace campus_rag
