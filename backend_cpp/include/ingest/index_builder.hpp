#pragma once
#include <memory>
#include <string>
#include <vector>
#include "corpus_index.hpp"
#include "embedding_service.hpp"

namespace campus_rag {

// A whole source document before chunking.
struct SourceDocument {
    std::string text;
    ChunkMeta meta;
};

struct BuildStats {
    size_t documents = 0;
    size_t chunks = 0;
    size_t duplicates = 0;
};

// Offline ingestion: load JSONL / Markdown / PDF, chunk by words, drop exact duplicates,
// embed in batches and produce a CorpusIndex ready to save().
class IndexBuilder {
public:
    static constexpr size_t kDefaultChunkWords = 200;
    static constexpr size_t kDefaultBatchSize = 32;

    explicit IndexBuilder(std::shared_ptr<EmbeddingService> embedder,
                          size_t chunk_words = kDefaultChunkWords,
                          size_t batch_size = kDefaultBatchSize);

    // One JSON object per line: {"text", "url", "title"}. Blank or invalid lines are skipped.
    // A missing file yields no documents.
    static std::vector<SourceDocument> load_jsonl(const std::string& path);

    // Every *.md below dir, recursively.
    static std::vector<SourceDocument> load_markdown_dir(const std::string& dir);

    // Every *.pdf below dir, recursively, as one document per file with the page
    // text joined and whitespace collapsed. Unreadable, locked or empty files are skipped.
    static std::vector<SourceDocument> load_pdf_dir(const std::string& dir);

    // Empty when the file cannot be opened or holds no text.
    static std::string extract_pdf_text(const std::string& path);

    static std::vector<std::string> chunk_words(const std::string& text, size_t max_words);

    // Chunks every document and keeps the first copy of each whitespace-normalised chunk.
    std::vector<Chunk> chunk_documents(const std::vector<SourceDocument>& docs, BuildStats* stats = nullptr) const;

    // Throws std::runtime_error when docs is empty, ModelServiceUnavailable when embedding fails.
    std::shared_ptr<const CorpusIndex> build(const std::vector<SourceDocument>& docs, BuildStats* stats = nullptr) const;

private:
    std::shared_ptr<EmbeddingService> embedder_;
    size_t chunk_words_;
    size_t batch_size_;
};

} // namespace campus_rag
