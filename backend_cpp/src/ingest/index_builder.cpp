#include "ingest/index_builder.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <nlohmann/json.hpp>
#include <poppler-document.h>
#include <poppler-page.h>
#include <spdlog/spdlog.h>
#include "text_utils.hpp"

namespace campus_rag {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string string_or_empty(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

} // namespace

IndexBuilder::IndexBuilder(std::shared_ptr<EmbeddingService> embedder, size_t chunk_words, size_t batch_size)
    : embedder_(std::move(embedder)),
      chunk_words_(chunk_words == 0 ? kDefaultChunkWords : chunk_words),
      batch_size_(batch_size == 0 ? kDefaultBatchSize : batch_size) {
    if (!embedder_) {
        throw std::invalid_argument("IndexBuilder requires an embedding service");
    }
}

std::vector<SourceDocument> IndexBuilder::load_jsonl(const std::string& path) {
    std::vector<SourceDocument> docs;
    std::ifstream in(path);
    if (!in) {
        spdlog::warn("JSONL input not found at {}, skipping.", path);
        return docs;
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (is_blank(line)) continue;
        json obj;
        try {
            obj = json::parse(line);
        } catch (const json::parse_error&) {
            spdlog::debug("{}:{}: invalid JSON, skipped", path, line_no);
            continue;
        }
        if (!obj.is_object()) continue;

        std::string text = trim(string_or_empty(obj, "text"));
        if (text.empty()) continue;

        json meta = {
            {"source_url", string_or_empty(obj, "url")},
            {"title", string_or_empty(obj, "title")},
            {"source", "web"}
        };
        docs.push_back({std::move(text), ChunkMeta::from_json(meta)});
    }
    spdlog::info("Loaded {} web docs from JSONL.", docs.size());
    return docs;
}

std::vector<SourceDocument> IndexBuilder::load_markdown_dir(const std::string& dir) {
    std::vector<SourceDocument> docs;
    if (dir.empty() || !fs::is_directory(dir)) {
        spdlog::info("MD directory {} not found or not a directory; skipping.", dir);
        return docs;
    }

    std::vector<fs::path> paths;
    for (const auto& entry : fs::recursive_directory_iterator(dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".md") {
            paths.push_back(entry.path());
        }
    }
    std::sort(paths.begin(), paths.end());

    for (const auto& path : paths) {
        std::ifstream f(path);
        if (!f) {
            spdlog::warn("Failed to read MD file {}", path.string());
            continue;
        }
        std::stringstream ss;
        ss << f.rdbuf();
        std::string text = trim(ss.str());
        if (text.empty()) continue;

        ChunkMeta meta;
        meta.path = path.string();
        meta.title = path.filename().string();
        meta.source = "md";
        docs.push_back({std::move(text), std::move(meta)});
    }
    spdlog::info("Loaded {} Markdown docs from {}.", docs.size(), dir);
    return docs;
}

std::string IndexBuilder::extract_pdf_text(const std::string& path) {
    std::unique_ptr<poppler::document> doc(poppler::document::load_from_file(path));
    if (!doc) {
        spdlog::warn("Failed to extract PDF text from {}: not a readable PDF", path);
        return "";
    }
    if (doc->is_locked()) {
        spdlog::warn("Failed to extract PDF text from {}: document is encrypted", path);
        return "";
    }

    std::string text;
    for (int i = 0; i < doc->pages(); ++i) {
        std::unique_ptr<poppler::page> page(doc->create_page(i));
        if (!page) continue;
        const poppler::byte_array utf8 = page->text().to_utf8();
        if (!text.empty()) text.push_back('\n');
        text.append(utf8.begin(), utf8.end());
    }
    return collapse_whitespace(text);
}

std::vector<SourceDocument> IndexBuilder::load_pdf_dir(const std::string& dir) {
    std::vector<SourceDocument> docs;
    if (dir.empty() || !fs::is_directory(dir)) {
        spdlog::info("PDF directory {} not found or not a directory; skipping.", dir);
        return docs;
    }

    std::vector<fs::path> paths;
    for (const auto& entry : fs::recursive_directory_iterator(dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".pdf") {
            paths.push_back(entry.path());
        }
    }
    std::sort(paths.begin(), paths.end());

    for (const auto& path : paths) {
        std::string text = extract_pdf_text(path.string());
        if (text.empty()) continue;

        ChunkMeta meta;
        meta.path = path.string();
        meta.title = path.filename().string();
        meta.source = "pdf";
        docs.push_back({std::move(text), std::move(meta)});
    }
    spdlog::info("Loaded {} PDF docs from {}.", docs.size(), dir);
    return docs;
}

std::vector<std::string> IndexBuilder::chunk_words(const std::string& text, size_t max_words) {
    const auto words = split_whitespace(text);
    std::vector<std::string> chunks;
    if (max_words == 0) max_words = kDefaultChunkWords;
    for (size_t i = 0; i < words.size(); i += max_words) {
        const size_t end = std::min(i + max_words, words.size());
        std::string chunk;
        for (size_t w = i; w < end; ++w) {
            if (w > i) chunk.push_back(' ');
            chunk += words[w];
        }
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

std::vector<Chunk> IndexBuilder::chunk_documents(const std::vector<SourceDocument>& docs, BuildStats* stats) const {
    std::vector<Chunk> chunks;
    std::unordered_set<std::string> seen;
    size_t duplicates = 0;

    for (const auto& doc : docs) {
        for (auto& piece : chunk_words(doc.text, chunk_words_)) {
            const std::string norm = collapse_whitespace(piece);
            if (norm.empty()) continue;
            if (!seen.insert(norm).second) {
                ++duplicates;
                continue;
            }
            chunks.push_back({std::move(piece), doc.meta});
        }
    }

    if (stats) {
        stats->documents = docs.size();
        stats->chunks = chunks.size();
        stats->duplicates = duplicates;
    }
    return chunks;
}

std::shared_ptr<const CorpusIndex> IndexBuilder::build(const std::vector<SourceDocument>& docs, BuildStats* stats) const {
    if (docs.empty()) {
        throw std::runtime_error("No documents loaded; aborting index build.");
    }
    spdlog::info("Total raw documents before chunking: {}", docs.size());

    BuildStats local;
    auto chunks = chunk_documents(docs, &local);
    spdlog::info("Total chunks to index: {} ({} duplicates dropped)", local.chunks, local.duplicates);

    std::vector<float> flat;
    int dim = 0;
    const size_t batches = (chunks.size() + batch_size_ - 1) / batch_size_;
    for (size_t i = 0; i < chunks.size(); i += batch_size_) {
        const size_t end = std::min(i + batch_size_, chunks.size());
        std::vector<std::string> texts;
        texts.reserve(end - i);
        for (size_t j = i; j < end; ++j) texts.push_back(chunks[j].text);

        auto embs = embedder_->generate_embeddings_batch(texts);
        if (embs.size() != texts.size()) {
            throw ModelServiceUnavailable("Embedding batch returned " + std::to_string(embs.size()) +
                                          " vectors for " + std::to_string(texts.size()) + " texts");
        }
        for (auto& e : embs) {
            if (dim == 0) {
                dim = static_cast<int>(e.size());
                flat.reserve(chunks.size() * e.size());
            }
            if (static_cast<int>(e.size()) != dim) {
                throw std::runtime_error("Inconsistent embedding dimension " + std::to_string(e.size()) +
                                         " (expected " + std::to_string(dim) + ")");
            }
            flat.insert(flat.end(), e.begin(), e.end());
        }
        spdlog::info("  - Embedded batch {}/{}", (i / batch_size_) + 1, batches);
    }

    auto index = CorpusIndex::from_parts(std::move(chunks), std::move(flat), dim, embedder_->model_id());
    if (stats) *stats = local;
    return index;
}

} // namespace campus_rag
