#include "corpus_index.hpp"
#include <faiss/IndexFlat.h>
#include <faiss/index_io.h>
#include <faiss/impl/FaissException.h>
#include <faiss/utils/distances.h>
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>
#include "text_utils.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace campus_rag {

namespace {

constexpr const char* kFaissFile = "faiss.index";
constexpr const char* kChunksFile = "chunks.json";

std::string string_field(const json& j, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it != j.end() && it->is_string() && !it->get_ref<const std::string&>().empty()) {
            return it->get<std::string>();
        }
    }
    return "";
}

std::string host_from_url(const std::string& url) {
    size_t start = url.find("://");
    start = (start == std::string::npos) ? 0 : start + 3;
    size_t end = url.find_first_of("/?#", start);
    std::string host = url.substr(start, end == std::string::npos ? std::string::npos : end - start);
    size_t colon = host.find(':');
    if (colon != std::string::npos) host.resize(colon);
    return to_lower(host);
}

} // namespace

std::string ChunkMeta::best_source() const {
    if (!source_url.empty()) return source_url;
    if (!path.empty()) return path;
    if (!source.empty()) return source;
    return "document";
}

json ChunkMeta::to_json() const {
    json j = json::object();
    if (!source_url.empty()) j["source_url"] = source_url;
    if (!host.empty()) j["host"] = host;
    if (!path.empty()) j["path"] = path;
    if (!title.empty()) j["title"] = title;
    if (!source.empty()) j["source"] = source;
    return j;
}

ChunkMeta ChunkMeta::from_json(const json& j) {
    ChunkMeta meta;
    if (!j.is_object()) return meta;
    meta.source_url = string_field(j, {"source_url", "url"});
    meta.host = string_field(j, {"source_host", "host"});
    meta.path = string_field(j, {"path", "file_path"});
    meta.title = string_field(j, {"title"});
    meta.source = string_field(j, {"source"});
    if (meta.host.empty() && meta.source_url.find("://") != std::string::npos) {
        meta.host = host_from_url(meta.source_url);
    }
    return meta;
}

json Chunk::to_json() const {
    return json{{"text", text}, {"meta", meta.to_json()}};
}

Chunk Chunk::from_json(const json& j) {
    Chunk chunk;
    if (j.is_string()) {
        chunk.text = j.get<std::string>();
        return chunk;
    }
    if (!j.is_object()) return chunk;
    chunk.text = string_field(j, {"text", "content", "page_content"});
    if (j.contains("meta")) {
        chunk.meta = ChunkMeta::from_json(j["meta"]);
    } else if (j.contains("metadata")) {
        chunk.meta = ChunkMeta::from_json(j["metadata"]);
    }
    return chunk;
}

CorpusIndex::CorpusIndex(std::unique_ptr<faiss::IndexFlat> index, std::vector<Chunk> chunks, std::string embed_model)
    : index_(std::move(index)),
      chunks_(std::move(chunks)),
      embed_model_(std::move(embed_model)) {
    std::vector<std::string> texts;
    texts.reserve(chunks_.size());
    for (const auto& c : chunks_) {
        texts.push_back(c.text);
    }
    sparse_model_ = Bm25Model(texts);
}

CorpusIndex::~CorpusIndex() {
}

int CorpusIndex::dimension() const {
    return static_cast<int>(index_->d);
}

const float* CorpusIndex::embedding_data() const {
    return index_->get_xb();
}

std::shared_ptr<const CorpusIndex> CorpusIndex::from_parts(std::vector<Chunk> chunks,
                                                           std::vector<float> embeddings,
                                                           int dimension,
                                                           std::string embed_model) {
    if (dimension <= 0) {
        throw IndexCorrupt("Embedding dimension must be positive, got " + std::to_string(dimension));
    }
    const size_t d = static_cast<size_t>(dimension);
    if (embeddings.size() % d != 0 || embeddings.size() / d != chunks.size()) {
        throw IndexCorrupt("Embeddings count " + std::to_string(embeddings.size() / d) +
                           " != chunks count " + std::to_string(chunks.size()));
    }

    auto index = std::make_unique<faiss::IndexFlatIP>(dimension);
    if (!chunks.empty()) {
        faiss::fvec_renorm_L2(d, chunks.size(), embeddings.data());
        index->add(static_cast<faiss::idx_t>(chunks.size()), embeddings.data());
    }

    return std::shared_ptr<const CorpusIndex>(
        new CorpusIndex(std::move(index), std::move(chunks), std::move(embed_model)));
}

std::shared_ptr<const CorpusIndex> CorpusIndex::load(const std::string& path) {
    fs::path dir(path);
    const fs::path faiss_path = dir / kFaissFile;
    const fs::path chunks_path = dir / kChunksFile;

    if (!fs::is_directory(dir) || !fs::exists(faiss_path) || !fs::exists(chunks_path)) {
        throw IndexNotFound("Index not found at " + dir.string() + ". Build it with campus_rag_build_index first.");
    }

    spdlog::info("Loading index from {}", dir.string());

    std::unique_ptr<faiss::Index> raw_index;
    try {
        raw_index.reset(faiss::read_index(faiss_path.string().c_str()));
    } catch (const faiss::FaissException& e) {
        throw IndexCorrupt("Unreadable FAISS index " + faiss_path.string() + ": " + e.what());
    }

    auto* flat = dynamic_cast<faiss::IndexFlat*>(raw_index.get());
    if (flat == nullptr || flat->metric_type != faiss::METRIC_INNER_PRODUCT) {
        throw IndexCorrupt("Expected a flat inner-product index in " + faiss_path.string());
    }
    std::unique_ptr<faiss::IndexFlat> index(flat);
    raw_index.release();

    std::vector<Chunk> chunks;
    std::string embed_model;
    try {
        std::ifstream meta_file(chunks_path);
        json doc = json::parse(meta_file);
        embed_model = doc.value("embed_model", "");
        const auto& list = doc.at("chunks");
        if (!list.is_array()) {
            throw IndexCorrupt("chunks.json 'chunks' is not an array");
        }
        chunks.reserve(list.size());
        for (const auto& item : list) {
            chunks.push_back(Chunk::from_json(item));
        }
    } catch (const json::exception& e) {
        throw IndexCorrupt("Malformed " + chunks_path.string() + ": " + e.what());
    }

    if (static_cast<size_t>(index->ntotal) != chunks.size()) {
        throw IndexCorrupt("Embeddings count " + std::to_string(index->ntotal) +
                           " != chunks count " + std::to_string(chunks.size()));
    }

    if (index->ntotal > 0) {
        faiss::fvec_renorm_L2(static_cast<size_t>(index->d), static_cast<size_t>(index->ntotal), index->get_xb());
    }

    const int dim = static_cast<int>(index->d);
    auto corpus = std::shared_ptr<const CorpusIndex>(
        new CorpusIndex(std::move(index), std::move(chunks), std::move(embed_model)));
    spdlog::info("Index stats: {} chunks, emb_dim={}", corpus->size(), dim);
    return corpus;
}

void CorpusIndex::save(const std::string& path) const {
    fs::path dir(path);
    fs::create_directories(dir);

    faiss::write_index(index_.get(), (dir / kFaissFile).string().c_str());

    json list = json::array();
    for (const auto& chunk : chunks_) {
        list.push_back(chunk.to_json());
    }

    std::ofstream meta_file(dir / kChunksFile);
    if (!meta_file) {
        throw std::runtime_error("Cannot write " + (dir / kChunksFile).string());
    }
    meta_file << json{{"embed_model", embed_model_}, {"chunks", list}}
        .dump(2, ' ', false, json::error_handler_t::replace);
    spdlog::info("Index saved to {} ({} chunks)", dir.string(), chunks_.size());
}

} // namespace campus_rag
