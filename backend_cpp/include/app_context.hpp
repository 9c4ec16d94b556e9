#pragma once
#include <memory>
#include "KeyManager.hpp"
#include "embedding_service.hpp"
#include "graph/pipeline.hpp"
#include "llm/generator.hpp"
#include "llm/llm_client.hpp"
#include "retrieval/reranker.hpp"
#include "retrieval/retriever.hpp"
#include "settings.hpp"

namespace campus_rag {

// Everything a front end needs, wired from Settings.
struct AppContext {
    Settings settings;
    std::shared_ptr<KeyManager> key_manager;
    std::shared_ptr<LlmClient> llm;            // null without credentials
    std::shared_ptr<EmbeddingService> embedder;
    std::shared_ptr<CrossEncoder> cross_encoder;
    std::shared_ptr<Retriever> retriever;
    std::shared_ptr<Pipeline> pipeline;
};

// Loads the index at settings.index_path and builds the HTTP-backed services.
// Throws IndexNotFound / IndexCorrupt when the index cannot be used.
AppContext build_app_context(const Settings& settings);

// Loads an index and warns when it was embedded with a different model than configured.
std::shared_ptr<const CorpusIndex> load_index_checked(const Settings& settings);

} // namespace campus_rag
