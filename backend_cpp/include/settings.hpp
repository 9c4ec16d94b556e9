#pragma once
#include <string>
#include <optional>

namespace campus_rag {

struct Settings {
    // Language model
    std::string gen_model = "gpt-4o-mini";
    std::string llm_base_url = "https://api.openai.com/v1";

    // Embedding / rerank services
    std::string embed_model = "sentence-transformers/all-MiniLM-L6-v2";
    std::string embed_url = "http://127.0.0.1:8080/embed";
    std::string rerank_model = "cross-encoder/ms-marco-MiniLM-L-6-v2";
    std::string rerank_url = "http://127.0.0.1:8081/rerank";
    int request_timeout_ms = 30000;
    size_t embedding_cache_size = 1024;

    // Storage
    std::string index_path = "storage/index";
    std::string keys_path;
    std::string log_dir = "logs";
    std::string log_level = "info";

    // Retrieval
    int rrf_k = 60;
    double domain_bias = 0.2;
    int candidate_multiplier = 8;

    // Router
    int default_max_chunks = 6;
    int max_chunks_cap = 20;
    std::string staff_directory_domain = "pure.ul.ie";
    std::string main_site_domain = "ul.ie";

    // Server
    std::string host = "127.0.0.1";
    int port = 5002;
    size_t max_sessions = 1000;
    int session_idle_seconds = 3600;
};

// Reads settings.json (explicit path, or the first hit on the standard search paths),
// then applies environment overrides. A missing file is not an error.
Settings load_settings(const std::optional<std::string>& explicit_path = std::nullopt);

void apply_env_overrides(Settings& settings);

} // namespace campus_rag
