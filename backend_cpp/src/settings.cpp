#include "settings.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace campus_rag {

using json = nlohmann::json;

namespace {

const std::vector<std::string> kSearchPaths = {
    "settings.json",
    "../settings.json",
    "build/settings.json",
    "../../settings.json"
};

void override_from_env(const char* name, std::string& target) {
    const char* value = std::getenv(name);
    if (value != nullptr && *value != '\0') {
        target = value;
    }
}

void apply_json(const json& j, Settings& s) {
    s.gen_model = j.value("gen_model", s.gen_model);
    s.llm_base_url = j.value("llm_base_url", s.llm_base_url);
    s.embed_model = j.value("embed_model", s.embed_model);
    s.embed_url = j.value("embed_url", s.embed_url);
    s.rerank_model = j.value("rerank_model", s.rerank_model);
    s.rerank_url = j.value("rerank_url", s.rerank_url);
    s.request_timeout_ms = j.value("request_timeout_ms", s.request_timeout_ms);
    s.embedding_cache_size = j.value("embedding_cache_size", s.embedding_cache_size);

    s.index_path = j.value("index_path", s.index_path);
    s.keys_path = j.value("keys_path", s.keys_path);
    s.log_dir = j.value("log_dir", s.log_dir);
    s.log_level = j.value("log_level", s.log_level);

    if (j.contains("retrieval")) {
        const auto& r = j["retrieval"];
        s.rrf_k = r.value("rrf_k", s.rrf_k);
        s.domain_bias = r.value("domain_bias", s.domain_bias);
        s.candidate_multiplier = r.value("candidate_multiplier", s.candidate_multiplier);
    }

    if (j.contains("router")) {
        const auto& r = j["router"];
        s.default_max_chunks = r.value("default_max_chunks", s.default_max_chunks);
        s.max_chunks_cap = r.value("max_chunks_cap", s.max_chunks_cap);
        s.staff_directory_domain = r.value("staff_directory_domain", s.staff_directory_domain);
        s.main_site_domain = r.value("main_site_domain", s.main_site_domain);
    }

    if (j.contains("server")) {
        const auto& srv = j["server"];
        s.host = srv.value("host", s.host);
        s.port = srv.value("port", s.port);
        s.max_sessions = srv.value("max_sessions", s.max_sessions);
        s.session_idle_seconds = srv.value("session_idle_seconds", s.session_idle_seconds);
    }
}

} // namespace

void apply_env_overrides(Settings& settings) {
    override_from_env("GEN_MODEL", settings.gen_model);
    override_from_env("LLM_BASE_URL", settings.llm_base_url);
    override_from_env("EMBED_MODEL", settings.embed_model);
    override_from_env("EMBED_URL", settings.embed_url);
    override_from_env("RERANK_MODEL", settings.rerank_model);
    override_from_env("RERANK_URL", settings.rerank_url);
    override_from_env("INDEX_PATH", settings.index_path);
    override_from_env("KEYS_PATH", settings.keys_path);
    override_from_env("LOG_LEVEL", settings.log_level);
    override_from_env("LOG_DIR", settings.log_dir);
}

Settings load_settings(const std::optional<std::string>& explicit_path) {
    Settings settings;

    std::ifstream f;
    std::string found_path;
    if (explicit_path) {
        f.open(*explicit_path);
        if (!f.is_open()) {
            throw std::runtime_error("Settings file not found: " + *explicit_path);
        }
        found_path = *explicit_path;
    } else {
        for (const auto& path : kSearchPaths) {
            f.open(path);
            if (f.is_open()) {
                found_path = path;
                break;
            }
            f.clear();
        }
    }

    if (!found_path.empty()) {
        try {
            apply_json(json::parse(f), settings);
            spdlog::debug("Settings loaded from {}", found_path);
        } catch (const json::exception& e) {
            throw std::runtime_error("Invalid settings file " + found_path + ": " + e.what());
        }
    }

    apply_env_overrides(settings);
    return settings;
}

} // namespace campus_rag
