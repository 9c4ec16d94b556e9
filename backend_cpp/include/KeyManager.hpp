#pragma once
#include <vector>
#include <string>
#include <cstdlib>
#include <shared_mutex>
#include <nlohmann/json.hpp>
#include <fstream>
#include <spdlog/spdlog.h>

namespace campus_rag {

// Pool of language-model API keys. Rotates to the next key when the provider rate-limits.
class KeyManager {
private:
    struct ApiKey {
        std::string key;
        bool is_active = true;
        int fail_count = 0;
    };

    std::vector<ApiKey> key_pool;
    mutable std::shared_mutex pool_mutex;
    size_t current_index = 0;
    std::string preferred_model;

public:
    KeyManager() = default;

    explicit KeyManager(const std::string& keys_path) {
        refresh_key_pool(keys_path);
    }

    explicit KeyManager(std::vector<std::string> keys) {
        for (auto& k : keys) {
            if (!k.empty()) key_pool.push_back({std::move(k), true, 0});
        }
    }

    // keys.json: {"keys": ["sk-..."], "model": "gpt-4o-mini"}. OPENAI_API_KEY is appended when set.
    void refresh_key_pool(const std::string& keys_path = "") {
        std::unique_lock lock(pool_mutex);

        std::vector<std::string> search_paths;
        if (!keys_path.empty()) {
            search_paths.push_back(keys_path);
        } else {
            search_paths = {
                "keys.json",
                "../keys.json",
                "build/keys.json",
                "../../keys.json"
            };
        }

        key_pool.clear();
        current_index = 0;

        std::ifstream f;
        std::string found_path;
        for (const auto& path : search_paths) {
            f.open(path);
            if (f.is_open()) {
                found_path = path;
                break;
            }
            f.clear();
        }

        if (!found_path.empty()) {
            try {
                auto j = nlohmann::json::parse(f);
                for (auto& k : j.value("keys", nlohmann::json::array())) {
                    if (k.is_string() && !k.get<std::string>().empty()) {
                        key_pool.push_back({k.get<std::string>(), true, 0});
                    }
                }
                preferred_model = j.value("model", "");
            } catch (const std::exception& e) {
                spdlog::error("Failed to parse key pool {}: {}", found_path, e.what());
            }
        }

        const char* env_key = std::getenv("OPENAI_API_KEY");
        if (env_key != nullptr && *env_key != '\0') {
            key_pool.push_back({env_key, true, 0});
        }

        if (key_pool.empty()) {
            spdlog::warn("No language-model API key configured; model calls will use fallbacks");
        } else {
            spdlog::info("Key pool loaded: {} key(s)", key_pool.size());
        }
    }

    bool has_keys() const {
        return get_active_key_count() > 0;
    }

    size_t get_active_key_count() const {
        std::shared_lock lock(pool_mutex);
        size_t count = 0;
        for (const auto& k : key_pool) {
            if (k.is_active) count++;
        }
        return count;
    }

    std::string get_current_key() const {
        std::shared_lock lock(pool_mutex);
        if (key_pool.empty()) return "";
        for (size_t i = 0; i < key_pool.size(); ++i) {
            const auto& candidate = key_pool[(current_index + i) % key_pool.size()];
            if (candidate.is_active) return candidate.key;
        }
        return "";
    }

    std::string get_preferred_model(const std::string& fallback) const {
        std::shared_lock lock(pool_mutex);
        return preferred_model.empty() ? fallback : preferred_model;
    }

    void report_rate_limit() {
        std::unique_lock lock(pool_mutex);
        if (key_pool.empty()) return;

        auto& current = key_pool[current_index % key_pool.size()];
        current.fail_count++;
        if (current.fail_count > 2) {
            current.is_active = false;
            spdlog::warn("Key #{} decommissioned after repeated rate limits", current_index);
        }
        current_index = (current_index + 1) % key_pool.size();
    }
};

} // namespace campus_rag
