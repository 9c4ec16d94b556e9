#include "embedding_service.hpp"
#include <chrono>
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "http_retry.hpp"

namespace campus_rag {

using json = nlohmann::json;

HttpEmbeddingService::HttpEmbeddingService(std::string url, std::string model, int timeout_ms, size_t cache_capacity)
    : url_(std::move(url)),
      model_(std::move(model)),
      timeout_ms_(timeout_ms),
      cache_(cache_capacity, std::chrono::seconds(3600)) {}

std::vector<std::vector<float>> HttpEmbeddingService::post_inputs(const std::vector<std::string>& texts) {
    const std::string payload = json{{"inputs", texts}, {"normalize", true}, {"truncate", true}}
        .dump(-1, ' ', false, json::error_handler_t::replace);

    auto r = perform_request_with_retry([&]() {
        return cpr::Post(cpr::Url{url_},
                         cpr::Body{payload},
                         cpr::Header{{"Content-Type", "application/json"}},
                         cpr::Timeout{timeout_ms_});
    }, nullptr);

    if (r.error) {
        throw ModelServiceUnavailable("Embedding transport error: " + r.error.message);
    }
    if (r.status_code != 200) {
        spdlog::error("Embedding API error [{}]: {}", r.status_code, r.text.substr(0, 300));
        throw ModelServiceUnavailable("Embedding API returned status " + std::to_string(r.status_code));
    }

    try {
        auto embeddings = json::parse(r.text).get<std::vector<std::vector<float>>>();
        if (embeddings.size() != texts.size()) {
            throw ModelServiceUnavailable("Embedding API returned " + std::to_string(embeddings.size()) +
                                          " vectors for " + std::to_string(texts.size()) + " inputs");
        }
        return embeddings;
    } catch (const json::exception& e) {
        throw ModelServiceUnavailable(std::string("Malformed embedding response: ") + e.what());
    }
}

std::vector<float> HttpEmbeddingService::generate_embedding(const std::string& text) {
    if (auto cached = cache_.get(text)) return *cached;

    auto start = std::chrono::steady_clock::now();
    auto embedding = post_inputs({text}).front();
    double duration = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    spdlog::debug("Query embedding in {:.1f} ms", duration);

    cache_.set(text, embedding);
    return embedding;
}

std::vector<std::vector<float>> HttpEmbeddingService::generate_embeddings_batch(const std::vector<std::string>& texts) {
    if (texts.empty()) return {};
    return post_inputs(texts);
}

} // namespace campus_rag
