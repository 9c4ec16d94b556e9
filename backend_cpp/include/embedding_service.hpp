#pragma once
#include <string>
#include <vector>
#include <memory>
#include "cache_manager.hpp"
#include "errors.hpp"

namespace campus_rag {

// Maps text to fixed-dimension vectors; deterministic for a fixed model id.
// Implementations throw ModelServiceUnavailable when the backend cannot answer.
class EmbeddingService {
public:
    virtual ~EmbeddingService() = default;

    virtual std::vector<float> generate_embedding(const std::string& text) = 0;
    virtual std::vector<std::vector<float>> generate_embeddings_batch(const std::vector<std::string>& texts) = 0;
    virtual std::string model_id() const = 0;
};

// text-embeddings-inference style endpoint: POST {"inputs": [...], "normalize": true} -> [[...], ...]
class HttpEmbeddingService final : public EmbeddingService {
public:
    HttpEmbeddingService(std::string url, std::string model, int timeout_ms, size_t cache_capacity = 1024);

    std::vector<float> generate_embedding(const std::string& text) override;
    std::vector<std::vector<float>> generate_embeddings_batch(const std::vector<std::string>& texts) override;
    std::string model_id() const override { return model_; }

private:
    std::string url_;
    std::string model_;
    int timeout_ms_;
    EmbeddingCache cache_;

    std::vector<std::vector<float>> post_inputs(const std::vector<std::string>& texts);
};

} // namespace campus_rag
