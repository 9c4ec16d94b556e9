#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "corpus_index.hpp"
#include "errors.hpp"

namespace campus_rag {

constexpr double kDefaultDomainBias = 0.2;

// Joint (query, passage) relevance model. Higher is more relevant; no fixed range.
// Throws ModelServiceUnavailable when the backend cannot answer.
class CrossEncoder {
public:
    virtual ~CrossEncoder() = default;
    virtual std::vector<float> score(const std::string& query, const std::vector<std::string>& texts) = 0;
    virtual std::string model_id() const = 0;
};

// text-embeddings-inference style endpoint:
// POST {"query": q, "texts": [...]} -> [{"index": i, "score": s}, ...]
class HttpCrossEncoder final : public CrossEncoder {
public:
    HttpCrossEncoder(std::string url, std::string model, int timeout_ms);

    std::vector<float> score(const std::string& query, const std::vector<std::string>& texts) override;
    std::string model_id() const override { return model_; }

private:
    std::string url_;
    std::string model_;
    int timeout_ms_;
};

struct RerankCandidate {
    std::string text;
    ChunkMeta meta;
};

struct RerankedItem {
    double score = 0.0;       // base_score plus the domain bias when the hint matched
    double base_score = 0.0;  // cross-encoder relevance
    std::string text;
    ChunkMeta meta;
};

class Reranker {
public:
    explicit Reranker(std::shared_ptr<CrossEncoder> model, double domain_bias = kDefaultDomainBias)
        : model_(std::move(model)), domain_bias_(domain_bias) {}

    // Descending score, stable on ties. A failing cross-encoder leaves every base score
    // at 0 so the incoming order survives and only the domain bias reorders.
    std::vector<RerankedItem> rerank(const std::string& query,
                                     const std::vector<RerankCandidate>& candidates,
                                     const std::optional<std::string>& domain_hint = std::nullopt) const;

    // Case-insensitive substring of the host, or of the URL/path.
    static bool matches_domain(const ChunkMeta& meta, const std::string& domain_hint);

    double domain_bias() const { return domain_bias_; }

private:
    std::shared_ptr<CrossEncoder> model_;
    double domain_bias_;
};

} // namespace campus_rag
