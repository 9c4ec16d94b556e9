#include "retrieval/reranker.hpp"
#include <algorithm>
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "http_retry.hpp"
#include "text_utils.hpp"

namespace campus_rag {

using json = nlohmann::json;

HttpCrossEncoder::HttpCrossEncoder(std::string url, std::string model, int timeout_ms)
    : url_(std::move(url)), model_(std::move(model)), timeout_ms_(timeout_ms) {}

std::vector<float> HttpCrossEncoder::score(const std::string& query, const std::vector<std::string>& texts) {
    if (texts.empty()) return {};

    const std::string payload = json{
        {"query", query},
        {"texts", texts},
        {"raw_scores", true},
        {"truncate", true}
    }.dump(-1, ' ', false, json::error_handler_t::replace);

    auto r = perform_request_with_retry([&]() {
        return cpr::Post(cpr::Url{url_},
                         cpr::Body{payload},
                         cpr::Header{{"Content-Type", "application/json"}},
                         cpr::Timeout{timeout_ms_});
    }, nullptr);

    if (r.error) {
        throw ModelServiceUnavailable("Rerank transport error: " + r.error.message);
    }
    if (r.status_code != 200) {
        spdlog::error("Rerank API error [{}]: {}", r.status_code, r.text.substr(0, 300));
        throw ModelServiceUnavailable("Rerank API returned status " + std::to_string(r.status_code));
    }

    std::vector<float> scores(texts.size(), 0.0F);
    try {
        for (const auto& item : json::parse(r.text)) {
            const auto idx = item.at("index").get<size_t>();
            if (idx < scores.size()) {
                scores[idx] = item.at("score").get<float>();
            }
        }
    } catch (const json::exception& e) {
        throw ModelServiceUnavailable(std::string("Malformed rerank response: ") + e.what());
    }
    return scores;
}

bool Reranker::matches_domain(const ChunkMeta& meta, const std::string& domain_hint) {
    if (domain_hint.empty()) return false;
    const std::string& url = meta.source_url.empty() ? meta.path : meta.source_url;
    return contains_ci(meta.host, domain_hint) || contains_ci(url, domain_hint);
}

std::vector<RerankedItem> Reranker::rerank(const std::string& query,
                                           const std::vector<RerankCandidate>& candidates,
                                           const std::optional<std::string>& domain_hint) const {
    if (candidates.empty()) return {};

    std::vector<std::string> texts;
    texts.reserve(candidates.size());
    for (const auto& c : candidates) {
        texts.push_back(c.text);
    }

    std::vector<float> base(candidates.size(), 0.0F);
    if (model_) {
        try {
            auto scores = model_->score(query, texts);
            if (scores.size() == candidates.size()) {
                base = std::move(scores);
            } else {
                spdlog::warn("Reranker: got {} scores for {} candidates, keeping fused order",
                             scores.size(), candidates.size());
            }
        } catch (const std::exception& e) {
            spdlog::warn("Reranker: cross-encoder unavailable, keeping fused order: {}", e.what());
        }
    }

    std::vector<RerankedItem> scored;
    scored.reserve(candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i) {
        RerankedItem item;
        item.base_score = static_cast<double>(base[i]);
        item.score = item.base_score;
        if (domain_hint && matches_domain(candidates[i].meta, *domain_hint)) {
            item.score += domain_bias_;
        }
        item.text = candidates[i].text;
        item.meta = candidates[i].meta;
        scored.push_back(std::move(item));
    }

    std::stable_sort(scored.begin(), scored.end(), [](const RerankedItem& a, const RerankedItem& b) {
        return a.score > b.score;
    });
    return scored;
}

} // namespace campus_rag
