#include "retrieval/bm25_model.hpp"
#include <cctype>
#include <cmath>
#include <vector>
#include "text_utils.hpp"

namespace campus_rag {

Bm25Model::Bm25Model(const std::vector<std::string>& documents) {
    build(documents);
}

Bm25Model::Bm25Model(const std::vector<std::string>& documents, Params params) : params_(params) {
    build(documents);
}

std::vector<std::string> Bm25Model::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    for (const auto& raw : split_whitespace(text)) {
        size_t begin = 0;
        size_t end = raw.size();
        while (begin < end && std::ispunct(static_cast<unsigned char>(raw[begin])) != 0) ++begin;
        while (end > begin && std::ispunct(static_cast<unsigned char>(raw[end - 1])) != 0) --end;
        if (begin >= end) continue;
        tokens.push_back(to_lower(raw.substr(begin, end - begin)));
    }
    return tokens;
}

void Bm25Model::build(const std::vector<std::string>& documents) {
    doc_lengths_.reserve(documents.size());
    size_t total_length = 0;

    for (size_t doc = 0; doc < documents.size(); ++doc) {
        auto tokens = tokenize(documents[doc]);
        doc_lengths_.push_back(tokens.size());
        total_length += tokens.size();

        std::unordered_map<std::string, int> tf;
        for (const auto& token : tokens) {
            ++tf[token];
        }
        for (const auto& [term, count] : tf) {
            postings_[term].push_back({doc, count});
        }
    }

    if (documents.empty()) return;
    avgdl_ = static_cast<double>(total_length) / static_cast<double>(documents.size());

    const double n = static_cast<double>(documents.size());
    double idf_sum = 0.0;
    std::vector<std::string> negative_terms;
    for (const auto& [term, list] : postings_) {
        const double df = static_cast<double>(list.size());
        const double value = std::log(n - df + 0.5) - std::log(df + 0.5);
        idf_[term] = value;
        idf_sum += value;
        if (value < 0.0) negative_terms.push_back(term);
    }

    if (!idf_.empty()) {
        const double eps = params_.epsilon * (idf_sum / static_cast<double>(idf_.size()));
        for (const auto& term : negative_terms) {
            idf_[term] = eps;
        }
    }
}

double Bm25Model::idf(const std::string& term) const {
    auto it = idf_.find(term);
    return it == idf_.end() ? 0.0 : it->second;
}

std::vector<std::pair<size_t, double>> Bm25Model::score_matches(const std::vector<std::string>& query_tokens) const {
    std::unordered_map<size_t, double> scores;
    if (avgdl_ <= 0.0) return {};

    for (const auto& token : query_tokens) {
        auto it = postings_.find(token);
        if (it == postings_.end()) continue;

        const double term_idf = idf(token);
        for (const auto& posting : it->second) {
            const double tf = static_cast<double>(posting.tf);
            const double dl = static_cast<double>(doc_lengths_[posting.doc]);
            const double denom = tf + params_.k1 * (1.0 - params_.b + params_.b * dl / avgdl_);
            scores[posting.doc] += term_idf * (tf * (params_.k1 + 1.0)) / denom;
        }
    }

    return {scores.begin(), scores.end()};
}

} // namespace campus_rag
