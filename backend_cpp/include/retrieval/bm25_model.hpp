#pragma once
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace campus_rag {

// Okapi BM25 over a fixed list of documents, built once and never mutated.
// Negative IDFs (terms in more than half the corpus) are floored to epsilon * average IDF.
class Bm25Model {
public:
    struct Params {
        double k1 = 1.5;
        double b = 0.75;
        double epsilon = 0.25;
    };

    Bm25Model() = default;
    explicit Bm25Model(const std::vector<std::string>& documents);
    Bm25Model(const std::vector<std::string>& documents, Params params);

    // Lowercase whitespace tokens with leading/trailing punctuation stripped.
    static std::vector<std::string> tokenize(const std::string& text);

    // (doc index, score) for every document sharing at least one query token, unordered.
    std::vector<std::pair<size_t, double>> score_matches(const std::vector<std::string>& query_tokens) const;

    double idf(const std::string& term) const;
    size_t size() const { return doc_lengths_.size(); }
    double average_doc_length() const { return avgdl_; }

private:
    struct Posting {
        size_t doc;
        int tf;
    };

    Params params_;
    std::vector<size_t> doc_lengths_;
    double avgdl_ = 0.0;
    std::unordered_map<std::string, std::vector<Posting>> postings_;
    std::unordered_map<std::string, double> idf_;

    void build(const std::vector<std::string>& documents);
};

} // namespace campus_rag
