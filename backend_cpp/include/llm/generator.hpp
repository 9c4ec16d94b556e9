#pragma once
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "chat_mode.hpp"
#include "llm/llm_client.hpp"
#include "retrieval/retrieval_types.hpp"

namespace campus_rag {

struct Citation {
    int n = 0;
    std::string source;

    nlohmann::json to_json() const { return {{"n", n}, {"source", source}}; }
};

struct GeneratedAnswer {
    std::string answer;
    std::vector<Citation> citations;
    nlohmann::json meta = nlohmann::json::object();
};

class Generator {
public:
    static constexpr size_t kSnippetBytes = 550;
    static constexpr size_t kFallbackSnippetBytes = 350;
    static constexpr size_t kFallbackDocs = 3;

    // A null client is valid: every call site then answers from its deterministic fallback.
    explicit Generator(std::shared_ptr<LlmClient> llm);

    // Grounded answer over the retrieved docs. Never throws on model failure.
    GeneratedAnswer answer(const std::string& question,
                           const std::vector<RetrievedDoc>& docs,
                           ChatMode mode = ChatMode::kStudent,
                           const std::string& locale = "IE") const;

    std::string answer_chitchat(const std::string& question,
                                ChatMode mode = ChatMode::kStudent,
                                const std::string& locale = "IE") const;

    std::string answer_nonsense(const std::string& question,
                                ChatMode mode = ChatMode::kStudent,
                                const std::string& locale = "IE") const;

    static GeneratedAnswer no_documents_answer();
    static GeneratedAnswer unreadable_documents_answer();

    // "[n] <snippet>\n(Source: <source>)\n" per doc with text, joined by blank lines.
    static std::pair<std::string, std::vector<Citation>> format_context(const std::vector<RetrievedDoc>& docs);

    // Extractive answer from the first usable docs. Verbatim source text only.
    static std::string fallback_answer(const std::vector<RetrievedDoc>& docs);

    static std::string snippet(const std::string& text, size_t max_bytes);

private:
    std::string converse(const char* system_prompt, const std::string& question,
                         double temperature, const std::string& canned) const;

    std::shared_ptr<LlmClient> llm_;
};

} // namespace campus_rag
