#include "llm/generator.hpp"
#include <spdlog/spdlog.h>
#include "llm/prompts.hpp"
#include "text_utils.hpp"

namespace campus_rag {

using json = nlohmann::json;

namespace {

const char* const kStudentGreeting =
    "Hi! I'm the University of Limerick assistant. Ask me anything about UL whenever you're ready.";
const char* const kStaffGreeting =
    "Hello. I'm the University of Limerick assistant. Let me know if you have any UL-related questions.";
const char* const kNotUnderstood =
    "I'm not sure what you meant there. "
    "I can help with questions about the University of Limerick if you'd like to ask one.";

std::vector<const RetrievedDoc*> usable_docs(const std::vector<RetrievedDoc>& docs) {
    std::vector<const RetrievedDoc*> out;
    for (const auto& doc : docs) {
        if (!is_blank(doc.text)) out.push_back(&doc);
    }
    return out;
}

} // namespace

Generator::Generator(std::shared_ptr<LlmClient> llm) : llm_(std::move(llm)) {}

std::string Generator::snippet(const std::string& text, size_t max_bytes) {
    return shorten(strip_front_matter(text), max_bytes);
}

GeneratedAnswer Generator::no_documents_answer() {
    GeneratedAnswer out;
    out.answer = "Sorry, I couldn't find any University of Limerick documents clearly related to that question. "
                 "Try rephrasing it, or check the official UL website or department directly.";
    out.meta = {{"ctx", 0}, {"model", nullptr}};
    return out;
}

GeneratedAnswer Generator::unreadable_documents_answer() {
    GeneratedAnswer out;
    out.answer = "I found some University of Limerick documents for that question, but none of them "
                 "contained readable text. Try rephrasing it, or check the official UL website directly.";
    out.meta = {{"ctx", 0}, {"model", nullptr}};
    return out;
}

std::pair<std::string, std::vector<Citation>> Generator::format_context(const std::vector<RetrievedDoc>& docs) {
    std::string context;
    std::vector<Citation> citations;
    int n = 0;
    for (const RetrievedDoc* doc : usable_docs(docs)) {
        ++n;
        const std::string source = doc->meta.best_source();
        if (!context.empty()) context += "\n";
        context += "[" + std::to_string(n) + "] " + snippet(doc->text, kSnippetBytes) +
                   "\n(Source: " + source + ")\n";
        citations.push_back({n, source});
    }
    return {context, citations};
}

std::string Generator::fallback_answer(const std::vector<RetrievedDoc>& docs) {
    std::string joined;
    size_t i = 0;
    for (const RetrievedDoc* doc : usable_docs(docs)) {
        if (i == kFallbackDocs) break;
        ++i;
        if (!joined.empty()) joined += "\n\n";
        joined += "From source " + std::to_string(i) + " (" + doc->meta.best_source() + "): " +
                  snippet(doc->text, kFallbackSnippetBytes);
    }
    if (joined.empty()) joined = "(no text available)";
    return "I can't use the language model right now.\n\n"
           "Here is a short summary of the most relevant University of Limerick information I could find:\n\n" +
           joined;
}

GeneratedAnswer Generator::answer(const std::string& question,
                                  const std::vector<RetrievedDoc>& docs,
                                  ChatMode mode,
                                  const std::string& /*locale*/) const {
    if (docs.empty()) {
        return no_documents_answer();
    }

    auto [context, citations] = format_context(docs);
    if (citations.empty()) {
        spdlog::warn("Generator: {} docs retrieved but none had text", docs.size());
        return unreadable_documents_answer();
    }

    GeneratedAnswer out;
    out.citations = std::move(citations);
    const int ctx = static_cast<int>(out.citations.size());

    if (!llm_) {
        spdlog::warn("Generator: no LLM client configured, using extractive fallback.");
        out.answer = fallback_answer(docs);
        out.meta = {{"model", nullptr}, {"ctx", ctx}, {"fallback", true}};
        return out;
    }

    CompletionRequest request;
    request.system_prompt = mode == ChatMode::kStudent ? prompts::kStudentSystem : prompts::kStaffSystem;
    request.user_prompt = prompts::render_user_prompt(question, context);
    request.temperature = 0.3;

    bool fallback = false;
    try {
        out.answer = llm_->complete(request);
    } catch (const std::exception& e) {
        spdlog::warn("Generator: LLM call failed, using extractive fallback: {}", e.what());
        out.answer = fallback_answer(docs);
        fallback = true;
    }
    out.meta = {{"model", llm_->model_name()}, {"ctx", ctx}, {"fallback", fallback}};
    return out;
}

std::string Generator::converse(const char* system_prompt, const std::string& question,
                                double temperature, const std::string& canned) const {
    if (!llm_) return canned;

    CompletionRequest request;
    request.system_prompt = system_prompt;
    request.user_prompt = question;
    request.temperature = temperature;
    try {
        std::string reply = trim(llm_->complete(request));
        return reply.empty() ? canned : reply;
    } catch (const std::exception& e) {
        spdlog::warn("Generator: LLM call failed, using canned reply: {}", e.what());
        return canned;
    }
}

std::string Generator::answer_chitchat(const std::string& question, ChatMode mode,
                                       const std::string& /*locale*/) const {
    return converse(prompts::kChitchatSystem, question, 0.6,
                    mode == ChatMode::kStudent ? kStudentGreeting : kStaffGreeting);
}

std::string Generator::answer_nonsense(const std::string& question, ChatMode /*mode*/,
                                       const std::string& /*locale*/) const {
    return converse(prompts::kNonsenseSystem, question, 0.3, kNotUnderstood);
}

} // namespace campus_rag
