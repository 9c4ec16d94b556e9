#include "graph/router.hpp"
#include <cmath>
#include <spdlog/spdlog.h>
#include "errors.hpp"
#include "text_utils.hpp"

namespace campus_rag {

using json = nlohmann::json;

namespace {

const char* const kTopicKeywords[] = {"lero", "csis", "accommodation"};

// Loose truthiness: empty strings, containers, zero and null are false.
bool truthy(const json& value) {
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number()) return value.get<double>() != 0.0;
    if (value.is_string()) return !value.get_ref<const std::string&>().empty();
    if (value.is_array() || value.is_object()) return !value.empty();
    return false;
}

json extract_json(const std::string& raw) {
    try {
        return json::parse(raw);
    } catch (const json::parse_error&) {
        // Prose around the object: take the first '{' .. last '}' span.
    }
    const size_t start = raw.find('{');
    const size_t end = raw.rfind('}');
    if (start == std::string::npos || end == std::string::npos || end <= start) {
        throw RouterParseError("No JSON object found in router output");
    }
    try {
        return json::parse(raw.substr(start, end - start + 1));
    } catch (const json::parse_error& e) {
        throw RouterParseError(std::string("Router output is not valid JSON: ") + e.what());
    }
}

} // namespace

Router::Router(std::shared_ptr<LlmClient> llm, RouterConfig config)
    : llm_(std::move(llm)), config_(std::move(config)) {}

const std::string& Router::system_prompt() {
    static const std::string prompt =
        "You are an intent classifier and planner for a University of Limerick (UL) assistant.\n\n"
        "You must look at the USER MESSAGE and decide:\n"
        "1) What kind of message it is.\n"
        "2) If it is a UL question, what high-level type and topic it has.\n\n"
        "You MUST choose one of these values for query_type:\n"
        "- 'who_is'              : asking about a person (staff, lecturer, professor, researcher, etc.)\n"
        "- 'programme_or_module' : asking about a degree programme, course, module, or subject\n"
        "- 'campus_directions'   : asking about campus map, directions, locations, buildings, transport, parking\n"
        "- 'admin_process'       : asking about admissions, registration, exams, fees, regulations, policies\n"
        "- 'research'            : asking about research centres, Lero, SFI Research Centre for Software, grants, projects\n"
        "- 'general'             : UL-related question that does not fit the above categories\n"
        "- 'chitchat'            : greeting / small talk / social message (e.g. 'hi', 'hello', 'thanks', 'how are you') "
        "that is NOT clearly asking for UL information\n"
        "- 'nonsense'            : mostly random characters, spam, or clearly not understandable as a UL-related question\n\n"
        "Additional fields:\n"
        "- topic: a short keyword for the main topic, or '' if none.\n"
        "- needs_multi_hop: true if the question clearly requires combining information from multiple documents.\n"
        "- retrieval_mode: one of 'hybrid', 'dense_only', 'sparse_only' (use 'hybrid' for most questions).\n"
        "- max_chunks: integer, approx number of chunks to retrieve (e.g. 4, 6, 8).\n"
        "- domain_hint: optional host/domain preference (e.g. 'pure.ul.ie', 'ul.ie/buildings'), or null if no preference.\n\n"
        "You MUST respond with ONLY a single JSON object, no extra text.";
    return prompt;
}

QueryPlan Router::default_plan(const std::string& question) const {
    QueryPlan plan;
    plan.max_chunks = config_.default_max_chunks;
    const std::string lowered = to_lower(question);
    for (const char* keyword : kTopicKeywords) {
        if (lowered.find(keyword) != std::string::npos) {
            plan.topic = keyword;
            break;
        }
    }
    return plan;
}

int Router::coerce_max_chunks(const json& value) const {
    long long n = 0;
    bool ok = false;
    if (value.is_number_integer()) {
        n = value.get<long long>();
        ok = true;
    } else if (value.is_number_float()) {
        const double d = value.get<double>();
        if (std::isfinite(d)) {
            n = static_cast<long long>(d);
            ok = true;
        }
    } else if (value.is_boolean()) {
        n = value.get<bool>() ? 1 : 0;
        ok = true;
    } else if (value.is_string()) {
        const std::string s = trim(value.get<std::string>());
        try {
            size_t consumed = 0;
            n = std::stoll(s, &consumed);
            ok = consumed == s.size();
        } catch (const std::exception&) {
            ok = false;
        }
    }

    if (!ok || n <= 0) return config_.default_max_chunks;
    if (n > config_.max_chunks_cap) return config_.max_chunks_cap;
    return static_cast<int>(n);
}

QueryPlan Router::parse_plan(const std::string& content) const {
    const std::string raw = trim(content);
    if (raw.empty()) {
        throw RouterParseError("Empty router output");
    }
    const json data = extract_json(raw);
    if (!data.is_object()) {
        throw RouterParseError("Router output is not a JSON object");
    }

    QueryPlan plan;
    plan.max_chunks = config_.default_max_chunks;

    const json qt = data.value("query_type", json("general"));
    if (qt.is_string()) {
        plan.query_type = query_type_from_string(qt.get<std::string>()).value_or(QueryType::kGeneral);
    }

    const json rm = data.value("retrieval_mode", json("hybrid"));
    if (rm.is_string()) {
        plan.retrieval_mode = retrieval_mode_from_string(rm.get<std::string>()).value_or(RetrievalMode::kHybrid);
    }

    const json topic = data.value("topic", json(""));
    plan.topic = topic.is_string() ? topic.get<std::string>() : "";

    plan.needs_multi_hop = truthy(data.value("needs_multi_hop", json(false)));
    plan.max_chunks = coerce_max_chunks(data.value("max_chunks", json(config_.default_max_chunks)));

    const json dh = data.value("domain_hint", json(nullptr));
    if (dh.is_string() && !dh.get_ref<const std::string&>().empty()) {
        plan.domain_hint = dh.get<std::string>();
    }
    return plan;
}

void Router::apply_domain_defaults(QueryPlan& plan) const {
    if (plan.domain_hint) return;
    if (plan.query_type == QueryType::kWhoIs && !config_.staff_directory_domain.empty()) {
        plan.domain_hint = config_.staff_directory_domain;
    } else if (plan.query_type == QueryType::kCampusDirections && !config_.main_site_domain.empty()) {
        plan.domain_hint = config_.main_site_domain;
    }
}

QueryPlan Router::route(const std::string& question) const {
    if (!llm_) {
        spdlog::warn("Router: no LLM client configured, using default plan.");
        return default_plan(question);
    }

    std::string content;
    try {
        CompletionRequest request;
        request.system_prompt = system_prompt();
        request.user_prompt = "USER MESSAGE:\n" + question;
        request.temperature = 0.0;
        request.json_response = true;
        content = llm_->complete(request);
    } catch (const std::exception& e) {
        spdlog::warn("Router: LLM call failed, using default plan: {}", e.what());
        return default_plan(question);
    }

    QueryPlan plan;
    try {
        plan = parse_plan(content);
    } catch (const RouterParseError& e) {
        spdlog::warn("Router: failed to parse JSON plan, using default plan: {}", e.what());
        return default_plan(question);
    }

    apply_domain_defaults(plan);
    spdlog::debug("Router: {}", plan.to_json().dump());
    return plan;
}

} // namespace campus_rag
