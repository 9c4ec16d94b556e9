#include "graph/pipeline.hpp"
#include <chrono>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace campus_rag {

using json = nlohmann::json;

json PipelineResult::to_json() const {
    json cites = json::array();
    for (const auto& c : citations) {
        cites.push_back(c.to_json());
    }
    return {
        {"answer", answer},
        {"citations", cites},
        {"mode", to_string(mode)},
        {"meta", meta},
        {"plan", plan ? plan->to_json() : json(nullptr)}
    };
}

Pipeline::Pipeline(std::shared_ptr<SafetyGate> safety,
                   std::shared_ptr<Router> router,
                   std::shared_ptr<Retriever> retriever,
                   std::shared_ptr<Generator> generator)
    : safety_(std::move(safety)),
      router_(std::move(router)),
      retriever_(std::move(retriever)),
      generator_(std::move(generator)) {
    if (!safety_ || !router_ || !retriever_ || !generator_) {
        throw std::invalid_argument("Pipeline requires safety, router, retriever and generator");
    }
}

PipelineState Pipeline::safety_node(PipelineState state) const {
    auto result = safety_->check(state.question);
    if (result.escalate) {
        state.answer = safety_->escalation_message(state.locale);
        state.citations.clear();
        state.meta = {{"escalation", result.reason.value_or("crisis")}};
    }
    return state;
}

PipelineState Pipeline::route_node(PipelineState state) const {
    if (state.answer) return state;
    state.plan = router_->route(state.question);
    return state;
}

PipelineState Pipeline::retrieve_node(PipelineState state) const {
    if (state.answer) return state;
    const QueryPlan plan = state.plan.value_or(QueryPlan{});
    if (is_conversational(plan.query_type)) {
        state.docs.clear();
        return state;
    }
    state.docs = retriever_->retrieve(state.question, plan.max_chunks, plan.domain_hint, plan.retrieval_mode);
    return state;
}

PipelineState Pipeline::generate_node(PipelineState state) const {
    if (state.answer) return state;
    const QueryType type = state.plan ? state.plan->query_type : QueryType::kGeneral;

    if (type == QueryType::kChitchat) {
        state.answer = generator_->answer_chitchat(state.question, state.mode, state.locale);
        state.citations.clear();
        state.meta = {{"intent", "chitchat"}};
        return state;
    }
    if (type == QueryType::kNonsense) {
        state.answer = generator_->answer_nonsense(state.question, state.mode, state.locale);
        state.citations.clear();
        state.meta = {{"intent", "nonsense"}};
        return state;
    }

    GeneratedAnswer generated = state.docs.empty()
        ? Generator::no_documents_answer()
        : generator_->answer(state.question, state.docs, state.mode, state.locale);
    state.answer = std::move(generated.answer);
    state.citations = std::move(generated.citations);
    state.meta = std::move(generated.meta);
    return state;
}

PipelineState Pipeline::run_state(const std::string& question, ChatMode mode, const std::string& locale) const {
    auto start = std::chrono::steady_clock::now();

    PipelineState state;
    state.question = question;
    state.mode = mode;
    state.locale = locale;

    state = safety_node(std::move(state));
    state = route_node(std::move(state));
    state = retrieve_node(std::move(state));
    state = generate_node(std::move(state));

    double duration = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    spdlog::info("Pipeline: type={} docs={} citations={} in {:.1f} ms",
                 state.plan ? to_string(state.plan->query_type) : "none",
                 state.docs.size(), state.citations.size(), duration);
    return state;
}

PipelineResult Pipeline::run(const std::string& question, ChatMode mode, const std::string& locale) const {
    PipelineState state = run_state(question, mode, locale);
    PipelineResult result;
    result.answer = state.answer.value_or("");
    result.citations = std::move(state.citations);
    result.mode = state.mode;
    result.meta = std::move(state.meta);
    result.plan = std::move(state.plan);
    return result;
}

} // namespace campus_rag
