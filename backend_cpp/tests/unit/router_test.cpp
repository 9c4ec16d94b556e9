#include "graph/router.hpp"

#include "../support/fakes.hpp"
#include "../test_logger.hpp"

#include <cstdlib>
#include <memory>
#include <string>

namespace {

using campus_rag::QueryType;
using campus_rag::RetrievalMode;
using campus_rag::tests::Require;

campus_rag::QueryPlan RouteWith(const std::string& reply, const std::string& question = "q") {
    auto llm = std::make_shared<campus_rag::tests::FakeLlmClient>(reply);
    campus_rag::Router router(llm);
    return router.route(question);
}

void ScenarioNoClientUsesDefault() {
    campus_rag::tests::Log("scenario: no client uses default");
    campus_rag::Router router(nullptr);
    const auto plan = router.route("Who works at Lero?");
    Require(plan.query_type == QueryType::kGeneral, "default plan is general");
    Require(plan.retrieval_mode == RetrievalMode::kHybrid, "default plan is hybrid");
    Require(plan.max_chunks == 6, "default plan fetches six chunks");
    Require(plan.topic == "lero", "keyword topic is picked up");
    Require(!plan.domain_hint.has_value() && !plan.needs_multi_hop, "default plan has no hint and no multi hop");
}

void ScenarioRequestShape() {
    campus_rag::tests::Log("scenario: request shape");
    auto llm = std::make_shared<campus_rag::tests::FakeLlmClient>(R"({"query_type":"general"})");
    campus_rag::Router router(llm);
    router.route("where is the library");
    Require(llm->requests().size() == 1, "one classifier call per question");
    const auto& request = llm->requests().front();
    Require(request.json_response, "classifier asks for a JSON response");
    Require(request.temperature == 0.0, "classifier runs at temperature 0");
    Require(request.user_prompt == "USER MESSAGE:\nwhere is the library", "question is wrapped as the user message");
    Require(request.system_prompt == campus_rag::Router::system_prompt(), "classifier prompt is the system prompt");
}

void ScenarioDomainDefaults() {
    campus_rag::tests::Log("scenario: domain defaults");
    const auto who = RouteWith(R"({"query_type":"who_is","topic":"smith","max_chunks":4})");
    Require(who.query_type == QueryType::kWhoIs, "who_is parsed");
    Require(who.domain_hint && *who.domain_hint == "pure.ul.ie", "who_is defaults to the staff directory");
    Require(who.max_chunks == 4 && who.topic == "smith", "fields carried over");

    const auto directions = RouteWith(R"({"query_type":"campus_directions"})");
    Require(directions.domain_hint && *directions.domain_hint == "ul.ie", "directions default to the main site");

    const auto kept = RouteWith(R"({"query_type":"who_is","domain_hint":"ul.ie/csis"})");
    Require(kept.domain_hint && *kept.domain_hint == "ul.ie/csis", "explicit hint is never overridden");

    const auto admin = RouteWith(R"({"query_type":"admin_process","domain_hint":""})");
    Require(!admin.domain_hint.has_value(), "empty hint means no hint");
}

void ScenarioProseWrappedJson() {
    campus_rag::tests::Log("scenario: prose wrapped json");
    const auto plan = RouteWith("Sure! Here is the plan:\n{\"query_type\":\"research\",\"needs_multi_hop\":true}\nThanks.");
    Require(plan.query_type == QueryType::kResearch, "object recovered from surrounding prose");
    Require(plan.needs_multi_hop, "multi hop flag parsed");
}

void ScenarioLongProseReply() {
    campus_rag::tests::Log("scenario: long prose reply");
    const std::string prose(200 * 1024, 'x');
    const auto plan = RouteWith("Here is the plan: " + prose +
                                "\n{\"query_type\":\"admin_process\",\"topic\":\"" + prose + "\"}\n" + prose + " thanks");
    Require(plan.query_type == campus_rag::QueryType::kAdminProcess, "plan recovered from a very long reply");
    Require(plan.topic.size() == prose.size(), "long field value survives extraction");

    const auto unbalanced = RouteWith(prose + "} trailing text {");
    Require(unbalanced.query_type == campus_rag::QueryType::kGeneral, "closing brace before opening brace gives the default plan");
}

void ScenarioMaxChunksCoercion() {
    campus_rag::tests::Log("scenario: max_chunks coercion");
    Require(RouteWith(R"({"max_chunks":"8"})").max_chunks == 8, "numeric string is accepted");
    Require(RouteWith(R"({"max_chunks":" 5 "})").max_chunks == 5, "padded numeric string is accepted");
    Require(RouteWith(R"({"max_chunks":"abc"})").max_chunks == 6, "non-numeric string falls back to 6");
    Require(RouteWith(R"({"max_chunks":100})").max_chunks == 20, "large values are capped");
    Require(RouteWith(R"({"max_chunks":-3})").max_chunks == 6, "non-positive values fall back to 6");
    Require(RouteWith(R"({"max_chunks":0})").max_chunks == 6, "zero falls back to 6");
    Require(RouteWith(R"({"max_chunks":7.9})").max_chunks == 7, "floats are truncated");
    Require(RouteWith(R"({"max_chunks":null})").max_chunks == 6, "null falls back to 6");
}

void ScenarioUnknownValues() {
    campus_rag::tests::Log("scenario: unknown values");
    const auto plan = RouteWith(R"({"query_type":"weather","retrieval_mode":"telepathy","topic":42})");
    Require(plan.query_type == QueryType::kGeneral, "unknown query type becomes general");
    Require(plan.retrieval_mode == RetrievalMode::kHybrid, "unknown retrieval mode becomes hybrid");
    Require(plan.topic.empty(), "non-string topic becomes empty");

    const auto sparse = RouteWith(R"({"query_type":"admin_process","retrieval_mode":"sparse_only"})");
    Require(sparse.retrieval_mode == RetrievalMode::kSparseOnly, "known retrieval mode is kept");
}

void ScenarioFailuresFallBack() {
    campus_rag::tests::Log("scenario: failures fall back");
    const auto garbage = RouteWith("I cannot classify that.", "accommodation deadlines");
    Require(garbage.query_type == QueryType::kGeneral, "garbage output gives the default plan");
    Require(garbage.topic == "accommodation", "default plan still picks up keywords");

    const auto array = RouteWith("[1, 2, 3]");
    Require(array.query_type == QueryType::kGeneral && array.max_chunks == 6, "non-object JSON gives the default plan");

    auto llm = std::make_shared<campus_rag::tests::FakeLlmClient>();
    llm->set_fail(true);
    campus_rag::Router router(llm);
    const auto failed = router.route("CSIS office hours");
    Require(failed.query_type == QueryType::kGeneral && failed.topic == "csis", "service failure gives the default plan");
}

void ScenarioParsePlanThrows() {
    campus_rag::tests::Log("scenario: parse_plan throws");
    campus_rag::Router router(nullptr);
    bool threw = false;
    try {
        router.parse_plan("   ");
    } catch (const campus_rag::RouterParseError&) {
        threw = true;
    }
    Require(threw, "empty output is a parse error");

    threw = false;
    try {
        router.parse_plan("{not json}");
    } catch (const campus_rag::RouterParseError&) {
        threw = true;
    }
    Require(threw, "broken object is a parse error");

    const auto plan = router.parse_plan(R"({"query_type":"chitchat"})");
    Require(plan.query_type == QueryType::kChitchat, "parse_plan alone applies no domain defaults");
    Require(campus_rag::is_conversational(plan.query_type), "chitchat is conversational");
}

}  // namespace

int main() {
    try {
        campus_rag::tests::ConfigureLibraryLogging();
        campus_rag::tests::Log("router_test: start");
        ScenarioNoClientUsesDefault();
        ScenarioRequestShape();
        ScenarioDomainDefaults();
        ScenarioProseWrappedJson();
        ScenarioLongProseReply();
        ScenarioMaxChunksCoercion();
        ScenarioUnknownValues();
        ScenarioFailuresFallBack();
        ScenarioParsePlanThrows();
        campus_rag::tests::Log("router_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        campus_rag::tests::LogError(ex.what());
        return EXIT_FAILURE;
    }
}
