#include "llm/llm_client.hpp"
#include <chrono>
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "http_retry.hpp"

namespace campus_rag {

using json = nlohmann::json;

OpenAiChatClient::OpenAiChatClient(std::shared_ptr<KeyManager> key_manager,
                                   std::string base_url,
                                   std::string model,
                                   int timeout_ms)
    : key_manager_(std::move(key_manager)),
      base_url_(std::move(base_url)),
      model_(std::move(model)),
      timeout_ms_(timeout_ms) {}

std::string OpenAiChatClient::complete(const CompletionRequest& request) {
    json payload = {
        {"model", model_},
        {"messages", json::array({
            {{"role", "system"}, {"content", request.system_prompt}},
            {{"role", "user"}, {"content", request.user_prompt}}
        })},
        {"temperature", request.temperature}
    };
    if (request.json_response) {
        payload["response_format"] = {{"type", "json_object"}};
    }
    const std::string body = payload.dump(-1, ' ', false, json::error_handler_t::replace);

    auto start = std::chrono::steady_clock::now();
    auto r = perform_request_with_retry([&]() {
        return cpr::Post(cpr::Url{base_url_ + "/chat/completions"},
                         cpr::Bearer{key_manager_->get_current_key()},
                         cpr::Body{body},
                         cpr::Header{{"Content-Type", "application/json"}},
                         cpr::Timeout{timeout_ms_});
    }, key_manager_);
    double duration = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

    if (r.error) {
        throw ModelServiceUnavailable("LLM transport error: " + r.error.message);
    }
    if (r.status_code != 200) {
        spdlog::error("LLM API error [{}]: {}", r.status_code, r.text.substr(0, 300));
        throw ModelServiceUnavailable("LLM API returned status " + std::to_string(r.status_code));
    }

    try {
        auto response_json = json::parse(r.text);
        const auto& content = response_json.at("choices").at(0).at("message").at("content");
        if (!content.is_string()) {
            throw ModelServiceUnavailable("LLM response has no text content");
        }
        spdlog::debug("LLM completion in {:.1f} ms ({} chars)", duration, content.get_ref<const std::string&>().size());
        return content.get<std::string>();
    } catch (const json::exception& e) {
        throw ModelServiceUnavailable(std::string("Malformed LLM response: ") + e.what());
    }
}

std::shared_ptr<LlmClient> make_llm_client(std::shared_ptr<KeyManager> key_manager,
                                           const std::string& base_url,
                                           const std::string& model,
                                           int timeout_ms) {
    if (!key_manager || !key_manager->has_keys()) {
        return nullptr;
    }
    return std::make_shared<OpenAiChatClient>(key_manager, base_url,
                                              key_manager->get_preferred_model(model), timeout_ms);
}

} // namespace campus_rag
