#pragma once
#include <memory>
#include <string>
#include "KeyManager.hpp"
#include "errors.hpp"

namespace campus_rag {

struct CompletionRequest {
    std::string system_prompt;
    std::string user_prompt;
    double temperature = 0.0;
    bool json_response = false;
};

// Text-completion service. complete() throws ModelServiceUnavailable on any failure.
class LlmClient {
public:
    virtual ~LlmClient() = default;
    virtual std::string complete(const CompletionRequest& request) = 0;
    virtual std::string model_name() const = 0;
};

// OpenAI-compatible /chat/completions endpoint.
class OpenAiChatClient final : public LlmClient {
public:
    OpenAiChatClient(std::shared_ptr<KeyManager> key_manager,
                     std::string base_url,
                     std::string model,
                     int timeout_ms);

    std::string complete(const CompletionRequest& request) override;
    std::string model_name() const override { return model_; }

private:
    std::shared_ptr<KeyManager> key_manager_;
    std::string base_url_;
    std::string model_;
    int timeout_ms_;
};

// Returns nullptr when the key pool is empty, so callers take their fallback path.
std::shared_ptr<LlmClient> make_llm_client(std::shared_ptr<KeyManager> key_manager,
                                           const std::string& base_url,
                                           const std::string& model,
                                           int timeout_ms);

} // namespace campus_rag
