#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/relay_errors.hpp"

namespace relay::llm {

enum class ResponseFormat {
    Text,
    JsonObject
};

struct CompletionRequest {
    std::string system_prompt;
    std::string user_prompt;
    ResponseFormat response_format = ResponseFormat::Text;
    double temperature = 0.7;
};

// Abstract language-model text generation.
class Completion {
public:
    virtual ~Completion() = default;
    virtual core::errors::Result<std::string> complete(const CompletionRequest& request) = 0;
};

struct OpenAiConfig {
    std::string api_key;
    std::string model = "gpt-4o-mini";
    std::string base_url = "https://api.openai.com";
    int timeout_seconds = 60;
};

class OpenAiCompletion : public Completion {
public:
    explicit OpenAiCompletion(OpenAiConfig config);

    core::errors::Result<std::string> complete(const CompletionRequest& request) override;

private:
    OpenAiConfig config_;
};

nlohmann::json build_chat_request(const CompletionRequest& request, const std::string& model);

// Pulls choices[0].message.content out of a chat completions response.
core::errors::Result<std::string> extract_completion_text(const nlohmann::json& response);

}  // namespace relay::llm
