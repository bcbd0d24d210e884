#include "llm/completion.hpp"

#include <utility>
#include <httplib.h>
#include "core/logging/logger.hpp"
#include "providers/http_support.hpp"

namespace relay::llm {

using core::errors::ErrorCategory;
using core::errors::RelayError;
using nlohmann::json;

OpenAiCompletion::OpenAiCompletion(OpenAiConfig config) : config_(std::move(config)) {}

json build_chat_request(const CompletionRequest& request, const std::string& model) {
    json body;
    body["model"] = model;
    body["messages"] = json::array({{{"role", "system"}, {"content", request.system_prompt}},
                                    {{"role", "user"}, {"content", request.user_prompt}}});
    body["temperature"] = request.temperature;
    if (request.response_format == ResponseFormat::JsonObject) {
        body["response_format"] = {{"type", "json_object"}};
    }
    return body;
}

core::errors::Result<std::string> extract_completion_text(const json& response) {
    if (!response.is_object()) {
        return RelayError{ErrorCategory::Provider, "Completion response is not an object.",
                          "completion_bad_response"};
    }
    auto choices = response.find("choices");
    if (choices == response.end() || !choices->is_array() || choices->empty() ||
        !(*choices)[0].is_object()) {
        return RelayError{ErrorCategory::Provider, "Completion response has no choices.",
                          "completion_bad_response"};
    }
    const json& choice = (*choices)[0];
    auto message = choice.find("message");
    if (message == choice.end() || !message->is_object()) {
        return RelayError{ErrorCategory::Provider, "Completion choice has no message.",
                          "completion_bad_response"};
    }
    auto content = message->find("content");
    if (content == message->end() || !content->is_string()) {
        return RelayError{ErrorCategory::Provider, "Completion message has no text content.",
                          "completion_bad_response"};
    }
    return content->get<std::string>();
}

core::errors::Result<std::string> OpenAiCompletion::complete(const CompletionRequest& request) {
    if (!providers::has_http_scheme(config_.base_url)) {
        return RelayError{ErrorCategory::Provider,
                          "Unsupported completion base URL: " + config_.base_url,
                          "completion_unavailable"};
    }
    httplib::Client client(config_.base_url);
    if (!client.is_valid()) {
        return RelayError{ErrorCategory::Provider,
                          "Unsupported completion base URL: " + config_.base_url,
                          "completion_unavailable"};
    }
    client.set_bearer_token_auth(config_.api_key);
    client.set_connection_timeout(config_.timeout_seconds);
    client.set_read_timeout(config_.timeout_seconds);

    const std::string body = build_chat_request(request, config_.model)
                                  .dump(-1, ' ', false, json::error_handler_t::replace);
    auto response = client.Post("/v1/chat/completions", body, "application/json");
    if (!response) {
        return RelayError{ErrorCategory::Provider,
                          "Completion request failed: " + httplib::to_string(response.error()),
                          "completion_unavailable"};
    }

    const json document = json::parse(response->body, nullptr, false);
    if (response->status != 200) {
        std::string detail = std::to_string(response->status);
        if (!document.is_discarded() && document.contains("error") &&
            document["error"].is_object() && document["error"].contains("message") &&
            document["error"]["message"].is_string()) {
            detail += " " + document["error"]["message"].get<std::string>();
        }
        RELAY_LOG_WARN("OpenAiCompletion: HTTP " + detail);
        return RelayError{ErrorCategory::Provider, "Completion API error: " + detail,
                          "completion_http_status"};
    }
    if (document.is_discarded()) {
        return RelayError{ErrorCategory::Provider, "Completion response body is not JSON.",
                          "completion_bad_response"};
    }
    return extract_completion_text(document);
}

}  // namespace relay::llm
