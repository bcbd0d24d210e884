#include "providers/serper_search_provider.hpp"

#include <utility>
#include <httplib.h>
#include "core/logging/logger.hpp"
#include "providers/http_support.hpp"

namespace relay::providers {

using core::errors::ErrorCategory;
using core::errors::RelayError;
using nlohmann::json;

namespace {

json field_or_null(const json& item, const char* key) {
    auto it = item.find(key);
    if (it == item.end()) {
        return nullptr;
    }
    return *it;
}

}  // namespace

SerperSearchProvider::SerperSearchProvider(std::string api_key, std::string base_url,
                                           const int timeout_seconds)
    : api_key_(std::move(api_key)),
      base_url_(std::move(base_url)),
      timeout_seconds_(timeout_seconds) {}

json map_serper_response(const std::string& query, const json& document) {
    json results = json::array();
    if (document.is_object()) {
        auto organic = document.find("organic");
        if (organic != document.end() && organic->is_array()) {
            for (const auto& item : *organic) {
                if (results.size() >= kMaxSearchResults) {
                    break;
                }
                if (!item.is_object()) {
                    continue;
                }
                results.push_back({{"title", field_or_null(item, "title")},
                                   {"link", field_or_null(item, "link")},
                                   {"snippet", field_or_null(item, "snippet")}});
            }
        }
    }

    json knowledge_graph = nullptr;
    if (document.is_object()) {
        auto knowledge = document.find("knowledgeGraph");
        if (knowledge != document.end() && knowledge->is_object() && !knowledge->empty()) {
            auto description = knowledge->find("description");
            knowledge_graph = (description != knowledge->end()) ? *description : json("");
        }
    }

    return json{{"query", query}, {"results", results}, {"knowledge_graph", knowledge_graph}};
}

core::errors::Result<json> SerperSearchProvider::search(const protocol::WebSearchInput& input) {
    if (api_key_.empty()) {
        return RelayError{ErrorCategory::Provider, "SERPER_API_KEY not configured",
                          "search_not_configured"};
    }

    if (!has_http_scheme(base_url_)) {
        return RelayError{ErrorCategory::Provider,
                          "Web search error: unsupported base URL " + base_url_,
                          "search_unavailable"};
    }
    httplib::Client client(base_url_);
    if (!client.is_valid()) {
        return RelayError{ErrorCategory::Provider,
                          "Web search error: unsupported base URL " + base_url_,
                          "search_unavailable"};
    }
    client.set_connection_timeout(timeout_seconds_);
    client.set_read_timeout(timeout_seconds_);

    const httplib::Headers headers = {{"X-API-KEY", api_key_}};
    const json payload = {{"q", input.query}, {"num", kMaxSearchResults}};
    RELAY_LOG_DEBUG("SerperSearchProvider: POST " + base_url_ + "/search");
    const std::string body = payload.dump(-1, ' ', false, json::error_handler_t::replace);
    auto response = client.Post("/search", headers, body, "application/json");
    if (!response) {
        return RelayError{ErrorCategory::Provider,
                          "Web search error: " + httplib::to_string(response.error()),
                          "search_unavailable"};
    }
    if (response->status != 200) {
        return RelayError{ErrorCategory::Provider,
                          "Serper API error: " + std::to_string(response->status),
                          "search_http_status"};
    }

    const json document = json::parse(response->body, nullptr, false);
    if (document.is_discarded()) {
        return RelayError{ErrorCategory::Provider, "Web search error: response body is not JSON",
                          "search_bad_response"};
    }
    return map_serper_response(input.query, document);
}

}  // namespace relay::providers
