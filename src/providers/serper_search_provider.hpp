#pragma once

#include <cstddef>
#include <string>
#include "providers/tool_provider.hpp"

namespace relay::providers {

inline constexpr std::size_t kMaxSearchResults = 5;

// Google results through the Serper API.
class SerperSearchProvider : public WebSearchProvider {
public:
    SerperSearchProvider(std::string api_key,
                         std::string base_url = "https://google.serper.dev",
                         int timeout_seconds = 10);

    core::errors::Result<nlohmann::json> search(const protocol::WebSearchInput& input) override;

private:
    std::string api_key_;
    std::string base_url_;
    int timeout_seconds_;
};

// Maps a Serper response to {query, results[{title, link, snippet}],
// knowledge_graph}.
nlohmann::json map_serper_response(const std::string& query, const nlohmann::json& document);

}  // namespace relay::providers
