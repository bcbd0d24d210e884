#pragma once

#include <nlohmann/json.hpp>
#include "core/errors/relay_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace relay::providers {

// Each provider performs its own outbound call with its own timeout and maps
// its own failures to RelayError{Provider, ...}.
class WeatherProvider {
public:
    virtual ~WeatherProvider() = default;
    virtual core::errors::Result<nlohmann::json> lookup(const protocol::WeatherInput& input) = 0;
};

class WebSearchProvider {
public:
    virtual ~WebSearchProvider() = default;
    virtual core::errors::Result<nlohmann::json> search(const protocol::WebSearchInput& input) = 0;
};

}  // namespace relay::providers
