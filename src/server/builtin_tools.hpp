#pragma once

#include "core/errors/relay_errors.hpp"
#include "providers/tool_provider.hpp"
#include "server/tool_registry.hpp"

namespace relay::server {

ToolSchema weather_schema();
ToolSchema web_search_schema();

// Registers get_weather and web_search. The providers must outlive the
// registry.
core::errors::Result<std::size_t> register_builtin_tools(ToolRegistry& registry,
                                                         providers::WeatherProvider& weather,
                                                         providers::WebSearchProvider& search);

}  // namespace relay::server
