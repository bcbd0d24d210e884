#include "server/builtin_tools.hpp"

#include <string>
#include <utility>
#include "protocol/tool_contract.hpp"

namespace relay::server {

using nlohmann::json;
using protocol::WeatherInput;
using protocol::WebSearchInput;

ToolSchema weather_schema() {
    return ToolSchema{{FieldSpec{"city", FieldType::String, "City name, e.g. Paris", true}}};
}

ToolSchema web_search_schema() {
    return ToolSchema{{FieldSpec{"query", FieldType::String, "Search query", true}}};
}

core::errors::Result<std::size_t> register_builtin_tools(ToolRegistry& registry,
                                                         providers::WeatherProvider& weather,
                                                         providers::WebSearchProvider& search) {
    ToolDefinition weather_tool;
    weather_tool.name = protocol::kWeatherToolName;
    weather_tool.description = "Get current weather for a city using wttr.in";
    weather_tool.schema = weather_schema();
    weather_tool.handler = [&weather](const json& validated) {
        WeatherInput input;
        input.city = validated.at("city").get<std::string>();
        return weather.lookup(input);
    };
    auto registered = registry.register_tool(std::move(weather_tool));
    if (core::errors::is_error(registered)) {
        return core::errors::get_error(registered);
    }

    ToolDefinition search_tool;
    search_tool.name = protocol::kWebSearchToolName;
    search_tool.description = "Search the web using the Serper API";
    search_tool.schema = web_search_schema();
    search_tool.handler = [&search](const json& validated) {
        WebSearchInput input;
        input.query = validated.at("query").get<std::string>();
        return search.search(input);
    };
    registered = registry.register_tool(std::move(search_tool));
    if (core::errors::is_error(registered)) {
        return core::errors::get_error(registered);
    }

    return registry.size();
}

}  // namespace relay::server
