#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace relay::protocol {

    inline constexpr const char* kWeatherToolName = "get_weather";
    inline constexpr const char* kWebSearchToolName = "web_search";

    // Every tool schema expects a single top-level "input" field.
    inline constexpr const char* kToolInputKey = "input";

    // How the pipeline asks the tool server to do something
    struct ToolCall {
        std::string name;           // e.g., "get_weather", "web_search"
        nlohmann::json arguments;   // Unwrapped argument mapping
    };

    // Typed inputs, built only from payloads that passed schema validation.
    struct WeatherInput {
        std::string city;
    };

    struct WebSearchInput {
        std::string query;
    };

} // namespace relay::protocol
