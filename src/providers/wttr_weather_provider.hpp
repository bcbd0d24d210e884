#pragma once

#include <string>
#include "providers/tool_provider.hpp"

namespace relay::providers {

// Current conditions from wttr.in's JSON format (format=j1).
class WttrWeatherProvider : public WeatherProvider {
public:
    explicit WttrWeatherProvider(std::string base_url = "https://wttr.in",
                                 int timeout_seconds = 5);

    core::errors::Result<nlohmann::json> lookup(const protocol::WeatherInput& input) override;

private:
    std::string base_url_;
    int timeout_seconds_;
};

// Maps a format=j1 document to {location, temperature, condition, humidity,
// wind, feels_like}.
core::errors::Result<nlohmann::json> map_wttr_response(const nlohmann::json& document);

}  // namespace relay::providers
