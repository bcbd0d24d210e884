#include "providers/wttr_weather_provider.hpp"

#include <optional>
#include <utility>
#include <httplib.h>
#include "core/logging/logger.hpp"
#include "providers/http_support.hpp"

namespace relay::providers {

using core::errors::ErrorCategory;
using core::errors::RelayError;
using nlohmann::json;

namespace {

const json* first_element(const json& node, const char* key) {
    if (!node.is_object()) {
        return nullptr;
    }
    auto it = node.find(key);
    if (it == node.end() || !it->is_array() || it->empty()) {
        return nullptr;
    }
    return &(*it)[0];
}

std::optional<std::string> string_field(const json& node, const char* key) {
    if (!node.is_object()) {
        return std::nullopt;
    }
    auto it = node.find(key);
    if (it == node.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

// wttr.in wraps most labels as [{"value": "..."}].
std::optional<std::string> wrapped_value(const json& node, const char* key) {
    const json* first = first_element(node, key);
    if (first == nullptr) {
        return std::nullopt;
    }
    return string_field(*first, "value");
}

RelayError shape_error(const std::string& detail) {
    return RelayError{ErrorCategory::Provider, "Weather API error: " + detail,
                      "weather_bad_response"};
}

}  // namespace

WttrWeatherProvider::WttrWeatherProvider(std::string base_url, const int timeout_seconds)
    : base_url_(std::move(base_url)), timeout_seconds_(timeout_seconds) {}

core::errors::Result<json> map_wttr_response(const json& document) {
    const json* current = first_element(document, "current_condition");
    const json* area = first_element(document, "nearest_area");
    if (current == nullptr || area == nullptr) {
        return shape_error("response is missing current_condition or nearest_area");
    }

    const auto area_name = wrapped_value(*area, "areaName");
    const auto country = wrapped_value(*area, "country");
    const auto temp_c = string_field(*current, "temp_C");
    const auto temp_f = string_field(*current, "temp_F");
    const auto description = wrapped_value(*current, "weatherDesc");
    const auto humidity = string_field(*current, "humidity");
    const auto wind = string_field(*current, "windspeedKmph");
    const auto feels_like = string_field(*current, "FeelsLikeC");
    if (!area_name || !country || !temp_c || !temp_f || !description || !humidity || !wind ||
        !feels_like) {
        return shape_error("response is missing expected fields");
    }

    json weather;
    weather["location"] = *area_name + ", " + *country;
    weather["temperature"] = *temp_c + "°C / " + *temp_f + "°F";
    weather["condition"] = *description;
    weather["humidity"] = *humidity + "%";
    weather["wind"] = *wind + " km/h";
    weather["feels_like"] = *feels_like + "°C";
    return weather;
}

core::errors::Result<json> WttrWeatherProvider::lookup(const protocol::WeatherInput& input) {
    if (!has_http_scheme(base_url_)) {
        return RelayError{ErrorCategory::Provider,
                          "Weather API error: unsupported base URL " + base_url_,
                          "weather_unavailable"};
    }
    httplib::Client client(base_url_);
    if (!client.is_valid()) {
        return RelayError{ErrorCategory::Provider,
                          "Weather API error: unsupported base URL " + base_url_,
                          "weather_unavailable"};
    }
    client.set_follow_location(true);
    client.set_connection_timeout(timeout_seconds_);
    client.set_read_timeout(timeout_seconds_);

    const std::string path = "/" + url_encode(input.city) + "?format=j1";
    RELAY_LOG_DEBUG("WttrWeatherProvider: GET " + base_url_ + path);
    auto response = client.Get(path);
    if (!response) {
        return RelayError{ErrorCategory::Provider,
                          "Weather API error: " + httplib::to_string(response.error()),
                          "weather_unavailable"};
    }
    if (response->status != 200) {
        return RelayError{ErrorCategory::Provider, "Could not fetch weather for " + input.city,
                          "weather_http_status"};
    }

    const json document = json::parse(response->body, nullptr, false);
    if (document.is_discarded()) {
        return shape_error("response body is not JSON");
    }
    return map_wttr_response(document);
}

}  // namespace relay::providers
