#include <iostream>
#include <string>
#include "core/config/settings.hpp"
#include "core/errors/relay_errors.hpp"
#include "core/logging/logger.hpp"
#include "providers/serper_search_provider.hpp"
#include "providers/wttr_weather_provider.hpp"
#include "server/builtin_tools.hpp"
#include "server/tool_registry.hpp"
#include "server/tool_server.hpp"
#include "transport/stream_transport.hpp"

int main() {
    // stdout carries protocol traffic only; every diagnostic goes to stderr.
    relay::core::logging::Logger::get().set_stream(std::cerr);
    relay::core::logging::Logger::get().begin_session();

    auto dotenv = relay::core::config::load_dotenv_file(".env");
    if (relay::core::errors::is_error(dotenv)) {
        const auto& err = relay::core::errors::get_error(dotenv);
        RELAY_LOG_ERROR("Configuration error [" + err.code + "]: " + err.message);
        return 3;
    }
    auto loaded = relay::core::config::load_settings(relay::core::config::process_env_lookup(),
                                                     relay::core::errors::get_value(dotenv));
    if (relay::core::errors::is_error(loaded)) {
        const auto& err = relay::core::errors::get_error(loaded);
        RELAY_LOG_ERROR("Configuration error [" + err.code + "]: " + err.message);
        return 3;
    }
    const auto& settings = relay::core::errors::get_value(loaded);
    relay::core::logging::Logger::get().set_min_level(settings.log_level);
    if (settings.serper_api_key.empty()) {
        RELAY_LOG_WARN("SERPER_API_KEY is not set, web_search will report an error");
    }

    relay::providers::WttrWeatherProvider weather(settings.weather_base_url);
    relay::providers::SerperSearchProvider search(settings.serper_api_key,
                                                  settings.serper_base_url);

    relay::server::ToolRegistry registry;
    auto registered = relay::server::register_builtin_tools(registry, weather, search);
    if (relay::core::errors::is_error(registered)) {
        const auto& err = relay::core::errors::get_error(registered);
        RELAY_LOG_ERROR("Failed to register tools [" + err.code + "]: " + err.message);
        return 1;
    }

    relay::server::ToolServer server(registry, relay::server::ServerInfo{});
    relay::transport::StreamTransport transport(std::cin, std::cout);

    // The client waits for this banner before it starts the handshake.
    std::cerr << relay::core::config::kServerReadyMarker << " ("
              << relay::core::errors::get_value(registered) << " tools)" << std::endl;

    auto served = server.run(transport);
    if (relay::core::errors::is_error(served)) {
        const auto& err = relay::core::errors::get_error(served);
        RELAY_LOG_ERROR("Transport failure [" + err.code + "]: " + err.message);
        return 1;
    }
    return 0;
}
