#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/errors/relay_errors.hpp"
#include "core/logging/logger.hpp"

namespace relay::core::config {

inline constexpr const char* kRelayVersion = "1.0.0";
inline constexpr const char* kProtocolVersion = "2024-11-05";
inline constexpr const char* kServerReadyMarker = "Starting tool server";

struct Settings {
    std::string openai_api_key;
    std::string openai_model = "gpt-4o-mini";
    std::string openai_base_url = "https://api.openai.com";
    std::string serper_api_key;
    std::string weather_base_url = "https://wttr.in";
    std::string serper_base_url = "https://google.serper.dev";
    std::string server_command = "relay_tool_server";
    std::uint32_t read_timeout_ms = 0;  // 0 blocks forever
    std::uint32_t startup_timeout_ms = 2000;
    logging::LogLevel log_level = logging::LogLevel::INFO;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;
using DotenvMap = std::unordered_map<std::string, std::string>;

// Reads variables from the real process environment.
EnvLookup process_env_lookup();

// KEY=VALUE lines; '#' comments, an optional "export " prefix and matching
// single or double quotes around the value are accepted.
errors::Result<DotenvMap> parse_dotenv(const std::string& text);

// A missing file is not an error and yields an empty map.
errors::Result<DotenvMap> load_dotenv_file(const std::filesystem::path& path);

// Process environment wins over the .env file.
errors::Result<Settings> load_settings(const EnvLookup& env, const DotenvMap& dotenv);

errors::Result<Settings> validate_agent_settings(const Settings& settings);

}  // namespace relay::core::config
