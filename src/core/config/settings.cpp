#include "core/config/settings.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

namespace relay::core::config {

using errors::ErrorCategory;
using errors::RelayError;

namespace {

std::string trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r");
    return value.substr(begin, end - begin + 1);
}

std::optional<std::string> lookup(const EnvLookup& env, const DotenvMap& dotenv,
                                  const std::string& key) {
    if (env) {
        auto value = env(key);
        if (value.has_value()) {
            return value;
        }
    }
    auto it = dotenv.find(key);
    if (it != dotenv.end()) {
        return it->second;
    }
    return std::nullopt;
}

errors::Result<std::uint32_t> parse_uint(const std::string& key,
                                         const std::string& text) {
    std::uint32_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc() || ptr != end) {
        return RelayError{ErrorCategory::Input, "Invalid number for " + key + ": " + text,
                          "invalid_integer", "Provide a non-negative integer."};
    }
    return value;
}

}  // namespace

EnvLookup process_env_lookup() {
    return [](const std::string& key) -> std::optional<std::string> {
        const char* value = std::getenv(key.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

errors::Result<DotenvMap> parse_dotenv(const std::string& text) {
    DotenvMap values;
    std::istringstream in(text);
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            return RelayError{ErrorCategory::Input,
                              "Malformed .env line " + std::to_string(line_no) + ": " + line,
                              "invalid_dotenv", "Expected KEY=VALUE."};
        }

        const std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        } else {
            const auto comment = value.find(" #");
            if (comment != std::string::npos) {
                value = trim(value.substr(0, comment));
            }
        }
        values[key] = value;
    }
    return values;
}

errors::Result<DotenvMap> load_dotenv_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return DotenvMap{};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return RelayError{ErrorCategory::Input, "Failed to open env file: " + path.string(),
                          "env_file_unreadable"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_dotenv(buffer.str());
}

errors::Result<Settings> load_settings(const EnvLookup& env, const DotenvMap& dotenv) {
    Settings settings;

    if (auto v = lookup(env, dotenv, "OPEN_AI_KEY")) settings.openai_api_key = *v;
    if (auto v = lookup(env, dotenv, "SERPER_API_KEY")) settings.serper_api_key = *v;
    if (auto v = lookup(env, dotenv, "RELAY_OPENAI_MODEL")) settings.openai_model = *v;
    if (auto v = lookup(env, dotenv, "RELAY_OPENAI_BASE_URL")) settings.openai_base_url = *v;
    if (auto v = lookup(env, dotenv, "RELAY_WEATHER_BASE_URL")) settings.weather_base_url = *v;
    if (auto v = lookup(env, dotenv, "RELAY_SERPER_BASE_URL")) settings.serper_base_url = *v;
    if (auto v = lookup(env, dotenv, "RELAY_SERVER_COMMAND")) settings.server_command = *v;

    if (auto v = lookup(env, dotenv, "RELAY_READ_TIMEOUT_MS")) {
        auto parsed = parse_uint("RELAY_READ_TIMEOUT_MS", *v);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        settings.read_timeout_ms = errors::get_value(parsed);
    }
    if (auto v = lookup(env, dotenv, "RELAY_STARTUP_TIMEOUT_MS")) {
        auto parsed = parse_uint("RELAY_STARTUP_TIMEOUT_MS", *v);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        settings.startup_timeout_ms = errors::get_value(parsed);
    }
    if (auto v = lookup(env, dotenv, "RELAY_LOG_LEVEL")) {
        auto level = logging::parse_log_level(*v);
        if (!level.has_value()) {
            return RelayError{ErrorCategory::Input, "Unknown log level: " + *v,
                              "invalid_log_level", "Use debug, info, warn or error."};
        }
        settings.log_level = *level;
    }

    return settings;
}

errors::Result<Settings> validate_agent_settings(const Settings& settings) {
    if (settings.openai_api_key.empty()) {
        return RelayError{ErrorCategory::Input, "OPEN_AI_KEY is not configured.",
                          "missing_openai_key",
                          "Export OPEN_AI_KEY or add it to the .env file."};
    }
    if (settings.server_command.empty()) {
        return RelayError{ErrorCategory::Input, "Tool server command is empty.",
                          "missing_server_command"};
    }
    return settings;
}

}  // namespace relay::core::config
