#include <iostream>
#include <string>
#include <vector>
#include "app/cli_parser.hpp"
#include "core/config/settings.hpp"
#include "core/errors/relay_errors.hpp"
#include "core/logging/event_sink.hpp"
#include "core/logging/logger.hpp"
#include "llm/completion.hpp"
#include "pipeline/routing_pipeline.hpp"
#include "session/client_session.hpp"
#include "session/server_process.hpp"

namespace {

const std::vector<std::string> kDemoPrompts = {
    "What's the weather in Mumbai?",
    "Tell me about the weather in Delhi",
    "Search for latest news about AI",
    "What is Model Context Protocol?"};

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Tag this execution's log lines with a fresh session id
    relay::core::logging::Logger::get().begin_session();

    // 2. Parse CLI input and return normalized input errors
    RELAY_LOG_INFO("relay_agent: Bootstrapping...");
    auto parsed = relay::app::cli::parse_and_validate(argc, argv);
    if (relay::core::errors::is_error(parsed)) {
        const auto& err = relay::core::errors::get_error(parsed);
        RELAY_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            RELAY_LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& req = relay::core::errors::get_value(parsed);

    // 3. Load configuration: process environment first, then the .env file
    auto dotenv = relay::core::config::load_dotenv_file(req.env_file);
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
    relay::core::config::Settings settings = relay::core::errors::get_value(loaded);
    if (req.server_command) settings.server_command = req.server_command.value();
    if (req.read_timeout_ms) settings.read_timeout_ms = req.read_timeout_ms.value();
    if (req.verbose) settings.log_level = relay::core::logging::LogLevel::DEBUG;
    relay::core::logging::Logger::get().set_min_level(settings.log_level);

    auto validated = relay::core::config::validate_agent_settings(settings);
    if (relay::core::errors::is_error(validated)) {
        const auto& err = relay::core::errors::get_error(validated);
        RELAY_LOG_ERROR("Configuration error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            RELAY_LOG_INFO("Hint: " + err.hint);
        }
        return 3;
    }

    // 4. Launch the tool server and wait for its startup banner
    relay::session::ServerProcess server;
    relay::session::ServerLaunch launch;
    launch.command = settings.server_command;
    launch.ready_marker = relay::core::config::kServerReadyMarker;
    launch.read_timeout_ms = settings.read_timeout_ms;
    auto started = server.start(launch);
    if (relay::core::errors::is_error(started)) {
        const auto& err = relay::core::errors::get_error(started);
        RELAY_LOG_ERROR("Failed to start tool server [" + err.code + "]: " + err.message);
        return 4;
    }
    if (!server.wait_until_ready(settings.startup_timeout_ms)) {
        RELAY_LOG_WARN("Tool server did not report readiness within " +
                       std::to_string(settings.startup_timeout_ms) + " ms, continuing");
    }

    // 5. Handshake
    auto channel = server.transport();
    if (relay::core::errors::is_error(channel)) {
        const auto& err = relay::core::errors::get_error(channel);
        RELAY_LOG_ERROR("Tool server channel unavailable [" + err.code + "]: " + err.message);
        return 4;
    }
    relay::session::ClientSession session(*relay::core::errors::get_value(channel));
    auto initialized = session.initialize();
    if (relay::core::errors::is_error(initialized)) {
        const auto& err = relay::core::errors::get_error(initialized);
        RELAY_LOG_ERROR("Handshake failed [" + err.code + "]: " + err.message);
        return 4;
    }
    const auto& init_result = relay::core::errors::get_value(initialized);
    if (init_result.is_object() && init_result.contains("serverInfo")) {
        RELAY_LOG_INFO("Connected to tool server: " +
                       init_result["serverInfo"].dump(
                           -1, ' ', false, nlohmann::json::error_handler_t::replace));
    }

    // 6. Run the pipeline for every requested turn
    relay::llm::OpenAiConfig openai;
    openai.api_key = settings.openai_api_key;
    openai.model = settings.openai_model;
    openai.base_url = settings.openai_base_url;
    relay::llm::OpenAiCompletion completion(openai);
    relay::pipeline::RoutingPipeline pipeline(completion, session);

    std::vector<std::string> prompts;
    if (req.command == relay::protocol::AgentCommand::Ask) {
        prompts.push_back(req.message.value());
    } else {
        prompts = kDemoPrompts;
    }

    for (const auto& prompt : prompts) {
        std::cout << "\n" << std::string(80, '=') << "\n"
                  << "USER: " << prompt << "\n"
                  << std::string(80, '=') << std::endl;

        auto turn = pipeline.run(prompt);
        if (relay::core::errors::is_error(turn)) {
            const auto& err = relay::core::errors::get_error(turn);
            RELAY_LOG_ERROR("Turn failed [" + err.code + "]: " + err.message);
            return 5;
        }
        std::cout << "AGENT: " << relay::core::errors::get_value(turn).result.value_or("")
                  << "\n" << std::endl;

        if (session.state() == relay::session::HandshakeState::Failed) {
            RELAY_LOG_ERROR("Tool server is gone, ending the session.");
            return 6;
        }
    }

    server.stop();
    return 0;
}
