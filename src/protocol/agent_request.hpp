#pragma once
#include <string>
#include <filesystem>
#include <cstdint>
#include <optional>

namespace relay::protocol {

    enum class AgentCommand {
        Ask,    // Answer one message
        Demo    // Run the built-in sample prompts
    };

    // Represents the validated user input required to start the agent
    struct AgentRequest {
        AgentCommand command = AgentCommand::Ask;
        std::optional<std::string> message;
        std::optional<std::string> server_command;   // Overrides RELAY_SERVER_COMMAND
        std::filesystem::path env_file = ".env";
        std::optional<std::uint32_t> read_timeout_ms; // Overrides RELAY_READ_TIMEOUT_MS
        bool verbose = false;
    };

} // namespace relay::protocol
