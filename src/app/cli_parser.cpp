#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>

namespace relay::app::cli {

    using namespace relay::core::errors;
    using relay::protocol::AgentCommand;
    using relay::protocol::AgentRequest;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> message;
        std::optional<std::string> server_cmd;
        std::optional<std::string> env_file;
        std::optional<std::string> read_timeout_ms;
        bool verbose = false;
    };

    Result<AgentRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return RelayError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: relay_agent ask --message \"...\""};
        }

        std::string command = argv[1];
        AgentRequest req;
        if (command == "ask") {
            req.command = AgentCommand::Ask;
        } else if (command == "demo") {
            req.command = AgentCommand::Demo;
        } else {
            return RelayError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Supported commands are 'ask' and 'demo'."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and the command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--message") {
                if (i + 1 < args.size()) raw.message = args[++i];
                else return RelayError{ErrorCategory::Input, "Missing value for --message", "missing_value"};
            } else if (args[i] == "--server-cmd") {
                if (i + 1 < args.size()) raw.server_cmd = args[++i];
                else return RelayError{ErrorCategory::Input, "Missing value for --server-cmd", "missing_value"};
            } else if (args[i] == "--env-file") {
                if (i + 1 < args.size()) raw.env_file = args[++i];
                else return RelayError{ErrorCategory::Input, "Missing value for --env-file", "missing_value"};
            } else if (args[i] == "--read-timeout-ms") {
                if (i + 1 < args.size()) raw.read_timeout_ms = args[++i];
                else return RelayError{ErrorCategory::Input, "Missing value for --read-timeout-ms", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return RelayError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        req.verbose = raw.verbose;

        if (req.command == AgentCommand::Ask) {
            if (!raw.message.has_value()) {
                return RelayError{ErrorCategory::Input, "The ask command requires --message", "missing_required_flag"};
            }
            if (raw.message->find_first_not_of(" \t\r\n") == std::string::npos) {
                return RelayError{ErrorCategory::Input, "--message cannot be empty", "empty_message"};
            }
            req.message = raw.message.value();
        } else if (raw.message.has_value()) {
            return RelayError{ErrorCategory::Input, "The demo command does not take --message", "conflicting_flags"};
        }

        if (raw.server_cmd) {
            if (raw.server_cmd->empty()) {
                return RelayError{ErrorCategory::Input, "--server-cmd cannot be empty", "invalid_path"};
            }
            req.server_command = raw.server_cmd.value();
        }

        if (raw.env_file) req.env_file = std::filesystem::path(raw.env_file.value());

        // Exception-free integer parsing
        if (raw.read_timeout_ms) {
            uint32_t timeout = 0;
            const char* begin = raw.read_timeout_ms->data();
            const char* end = raw.read_timeout_ms->data() + raw.read_timeout_ms->size();
            auto [ptr, ec] = std::from_chars(begin, end, timeout);
            if (ec != std::errc() || ptr != end) {
                return RelayError{ErrorCategory::Input, "Invalid number for --read-timeout-ms", "invalid_integer", "Provide a non-negative integer."};
            }
            if (timeout > 600000) {
                return RelayError{ErrorCategory::Input, "--read-timeout-ms out of bounds", "bounds_error", "Must be between 0 and 600000."};
            }
            req.read_timeout_ms = timeout;
        }

        return req;
    }

} // namespace relay::app::cli
