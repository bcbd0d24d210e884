#pragma once
#include <string>
#include <variant>

namespace relay::core::errors {

    // 1. Define typed error categories
    enum class ErrorCategory {
        Input,      // E.g., User provided an invalid CLI flag or config value
        Transport,  // E.g., The tool server closed its pipes
        Protocol,   // E.g., A response line was not a valid JSON-RPC message
        Tool,       // E.g., Unknown tool or schema validation failure
        Provider,   // E.g., Weather API or OpenAI timed out
        Internal    // E.g., fork() failed
    };

    // The standardized error payload
    struct RelayError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR a RelayError.
    template <typename T>
    using Result = std::variant<T, RelayError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<RelayError>(result);
    }

    template <typename T>
    const RelayError& get_error(const Result<T>& result) {
        return std::get<RelayError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Transport: return "transport";
            case ErrorCategory::Protocol: return "protocol";
            case ErrorCategory::Tool: return "tool";
            case ErrorCategory::Provider: return "provider";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace relay::core::errors
