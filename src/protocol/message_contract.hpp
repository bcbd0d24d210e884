#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace relay::protocol {

    inline constexpr const char* kJsonRpcVersion = "2.0";

    // Standard JSON-RPC codes plus the server-defined range.
    inline constexpr int kParseError = -32700;
    inline constexpr int kInvalidRequest = -32600;
    inline constexpr int kMethodNotFound = -32601;
    inline constexpr int kInvalidParams = -32602;
    inline constexpr int kInternalError = -32603;
    inline constexpr int kToolExecutionError = -32000;
    inline constexpr int kServerNotInitialized = -32002;

    struct RpcError {
        int code = kInternalError;
        std::string message;
        std::optional<nlohmann::json> data;

        bool operator==(const RpcError& other) const {
            return code == other.code && message == other.message && data == other.data;
        }
    };

    enum class MessageKind {
        Request,
        Response,
        Notification,
        Invalid
    };

    // One line of protocol traffic. Which optional fields are set decides
    // whether it is a request, a response or a notification.
    struct Message {
        std::string jsonrpc = kJsonRpcVersion;
        std::optional<std::string> id;
        std::optional<std::string> method;
        std::optional<nlohmann::json> params;
        std::optional<nlohmann::json> result;
        std::optional<RpcError> error;

        bool operator==(const Message& other) const {
            return jsonrpc == other.jsonrpc && id == other.id && method == other.method &&
                   params == other.params && result == other.result && error == other.error;
        }
    };

    inline MessageKind classify(const Message& message) {
        if (message.jsonrpc != kJsonRpcVersion) {
            return MessageKind::Invalid;
        }
        if (message.method.has_value()) {
            if (message.result.has_value() || message.error.has_value()) {
                return MessageKind::Invalid;
            }
            return message.id.has_value() ? MessageKind::Request : MessageKind::Notification;
        }
        if (message.result.has_value() != message.error.has_value()) {
            return MessageKind::Response;
        }
        return MessageKind::Invalid;
    }

    inline std::string to_string(const MessageKind kind) {
        switch (kind) {
            case MessageKind::Request: return "request";
            case MessageKind::Response: return "response";
            case MessageKind::Notification: return "notification";
            case MessageKind::Invalid: return "invalid";
            default: return "unknown";
        }
    }

    inline Message make_request(std::string id, std::string method,
                                std::optional<nlohmann::json> params = std::nullopt) {
        Message message;
        message.id = std::move(id);
        message.method = std::move(method);
        message.params = std::move(params);
        return message;
    }

    inline Message make_notification(std::string method,
                                     std::optional<nlohmann::json> params = std::nullopt) {
        Message message;
        message.method = std::move(method);
        message.params = std::move(params);
        return message;
    }

    inline Message make_result(std::optional<std::string> id, nlohmann::json result) {
        Message message;
        message.id = std::move(id);
        message.result = std::move(result);
        return message;
    }

    inline Message make_error(std::optional<std::string> id, RpcError error) {
        Message message;
        message.id = std::move(id);
        message.error = std::move(error);
        return message;
    }

} // namespace relay::protocol
