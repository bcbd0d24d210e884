#include "server/tool_server.hpp"

#include <utility>
#include "core/config/settings.hpp"
#include "core/logging/logger.hpp"
#include "protocol/message_codec.hpp"

namespace relay::server {

using core::errors::RelayError;
using nlohmann::json;
using protocol::Message;
using protocol::MessageKind;
using protocol::RpcError;

std::string to_string(const ServerState state) {
    switch (state) {
        case ServerState::AwaitingInitialize:
            return "awaiting_initialize";
        case ServerState::AwaitingInitialized:
            return "awaiting_initialized";
        case ServerState::Ready:
            return "ready";
        default:
            return "unknown";
    }
}

RpcError to_rpc_error(const RelayError& error) {
    RpcError rpc_error;
    if (error.code == "tool_not_found") {
        rpc_error.code = protocol::kMethodNotFound;
    } else if (error.code == "invalid_tool_input" || error.code == "invalid_arguments") {
        rpc_error.code = protocol::kInvalidParams;
    } else {
        rpc_error.code = protocol::kToolExecutionError;
    }
    rpc_error.message = error.message;
    rpc_error.data = json{{"code", error.code},
                          {"category", core::errors::to_string(error.category)}};
    return rpc_error;
}

ToolServer::ToolServer(const ToolRegistry& registry, ServerInfo info)
    : registry_(registry), info_(std::move(info)) {
    if (info_.version.empty()) {
        info_.version = core::config::kRelayVersion;
    }
}

std::optional<Message> ToolServer::handle_message(const Message& message) {
    switch (protocol::classify(message)) {
        case MessageKind::Request:
            return handle_request(message);
        case MessageKind::Notification:
            handle_notification(message);
            return std::nullopt;
        case MessageKind::Response:
            RELAY_LOG_WARN("ToolServer: ignoring unsolicited response");
            return std::nullopt;
        default:
            return protocol::make_error(
                message.id, RpcError{protocol::kInvalidRequest, "Invalid Request", std::nullopt});
    }
}

std::optional<Message> ToolServer::handle_line(const std::string& line) {
    auto decoded = protocol::decode_line(line);
    if (core::errors::is_error(decoded)) {
        const auto& err = core::errors::get_error(decoded);
        RELAY_LOG_WARN("ToolServer: " + err.message);
        if (err.code == "parse_error") {
            return protocol::make_error(std::nullopt,
                                        RpcError{protocol::kParseError, "Parse error", std::nullopt});
        }
        return protocol::make_error(std::nullopt,
                                    RpcError{protocol::kInvalidRequest, err.message, std::nullopt});
    }
    return handle_message(core::errors::get_value(decoded));
}

core::errors::Result<std::size_t> ToolServer::run(transport::LineTransport& transport) {
    std::size_t handled = 0;
    while (true) {
        auto read = transport.read_line();
        if (core::errors::is_error(read)) {
            return core::errors::get_error(read);
        }
        const auto& line = core::errors::get_value(read);
        if (!line.has_value()) {
            RELAY_LOG_INFO("ToolServer: input closed after " + std::to_string(handled) +
                           " messages");
            return handled;
        }
        if (line->empty()) {
            continue;
        }

        RELAY_LOG_DEBUG("ToolServer: received " + *line);
        ++handled;
        auto response = handle_line(*line);
        if (!response.has_value()) {
            continue;
        }
        auto written = transport.write_message(*response);
        if (core::errors::is_error(written)) {
            return core::errors::get_error(written);
        }
    }
}

Message ToolServer::handle_request(const Message& request) {
    const std::string& method = request.method.value();
    if (method == "initialize") {
        return handle_initialize(request);
    }
    if (method == "ping") {
        return protocol::make_result(request.id, json::object());
    }
    if (method == "tools/list" || method == "tools/call") {
        if (state_ != ServerState::Ready) {
            RELAY_LOG_WARN("ToolServer: " + method + " rejected in state " + to_string(state_));
            return protocol::make_error(
                request.id,
                RpcError{protocol::kServerNotInitialized, "Server not initialized", std::nullopt});
        }
        if (method == "tools/list") {
            return protocol::make_result(request.id, registry_.describe_tools());
        }
        return handle_tools_call(request);
    }
    return protocol::make_error(
        request.id, RpcError{protocol::kMethodNotFound, "Method not found: " + method, std::nullopt});
}

void ToolServer::handle_notification(const Message& notification) {
    const std::string& method = notification.method.value();
    if (method == "initialized" || method == "notifications/initialized") {
        if (state_ == ServerState::AwaitingInitialized) {
            state_ = ServerState::Ready;
            RELAY_LOG_INFO("ToolServer: handshake complete");
        } else {
            RELAY_LOG_WARN("ToolServer: unexpected " + method + " in state " + to_string(state_));
        }
        return;
    }
    RELAY_LOG_DEBUG("ToolServer: ignoring notification " + method);
}

Message ToolServer::handle_initialize(const Message& request) {
    if (state_ != ServerState::AwaitingInitialize) {
        return protocol::make_error(
            request.id,
            RpcError{protocol::kInvalidRequest, "Session is already initialized", std::nullopt});
    }

    state_ = ServerState::AwaitingInitialized;
    if (request.params.has_value() && request.params->is_object()) {
        auto client = request.params->find("clientInfo");
        if (client != request.params->end() && client->is_object() &&
            client->contains("name") && (*client)["name"].is_string()) {
            RELAY_LOG_INFO("ToolServer: initialize from " + (*client)["name"].get<std::string>());
        }
    }

    json result;
    result["protocolVersion"] = core::config::kProtocolVersion;
    result["capabilities"] = {{"tools", json::object()}};
    result["serverInfo"] = {{"name", info_.name}, {"version", info_.version}};
    return protocol::make_result(request.id, result);
}

Message ToolServer::handle_tools_call(const Message& request) {
    if (!request.params.has_value() || !request.params->is_object() ||
        !request.params->contains("name") || !(*request.params)["name"].is_string()) {
        return protocol::make_error(
            request.id,
            RpcError{protocol::kInvalidParams, "tools/call requires a tool name", std::nullopt});
    }

    const json& params = request.params.value();
    const std::string name = params["name"].get<std::string>();
    const json arguments = params.contains("arguments") ? params["arguments"] : json::object();

    RELAY_LOG_INFO("ToolServer: calling " + name);
    auto outcome = registry_.call(name, arguments);
    if (core::errors::is_error(outcome)) {
        const auto& err = core::errors::get_error(outcome);
        RELAY_LOG_WARN("ToolServer: " + name + " failed [" + err.code + "]: " + err.message);
        return protocol::make_error(request.id, to_rpc_error(err));
    }
    return protocol::make_result(request.id, core::errors::get_value(outcome));
}

}  // namespace relay::server
