#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include "core/errors/relay_errors.hpp"
#include "protocol/message_contract.hpp"
#include "server/tool_registry.hpp"
#include "transport/line_transport.hpp"

namespace relay::server {

enum class ServerState {
    AwaitingInitialize,
    AwaitingInitialized,
    Ready
};

struct ServerInfo {
    std::string name = "relay-tool-server";
    std::string version;
};

std::string to_string(ServerState state);

// Maps a registry failure onto a JSON-RPC error object.
protocol::RpcError to_rpc_error(const core::errors::RelayError& error);

class ToolServer {
public:
    ToolServer(const ToolRegistry& registry, ServerInfo info);

    // Requests get exactly one response, notifications none.
    std::optional<protocol::Message> handle_message(const protocol::Message& message);

    // Same as handle_message for a raw protocol line. Unparsable input gets a
    // parse-error response with a null id.
    std::optional<protocol::Message> handle_line(const std::string& line);

    // Serves until the peer closes the stream. Returns the number of lines
    // handled; fails only when the transport itself fails.
    core::errors::Result<std::size_t> run(transport::LineTransport& transport);

    ServerState state() const { return state_; }

private:
    protocol::Message handle_request(const protocol::Message& request);
    void handle_notification(const protocol::Message& notification);
    protocol::Message handle_initialize(const protocol::Message& request);
    protocol::Message handle_tools_call(const protocol::Message& request);

    const ToolRegistry& registry_;
    ServerInfo info_;
    ServerState state_ = ServerState::AwaitingInitialize;
};

}  // namespace relay::server
