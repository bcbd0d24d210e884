#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/relay_errors.hpp"
#include "core/logging/event_sink.hpp"
#include "protocol/tool_contract.hpp"
#include "rpc/correlator.hpp"
#include "transport/line_transport.hpp"

namespace relay::session {

enum class HandshakeState {
    Unstarted,
    Initializing,
    Ready,
    Failed
};

struct ClientInfo {
    std::string name = "relay-agent";
    std::string version;
    std::string protocol_version;
};

std::string to_string(HandshakeState state);

// One client-server session. Tool calls are only issued once the
// initialize / initialized exchange has completed.
class ClientSession {
public:
    explicit ClientSession(transport::LineTransport& transport,
                           core::logging::EventSink& events = core::logging::default_event_sink(),
                           ClientInfo info = {}, rpc::CorrelatorOptions options = {});

    // Unstarted -> Initializing -> Ready. Returns the server's initialize
    // result. Any failure leaves the session Failed.
    core::errors::Result<nlohmann::json> initialize();

    core::errors::Result<nlohmann::json> list_tools();

    // Returns the tool payload: the result, or an error-shaped payload for an
    // error reply, or the raw line for an unparsable one. Fails only when the
    // session is not Ready or the transport is gone.
    core::errors::Result<nlohmann::json> call_tool(const protocol::ToolCall& call);

    HandshakeState state() const { return state_; }
    std::uint64_t last_request_id() const { return correlator_.last_request_id(); }

private:
    core::errors::Result<HandshakeState> require_ready(const std::string& operation) const;
    void transition(HandshakeState next);

    rpc::RpcCorrelator correlator_;
    core::logging::EventSink& events_;
    ClientInfo info_;
    HandshakeState state_ = HandshakeState::Unstarted;
};

}  // namespace relay::session
