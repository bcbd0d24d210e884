#include "session/client_session.hpp"

#include <utility>
#include "core/config/settings.hpp"
#include "core/logging/logger.hpp"

namespace relay::session {

using core::errors::ErrorCategory;
using core::errors::RelayError;
using nlohmann::json;

std::string to_string(const HandshakeState state) {
    switch (state) {
        case HandshakeState::Unstarted:
            return "unstarted";
        case HandshakeState::Initializing:
            return "initializing";
        case HandshakeState::Ready:
            return "ready";
        case HandshakeState::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

ClientSession::ClientSession(transport::LineTransport& transport,
                             core::logging::EventSink& events, ClientInfo info,
                             rpc::CorrelatorOptions options)
    : correlator_(transport, events, options), events_(events), info_(std::move(info)) {
    if (info_.version.empty()) {
        info_.version = core::config::kRelayVersion;
    }
    if (info_.protocol_version.empty()) {
        info_.protocol_version = core::config::kProtocolVersion;
    }
}

void ClientSession::transition(const HandshakeState next) {
    const std::string prev = to_string(state_);
    state_ = next;
    RELAY_LOG_DEBUG("ClientSession: transition " + prev + " -> " + to_string(next));
    events_.emit(protocol::HandshakeTransitionEvent{prev, to_string(next)});
}

core::errors::Result<json> ClientSession::initialize() {
    if (state_ != HandshakeState::Unstarted) {
        return RelayError{ErrorCategory::Protocol,
                          "Handshake already attempted (state " + to_string(state_) + ").",
                          "invalid_state_transition"};
    }
    transition(HandshakeState::Initializing);

    json params;
    params["protocolVersion"] = info_.protocol_version;
    params["capabilities"] = json::object();
    params["clientInfo"] = {{"name", info_.name}, {"version", info_.version}};

    auto reply_result = correlator_.call("initialize", params);
    if (core::errors::is_error(reply_result)) {
        transition(HandshakeState::Failed);
        return core::errors::get_error(reply_result);
    }
    const auto& reply = core::errors::get_value(reply_result);
    if (reply.kind != rpc::ReplyKind::Result) {
        transition(HandshakeState::Failed);
        return RelayError{ErrorCategory::Protocol,
                          "initialize was rejected: " +
                              reply.payload.dump(-1, ' ', false, json::error_handler_t::replace),
                          "handshake_rejected"};
    }

    auto notified = correlator_.notify("initialized");
    if (core::errors::is_error(notified)) {
        transition(HandshakeState::Failed);
        return core::errors::get_error(notified);
    }

    transition(HandshakeState::Ready);
    return reply.payload;
}

core::errors::Result<HandshakeState> ClientSession::require_ready(
    const std::string& operation) const {
    if (state_ != HandshakeState::Ready) {
        return RelayError{ErrorCategory::Protocol,
                          operation + " requires a completed handshake (state " +
                              to_string(state_) + ").",
                          "session_not_ready"};
    }
    return state_;
}

core::errors::Result<json> ClientSession::list_tools() {
    auto ready = require_ready("tools/list");
    if (core::errors::is_error(ready)) {
        return core::errors::get_error(ready);
    }

    auto reply = correlator_.call("tools/list");
    if (core::errors::is_error(reply)) {
        const auto& err = core::errors::get_error(reply);
        if (err.category == ErrorCategory::Transport) {
            transition(HandshakeState::Failed);
        }
        return err;
    }
    return rpc::to_tool_payload(core::errors::get_value(reply));
}

core::errors::Result<json> ClientSession::call_tool(const protocol::ToolCall& call) {
    auto ready = require_ready("tools/call " + call.name);
    if (core::errors::is_error(ready)) {
        return core::errors::get_error(ready);
    }

    json params;
    params["name"] = call.name;
    params["arguments"] = {{protocol::kToolInputKey, call.arguments}};

    auto reply = correlator_.call("tools/call", params);
    if (core::errors::is_error(reply)) {
        const auto& err = core::errors::get_error(reply);
        if (err.category == ErrorCategory::Transport) {
            RELAY_LOG_ERROR("ClientSession: lost the tool server: " + err.message);
            transition(HandshakeState::Failed);
        }
        return err;
    }
    return rpc::to_tool_payload(core::errors::get_value(reply));
}

}  // namespace relay::session
