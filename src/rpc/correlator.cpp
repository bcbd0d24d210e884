#include "rpc/correlator.hpp"

#include "core/logging/logger.hpp"
#include "protocol/message_contract.hpp"

namespace relay::rpc {

using core::errors::ErrorCategory;
using core::errors::RelayError;
using protocol::Message;
using protocol::MessageKind;

std::string to_string(const ReplyKind kind) {
    switch (kind) {
        case ReplyKind::Result:
            return "result";
        case ReplyKind::Error:
            return "error";
        case ReplyKind::Raw:
            return "raw";
        default:
            return "unknown";
    }
}

nlohmann::json to_tool_payload(const RpcReply& reply) {
    if (reply.kind == ReplyKind::Error) {
        return nlohmann::json{{"error", reply.payload}};
    }
    return reply.payload;
}

RpcCorrelator::RpcCorrelator(transport::LineTransport& transport,
                             core::logging::EventSink& events, CorrelatorOptions options)
    : transport_(transport), events_(events), options_(options) {}

std::string RpcCorrelator::next_request_id() {
    return std::to_string(++last_request_id_);
}

core::errors::Result<RpcReply> RpcCorrelator::call(
    const std::string& method, const std::optional<nlohmann::json>& params) {
    const std::string request_id = next_request_id();

    auto written = transport_.write_message(protocol::make_request(request_id, method, params));
    if (core::errors::is_error(written)) {
        const auto& err = core::errors::get_error(written);
        return RelayError{ErrorCategory::Transport,
                          "Tool server unavailable: " + err.message, "server_unavailable"};
    }
    events_.emit(protocol::RequestSentEvent{request_id, method});

    auto read = transport_.read_line();
    if (core::errors::is_error(read)) {
        const auto& err = core::errors::get_error(read);
        return RelayError{ErrorCategory::Transport,
                          "Tool server unavailable: " + err.message, "server_unavailable"};
    }
    const auto& line = core::errors::get_value(read);
    if (!line.has_value()) {
        return RelayError{ErrorCategory::Transport,
                          "Tool server unavailable: stream closed while waiting for response " +
                              request_id,
                          "server_unavailable",
                          "The tool server process has probably exited."};
    }

    auto decoded = protocol::decode_line(*line);
    if (core::errors::is_error(decoded)) {
        const auto& err = core::errors::get_error(decoded);
        if (options_.strict_parsing) {
            return RelayError{ErrorCategory::Protocol,
                              "Malformed response to request " + request_id + ": " + err.message,
                              "malformed_response"};
        }
        RELAY_LOG_WARN("RpcCorrelator: response to request " + request_id +
                       " is not a valid message, passing raw text through");
        events_.emit(protocol::ResponseReceivedEvent{request_id, to_string(ReplyKind::Raw)});
        return RpcReply{request_id, ReplyKind::Raw, nlohmann::json(*line)};
    }

    const Message& message = core::errors::get_value(decoded);
    if (protocol::classify(message) != MessageKind::Response) {
        return RelayError{ErrorCategory::Protocol,
                          "Expected a response to request " + request_id + ", got a " +
                              protocol::to_string(protocol::classify(message)),
                          "unexpected_message"};
    }
    if (message.id.has_value() && message.id.value() != request_id) {
        return RelayError{ErrorCategory::Protocol,
                          "Response id " + message.id.value() + " does not match request " +
                              request_id,
                          "correlation_mismatch"};
    }

    RpcReply reply;
    reply.request_id = request_id;
    if (message.error.has_value()) {
        reply.kind = ReplyKind::Error;
        reply.payload = nlohmann::json{{"code", message.error->code},
                                       {"message", message.error->message}};
        if (message.error->data.has_value()) {
            reply.payload["data"] = message.error->data.value();
        }
    } else {
        reply.kind = ReplyKind::Result;
        reply.payload = message.result.value();
    }
    events_.emit(protocol::ResponseReceivedEvent{request_id, to_string(reply.kind)});
    return reply;
}

core::errors::Result<std::size_t> RpcCorrelator::notify(
    const std::string& method, const std::optional<nlohmann::json>& params) {
    auto written = transport_.write_message(protocol::make_notification(method, params));
    if (core::errors::is_error(written)) {
        const auto& err = core::errors::get_error(written);
        return RelayError{ErrorCategory::Transport,
                          "Tool server unavailable: " + err.message, "server_unavailable"};
    }
    events_.emit(protocol::NotificationSentEvent{method});
    return core::errors::get_value(written);
}

}  // namespace relay::rpc
