#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/relay_errors.hpp"
#include "core/logging/event_sink.hpp"
#include "transport/line_transport.hpp"

namespace relay::rpc {

enum class ReplyKind {
    Result,  // payload is the "result" value
    Error,   // payload is the "error" object
    Raw      // payload is the unparsable response line as a JSON string
};

struct RpcReply {
    std::string request_id;
    ReplyKind kind = ReplyKind::Result;
    nlohmann::json payload;
};

struct CorrelatorOptions {
    // Fail with "malformed_response" instead of degrading to a Raw reply.
    bool strict_parsing = false;
};

std::string to_string(ReplyKind kind);

// Folds a reply into the payload handed to the pipeline: the result itself,
// {"error": <error object>} for error replies, or the raw line.
nlohmann::json to_tool_payload(const RpcReply& reply);

// Strict one-shot correlation: every call writes one request and consumes
// exactly one response line before returning. At most one request is ever
// outstanding, so there is nothing to reorder.
class RpcCorrelator {
public:
    explicit RpcCorrelator(transport::LineTransport& transport,
                           core::logging::EventSink& events = core::logging::default_event_sink(),
                           CorrelatorOptions options = {});

    core::errors::Result<RpcReply> call(const std::string& method,
                                        const std::optional<nlohmann::json>& params = std::nullopt);

    core::errors::Result<std::size_t> notify(
        const std::string& method, const std::optional<nlohmann::json>& params = std::nullopt);

    std::uint64_t last_request_id() const { return last_request_id_; }

private:
    std::string next_request_id();

    transport::LineTransport& transport_;
    core::logging::EventSink& events_;
    CorrelatorOptions options_;
    std::uint64_t last_request_id_ = 0;
};

}  // namespace relay::rpc
