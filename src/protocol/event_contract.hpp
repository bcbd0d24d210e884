#pragma once
#include <cstddef>
#include <string>
#include <variant>

namespace relay::protocol {

    // Lifecycle events emitted by the session, correlator and pipeline.
    struct HandshakeTransitionEvent { std::string from; std::string to; };
    struct RequestSentEvent { std::string request_id; std::string method; };
    struct ResponseReceivedEvent { std::string request_id; std::string kind; };
    struct NotificationSentEvent { std::string method; };
    struct RoutingDecisionEvent { std::string tool; std::string reasoning; };
    struct RoutingFallbackEvent { std::string reason; };
    struct ToolInvocationEvent { std::string tool_name; bool success; };
    struct ResponseComposedEvent { bool used_tool; std::size_t length; };

    // RelayEvent is exactly ONE of the types listed below.
    using RelayEvent = std::variant<
        HandshakeTransitionEvent,
        RequestSentEvent,
        ResponseReceivedEvent,
        NotificationSentEvent,
        RoutingDecisionEvent,
        RoutingFallbackEvent,
        ToolInvocationEvent,
        ResponseComposedEvent
    >;

} // namespace relay::protocol
