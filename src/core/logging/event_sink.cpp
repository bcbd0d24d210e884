#include "core/logging/event_sink.hpp"

#include <type_traits>
#include "core/logging/logger.hpp"

namespace relay::core::logging {

using namespace relay::protocol;

std::string describe(const RelayEvent& event) {
    return std::visit(
        [](const auto& e) -> std::string {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, HandshakeTransitionEvent>) {
                return "handshake " + e.from + " -> " + e.to;
            } else if constexpr (std::is_same_v<T, RequestSentEvent>) {
                return "request " + e.request_id + " sent: " + e.method;
            } else if constexpr (std::is_same_v<T, ResponseReceivedEvent>) {
                return "response " + e.request_id + " received (" + e.kind + ")";
            } else if constexpr (std::is_same_v<T, NotificationSentEvent>) {
                return "notification sent: " + e.method;
            } else if constexpr (std::is_same_v<T, RoutingDecisionEvent>) {
                return "routing decision: " + e.tool + " (" + e.reasoning + ")";
            } else if constexpr (std::is_same_v<T, RoutingFallbackEvent>) {
                return "routing fallback to direct answer: " + e.reason;
            } else if constexpr (std::is_same_v<T, ToolInvocationEvent>) {
                return "tool " + e.tool_name + (e.success ? " returned" : " failed");
            } else {
                return std::string("response composed (") +
                       (e.used_tool ? "with tool data" : "direct") + ", " +
                       std::to_string(e.length) + " chars)";
            }
        },
        event);
}

void LogEventSink::emit(const RelayEvent& event) {
    if (std::holds_alternative<RequestSentEvent>(event) ||
        std::holds_alternative<ResponseReceivedEvent>(event) ||
        std::holds_alternative<NotificationSentEvent>(event)) {
        RELAY_LOG_DEBUG(describe(event));
        return;
    }
    RELAY_LOG_INFO(describe(event));
}

EventSink& default_event_sink() {
    static LogEventSink sink;
    return sink;
}

}  // namespace relay::core::logging
