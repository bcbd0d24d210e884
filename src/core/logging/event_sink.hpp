#pragma once

#include <string>
#include "protocol/event_contract.hpp"

namespace relay::core::logging {

class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(const protocol::RelayEvent& event) = 0;
};

// Renders every event through the global Logger.
class LogEventSink : public EventSink {
public:
    void emit(const protocol::RelayEvent& event) override;
};

std::string describe(const protocol::RelayEvent& event);

// Shared LogEventSink used when a component is not given one explicitly.
EventSink& default_event_sink();

}  // namespace relay::core::logging
