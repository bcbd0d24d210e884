#pragma once
#include "protocol/agent_request.hpp"
#include "core/errors/relay_errors.hpp"

namespace relay::app::cli {
    relay::core::errors::Result<relay::protocol::AgentRequest> parse_and_validate(int argc, char* argv[]);
}
