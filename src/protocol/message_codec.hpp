#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/relay_errors.hpp"
#include "protocol/message_contract.hpp"

namespace relay::protocol {

nlohmann::json to_json(const Message& message);

// Single line, no trailing newline. nlohmann escapes control characters, so
// the output never contains a raw '\n'.
std::string encode_line(const Message& message);

// Never throws. Unparsable text fails with code "parse_error", a JSON value
// that is not a well-formed envelope with "invalid_message".
core::errors::Result<Message> decode_line(const std::string& line);

core::errors::Result<Message> from_json(const nlohmann::json& value);

}  // namespace relay::protocol
