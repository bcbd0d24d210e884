#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include "core/errors/relay_errors.hpp"
#include "protocol/message_codec.hpp"

namespace relay::transport {

// One JSON value per line over a pair of byte streams.
class LineTransport {
public:
    virtual ~LineTransport() = default;

    // Writes the line plus '\n' and flushes before returning. Returns the
    // number of bytes handed to the channel.
    virtual core::errors::Result<std::size_t> write_line(const std::string& line) = 0;

    // Blocks until a full line is available. An empty optional means the
    // peer closed the stream, which is distinct from an empty line.
    virtual core::errors::Result<std::optional<std::string>> read_line() = 0;

    core::errors::Result<std::size_t> write_message(const protocol::Message& message) {
        return write_line(protocol::encode_line(message));
    }
};

}  // namespace relay::transport
