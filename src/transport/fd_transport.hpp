#pragma once

#include <cstdint>
#include <string>
#include "transport/line_transport.hpp"

namespace relay::transport {

// Line transport over raw file descriptors (the pipes to the tool server).
// Does not own the descriptors.
class FdTransport : public LineTransport {
public:
    FdTransport(int read_fd, int write_fd, std::uint32_t read_timeout_ms = 0);

    core::errors::Result<std::size_t> write_line(const std::string& line) override;
    core::errors::Result<std::optional<std::string>> read_line() override;

private:
    int read_fd_;
    int write_fd_;
    std::uint32_t read_timeout_ms_;
    std::string buffer_;
    bool eof_ = false;
};

}  // namespace relay::transport
