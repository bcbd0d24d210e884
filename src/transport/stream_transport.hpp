#pragma once

#include <istream>
#include <ostream>
#include "transport/line_transport.hpp"

namespace relay::transport {

// Line transport over iostreams. The tool server runs it on std::cin and
// std::cout.
class StreamTransport : public LineTransport {
public:
    StreamTransport(std::istream& in, std::ostream& out);

    core::errors::Result<std::size_t> write_line(const std::string& line) override;
    core::errors::Result<std::optional<std::string>> read_line() override;

private:
    std::istream& in_;
    std::ostream& out_;
};

}  // namespace relay::transport
