#include "transport/stream_transport.hpp"

#include <string>

namespace relay::transport {

using core::errors::ErrorCategory;
using core::errors::RelayError;

StreamTransport::StreamTransport(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

core::errors::Result<std::size_t> StreamTransport::write_line(const std::string& line) {
    out_ << line << '\n';
    out_.flush();
    if (!out_.good()) {
        return RelayError{ErrorCategory::Transport, "Output stream rejected the line.",
                          "write_failed"};
    }
    return line.size() + 1;
}

core::errors::Result<std::optional<std::string>> StreamTransport::read_line() {
    std::string line;
    if (!std::getline(in_, line)) {
        if (in_.eof()) {
            return std::optional<std::string>();
        }
        return RelayError{ErrorCategory::Transport, "Input stream failed.", "read_failed"};
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return std::optional<std::string>(std::move(line));
}

}  // namespace relay::transport
