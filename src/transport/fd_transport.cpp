#include "transport/fd_transport.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace relay::transport {

using core::errors::ErrorCategory;
using core::errors::RelayError;

namespace {

std::string take_line(std::string& buffer, const std::size_t newline) {
    std::string line = buffer.substr(0, newline);
    buffer.erase(0, newline + 1);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

}  // namespace

FdTransport::FdTransport(const int read_fd, const int write_fd,
                         const std::uint32_t read_timeout_ms)
    : read_fd_(read_fd), write_fd_(write_fd), read_timeout_ms_(read_timeout_ms) {}

core::errors::Result<std::size_t> FdTransport::write_line(const std::string& line) {
    const std::string framed = line + "\n";
    std::size_t written = 0;
    while (written < framed.size()) {
        const ssize_t n = write(write_fd_, framed.data() + written, framed.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return RelayError{ErrorCategory::Transport,
                          std::string("Failed to write to tool server: ") + std::strerror(errno),
                          "write_failed"};
    }
    return written;
}

core::errors::Result<std::optional<std::string>> FdTransport::read_line() {
    const auto started = std::chrono::steady_clock::now();

    while (true) {
        const auto newline = buffer_.find('\n');
        if (newline != std::string::npos) {
            return std::optional<std::string>(take_line(buffer_, newline));
        }
        if (eof_) {
            if (buffer_.empty()) {
                return std::optional<std::string>();
            }
            std::string fragment;
            fragment.swap(buffer_);
            return std::optional<std::string>(std::move(fragment));
        }

        int wait_ms = -1;
        if (read_timeout_ms_ > 0) {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now() - started)
                                     .count();
            if (elapsed >= static_cast<std::int64_t>(read_timeout_ms_)) {
                return RelayError{ErrorCategory::Transport,
                                  "Timed out after " + std::to_string(read_timeout_ms_) +
                                      " ms waiting for the tool server.",
                                  "read_timeout"};
            }
            wait_ms = static_cast<int>(read_timeout_ms_ - elapsed);
        }

        pollfd fds[1];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        const int ready = poll(fds, 1, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return RelayError{ErrorCategory::Transport,
                              std::string("poll failed: ") + std::strerror(errno),
                              "read_failed"};
        }
        if (ready == 0) {
            continue;
        }

        char chunk[4096];
        const ssize_t n = read(read_fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.append(chunk, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            eof_ = true;
            continue;
        }
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
            continue;
        }
        return RelayError{ErrorCategory::Transport,
                          std::string("Failed to read from tool server: ") + std::strerror(errno),
                          "read_failed"};
    }
}

}  // namespace relay::transport
