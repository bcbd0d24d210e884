#pragma once

#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/relay_errors.hpp"
#include "core/logging/event_sink.hpp"
#include "llm/completion.hpp"
#include "protocol/message_codec.hpp"
#include "providers/tool_provider.hpp"
#include "server/tool_server.hpp"
#include "transport/line_transport.hpp"

namespace relay::testing {

using core::errors::ErrorCategory;
using core::errors::RelayError;
using core::errors::Result;

// Records written lines and replays canned response lines. An exhausted
// script reads as end of stream.
class ScriptedTransport : public transport::LineTransport {
public:
    void push_reply(std::string line) { replies_.push_back(std::move(line)); }

    Result<std::size_t> write_line(const std::string& line) override {
        if (fail_writes) {
            return RelayError{ErrorCategory::Transport, "Broken pipe", "write_failed"};
        }
        written.push_back(line);
        return line.size() + 1;
    }

    Result<std::optional<std::string>> read_line() override {
        ++reads;
        if (replies_.empty()) {
            return std::optional<std::string>();
        }
        std::string line = replies_.front();
        replies_.pop_front();
        return std::optional<std::string>(std::move(line));
    }

    std::vector<std::string> written;
    int reads = 0;
    bool fail_writes = false;

private:
    std::deque<std::string> replies_;
};

// Connects a client directly to an in-process ToolServer. Each written line
// is handled synchronously and its response queued for the next read.
class LoopbackTransport : public transport::LineTransport {
public:
    explicit LoopbackTransport(server::ToolServer& server) : server_(server) {}

    // Simulates the server process dying.
    void close() { closed_ = true; }

    Result<std::size_t> write_line(const std::string& line) override {
        if (closed_) {
            return RelayError{ErrorCategory::Transport, "Broken pipe", "write_failed"};
        }
        written.push_back(line);
        auto response = server_.handle_line(line);
        if (response.has_value()) {
            pending_.push_back(protocol::encode_line(*response));
        }
        return line.size() + 1;
    }

    Result<std::optional<std::string>> read_line() override {
        if (closed_ || pending_.empty()) {
            return std::optional<std::string>();
        }
        std::string line = pending_.front();
        pending_.pop_front();
        return std::optional<std::string>(std::move(line));
    }

    std::vector<std::string> written;

private:
    server::ToolServer& server_;
    std::deque<std::string> pending_;
    bool closed_ = false;
};

class RecordingEventSink : public core::logging::EventSink {
public:
    void emit(const protocol::RelayEvent& event) override { events.push_back(event); }

    template <typename T>
    std::vector<T> of_type() const {
        std::vector<T> matching;
        for (const auto& event : events) {
            if (const T* typed = std::get_if<T>(&event)) {
                matching.push_back(*typed);
            }
        }
        return matching;
    }

    std::vector<protocol::RelayEvent> events;
};

// Completion driven by a function of the request; every request is recorded.
class FunctionCompletion : public llm::Completion {
public:
    using Handler = std::function<Result<std::string>(const llm::CompletionRequest&)>;

    explicit FunctionCompletion(Handler handler) : handler_(std::move(handler)) {}

    Result<std::string> complete(const llm::CompletionRequest& request) override {
        requests.push_back(request);
        return handler_(request);
    }

    std::vector<llm::CompletionRequest> requests;

private:
    Handler handler_;
};

class StubWeatherProvider : public providers::WeatherProvider {
public:
    explicit StubWeatherProvider(nlohmann::json reply) : reply_(std::move(reply)) {}

    Result<nlohmann::json> lookup(const protocol::WeatherInput& input) override {
        cities.push_back(input.city);
        if (fail) {
            return RelayError{ErrorCategory::Provider, "Could not fetch weather for " + input.city,
                              "weather_http_status"};
        }
        return reply_;
    }

    std::vector<std::string> cities;
    bool fail = false;

private:
    nlohmann::json reply_;
};

class StubSearchProvider : public providers::WebSearchProvider {
public:
    Result<nlohmann::json> search(const protocol::WebSearchInput& input) override {
        queries.push_back(input.query);
        return nlohmann::json{{"query", input.query},
                              {"results", nlohmann::json::array()},
                              {"knowledge_graph", nullptr}};
    }

    std::vector<std::string> queries;
};

inline std::string response_line(const std::string& id, const nlohmann::json& result) {
    return nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}}.dump();
}

inline std::string error_line(const std::string& id, int code, const std::string& message) {
    return nlohmann::json{{"jsonrpc", "2.0"},
                          {"id", id},
                          {"error", {{"code", code}, {"message", message}}}}
        .dump();
}

}  // namespace relay::testing
