#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/relay_errors.hpp"
#include "session/server_process.hpp"
#include "transport/line_transport.hpp"

namespace {

using relay::core::errors::get_error;
using relay::core::errors::get_value;
using relay::core::errors::is_error;
using relay::session::ServerLaunch;
using relay::session::ServerProcess;

ServerLaunch shell_launch(const std::string& script) {
    ServerLaunch launch;
    launch.command = "/bin/sh";
    launch.args = {"-c", script};
    launch.ready_marker = "Starting tool server";
    launch.read_timeout_ms = 5000;
    return launch;
}

TEST(ServerProcessTest, WaitsForMarkerAndEchoesLines) {
    ServerProcess server;
    auto started = server.start(shell_launch("echo 'Starting tool server (2 tools)' >&2; cat"));
    ASSERT_FALSE(is_error(started));
    EXPECT_GT(get_value(started), 0);
    EXPECT_TRUE(server.is_running());

    EXPECT_TRUE(server.wait_until_ready(5000));

    auto channel = server.transport();
    ASSERT_FALSE(is_error(channel));
    relay::transport::LineTransport* transport = get_value(channel);

    auto written = transport->write_line(R"({"jsonrpc":"2.0","id":"1","method":"ping"})");
    ASSERT_FALSE(is_error(written));
    auto echoed = transport->read_line();
    ASSERT_FALSE(is_error(echoed));
    ASSERT_TRUE(get_value(echoed).has_value());
    EXPECT_EQ(get_value(echoed).value(), R"({"jsonrpc":"2.0","id":"1","method":"ping"})");

    const std::vector<std::string> diagnostics = server.diagnostics();
    ASSERT_FALSE(diagnostics.empty());
    EXPECT_EQ(diagnostics.front(), "Starting tool server (2 tools)");

    server.stop();
    EXPECT_FALSE(server.is_running());
}

TEST(ServerProcessTest, ReadyWaitEndsWhenDiagnosticsClose) {
    ServerProcess server;
    ASSERT_FALSE(is_error(server.start(shell_launch("exit 0"))));

    EXPECT_FALSE(server.wait_until_ready(5000));

    auto channel = server.transport();
    ASSERT_FALSE(is_error(channel));
    relay::transport::LineTransport* transport = get_value(channel);

    auto read = transport->read_line();
    ASSERT_FALSE(is_error(read));
    EXPECT_FALSE(get_value(read).has_value());
}

TEST(ServerProcessTest, ExitedServerReadsAsEndOfStream) {
    ServerProcess server;
    ASSERT_FALSE(is_error(server.start(shell_launch("echo 'Starting tool server' >&2; read line"))));
    ASSERT_TRUE(server.wait_until_ready(5000));

    auto channel = server.transport();
    ASSERT_FALSE(is_error(channel));
    relay::transport::LineTransport* transport = get_value(channel);

    ASSERT_FALSE(is_error(transport->write_line("{}")));
    auto read = transport->read_line();
    ASSERT_FALSE(is_error(read));
    EXPECT_FALSE(get_value(read).has_value());
}

TEST(ServerProcessTest, SilentServerHitsReadTimeout) {
    ServerProcess server;
    ServerLaunch launch = shell_launch("echo 'Starting tool server' >&2; sleep 5");
    launch.read_timeout_ms = 100;
    ASSERT_FALSE(is_error(server.start(launch)));
    ASSERT_TRUE(server.wait_until_ready(5000));

    auto channel = server.transport();
    ASSERT_FALSE(is_error(channel));
    relay::transport::LineTransport* transport = get_value(channel);

    auto read = transport->read_line();
    ASSERT_TRUE(is_error(read));
    EXPECT_EQ(get_error(read).code, "read_timeout");
    // stop() escalates to SIGTERM for a server that ignores closed stdin.
    server.stop();
    EXPECT_FALSE(server.is_running());
}

TEST(ServerProcessTest, MissingExecutableClosesPipes) {
    ServerProcess server;
    ServerLaunch launch;
    launch.command = "/nonexistent/relay_tool_server";
    launch.ready_marker = "Starting tool server";
    ASSERT_FALSE(is_error(server.start(launch)));

    EXPECT_FALSE(server.wait_until_ready(5000));
    auto channel = server.transport();
    ASSERT_FALSE(is_error(channel));
    relay::transport::LineTransport* transport = get_value(channel);

    auto read = transport->read_line();
    ASSERT_FALSE(is_error(read));
    EXPECT_FALSE(get_value(read).has_value());
}

TEST(ServerProcessTest, RejectsEmptyCommandAndDoubleStart) {
    ServerProcess server;
    auto empty = server.start(ServerLaunch{});
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).code, "missing_server_command");

    ASSERT_FALSE(is_error(server.start(shell_launch("cat"))));
    auto again = server.start(shell_launch("cat"));
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "server_already_running");
}

TEST(ServerProcessTest, TransportUnavailableBeforeStartAndAfterStop) {
    ServerProcess server;
    auto before = server.transport();
    ASSERT_TRUE(is_error(before));
    EXPECT_EQ(get_error(before).code, "server_not_running");

    ASSERT_FALSE(is_error(server.start(shell_launch("echo 'Starting tool server' >&2; cat"))));
    ASSERT_TRUE(server.wait_until_ready(5000));
    EXPECT_FALSE(is_error(server.transport()));

    server.stop();
    auto after = server.transport();
    ASSERT_TRUE(is_error(after));
    EXPECT_EQ(get_error(after).code, "server_not_running");
}

}  // namespace
