#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/relay_errors.hpp"
#include "protocol/message_codec.hpp"
#include "rpc/correlator.hpp"
#include "test_support.hpp"

namespace {

using nlohmann::json;
using relay::core::errors::ErrorCategory;
using relay::core::errors::get_error;
using relay::core::errors::get_value;
using relay::core::errors::is_error;
using relay::rpc::CorrelatorOptions;
using relay::rpc::ReplyKind;
using relay::rpc::RpcCorrelator;
using relay::testing::error_line;
using relay::testing::RecordingEventSink;
using relay::testing::response_line;
using relay::testing::ScriptedTransport;

std::string written_id(const std::string& line) {
    return json::parse(line)["id"].get<std::string>();
}

TEST(RpcCorrelatorTest, RequestIdsStrictlyIncrease) {
    ScriptedTransport transport;
    RecordingEventSink events;
    transport.push_reply(response_line("1", json::object()));
    transport.push_reply(response_line("2", json::object()));
    transport.push_reply(response_line("3", json::object()));
    RpcCorrelator correlator(transport, events);

    for (int i = 0; i < 3; ++i) {
        ASSERT_FALSE(is_error(correlator.call("ping")));
    }

    ASSERT_EQ(transport.written.size(), 3u);
    EXPECT_EQ(written_id(transport.written[0]), "1");
    EXPECT_EQ(written_id(transport.written[1]), "2");
    EXPECT_EQ(written_id(transport.written[2]), "3");
    EXPECT_EQ(correlator.last_request_id(), 3u);
    EXPECT_EQ(events.of_type<relay::protocol::RequestSentEvent>().size(), 3u);
    EXPECT_EQ(events.of_type<relay::protocol::ResponseReceivedEvent>().size(), 3u);
}

TEST(RpcCorrelatorTest, ReadsExactlyOneLinePerCall) {
    ScriptedTransport transport;
    RecordingEventSink events;
    transport.push_reply(response_line("1", json{{"ok", true}}));
    transport.push_reply(response_line("2", json{{"ok", false}}));
    RpcCorrelator correlator(transport, events);

    auto reply = correlator.call("tools/list");
    ASSERT_FALSE(is_error(reply));
    EXPECT_EQ(transport.reads, 1);
    EXPECT_EQ(get_value(reply).kind, ReplyKind::Result);
    EXPECT_EQ(get_value(reply).request_id, "1");
    EXPECT_EQ(get_value(reply).payload, json({{"ok", true}}));
}

TEST(RpcCorrelatorTest, ErrorReplyCarriesCodeMessageAndData) {
    ScriptedTransport transport;
    RecordingEventSink events;
    transport.push_reply(R"({"jsonrpc":"2.0","id":"1","error":{"code":-32602,"message":"bad","data":{"code":"invalid_tool_input"}}})");
    RpcCorrelator correlator(transport, events);

    auto reply = correlator.call("tools/call", json{{"name", "get_weather"}});
    ASSERT_FALSE(is_error(reply));
    EXPECT_EQ(get_value(reply).kind, ReplyKind::Error);
    EXPECT_EQ(get_value(reply).payload["code"], -32602);
    EXPECT_EQ(get_value(reply).payload["message"], "bad");
    EXPECT_EQ(get_value(reply).payload["data"]["code"], "invalid_tool_input");

    const json folded = relay::rpc::to_tool_payload(get_value(reply));
    ASSERT_TRUE(folded.contains("error"));
    EXPECT_EQ(folded["error"]["message"], "bad");
}

TEST(RpcCorrelatorTest, MismatchedIdIsAnError) {
    ScriptedTransport transport;
    RecordingEventSink events;
    transport.push_reply(response_line("99", json::object()));
    RpcCorrelator correlator(transport, events);

    auto reply = correlator.call("ping");
    ASSERT_TRUE(is_error(reply));
    EXPECT_EQ(get_error(reply).code, "correlation_mismatch");
    EXPECT_EQ(get_error(reply).category, ErrorCategory::Protocol);
}

TEST(RpcCorrelatorTest, NullIdErrorResponseIsAccepted) {
    ScriptedTransport transport;
    RecordingEventSink events;
    transport.push_reply(R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"Parse error"}})");
    RpcCorrelator correlator(transport, events);

    auto reply = correlator.call("ping");
    ASSERT_FALSE(is_error(reply));
    EXPECT_EQ(get_value(reply).kind, ReplyKind::Error);
    EXPECT_EQ(get_value(reply).payload["code"], -32700);
}

TEST(RpcCorrelatorTest, UnparsableLineDegradesToRawReply) {
    ScriptedTransport transport;
    RecordingEventSink events;
    transport.push_reply("Traceback: something broke");
    RpcCorrelator correlator(transport, events);

    auto reply = correlator.call("tools/call", json{{"name", "web_search"}});
    ASSERT_FALSE(is_error(reply));
    EXPECT_EQ(get_value(reply).kind, ReplyKind::Raw);
    EXPECT_EQ(get_value(reply).payload, json("Traceback: something broke"));

    auto received = events.of_type<relay::protocol::ResponseReceivedEvent>();
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].kind, "raw");
}

TEST(RpcCorrelatorTest, StrictParsingFailsOnUnparsableLine) {
    ScriptedTransport transport;
    RecordingEventSink events;
    transport.push_reply("not json");
    CorrelatorOptions options;
    options.strict_parsing = true;
    RpcCorrelator correlator(transport, events, options);

    auto reply = correlator.call("ping");
    ASSERT_TRUE(is_error(reply));
    EXPECT_EQ(get_error(reply).code, "malformed_response");
}

TEST(RpcCorrelatorTest, RequestInsteadOfResponseIsUnexpected) {
    ScriptedTransport transport;
    RecordingEventSink events;
    transport.push_reply(R"({"jsonrpc":"2.0","id":"1","method":"sampling/createMessage"})");
    RpcCorrelator correlator(transport, events);

    auto reply = correlator.call("ping");
    ASSERT_TRUE(is_error(reply));
    EXPECT_EQ(get_error(reply).code, "unexpected_message");
}

TEST(RpcCorrelatorTest, EndOfStreamMeansServerUnavailable) {
    ScriptedTransport transport;
    RecordingEventSink events;
    RpcCorrelator correlator(transport, events);

    auto reply = correlator.call("tools/call", json{{"name", "get_weather"}});
    ASSERT_TRUE(is_error(reply));
    EXPECT_EQ(get_error(reply).code, "server_unavailable");
    EXPECT_EQ(get_error(reply).category, ErrorCategory::Transport);
}

TEST(RpcCorrelatorTest, WriteFailureMeansServerUnavailable) {
    ScriptedTransport transport;
    RecordingEventSink events;
    transport.fail_writes = true;
    RpcCorrelator correlator(transport, events);

    auto reply = correlator.call("ping");
    ASSERT_TRUE(is_error(reply));
    EXPECT_EQ(get_error(reply).code, "server_unavailable");
    EXPECT_EQ(transport.reads, 0);

    auto notified = correlator.notify("initialized");
    ASSERT_TRUE(is_error(notified));
    EXPECT_EQ(get_error(notified).code, "server_unavailable");
}

TEST(RpcCorrelatorTest, NotificationsCarryNoIdAndConsumeNoId) {
    ScriptedTransport transport;
    RecordingEventSink events;
    transport.push_reply(response_line("1", json::object()));
    RpcCorrelator correlator(transport, events);

    ASSERT_FALSE(is_error(correlator.notify("initialized")));
    ASSERT_FALSE(is_error(correlator.call("ping")));

    ASSERT_EQ(transport.written.size(), 2u);
    const json notification = json::parse(transport.written[0]);
    EXPECT_FALSE(notification.contains("id"));
    EXPECT_EQ(notification["method"], "initialized");
    EXPECT_EQ(written_id(transport.written[1]), "1");
    EXPECT_EQ(transport.reads, 1);
}

TEST(RpcCorrelatorTest, IntegerIdInResponseMatchesStringRequestId) {
    ScriptedTransport transport;
    RecordingEventSink events;
    transport.push_reply(R"({"jsonrpc":"2.0","id":1,"result":{}})");
    RpcCorrelator correlator(transport, events);

    EXPECT_FALSE(is_error(correlator.call("ping")));
}

TEST(RpcCorrelatorTest, ErrorLineHelperProducesErrorReply) {
    ScriptedTransport transport;
    RecordingEventSink events;
    transport.push_reply(error_line("1", -32601, "Method not found: nope"));
    RpcCorrelator correlator(transport, events);

    auto reply = correlator.call("nope");
    ASSERT_FALSE(is_error(reply));
    EXPECT_EQ(get_value(reply).kind, ReplyKind::Error);
    EXPECT_FALSE(get_value(reply).payload.contains("data"));
}

}  // namespace
