#include <stdexcept>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/relay_errors.hpp"
#include "server/builtin_tools.hpp"
#include "server/tool_registry.hpp"
#include "test_support.hpp"

namespace {

using nlohmann::json;
using relay::core::errors::get_error;
using relay::core::errors::get_value;
using relay::core::errors::is_error;
using relay::server::FieldSpec;
using relay::server::FieldType;
using relay::server::ToolDefinition;
using relay::server::ToolRegistry;
using relay::server::ToolSchema;

ToolDefinition echo_tool(const std::string& name) {
    ToolDefinition tool;
    tool.name = name;
    tool.description = "Echoes its input";
    tool.schema = ToolSchema{{FieldSpec{"text", FieldType::String, "Text to echo", true},
                              FieldSpec{"times", FieldType::Integer, "", false}}};
    tool.handler = [](const json& input) -> relay::core::errors::Result<json> {
        return json{{"echo", input["text"]}};
    };
    return tool;
}

TEST(ToolSchemaTest, RendersJsonSchema) {
    const ToolSchema schema = echo_tool("echo").schema;
    const json rendered = schema.to_json_schema();

    EXPECT_EQ(rendered["type"], "object");
    EXPECT_EQ(rendered["properties"]["text"]["type"], "string");
    EXPECT_EQ(rendered["properties"]["text"]["description"], "Text to echo");
    EXPECT_EQ(rendered["properties"]["times"]["type"], "integer");
    EXPECT_FALSE(rendered["properties"]["times"].contains("description"));
    EXPECT_EQ(rendered["required"], json::array({"text"}));
}

TEST(ToolSchemaTest, ValidatesRequiredFieldsAndTypes) {
    const ToolSchema schema = echo_tool("echo").schema;

    EXPECT_FALSE(is_error(schema.validate(json{{"text", "hi"}})));
    EXPECT_FALSE(is_error(schema.validate(json{{"text", "hi"}, {"times", 2}, {"extra", true}})));

    auto missing = schema.validate(json::object());
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "invalid_tool_input");
    EXPECT_EQ(get_error(missing).message, "Missing required field 'text'.");

    auto wrong_type = schema.validate(json{{"text", 5}});
    ASSERT_TRUE(is_error(wrong_type));
    EXPECT_EQ(get_error(wrong_type).message, "Field 'text' must be of type string.");

    auto not_object = schema.validate(json("text"));
    ASSERT_TRUE(is_error(not_object));
    EXPECT_EQ(get_error(not_object).code, "invalid_tool_input");
}

TEST(ToolRegistryTest, RejectsDuplicateAndIncompleteDefinitions) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.register_tool(echo_tool("echo"))));

    auto duplicate = registry.register_tool(echo_tool("echo"));
    ASSERT_TRUE(is_error(duplicate));
    EXPECT_EQ(get_error(duplicate).code, "duplicate_tool");

    auto unnamed = registry.register_tool(echo_tool(""));
    ASSERT_TRUE(is_error(unnamed));
    EXPECT_EQ(get_error(unnamed).code, "invalid_tool_name");

    ToolDefinition no_handler = echo_tool("silent");
    no_handler.handler = nullptr;
    auto missing = registry.register_tool(no_handler);
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "missing_handler");

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_TRUE(registry.contains("echo"));
    EXPECT_FALSE(registry.contains("silent"));
}

TEST(ToolRegistryTest, CallUnwrapsInputAndRunsHandler) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.register_tool(echo_tool("echo"))));

    auto called = registry.call("echo", json{{"input", {{"text", "hello"}}}});
    ASSERT_FALSE(is_error(called));
    EXPECT_EQ(get_value(called), json({{"echo", "hello"}}));
}

TEST(ToolRegistryTest, CallFailuresAreTyped) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.register_tool(echo_tool("echo"))));

    EXPECT_EQ(get_error(registry.call("nope", json{{"input", json::object()}})).code,
              "tool_not_found");
    EXPECT_EQ(get_error(registry.call("echo", json{{"text", "hello"}})).code, "invalid_arguments");
    EXPECT_EQ(get_error(registry.call("echo", json::array())).code, "invalid_arguments");
    EXPECT_EQ(get_error(registry.call("echo", json{{"input", json::object()}})).code,
              "invalid_tool_input");
}

TEST(ToolRegistryTest, ThrowingHandlerBecomesExecutionFailure) {
    ToolRegistry registry;
    ToolDefinition tool = echo_tool("explode");
    tool.handler = [](const json&) -> relay::core::errors::Result<json> {
        throw std::runtime_error("provider crashed");
    };
    ASSERT_FALSE(is_error(registry.register_tool(tool)));

    auto called = registry.call("explode", json{{"input", {{"text", "x"}}}});
    ASSERT_TRUE(is_error(called));
    EXPECT_EQ(get_error(called).code, "tool_execution_failed");
    EXPECT_NE(get_error(called).message.find("provider crashed"), std::string::npos);
}

TEST(ToolRegistryTest, NonStandardThrowBecomesExecutionFailure) {
    ToolRegistry registry;
    ToolDefinition tool = echo_tool("explode");
    tool.handler = [](const json&) -> relay::core::errors::Result<json> { throw 42; };
    ASSERT_FALSE(is_error(registry.register_tool(tool)));

    auto called = registry.call("explode", json{{"input", {{"text", "x"}}}});
    ASSERT_TRUE(is_error(called));
    EXPECT_EQ(get_error(called).category, relay::core::errors::ErrorCategory::Tool);
    EXPECT_EQ(get_error(called).code, "tool_execution_failed");

    auto again = registry.call("explode", json{{"input", {{"text", "y"}}}});
    EXPECT_TRUE(is_error(again));
}

TEST(ToolRegistryTest, RejectedInputDoesNotPoisonLaterCalls) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.register_tool(echo_tool("echo"))));

    ASSERT_TRUE(is_error(registry.call("echo", json{{"input", {{"text", 1}}}})));
    auto valid = registry.call("echo", json{{"input", {{"text", "ok"}}}});
    ASSERT_FALSE(is_error(valid));
    EXPECT_EQ(get_value(valid)["echo"], "ok");
}

TEST(ToolRegistryTest, DescribeToolsKeepsRegistrationOrder) {
    relay::testing::StubWeatherProvider weather(json{{"location", "Paris, FR"}});
    relay::testing::StubSearchProvider search;
    ToolRegistry registry;

    auto registered = relay::server::register_builtin_tools(registry, weather, search);
    ASSERT_FALSE(is_error(registered));
    EXPECT_EQ(get_value(registered), 2u);

    const json described = registry.describe_tools();
    ASSERT_EQ(described["tools"].size(), 2u);
    EXPECT_EQ(described["tools"][0]["name"], "get_weather");
    EXPECT_EQ(described["tools"][1]["name"], "web_search");

    const json& input_schema = described["tools"][0]["inputSchema"];
    EXPECT_EQ(input_schema["required"], json::array({"input"}));
    EXPECT_EQ(input_schema["properties"]["input"]["properties"]["city"]["type"], "string");
}

TEST(BuiltinToolsTest, HandlersPassTypedInputToProviders) {
    relay::testing::StubWeatherProvider weather(json{{"location", "Paris, FR"}});
    relay::testing::StubSearchProvider search;
    ToolRegistry registry;
    ASSERT_FALSE(is_error(relay::server::register_builtin_tools(registry, weather, search)));

    auto forecast = registry.call("get_weather", json{{"input", {{"city", "Paris"}}}});
    ASSERT_FALSE(is_error(forecast));
    EXPECT_EQ(get_value(forecast)["location"], "Paris, FR");
    ASSERT_EQ(weather.cities.size(), 1u);
    EXPECT_EQ(weather.cities[0], "Paris");

    auto results = registry.call("web_search", json{{"input", {{"query", "AI news"}}}});
    ASSERT_FALSE(is_error(results));
    ASSERT_EQ(search.queries.size(), 1u);
    EXPECT_EQ(search.queries[0], "AI news");
}

TEST(BuiltinToolsTest, ProviderFailurePropagates) {
    relay::testing::StubWeatherProvider weather(json::object());
    weather.fail = true;
    relay::testing::StubSearchProvider search;
    ToolRegistry registry;
    ASSERT_FALSE(is_error(relay::server::register_builtin_tools(registry, weather, search)));

    auto forecast = registry.call("get_weather", json{{"input", {{"city", "Atlantis"}}}});
    ASSERT_TRUE(is_error(forecast));
    EXPECT_EQ(get_error(forecast).code, "weather_http_status");
    EXPECT_EQ(get_error(forecast).message, "Could not fetch weather for Atlantis");
}

}  // namespace
