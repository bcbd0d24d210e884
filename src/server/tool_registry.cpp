#include "server/tool_registry.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/tool_contract.hpp"

namespace relay::server {

using core::errors::ErrorCategory;
using core::errors::RelayError;
using nlohmann::json;

namespace {

bool matches_type(const json& value, const FieldType type) {
    switch (type) {
        case FieldType::String:
            return value.is_string();
        case FieldType::Integer:
            return value.is_number_integer();
        case FieldType::Number:
            return value.is_number();
        case FieldType::Boolean:
            return value.is_boolean();
        case FieldType::Object:
            return value.is_object();
        case FieldType::Array:
            return value.is_array();
        default:
            return false;
    }
}

}  // namespace

std::string to_string(const FieldType type) {
    switch (type) {
        case FieldType::String:
            return "string";
        case FieldType::Integer:
            return "integer";
        case FieldType::Number:
            return "number";
        case FieldType::Boolean:
            return "boolean";
        case FieldType::Object:
            return "object";
        case FieldType::Array:
            return "array";
        default:
            return "unknown";
    }
}

json ToolSchema::to_json_schema() const {
    json properties = json::object();
    json required = json::array();
    for (const auto& field : fields) {
        json property;
        property["type"] = to_string(field.type);
        if (!field.description.empty()) {
            property["description"] = field.description;
        }
        properties[field.name] = property;
        if (field.required) {
            required.push_back(field.name);
        }
    }
    return json{{"type", "object"}, {"properties", properties}, {"required", required}};
}

core::errors::Result<json> ToolSchema::validate(const json& payload) const {
    if (!payload.is_object()) {
        return RelayError{ErrorCategory::Tool, "Tool input must be a JSON object.",
                          "invalid_tool_input"};
    }
    for (const auto& field : fields) {
        auto it = payload.find(field.name);
        if (it == payload.end() || it->is_null()) {
            if (field.required) {
                return RelayError{ErrorCategory::Tool,
                                  "Missing required field '" + field.name + "'.",
                                  "invalid_tool_input"};
            }
            continue;
        }
        if (!matches_type(*it, field.type)) {
            return RelayError{ErrorCategory::Tool,
                              "Field '" + field.name + "' must be of type " +
                                  to_string(field.type) + ".",
                              "invalid_tool_input"};
        }
    }
    return payload;
}

core::errors::Result<std::string> ToolRegistry::register_tool(ToolDefinition definition) {
    if (definition.name.empty()) {
        return RelayError{ErrorCategory::Input, "Tool name cannot be empty.",
                          "invalid_tool_name"};
    }
    if (!definition.handler) {
        return RelayError{ErrorCategory::Input,
                          "Tool " + definition.name + " has no handler.", "missing_handler"};
    }
    if (tools_.find(definition.name) != tools_.end()) {
        return RelayError{ErrorCategory::Input,
                          "Tool already registered: " + definition.name, "duplicate_tool"};
    }

    std::string name = definition.name;
    order_.push_back(name);
    tools_.emplace(name, std::move(definition));
    RELAY_LOG_DEBUG("ToolRegistry: registered " + name);
    return name;
}

core::errors::Result<json> ToolRegistry::call(const std::string& name,
                                              const json& arguments) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return RelayError{ErrorCategory::Tool, "Tool not found: " + name, "tool_not_found"};
    }

    if (!arguments.is_object() || !arguments.contains(protocol::kToolInputKey)) {
        return RelayError{ErrorCategory::Tool,
                          std::string("Tool arguments must be an object with an '") +
                              protocol::kToolInputKey + "' field.",
                          "invalid_arguments"};
    }

    const ToolDefinition& tool = it->second;
    auto validated = tool.schema.validate(arguments.at(protocol::kToolInputKey));
    if (core::errors::is_error(validated)) {
        RELAY_LOG_WARN("ToolRegistry: rejected input for " + name + ": " +
                       core::errors::get_error(validated).message);
        return core::errors::get_error(validated);
    }

    try {
        return tool.handler(core::errors::get_value(validated));
    } catch (const std::exception& e) {
        RELAY_LOG_ERROR("ToolRegistry: " + name + " threw: " + e.what());
        return RelayError{ErrorCategory::Tool,
                          "Tool " + name + " failed: " + std::string(e.what()),
                          "tool_execution_failed"};
    } catch (...) {
        RELAY_LOG_ERROR("ToolRegistry: " + name + " threw a non-standard exception");
        return RelayError{ErrorCategory::Tool,
                          "Tool " + name + " failed with an unknown exception.",
                          "tool_execution_failed"};
    }
}

json ToolRegistry::describe_tools() const {
    json tools = json::array();
    for (const auto& name : order_) {
        const ToolDefinition& tool = tools_.at(name);
        json input_schema = {
            {"type", "object"},
            {"properties", {{protocol::kToolInputKey, tool.schema.to_json_schema()}}},
            {"required", json::array({protocol::kToolInputKey})}};
        tools.push_back(
            {{"name", tool.name}, {"description", tool.description}, {"inputSchema", input_schema}});
    }
    return json{{"tools", tools}};
}

bool ToolRegistry::contains(const std::string& name) const {
    return tools_.find(name) != tools_.end();
}

}  // namespace relay::server
