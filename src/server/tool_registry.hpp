#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/relay_errors.hpp"

namespace relay::server {

enum class FieldType {
    String,
    Integer,
    Number,
    Boolean,
    Object,
    Array
};

struct FieldSpec {
    std::string name;
    FieldType type = FieldType::String;
    std::string description;
    bool required = true;
};

struct ToolSchema {
    std::vector<FieldSpec> fields;

    // JSON Schema for the payload carried under "input".
    nlohmann::json to_json_schema() const;

    // Returns the payload unchanged when it is an object whose required
    // fields are present and whose declared fields have the right JSON type.
    core::errors::Result<nlohmann::json> validate(const nlohmann::json& payload) const;
};

// Handlers only ever see payloads that passed ToolSchema::validate.
using ToolHandler = std::function<core::errors::Result<nlohmann::json>(const nlohmann::json&)>;

struct ToolDefinition {
    std::string name;
    std::string description;
    ToolSchema schema;
    ToolHandler handler;
};

std::string to_string(FieldType type);

class ToolRegistry {
public:
    core::errors::Result<std::string> register_tool(ToolDefinition definition);

    // arguments is the "arguments" member of a tools/call request, i.e.
    // {"input": <payload>}. Every failure comes back as a RelayError; nothing
    // thrown by a handler escapes.
    core::errors::Result<nlohmann::json> call(const std::string& name,
                                              const nlohmann::json& arguments) const;

    // Payload for a tools/list response.
    nlohmann::json describe_tools() const;

    bool contains(const std::string& name) const;
    std::size_t size() const { return order_.size(); }

private:
    std::unordered_map<std::string, ToolDefinition> tools_;
    std::vector<std::string> order_;
};

}  // namespace relay::server
