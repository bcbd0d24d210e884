#include "pipeline/routing_pipeline.hpp"

#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/tool_contract.hpp"

namespace relay::pipeline {

using core::errors::ErrorCategory;
using core::errors::RelayError;
using llm::CompletionRequest;
using llm::ResponseFormat;
using nlohmann::json;

namespace {

constexpr const char* kRoutingSystemPrompt =
    "You are a tool routing assistant. Analyze user requests and determine which tool to use. "
    "Always respond with valid JSON.";
constexpr const char* kDirectSystemPrompt = "You are a helpful assistant.";
constexpr const char* kGroundedSystemPrompt =
    "You are a helpful assistant. Use the tool results provided to answer the user's question "
    "in a natural, conversational way. Be concise but informative.";

std::string dump_safe(const json& value, const int indent = -1) {
    return value.dump(indent, ' ', false, json::error_handler_t::replace);
}

}  // namespace

std::string to_string(const ToolSelector selector) {
    switch (selector) {
        case ToolSelector::None:
            return "none";
        case ToolSelector::Weather:
            return protocol::kWeatherToolName;
        case ToolSelector::WebSearch:
            return protocol::kWebSearchToolName;
        default:
            return "unknown";
    }
}

const std::vector<ToolDescriptor>& default_tool_catalog() {
    static const std::vector<ToolDescriptor> catalog = {
        {ToolSelector::Weather, protocol::kWeatherToolName, "Get current weather for a city",
         "city"},
        {ToolSelector::WebSearch, protocol::kWebSearchToolName,
         "Search the web for information", "query"}};
    return catalog;
}

std::string build_routing_prompt(const std::string& message,
                                 const std::vector<ToolDescriptor>& catalog) {
    std::ostringstream prompt;
    prompt << "Analyze this user request and determine which tool to use:\n\n"
           << "User request: " << message << "\n\n"
           << "Available tools:\n";
    for (std::size_t i = 0; i < catalog.size(); ++i) {
        prompt << (i + 1) << ". " << catalog[i].name << " - " << catalog[i].description
               << ". Requires: " << catalog[i].required_parameter << "\n";
    }

    std::string tool_choices;
    std::string parameter_choices;
    for (const auto& tool : catalog) {
        tool_choices += "\"" + tool.name + "\" | ";
        parameter_choices += "{\"" + tool.required_parameter + "\": \"...\"} or ";
    }
    prompt << "\nRespond in JSON format with:\n"
           << "{\n"
           << "    \"tool\": " << tool_choices << "\"none\",\n"
           << "    \"parameters\": " << parameter_choices << "null,\n"
           << "    \"reasoning\": \"brief explanation\"\n"
           << "}\n\n"
           << "Only use tools if clearly needed. For general conversation, use \"none\".";
    return prompt.str();
}

core::errors::Result<RoutingDecision> parse_routing_decision(
    const std::string& text, const std::vector<ToolDescriptor>& catalog) {
    const json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return RelayError{ErrorCategory::Protocol, "Routing response is not a JSON object.",
                          "invalid_routing_json"};
    }

    auto tool = parsed.find("tool");
    if (tool == parsed.end() || !tool->is_string()) {
        return RelayError{ErrorCategory::Protocol, "Routing response has no tool name.",
                          "invalid_routing_json"};
    }

    RoutingDecision decision;
    const std::string tool_name = tool->get<std::string>();
    if (tool_name != "none") {
        bool known = false;
        for (const auto& descriptor : catalog) {
            if (descriptor.name == tool_name) {
                decision.tool = descriptor.selector;
                known = true;
                break;
            }
        }
        if (!known) {
            return RelayError{ErrorCategory::Protocol, "Routing chose unknown tool: " + tool_name,
                              "unknown_tool"};
        }
    }

    auto parameters = parsed.find("parameters");
    if (parameters != parsed.end() && !parameters->is_null()) {
        decision.parameters = *parameters;
    }

    auto reasoning = parsed.find("reasoning");
    if (reasoning != parsed.end() && reasoning->is_string()) {
        decision.reasoning = reasoning->get<std::string>();
    }
    return decision;
}

RoutingPipeline::RoutingPipeline(llm::Completion& completion, session::ClientSession& session,
                                 core::logging::EventSink& events, PipelineOptions options,
                                 std::vector<ToolDescriptor> catalog)
    : completion_(completion),
      session_(session),
      events_(events),
      options_(options),
      catalog_(std::move(catalog)) {}

core::errors::Result<PipelineState> RoutingPipeline::run(const std::string& message) {
    PipelineState state;
    state.message = message;

    auto routed = route(state);
    if (core::errors::is_error(routed)) {
        return core::errors::get_error(routed);
    }
    auto answer = respond(state);
    if (core::errors::is_error(answer)) {
        return core::errors::get_error(answer);
    }
    return state;
}

std::optional<ToolDescriptor> RoutingPipeline::select_tool(const RoutingDecision& decision) const {
    if (decision.tool == ToolSelector::None || !decision.parameters.has_value() ||
        !decision.parameters->is_object()) {
        return std::nullopt;
    }
    for (const auto& descriptor : catalog_) {
        if (descriptor.selector != decision.tool) {
            continue;
        }
        auto it = decision.parameters->find(descriptor.required_parameter);
        if (it == decision.parameters->end() || it->is_null()) {
            return std::nullopt;
        }
        return descriptor;
    }
    return std::nullopt;
}

void RoutingPipeline::fall_back(PipelineState& state, const std::string& reason) {
    state.tool_result.reset();
    state.routed = true;
    events_.emit(protocol::RoutingFallbackEvent{reason});
}

core::errors::Result<bool> RoutingPipeline::route(PipelineState& state) {
    if (state.routed) {
        return RelayError{ErrorCategory::Internal, "Turn has already been routed.",
                          "pipeline_already_routed"};
    }

    CompletionRequest request;
    request.system_prompt = kRoutingSystemPrompt;
    request.user_prompt = build_routing_prompt(state.message, catalog_);
    request.response_format = ResponseFormat::JsonObject;
    request.temperature = options_.routing_temperature;

    auto completion = completion_.complete(request);
    if (core::errors::is_error(completion)) {
        const auto& err = core::errors::get_error(completion);
        RELAY_LOG_WARN("RoutingPipeline: routing completion failed [" + err.code +
                       "]: " + err.message);
        fall_back(state, "routing completion failed: " + err.message);
        return false;
    }

    auto parsed = parse_routing_decision(core::errors::get_value(completion), catalog_);
    if (core::errors::is_error(parsed)) {
        const auto& err = core::errors::get_error(parsed);
        RELAY_LOG_WARN("RoutingPipeline: routing error [" + err.code + "]: " + err.message);
        fall_back(state, err.message);
        return false;
    }

    const RoutingDecision& decision = core::errors::get_value(parsed);
    events_.emit(protocol::RoutingDecisionEvent{to_string(decision.tool), decision.reasoning});

    const auto tool = select_tool(decision);
    if (!tool.has_value()) {
        fall_back(state, decision.tool == ToolSelector::None
                             ? "no tool needed"
                             : "parameters do not match " + to_string(decision.tool));
        return false;
    }

    protocol::ToolCall call{tool->name, decision.parameters.value()};
    auto outcome = session_.call_tool(call);
    if (core::errors::is_error(outcome)) {
        const auto& err = core::errors::get_error(outcome);
        RELAY_LOG_ERROR("RoutingPipeline: " + tool->name + " unavailable [" + err.code +
                        "]: " + err.message);
        state.tool_result = json{{"error", err.message}};
        events_.emit(protocol::ToolInvocationEvent{tool->name, false});
    } else {
        const json& payload = core::errors::get_value(outcome);
        const bool failed = payload.is_object() && payload.contains("error");
        events_.emit(protocol::ToolInvocationEvent{tool->name, !failed});
        if (payload.is_null()) {
            // Nothing to ground on; answered like a direct question.
            state.tool_result.reset();
        } else {
            state.tool_result = payload;
        }
    }
    state.routed = true;
    return true;
}

core::errors::Result<std::string> RoutingPipeline::respond(PipelineState& state) {
    if (!state.routed) {
        return RelayError{ErrorCategory::Internal, "Turn must be routed before it is answered.",
                          "pipeline_not_routed"};
    }

    CompletionRequest request;
    request.temperature = options_.answer_temperature;

    if (!state.tool_result.has_value()) {
        request.system_prompt = kDirectSystemPrompt;
        request.user_prompt = state.message;
    } else {
        // Error-shaped tool results are passed through like any other data.
        std::ostringstream prompt;
        prompt << "User question: " << state.message << "\n\n"
               << "Tool results:\n"
               << dump_safe(state.tool_result.value(), 2) << "\n\n"
               << "Provide a helpful answer based on this information. "
               << "Please limit your answer in " << options_.answer_word_limit << " words.";
        request.system_prompt = kGroundedSystemPrompt;
        request.user_prompt = prompt.str();
    }

    auto completion = completion_.complete(request);
    if (core::errors::is_error(completion)) {
        const auto& err = core::errors::get_error(completion);
        RELAY_LOG_ERROR("RoutingPipeline: answer completion failed [" + err.code +
                        "]: " + err.message);
        return err;
    }

    state.result = core::errors::get_value(completion);
    events_.emit(protocol::ResponseComposedEvent{state.tool_result.has_value(),
                                                 state.result->size()});
    return state.result.value();
}

}  // namespace relay::pipeline
