#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/relay_errors.hpp"
#include "core/logging/event_sink.hpp"
#include "llm/completion.hpp"
#include "session/client_session.hpp"

namespace relay::pipeline {

enum class ToolSelector {
    None,
    Weather,
    WebSearch
};

struct ToolDescriptor {
    ToolSelector selector;
    std::string name;
    std::string description;
    std::string required_parameter;
};

struct RoutingDecision {
    ToolSelector tool = ToolSelector::None;
    std::optional<nlohmann::json> parameters;
    std::string reasoning;
};

// One user turn. Created at entry, mutated once per stage.
struct PipelineState {
    std::string message;
    std::optional<nlohmann::json> tool_result;
    std::optional<std::string> result;
    bool routed = false;
};

struct PipelineOptions {
    double routing_temperature = 0.3;
    double answer_temperature = 0.7;
    std::size_t answer_word_limit = 100;
};

std::string to_string(ToolSelector selector);

// get_weather (city) and web_search (query).
const std::vector<ToolDescriptor>& default_tool_catalog();

std::string build_routing_prompt(const std::string& message,
                                 const std::vector<ToolDescriptor>& catalog);

// Parses the model's routing JSON. Unknown tool names, a non-object body or
// missing fields are errors; callers treat any error as "no tool".
core::errors::Result<RoutingDecision> parse_routing_decision(
    const std::string& text, const std::vector<ToolDescriptor>& catalog);

// route -> respond. Failures below the pipeline are folded into tool_result;
// only a failing final completion or out-of-order stage is returned as an error.
class RoutingPipeline {
public:
    RoutingPipeline(llm::Completion& completion, session::ClientSession& session,
                    core::logging::EventSink& events = core::logging::default_event_sink(),
                    PipelineOptions options = {},
                    std::vector<ToolDescriptor> catalog = default_tool_catalog());

    core::errors::Result<PipelineState> run(const std::string& message);

    // Stage 1. Routing problems fall back to tool_result = null; a state that
    // was already routed is rejected. Returns whether a tool was invoked.
    core::errors::Result<bool> route(PipelineState& state);

    // Stage 2. Rejects a state that has not been routed.
    core::errors::Result<std::string> respond(PipelineState& state);

private:
    std::optional<ToolDescriptor> select_tool(const RoutingDecision& decision) const;
    void fall_back(PipelineState& state, const std::string& reason);

    llm::Completion& completion_;
    session::ClientSession& session_;
    core::logging::EventSink& events_;
    PipelineOptions options_;
    std::vector<ToolDescriptor> catalog_;
};

}  // namespace relay::pipeline
