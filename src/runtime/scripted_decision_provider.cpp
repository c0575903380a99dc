#include "runtime/scripted_decision_provider.hpp"

#include <fstream>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace autoloop::runtime {

using core::errors::ErrorCategory;
using core::errors::LoopError;
using nlohmann::json;
using protocol::Decision;
using protocol::ToolCall;

namespace {

LoopError invalid_decision(const std::string& message) {
    return LoopError{ErrorCategory::Provider, message, "invalid_decision"};
}

core::errors::Result<Decision> decision_from_json(const json& entry, std::size_t index,
                                                  std::size_t& call_counter) {
    const std::string where = "decision #" + std::to_string(index + 1);
    if (!entry.is_object()) {
        return invalid_decision(where + " must be a JSON object");
    }

    Decision decision;
    if (entry.contains("content")) {
        if (!entry.at("content").is_string()) {
            return invalid_decision(where + ": 'content' must be a string");
        }
        decision.content = entry.at("content").get<std::string>();
    }

    if (!entry.contains("tool_calls")) {
        return decision;
    }
    const auto& calls = entry.at("tool_calls");
    if (!calls.is_array()) {
        return invalid_decision(where + ": 'tool_calls' must be an array");
    }
    for (const auto& raw_call : calls) {
        if (!raw_call.is_object() || !raw_call.contains("name") ||
            !raw_call.at("name").is_string()) {
            return invalid_decision(where + ": every tool call needs a string 'name'");
        }

        ToolCall call;
        ++call_counter;
        call.name = raw_call.at("name").get<std::string>();
        if (raw_call.contains("id") && raw_call.at("id").is_string()) {
            call.id = raw_call.at("id").get<std::string>();
        } else {
            call.id = "call-" + std::to_string(call_counter);
        }

        if (raw_call.contains("arguments")) {
            const auto& arguments = raw_call.at("arguments");
            // Arguments may be given inline or as already-serialized JSON text.
            call.arguments = arguments.is_string() ? arguments.get<std::string>()
                                                   : arguments.dump();
        } else {
            call.arguments = "{}";
        }
        decision.tool_calls.push_back(std::move(call));
    }
    return decision;
}

}  // namespace

ScriptedDecisionProvider::ScriptedDecisionProvider(std::vector<Decision> script)
    : script_(std::move(script)) {}

core::errors::Result<ScriptedDecisionProvider> ScriptedDecisionProvider::from_json(
    const std::string& json_text) {
    const json doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        return invalid_decision("Decisions file is not valid JSON.");
    }
    if (!doc.is_array()) {
        return invalid_decision("Decisions file must contain a JSON array.");
    }

    std::vector<Decision> script;
    std::size_t call_counter = 0;
    for (std::size_t i = 0; i < doc.size(); ++i) {
        auto decision = decision_from_json(doc.at(i), i, call_counter);
        if (core::errors::is_error(decision)) {
            return core::errors::get_error(decision);
        }
        script.push_back(core::errors::get_value(decision));
    }
    return ScriptedDecisionProvider(std::move(script));
}

core::errors::Result<ScriptedDecisionProvider> ScriptedDecisionProvider::from_file(
    const std::filesystem::path& decisions_file) {
    std::ifstream in(decisions_file);
    if (!in.is_open()) {
        return LoopError{ErrorCategory::Input,
                         "Unable to open decisions file: " + decisions_file.string(),
                         "invalid_path"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return from_json(buffer.str());
}

core::errors::Result<Decision> ScriptedDecisionProvider::decide(
    const std::vector<protocol::Message>& history,
    const std::string& system_prompt,
    const std::vector<protocol::ToolSpec>& tools) {
    static_cast<void>(history);
    static_cast<void>(tools);
    prompts_.push_back(system_prompt);

    if (next_ >= script_.size()) {
        return LoopError{ErrorCategory::Provider,
                         "No scripted decision left after " +
                             std::to_string(script_.size()) + " call(s).",
                         "decision_script_exhausted",
                         "Add more entries to the decisions file or lower --limit."};
    }
    return script_[next_++];
}

}  // namespace autoloop::runtime
