#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "runtime/decision_provider.hpp"

namespace autoloop::runtime {

// Replays a fixed list of decisions, one per call. The decisions file is a JSON
// array of {"content": "...", "tool_calls": [{"id", "name", "arguments"}]}.
class ScriptedDecisionProvider : public DecisionProvider {
public:
    explicit ScriptedDecisionProvider(std::vector<protocol::Decision> script);

    static core::errors::Result<ScriptedDecisionProvider> from_json(
        const std::string& json_text);

    static core::errors::Result<ScriptedDecisionProvider> from_file(
        const std::filesystem::path& decisions_file);

    core::errors::Result<protocol::Decision> decide(
        const std::vector<protocol::Message>& history,
        const std::string& system_prompt,
        const std::vector<protocol::ToolSpec>& tools) override;

    std::size_t remaining() const { return script_.size() - next_; }

    // System prompts received so far, in call order.
    const std::vector<std::string>& prompts() const { return prompts_; }

private:
    std::vector<protocol::Decision> script_;
    std::size_t next_ = 0;
    std::vector<std::string> prompts_;
};

}  // namespace autoloop::runtime
