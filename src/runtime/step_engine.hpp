#pragma once

#include <string>
#include <vector>
#include "core/errors/loop_errors.hpp"
#include "protocol/message_contract.hpp"
#include "runtime/decision_provider.hpp"
#include "runtime/prompt_builder.hpp"
#include "tools/tool_context.hpp"
#include "tools/tool_dispatcher.hpp"

namespace autoloop::runtime {

// One decide/execute/append cycle. The engine keeps no conversation state; it
// returns the messages produced by this step for the caller to append.
class StepEngine {
public:
    StepEngine(DecisionProvider& provider, const tools::ToolDispatcher& tools,
               PromptBuilder prompt_builder, tools::ToolContext context);

    // Returns the assistant message followed by one tool message per requested
    // call, in request order. A provider failure is returned as is.
    core::errors::Result<std::vector<protocol::Message>> run_step(
        const std::vector<protocol::Message>& history, const std::string& instruction);

private:
    DecisionProvider& provider_;
    const tools::ToolDispatcher& tools_;
    PromptBuilder prompt_builder_;
    tools::ToolContext context_;
};

}  // namespace autoloop::runtime
