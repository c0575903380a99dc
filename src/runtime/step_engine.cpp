#include "runtime/step_engine.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace autoloop::runtime {

using protocol::Message;
using protocol::Role;

StepEngine::StepEngine(DecisionProvider& provider, const tools::ToolDispatcher& tools,
                       PromptBuilder prompt_builder, tools::ToolContext context)
    : provider_(provider),
      tools_(tools),
      prompt_builder_(std::move(prompt_builder)),
      context_(std::move(context)) {}

core::errors::Result<std::vector<Message>> StepEngine::run_step(
    const std::vector<Message>& history, const std::string& instruction) {
    const std::string system_prompt = prompt_builder_.build(instruction);

    auto decided = provider_.decide(history, system_prompt, tools_.specs());
    if (core::errors::is_error(decided)) {
        return core::errors::get_error(decided);
    }
    const auto& decision = core::errors::get_value(decided);

    std::vector<Message> delta;
    delta.push_back(Message{Role::Assistant, decision.content, decision.tool_calls,
                            std::nullopt, std::nullopt});
    if (!decision.has_tool_calls()) {
        return delta;
    }

    // Sequential on purpose: a later call must observe an earlier call's writes.
    for (const auto& call : decision.tool_calls) {
        AUTOLOOP_LOG_DEBUG("Executing tool call " + call.id + " (" + call.name + ")");
        delta.push_back(protocol::make_tool_message(call, tools_.execute(call, context_)));
    }
    return delta;
}

}  // namespace autoloop::runtime
