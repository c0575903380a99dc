#pragma once

#include <string>
#include <vector>
#include "core/errors/loop_errors.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace autoloop::runtime {

// The reasoning step. Given the conversation so far, the system prompt and the
// tools on offer, produce either tool calls or a final message. Failures are
// reported as Provider errors and stop the loop.
class DecisionProvider {
public:
    virtual ~DecisionProvider() = default;

    virtual core::errors::Result<protocol::Decision> decide(
        const std::vector<protocol::Message>& history,
        const std::string& system_prompt,
        const std::vector<protocol::ToolSpec>& tools) = 0;
};

}  // namespace autoloop::runtime
