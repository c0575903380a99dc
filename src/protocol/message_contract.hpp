#pragma once
#include <string>
#include <vector>
#include <optional>
#include <utility>
#include "tool_contract.hpp"

namespace autoloop::protocol {

    enum class Role {
        User,
        Assistant,
        Tool
    };

    struct Message {
        Role role;
        std::string content;

        // Set on assistant messages that request tool execution.
        std::vector<ToolCall> tool_calls;

        // Set on tool messages: which call this result answers, and the tool name.
        std::optional<std::string> tool_call_id;
        std::optional<std::string> tool_name;
    };

    inline std::string to_string(const Role role) {
        switch (role) {
            case Role::User: return "user";
            case Role::Assistant: return "assistant";
            case Role::Tool: return "tool";
            default: return "unknown";
        }
    }

    inline Message make_user_message(std::string content) {
        return Message{Role::User, std::move(content), {}, std::nullopt, std::nullopt};
    }

    inline Message make_tool_message(const ToolCall& call, std::string result) {
        return Message{Role::Tool, std::move(result), {}, call.id, call.name};
    }

    // The model's answer for one step: a final message, or tool calls to run in order.
    struct Decision {
        std::string content;
        std::vector<ToolCall> tool_calls;

        bool has_tool_calls() const { return !tool_calls.empty(); }
    };

} // namespace autoloop::protocol
