#pragma once
#include <string>
#include <vector>

namespace autoloop::protocol {

    // Exact, case-sensitive value returned by the done tool.
    inline constexpr const char* kCompletionSentinel = "AUTOLOOP_DONE";

    // How the decision provider asks the loop to run a tool
    struct ToolCall {
        std::string id;
        std::string name;       // e.g., "read_file", "run_command"
        std::string arguments;  // Raw JSON object text of the arguments
    };

    enum class ParameterType {
        String,
        OptionalString
    };

    struct ToolParameter {
        std::string name;
        ParameterType type = ParameterType::String;
        std::string description;
    };

    // What the provider is told about a tool: name, description and typed arguments.
    struct ToolSpec {
        std::string name;
        std::string description;
        std::vector<ToolParameter> parameters;

        // JSON-schema object describing the parameters.
        std::string parameters_json() const;
    };

} // namespace autoloop::protocol
