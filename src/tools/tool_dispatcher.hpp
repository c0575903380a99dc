#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/tool_contract.hpp"
#include "tools/tool_context.hpp"
#include "tools/tool_host.hpp"

namespace autoloop::tools {

using ToolHandler =
    std::function<std::string(const nlohmann::json& arguments, const ToolContext& context)>;

// Name-to-handler table for the tools the decision provider may call. Execute
// never throws: unknown names, bad arguments and faults inside a handler all
// come back as error strings so the model can react to them.
class ToolDispatcher {
public:
    void register_tool(protocol::ToolSpec spec, ToolHandler handler);

    // Keeps only the named tools; "done" always stays so a run can finish.
    void restrict_to(const std::vector<std::string>& allowed);

    bool has(const std::string& name) const;
    std::vector<protocol::ToolSpec> specs() const;

    std::string execute(const protocol::ToolCall& call, const ToolContext& context) const;

private:
    struct Entry {
        protocol::ToolSpec spec;
        ToolHandler handler;
    };

    std::map<std::string, Entry> tools_;
};

// Registers list_files, read_file, write_file, run_command, update_ledger,
// ask_user, update_instruction and done.
ToolDispatcher make_default_dispatcher(ToolHost host = ToolHost{});

}  // namespace autoloop::tools
