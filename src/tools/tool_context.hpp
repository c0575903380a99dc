#pragma once

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include "core/config/loop_config.hpp"

namespace autoloop::tools {

// Everything a tool may depend on for one run, passed explicitly to each call.
struct ToolContext {
    std::filesystem::path workspace_root;
    // Working copy of the instruction; empty when update_instruction is unavailable.
    std::filesystem::path instruction_path;
    std::string ledger_branch = "main";
    std::uint32_t command_timeout_ms = core::config::kDefaultCommandTimeoutSeconds * 1000;
    // Operator channel for ask_user.
    std::istream* operator_input = &std::cin;
    std::ostream* operator_output = &std::cout;
};

}  // namespace autoloop::tools
