#pragma once

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include "core/config/loop_config.hpp"
#include "core/errors/loop_errors.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/run_execution_contract.hpp"
#include "runtime/decision_provider.hpp"
#include "runtime/loop_observer.hpp"
#include "runtime/prompt_builder.hpp"
#include "tools/tool_dispatcher.hpp"

namespace autoloop::runtime {

inline constexpr const char* kInitialUserMessage = "Please execute the instruction.";

struct LoopSettings {
    std::filesystem::path working_directory;
    std::uint32_t limit = 1;
    // Working copy read at the top of every iteration.
    std::filesystem::path instruction_path;
    // Used whenever the working copy cannot be read.
    std::string initial_instruction;
    std::string base_prompt = PromptBuilder::default_base_prompt();
    std::string ledger_branch = "main";
    std::uint32_t command_timeout_ms = core::config::kDefaultCommandTimeoutSeconds * 1000;
    std::istream* operator_input = &std::cin;
    std::ostream* operator_output = &std::cout;
};

// Drives up to `limit` steps against one conversation history. Stops early when
// a tool message carrying the completion sentinel appears among the last two
// messages, and stops for good on the first step-level failure.
class LoopController {
public:
    LoopController(LoopSettings settings, DecisionProvider& provider,
                   const tools::ToolDispatcher& tools, LoopObserver* observer = nullptr);

    // An error means the run is misconfigured and no iteration ran. Failures
    // during the run are reported through RunResult::status and RunResult::error.
    core::errors::Result<protocol::RunResult> run();

    static bool is_completion_signaled(const std::vector<protocol::Message>& history);

private:
    LoopSettings settings_;
    DecisionProvider& provider_;
    const tools::ToolDispatcher& tools_;
    LoggingObserver default_observer_;
    LoopObserver* observer_;
};

}  // namespace autoloop::runtime
