#include "runtime/loop_controller.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"
#include "policy/path_sandbox.hpp"
#include "runtime/step_engine.hpp"
#include "session/instruction_store.hpp"

namespace autoloop::runtime {

using core::errors::ErrorCategory;
using core::errors::LoopError;
using protocol::Message;
using protocol::Role;
using protocol::RunResult;
using protocol::RunStatus;

LoopController::LoopController(LoopSettings settings, DecisionProvider& provider,
                               const tools::ToolDispatcher& tools,
                               LoopObserver* observer)
    : settings_(std::move(settings)),
      provider_(provider),
      tools_(tools),
      observer_(observer != nullptr ? observer : &default_observer_) {}

bool LoopController::is_completion_signaled(const std::vector<Message>& history) {
    const std::size_t window = history.size() < 2 ? history.size() : 2;
    for (std::size_t i = history.size() - window; i < history.size(); ++i) {
        const auto& message = history[i];
        if (message.role == Role::Tool &&
            message.content == protocol::kCompletionSentinel) {
            return true;
        }
    }
    return false;
}

core::errors::Result<RunResult> LoopController::run() {
    auto root_result = policy::PathSandbox::canonical_root(settings_.working_directory);
    if (core::errors::is_error(root_result)) {
        return core::errors::get_error(root_result);
    }
    const auto root = core::errors::get_value(root_result);

    if (settings_.limit == 0) {
        return LoopError{ErrorCategory::Config, "Iteration limit must be at least 1.",
                         "invalid_limit"};
    }
    if (settings_.instruction_path.empty()) {
        return LoopError{ErrorCategory::Config,
                         "No instruction file path found in configuration.",
                         "missing_instruction_path"};
    }

    tools::ToolContext context;
    context.workspace_root = root;
    context.instruction_path = settings_.instruction_path;
    context.ledger_branch = settings_.ledger_branch;
    context.command_timeout_ms = settings_.command_timeout_ms;
    context.operator_input = settings_.operator_input;
    context.operator_output = settings_.operator_output;

    const session::InstructionStore instructions(settings_.instruction_path,
                                                 settings_.initial_instruction);
    StepEngine engine(provider_, tools_, PromptBuilder(settings_.base_prompt, root),
                      context);

    RunResult result;
    result.status = RunStatus::Exhausted;
    result.history.push_back(protocol::make_user_message(kInitialUserMessage));

    for (std::uint32_t index = 1; index <= settings_.limit; ++index) {
        observer_->on_iteration_start(index, settings_.limit);
        result.iterations = index;

        const std::string instruction = instructions.load();

        core::errors::Result<std::vector<Message>> step;
        try {
            step = engine.run_step(result.history, instruction);
        } catch (const std::exception& ex) {
            step = LoopError{ErrorCategory::Internal,
                             std::string("Step raised an exception: ") + ex.what(),
                             "step_exception"};
        }

        // The history may be inconsistent after a failed step; never retry it.
        if (core::errors::is_error(step)) {
            const auto& error = core::errors::get_error(step);
            result.status = RunStatus::Failed;
            result.error = error;
            observer_->on_error(index, error);
            break;
        }

        const auto& delta = core::errors::get_value(step);
        result.history.insert(result.history.end(), delta.begin(), delta.end());
        observer_->on_iteration_end(protocol::IterationRecord{index, delta});

        if (is_completion_signaled(result.history)) {
            result.status = RunStatus::Completed;
            break;
        }
    }

    AUTOLOOP_LOG_DEBUG("Loop finished with status " + protocol::to_string(result.status));
    observer_->on_finished(result);
    return result;
}

}  // namespace autoloop::runtime
