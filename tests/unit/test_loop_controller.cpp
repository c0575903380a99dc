#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/id_generator.hpp"
#include "core/errors/loop_errors.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/run_execution_contract.hpp"
#include "runtime/decision_provider.hpp"
#include "runtime/loop_controller.hpp"
#include "runtime/loop_observer.hpp"
#include "runtime/scripted_decision_provider.hpp"
#include "tools/tool_dispatcher.hpp"

namespace {

using autoloop::core::errors::ErrorCategory;
using autoloop::core::errors::LoopError;
using autoloop::core::errors::Result;
using autoloop::core::errors::get_error;
using autoloop::core::errors::get_value;
using autoloop::core::errors::is_error;
using autoloop::protocol::Decision;
using autoloop::protocol::IterationRecord;
using autoloop::protocol::Message;
using autoloop::protocol::Role;
using autoloop::protocol::RunResult;
using autoloop::protocol::RunStatus;
using autoloop::protocol::ToolSpec;
using autoloop::runtime::LoopController;
using autoloop::runtime::LoopObserver;
using autoloop::runtime::LoopSettings;
using autoloop::runtime::ScriptedDecisionProvider;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_loop_controller_" + autoloop::core::config::generate_run_id());
        std::filesystem::create_directories(root_ / "prompts/instructions");
        root_ = std::filesystem::canonical(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path instruction() const {
        return root_ / "prompts/instructions/task.md";
    }

private:
    std::filesystem::path root_;
};

class RecordingObserver : public LoopObserver {
public:
    void on_iteration_start(std::uint32_t index, std::uint32_t) override {
        started.push_back(index);
    }
    void on_iteration_end(const IterationRecord& record) override {
        ended.push_back(record.index);
    }
    void on_error(std::uint32_t, const LoopError& error) override {
        errors.push_back(error.code);
    }
    void on_finished(const RunResult&) override { ++finished; }

    std::vector<std::uint32_t> started;
    std::vector<std::uint32_t> ended;
    std::vector<std::string> errors;
    int finished = 0;
};

class ThrowingProvider : public autoloop::runtime::DecisionProvider {
public:
    Result<Decision> decide(const std::vector<Message>&, const std::string&,
                            const std::vector<ToolSpec>&) override {
        throw std::runtime_error("provider crashed");
    }
};

ScriptedDecisionProvider load_script(const std::string& json_text) {
    auto loaded = ScriptedDecisionProvider::from_json(json_text);
    EXPECT_FALSE(is_error(loaded));
    return get_value(loaded);
}

LoopSettings make_settings(const TempWorkspace& workspace, std::uint32_t limit,
                           const std::string& instruction) {
    {
        std::ofstream out(workspace.instruction());
        out << instruction;
    }
    LoopSettings settings;
    settings.working_directory = workspace.root();
    settings.limit = limit;
    settings.instruction_path = workspace.instruction();
    settings.initial_instruction = instruction;
    settings.base_prompt = "base";
    return settings;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

TEST(LoopControllerTest, StopsWhenDoneIsCalled) {
    TempWorkspace workspace;
    auto provider = load_script(R"([
        {"content": "writing", "tool_calls": [
            {"id": "w", "name": "write_file", "arguments": {"path": "out.txt", "content": "hello"}}]},
        {"content": "finished", "tool_calls": [{"id": "d", "name": "done"}]},
        {"content": "never reached"}
    ])");
    const auto tools = autoloop::tools::make_default_dispatcher();
    RecordingObserver observer;

    LoopController controller(make_settings(workspace, 5, "write hello"), provider, tools,
                              &observer);
    auto outcome = controller.run();
    ASSERT_FALSE(is_error(outcome));

    const auto& result = get_value(outcome);
    EXPECT_EQ(result.status, RunStatus::Completed);
    EXPECT_EQ(result.iterations, 2u);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(provider.remaining(), 1u);
    EXPECT_EQ(read_file(workspace.root() / "out.txt"), "hello");

    ASSERT_EQ(result.history.size(), 5u);
    EXPECT_EQ(result.history[0].role, Role::User);
    EXPECT_EQ(result.history[0].content, autoloop::runtime::kInitialUserMessage);
    EXPECT_EQ(result.history.back().content, autoloop::protocol::kCompletionSentinel);

    const std::vector<std::uint32_t> expected = {1, 2};
    EXPECT_EQ(observer.started, expected);
    EXPECT_EQ(observer.ended, expected);
    EXPECT_EQ(observer.finished, 1);
}

TEST(LoopControllerTest, RunsExactlyLimitIterationsWithoutCompletion) {
    TempWorkspace workspace;
    auto provider = load_script(R"([
        {"content": "step one"}, {"content": "step two"}, {"content": "step three"},
        {"content": "step four"}
    ])");
    const auto tools = autoloop::tools::make_default_dispatcher();

    LoopController controller(make_settings(workspace, 3, "keep going"), provider, tools);
    auto outcome = controller.run();
    ASSERT_FALSE(is_error(outcome));

    const auto& result = get_value(outcome);
    EXPECT_EQ(result.status, RunStatus::Exhausted);
    EXPECT_EQ(result.iterations, 3u);
    EXPECT_EQ(result.history.size(), 4u);
    EXPECT_EQ(provider.remaining(), 1u);
}

TEST(LoopControllerTest, SentinelInAssistantTextDoesNotComplete) {
    TempWorkspace workspace;
    auto provider = load_script(R"([{"content": "AUTOLOOP_DONE"}, {"content": "again"}])");
    const auto tools = autoloop::tools::make_default_dispatcher();

    LoopController controller(make_settings(workspace, 2, "x"), provider, tools);
    auto outcome = controller.run();
    ASSERT_FALSE(is_error(outcome));
    EXPECT_EQ(get_value(outcome).status, RunStatus::Exhausted);
    EXPECT_EQ(get_value(outcome).iterations, 2u);
}

TEST(LoopControllerTest, InstructionUpdateIsSeenNextIteration) {
    TempWorkspace workspace;
    auto provider = load_script(R"([
        {"tool_calls": [{"name": "update_instruction", "arguments": {"new_instruction": "X"}}]},
        {"tool_calls": [{"name": "done"}]}
    ])");
    const auto tools = autoloop::tools::make_default_dispatcher();

    LoopController controller(make_settings(workspace, 4, "original text"), provider, tools);
    auto outcome = controller.run();
    ASSERT_FALSE(is_error(outcome));
    EXPECT_EQ(get_value(outcome).status, RunStatus::Completed);

    ASSERT_EQ(provider.prompts().size(), 2u);
    EXPECT_NE(provider.prompts()[0].find("original text"), std::string::npos);
    EXPECT_NE(provider.prompts()[1].find("instructions:\nX\n"), std::string::npos);
    EXPECT_EQ(provider.prompts()[1].find("original text"), std::string::npos);
}

TEST(LoopControllerTest, FallsBackToInitialInstructionWhenFileRemoved) {
    TempWorkspace workspace;
    auto provider = load_script(R"([{"content": "a"}])");
    const auto tools = autoloop::tools::make_default_dispatcher();

    auto settings = make_settings(workspace, 1, "remembered instruction");
    std::filesystem::remove(workspace.instruction());
    LoopController controller(settings, provider, tools);
    ASSERT_FALSE(is_error(controller.run()));

    ASSERT_EQ(provider.prompts().size(), 1u);
    EXPECT_NE(provider.prompts()[0].find("remembered instruction"), std::string::npos);
}

TEST(LoopControllerTest, ProviderFailureStopsTheRun) {
    TempWorkspace workspace;
    auto provider = load_script(R"([{"content": "only one"}])");
    const auto tools = autoloop::tools::make_default_dispatcher();
    RecordingObserver observer;

    LoopController controller(make_settings(workspace, 5, "x"), provider, tools, &observer);
    auto outcome = controller.run();
    ASSERT_FALSE(is_error(outcome));

    const auto& result = get_value(outcome);
    EXPECT_EQ(result.status, RunStatus::Failed);
    EXPECT_EQ(result.iterations, 2u);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->category, ErrorCategory::Provider);
    EXPECT_EQ(result.history.size(), 2u);

    const std::vector<std::string> expected_errors = {"decision_script_exhausted"};
    EXPECT_EQ(observer.errors, expected_errors);
    EXPECT_EQ(observer.ended.size(), 1u);
    EXPECT_EQ(observer.finished, 1);
}

TEST(LoopControllerTest, ThrownExceptionBecomesFailure) {
    TempWorkspace workspace;
    ThrowingProvider provider;
    const auto tools = autoloop::tools::make_default_dispatcher();

    LoopController controller(make_settings(workspace, 3, "x"), provider, tools);
    auto outcome = controller.run();
    ASSERT_FALSE(is_error(outcome));

    const auto& result = get_value(outcome);
    EXPECT_EQ(result.status, RunStatus::Failed);
    EXPECT_EQ(result.iterations, 1u);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, "step_exception");
    EXPECT_NE(result.error->message.find("provider crashed"), std::string::npos);
}

TEST(LoopControllerTest, RejectsInvalidConfiguration) {
    TempWorkspace workspace;
    auto provider = load_script("[]");
    const auto tools = autoloop::tools::make_default_dispatcher();

    auto no_root = make_settings(workspace, 1, "x");
    no_root.working_directory = workspace.root() / "missing";
    auto bad_root = LoopController(no_root, provider, tools).run();
    ASSERT_TRUE(is_error(bad_root));
    EXPECT_EQ(get_error(bad_root).code, "invalid_workspace_root");

    auto zero_limit = make_settings(workspace, 0, "x");
    auto bad_limit = LoopController(zero_limit, provider, tools).run();
    ASSERT_TRUE(is_error(bad_limit));
    EXPECT_EQ(get_error(bad_limit).code, "invalid_limit");

    auto no_instruction = make_settings(workspace, 1, "x");
    no_instruction.instruction_path.clear();
    auto bad_instruction = LoopController(no_instruction, provider, tools).run();
    ASSERT_TRUE(is_error(bad_instruction));
    EXPECT_EQ(get_error(bad_instruction).category, ErrorCategory::Config);
    EXPECT_EQ(get_error(bad_instruction).code, "missing_instruction_path");

    EXPECT_TRUE(provider.prompts().empty());
}

TEST(LoopControllerTest, CompletionCheckLooksAtLastTwoMessages) {
    const autoloop::protocol::ToolCall done{"d", "done", "{}"};
    const auto sentinel = autoloop::protocol::make_tool_message(done, "AUTOLOOP_DONE");
    const auto other = autoloop::protocol::make_tool_message(done, "other");

    EXPECT_FALSE(LoopController::is_completion_signaled({}));
    EXPECT_TRUE(LoopController::is_completion_signaled({sentinel}));
    EXPECT_TRUE(LoopController::is_completion_signaled({sentinel, other}));
    EXPECT_FALSE(LoopController::is_completion_signaled({sentinel, other, other}));
    EXPECT_FALSE(LoopController::is_completion_signaled(
        {autoloop::protocol::make_tool_message(done, "AUTOLOOP_DONE ")}));
}

}  // namespace
