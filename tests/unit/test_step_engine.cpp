#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/id_generator.hpp"
#include "core/errors/loop_errors.hpp"
#include "protocol/message_contract.hpp"
#include "runtime/prompt_builder.hpp"
#include "runtime/scripted_decision_provider.hpp"
#include "runtime/step_engine.hpp"
#include "tools/tool_dispatcher.hpp"

namespace {

using autoloop::core::errors::get_error;
using autoloop::core::errors::get_value;
using autoloop::core::errors::is_error;
using autoloop::protocol::Message;
using autoloop::protocol::Role;
using autoloop::runtime::PromptBuilder;
using autoloop::runtime::ScriptedDecisionProvider;
using autoloop::runtime::StepEngine;
using autoloop::tools::ToolContext;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_step_engine_" + autoloop::core::config::generate_run_id());
        std::filesystem::create_directories(root_);
        root_ = std::filesystem::canonical(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

ScriptedDecisionProvider load_script(const std::string& json_text) {
    auto loaded = ScriptedDecisionProvider::from_json(json_text);
    EXPECT_FALSE(is_error(loaded));
    return get_value(loaded);
}

ToolContext make_context(const std::filesystem::path& root) {
    ToolContext context;
    context.workspace_root = root;
    context.instruction_path = root / "task.md";
    return context;
}

TEST(StepEngineTest, TextOnlyDecisionYieldsSingleAssistantMessage) {
    TempWorkspace workspace;
    auto provider = load_script(R"([{"content": "thinking out loud"}])");
    const auto tools = autoloop::tools::make_default_dispatcher();
    StepEngine engine(provider, tools, PromptBuilder("base", workspace.root()),
                      make_context(workspace.root()));

    auto step = engine.run_step({autoloop::protocol::make_user_message("go")}, "do it");
    ASSERT_FALSE(is_error(step));
    const auto& delta = get_value(step);
    ASSERT_EQ(delta.size(), 1u);
    EXPECT_EQ(delta[0].role, Role::Assistant);
    EXPECT_EQ(delta[0].content, "thinking out loud");
    EXPECT_TRUE(delta[0].tool_calls.empty());
}

TEST(StepEngineTest, ExecutesCallsInOrderAndPairsResults) {
    TempWorkspace workspace;
    auto provider = load_script(R"([{"content": "", "tool_calls": [
        {"id": "w", "name": "write_file", "arguments": {"path": "f.txt", "content": "v1"}},
        {"id": "r", "name": "read_file", "arguments": {"path": "f.txt"}},
        {"id": "d", "name": "done", "arguments": {}}
    ]}])");
    const auto tools = autoloop::tools::make_default_dispatcher();
    StepEngine engine(provider, tools, PromptBuilder("base", workspace.root()),
                      make_context(workspace.root()));

    auto step = engine.run_step({}, "write then read");
    ASSERT_FALSE(is_error(step));
    const auto& delta = get_value(step);
    ASSERT_EQ(delta.size(), 4u);

    EXPECT_EQ(delta[0].role, Role::Assistant);
    EXPECT_EQ(delta[0].tool_calls.size(), 3u);

    EXPECT_EQ(delta[1].role, Role::Tool);
    EXPECT_EQ(delta[1].tool_call_id.value(), "w");
    EXPECT_EQ(delta[1].tool_name.value(), "write_file");
    EXPECT_EQ(delta[1].content, "Successfully wrote to f.txt");

    EXPECT_EQ(delta[2].tool_call_id.value(), "r");
    EXPECT_EQ(delta[2].content, "v1");

    EXPECT_EQ(delta[3].tool_call_id.value(), "d");
    EXPECT_EQ(delta[3].content, autoloop::protocol::kCompletionSentinel);
}

TEST(StepEngineTest, ToolFailureStaysInConversation) {
    TempWorkspace workspace;
    auto provider = load_script(R"([{"tool_calls": [
        {"id": "x", "name": "read_file", "arguments": {"path": "missing.txt"}},
        {"id": "y", "name": "no_such_tool"}
    ]}])");
    const auto tools = autoloop::tools::make_default_dispatcher();
    StepEngine engine(provider, tools, PromptBuilder("base", workspace.root()),
                      make_context(workspace.root()));

    auto step = engine.run_step({}, "read");
    ASSERT_FALSE(is_error(step));
    const auto& delta = get_value(step);
    ASSERT_EQ(delta.size(), 3u);
    EXPECT_EQ(delta[1].content.rfind("Error reading file missing.txt: ", 0), 0u);
    EXPECT_EQ(delta[2].content, "Error: Tool 'no_such_tool' not found");
}

TEST(StepEngineTest, PromptCarriesInstructionAndDirectory) {
    TempWorkspace workspace;
    auto provider = load_script(R"([{"content": "ok"}])");
    const auto tools = autoloop::tools::make_default_dispatcher();
    StepEngine engine(provider, tools, PromptBuilder("BASE PROMPT", workspace.root()),
                      make_context(workspace.root()));

    ASSERT_FALSE(is_error(engine.run_step({}, "Refactor the parser")));
    ASSERT_EQ(provider.prompts().size(), 1u);
    const auto& prompt = provider.prompts()[0];
    EXPECT_EQ(prompt.rfind("BASE PROMPT", 0), 0u);
    EXPECT_NE(prompt.find("You are working in the directory: " + workspace.root().string()),
              std::string::npos);
    EXPECT_NE(prompt.find("Your goal is to follow these instructions:\nRefactor the parser"),
              std::string::npos);
}

TEST(StepEngineTest, ProviderFailureIsReturned) {
    TempWorkspace workspace;
    auto provider = load_script("[]");
    const auto tools = autoloop::tools::make_default_dispatcher();
    StepEngine engine(provider, tools, PromptBuilder("base", workspace.root()),
                      make_context(workspace.root()));

    auto step = engine.run_step({}, "anything");
    ASSERT_TRUE(is_error(step));
    EXPECT_EQ(get_error(step).code, "decision_script_exhausted");
}

}  // namespace
