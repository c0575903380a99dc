#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/loop_errors.hpp"
#include "runtime/scripted_decision_provider.hpp"

namespace {

using autoloop::core::errors::ErrorCategory;
using autoloop::core::errors::get_error;
using autoloop::core::errors::get_value;
using autoloop::core::errors::is_error;
using autoloop::runtime::ScriptedDecisionProvider;

TEST(ScriptedDecisionProviderTest, ReplaysDecisionsInOrder) {
    auto loaded = ScriptedDecisionProvider::from_json(R"([
        {"content": "looking around",
         "tool_calls": [{"id": "c1", "name": "list_files", "arguments": {"path": "."}}]},
        {"content": "all done"}
    ])");
    ASSERT_FALSE(is_error(loaded));
    auto provider = get_value(loaded);
    EXPECT_EQ(provider.remaining(), 2u);

    auto first = provider.decide({}, "prompt one", {});
    ASSERT_FALSE(is_error(first));
    const auto& decision = get_value(first);
    EXPECT_EQ(decision.content, "looking around");
    ASSERT_EQ(decision.tool_calls.size(), 1u);
    EXPECT_EQ(decision.tool_calls[0].id, "c1");
    EXPECT_EQ(decision.tool_calls[0].name, "list_files");
    EXPECT_EQ(decision.tool_calls[0].arguments, R"({"path":"."})");

    auto second = provider.decide({}, "prompt two", {});
    ASSERT_FALSE(is_error(second));
    EXPECT_FALSE(get_value(second).has_tool_calls());
    EXPECT_EQ(provider.remaining(), 0u);

    const std::vector<std::string> expected_prompts = {"prompt one", "prompt two"};
    EXPECT_EQ(provider.prompts(), expected_prompts);
}

TEST(ScriptedDecisionProviderTest, FillsMissingIdsAndArguments) {
    auto loaded = ScriptedDecisionProvider::from_json(R"([
        {"tool_calls": [{"name": "done"}, {"name": "read_file", "arguments": "{\"path\":\"a\"}"}]}
    ])");
    ASSERT_FALSE(is_error(loaded));
    auto provider = get_value(loaded);

    auto decided = provider.decide({}, "", {});
    ASSERT_FALSE(is_error(decided));
    const auto& calls = get_value(decided).tool_calls;
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].id, "call-1");
    EXPECT_EQ(calls[0].arguments, "{}");
    EXPECT_EQ(calls[1].id, "call-2");
    EXPECT_EQ(calls[1].arguments, R"({"path":"a"})");
}

TEST(ScriptedDecisionProviderTest, ExhaustedScriptIsProviderError) {
    auto loaded = ScriptedDecisionProvider::from_json("[]");
    ASSERT_FALSE(is_error(loaded));
    auto provider = get_value(loaded);

    auto decided = provider.decide({}, "prompt", {});
    ASSERT_TRUE(is_error(decided));
    EXPECT_EQ(get_error(decided).category, ErrorCategory::Provider);
    EXPECT_EQ(get_error(decided).code, "decision_script_exhausted");
    EXPECT_FALSE(get_error(decided).hint.empty());
}

TEST(ScriptedDecisionProviderTest, RejectsMalformedScripts) {
    for (const char* text : {"{", R"({"content": "x"})", "[42]", R"([{"content": 5}])",
                             R"([{"tool_calls": {}}])", R"([{"tool_calls": [{"id": "x"}]}])"}) {
        auto loaded = ScriptedDecisionProvider::from_json(text);
        ASSERT_TRUE(is_error(loaded)) << text;
        EXPECT_EQ(get_error(loaded).category, ErrorCategory::Provider) << text;
        EXPECT_EQ(get_error(loaded).code, "invalid_decision") << text;
    }
}

TEST(ScriptedDecisionProviderTest, MissingFileIsInputError) {
    auto loaded = ScriptedDecisionProvider::from_file("__missing_decisions__.json");
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(loaded).code, "invalid_path");
}

}  // namespace
