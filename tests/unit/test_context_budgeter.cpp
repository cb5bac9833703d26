#include <cstddef>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "context/context_budgeter.hpp"
#include "context/prompt_template.hpp"
#include "context/token_estimator.hpp"
#include "protocol/history_record.hpp"

namespace {

using autopilot::context::build_prompt;
using autopilot::context::estimate_tokens;
using autopilot::context::measure;
using autopilot::context::PromptTemplate;
using autopilot::context::render_history;
using autopilot::protocol::History;
using autopilot::protocol::HistoryItem;
using nlohmann::json;

const std::string kTask = "Greet every new user in the chat.";
const std::string kHints = "Available tools:\n1. \"messages\"";

History make_history(const std::size_t count, const std::size_t payload_bytes) {
    History history;
    for (std::size_t i = 0; i < count; ++i) {
        json result;
        result["marker"] = "item-" + std::to_string(i);
        result["text"] = std::string(payload_bytes, 'x');
        history.push_back(HistoryItem::tool_call(
            "messages", {{"method", "send_message"}, {"params", {{"text", "hello " + std::to_string(i)}}}},
            result));
    }
    return history;
}

History suffix_of(const History& history, const std::size_t kept) {
    return History(history.end() - static_cast<std::ptrdiff_t>(kept), history.end());
}

TEST(TokenEstimatorTest, TakesLargerOfWordsAndQuarterBytes) {
    EXPECT_EQ(estimate_tokens(""), 0u);
    EXPECT_EQ(estimate_tokens("a b c d e"), 5u);
    EXPECT_EQ(estimate_tokens(std::string(40, 'z')), 10u);
    EXPECT_EQ(measure("  two\twords \n").words, 2u);

    for (const std::string text : {"x", "one two three", "{\n  \"a\": 1\n}", "word  word  word"}) {
        EXPECT_GE(estimate_tokens(text), measure(text).words) << text;
    }
}

TEST(TokenEstimatorTest, StatsAddAcrossWhitespaceBoundaries) {
    const std::string left = "History: ";
    const std::string right = "[\n  {}\n]";
    const auto combined = measure(left) + measure(right);
    EXPECT_EQ(combined.words, measure(left + right).words);
    EXPECT_EQ(combined.bytes, measure(left + right).bytes);
}

TEST(ContextBudgeterTest, KeepsEverythingWhenItFits) {
    const History history = make_history(3, 10);
    const auto budgeted = build_prompt(kTask, kHints, history, 5000);

    EXPECT_FALSE(budgeted.truncated);
    EXPECT_FALSE(budgeted.forced_reset);
    EXPECT_EQ(budgeted.kept_count, 3u);
    EXPECT_NE(budgeted.prompt.find(kTask), std::string::npos);
    EXPECT_NE(budgeted.prompt.find(kHints), std::string::npos);
    EXPECT_NE(budgeted.prompt.find(render_history(history)), std::string::npos);
    EXPECT_EQ(budgeted.estimated_tokens, estimate_tokens(budgeted.prompt));
}

TEST(ContextBudgeterTest, EmptyHistoryRendersAsEmptyArray) {
    const auto budgeted = build_prompt(kTask, kHints, History{}, 5000);
    EXPECT_FALSE(budgeted.truncated);
    EXPECT_NE(budgeted.prompt.find("History: []"), std::string::npos);
    EXPECT_EQ(render_history(History{}), "[]");
}

TEST(ContextBudgeterTest, NeverExceedsCeilingAndKeepsLongestSuffix) {
    const History history = make_history(30, 200);
    const std::size_t baseline = build_prompt(kTask, kHints, History{}, 1000000).estimated_tokens;

    for (std::size_t ceiling = baseline; ceiling <= baseline + 3000; ceiling += 137) {
        const auto budgeted = build_prompt(kTask, kHints, history, ceiling);
        ASSERT_FALSE(budgeted.forced_reset) << "ceiling " << ceiling;
        EXPECT_LE(budgeted.estimated_tokens, ceiling) << "ceiling " << ceiling;
        EXPECT_EQ(budgeted.estimated_tokens, estimate_tokens(budgeted.prompt));
        EXPECT_EQ(budgeted.truncated, budgeted.kept_count < history.size());

        // The prompt holds exactly the newest kept_count items, in order.
        const History kept = suffix_of(history, budgeted.kept_count);
        EXPECT_EQ(budgeted.prompt, build_prompt(kTask, kHints, kept, 1000000).prompt)
            << "ceiling " << ceiling;

        // One more item would not have fit.
        if (budgeted.kept_count < history.size()) {
            const History one_more = suffix_of(history, budgeted.kept_count + 1);
            EXPECT_GT(build_prompt(kTask, kHints, one_more, 1000000).estimated_tokens, ceiling)
                << "ceiling " << ceiling;
        }
    }
}

TEST(ContextBudgeterTest, TruncatedPromptKeepsChronologicalOrder) {
    const History history = make_history(30, 200);
    const auto budgeted = build_prompt(kTask, kHints, history, 1500);

    ASSERT_TRUE(budgeted.truncated);
    ASSERT_GE(budgeted.kept_count, 2u);
    const auto older = budgeted.prompt.find("item-28");
    const auto newer = budgeted.prompt.find("item-29");
    ASSERT_NE(older, std::string::npos);
    ASSERT_NE(newer, std::string::npos);
    EXPECT_LT(older, newer);
    EXPECT_EQ(budgeted.prompt.find("item-0\""), std::string::npos);
}

TEST(ContextBudgeterTest, ForcedResetUsesMinimalPrompt) {
    const std::string huge_task(40000, 't');
    const History history = make_history(5, 10);
    const auto budgeted = build_prompt(huge_task, kHints, history, 500);

    EXPECT_TRUE(budgeted.forced_reset);
    EXPECT_TRUE(budgeted.truncated);
    EXPECT_EQ(budgeted.kept_count, 0u);
    EXPECT_EQ(budgeted.prompt, PromptTemplate::minimal());
    EXPECT_LT(budgeted.estimated_tokens, 200u);
    EXPECT_EQ(budgeted.estimated_tokens, estimate_tokens(budgeted.prompt));
}

TEST(ContextBudgeterTest, TemplateWithoutHistorySlotStillCarriesHistory) {
    const PromptTemplate plain{"Task: {task}\nTools: {tools}"};
    const History history = make_history(2, 10);
    const auto budgeted = build_prompt(kTask, kHints, history, 5000, plain);

    EXPECT_FALSE(budgeted.truncated);
    EXPECT_NE(budgeted.prompt.find("item-1"), std::string::npos);
    EXPECT_EQ(budgeted.prompt.rfind("Task: " + kTask, 0), 0u);
}

}  // namespace
