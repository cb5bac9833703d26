#include <filesystem>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/agent_errors.hpp"
#include "test_support.hpp"

namespace {

using autopilot::app::cli::parse_and_validate;
using autopilot::core::config::AgentConfig;
using autopilot::core::errors::ErrorCategory;
using autopilot::core::errors::get_error;
using autopilot::core::errors::get_value;
using autopilot::core::errors::is_error;
using autopilot::test_support::TempWorkspace;
using autopilot::test_support::write_file;

autopilot::core::errors::Result<AgentConfig> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("autopilot");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, FailsWhenServerCommandMissing) {
    auto result = parse_tokens({"run"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_server_command");

    auto empty_after_separator = parse_tokens({"run", "--verbose", "--"});
    ASSERT_TRUE(is_error(empty_after_separator));
    EXPECT_EQ(get_error(empty_after_separator).code, "missing_server_command");
}

TEST(CliParserTest, FailsOnUnknownArgument) {
    auto result = parse_tokens({"run", "--max-steps", "3", "--", "server"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenValueMissing) {
    auto result = parse_tokens({"run", "--model"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsWhenTokenCeilingNotNumeric) {
    auto result = parse_tokens({"run", "--token-ceiling", "abc", "--", "server"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenTokenCeilingHasTrailingCharacters) {
    auto result = parse_tokens({"run", "--token-ceiling", "12abc", "--", "server"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenTokenCeilingOutOfBounds) {
    auto result = parse_tokens({"run", "--token-ceiling", "0", "--", "server"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(CliParserTest, FailsWhenStateDirInvalid) {
    const auto missing_dir =
        std::filesystem::current_path() / "__definitely_missing_cli_parser_test_dir__";
    auto result = parse_tokens({"run", "--state-dir", missing_dir.string(), "--", "server"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, FailsWhenToolHintsFileMissing) {
    auto result = parse_tokens({"run", "--tool-hints", "__no_such_hints_file__.txt", "--", "server"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, AppliesDefaults) {
    auto result = parse_tokens({"run", "--", "python3", "server.py"});
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_EQ(config.server.command, (std::vector<std::string>{"python3", "server.py"}));
    EXPECT_EQ(config.token_ceiling, 5000u);
    EXPECT_EQ(config.backend.model, "gemma3:4b");
    EXPECT_EQ(config.backend.url, "http://localhost:11434/api/generate");
    EXPECT_EQ(config.backend.attempts, 3u);
    EXPECT_EQ(config.server.handshake_timeout, std::chrono::hours(1));
    EXPECT_EQ(config.final_answer_sentinel, "Your detailed answer here.");
    EXPECT_FALSE(config.tool_hints_file.has_value());
    EXPECT_FALSE(config.log_file.has_value());
    EXPECT_FALSE(config.verbose);
}

TEST(CliParserTest, ParsesFullRunRequest) {
    TempWorkspace workspace("cli_parser");
    const auto hints = workspace.root() / "hints.txt";
    write_file(hints, "messages: send_message");

    auto result = parse_tokens({"run",
                                "--state-dir", workspace.root().string(),
                                "--backend-url", "http://127.0.0.1:8080/api/generate",
                                "--model", "llama3",
                                "--token-ceiling", "1200",
                                "--rpc-timeout", "1500",
                                "--handshake-timeout", "2500",
                                "--backend-attempts", "5",
                                "--backend-retry-delay", "0",
                                "--final-answer", "DONE",
                                "--tool-hints", hints.string(),
                                "--log-file", "custom.log",
                                "--verbose",
                                "--", "node", "server.js", "--", "--port", "1"});
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_EQ(config.state_dir, std::filesystem::canonical(workspace.root()));
    EXPECT_EQ(config.backend.url, "http://127.0.0.1:8080/api/generate");
    EXPECT_EQ(config.backend.model, "llama3");
    EXPECT_EQ(config.token_ceiling, 1200u);
    EXPECT_EQ(config.server.rpc_timeout, std::chrono::milliseconds(1500));
    EXPECT_EQ(config.server.handshake_timeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(config.backend.attempts, 5u);
    EXPECT_EQ(config.backend.retry_delay, std::chrono::milliseconds(0));
    EXPECT_EQ(config.final_answer_sentinel, "DONE");
    ASSERT_TRUE(config.tool_hints_file.has_value());
    EXPECT_EQ(config.tool_hints_file.value(), hints);
    ASSERT_TRUE(config.log_file.has_value());
    EXPECT_EQ(config.log_file->string(), "custom.log");
    EXPECT_TRUE(config.verbose);
    EXPECT_EQ(config.server.command,
              (std::vector<std::string>{"node", "server.js", "--", "--port", "1"}));
    EXPECT_EQ(config.path_of(config.files.history), config.state_dir / "history.json");
}

}  // namespace
