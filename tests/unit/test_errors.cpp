#include <gtest/gtest.h>
#include "core/errors/agent_errors.hpp"

using namespace autopilot::core::errors;

// A dummy function to simulate the MCP server failing to start
Result<std::string> simulate_spawn(bool should_fail) {
    if (should_fail) {
        return AgentError{ErrorCategory::Process, "Server binary not found", "process_start_failed"};
    }
    return std::string("server pid 4242");
}

Status simulate_save(bool should_fail) {
    if (should_fail) {
        return AgentError{ErrorCategory::Persistence, "Disk full", "persistence_failure"};
    }
    return Ok{};
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_spawn(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "server pid 4242");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_spawn(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Process);
    EXPECT_EQ(error.message, "Server binary not found");
    EXPECT_EQ(error.code, "process_start_failed");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, StatusCarriesNoValue) {
    EXPECT_FALSE(is_error(simulate_save(false)));

    auto failed = simulate_save(true);
    ASSERT_TRUE(is_error(failed));
    EXPECT_EQ(get_error(failed).category, ErrorCategory::Persistence);
}

TEST(ErrorModelTest, CategoryNamesAreStable) {
    EXPECT_EQ(to_string(ErrorCategory::Input), "input");
    EXPECT_EQ(to_string(ErrorCategory::Process), "process");
    EXPECT_EQ(to_string(ErrorCategory::Protocol), "protocol");
    EXPECT_EQ(to_string(ErrorCategory::Backend), "backend");
    EXPECT_EQ(to_string(ErrorCategory::Persistence), "persistence");
    EXPECT_EQ(to_string(ErrorCategory::Internal), "internal");
}
