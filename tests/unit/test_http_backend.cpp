#include <chrono>
#include <deque>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "backend/backend_client.hpp"
#include "backend/http_backend.hpp"
#include "core/config/agent_config.hpp"
#include "core/errors/agent_errors.hpp"

namespace {

using autopilot::backend::Backend;
using autopilot::backend::build_generate_request;
using autopilot::backend::generate_with_retry;
using autopilot::backend::HttpBackend;
using autopilot::backend::parse_generate_response;
using autopilot::backend::RetryPolicy;
using autopilot::core::errors::AgentError;
using autopilot::core::errors::ErrorCategory;
using autopilot::core::errors::get_error;
using autopilot::core::errors::get_value;
using autopilot::core::errors::is_error;
using autopilot::core::errors::Result;
using nlohmann::json;

class ScriptedBackend : public Backend {
public:
    std::deque<Result<std::string>> replies;
    int calls = 0;

    Result<std::string> generate(const std::string&) override {
        ++calls;
        if (replies.empty()) {
            return AgentError{ErrorCategory::Backend, "no scripted reply", "backend_unavailable"};
        }
        auto reply = replies.front();
        replies.pop_front();
        return reply;
    }
};

AgentError unavailable() {
    return AgentError{ErrorCategory::Backend, "connection refused", "backend_unavailable"};
}

RetryPolicy no_delay(std::uint32_t attempts) {
    RetryPolicy policy;
    policy.attempts = attempts;
    policy.delay = std::chrono::milliseconds(0);
    return policy;
}

TEST(HttpBackendTest, BuildsNonStreamingRequest) {
    const json request = json::parse(build_generate_request("gemma3:4b", "Say \"hi\"\n"));
    EXPECT_EQ(request.at("model"), "gemma3:4b");
    EXPECT_EQ(request.at("prompt"), "Say \"hi\"\n");
    EXPECT_EQ(request.at("stream"), false);
}

TEST(HttpBackendTest, InvalidUtf8PromptIsReplacedNotThrown) {
    const std::string prompt = "Reply to caf\xe9 messages";
    std::string body;
    ASSERT_NO_THROW(body = build_generate_request("gemma3:4b", prompt));

    const json request = json::parse(body);
    EXPECT_EQ(request.at("prompt"), "Reply to caf\xEF\xBF\xBD messages");
}

TEST(HttpBackendTest, ParsesResponseField) {
    auto parsed = parse_generate_response(R"({"model":"m","response":"{\"tool\": \"x\"}","done":true})");
    ASSERT_FALSE(is_error(parsed));
    EXPECT_EQ(get_value(parsed), "{\"tool\": \"x\"}");
}

TEST(HttpBackendTest, RejectsUnexpectedReplies) {
    for (const std::string body : {"<html>502</html>", R"({"error":"model not found"})",
                                   R"({"response": 12})", "[]"}) {
        auto parsed = parse_generate_response(body);
        ASSERT_TRUE(is_error(parsed)) << body;
        EXPECT_EQ(get_error(parsed).code, "unexpected_backend_response") << body;
    }
}

TEST(HttpBackendTest, UnreachableEndpointIsUnavailable) {
    autopilot::core::config::BackendConfig config;
    config.url = "http://127.0.0.1:1/api/generate";
    config.request_timeout = std::chrono::milliseconds(2000);
    HttpBackend backend(config);

    auto result = backend.generate("hello");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "backend_unavailable");
    EXPECT_EQ(get_error(result).category, ErrorCategory::Backend);
}

TEST(RetryTest, RetriesUnavailableUntilSuccess) {
    ScriptedBackend backend;
    backend.replies.push_back(unavailable());
    backend.replies.push_back(unavailable());
    backend.replies.push_back(std::string("{\"final_answer\": \"ok\"}"));

    EXPECT_EQ(generate_with_retry(backend, "prompt", no_delay(3)), "{\"final_answer\": \"ok\"}");
    EXPECT_EQ(backend.calls, 3);
}

TEST(RetryTest, GivesUpWithEmptyStringAfterBoundedAttempts) {
    ScriptedBackend backend;
    backend.replies.push_back(unavailable());
    backend.replies.push_back(unavailable());
    backend.replies.push_back(std::string("too late"));

    EXPECT_EQ(generate_with_retry(backend, "prompt", no_delay(2)), "");
    EXPECT_EQ(backend.calls, 2);
}

TEST(RetryTest, DoesNotRetryFormatErrors) {
    ScriptedBackend backend;
    backend.replies.push_back(
        AgentError{ErrorCategory::Backend, "bad format", "unexpected_backend_response"});
    backend.replies.push_back(std::string("never used"));

    EXPECT_EQ(generate_with_retry(backend, "prompt", no_delay(3)), "");
    EXPECT_EQ(backend.calls, 1);
}

TEST(RetryTest, WaitsBetweenAttempts) {
    ScriptedBackend backend;
    backend.replies.push_back(unavailable());
    backend.replies.push_back(std::string("ok"));

    RetryPolicy policy;
    policy.attempts = 2;
    policy.delay = std::chrono::milliseconds(50);
    const auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(generate_with_retry(backend, "prompt", policy), "ok");
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(50));
}

}  // namespace
