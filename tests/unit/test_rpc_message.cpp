#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/rpc_message.hpp"

namespace {

using autopilot::core::errors::get_error;
using autopilot::core::errors::get_value;
using autopilot::core::errors::is_error;
using autopilot::protocol::decode;
using autopilot::protocol::encode;
using autopilot::protocol::is_notification;
using autopilot::protocol::is_response_to;
using autopilot::protocol::RpcNotification;
using autopilot::protocol::RpcRequest;
using autopilot::protocol::RpcResponse;
using nlohmann::json;

TEST(RpcMessageTest, EncodesRequestWithVersionIdAndParams) {
    RpcRequest request;
    request.id = 7;
    request.method = "tools/call";
    request.params = {{"name", "messages"}, {"arguments", {{"method", "send_message"}}}};

    const std::string line = encode(request);
    EXPECT_EQ(line.find('\n'), std::string::npos);

    const json parsed = json::parse(line);
    EXPECT_EQ(parsed.at("jsonrpc"), "2.0");
    EXPECT_EQ(parsed.at("id"), 7);
    EXPECT_EQ(parsed.at("method"), "tools/call");
    EXPECT_EQ(parsed.at("params").at("name"), "messages");
}

TEST(RpcMessageTest, EncodesNotificationWithoutIdOrEmptyParams) {
    RpcNotification notification;
    notification.method = "notifications/initialized";

    const json parsed = json::parse(encode(notification));
    EXPECT_FALSE(parsed.contains("id"));
    EXPECT_FALSE(parsed.contains("params"));
    EXPECT_EQ(parsed.at("method"), "notifications/initialized");
}

TEST(RpcMessageTest, DecodesResponseWithResult) {
    auto decoded = decode(R"({"jsonrpc":"2.0","id":3,"result":{"content":[]}})");
    ASSERT_FALSE(is_error(decoded));

    const auto& message = get_value(decoded);
    EXPECT_TRUE(is_response_to(message, 3));
    EXPECT_FALSE(is_response_to(message, 4));
    const auto& response = std::get<RpcResponse>(message);
    EXPECT_FALSE(response.has_error);
    EXPECT_TRUE(response.result.contains("content"));
}

TEST(RpcMessageTest, DecodesErrorResponse) {
    auto decoded = decode(R"({"jsonrpc":"2.0","id":3,"error":{"code":-32601,"message":"nope"}})");
    ASSERT_FALSE(is_error(decoded));

    const auto& response = std::get<RpcResponse>(get_value(decoded));
    EXPECT_TRUE(response.has_error);
    EXPECT_EQ(response.error.at("code"), -32601);
}

TEST(RpcMessageTest, NullErrorFieldIsNotAnError) {
    auto decoded = decode(R"({"jsonrpc":"2.0","id":1,"error":null,"result":{"ok":true}})");
    ASSERT_FALSE(is_error(decoded));

    const auto& response = std::get<RpcResponse>(get_value(decoded));
    EXPECT_FALSE(response.has_error);
    EXPECT_TRUE(response.result.at("ok").get<bool>());
}

TEST(RpcMessageTest, DecodesNotificationAndRequest) {
    auto notification = decode(R"({"jsonrpc":"2.0","method":"tools_ready","params":{"tools":["a"]}})");
    ASSERT_FALSE(is_error(notification));
    EXPECT_TRUE(is_notification(get_value(notification), "tools_ready"));

    auto request = decode(R"({"jsonrpc":"2.0","id":9,"method":"ping"})");
    ASSERT_FALSE(is_error(request));
    const auto& parsed = std::get<RpcRequest>(get_value(request));
    EXPECT_EQ(parsed.id, 9);
    EXPECT_TRUE(parsed.params.is_object());
    EXPECT_FALSE(is_notification(get_value(request), "ping"));
}

TEST(RpcMessageTest, RejectsMalformedLines) {
    for (const std::string line : {"Server starting on stdio...",
                                   "[1,2,3]",
                                   R"({"jsonrpc":"2.0","id":"abc","result":{}})",
                                   R"({"jsonrpc":"2.0","method":42})",
                                   R"({"jsonrpc":"2.0","result":{}})",
                                   ""}) {
        auto decoded = decode(line);
        ASSERT_TRUE(is_error(decoded)) << line;
        EXPECT_EQ(get_error(decoded).code, "malformed_message") << line;
    }
}

}  // namespace
