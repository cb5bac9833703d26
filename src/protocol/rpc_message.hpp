#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"

namespace autopilot::protocol {

using RpcId = std::int64_t;

struct RpcRequest {
    RpcId id = 0;
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

struct RpcNotification {
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

// Exactly one of result / error is meaningful; has_error tells which.
struct RpcResponse {
    RpcId id = 0;
    nlohmann::json result = nlohmann::json::object();
    nlohmann::json error;
    bool has_error = false;
};

using RpcMessage = std::variant<RpcRequest, RpcNotification, RpcResponse>;

// One JSON object, no trailing newline.
std::string encode(const RpcMessage& message);

// Classifies a single inbound line. Lines that are not JSON objects, or whose
// shape fits none of the three message kinds, yield a "malformed_message" error.
core::errors::Result<RpcMessage> decode(const std::string& line);

inline bool is_response_to(const RpcMessage& message, const RpcId id) {
    const auto* response = std::get_if<RpcResponse>(&message);
    return response != nullptr && response->id == id;
}

inline bool is_notification(const RpcMessage& message, const std::string& method) {
    const auto* notification = std::get_if<RpcNotification>(&message);
    return notification != nullptr && notification->method == method;
}

}  // namespace autopilot::protocol
