#include "protocol/rpc_message.hpp"

#include <utility>

namespace autopilot::protocol {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr const char* kJsonRpcVersion = "2.0";

AgentError malformed(const std::string& reason) {
    return AgentError{ErrorCategory::Protocol, "Malformed JSON-RPC message: " + reason,
                      "malformed_message"};
}

json params_or_empty(const json& object) {
    const auto it = object.find("params");
    if (it == object.end() || it->is_null()) {
        return json::object();
    }
    return *it;
}

}  // namespace

std::string encode(const RpcMessage& message) {
    json payload;
    payload["jsonrpc"] = kJsonRpcVersion;

    if (const auto* request = std::get_if<RpcRequest>(&message)) {
        payload["id"] = request->id;
        payload["method"] = request->method;
        payload["params"] = request->params;
    } else if (const auto* notification = std::get_if<RpcNotification>(&message)) {
        payload["method"] = notification->method;
        if (!notification->params.empty()) {
            payload["params"] = notification->params;
        }
    } else {
        const auto& response = std::get<RpcResponse>(message);
        payload["id"] = response.id;
        if (response.has_error) {
            payload["error"] = response.error;
        } else {
            payload["result"] = response.result;
        }
    }
    return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

core::errors::Result<RpcMessage> decode(const std::string& line) {
    const json object = json::parse(line, nullptr, false);
    if (object.is_discarded()) {
        return malformed("not valid JSON");
    }
    if (!object.is_object()) {
        return malformed("top-level value is not an object");
    }

    const auto id_it = object.find("id");
    const bool has_id = id_it != object.end() && !id_it->is_null();
    if (has_id && !id_it->is_number_integer()) {
        return malformed("id is not an integer");
    }

    const auto method_it = object.find("method");
    if (method_it != object.end()) {
        if (!method_it->is_string()) {
            return malformed("method is not a string");
        }
        if (has_id) {
            RpcRequest request;
            request.id = id_it->get<RpcId>();
            request.method = method_it->get<std::string>();
            request.params = params_or_empty(object);
            return RpcMessage{std::move(request)};
        }
        RpcNotification notification;
        notification.method = method_it->get<std::string>();
        notification.params = params_or_empty(object);
        return RpcMessage{std::move(notification)};
    }

    if (!has_id) {
        return malformed("neither id nor method present");
    }

    RpcResponse response;
    response.id = id_it->get<RpcId>();
    const auto error_it = object.find("error");
    if (error_it != object.end() && !error_it->is_null()) {
        response.has_error = true;
        response.error = *error_it;
    } else {
        const auto result_it = object.find("result");
        if (result_it != object.end() && !result_it->is_null()) {
            response.result = *result_it;
        }
    }
    return RpcMessage{std::move(response)};
}

}  // namespace autopilot::protocol
