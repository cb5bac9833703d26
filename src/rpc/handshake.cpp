#include "rpc/handshake.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace autopilot::rpc {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr std::chrono::milliseconds kReceiveSlice{100};
constexpr const char* kToolsReadyMethod = "tools_ready";
constexpr const char* kInitializedMethod = "notifications/initialized";

}  // namespace

HandshakeCoordinator::HandshakeCoordinator(Transport& transport, HandshakeOptions options,
                                           std::function<void()> on_failure)
    : transport_(transport),
      options_(std::move(options)),
      on_failure_(std::move(on_failure)) {}

std::string HandshakeCoordinator::to_string(const HandshakeState state) {
    switch (state) {
        case HandshakeState::AwaitingInit:
            return "awaiting_init";
        case HandshakeState::AwaitingTools:
            return "awaiting_tools";
        case HandshakeState::Ready:
            return "ready";
        case HandshakeState::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

void HandshakeCoordinator::update_state() {
    const HandshakeState previous = state_;
    if (init_seen_ && tools_seen_) {
        state_ = HandshakeState::Ready;
    } else if (init_seen_) {
        state_ = HandshakeState::AwaitingTools;
    } else {
        state_ = HandshakeState::AwaitingInit;
    }
    if (previous != state_) {
        LOG_DEBUG("Handshake: " + to_string(previous) + " -> " + to_string(state_));
    }
}

void HandshakeCoordinator::observe(const protocol::RpcMessage& message,
                                   const protocol::RpcId init_id) {
    if (protocol::is_response_to(message, init_id)) {
        LOG_INFO("Received initialize response");
        init_seen_ = true;
        return;
    }
    if (!protocol::is_notification(message, kToolsReadyMethod)) {
        return;
    }

    LOG_INFO("Received 'tools_ready' notification");
    tools_seen_ = true;
    tool_names_.clear();
    const auto& params = std::get<protocol::RpcNotification>(message).params;
    const auto tools_it = params.find("tools");
    if (tools_it == params.end() || !tools_it->is_array()) {
        return;
    }
    for (const auto& name : *tools_it) {
        if (name.is_string()) {
            tool_names_.push_back(name.get<std::string>());
        }
    }
}

core::errors::Result<ToolCatalog> HandshakeCoordinator::run() {
    LOG_INFO("Performing MCP handshake...");

    json client_info;
    client_info["name"] = options_.client_name;
    client_info["version"] = options_.client_version;
    json params;
    params["protocolVersion"] = options_.protocol_version;
    params["capabilities"] = json::object();
    params["clientInfo"] = client_info;
    const protocol::RpcId init_id = transport_.send_request("initialize", params);

    const auto deadline = std::chrono::steady_clock::now() + options_.timeout;
    while (state_ != HandshakeState::Ready) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto message = transport_.receive(remaining < kReceiveSlice ? remaining : kReceiveSlice);
        if (!message.has_value()) {
            continue;
        }
        observe(message.value(), init_id);
        update_state();
    }

    if (state_ != HandshakeState::Ready) {
        state_ = HandshakeState::Failed;
        LOG_ERROR("Handshake timed out (init_response=" + std::string(init_seen_ ? "yes" : "no") +
                  ", tools_ready=" + std::string(tools_seen_ ? "yes" : "no") + ")");
        if (on_failure_) {
            on_failure_();
        }
        return AgentError{ErrorCategory::Protocol, "Handshake timed out", "handshake_timeout",
                          "The MCP server never announced its tools; check its stderr output."};
    }

    transport_.send_notification(kInitializedMethod);
    LOG_INFO("Handshake complete! " + std::to_string(tool_names_.size()) + " tool(s) available");
    return ToolCatalog(tool_names_);
}

}  // namespace autopilot::rpc
