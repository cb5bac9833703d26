#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "rpc/tool_catalog.hpp"
#include "rpc/transport.hpp"

namespace autopilot::rpc {

enum class HandshakeState {
    AwaitingInit,
    AwaitingTools,
    Ready,
    Failed
};

struct HandshakeOptions {
    std::string protocol_version = "2024-11-05";
    std::string client_name = "agent-client";
    std::string client_version = "1.0.0";
    std::chrono::milliseconds timeout{std::chrono::hours(1)};
};

// initialize -> (initialize response AND tools_ready, in any order) -> initialized.
class HandshakeCoordinator {
public:
    HandshakeCoordinator(Transport& transport, HandshakeOptions options,
                         std::function<void()> on_failure = nullptr);

    // Blocks until Ready or until the timeout expires. On timeout the failure
    // callback runs before the "handshake_timeout" error is returned.
    core::errors::Result<ToolCatalog> run();

    HandshakeState state() const { return state_; }

    static std::string to_string(HandshakeState state);

private:
    void observe(const protocol::RpcMessage& message, protocol::RpcId init_id);
    void update_state();

    Transport& transport_;
    HandshakeOptions options_;
    std::function<void()> on_failure_;
    HandshakeState state_ = HandshakeState::AwaitingInit;
    bool init_seen_ = false;
    bool tools_seen_ = false;
    std::vector<std::string> tool_names_;
};

}  // namespace autopilot::rpc
