#include "rpc/mcp_client.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "rpc/handshake.hpp"

namespace autopilot::rpc {

using nlohmann::json;

namespace {

constexpr std::chrono::milliseconds kDrainPollInterval{100};

}  // namespace

core::errors::Result<std::unique_ptr<McpClient>> McpClient::connect(
    const core::config::ServerConfig& config) {
    auto spawned = process::ChildProcess::spawn(config.command, config.shutdown_grace);
    if (core::errors::is_error(spawned)) {
        return core::errors::get_error(spawned);
    }

    auto client = std::make_unique<McpClient>(
        ConnectKey{}, std::move(core::errors::get_value(spawned)), config.rpc_timeout);
    client->start_background_tasks();

    HandshakeOptions options;
    options.protocol_version = config.protocol_version;
    options.client_name = config.client_name;
    options.client_version = config.client_version;
    options.timeout = config.handshake_timeout;

    McpClient* raw = client.get();
    HandshakeCoordinator handshake(*client->transport_, options, [raw] { raw->shutdown(); });
    auto catalog = handshake.run();
    if (core::errors::is_error(catalog)) {
        return core::errors::get_error(catalog);
    }
    client->tools_ = core::errors::get_value(catalog);
    return client;
}

McpClient::McpClient(ConnectKey, std::unique_ptr<process::ChildProcess> child,
                     const std::chrono::milliseconds rpc_timeout)
    : child_(std::move(child)), rpc_timeout_(rpc_timeout) {
    transport_ = std::make_unique<Transport>(child_->stdin_fd(), stdout_queue_);
}

McpClient::~McpClient() {
    shutdown();
}

void McpClient::start_background_tasks() {
    stdout_reader_ = std::make_unique<process::LineReader>(child_->stdout_fd(), stdout_queue_,
                                                          "stdout");
    stderr_reader_ = std::make_unique<process::LineReader>(child_->stderr_fd(), stderr_queue_,
                                                          "stderr");
    stdout_reader_->start();
    stderr_reader_->start();

    draining_ = true;
    stderr_drain_ = std::thread([this] { drain_stderr(); });
}

void McpClient::log_stderr_line(const std::string& line) {
    if (!line.empty()) {
        LOG_INFO("[MCP stderr] " + line);
    }
}

void McpClient::drain_stderr() {
    while (draining_.load()) {
        auto line = stderr_queue_.pop_for(kDrainPollInterval);
        if (line.has_value()) {
            log_stderr_line(line.value());
        }
    }
}

json McpClient::call_tool(const std::string& name, const json& arguments) {
    if (shut_down_) {
        LOG_WARN("McpClient: tool call '" + name + "' after shutdown");
        return json::object();
    }
    json params;
    params["name"] = name;
    params["arguments"] = arguments;
    const protocol::RpcId id = transport_->send_request("tools/call", params);
    return transport_->await_response(id, rpc_timeout_);
}

void McpClient::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    LOG_INFO("Shutting down...");

    transport_->close();
    const int exit_code = child_->terminate();

    if (stdout_reader_) {
        stdout_reader_->stop();
    }
    if (stderr_reader_) {
        stderr_reader_->stop();
    }
    draining_ = false;
    if (stderr_drain_.joinable()) {
        stderr_drain_.join();
    }
    while (auto line = stderr_queue_.try_pop()) {
        log_stderr_line(line.value());
    }
    child_->close_output_pipes();

    LOG_INFO("Shutdown complete (server exit code " + std::to_string(exit_code) + ").");
}

}  // namespace autopilot::rpc
