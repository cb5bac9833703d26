#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include "core/config/agent_config.hpp"
#include "core/errors/agent_errors.hpp"
#include "process/child_process.hpp"
#include "process/line_queue.hpp"
#include "process/line_reader.hpp"
#include "rpc/tool_catalog.hpp"
#include "rpc/tool_dispatcher.hpp"
#include "rpc/transport.hpp"

namespace autopilot::rpc {

// Owns the MCP server process and everything attached to it: the stdout and
// stderr readers with their queues, the stderr drain, and the transport.
// shutdown() runs on every exit path, including destruction.
class McpClient : public ToolDispatcher {
public:
    // Spawns the server and completes the handshake.
    static core::errors::Result<std::unique_ptr<McpClient>> connect(
        const core::config::ServerConfig& config);

    ~McpClient() override;

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    nlohmann::json call_tool(const std::string& name, const nlohmann::json& arguments) override;

    const ToolCatalog& tools() const { return tools_; }

    void shutdown();

private:
    struct ConnectKey {
        explicit ConnectKey() = default;
    };

public:
    McpClient(ConnectKey, std::unique_ptr<process::ChildProcess> child,
              std::chrono::milliseconds rpc_timeout);

private:

    void start_background_tasks();
    void drain_stderr();
    void log_stderr_line(const std::string& line);

    std::unique_ptr<process::ChildProcess> child_;
    process::LineQueue stdout_queue_;
    process::LineQueue stderr_queue_;
    std::unique_ptr<process::LineReader> stdout_reader_;
    std::unique_ptr<process::LineReader> stderr_reader_;
    std::thread stderr_drain_;
    std::atomic_bool draining_{false};
    std::unique_ptr<Transport> transport_;
    ToolCatalog tools_;
    std::chrono::milliseconds rpc_timeout_;
    bool shut_down_ = false;
};

}  // namespace autopilot::rpc
