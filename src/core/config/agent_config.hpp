#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace autopilot::core::config {

    // Names of the files the agent reads and writes inside its state directory.
    struct StateFiles {
        std::string goal = "goal.txt";
        std::string pause_flag = "paused.flag";
        std::string correction = "correction.txt";
        std::string history = "history.json";
        std::string knowledge = "knowledge.json";
        std::string log = "agent.log";
    };

    struct BackendConfig {
        std::string url = "http://localhost:11434/api/generate";
        std::string model = "gemma3:4b";
        std::uint32_t attempts = 3;
        std::chrono::milliseconds retry_delay{2000};
        std::chrono::milliseconds request_timeout{60000};
    };

    struct ServerConfig {
        // argv of the MCP server; element 0 is resolved through PATH.
        std::vector<std::string> command;
        std::string protocol_version = "2024-11-05";
        std::string client_name = "agent-client";
        std::string client_version = "1.0.0";
        std::chrono::milliseconds handshake_timeout{std::chrono::hours(1)};
        std::chrono::milliseconds rpc_timeout{std::chrono::hours(1)};
        std::chrono::milliseconds shutdown_grace{5000};
    };

    // Validated settings for one agent run.
    struct AgentConfig {
        std::filesystem::path state_dir = std::filesystem::current_path();
        StateFiles files;
        ServerConfig server;
        BackendConfig backend;
        std::size_t token_ceiling = 5000;
        std::string final_answer_sentinel = "Your detailed answer here.";
        std::optional<std::filesystem::path> tool_hints_file;
        std::optional<std::filesystem::path> log_file;
        std::chrono::milliseconds pause_poll_interval{1000};
        bool verbose = false;

        std::filesystem::path path_of(const std::string& name) const {
            return state_dir / name;
        }
    };

} // namespace autopilot::core::config
