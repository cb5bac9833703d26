#pragma once

#include <string>
#include "core/config/agent_config.hpp"
#include "core/errors/agent_errors.hpp"

namespace autopilot::runtime {

enum class RunOutcome {
    NothingToDo,  // goal file missing or empty
    GoalAchieved
};

// Wires one run together: goal and history from the state directory, the MCP
// server, the HTTP backend and the console feedback source.
class AgentRunner {
public:
    explicit AgentRunner(core::config::AgentConfig config);

    // Only process start and handshake failures come back as errors.
    core::errors::Result<RunOutcome> run();

private:
    core::config::AgentConfig config_;
};

std::string to_string(RunOutcome outcome);

}  // namespace autopilot::runtime
