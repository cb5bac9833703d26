#pragma once
#include "core/config/agent_config.hpp"
#include "core/errors/agent_errors.hpp"

namespace autopilot::app::cli {
    // Parses `autopilot run [options] -- <server command...>`.
    autopilot::core::errors::Result<autopilot::core::config::AgentConfig> parse_and_validate(int argc, char* argv[]);
}
