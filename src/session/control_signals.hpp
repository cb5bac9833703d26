#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "core/config/agent_config.hpp"

namespace autopilot::session {

// File-based signals written by an outside controller: the task text, a pause
// marker and a one-shot correction. The agent only ever reads them, apart from
// deleting a correction once consumed.
class ControlSignals {
public:
    ControlSignals(std::filesystem::path goal_file, std::filesystem::path pause_flag,
                   std::filesystem::path correction_file);

    static ControlSignals from_config(const core::config::AgentConfig& config);

    // Trimmed goal text; nullopt when the file is missing or unreadable.
    std::optional<std::string> read_goal() const;

    bool paused() const;

    // Returns the trimmed correction text and removes the file. An empty file is
    // removed too but yields nullopt.
    std::optional<std::string> take_correction() const;

private:
    std::filesystem::path goal_file_;
    std::filesystem::path pause_flag_;
    std::filesystem::path correction_file_;
};

std::string trim(const std::string& text);

}  // namespace autopilot::session
