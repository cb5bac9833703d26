#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"

namespace autopilot::session {

// Capabilities learned per tool from "__capabilities__" calls, kept in a JSON
// object {"<tool>": {"capabilities": ["..."]}} next to the history.
class KnowledgeStore {
public:
    explicit KnowledgeStore(std::filesystem::path path);

    // Missing or unreadable files leave the store empty.
    void load();

    // Records capabilities if `arguments` / `result` describe a successful
    // discovery call. Returns true when something was learned.
    bool learn_from(const std::string& tool, const nlohmann::json& arguments,
                    const nlohmann::json& result);

    core::errors::Status save() const;

    // Hint lines for the prompt, empty if nothing is known.
    std::string describe() const;

    const std::map<std::string, std::vector<std::string>>& capabilities() const {
        return capabilities_;
    }

private:
    std::filesystem::path path_;
    std::map<std::string, std::vector<std::string>> capabilities_;
};

}  // namespace autopilot::session
