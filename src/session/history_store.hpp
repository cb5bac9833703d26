#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/history_record.hpp"

namespace autopilot::session {

// Writes `document` to `path` through a sibling temp file and rename(), so a
// reader sees either the old or the new content, never a partial write.
core::errors::Status write_json_atomically(const std::filesystem::path& path,
                                           const nlohmann::json& document);

// History persisted as one JSON array, fully rewritten on every save.
class HistoryStore {
public:
    explicit HistoryStore(std::filesystem::path path);

    // A missing file is an empty history. A file that does not parse is an error.
    core::errors::Result<protocol::History> load() const;

    core::errors::Status save(const protocol::History& history) const;

    // Renames an unreadable history file to "<path>.bad" so the next save does
    // not destroy it. Returns the new location.
    core::errors::Result<std::filesystem::path> set_aside() const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace autopilot::session
