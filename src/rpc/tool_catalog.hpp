#pragma once

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace autopilot::rpc {

// Tool names announced by the server in its tools_ready notification, in the
// order received. Fixed once the handshake completes.
class ToolCatalog {
public:
    ToolCatalog() = default;
    explicit ToolCatalog(std::vector<std::string> names) : names_(std::move(names)) {}

    const std::vector<std::string>& names() const { return names_; }
    bool empty() const { return names_.empty(); }
    std::size_t size() const { return names_.size(); }

    bool contains(const std::string& name) const {
        return std::find(names_.begin(), names_.end(), name) != names_.end();
    }

private:
    std::vector<std::string> names_;
};

}  // namespace autopilot::rpc
