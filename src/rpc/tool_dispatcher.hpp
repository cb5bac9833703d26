#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace autopilot::rpc {

// Executes one tool call and returns its opaque result. An empty object means
// the call failed or timed out; callers proceed regardless.
class ToolDispatcher {
public:
    virtual ~ToolDispatcher() = default;

    virtual nlohmann::json call_tool(const std::string& name,
                                     const nlohmann::json& arguments) = 0;
};

}  // namespace autopilot::rpc
