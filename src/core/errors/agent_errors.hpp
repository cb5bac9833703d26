#pragma once
#include <string>
#include <variant>

namespace autopilot::core::errors {

    // 1. Define typed error categories
    enum class ErrorCategory {
        Input,        // E.g., an invalid CLI flag or missing server command
        Process,      // E.g., the MCP server could not be started
        Protocol,     // E.g., handshake timeout or a malformed JSON-RPC line
        Backend,      // E.g., the generation endpoint is unreachable
        Persistence,  // E.g., history.json could not be written
        Internal      // E.g., C++ logic bug
    };

    // The standardized error payload
    struct AgentError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR an AgentError.
    template <typename T>
    using Result = std::variant<T, AgentError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<AgentError>(result);
    }

    template <typename T>
    const AgentError& get_error(const Result<T>& result) {
        return std::get<AgentError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    // Operations that only succeed or fail carry no value.
    struct Ok {};
    using Status = Result<Ok>;

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:       return "input";
            case ErrorCategory::Process:     return "process";
            case ErrorCategory::Protocol:    return "protocol";
            case ErrorCategory::Backend:     return "backend";
            case ErrorCategory::Persistence: return "persistence";
            case ErrorCategory::Internal:    return "internal";
            default: return "unknown";
        }
    }

} // namespace autopilot::core::errors
