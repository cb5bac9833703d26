#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include "core/errors/agent_errors.hpp"

namespace autopilot::backend {

// The text-generation service, one blocking call per prompt.
class Backend {
public:
    virtual ~Backend() = default;

    // Returns the generated text. A "backend_unavailable" error means the call may
    // be retried; any other error is final for this prompt.
    virtual core::errors::Result<std::string> generate(const std::string& prompt) = 0;
};

struct RetryPolicy {
    std::uint32_t attempts = 3;
    std::chrono::milliseconds delay{2000};
};

// Calls the backend with a fixed-delay retry on "backend_unavailable". Every
// failure ends in an empty string; the caller records it as a reasoning error.
std::string generate_with_retry(Backend& backend, const std::string& prompt,
                                const RetryPolicy& policy);

}  // namespace autopilot::backend
