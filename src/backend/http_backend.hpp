#pragma once

#include <chrono>
#include <string>
#include "backend/backend_client.hpp"
#include "core/config/agent_config.hpp"

namespace autopilot::backend {

// POSTs {"model", "prompt", "stream": false} and reads {"response": "..."}.
class HttpBackend : public Backend {
public:
    explicit HttpBackend(core::config::BackendConfig config);
    ~HttpBackend() override;

    HttpBackend(const HttpBackend&) = delete;
    HttpBackend& operator=(const HttpBackend&) = delete;

    core::errors::Result<std::string> generate(const std::string& prompt) override;

private:
    core::config::BackendConfig config_;
};

std::string build_generate_request(const std::string& model, const std::string& prompt);

// Extracts the "response" string from a reply body. A body that is not JSON or
// lacks the field is an "unexpected_backend_response" error (not retried).
core::errors::Result<std::string> parse_generate_response(const std::string& body);

}  // namespace autopilot::backend
