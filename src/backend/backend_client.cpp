#include "backend/backend_client.hpp"

#include <thread>
#include "context/token_estimator.hpp"
#include "core/logging/logger.hpp"

namespace autopilot::backend {

std::string generate_with_retry(Backend& backend, const std::string& prompt,
                                const RetryPolicy& policy) {
    LOG_INFO("Asking backend for next action...");
    const std::uint32_t attempts = policy.attempts == 0 ? 1 : policy.attempts;

    for (std::uint32_t attempt = 1; attempt <= attempts; ++attempt) {
        auto result = backend.generate(prompt);
        if (!core::errors::is_error(result)) {
            const std::string& text = core::errors::get_value(result);
            LOG_INFO("Model response tokens: " +
                     std::to_string(context::estimate_tokens(text)));
            return text;
        }

        const auto& err = core::errors::get_error(result);
        if (err.code != "backend_unavailable") {
            LOG_ERROR("Backend call failed [" + err.code + "]: " + err.message);
            return "";
        }
        LOG_WARN("Backend call error (attempt " + std::to_string(attempt) + "/" +
                 std::to_string(attempts) + "): " + err.message);
        if (attempt < attempts) {
            std::this_thread::sleep_for(policy.delay);
        }
    }

    LOG_ERROR("Backend call failed after " + std::to_string(attempts) + " attempts.");
    return "";
}

}  // namespace autopilot::backend
