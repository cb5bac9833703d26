#include <exception>
#include <filesystem>
#include <string>
#include "app/cli_parser.hpp"
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"
#include "runtime/agent_runner.hpp"

int main(int argc, char* argv[]) {
    auto& logger = autopilot::core::logging::Logger::get();
    logger.set_tag("autopilot");

    // 1. Parse CLI input and return normalized input errors
    auto parsed = autopilot::app::cli::parse_and_validate(argc, argv);
    if (autopilot::core::errors::is_error(parsed)) {
        const auto& err = autopilot::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& config = autopilot::core::errors::get_value(parsed);

    // 2. Route the log to the state directory unless told otherwise
    if (config.verbose) {
        logger.set_min_level(autopilot::core::logging::LogLevel::DEBUG);
    }
    const std::filesystem::path log_path =
        config.log_file.value_or(config.path_of(config.files.log));
    if (!logger.open_file(log_path)) {
        LOG_WARN("Could not open log file " + log_path.string() + ", logging to console only.");
    }

    LOG_INFO("Starting agent in " + config.state_dir.string());

    // 3. Run until the goal is achieved or a fatal error occurs
    try {
        autopilot::runtime::AgentRunner runner(config);
        auto outcome = runner.run();
        if (autopilot::core::errors::is_error(outcome)) {
            const auto& err = autopilot::core::errors::get_error(outcome);
            LOG_ERROR("Fatal " + autopilot::core::errors::to_string(err.category) + " error [" +
                      err.code + "]: " + err.message);
            if (!err.hint.empty()) {
                LOG_INFO("Hint: " + err.hint);
            }
            logger.close_file();
            return 1;
        }
        LOG_INFO("Run finished: " +
                 autopilot::runtime::to_string(autopilot::core::errors::get_value(outcome)));
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Unhandled exception: ") + e.what());
        logger.close_file();
        return 1;
    }

    logger.close_file();
    return 0;
}
