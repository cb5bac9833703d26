#include "cli_parser.hpp"
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace autopilot::app::cli {

    using namespace autopilot::core::errors;
    using autopilot::core::config::AgentConfig;

    namespace {

        const char* const kUsage =
            "Usage: autopilot run [--state-dir DIR] [--backend-url URL] [--model NAME] "
            "[--token-ceiling N] [--rpc-timeout MS] [--handshake-timeout MS] "
            "[--backend-attempts N] [--backend-retry-delay MS] [--final-answer TEXT] "
            "[--tool-hints FILE] [--log-file FILE] [--verbose] -- <server command...>";

        struct RawCliOptions {
            std::optional<std::string> state_dir;
            std::optional<std::string> backend_url;
            std::optional<std::string> model;
            std::optional<std::string> token_ceiling;
            std::optional<std::string> rpc_timeout;
            std::optional<std::string> handshake_timeout;
            std::optional<std::string> backend_attempts;
            std::optional<std::string> backend_retry_delay;
            std::optional<std::string> final_answer;
            std::optional<std::string> tool_hints;
            std::optional<std::string> log_file;
            std::vector<std::string> server_command;
            bool verbose = false;
        };

        Result<std::uint64_t> parse_unsigned(const std::string& flag, const std::string& text,
                                             std::uint64_t min_value, std::uint64_t max_value) {
            std::uint64_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (text.empty() || ec != std::errc() || ptr != end) {
                return AgentError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer",
                                  "Provide a non-negative integer."};
            }
            if (value < min_value || value > max_value) {
                return AgentError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                                  "Must be between " + std::to_string(min_value) + " and " +
                                      std::to_string(max_value) + "."};
            }
            return value;
        }

        Result<std::filesystem::path> existing_directory(const std::string& text) {
            std::filesystem::path p(text);
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return AgentError{ErrorCategory::Input, "State directory does not exist or is not a directory",
                                  "invalid_path"};
            }
            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return AgentError{ErrorCategory::Input, "Failed to canonicalize state directory", "invalid_path"};
            }
            return canonical_path;
        }

    }  // namespace

    Result<AgentConfig> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return AgentError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        std::string command = argv[1];
        if (command != "run") {
            return AgentError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command",
                              "Currently only the 'run' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 1. Parser phase: collect raw strings, everything after "--" is the server command
        const auto value_flags = {
            std::make_pair("--state-dir", &raw.state_dir),
            std::make_pair("--backend-url", &raw.backend_url),
            std::make_pair("--model", &raw.model),
            std::make_pair("--token-ceiling", &raw.token_ceiling),
            std::make_pair("--rpc-timeout", &raw.rpc_timeout),
            std::make_pair("--handshake-timeout", &raw.handshake_timeout),
            std::make_pair("--backend-attempts", &raw.backend_attempts),
            std::make_pair("--backend-retry-delay", &raw.backend_retry_delay),
            std::make_pair("--final-answer", &raw.final_answer),
            std::make_pair("--tool-hints", &raw.tool_hints),
            std::make_pair("--log-file", &raw.log_file),
        };

        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--") {
                raw.server_command.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
                break;
            }
            if (args[i] == "--verbose") {
                raw.verbose = true;
                continue;
            }

            bool matched = false;
            for (const auto& [flag, slot] : value_flags) {
                if (args[i] != flag) {
                    continue;
                }
                if (i + 1 >= args.size()) {
                    return AgentError{ErrorCategory::Input, std::string("Missing value for ") + flag,
                                      "missing_value"};
                }
                *slot = args[++i];
                matched = true;
                break;
            }
            if (!matched) {
                return AgentError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument",
                                  kUsage};
            }
        }

        // 2. Validator phase
        AgentConfig config;
        config.verbose = raw.verbose;

        if (raw.server_command.empty() || raw.server_command.front().empty()) {
            return AgentError{ErrorCategory::Input, "Missing MCP server command", "missing_server_command",
                              "Pass the server command after '--', e.g. -- python3 server.py"};
        }
        config.server.command = std::move(raw.server_command);

        if (raw.state_dir) {
            auto dir = existing_directory(raw.state_dir.value());
            if (is_error(dir)) {
                return get_error(dir);
            }
            config.state_dir = get_value(dir);
        }

        if (raw.backend_url) {
            if (raw.backend_url->empty()) {
                return AgentError{ErrorCategory::Input, "--backend-url cannot be empty", "invalid_value"};
            }
            config.backend.url = raw.backend_url.value();
        }
        if (raw.model) {
            if (raw.model->empty()) {
                return AgentError{ErrorCategory::Input, "--model cannot be empty", "invalid_value"};
            }
            config.backend.model = raw.model.value();
        }
        if (raw.final_answer) {
            config.final_answer_sentinel = raw.final_answer.value();
        }

        if (raw.token_ceiling) {
            auto parsed = parse_unsigned("--token-ceiling", raw.token_ceiling.value(), 1, 10000000);
            if (is_error(parsed)) {
                return get_error(parsed);
            }
            config.token_ceiling = static_cast<std::size_t>(get_value(parsed));
        }
        if (raw.rpc_timeout) {
            auto parsed = parse_unsigned("--rpc-timeout", raw.rpc_timeout.value(), 1, 86400000);
            if (is_error(parsed)) {
                return get_error(parsed);
            }
            config.server.rpc_timeout = std::chrono::milliseconds(get_value(parsed));
        }
        if (raw.handshake_timeout) {
            auto parsed = parse_unsigned("--handshake-timeout", raw.handshake_timeout.value(), 1, 86400000);
            if (is_error(parsed)) {
                return get_error(parsed);
            }
            config.server.handshake_timeout = std::chrono::milliseconds(get_value(parsed));
        }
        if (raw.backend_attempts) {
            auto parsed = parse_unsigned("--backend-attempts", raw.backend_attempts.value(), 1, 100);
            if (is_error(parsed)) {
                return get_error(parsed);
            }
            config.backend.attempts = static_cast<std::uint32_t>(get_value(parsed));
        }
        if (raw.backend_retry_delay) {
            auto parsed = parse_unsigned("--backend-retry-delay", raw.backend_retry_delay.value(), 0, 600000);
            if (is_error(parsed)) {
                return get_error(parsed);
            }
            config.backend.retry_delay = std::chrono::milliseconds(get_value(parsed));
        }

        if (raw.tool_hints) {
            std::filesystem::path hints(raw.tool_hints.value());
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(hints, path_ec);
            if (path_ec || !is_file) {
                return AgentError{ErrorCategory::Input, "Tool hints file does not exist", "invalid_path"};
            }
            config.tool_hints_file = std::move(hints);
        }
        if (raw.log_file) {
            if (raw.log_file->empty()) {
                return AgentError{ErrorCategory::Input, "--log-file cannot be empty", "invalid_value"};
            }
            config.log_file = std::filesystem::path(raw.log_file.value());
        }

        return config;
    }

} // namespace autopilot::app::cli
