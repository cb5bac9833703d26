#include "session/control_signals.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"

namespace autopilot::session {

namespace {

std::optional<std::string> read_text(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return std::nullopt;
    }
    return buffer.str();
}

}  // namespace

std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
        --end;
    }
    return text.substr(begin, end - begin);
}

ControlSignals::ControlSignals(std::filesystem::path goal_file,
                               std::filesystem::path pause_flag,
                               std::filesystem::path correction_file)
    : goal_file_(std::move(goal_file)),
      pause_flag_(std::move(pause_flag)),
      correction_file_(std::move(correction_file)) {}

ControlSignals ControlSignals::from_config(const core::config::AgentConfig& config) {
    return ControlSignals(config.path_of(config.files.goal), config.path_of(config.files.pause_flag),
                          config.path_of(config.files.correction));
}

std::optional<std::string> ControlSignals::read_goal() const {
    auto text = read_text(goal_file_);
    if (!text.has_value()) {
        return std::nullopt;
    }
    return trim(text.value());
}

bool ControlSignals::paused() const {
    std::error_code ec;
    return std::filesystem::exists(pause_flag_, ec) && !ec;
}

std::optional<std::string> ControlSignals::take_correction() const {
    std::error_code ec;
    if (!std::filesystem::exists(correction_file_, ec) || ec) {
        return std::nullopt;
    }

    auto text = read_text(correction_file_);
    if (!text.has_value()) {
        LOG_WARN("Could not read correction file: " + correction_file_.string());
        return std::nullopt;
    }
    std::filesystem::remove(correction_file_, ec);
    if (ec) {
        LOG_WARN("Could not remove correction file: " + ec.message());
    }

    std::string correction = trim(text.value());
    if (correction.empty()) {
        return std::nullopt;
    }
    return correction;
}

}  // namespace autopilot::session
