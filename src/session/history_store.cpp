#include "session/history_store.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include <utility>

namespace autopilot::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

AgentError persistence_failure(const std::string& message) {
    return AgentError{ErrorCategory::Persistence, message, "persistence_failure"};
}

}  // namespace

core::errors::Status write_json_atomically(const std::filesystem::path& path,
                                           const json& document) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return persistence_failure("Unable to create directory: " +
                                       path.parent_path().string());
        }
    }

    const std::filesystem::path temp_path =
        path.string() + ".tmp." + std::to_string(static_cast<long>(getpid()));
    const std::string text = document.dump(2, ' ', false, json::error_handler_t::replace);

    const int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return persistence_failure("Unable to open " + temp_path.string() + ": " +
                                   std::strerror(errno));
    }

    std::size_t written = 0;
    while (written < text.size()) {
        const ssize_t n = write(fd, text.data() + written, text.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const std::string reason = std::strerror(errno);
            static_cast<void>(close(fd));
            std::filesystem::remove(temp_path, ec);
            return persistence_failure("Unable to write " + temp_path.string() + ": " + reason);
        }
        written += static_cast<std::size_t>(n);
    }

    if (fsync(fd) != 0 || close(fd) != 0) {
        const std::string reason = std::strerror(errno);
        std::filesystem::remove(temp_path, ec);
        return persistence_failure("Unable to flush " + temp_path.string() + ": " + reason);
    }

    if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
        const std::string reason = std::strerror(errno);
        std::filesystem::remove(temp_path, ec);
        return persistence_failure("Unable to replace " + path.string() + ": " + reason);
    }
    return core::errors::Ok{};
}

HistoryStore::HistoryStore(std::filesystem::path path) : path_(std::move(path)) {}

core::errors::Result<protocol::History> HistoryStore::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec) || ec) {
        return protocol::History{};
    }

    std::ifstream in(path_);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Persistence, "Unable to open " + path_.string(),
                          "history_unreadable"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    const json document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded()) {
        return AgentError{ErrorCategory::Persistence, path_.string() + " is not valid JSON",
                          "history_corrupt"};
    }
    return protocol::history_from_json(document);
}

core::errors::Status HistoryStore::save(const protocol::History& history) const {
    return write_json_atomically(path_, protocol::to_json(history));
}

core::errors::Result<std::filesystem::path> HistoryStore::set_aside() const {
    std::filesystem::path target = path_;
    target += ".bad";
    std::error_code ec;
    std::filesystem::rename(path_, target, ec);
    if (ec) {
        return persistence_failure("Unable to move " + path_.string() + " aside: " + ec.message());
    }
    return target;
}

}  // namespace autopilot::session
