#include "process/line_reader.hpp"

#include <cerrno>
#include <poll.h>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace autopilot::process {

namespace {

constexpr int kPollIntervalMs = 100;

}  // namespace

LineReader::LineReader(const int fd, LineQueue& queue, std::string name)
    : fd_(fd), queue_(queue), name_(std::move(name)) {}

LineReader::~LineReader() {
    stop();
}

void LineReader::start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::thread([this] { run(); });
}

void LineReader::stop() {
    stop_requested_ = true;
    if (thread_.joinable()) {
        thread_.join();
    }
}

void LineReader::run() {
    std::string pending;
    char buffer[4096];

    while (!stop_requested_.load()) {
        pollfd fds{fd_, POLLIN, 0};
        const int ready = poll(&fds, 1, kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ready == 0) {
            continue;
        }

        const ssize_t n = read(fd_, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            break;
        }
        if (n == 0) {
            break;
        }

        pending.append(buffer, static_cast<std::size_t>(n));
        std::size_t start = 0;
        std::size_t newline = pending.find('\n', start);
        while (newline != std::string::npos) {
            std::string line = pending.substr(start, newline - start);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            queue_.push(std::move(line));
            start = newline + 1;
            newline = pending.find('\n', start);
        }
        pending.erase(0, start);
    }

    if (!pending.empty()) {
        queue_.push(std::move(pending));
    }
    LOG_DEBUG("LineReader[" + name_ + "]: stream closed");
    finished_ = true;
}

}  // namespace autopilot::process
