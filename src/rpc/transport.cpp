#include "rpc/transport.hpp"

#include <cerrno>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace autopilot::rpc {

using nlohmann::json;
using protocol::RpcId;
using protocol::RpcMessage;
using protocol::RpcNotification;
using protocol::RpcRequest;
using protocol::RpcResponse;

Transport::Transport(const int output_fd, process::LineQueue& inbound)
    : output_fd_(output_fd), inbound_(inbound) {}

RpcId Transport::next_id() {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_++;
}

RpcId Transport::send_request(const std::string& method, const json& params) {
    RpcRequest request;
    request.id = next_id();
    request.method = method;
    request.params = params;
    write_line(protocol::encode(request));
    return request.id;
}

void Transport::send_notification(const std::string& method, const json& params) {
    RpcNotification notification;
    notification.method = method;
    notification.params = params;
    write_line(protocol::encode(notification));
}

void Transport::write_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || output_fd_ < 0) {
        LOG_DEBUG("Transport: dropping write after close");
        return;
    }

    const std::string framed = line + "\n";
    std::size_t written = 0;
    while (written < framed.size()) {
        const ssize_t n = write(output_fd_, framed.data() + written, framed.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            // The reader went away (EPIPE) or the descriptor is gone: treat as closed.
            LOG_WARN("Transport: write failed, marking channel closed (errno=" +
                     std::to_string(errno) + ")");
            closed_ = true;
            return;
        }
        written += static_cast<std::size_t>(n);
    }
}

std::optional<RpcMessage> Transport::receive(const std::chrono::milliseconds wait) {
    auto line = inbound_.pop_for(wait);
    if (!line.has_value()) {
        return std::nullopt;
    }
    auto decoded = protocol::decode(line.value());
    if (core::errors::is_error(decoded)) {
        LOG_DEBUG("Transport: skipping line (" + core::errors::get_error(decoded).message +
                  "): " + line.value());
        return std::nullopt;
    }
    return core::errors::get_value(decoded);
}

json Transport::await_response(const RpcId id, const std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto message = receive(remaining.count() > 0 ? remaining : std::chrono::milliseconds(1));
        if (!message.has_value()) {
            continue;
        }
        if (!protocol::is_response_to(message.value(), id)) {
            LOG_DEBUG("Transport: dropping message not addressed to request " +
                      std::to_string(id));
            continue;
        }

        const auto& response = std::get<RpcResponse>(message.value());
        if (response.has_error) {
            LOG_ERROR("MCP tool call error: " + response.error.dump());
            return json::object();
        }
        return response.result;
    }

    LOG_WARN("Timeout waiting for response to request ID " + std::to_string(id));
    return json::object();
}

void Transport::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

bool Transport::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

}  // namespace autopilot::rpc
