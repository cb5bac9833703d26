#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "process/line_queue.hpp"
#include "protocol/rpc_message.hpp"

namespace autopilot::rpc {

// Line-delimited JSON-RPC over a pair of pipes. The transport is the only writer
// to the output descriptor and the only consumer of the inbound queue.
//
// Callers must keep at most one request outstanding: await_response() drops any
// response whose id does not match the one being awaited.
class Transport {
public:
    static constexpr std::chrono::milliseconds kDefaultTimeout{std::chrono::hours(1)};

    Transport(int output_fd, process::LineQueue& inbound);

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    // Ids start at 1 and are never reused within the process lifetime.
    protocol::RpcId next_id();

    // Assigns an id, writes the request and returns the id.
    protocol::RpcId send_request(const std::string& method,
                                 const nlohmann::json& params = nlohmann::json::object());

    void send_notification(const std::string& method,
                           const nlohmann::json& params = nlohmann::json::object());

    // Waits up to `wait` for the next well-formed inbound message. Malformed lines
    // are logged and skipped.
    std::optional<protocol::RpcMessage> receive(std::chrono::milliseconds wait);

    // Returns the `result` of the response with the given id. An error response or
    // a timeout yields an empty JSON object; nothing is thrown.
    nlohmann::json await_response(protocol::RpcId id,
                                  std::chrono::milliseconds timeout = kDefaultTimeout);

    // After close() every write is a silent no-op.
    void close();
    bool closed() const;

private:
    void write_line(const std::string& line);

    int output_fd_;
    process::LineQueue& inbound_;
    mutable std::mutex mutex_;
    bool closed_ = false;
    protocol::RpcId next_id_ = 1;
};

inline bool is_empty_result(const nlohmann::json& result) {
    return result.is_null() || (result.is_object() && result.empty());
}

}  // namespace autopilot::rpc
