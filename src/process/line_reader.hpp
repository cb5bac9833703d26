#pragma once

#include <atomic>
#include <string>
#include <thread>
#include "process/line_queue.hpp"

namespace autopilot::process {

// Reads newline-delimited text from a file descriptor on a background thread and
// pushes every complete line (delimiter stripped) into a queue. The thread exits
// on end of stream, on a read error, or when stop() is called. It does not own
// the descriptor.
class LineReader {
public:
    LineReader(int fd, LineQueue& queue, std::string name);
    ~LineReader();

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    void start();
    void stop();

    bool finished() const { return finished_.load(); }

private:
    void run();

    int fd_;
    LineQueue& queue_;
    std::string name_;
    std::atomic_bool stop_requested_{false};
    std::atomic_bool finished_{false};
    std::thread thread_;
};

}  // namespace autopilot::process
