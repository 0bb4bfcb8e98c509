#pragma once

#include <string>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <chrono>

namespace liverun {

// Drains one output pipe on its own thread, handing each line (newline
// included) to on_line in read order. A trailing line without newline is
// delivered at end of stream; a line longer than MAX_LINE_BYTES is delivered
// in pieces. A read error is reported once through on_error and ends the
// pump. Handlers run on the pump thread.
class StreamPump {
public:
    using LineHandler = std::function<void(const std::string& line)>;
    using ErrorHandler = std::function<void(const std::string& message)>;

    // Takes ownership of fd. Throws std::runtime_error if the wake-up pipe
    // cannot be created.
    StreamPump(std::string name, int fd, LineHandler on_line, ErrorHandler on_error);
    ~StreamPump();

    StreamPump(const StreamPump&) = delete;
    StreamPump& operator=(const StreamPump&) = delete;

    void start();

    // Wait for end of stream (or error). True if the pump finished in time.
    bool wait(std::chrono::milliseconds timeout);

    // Interrupt a pump still blocked on the pipe, deliver any partial line,
    // and join the thread. Idempotent.
    void stop();

    bool finished() const;
    const std::string& name() const { return name_; }

private:
    void run();
    void deliver(const std::string& text);

    std::string name_;
    int fd_;
    int wake_[2] = {-1, -1};
    LineHandler on_line_;
    ErrorHandler on_error_;

    std::thread thread_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool finished_ = false;
};

} // namespace liverun
