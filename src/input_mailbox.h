#pragma once

#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <optional>
#include <cstddef>

namespace liverun {

// Unbounded FIFO of input lines for one execution. Any thread may push;
// only the owning supervisor pops.
class InputMailbox {
public:
    // Appends line plus '\n'. Never blocks, never rejects.
    void push(const std::string& line);

    // Next line, or nullopt once timeout elapses with the queue empty
    std::optional<std::string> try_pop(std::chrono::milliseconds timeout);

    std::size_t size() const;

    // Drop every pending line
    void clear();

private:
    std::queue<std::string> lines_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace liverun
