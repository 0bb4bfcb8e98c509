#include "input_mailbox.h"

namespace liverun {

void InputMailbox::push(const std::string& line) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push(line + "\n");
    }
    cv_.notify_one();
}

std::optional<std::string> InputMailbox::try_pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this]() { return !lines_.empty(); })) {
        return std::nullopt;
    }
    std::string line = std::move(lines_.front());
    lines_.pop();
    return line;
}

std::size_t InputMailbox::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

void InputMailbox::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::queue<std::string>().swap(lines_);
}

} // namespace liverun
