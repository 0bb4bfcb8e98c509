#include "stream_pump.h"
#include "constants.h"
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <iostream>
#include <stdexcept>
#include <cerrno>
#include <cstring>

namespace liverun {

StreamPump::StreamPump(std::string name, int fd, LineHandler on_line, ErrorHandler on_error)
    : name_(std::move(name)), fd_(fd), on_line_(std::move(on_line)), on_error_(std::move(on_error)) {
    if (pipe2(wake_, O_CLOEXEC | O_NONBLOCK) != 0) {
        int err = errno;
        if (fd_ >= 0) close(fd_);
        throw std::runtime_error(std::string("Failed to create pump wake pipe: ") + std::strerror(err));
    }
}

StreamPump::~StreamPump() {
    stop();
    if (fd_ >= 0) close(fd_);
    close(wake_[0]);
    close(wake_[1]);
}

void StreamPump::start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::thread(&StreamPump::run, this);
}

bool StreamPump::wait(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return finished_; });
}

void StreamPump::stop() {
    if (!thread_.joinable()) {
        return;
    }
    char byte = 1;
    ssize_t ignored = write(wake_[1], &byte, 1);
    (void)ignored;
    thread_.join();
}

bool StreamPump::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

void StreamPump::deliver(const std::string& text) {
    for (size_t offset = 0; offset < text.size(); offset += MAX_LINE_BYTES) {
        try {
            on_line_(text.substr(offset, MAX_LINE_BYTES));
        } catch (const std::exception& e) {
            std::cerr << "[Pump] " << name_ << " handler failed: " << e.what() << std::endl;
        }
    }
}

void StreamPump::run() {
    std::string pending;
    char buffer[PIPE_BUFFER_SIZE];

    pollfd fds[2];
    fds[0] = {fd_, POLLIN, 0};
    fds[1] = {wake_[0], POLLIN, 0};

    while (true) {
        int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            std::string message = std::strerror(errno);
            try {
                on_error_(message);
            } catch (const std::exception& e) {
                std::cerr << "[Pump] " << name_ << " error handler failed: " << e.what() << std::endl;
            }
            break;
        }

        if (fds[1].revents != 0) {
            break;  // stop() requested
        }

        if (fds[0].revents == 0) {
            continue;
        }

        ssize_t n = read(fd_, buffer, sizeof(buffer));
        if (n == 0) {
            break;  // End of stream
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            std::string message = std::strerror(errno);
            try {
                on_error_(message);
            } catch (const std::exception& e) {
                std::cerr << "[Pump] " << name_ << " error handler failed: " << e.what() << std::endl;
            }
            break;
        }

        pending.append(buffer, static_cast<size_t>(n));

        size_t start = 0;
        size_t newline;
        while ((newline = pending.find('\n', start)) != std::string::npos) {
            deliver(pending.substr(start, newline - start + 1));
            start = newline + 1;
        }
        pending.erase(0, start);

        while (pending.size() >= MAX_LINE_BYTES) {
            deliver(pending.substr(0, MAX_LINE_BYTES));
            pending.erase(0, MAX_LINE_BYTES);
        }
    }

    if (!pending.empty()) {
        deliver(pending);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
    }
    cv_.notify_all();
}

} // namespace liverun
