#include "child_process.h"
#include <sys/wait.h>
#include <unistd.h>
#include <signal.h>
#include <cerrno>

namespace liverun {

ChildProcess::ChildProcess(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

ChildProcess::~ChildProcess() {
    if (!exited()) {
        kill();
        wait();
    }
    close_stdin();
    if (stdout_fd_ >= 0) close(stdout_fd_);
    if (stderr_fd_ >= 0) close(stderr_fd_);
}

ExitStatus ChildProcess::decode(int status) {
    ExitStatus result;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = -WTERMSIG(status);
        result.signaled = true;
    }
    return result;
}

void ChildProcess::reap() {
    ::kill(-pid_, SIGKILL);

    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &status, 0);
    } while (result == -1 && errno == EINTR);

    exit_status_ = (result == pid_) ? decode(status) : ExitStatus{-1, false};
}

std::optional<ExitStatus> ChildProcess::poll() {
    if (exited()) {
        return exit_status_;
    }

    siginfo_t info{};
    int result;
    do {
        result = waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT);
    } while (result == -1 && errno == EINTR);

    if (result == -1) {
        // Reaped elsewhere or never ours; nothing left to wait for
        exit_status_ = ExitStatus{-1, false};
    } else if (info.si_pid == pid_) {
        reap();
    }
    return exit_status_;
}

ExitStatus ChildProcess::wait() {
    if (exited()) {
        return *exit_status_;
    }

    siginfo_t info{};
    int result;
    do {
        result = waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT);
    } while (result == -1 && errno == EINTR);

    if (result == -1) {
        exit_status_ = ExitStatus{-1, false};
    } else {
        reap();
    }
    return *exit_status_;
}

bool ChildProcess::kill() {
    if (exited()) {
        return false;
    }
    if (::kill(-pid_, SIGKILL) != 0) {
        ::kill(pid_, SIGKILL);
    }
    return true;
}

WriteStatus ChildProcess::write_stdin(const std::string& data, size_t& written) {
    if (stdin_fd_ < 0) {
        return WriteStatus::BROKEN_PIPE;
    }

    while (written < data.size()) {
        ssize_t n = write(stdin_fd_, data.data() + written, data.size() - written);
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return WriteStatus::PARTIAL;
        }
        close_stdin();
        return WriteStatus::BROKEN_PIPE;
    }
    return WriteStatus::COMPLETE;
}

void ChildProcess::close_stdin() {
    if (stdin_fd_ >= 0) {
        close(stdin_fd_);
        stdin_fd_ = -1;
    }
}

int ChildProcess::release_stdout() {
    int fd = stdout_fd_;
    stdout_fd_ = -1;
    return fd;
}

int ChildProcess::release_stderr() {
    int fd = stderr_fd_;
    stderr_fd_ = -1;
    return fd;
}

} // namespace liverun
