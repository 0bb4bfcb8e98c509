#pragma once

#include <string>
#include <optional>
#include <cstddef>
#include <sys/types.h>

namespace liverun {

struct ExitStatus {
    int exit_code = 0;          // WEXITSTATUS, or -signal when killed
    bool signaled = false;
};

enum class WriteStatus {
    COMPLETE,       // Every byte accepted
    PARTIAL,        // Pipe full; retry the remainder later
    BROKEN_PIPE     // Reader gone (exited or closed stdin)
};

// A spawned program attached to pipes. Not thread-safe: one owner (the
// execution supervisor) drives it. The child leads its own process group;
// when it exits, whatever it forked is killed before the leader is reaped
// (the zombie pins the group id, so the signal cannot reach a recycled
// group). The destructor kills and reaps a child that is still running and
// closes every descriptor still held.
class ChildProcess {
public:
    // stdin_fd may be -1 when no input pipe was attached. stdin_fd must be
    // non-blocking.
    ChildProcess(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }
    bool has_stdin() const { return stdin_fd_ >= 0; }
    bool exited() const { return exit_status_.has_value(); }
    const std::optional<ExitStatus>& exit_status() const { return exit_status_; }

    // Reap without blocking; nullopt while the child is still running
    std::optional<ExitStatus> poll();

    // Block until the child exits
    ExitStatus wait();

    // SIGKILL the process group. False if the child was already reaped.
    bool kill();

    // Write data[written..] without blocking, advancing written
    WriteStatus write_stdin(const std::string& data, size_t& written);
    void close_stdin();

    // Transfer ownership of the output read ends (e.g. to stream pumps)
    int release_stdout();
    int release_stderr();

private:
    static ExitStatus decode(int status);

    // Leader has exited (still a zombie): kill survivors, then reap
    void reap();

    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;
    std::optional<ExitStatus> exit_status_;
};

} // namespace liverun
