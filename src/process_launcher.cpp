#include "process_launcher.h"
#include "errors.h"
#include "file_utils.h"
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <chrono>
#include <thread>
#include <mutex>
#include <cerrno>
#include <cstring>

namespace liverun {

namespace {

// Writes to a pipe whose reader exited must fail with EPIPE, not kill us
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, []() { signal(SIGPIPE, SIG_IGN); });
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void close_pipe(int fds[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

bool make_pipe(int fds[2]) {
    return pipe2(fds, O_CLOEXEC) == 0;
}

// The server blocks SIGINT/SIGTERM and ignores SIGPIPE; both survive exec
void reset_signals() {
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);
    signal(SIGPIPE, SIG_DFL);
}

struct ChildLimits {
    bool enabled = false;
    rlimit memory{RLIM_INFINITY, RLIM_INFINITY};
    rlimit file_size{RLIM_INFINITY, RLIM_INFINITY};
    rlimit open_files{RLIM_INFINITY, RLIM_INFINITY};
};

// Runs in the forked child: async-signal-safe calls only
[[noreturn]] void exec_child(char* const argv[], const char* working_dir, int stdin_fd,
                             int stdout_fd, int stderr_fd, int error_fd,
                             const ChildLimits& limits) {
    setpgid(0, 0);

    if (dup2(stdin_fd, STDIN_FILENO) < 0 ||
        dup2(stdout_fd, STDOUT_FILENO) < 0 ||
        dup2(stderr_fd, STDERR_FILENO) < 0 ||
        chdir(working_dir) != 0) {
        int err = errno;
        ssize_t ignored = write(error_fd, &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    if (limits.enabled) {
        setrlimit(RLIMIT_AS, &limits.memory);
        setrlimit(RLIMIT_FSIZE, &limits.file_size);
        setrlimit(RLIMIT_NOFILE, &limits.open_files);
    }

    reset_signals();
    execvp(argv[0], argv);

    int err = errno;
    ssize_t ignored = write(error_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

} // namespace

std::string backend_to_string(RuntimeBackend backend) {
    switch (backend) {
        case RuntimeBackend::LOCAL: return "local";
        case RuntimeBackend::CONTAINERIZED: return "containerized";
    }
    return "local";
}

std::optional<RuntimeBackend> backend_from_string(const std::string& name) {
    if (name == "local") return RuntimeBackend::LOCAL;
    if (name == "containerized" || name == "docker") return RuntimeBackend::CONTAINERIZED;
    return std::nullopt;
}

ProcessLauncher::ProcessLauncher(LauncherConfig config) : config_(std::move(config)) {
    ignore_sigpipe();
}

bool ProcessLauncher::container_runtime_available() const {
    return !FileUtils::find_executable(config_.container_runtime).empty();
}

std::string ProcessLauncher::container_name(const std::string& execution_id) {
    return "liverun-" + execution_id;
}

std::vector<std::string> ProcessLauncher::build_local_command(const LaunchRequest& request) const {
    std::vector<std::string> argv = {config_.interpreter};
    argv.insert(argv.end(), config_.interpreter_args.begin(), config_.interpreter_args.end());
    argv.push_back(request.source_file);
    return argv;
}

std::vector<std::string> ProcessLauncher::build_container_command(const LaunchRequest& request) const {
    std::string script = std::string(CONTAINER_MOUNT_POINT) + "/" +
                         std::filesystem::path(request.source_file).filename().string();

    std::ostringstream shell;
    if (!request.packages.empty()) {
        shell << "pip install --no-cache-dir";
        for (const auto& package : request.packages) {
            shell << " " << FileUtils::shell_quote(package);
        }
        shell << " >/dev/null 2>&1 && ";
    }
    shell << config_.container_interpreter;
    for (const auto& arg : config_.interpreter_args) {
        shell << " " << FileUtils::shell_quote(arg);
    }
    shell << " " << FileUtils::shell_quote(script);

    return {
        config_.container_runtime, "run", "--rm", "-i",
        "--name", container_name(request.execution_id),
        "-v", request.workspace_dir + ":" + CONTAINER_MOUNT_POINT,
        "-w", CONTAINER_MOUNT_POINT,
        config_.container_image,
        "bash", "-lc", shell.str()
    };
}

LaunchPlan ProcessLauncher::plan(const LaunchRequest& request) const {
    LaunchPlan plan;
    plan.backend = request.backend;

    if (plan.backend == RuntimeBackend::CONTAINERIZED && !container_runtime_available()) {
        plan.notices.push_back("Container runtime '" + config_.container_runtime +
                               "' not found on server, falling back to local execution.\n");
        plan.backend = RuntimeBackend::LOCAL;
    }

    if (plan.backend == RuntimeBackend::CONTAINERIZED) {
        plan.argv = build_container_command(request);
        plan.teardown_argv = {config_.container_runtime, "rm", "-f",
                              container_name(request.execution_id)};
    } else {
        plan.argv = build_local_command(request);
    }

    return plan;
}

std::unique_ptr<ChildProcess> ProcessLauncher::launch(const LaunchPlan& plan,
                                                      const LaunchRequest& request) const {
    if (plan.argv.empty()) {
        throw LaunchFailure("empty command");
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int stdin_pipe[2] = {-1, -1};
    int error_pipe[2] = {-1, -1};

    auto close_all = [&]() {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(stdin_pipe);
        close_pipe(error_pipe);
    };

    bool pipes_ok = make_pipe(stdout_pipe) && make_pipe(stderr_pipe) && make_pipe(error_pipe);
    if (pipes_ok && request.needs_input) {
        pipes_ok = make_pipe(stdin_pipe);
    } else if (pipes_ok) {
        // No feeder: the child reads EOF instead of blocking forever
        stdin_pipe[0] = open("/dev/null", O_RDONLY | O_CLOEXEC);
        pipes_ok = stdin_pipe[0] >= 0;
    }
    if (!pipes_ok) {
        int err = errno;
        close_all();
        throw LaunchFailure(std::string("failed to create pipes: ") + std::strerror(err));
    }

    // Everything the child touches is prepared before fork
    std::vector<char*> argv;
    for (const auto& arg : plan.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    ChildLimits limits;
    if (plan.backend == RuntimeBackend::LOCAL) {
        limits.enabled = true;
        if (config_.memory_limit_bytes > 0) {
            limits.memory.rlim_cur = limits.memory.rlim_max = config_.memory_limit_bytes;
        }
        if (config_.max_file_size_bytes > 0) {
            limits.file_size.rlim_cur = limits.file_size.rlim_max = config_.max_file_size_bytes;
        }
        if (config_.max_open_files > 0) {
            limits.open_files.rlim_cur = limits.open_files.rlim_max = config_.max_open_files;
        }
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_all();
        throw LaunchFailure(std::string("fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        exec_child(argv.data(), request.workspace_dir.c_str(), stdin_pipe[0],
                   stdout_pipe[1], stderr_pipe[1], error_pipe[1], limits);
    }

    // Parent: also set the group here so kill(-pid) works before the child runs
    setpgid(pid, pid);

    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(stdin_pipe[0]);
    close_fd(error_pipe[1]);

    // The error pipe closes on successful exec; otherwise it carries errno
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(error_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(error_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        close_all();
        throw LaunchFailure("cannot execute '" + plan.argv[0] + "': " + std::strerror(child_errno));
    }

    if (stdin_pipe[1] >= 0) {
        int flags = fcntl(stdin_pipe[1], F_GETFL);
        fcntl(stdin_pipe[1], F_SETFL, flags | O_NONBLOCK);
    }

    auto child = std::make_unique<ChildProcess>(pid, stdin_pipe[1], stdout_pipe[0], stderr_pipe[0]);
    stdin_pipe[1] = stdout_pipe[0] = stderr_pipe[0] = -1;

    std::cout << "[Launcher] Started pid " << pid << " (" << backend_to_string(plan.backend)
              << ", stdin " << (request.needs_input ? "pipe" : "closed") << ")" << std::endl;
    return child;
}

void ProcessLauncher::run_teardown(const LaunchPlan& plan) {
    if (plan.teardown_argv.empty()) {
        return;
    }

    std::vector<char*> argv;
    for (const auto& arg : plan.teardown_argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int null_fd = open("/dev/null", O_RDWR | O_CLOEXEC);
    if (null_fd < 0) {
        std::cerr << "[Launcher] Teardown skipped: cannot open /dev/null" << std::endl;
        return;
    }

    pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "[Launcher] Teardown fork failed: " << std::strerror(errno) << std::endl;
        close(null_fd);
        return;
    }

    if (pid == 0) {
        setpgid(0, 0);
        dup2(null_fd, STDIN_FILENO);
        dup2(null_fd, STDOUT_FILENO);
        dup2(null_fd, STDERR_FILENO);
        reset_signals();
        execvp(argv[0], argv.data());
        _exit(127);
    }
    close(null_fd);

    ChildProcess teardown(pid, -1, -1, -1);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (!teardown.poll()) {
        if (std::chrono::steady_clock::now() > deadline) {
            std::cerr << "[Launcher] Teardown '" << plan.teardown_argv[0]
                      << "' did not finish, killing it" << std::endl;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    // ~ChildProcess kills and reaps a teardown that overran
}

} // namespace liverun
