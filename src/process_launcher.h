#pragma once

#include "child_process.h"
#include "constants.h"
#include <string>
#include <vector>
#include <memory>
#include <optional>

namespace liverun {

enum class RuntimeBackend {
    LOCAL,          // Interpreter runs directly on the host
    CONTAINERIZED   // Interpreter runs inside a throwaway container
};

std::string backend_to_string(RuntimeBackend backend);
std::optional<RuntimeBackend> backend_from_string(const std::string& name);

struct LauncherConfig {
    std::string interpreter = "python3";
    std::vector<std::string> interpreter_args = {"-u"};     // Unbuffered output
    std::string container_runtime = "docker";
    std::string container_image = "python:3.11-slim";
    std::string container_interpreter = "python";

    // Local backend only; 0 disables the limit
    size_t memory_limit_bytes = DEFAULT_MEMORY_LIMIT_BYTES;
    size_t max_file_size_bytes = MAX_FILE_SIZE_BYTES;
    int max_open_files = MAX_OPEN_FILES;
};

struct LaunchRequest {
    std::string execution_id;
    std::string workspace_dir;
    std::string source_file;
    bool needs_input = false;
    RuntimeBackend backend = RuntimeBackend::LOCAL;
    std::vector<std::string> packages;      // Containerized backend only
};

// Concrete command chosen for a request
struct LaunchPlan {
    RuntimeBackend backend = RuntimeBackend::LOCAL;
    std::vector<std::string> argv;
    std::vector<std::string> teardown_argv;     // Run once the process is gone
    std::vector<std::string> notices;           // System messages for the user
};

class ProcessLauncher {
public:
    explicit ProcessLauncher(LauncherConfig config = LauncherConfig{});

    // Probe for the container runtime binary on PATH
    bool container_runtime_available() const;

    // Build the argument vector. A containerized request falls back to the
    // local backend (with a notice) when the runtime is not installed.
    LaunchPlan plan(const LaunchRequest& request) const;

    // Start the planned command in the workspace. stdout and stderr are
    // always pipes; stdin is a pipe only when request.needs_input, otherwise
    // /dev/null. Throws LaunchFailure if the process cannot be started.
    std::unique_ptr<ChildProcess> launch(const LaunchPlan& plan,
                                         const LaunchRequest& request) const;

    // Run plan.teardown_argv to completion (bounded). Never throws.
    static void run_teardown(const LaunchPlan& plan);

    const LauncherConfig& config() const { return config_; }

    // Name given to the container of an execution
    static std::string container_name(const std::string& execution_id);

private:
    std::vector<std::string> build_local_command(const LaunchRequest& request) const;
    std::vector<std::string> build_container_command(const LaunchRequest& request) const;

    LauncherConfig config_;
};

} // namespace liverun
