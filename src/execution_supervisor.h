#pragma once

#include "events.h"
#include "execution.h"
#include "execution_registry.h"
#include "process_launcher.h"
#include "stream_pump.h"
#include "workspace.h"
#include "constants.h"
#include <memory>
#include <string>
#include <chrono>
#include <optional>

namespace liverun {

struct SupervisorTiming {
    std::chrono::milliseconds mailbox_wait{MAILBOX_WAIT_MS};
    std::chrono::milliseconds loop_yield{LOOP_YIELD_MS};
    std::chrono::milliseconds pump_drain{PUMP_DRAIN_MS};
};

// Drives one registered execution from Starting to Cleaned on the calling
// thread: provisions the workspace, launches the program, pumps its output,
// feeds it mailbox input, enforces the timeout and cleans up. Every path
// ends with exactly one cleanup pass and one "complete" event, published
// last.
class ExecutionSupervisor {
public:
    ExecutionSupervisor(std::shared_ptr<Execution> execution,
                        ExecutionRegistry& registry,
                        const WorkspaceProvisioner& provisioner,
                        const ProcessLauncher& launcher,
                        OutputSink& sink,
                        SupervisorTiming timing = SupervisorTiming{});
    ~ExecutionSupervisor();

    ExecutionSupervisor(const ExecutionSupervisor&) = delete;
    ExecutionSupervisor& operator=(const ExecutionSupervisor&) = delete;

    // Never throws
    void run();

    // Idempotent; the second and later calls do nothing
    void cleanup();

private:
    void launch();
    void monitor();
    void service_input();
    void finish(ExecutionState outcome);
    void drain_pumps();
    void stop_pumps();

    void publish(const Event& event);
    void publish_output(const std::string& text, OutputKind kind);

    std::shared_ptr<Execution> execution_;
    ExecutionRegistry& registry_;
    const WorkspaceProvisioner& provisioner_;
    const ProcessLauncher& launcher_;
    OutputSink& sink_;
    SupervisorTiming timing_;

    Workspace workspace_;
    LaunchPlan plan_;
    std::unique_ptr<ChildProcess> process_;
    std::unique_ptr<StreamPump> stdout_pump_;
    std::unique_ptr<StreamPump> stderr_pump_;

    // Input line popped from the mailbox but not yet fully written
    std::optional<std::string> pending_input_;
    size_t pending_written_ = 0;

    ExecutionState outcome_ = ExecutionState::FAILED;
    std::optional<int> exit_code_;
};

} // namespace liverun
