#pragma once

#include "dataset_stager.h"
#include "events.h"
#include "execution.h"
#include "execution_supervisor.h"
#include "input_classifier.h"
#include "process_launcher.h"
#include "constants.h"
#include <string>
#include <memory>
#include <optional>

namespace liverun {

// Engine configuration
struct EngineConfig {
    std::string workspace_root;             // Empty: system temp directory
    LauncherConfig launcher;
    SupervisorTiming timing;

    int default_timeout_seconds = DEFAULT_TIMEOUT_SECONDS;
    int min_timeout_seconds = MIN_TIMEOUT_SECONDS;
    int max_timeout_seconds = MAX_TIMEOUT_SECONDS;
};

// Accepted submission
struct StartResult {
    std::string execution_id;
    bool needs_input = false;
    int timeout_seconds = DEFAULT_TIMEOUT_SECONDS;
    RuntimeBackend backend = RuntimeBackend::LOCAL;
};

// Interactive execution engine. Each accepted submission runs on its own
// supervisor thread; output goes to the sink under the request's channel.
class ExecutionEngine {
public:
    // classifier defaults to PythonInputClassifier; stager may be null
    ExecutionEngine(const EngineConfig& config,
                    OutputSink& sink,
                    std::unique_ptr<InputClassifier> classifier = nullptr,
                    std::unique_ptr<DatasetStager> stager = nullptr);

    // Runs shutdown()
    ~ExecutionEngine();

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    // Register the execution, publish "started" and hand it to a new
    // supervisor thread. Launch problems arrive later as events. Throws
    // std::runtime_error once the engine is shutting down.
    StartResult start(const ExecutionRequest& request);

    // Queue a line for a running execution. False if the id is unknown or
    // already cleaned up.
    bool provide_input(const std::string& execution_id, const std::string& line);

    size_t active_executions() const;

    // Clamp a requested timeout into the configured range (default if unset)
    int clamp_timeout(std::optional<int> requested) const;

    // Kill every live execution, wait for each to clean up, join threads.
    // Idempotent.
    void shutdown();

    const EngineConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace liverun
