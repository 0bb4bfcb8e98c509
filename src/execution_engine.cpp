#include "execution_engine.h"
#include "dataset_stager.h"
#include "execution_registry.h"
#include "file_utils.h"
#include "input_classifier.h"
#include "workspace.h"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <iostream>
#include <list>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace liverun {

namespace {

std::string resolve_workspace_root(const std::string& configured) {
    if (!configured.empty()) {
        return configured;
    }
    std::error_code ec;
    auto temp = std::filesystem::temp_directory_path(ec);
    return ec ? std::string("/tmp") : temp.string();
}

} // namespace

class ExecutionEngine::Impl {
public:
    Impl(const EngineConfig& cfg, OutputSink& output,
         std::unique_ptr<InputClassifier> input_classifier,
         std::unique_ptr<DatasetStager> dataset_stager)
        : config(cfg),
          sink(output),
          classifier(input_classifier ? std::move(input_classifier)
                                      : std::make_unique<PythonInputClassifier>()),
          stager(std::move(dataset_stager)),
          provisioner(resolve_workspace_root(cfg.workspace_root), stager.get()),
          launcher(cfg.launcher) {}

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    // Join the threads of executions that have already finished
    void reap_finished_workers() {
        for (auto it = workers.begin(); it != workers.end();) {
            if (*it->done) {
                it->thread.join();
                it = workers.erase(it);
            } else {
                ++it;
            }
        }
    }

    void publish(const std::string& channel_id, const Event& event) {
        try {
            sink.publish(channel_id, event);
        } catch (const std::exception& e) {
            std::cerr << "[Engine] Failed to publish " << event_type_to_string(event.type)
                      << " for " << event.execution_id << ": " << e.what() << std::endl;
        }
    }

    EngineConfig config;
    OutputSink& sink;
    std::unique_ptr<InputClassifier> classifier;
    std::unique_ptr<DatasetStager> stager;
    WorkspaceProvisioner provisioner;
    ProcessLauncher launcher;
    ExecutionRegistry registry;

    std::mutex workers_mutex;
    std::list<Worker> workers;
    bool shutting_down = false;
};

ExecutionEngine::ExecutionEngine(const EngineConfig& config,
                                 OutputSink& sink,
                                 std::unique_ptr<InputClassifier> classifier,
                                 std::unique_ptr<DatasetStager> stager)
    : impl(std::make_unique<Impl>(config, sink, std::move(classifier), std::move(stager))) {}

ExecutionEngine::~ExecutionEngine() {
    shutdown();
}

int ExecutionEngine::clamp_timeout(std::optional<int> requested) const {
    const auto& config = impl->config;
    int value = requested.value_or(config.default_timeout_seconds);
    return std::max(config.min_timeout_seconds, std::min(value, config.max_timeout_seconds));
}

StartResult ExecutionEngine::start(const ExecutionRequest& request) {
    std::lock_guard<std::mutex> lock(impl->workers_mutex);
    if (impl->shutting_down) {
        throw std::runtime_error("engine is shutting down");
    }
    impl->reap_finished_workers();

    StartResult result;
    result.execution_id = FileUtils::generate_uuid();
    result.needs_input = impl->classifier->may_require_input(request.source);
    result.timeout_seconds = clamp_timeout(request.timeout_seconds);
    result.backend = request.backend;

    auto execution = std::make_shared<Execution>(result.execution_id, request,
                                                 result.needs_input, result.timeout_seconds);
    if (!impl->registry.insert(execution)) {
        throw std::runtime_error("duplicate execution id " + result.execution_id);
    }

    std::cout << "[Engine] Execution " << result.execution_id << " accepted (backend="
              << backend_to_string(result.backend) << ", timeout=" << result.timeout_seconds
              << "s, needs_input=" << (result.needs_input ? "yes" : "no") << ")" << std::endl;

    impl->publish(request.channel_id, Event::started(result.execution_id));

    auto supervisor = std::make_shared<ExecutionSupervisor>(
        execution, impl->registry, impl->provisioner, impl->launcher, impl->sink, impl->config.timing);
    auto done = std::make_shared<std::atomic<bool>>(false);

    try {
        std::thread thread([supervisor, done]() {
            supervisor->run();
            *done = true;
        });
        impl->workers.push_back(Impl::Worker{std::move(thread), done});
    } catch (const std::system_error& e) {
        std::cerr << "[Engine] Cannot start supervisor for " << result.execution_id
                  << ": " << e.what() << std::endl;
        impl->publish(request.channel_id,
                      Event::output(result.execution_id,
                                    std::string("\nExecution error: ") + e.what() + "\n",
                                    OutputKind::ERROR));
        supervisor->cleanup();
        throw std::runtime_error(std::string("cannot start execution: ") + e.what());
    }

    return result;
}

bool ExecutionEngine::provide_input(const std::string& execution_id, const std::string& line) {
    return impl->registry.push_input(execution_id, line);
}

size_t ExecutionEngine::active_executions() const {
    return impl->registry.size();
}

void ExecutionEngine::shutdown() {
    std::list<Impl::Worker> workers;
    {
        std::lock_guard<std::mutex> lock(impl->workers_mutex);
        if (!impl->shutting_down) {
            std::cout << "[Engine] Shutting down, " << impl->registry.size()
                      << " execution(s) still running" << std::endl;
        }
        impl->shutting_down = true;
        workers.swap(impl->workers);
    }

    for (const auto& execution : impl->registry.snapshot()) {
        execution->request_stop();
    }

    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

const EngineConfig& ExecutionEngine::config() const {
    return impl->config;
}

} // namespace liverun
