#include "execution_supervisor.h"
#include "errors.h"
#include <iostream>
#include <thread>

namespace liverun {

namespace {

CompletionStatus to_completion_status(ExecutionState state) {
    switch (state) {
        case ExecutionState::COMPLETED: return CompletionStatus::COMPLETED;
        case ExecutionState::TIMED_OUT: return CompletionStatus::TIMED_OUT;
        default: return CompletionStatus::FAILED;
    }
}

} // namespace

ExecutionSupervisor::ExecutionSupervisor(std::shared_ptr<Execution> execution,
                                         ExecutionRegistry& registry,
                                         const WorkspaceProvisioner& provisioner,
                                         const ProcessLauncher& launcher,
                                         OutputSink& sink,
                                         SupervisorTiming timing)
    : execution_(std::move(execution)),
      registry_(registry),
      provisioner_(provisioner),
      launcher_(launcher),
      sink_(sink),
      timing_(timing) {}

ExecutionSupervisor::~ExecutionSupervisor() {
    cleanup();
}

void ExecutionSupervisor::run() {
    try {
        launch();
        monitor();
    } catch (const LaunchFailure& e) {
        std::cerr << "[Supervisor] " << execution_->id() << ": " << e.what() << std::endl;
        publish_output(std::string("\n") + e.what() + "\n", OutputKind::ERROR);
        finish(ExecutionState::FAILED);
    } catch (const std::exception& e) {
        std::cerr << "[Supervisor] " << execution_->id() << " aborted: " << e.what() << std::endl;
        publish_output(std::string("\nExecution error: ") + e.what() + "\n", OutputKind::ERROR);
        finish(ExecutionState::FAILED);
    }
    cleanup();
}

void ExecutionSupervisor::launch() {
    const ExecutionRequest& request = execution_->request();

    workspace_ = provisioner_.provision(execution_->id(), request.source, request.session_id);
    if (workspace_.datasets_staged > 0) {
        publish_output("Session datasets were copied into the execution workspace at ./data/ and ./datasets/" +
                       request.session_id + "/\n", OutputKind::SYSTEM);
    }

    LaunchRequest launch_request;
    launch_request.execution_id = execution_->id();
    launch_request.workspace_dir = workspace_.directory;
    launch_request.source_file = workspace_.source_file;
    launch_request.needs_input = execution_->needs_input();
    launch_request.backend = request.backend;
    launch_request.packages = request.packages;

    plan_ = launcher_.plan(launch_request);
    for (const auto& notice : plan_.notices) {
        publish_output(notice, OutputKind::SYSTEM);
    }

    process_ = launcher_.launch(plan_, launch_request);
    execution_->advance(ExecutionState::RUNNING);

    publish_output("Code execution started...\n", OutputKind::SYSTEM);

    stdout_pump_ = std::make_unique<StreamPump>(
        "stdout", process_->release_stdout(),
        [this](const std::string& line) { publish_output(line, OutputKind::STDOUT); },
        [this](const std::string& message) {
            publish_output("\nStream read error: " + message + "\n", OutputKind::ERROR);
        });
    stderr_pump_ = std::make_unique<StreamPump>(
        "stderr", process_->release_stderr(),
        [this](const std::string& line) { publish_output(line, OutputKind::STDERR); },
        [this](const std::string& message) {
            publish_output("\nStream read error: " + message + "\n", OutputKind::ERROR);
        });
    stdout_pump_->start();
    stderr_pump_->start();
}

void ExecutionSupervisor::monitor() {
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::seconds(execution_->timeout_seconds());

    while (true) {
        if (auto status = process_->poll()) {
            exit_code_ = status->exit_code;
            break;
        }

        if (execution_->stop_requested()) {
            process_->kill();
            exit_code_ = process_->wait().exit_code;
            publish_output("\nExecution aborted: server is shutting down\n", OutputKind::ERROR);
            drain_pumps();
            finish(ExecutionState::FAILED);
            return;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            process_->kill();
            exit_code_ = process_->wait().exit_code;
            std::cout << "[Supervisor] Execution " << execution_->id() << " timed out after "
                      << execution_->timeout_seconds() << "s" << std::endl;
            publish_output("\nError: Code execution timed out (" +
                           std::to_string(execution_->timeout_seconds()) + " seconds)\n",
                           OutputKind::ERROR);
            drain_pumps();
            finish(ExecutionState::TIMED_OUT);
            return;
        }

        service_input();
        std::this_thread::sleep_for(timing_.loop_yield);
    }

    drain_pumps();
    const auto& status = process_->exit_status();
    bool success = status && !status->signaled && status->exit_code == 0;
    finish(success ? ExecutionState::COMPLETED : ExecutionState::FAILED);
}

void ExecutionSupervisor::service_input() {
    if (!pending_input_) {
        auto line = execution_->mailbox().try_pop(timing_.mailbox_wait);
        if (!line) {
            return;
        }
        if (!process_->has_stdin()) {
            std::cerr << "[Supervisor] " << execution_->id()
                      << ": no input pipe attached, dropping input line" << std::endl;
            return;
        }
        pending_input_ = std::move(*line);
        pending_written_ = 0;
    }

    switch (process_->write_stdin(*pending_input_, pending_written_)) {
        case WriteStatus::COMPLETE:
            pending_input_.reset();
            publish(Event::input_received(execution_->id()));
            break;
        case WriteStatus::PARTIAL:
            break;  // Pipe full; the rest goes out on a later pass
        case WriteStatus::BROKEN_PIPE:
            std::cerr << "[Supervisor] " << execution_->id()
                      << ": input pipe closed, dropping input line" << std::endl;
            pending_input_.reset();
            break;
    }
}

void ExecutionSupervisor::finish(ExecutionState outcome) {
    if (execution_->advance(outcome)) {
        outcome_ = outcome;
    }
}

void ExecutionSupervisor::drain_pumps() {
    const auto deadline = std::chrono::steady_clock::now() + timing_.pump_drain;
    for (StreamPump* pump : {stdout_pump_.get(), stderr_pump_.get()}) {
        if (!pump) {
            continue;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() < 0) {
            remaining = std::chrono::milliseconds(0);
        }
        if (!pump->wait(remaining)) {
            std::cerr << "[Supervisor] " << execution_->id() << ": " << pump->name()
                      << " still open after drain budget" << std::endl;
        }
    }
    stop_pumps();
}

void ExecutionSupervisor::stop_pumps() {
    // Destruction stops and joins the pump thread
    stdout_pump_.reset();
    stderr_pump_.reset();
}

void ExecutionSupervisor::cleanup() {
    ExecutionState state = execution_->state();
    if (state == ExecutionState::STARTING || state == ExecutionState::RUNNING) {
        finish(ExecutionState::FAILED);
    }
    if (!execution_->advance(ExecutionState::CLEANED)) {
        return;
    }

    stop_pumps();
    if (process_) {
        if (!process_->exited()) {
            process_->kill();
            exit_code_ = process_->wait().exit_code;
        }
        process_.reset();
    }
    pending_input_.reset();

    registry_.remove(execution_->id(), execution_.get());
    execution_->mailbox().clear();

    if (!plan_.teardown_argv.empty()) {
        ProcessLauncher::run_teardown(plan_);
    }
    if (!workspace_.empty()) {
        WorkspaceProvisioner::remove(workspace_);
    }

    std::cout << "[Supervisor] Execution " << execution_->id() << " finished: "
              << execution_state_to_string(outcome_);
    if (exit_code_) {
        std::cout << " (exit code " << *exit_code_ << ")";
    }
    std::cout << std::endl;

    publish(Event::complete(execution_->id(), to_completion_status(outcome_), exit_code_));
}

void ExecutionSupervisor::publish(const Event& event) {
    try {
        sink_.publish(execution_->channel_id(), event);
    } catch (const std::exception& e) {
        std::cerr << "[Supervisor] Failed to publish " << event_type_to_string(event.type)
                  << " for " << execution_->id() << ": " << e.what() << std::endl;
    }
}

void ExecutionSupervisor::publish_output(const std::string& text, OutputKind kind) {
    publish(Event::output(execution_->id(), text, kind));
}

} // namespace liverun
