#pragma once

#include "input_mailbox.h"
#include "process_launcher.h"
#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include <atomic>

namespace liverun {

enum class ExecutionState {
    STARTING,
    RUNNING,
    COMPLETED,
    TIMED_OUT,
    FAILED,
    CLEANED
};

std::string execution_state_to_string(ExecutionState state);

// Starting -> Running -> {Completed | TimedOut | Failed} -> Cleaned.
// Starting may also fail directly (launch failure).
bool is_valid_transition(ExecutionState from, ExecutionState to);
bool is_outcome(ExecutionState state);

// What the submitter asked for
struct ExecutionRequest {
    std::string source;
    std::string channel_id;
    std::string session_id;                 // Dataset lookup key; may be empty
    std::optional<int> timeout_seconds;     // Clamped by the engine
    RuntimeBackend backend = RuntimeBackend::LOCAL;
    std::vector<std::string> packages;
};

// Shared record of one run. The registry maps the execution id to this
// object, so the mailbox and the needs-input flag appear and disappear
// together. Only the owning supervisor advances the state.
class Execution {
public:
    Execution(std::string id, ExecutionRequest request, bool needs_input, int timeout_seconds);

    Execution(const Execution&) = delete;
    Execution& operator=(const Execution&) = delete;

    const std::string& id() const { return id_; }
    const std::string& channel_id() const { return request_.channel_id; }
    const ExecutionRequest& request() const { return request_; }
    bool needs_input() const { return needs_input_; }
    int timeout_seconds() const { return timeout_seconds_; }

    InputMailbox& mailbox() { return mailbox_; }

    ExecutionState state() const;

    // Move to next if the transition is legal. False otherwise, including
    // a second attempt to reach the same state.
    bool advance(ExecutionState next);

    // Ask the supervisor to kill the process at its next check
    void request_stop() { stop_requested_ = true; }
    bool stop_requested() const { return stop_requested_; }

private:
    const std::string id_;
    const ExecutionRequest request_;
    const bool needs_input_;
    const int timeout_seconds_;

    InputMailbox mailbox_;

    mutable std::mutex state_mutex_;
    ExecutionState state_ = ExecutionState::STARTING;
    std::atomic<bool> stop_requested_{false};
};

} // namespace liverun
