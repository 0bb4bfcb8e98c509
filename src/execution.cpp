#include "execution.h"

namespace liverun {

std::string execution_state_to_string(ExecutionState state) {
    switch (state) {
        case ExecutionState::STARTING: return "starting";
        case ExecutionState::RUNNING: return "running";
        case ExecutionState::COMPLETED: return "completed";
        case ExecutionState::TIMED_OUT: return "timed_out";
        case ExecutionState::FAILED: return "failed";
        case ExecutionState::CLEANED: return "cleaned";
    }
    return "unknown";
}

bool is_outcome(ExecutionState state) {
    return state == ExecutionState::COMPLETED ||
           state == ExecutionState::TIMED_OUT ||
           state == ExecutionState::FAILED;
}

bool is_valid_transition(ExecutionState from, ExecutionState to) {
    switch (from) {
        case ExecutionState::STARTING:
            return to == ExecutionState::RUNNING || to == ExecutionState::FAILED;
        case ExecutionState::RUNNING:
            return is_outcome(to);
        case ExecutionState::COMPLETED:
        case ExecutionState::TIMED_OUT:
        case ExecutionState::FAILED:
            return to == ExecutionState::CLEANED;
        case ExecutionState::CLEANED:
            return false;
    }
    return false;
}

Execution::Execution(std::string id, ExecutionRequest request, bool needs_input, int timeout_seconds)
    : id_(std::move(id)),
      request_(std::move(request)),
      needs_input_(needs_input),
      timeout_seconds_(timeout_seconds) {}

ExecutionState Execution::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool Execution::advance(ExecutionState next) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!is_valid_transition(state_, next)) {
        return false;
    }
    state_ = next;
    return true;
}

} // namespace liverun
