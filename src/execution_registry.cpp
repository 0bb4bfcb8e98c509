#include "execution_registry.h"

namespace liverun {

bool ExecutionRegistry::insert(std::shared_ptr<Execution> execution) {
    if (!execution) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string id = execution->id();
    return executions_.emplace(id, std::move(execution)).second;
}

std::shared_ptr<Execution> ExecutionRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = executions_.find(id);
    if (it == executions_.end()) {
        return nullptr;
    }
    return it->second;
}

bool ExecutionRegistry::remove(const std::string& id, const Execution* owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = executions_.find(id);
    if (it == executions_.end() || it->second.get() != owner) {
        return false;
    }
    executions_.erase(it);
    return true;
}

bool ExecutionRegistry::push_input(const std::string& id, const std::string& line) const {
    // Push under the lock so a concurrent remove() cannot slip in between
    // the lookup and the append
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = executions_.find(id);
    if (it == executions_.end()) {
        return false;
    }
    it->second->mailbox().push(line);
    return true;
}

size_t ExecutionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return executions_.size();
}

std::vector<std::shared_ptr<Execution>> ExecutionRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Execution>> result;
    result.reserve(executions_.size());
    for (const auto& entry : executions_) {
        result.push_back(entry.second);
    }
    return result;
}

} // namespace liverun
