#pragma once

#include "execution.h"
#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace liverun {

// Live executions by id. Anyone may look an entry up (to push input); only
// the execution that was inserted may remove its own entry.
class ExecutionRegistry {
public:
    // False if the id is already registered
    bool insert(std::shared_ptr<Execution> execution);

    // nullptr for unknown or already cleaned ids
    std::shared_ptr<Execution> find(const std::string& id) const;

    // Removes id only when it still maps to owner
    bool remove(const std::string& id, const Execution* owner);

    // Append a line to a registered execution's mailbox. False ("process
    // not found") when the id is not registered.
    bool push_input(const std::string& id, const std::string& line) const;

    size_t size() const;
    std::vector<std::shared_ptr<Execution>> snapshot() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Execution>> executions_;
};

} // namespace liverun
