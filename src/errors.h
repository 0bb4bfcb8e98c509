#pragma once

#include <stdexcept>
#include <string>

namespace liverun {

// The program could not be started: workspace unwritable, interpreter or
// container runtime missing, fork/exec failure.
class LaunchFailure : public std::runtime_error {
public:
    explicit LaunchFailure(const std::string& message)
        : std::runtime_error("Launch failure: " + message) {}
};

// Malformed submission (bad JSON, missing or mistyped fields)
class ProtocolError : public std::invalid_argument {
public:
    explicit ProtocolError(const std::string& message)
        : std::invalid_argument(message) {}
};

} // namespace liverun
