#pragma once

#include "execution_engine.h"
#include "constants.h"
#include <string>
#include <vector>

namespace liverun {

// Command-line configuration of the liverun server
struct ServerConfig {
    int port = DEFAULT_PORT;
    std::string workspace_root;                     // Empty: system temp directory
    std::string dataset_root = "./data/sessions";
    std::string interpreter = "python3";
    std::string container_runtime = "docker";
    std::string container_image = "python:3.11-slim";
    int default_timeout_seconds = DEFAULT_TIMEOUT_SECONDS;
    int max_timeout_seconds = MAX_TIMEOUT_SECONDS;
    bool show_help = false;

    // Engine settings derived from these flags
    EngineConfig engine_config() const;
};

// Parse argv. Throws std::invalid_argument for unknown flags, missing
// values and out-of-range numbers.
ServerConfig parse_args(const std::vector<std::string>& args);
ServerConfig parse_args(int argc, char* argv[]);

std::string usage(const std::string& program);

} // namespace liverun
