#include "config.h"
#include <sstream>
#include <stdexcept>

namespace liverun {

namespace {

int parse_int(const std::string& flag, const std::string& value, int min, int max) {
    size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    }
    if (parsed < min || parsed > max) {
        throw std::invalid_argument(flag + " must be between " + std::to_string(min) +
                                    " and " + std::to_string(max));
    }
    return parsed;
}

} // namespace

EngineConfig ServerConfig::engine_config() const {
    EngineConfig config;
    config.workspace_root = workspace_root;
    config.launcher.interpreter = interpreter;
    config.launcher.container_runtime = container_runtime;
    config.launcher.container_image = container_image;
    config.default_timeout_seconds = default_timeout_seconds;
    config.max_timeout_seconds = max_timeout_seconds;
    return config;
}

ServerConfig parse_args(const std::vector<std::string>& args) {
    ServerConfig config;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& flag = args[i];

        if (flag == "--help" || flag == "-h") {
            config.show_help = true;
            continue;
        }

        auto next_value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("missing value for " + flag);
            }
            return args[++i];
        };

        if (flag == "--port") {
            config.port = parse_int(flag, next_value(), 0, 65535);
        } else if (flag == "--workspace-root") {
            config.workspace_root = next_value();
        } else if (flag == "--dataset-root") {
            config.dataset_root = next_value();
        } else if (flag == "--interpreter") {
            config.interpreter = next_value();
        } else if (flag == "--container-runtime") {
            config.container_runtime = next_value();
        } else if (flag == "--container-image") {
            config.container_image = next_value();
        } else if (flag == "--default-timeout") {
            config.default_timeout_seconds = parse_int(flag, next_value(), MIN_TIMEOUT_SECONDS, 24 * 3600);
        } else if (flag == "--max-timeout") {
            config.max_timeout_seconds = parse_int(flag, next_value(), MIN_TIMEOUT_SECONDS, 24 * 3600);
        } else {
            throw std::invalid_argument("unknown option " + flag);
        }
    }

    if (config.default_timeout_seconds > config.max_timeout_seconds) {
        throw std::invalid_argument("--default-timeout cannot exceed --max-timeout");
    }
    if (config.interpreter.empty()) {
        throw std::invalid_argument("--interpreter cannot be empty");
    }

    return config;
}

ServerConfig parse_args(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        args.emplace_back(argv[i]);
    }
    return parse_args(args);
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --port N                 Listen port (default " << DEFAULT_PORT << ")\n"
        << "  --workspace-root DIR     Parent of per-execution workspaces (default: temp dir)\n"
        << "  --dataset-root DIR       Session datasets, one sub-directory per session\n"
        << "                           (default ./data/sessions)\n"
        << "  --interpreter PATH       Local interpreter (default python3)\n"
        << "  --container-runtime BIN  Container runtime (default docker)\n"
        << "  --container-image IMAGE  Container image (default python:3.11-slim)\n"
        << "  --default-timeout SECS   Timeout when a request names none (default "
        << DEFAULT_TIMEOUT_SECONDS << ")\n"
        << "  --max-timeout SECS       Upper bound for requested timeouts (default "
        << MAX_TIMEOUT_SECONDS << ")\n"
        << "  --help                   Show this message\n";
    return out.str();
}

} // namespace liverun
