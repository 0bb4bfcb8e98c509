#pragma once

#include "process_launcher.h"
#include <string>
#include <vector>
#include <optional>
#include <json/json.h>

namespace liverun {

class ExecutionEngine;

// A request to start a run, or to feed a line to one that is running
struct Submission {
    std::optional<std::string> code;
    std::string channel_id;
    std::string session_id;
    std::optional<std::string> execution_id;
    std::optional<std::string> input_line;
    std::optional<int> timeout_seconds;
    RuntimeBackend backend = RuntimeBackend::LOCAL;
    std::vector<std::string> packages;

    bool is_input_feed() const { return execution_id.has_value() && input_line.has_value(); }
};

// Parse a JSON submission. Accepts the camelCase field names and the
// legacy aliases (process_id, user_input, session_id, timeout_seconds,
// use_docker, docker_packages). channelId falls back to session_id, then
// to default_channel. Throws ProtocolError on malformed input.
Submission parse_submission(const std::string& body, const std::string& default_channel = "");
Submission parse_submission(const Json::Value& json, const std::string& default_channel = "");

// Compact single-line JSON
std::string to_json_string(const Json::Value& value);

// Turns submissions into engine calls and engine results into responses:
//   start -> {status: started, executionId, needsInput, timeoutSeconds, runtimeBackend}
//   feed  -> {status: input_sent} | {status: error, message: "process not found"}
class SubmissionDispatcher {
public:
    explicit SubmissionDispatcher(ExecutionEngine& engine);

    // Start or feed depending on the fields present. Never throws.
    Json::Value handle(const std::string& body, const std::string& default_channel = "");

    // Feed only; executionId and inputLine are both required. Never throws.
    Json::Value handle_input(const std::string& body);

    Json::Value start(const Submission& submission);
    Json::Value feed(const std::string& execution_id, const std::string& line);

    static Json::Value error_response(const std::string& message);

private:
    ExecutionEngine& engine_;
};

} // namespace liverun
