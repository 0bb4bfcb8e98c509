#include "protocol.h"
#include "errors.h"
#include "execution_engine.h"
#include <climits>
#include <cmath>
#include <iostream>
#include <sstream>

namespace liverun {

namespace {

// First present member among the given names (camelCase name first)
const Json::Value* find_field(const Json::Value& json, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        if (json.isMember(name) && !json[name].isNull()) {
            return &json[name];
        }
    }
    return nullptr;
}

std::optional<std::string> string_field(const Json::Value& json,
                                        std::initializer_list<const char*> names) {
    const Json::Value* value = find_field(json, names);
    if (!value) {
        return std::nullopt;
    }
    if (value->isString()) {
        return value->asString();
    }
    // Clients sometimes send numeric input lines (e.g. 42) unquoted
    if (value->isNumeric() || value->isBool()) {
        return value->asString();
    }
    throw ProtocolError(std::string(*names.begin()) + " must be a string");
}

int clamp_to_int(long long value) {
    if (value > INT_MAX) return INT_MAX;
    if (value < INT_MIN) return INT_MIN;
    return static_cast<int>(value);
}

std::optional<int> timeout_field(const Json::Value& json) {
    const Json::Value* value = find_field(json, {"timeoutSeconds", "timeout_seconds"});
    if (!value) {
        return std::nullopt;
    }
    if (value->isIntegral()) {
        return clamp_to_int(value->asLargestInt());
    }
    if (value->isDouble() && std::isfinite(value->asDouble())) {
        double seconds = value->asDouble();
        if (seconds > INT_MAX) return INT_MAX;
        if (seconds < INT_MIN) return INT_MIN;
        return static_cast<int>(seconds);
    }
    if (value->isString()) {
        try {
            size_t consumed = 0;
            long long seconds = std::stoll(value->asString(), &consumed);
            if (consumed == value->asString().size()) {
                return clamp_to_int(seconds);
            }
        } catch (const std::exception&) {
            // Falls through to the error below
        }
    }
    throw ProtocolError("timeoutSeconds must be an integer");
}

RuntimeBackend backend_field(const Json::Value& json) {
    if (const Json::Value* value = find_field(json, {"runtimeBackend"})) {
        if (!value->isString()) {
            throw ProtocolError("runtimeBackend must be a string");
        }
        auto backend = backend_from_string(value->asString());
        if (!backend) {
            throw ProtocolError("unknown runtimeBackend '" + value->asString() + "'");
        }
        return *backend;
    }
    if (const Json::Value* value = find_field(json, {"use_docker"})) {
        if (!value->isBool()) {
            throw ProtocolError("use_docker must be a boolean");
        }
        return value->asBool() ? RuntimeBackend::CONTAINERIZED : RuntimeBackend::LOCAL;
    }
    return RuntimeBackend::LOCAL;
}

std::vector<std::string> packages_field(const Json::Value& json) {
    std::vector<std::string> packages;
    const Json::Value* value = find_field(json, {"packages", "docker_packages"});
    if (!value) {
        return packages;
    }
    if (!value->isArray()) {
        throw ProtocolError("packages must be a list of strings");
    }
    for (const auto& item : *value) {
        if (!item.isString()) {
            throw ProtocolError("packages must be a list of strings");
        }
        if (!item.asString().empty()) {
            packages.push_back(item.asString());
        }
    }
    return packages;
}

} // namespace

Submission parse_submission(const std::string& body, const std::string& default_channel) {
    Json::Value json;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(body);

    if (!Json::parseFromStream(builder, stream, &json, &errors)) {
        throw ProtocolError("invalid JSON: " + errors);
    }
    return parse_submission(json, default_channel);
}

Submission parse_submission(const Json::Value& json, const std::string& default_channel) {
    if (!json.isObject()) {
        throw ProtocolError("submission must be a JSON object");
    }

    Submission submission;
    submission.code = string_field(json, {"code"});
    submission.session_id = string_field(json, {"sessionId", "session_id"}).value_or("");
    submission.execution_id = string_field(json, {"executionId", "process_id"});
    submission.input_line = string_field(json, {"inputLine", "user_input"});
    submission.timeout_seconds = timeout_field(json);
    submission.backend = backend_field(json);
    submission.packages = packages_field(json);

    auto channel = string_field(json, {"channelId"});
    if (channel && !channel->empty()) {
        submission.channel_id = *channel;
    } else if (!submission.session_id.empty()) {
        submission.channel_id = submission.session_id;
    } else {
        submission.channel_id = default_channel;
    }

    return submission;
}

std::string to_json_string(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

SubmissionDispatcher::SubmissionDispatcher(ExecutionEngine& engine) : engine_(engine) {}

Json::Value SubmissionDispatcher::error_response(const std::string& message) {
    Json::Value response;
    response["status"] = "error";
    response["message"] = message;
    return response;
}

Json::Value SubmissionDispatcher::handle(const std::string& body, const std::string& default_channel) {
    Submission submission;
    try {
        submission = parse_submission(body, default_channel);
    } catch (const ProtocolError& e) {
        return error_response(e.what());
    }

    if (submission.is_input_feed()) {
        return feed(*submission.execution_id, *submission.input_line);
    }
    if (!submission.code) {
        return error_response("code is required");
    }
    return start(submission);
}

Json::Value SubmissionDispatcher::handle_input(const std::string& body) {
    Submission submission;
    try {
        submission = parse_submission(body);
    } catch (const ProtocolError& e) {
        return error_response(e.what());
    }

    if (!submission.is_input_feed()) {
        return error_response("executionId and inputLine are required");
    }
    return feed(*submission.execution_id, *submission.input_line);
}

Json::Value SubmissionDispatcher::start(const Submission& submission) {
    ExecutionRequest request;
    request.source = submission.code.value_or("");
    request.channel_id = submission.channel_id;
    request.session_id = submission.session_id;
    request.timeout_seconds = submission.timeout_seconds;
    request.backend = submission.backend;
    request.packages = submission.packages;

    try {
        StartResult result = engine_.start(request);

        Json::Value response;
        response["status"] = "started";
        response["executionId"] = result.execution_id;
        response["needsInput"] = result.needs_input;
        response["timeoutSeconds"] = result.timeout_seconds;
        response["runtimeBackend"] = backend_to_string(result.backend);
        response["message"] = "Code execution started successfully";
        return response;
    } catch (const std::exception& e) {
        std::cerr << "[Engine] Rejected submission: " << e.what() << std::endl;
        return error_response(std::string("Error starting execution: ") + e.what());
    }
}

Json::Value SubmissionDispatcher::feed(const std::string& execution_id, const std::string& line) {
    if (!engine_.provide_input(execution_id, line)) {
        return error_response("process not found");
    }
    Json::Value response;
    response["status"] = "input_sent";
    response["message"] = "Input sent to process";
    return response;
}

} // namespace liverun
