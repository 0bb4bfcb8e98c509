#include "events.h"

namespace liverun {

std::string event_type_to_string(EventType type) {
    switch (type) {
        case EventType::STARTED: return "started";
        case EventType::OUTPUT: return "output";
        case EventType::INPUT_RECEIVED: return "input_received";
        case EventType::COMPLETE: return "complete";
    }
    return "unknown";
}

std::string output_kind_to_string(OutputKind kind) {
    switch (kind) {
        case OutputKind::STDOUT: return "stdout";
        case OutputKind::STDERR: return "stderr";
        case OutputKind::SYSTEM: return "system";
        case OutputKind::ERROR: return "error";
    }
    return "unknown";
}

std::string completion_status_to_string(CompletionStatus status) {
    switch (status) {
        case CompletionStatus::COMPLETED: return "completed";
        case CompletionStatus::TIMED_OUT: return "timed_out";
        case CompletionStatus::FAILED: return "failed";
    }
    return "unknown";
}

Event Event::started(const std::string& execution_id) {
    Event event;
    event.type = EventType::STARTED;
    event.execution_id = execution_id;
    return event;
}

Event Event::output(const std::string& execution_id, const std::string& text, OutputKind kind) {
    Event event;
    event.type = EventType::OUTPUT;
    event.execution_id = execution_id;
    event.text = text;
    event.kind = kind;
    return event;
}

Event Event::input_received(const std::string& execution_id) {
    Event event;
    event.type = EventType::INPUT_RECEIVED;
    event.execution_id = execution_id;
    return event;
}

Event Event::complete(const std::string& execution_id, CompletionStatus status,
                      std::optional<int> exit_code) {
    Event event;
    event.type = EventType::COMPLETE;
    event.execution_id = execution_id;
    event.status = status;
    event.exit_code = exit_code;
    return event;
}

Json::Value Event::to_json() const {
    Json::Value json;
    json["event"] = event_type_to_string(type);
    json["executionId"] = execution_id;

    switch (type) {
        case EventType::OUTPUT:
            json["text"] = text;
            json["kind"] = output_kind_to_string(kind);
            break;
        case EventType::COMPLETE:
            json["status"] = completion_status_to_string(status);
            if (exit_code) {
                json["exitCode"] = *exit_code;
            }
            break;
        case EventType::STARTED:
        case EventType::INPUT_RECEIVED:
            break;
    }
    return json;
}

std::string Event::serialize() const {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, to_json());
}

} // namespace liverun
