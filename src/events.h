#pragma once

#include <string>
#include <optional>
#include <json/json.h>

namespace liverun {

enum class EventType {
    STARTED,
    OUTPUT,
    INPUT_RECEIVED,
    COMPLETE
};

enum class OutputKind {
    STDOUT,
    STDERR,
    SYSTEM,
    ERROR
};

enum class CompletionStatus {
    COMPLETED,
    TIMED_OUT,
    FAILED
};

std::string event_type_to_string(EventType type);
std::string output_kind_to_string(OutputKind kind);
std::string completion_status_to_string(CompletionStatus status);

// One message on an execution's channel
struct Event {
    EventType type = EventType::OUTPUT;
    std::string execution_id;
    std::string text;                                   // OUTPUT only
    OutputKind kind = OutputKind::STDOUT;               // OUTPUT only
    CompletionStatus status = CompletionStatus::COMPLETED;  // COMPLETE only
    std::optional<int> exit_code;                       // COMPLETE, when reaped

    static Event started(const std::string& execution_id);
    static Event output(const std::string& execution_id, const std::string& text, OutputKind kind);
    static Event input_received(const std::string& execution_id);
    static Event complete(const std::string& execution_id, CompletionStatus status,
                          std::optional<int> exit_code = std::nullopt);

    // {"event": "output", "executionId": ..., "text": ..., "kind": ...}
    Json::Value to_json() const;
    std::string serialize() const;
};

// Destination for execution events. Fire-and-forget: implementations must
// not block for long, and delivery failures stay inside the sink.
class OutputSink {
public:
    virtual ~OutputSink() = default;
    virtual void publish(const std::string& channel_id, const Event& event) = 0;
};

} // namespace liverun
