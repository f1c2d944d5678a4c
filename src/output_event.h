#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <json/json.h>

namespace cloudrun {

struct DependencyMatch;

enum class EventKind {
    STATUS,
    STDOUT,
    STDERR,
    DEPENDENCY_MISSING,
    INSTALL_START,
    INSTALL_RESULT,
    PREVIEW,
    COMPLETE
};

std::string to_string(EventKind kind);

// One message of a session's outbound stream
struct OutputEvent {
    EventKind kind = EventKind::STATUS;
    std::string content;
    Json::Value fields{Json::objectValue};  // Kind-specific members
    uint64_t sequence_number = 0;
    std::string timestamp;                  // ISO 8601, UTC

    // {kind, content, seq, timestamp, ...fields}
    Json::Value to_json() const;

    // Compact JSON text, one frame on the wire
    std::string serialize() const;
};

using EventSink = std::function<void(const OutputEvent&)>;

// Stamps events with consecutive sequence numbers and hands them to a sink.
// Emission is serialised, so the sink sees events in sequence order even when
// several threads emit.
class EventEmitter {
public:
    explicit EventEmitter(EventSink sink);

    void emit(EventKind kind, const std::string& content,
              Json::Value fields = Json::Value(Json::objectValue));

    void status(const std::string& message, const std::string& phase = "");
    void stdout_chunk(const std::string& data);
    void stderr_chunk(const std::string& data);
    void preview(const std::string& html);
    void install_start(const std::vector<std::string>& packages, const std::string& command);
    void install_result(bool success, int exit_code, const std::string& outcome,
                        const std::string& output);
    void dependency_missing(const DependencyMatch& match, const std::string& install_command);
    void complete(bool success,
                  std::chrono::milliseconds elapsed,
                  const std::string& outcome,
                  int exit_code,
                  const std::string& execution_id,
                  const std::string& message);

    uint64_t events_emitted() const;

private:
    EventSink sink_;
    mutable std::mutex mutex_;
    uint64_t next_sequence_ = 1;
    OutputEvent last_;
};

// ISO 8601 UTC with milliseconds, e.g. "2024-05-01T12:00:00.123Z"
std::string iso_timestamp(std::chrono::system_clock::time_point when);

// Length of the longest prefix that does not end inside a UTF-8 sequence
size_t complete_utf8_prefix(const std::string& data);

} // namespace cloudrun
