#include "output_event.h"
#include "dependency_detector.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace cloudrun {

std::string to_string(EventKind kind) {
    switch (kind) {
        case EventKind::STATUS: return "status";
        case EventKind::STDOUT: return "stdout";
        case EventKind::STDERR: return "stderr";
        case EventKind::DEPENDENCY_MISSING: return "dependency_missing";
        case EventKind::INSTALL_START: return "install_start";
        case EventKind::INSTALL_RESULT: return "install_result";
        case EventKind::PREVIEW: return "preview";
        case EventKind::COMPLETE: return "complete";
    }
    return "unknown";
}

Json::Value OutputEvent::to_json() const {
    Json::Value json = fields.isObject() ? fields : Json::Value(Json::objectValue);
    json["kind"] = to_string(kind);
    json["content"] = content;
    json["seq"] = Json::UInt64(sequence_number);
    json["timestamp"] = timestamp;
    return json;
}

std::string OutputEvent::serialize() const {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, to_json());
}

std::string iso_timestamp(std::chrono::system_clock::time_point when) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        when.time_since_epoch()).count() % 1000;
    std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

size_t complete_utf8_prefix(const std::string& data) {
    // Walk back over at most 3 continuation bytes to the last lead byte
    size_t n = data.size();
    size_t i = n;
    size_t continuation = 0;
    while (i > 0 && continuation < 4) {
        unsigned char c = static_cast<unsigned char>(data[i - 1]);
        if ((c & 0xC0) != 0x80) {
            break;
        }
        --i;
        ++continuation;
    }
    if (i == 0) {
        return n;
    }

    unsigned char lead = static_cast<unsigned char>(data[i - 1]);
    size_t expected;
    if (lead < 0x80) {
        return n;
    } else if ((lead & 0xE0) == 0xC0) {
        expected = 1;
    } else if ((lead & 0xF0) == 0xE0) {
        expected = 2;
    } else if ((lead & 0xF8) == 0xF0) {
        expected = 3;
    } else {
        return n;  // Not UTF-8; nothing to wait for
    }
    return continuation >= expected ? n : i - 1;
}

EventEmitter::EventEmitter(EventSink sink) : sink_(std::move(sink)) {}

void EventEmitter::emit(EventKind kind, const std::string& content, Json::Value fields) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_.kind = kind;
    last_.content = content;
    last_.fields = std::move(fields);
    last_.sequence_number = next_sequence_++;
    last_.timestamp = iso_timestamp(std::chrono::system_clock::now());
    if (sink_) {
        sink_(last_);
    }
}

void EventEmitter::status(const std::string& message, const std::string& phase) {
    Json::Value fields(Json::objectValue);
    if (!phase.empty()) {
        fields["phase"] = phase;
    }
    emit(EventKind::STATUS, message, fields);
}

void EventEmitter::stdout_chunk(const std::string& data) {
    emit(EventKind::STDOUT, data);
}

void EventEmitter::stderr_chunk(const std::string& data) {
    emit(EventKind::STDERR, data);
}

void EventEmitter::preview(const std::string& html) {
    Json::Value fields(Json::objectValue);
    fields["mime_type"] = "text/html";
    emit(EventKind::PREVIEW, html, fields);
}

void EventEmitter::install_start(const std::vector<std::string>& packages,
                                 const std::string& command) {
    Json::Value fields(Json::objectValue);
    Json::Value list(Json::arrayValue);
    std::string joined;
    for (const auto& pkg : packages) {
        list.append(pkg);
        joined += (joined.empty() ? "" : " ") + pkg;
    }
    fields["packages"] = list;
    fields["install_command"] = command;
    emit(EventKind::INSTALL_START, "Installing " + joined + "...", fields);
}

void EventEmitter::install_result(bool success, int exit_code, const std::string& outcome,
                                  const std::string& output) {
    Json::Value fields(Json::objectValue);
    fields["success"] = success;
    fields["exit_code"] = exit_code;
    fields["outcome"] = outcome;
    fields["output"] = output;
    emit(EventKind::INSTALL_RESULT,
         success ? "Installation completed successfully" : "Installation failed", fields);
}

void EventEmitter::dependency_missing(const DependencyMatch& match,
                                      const std::string& install_command) {
    Json::Value fields(Json::objectValue);
    fields["package_name"] = match.package_name;
    fields["package_manager"] = match.package_manager;
    fields["module_name"] = match.module_name;
    fields["install_command"] = install_command;
    emit(EventKind::DEPENDENCY_MISSING,
         "Missing dependency detected: " + match.package_name, fields);
}

void EventEmitter::complete(bool success,
                            std::chrono::milliseconds elapsed,
                            const std::string& outcome,
                            int exit_code,
                            const std::string& execution_id,
                            const std::string& message) {
    Json::Value fields(Json::objectValue);
    fields["success"] = success;
    fields["elapsed_ms"] = Json::Int64(elapsed.count());
    fields["outcome"] = outcome;
    fields["exit_code"] = exit_code;
    if (!execution_id.empty()) {
        fields["execution_id"] = execution_id;
    }
    emit(EventKind::COMPLETE, message, fields);
}

uint64_t EventEmitter::events_emitted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_sequence_ - 1;
}

} // namespace cloudrun
