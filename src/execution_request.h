#pragma once

#include <string>
#include <vector>
#include <json/json.h>

namespace cloudrun {

struct ExtraFile {
    std::string name;      // Already sanitised
    std::string content;
};

// One accepted request to run code. Immutable once parsed.
struct ExecutionRequest {
    std::string language_id;
    std::string source_code;
    std::string stdin_data;
    std::vector<ExtraFile> extra_files;
    std::vector<std::string> preinstall_packages;  // Deduplicated, order kept

    // Shape checks only; language-specific checks happen against the registry.
    // Throws ValidationError.
    static ExecutionRequest from_json(const Json::Value& json);
    static ExecutionRequest parse(const std::string& text);

    Json::Value to_json() const;
};

// Parse a JSON object from text; throws ValidationError
Json::Value parse_json_object(const std::string& text);

} // namespace cloudrun
