#include "execution_request.h"
#include "constants.h"
#include "dependency_detector.h"
#include "errors.h"
#include "file_utils.h"
#include <set>
#include <sstream>

namespace cloudrun {

namespace {

std::string optional_string(const Json::Value& json, const char* field) {
    const Json::Value& value = json[field];
    if (value.isNull()) {
        return "";
    }
    if (!value.isString()) {
        throw ValidationError(std::string("'") + field + "' must be a string");
    }
    return value.asString();
}

} // namespace

Json::Value parse_json_object(const std::string& text) {
    if (text.size() > MAX_MESSAGE_SIZE) {
        throw ValidationError("request too large");
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream in(text);
    if (!Json::parseFromStream(builder, in, &root, &errors)) {
        throw ValidationError("malformed JSON: " + errors);
    }
    if (!root.isObject()) {
        throw ValidationError("request must be a JSON object");
    }
    return root;
}

ExecutionRequest ExecutionRequest::from_json(const Json::Value& json) {
    if (!json.isObject()) {
        throw ValidationError("request must be a JSON object");
    }

    ExecutionRequest request;
    request.language_id = optional_string(json, "language");
    request.source_code = optional_string(json, "code");
    request.stdin_data = optional_string(json, "stdin");

    if (request.language_id.empty() || json["code"].isNull()) {
        throw ValidationError("Missing required fields: language and code");
    }

    const Json::Value& files = json["files"];
    if (!files.isNull()) {
        if (!files.isArray()) {
            throw ValidationError("'files' must be an array");
        }
        if (files.size() > MAX_FILES_PER_REQUEST) {
            throw ValidationError("too many files (max " +
                                  std::to_string(MAX_FILES_PER_REQUEST) + ")");
        }
        std::set<std::string> names;
        for (const auto& file : files) {
            if (!file.isObject() || !file["name"].isString()) {
                throw ValidationError("each file needs a string 'name'");
            }
            ExtraFile extra;
            extra.name = FileUtils::sanitize_filename(file["name"].asString());
            extra.content = optional_string(file, "content");
            if (extra.name.empty()) {
                throw ValidationError("invalid file name: " + file["name"].asString());
            }
            if (!names.insert(extra.name).second) {
                throw ValidationError("duplicate file name: " + extra.name);
            }
            request.extra_files.push_back(std::move(extra));
        }
    }

    const Json::Value& packages = json["preinstall_packages"];
    if (!packages.isNull()) {
        if (!packages.isArray()) {
            throw ValidationError("'preinstall_packages' must be an array of strings");
        }
        std::set<std::string> seen;
        for (const auto& pkg : packages) {
            if (!pkg.isString()) {
                throw ValidationError("'preinstall_packages' must be an array of strings");
            }
            std::string name = pkg.asString();
            if (!DependencyDetector::is_valid_package_name(name)) {
                throw ValidationError("invalid package name: " + name);
            }
            if (seen.insert(name).second) {
                request.preinstall_packages.push_back(name);
            }
        }
    }

    size_t total = request.source_code.size() + request.stdin_data.size();
    for (const auto& file : request.extra_files) {
        total += file.content.size();
    }
    if (total > MAX_MESSAGE_SIZE) {
        throw ValidationError("request too large");
    }

    return request;
}

ExecutionRequest ExecutionRequest::parse(const std::string& text) {
    return from_json(parse_json_object(text));
}

Json::Value ExecutionRequest::to_json() const {
    Json::Value json(Json::objectValue);
    json["language"] = language_id;
    json["code"] = source_code;
    if (!stdin_data.empty()) {
        json["stdin"] = stdin_data;
    }
    if (!extra_files.empty()) {
        Json::Value files(Json::arrayValue);
        for (const auto& file : extra_files) {
            Json::Value entry(Json::objectValue);
            entry["name"] = file.name;
            entry["content"] = file.content;
            files.append(entry);
        }
        json["files"] = files;
    }
    if (!preinstall_packages.empty()) {
        Json::Value packages(Json::arrayValue);
        for (const auto& pkg : preinstall_packages) {
            packages.append(pkg);
        }
        json["preinstall_packages"] = packages;
    }
    return json;
}

} // namespace cloudrun
