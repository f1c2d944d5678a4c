#include "environment_registry.h"
#include "errors.h"
#include <json/json.h>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>

namespace cloudrun {

namespace {

std::vector<std::string> string_array(const Json::Value& value, const std::string& field) {
    std::vector<std::string> out;
    if (value.isNull()) {
        return out;
    }
    if (!value.isArray()) {
        throw ValidationError("'" + field + "' must be an array of strings");
    }
    for (const auto& item : value) {
        if (!item.isString()) {
            throw ValidationError("'" + field + "' must be an array of strings");
        }
        out.push_back(item.asString());
    }
    return out;
}

EnvironmentDescriptor descriptor_from_json(const Json::Value& node) {
    if (!node.isObject()) {
        throw ValidationError("environment entry must be an object");
    }

    EnvironmentDescriptor desc;
    desc.id = node.get("id", "").asString();
    desc.display_name = node.get("display_name", desc.id).asString();
    desc.runtime_image = node.get("image", "").asString();
    desc.entry_filename = node.get("entry_filename", "").asString();
    desc.run_command = string_array(node["run_command"], "run_command");
    desc.network_enabled = node.get("network_enabled", false).asBool();
    desc.supports_dependency_install = node.get("supports_dependency_install", false).asBool();
    desc.package_manager = node.get("package_manager", "").asString();
    desc.install_command = node.get("install_command", "").asString();
    desc.preview_only = node.get("preview_only", false).asBool();

    const Json::Value& env = node["environment"];
    if (env.isObject()) {
        for (const auto& key : env.getMemberNames()) {
            desc.environment[key] = env[key].asString();
        }
    }
    return desc;
}

} // namespace

EnvironmentRegistry EnvironmentRegistry::with_builtins() {
    EnvironmentRegistry registry;
    registry.register_environment(BuiltInEnvironments::python());
    registry.register_environment(BuiltInEnvironments::nodejs());
    registry.register_environment(BuiltInEnvironments::java());
    registry.register_environment(BuiltInEnvironments::cpp());
    registry.register_environment(BuiltInEnvironments::html());
    registry.register_environment(BuiltInEnvironments::ubuntu());

    std::cout << "[Registry] Initialized with " << registry.size()
              << " built-in environments" << std::endl;
    return registry;
}

EnvironmentRegistry EnvironmentRegistry::from_json(const std::string& json_text) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream in(json_text);
    if (!Json::parseFromStream(builder, in, &root, &errors)) {
        throw ValidationError("environment file is not valid JSON: " + errors);
    }

    const Json::Value& entries = root.isArray() ? root : root["environments"];
    if (!entries.isArray() || entries.empty()) {
        throw ValidationError("environment file defines no environments");
    }

    EnvironmentRegistry registry;
    for (const auto& entry : entries) {
        registry.register_environment(descriptor_from_json(entry));
    }
    return registry;
}

EnvironmentRegistry EnvironmentRegistry::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ValidationError("cannot open environment file: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    EnvironmentRegistry registry = from_json(content);
    std::cout << "[Registry] Loaded " << registry.size()
              << " environments from " << path << std::endl;
    return registry;
}

void EnvironmentRegistry::register_environment(EnvironmentDescriptor descriptor) {
    if (descriptor.id.empty()) {
        throw ValidationError("environment id must not be empty");
    }
    if (environments_.count(descriptor.id)) {
        throw ValidationError("duplicate environment: " + descriptor.id);
    }
    if (!descriptor.preview_only) {
        if (descriptor.runtime_image.empty()) {
            throw ValidationError("environment '" + descriptor.id + "' has no runtime image");
        }
        if (descriptor.run_command.empty()) {
            throw ValidationError("environment '" + descriptor.id + "' has no run command");
        }
        if (descriptor.entry_filename.empty()) {
            throw ValidationError("environment '" + descriptor.id + "' has no entry filename");
        }
    }
    if (descriptor.supports_dependency_install &&
        (descriptor.install_command.empty() || descriptor.package_manager.empty())) {
        throw ValidationError("environment '" + descriptor.id +
                              "' supports installs but has no install command");
    }

    std::string id = descriptor.id;
    environments_[id] = std::make_shared<const EnvironmentDescriptor>(std::move(descriptor));
}

std::shared_ptr<const EnvironmentDescriptor> EnvironmentRegistry::find(
    const std::string& language_id
) const {
    auto it = environments_.find(language_id);
    return it == environments_.end() ? nullptr : it->second;
}

std::shared_ptr<const EnvironmentDescriptor> EnvironmentRegistry::resolve(
    const std::string& language_id
) const {
    auto desc = find(language_id);
    if (!desc) {
        throw ValidationError("unsupported language: " + language_id);
    }
    return desc;
}

bool EnvironmentRegistry::has_environment(const std::string& language_id) const {
    return environments_.count(language_id) > 0;
}

std::vector<std::string> EnvironmentRegistry::list_environments() const {
    std::vector<std::string> ids;
    for (const auto& [id, _] : environments_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<std::string> EnvironmentRegistry::runtime_images() const {
    std::set<std::string> images;
    for (const auto& [_, desc] : environments_) {
        if (!desc->runtime_image.empty()) {
            images.insert(desc->runtime_image);
        }
    }
    return {images.begin(), images.end()};
}

namespace BuiltInEnvironments {

EnvironmentDescriptor python() {
    EnvironmentDescriptor desc;
    desc.id = "python";
    desc.display_name = "Python 3.11";
    desc.runtime_image = "python:3.11-slim";
    desc.entry_filename = "main.py";
    desc.run_command = {"python", "-u", "{file}"};
    desc.supports_dependency_install = true;
    desc.package_manager = "pip";
    desc.install_command =
        "pip install --no-cache-dir --disable-pip-version-check "
        "--target /workspace/.packages {packages}";
    desc.environment = {
        {"PYTHONPATH", "/workspace/.packages"},
        {"PYTHONDONTWRITEBYTECODE", "1"},
        {"HOME", "/tmp"},
    };
    return desc;
}

EnvironmentDescriptor nodejs() {
    EnvironmentDescriptor desc;
    desc.id = "nodejs";
    desc.display_name = "Node.js 20";
    desc.runtime_image = "node:20-alpine";
    desc.entry_filename = "main.js";
    desc.run_command = {"node", "{file}"};
    desc.supports_dependency_install = true;
    desc.package_manager = "npm";
    desc.install_command = "npm install --no-audit --no-fund --prefix /workspace {packages}";
    desc.environment = {
        {"HOME", "/tmp"},
        {"npm_config_cache", "/tmp/.npm"},
    };
    return desc;
}

EnvironmentDescriptor java() {
    EnvironmentDescriptor desc;
    desc.id = "java";
    desc.display_name = "Java 21";
    desc.runtime_image = "eclipse-temurin:21-jdk";
    desc.entry_filename = "{classname}.java";
    desc.run_command = {"sh", "-c", "javac {file} && java -cp {dir} {classname}"};
    desc.environment = {{"HOME", "/tmp"}};
    return desc;
}

EnvironmentDescriptor cpp() {
    EnvironmentDescriptor desc;
    desc.id = "cpp";
    desc.display_name = "C++ (g++ 12)";
    desc.runtime_image = "gcc:12";
    desc.entry_filename = "main.cpp";
    desc.run_command = {"sh", "-c", "g++ -o /tmp/program {file} && /tmp/program"};
    desc.environment = {{"HOME", "/tmp"}};
    return desc;
}

EnvironmentDescriptor html() {
    EnvironmentDescriptor desc;
    desc.id = "html";
    desc.display_name = "HTML";
    desc.entry_filename = "index.html";
    desc.preview_only = true;
    return desc;
}

EnvironmentDescriptor ubuntu() {
    EnvironmentDescriptor desc;
    desc.id = "ubuntu";
    desc.display_name = "Ubuntu 22.04 shell";
    desc.runtime_image = "ubuntu:22.04";
    desc.entry_filename = "main.sh";
    desc.run_command = {"bash", "-c", "{code}"};
    desc.network_enabled = true;
    desc.environment = {{"HOME", "/tmp"}};
    return desc;
}

} // namespace BuiltInEnvironments

} // namespace cloudrun
