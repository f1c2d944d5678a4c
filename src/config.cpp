#include "config.h"
#include "errors.h"
#include <cctype>
#include <climits>
#include <cstdlib>
#include <iostream>

extern char** environ;

namespace cloudrun {

namespace {

long parse_number(const std::string& name, const std::string& text, long min_value) {
    size_t used = 0;
    long value = 0;
    try {
        value = std::stol(text, &used);
    } catch (const std::exception&) {
        throw ConfigError(name + " must be a number, got '" + text + "'");
    }
    if (used != text.size()) {
        throw ConfigError(name + " must be a number, got '" + text + "'");
    }
    if (value < min_value) {
        throw ConfigError(name + " must be at least " + std::to_string(min_value));
    }
    return value;
}

bool parse_bool(const std::string& name, const std::string& text) {
    std::string lower;
    for (char c : text) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off" || lower.empty()) {
        return false;
    }
    throw ConfigError(name + " must be true or false, got '" + text + "'");
}

} // namespace

long parse_memory_size(const std::string& text) {
    if (text.empty()) {
        throw ConfigError("memory size is empty");
    }

    std::string digits = text;
    long multiplier = 1;
    char suffix = static_cast<char>(std::tolower(static_cast<unsigned char>(text.back())));
    if (suffix == 'b' && text.size() > 1) {
        // "256mb" style
        digits.pop_back();
        suffix = static_cast<char>(std::tolower(static_cast<unsigned char>(digits.back())));
    }
    switch (suffix) {
        case 'k': multiplier = 1024L; digits.pop_back(); break;
        case 'm': multiplier = 1024L * 1024; digits.pop_back(); break;
        case 'g': multiplier = 1024L * 1024 * 1024; digits.pop_back(); break;
        default: break;
    }

    long value = parse_number("memory size", digits, 1);
    if (value > LONG_MAX / multiplier) {
        throw ConfigError("memory size '" + text + "' is too large");
    }
    // Docker refuses less than 6MB
    long bytes = value * multiplier;
    if (bytes < 6L * 1024 * 1024) {
        throw ConfigError("memory size '" + text + "' is below the 6MB minimum");
    }
    return bytes;
}

void ServiceConfig::apply_environment(const std::map<std::string, std::string>& env) {
    auto get = [&env](const char* key) -> const std::string* {
        auto it = env.find(key);
        return it == env.end() ? nullptr : &it->second;
    };

    if (auto v = get("CLOUDRUN_PORT")) {
        port = static_cast<int>(parse_number("CLOUDRUN_PORT", *v, 1));
    }
    if (auto v = get("CLOUDRUN_MAX_EXECUTION_TIME")) {
        run_limits.wall_clock_timeout =
            std::chrono::seconds(parse_number("CLOUDRUN_MAX_EXECUTION_TIME", *v, 1));
    }
    if (auto v = get("CLOUDRUN_MAX_MEMORY")) {
        run_limits.memory_limit_bytes = parse_memory_size(*v);
    }
    if (auto v = get("CLOUDRUN_MAX_CPU_QUOTA")) {
        run_limits.cpu_quota_us = parse_number("CLOUDRUN_MAX_CPU_QUOTA", *v, 1000);
    }
    if (auto v = get("CLOUDRUN_MAX_CPU_PERIOD")) {
        run_limits.cpu_period_us = parse_number("CLOUDRUN_MAX_CPU_PERIOD", *v, 1000);
    }
    if (auto v = get("CLOUDRUN_MAX_REQUESTS_PER_MINUTE")) {
        rate_limits.max_requests_per_minute =
            static_cast<int>(parse_number("CLOUDRUN_MAX_REQUESTS_PER_MINUTE", *v, 1));
    }
    if (auto v = get("CLOUDRUN_MAX_CONCURRENT_SANDBOXES")) {
        max_concurrent_sandboxes =
            static_cast<size_t>(parse_number("CLOUDRUN_MAX_CONCURRENT_SANDBOXES", *v, 1));
    }
    if (auto v = get("CLOUDRUN_DOCKER_BINARY")) {
        docker_binary = *v;
    }
    if (auto v = get("CLOUDRUN_WORKSPACE_ROOT")) {
        workspace_root = *v;
    }
    if (auto v = get("CLOUDRUN_PRE_PULL_IMAGES")) {
        pre_pull_images = parse_bool("CLOUDRUN_PRE_PULL_IMAGES", *v);
    }
}

void ServiceConfig::apply_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw ConfigError(arg + " needs a value");
            }
            return argv[++i];
        };

        if (arg == "--port") {
            port = static_cast<int>(parse_number(arg, value(), 1));
        } else if (arg == "--environments") {
            environments_file = value();
        } else if (arg == "--docker") {
            docker_binary = value();
        } else if (arg == "--workspace-root") {
            workspace_root = value();
        } else if (arg == "--timeout") {
            run_limits.wall_clock_timeout = std::chrono::seconds(parse_number(arg, value(), 1));
        } else if (arg == "--memory") {
            run_limits.memory_limit_bytes = parse_memory_size(value());
        } else if (arg == "--max-sandboxes") {
            max_concurrent_sandboxes = static_cast<size_t>(parse_number(arg, value(), 1));
        } else if (arg == "--pre-pull") {
            pre_pull_images = true;
        } else if (arg == "--help" || arg == "-h") {
            show_help = true;
        } else {
            throw ConfigError("unknown option " + arg);
        }
    }
}

ServiceConfig ServiceConfig::load(int argc, char* argv[]) {
    std::map<std::string, std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string kv = *entry;
        size_t eq = kv.find('=');
        if (eq != std::string::npos && kv.compare(0, 9, "CLOUDRUN_") == 0) {
            env[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
    }

    ServiceConfig config;
    config.apply_environment(env);
    config.apply_args(argc, argv);
    return config;
}

OrchestratorConfig ServiceConfig::orchestrator_config() const {
    OrchestratorConfig config;
    config.run_limits = run_limits;
    config.workspace_root = workspace_root;
    return config;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --port N              Listen port (default " << DEFAULT_PORT << ")\n"
              << "  --environments FILE   Load environments from a JSON file\n"
              << "  --docker PATH         Docker client binary\n"
              << "  --workspace-root DIR  Host directory for execution workspaces\n"
              << "  --timeout SECONDS     Wall-clock limit per execution\n"
              << "  --memory SIZE         Memory limit per execution, e.g. 256m\n"
              << "  --max-sandboxes N     Concurrent sandbox limit\n"
              << "  --pre-pull            Pull every runtime image at startup\n"
              << "Environment: CLOUDRUN_PORT, CLOUDRUN_MAX_EXECUTION_TIME, CLOUDRUN_MAX_MEMORY,\n"
              << "  CLOUDRUN_MAX_CPU_QUOTA, CLOUDRUN_MAX_CPU_PERIOD, CLOUDRUN_MAX_REQUESTS_PER_MINUTE,\n"
              << "  CLOUDRUN_MAX_CONCURRENT_SANDBOXES, CLOUDRUN_DOCKER_BINARY,\n"
              << "  CLOUDRUN_WORKSPACE_ROOT, CLOUDRUN_PRE_PULL_IMAGES" << std::endl;
}

} // namespace cloudrun
