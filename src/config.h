#pragma once

#include <map>
#include <string>
#include "execution_orchestrator.h"
#include "rate_limiter.h"
#include "sandbox_manager.h"
#include "streaming_session.h"

namespace cloudrun {

// Everything the server is started with. Defaults come from constants.h,
// then CLOUDRUN_* environment variables, then command line flags.
struct ServiceConfig {
    int port = DEFAULT_PORT;
    std::string docker_binary = DEFAULT_DOCKER_BINARY;
    std::string workspace_root = DEFAULT_WORKSPACE_ROOT;
    std::string environments_file;     // Replaces the built-in registry when set
    bool pre_pull_images = false;

    ResourceLimits run_limits;
    size_t max_concurrent_sandboxes = DEFAULT_MAX_CONCURRENT_SANDBOXES;
    RateLimiter::Config rate_limits;
    SessionConfig session;

    bool show_help = false;

    // Apply CLOUDRUN_* variables found in env; throws ConfigError
    void apply_environment(const std::map<std::string, std::string>& env);

    // Apply command line flags; throws ConfigError
    void apply_args(int argc, char* argv[]);

    // Defaults, then the process environment, then argv
    static ServiceConfig load(int argc, char* argv[]);

    OrchestratorConfig orchestrator_config() const;
};

// "256m", "1g", "512k" or plain bytes
long parse_memory_size(const std::string& text);

void print_usage(const char* program);

} // namespace cloudrun
