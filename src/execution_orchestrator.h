#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "channel.h"
#include "dependency_detector.h"
#include "environment_registry.h"
#include "execution_request.h"
#include "file_utils.h"
#include "output_event.h"
#include "sandbox_manager.h"

namespace cloudrun {

struct OrchestratorConfig {
    ResourceLimits run_limits;
    ResourceLimits install_limits = default_install_limits();
    std::string workspace_root = DEFAULT_WORKSPACE_ROOT;

    static ResourceLimits default_install_limits() {
        ResourceLimits limits;
        limits.memory_limit_bytes = INSTALL_MEMORY_LIMIT_BYTES;
        limits.wall_clock_timeout = std::chrono::seconds(INSTALL_TIMEOUT_SECONDS);
        return limits;
    }
};

// What one execution produced. Plain strings so that collaborators (the AI
// assistant, diagnostics) can consume it without knowing about sandboxes.
struct ExecutionSummary {
    std::string execution_id;
    std::string language_id;
    std::string source_code;
    std::string stdout_text;
    std::string stderr_text;
    std::string combined_output;    // Both streams in capture order
    std::string outcome;            // "completed", "timed_out", "validation_error", ...
    bool success = false;
    int exit_code = -1;
    std::chrono::milliseconds elapsed{0};
    std::optional<DependencyMatch> missing_dependency;
};

// Drives one request end to end: resolve, optionally install, run, detect
// missing dependencies, tear down, report. Every path ends with exactly one
// `complete` event and no sandbox left behind.
class ExecutionOrchestrator {
public:
    ExecutionOrchestrator(const EnvironmentRegistry& registry,
                          SandboxManager& sandboxes,
                          OrchestratorConfig config = OrchestratorConfig{});

    ExecutionSummary execute(const ExecutionRequest& request,
                             EventEmitter& events,
                             CancellationToken& cancel);

    const EnvironmentRegistry& registry() const { return registry_; }

    // Language-specific request checks; throws ValidationError
    static void validate(const EnvironmentDescriptor& descriptor, const ExecutionRequest& request);

    // First `public class X` in Java source, "Main" if none
    static std::string java_class_name(const std::string& source);

    // Entry file name with {classname} resolved
    static std::string entry_filename(const EnvironmentDescriptor& descriptor,
                                      const std::string& source);

    // Run command with every placeholder substituted
    static std::vector<std::string> build_run_command(const EnvironmentDescriptor& descriptor,
                                                      const std::string& entry_file,
                                                      const std::string& source);

    // True when the command reads stdin from a file instead of a pipe
    static bool uses_stdin_file(const EnvironmentDescriptor& descriptor);

private:
    struct Capture {
        std::string stdout_text;
        std::string stderr_text;
        std::string combined;
    };

    // Install packages in a network-enabled sandbox sharing the workspace
    RunResult install(const std::shared_ptr<const EnvironmentDescriptor>& descriptor,
                      const std::vector<std::string>& packages,
                      const Workspace& workspace,
                      const std::string& execution_id,
                      EventEmitter& events,
                      CancellationToken& cancel);

    // Pump a run's output until it ends. Chunks are forwarded as events when
    // `forward` is set; nothing is forwarded once cancellation is requested.
    RunResult relay(SandboxRun& run, EventEmitter& events, CancellationToken& cancel,
                    bool forward, Capture& capture);

    const EnvironmentRegistry& registry_;
    SandboxManager& sandboxes_;
    OrchestratorConfig config_;
};

} // namespace cloudrun
