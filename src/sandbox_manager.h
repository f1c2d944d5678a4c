#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "channel.h"
#include "constants.h"
#include "container_engine.h"
#include "environment_registry.h"

namespace cloudrun {

enum class SandboxState {
    CREATED,
    RUNNING,
    COMPLETED,
    FAILED,
    TIMED_OUT,
    CANCELLED,
    DESTROYED
};

std::string to_string(SandboxState state);

enum class NetworkMode {
    DISABLED,
    ENABLED
};

// Why a sandbox exists; install sandboxes get more memory and the network
enum class SandboxPurpose {
    RUN,
    INSTALL
};

struct ResourceLimits {
    long cpu_quota_us = DEFAULT_CPU_QUOTA_US;
    long cpu_period_us = DEFAULT_CPU_PERIOD_US;
    long memory_limit_bytes = DEFAULT_MEMORY_LIMIT_BYTES;
    std::chrono::milliseconds wall_clock_timeout{DEFAULT_TIMEOUT_SECONDS * 1000};
    int pids_limit = MAX_PROCESSES_PER_SANDBOX;
};

// How a run ended
enum class RunOutcome {
    COMPLETED,       // Exit code 0
    FAILED,          // Nonzero exit, including compile errors
    TIMED_OUT,       // Killed by the wall-clock watchdog
    OUT_OF_MEMORY,   // Killed by the memory ceiling
    CANCELLED,       // Killed on request
    ENGINE_FAILURE   // The engine could not run the command at all
};

std::string to_string(RunOutcome outcome);

struct OutputChunk {
    OutputStream stream = OutputStream::STDOUT;
    std::string data;
};

struct RunResult {
    RunOutcome outcome = RunOutcome::ENGINE_FAILURE;
    int exit_code = -1;
    std::chrono::milliseconds elapsed{0};
    std::string error_message;  // Engine diagnostics, empty otherwise
};

// One ephemeral sandbox. Read-only to everybody except the SandboxManager.
class SandboxHandle {
public:
    const std::string& id() const { return id_; }
    const std::string& container_id() const { return container_id_; }
    const std::string& execution_id() const { return execution_id_; }
    const EnvironmentDescriptor& descriptor() const { return *descriptor_; }
    const ResourceLimits& limits() const { return limits_; }
    NetworkMode network_mode() const { return network_mode_; }
    SandboxPurpose purpose() const { return purpose_; }

    SandboxState state() const;
    bool cancel_requested() const;

private:
    friend class SandboxManager;
    friend class SandboxRun;

    SandboxHandle(std::string id, std::string container_id, std::string execution_id,
                  std::shared_ptr<const EnvironmentDescriptor> descriptor,
                  ResourceLimits limits, NetworkMode network_mode, SandboxPurpose purpose);

    const std::string id_;
    const std::string container_id_;
    const std::string execution_id_;
    const std::shared_ptr<const EnvironmentDescriptor> descriptor_;
    const ResourceLimits limits_;
    const NetworkMode network_mode_;
    const SandboxPurpose purpose_;

    mutable std::mutex mutex_;
    SandboxState state_ = SandboxState::CREATED;
    bool cancel_requested_ = false;
    bool kill_sent_ = false;
};

class SandboxManager;

// A command running inside a sandbox. Output arrives on output() in capture
// order; the channel closes when the process is gone and fully drained.
class SandboxRun {
public:
    ~SandboxRun();

    SandboxRun(const SandboxRun&) = delete;
    SandboxRun& operator=(const SandboxRun&) = delete;

    Channel<OutputChunk>& output() { return output_; }

    // Block until the run is over; may be called more than once
    RunResult wait();

private:
    friend class SandboxManager;

    SandboxRun(SandboxManager& manager, std::shared_ptr<SandboxHandle> handle);

    void start(std::vector<std::string> command,
               std::string stdin_data,
               std::map<std::string, std::string> environment);
    void finish_immediately(RunOutcome outcome);
    void execute(const std::vector<std::string>& command,
                 const std::string& stdin_data,
                 const std::map<std::string, std::string>& environment);
    void watch();

    SandboxManager& manager_;
    std::shared_ptr<SandboxHandle> handle_;
    Channel<OutputChunk> output_;

    std::mutex mutex_;
    std::condition_variable finished_cv_;
    bool finished_ = false;
    bool timed_out_ = false;
    RunResult result_;
    std::chrono::steady_clock::time_point start_time_;

    std::thread worker_;
    std::thread watchdog_;
};

struct SandboxManagerConfig {
    size_t max_concurrent_sandboxes = DEFAULT_MAX_CONCURRENT_SANDBOXES;
    std::string user;   // "uid:gid" for sandboxed processes, empty = image default
    int keepalive_grace_seconds = SANDBOX_KEEPALIVE_GRACE_SECONDS;
};

// Owns the lifecycle of every sandbox: create, run, cancel, destroy.
// Thread-safe; one instance is shared by all sessions.
class SandboxManager {
public:
    SandboxManager(std::shared_ptr<ContainerEngine> engine,
                   SandboxManagerConfig config = SandboxManagerConfig{});

    // Materialise a started, idle sandbox for the descriptor's image with the
    // host workspace mounted as its working directory. Throws ProvisioningError
    // when the image cannot be obtained, the engine is unreachable, or the
    // concurrent sandbox limit is reached.
    std::shared_ptr<SandboxHandle> create(std::shared_ptr<const EnvironmentDescriptor> descriptor,
                                          const ResourceLimits& limits,
                                          NetworkMode network_mode,
                                          const std::string& host_workspace,
                                          const std::string& execution_id,
                                          SandboxPurpose purpose = SandboxPurpose::RUN);

    // Start a command. Each sandbox runs at most one command.
    std::unique_ptr<SandboxRun> run(const std::shared_ptr<SandboxHandle>& handle,
                                    const std::vector<std::string>& command,
                                    const std::string& stdin_data = "",
                                    const std::map<std::string, std::string>& environment = {});

    // Forcibly stop whatever runs in the sandbox. Idempotent, never throws.
    void cancel(const std::shared_ptr<SandboxHandle>& handle);

    // Release everything the sandbox holds. Idempotent, never throws.
    void destroy(const std::shared_ptr<SandboxHandle>& handle);

    // Remove labelled containers no live handle owns; returns how many
    size_t reap_orphans();

    // Make sure an image is present locally, pulling it if needed
    void ensure_image(const std::string& image);

    size_t active_sandboxes() const;
    ContainerEngine& engine() { return *engine_; }

private:
    friend class SandboxRun;

    // Kill the container once per handle; engine errors are logged
    void kill_once(const std::shared_ptr<SandboxHandle>& handle, const char* reason);

    void release_slot(const std::string& container_id);

    std::shared_ptr<ContainerEngine> engine_;
    SandboxManagerConfig config_;

    mutable std::mutex mutex_;
    size_t reserved_ = 0;                      // Slots taken, including sandboxes being created
    std::set<std::string> live_containers_;
    std::set<std::string> known_images_;
};

// Destroys a sandbox when the scope ends, however it ends
class SandboxGuard {
public:
    SandboxGuard(SandboxManager& manager, std::shared_ptr<SandboxHandle> handle)
        : manager_(manager), handle_(std::move(handle)) {}
    ~SandboxGuard() {
        if (handle_) manager_.destroy(handle_);
    }

    SandboxGuard(const SandboxGuard&) = delete;
    SandboxGuard& operator=(const SandboxGuard&) = delete;

    const std::shared_ptr<SandboxHandle>& handle() const { return handle_; }

private:
    SandboxManager& manager_;
    std::shared_ptr<SandboxHandle> handle_;
};

} // namespace cloudrun
