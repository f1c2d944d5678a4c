#include "sandbox_manager.h"
#include "errors.h"
#include "ids.h"
#include <iostream>

namespace cloudrun {

std::string to_string(SandboxState state) {
    switch (state) {
        case SandboxState::CREATED: return "created";
        case SandboxState::RUNNING: return "running";
        case SandboxState::COMPLETED: return "completed";
        case SandboxState::FAILED: return "failed";
        case SandboxState::TIMED_OUT: return "timed_out";
        case SandboxState::CANCELLED: return "cancelled";
        case SandboxState::DESTROYED: return "destroyed";
    }
    return "unknown";
}

std::string to_string(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::COMPLETED: return "completed";
        case RunOutcome::FAILED: return "failed";
        case RunOutcome::TIMED_OUT: return "timed_out";
        case RunOutcome::OUT_OF_MEMORY: return "out_of_memory";
        case RunOutcome::CANCELLED: return "cancelled";
        case RunOutcome::ENGINE_FAILURE: return "engine_failure";
    }
    return "unknown";
}

namespace {

SandboxState state_for(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::COMPLETED: return SandboxState::COMPLETED;
        case RunOutcome::TIMED_OUT: return SandboxState::TIMED_OUT;
        case RunOutcome::CANCELLED: return SandboxState::CANCELLED;
        default: return SandboxState::FAILED;
    }
}

// Exit status of a process killed by SIGKILL, as reported through exec
constexpr int KILLED_EXIT_CODE = 128 + 9;

} // namespace

// ============================================================================
// SandboxHandle
// ============================================================================

SandboxHandle::SandboxHandle(std::string id, std::string container_id, std::string execution_id,
                             std::shared_ptr<const EnvironmentDescriptor> descriptor,
                             ResourceLimits limits, NetworkMode network_mode,
                             SandboxPurpose purpose)
    : id_(std::move(id)),
      container_id_(std::move(container_id)),
      execution_id_(std::move(execution_id)),
      descriptor_(std::move(descriptor)),
      limits_(limits),
      network_mode_(network_mode),
      purpose_(purpose) {}

SandboxState SandboxHandle::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool SandboxHandle::cancel_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancel_requested_;
}

// ============================================================================
// SandboxRun
// ============================================================================

SandboxRun::SandboxRun(SandboxManager& manager, std::shared_ptr<SandboxHandle> handle)
    : manager_(manager), handle_(std::move(handle)),
      start_time_(std::chrono::steady_clock::now()) {}

SandboxRun::~SandboxRun() {
    bool still_running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        still_running = !finished_;
    }
    // Abandoned mid-run: stop the process so the threads can finish
    if (still_running) {
        manager_.cancel(handle_);
    }
    if (worker_.joinable()) worker_.join();
    if (watchdog_.joinable()) watchdog_.join();
}

void SandboxRun::start(std::vector<std::string> command,
                       std::string stdin_data,
                       std::map<std::string, std::string> environment) {
    start_time_ = std::chrono::steady_clock::now();
    worker_ = std::thread([this, command = std::move(command), stdin_data = std::move(stdin_data),
                           environment = std::move(environment)]() {
        execute(command, stdin_data, environment);
    });
    watchdog_ = std::thread(&SandboxRun::watch, this);
}

void SandboxRun::finish_immediately(RunOutcome outcome) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result_.outcome = outcome;
        result_.exit_code = -1;
        finished_ = true;
    }
    finished_cv_.notify_all();
    output_.close();
}

void SandboxRun::execute(const std::vector<std::string>& command,
                         const std::string& stdin_data,
                         const std::map<std::string, std::string>& environment) {
    RunResult result;
    bool engine_failed = false;

    try {
        result.exit_code = manager_.engine_->exec(
            handle_->container_id(), command, environment, stdin_data,
            [this](OutputStream stream, const std::string& data) {
                output_.push(OutputChunk{stream, data});
            });
    } catch (const EngineError& e) {
        engine_failed = true;
        result.error_message = e.what();
        std::cerr << "[Sandbox] " << handle_->id() << ": " << e.what() << std::endl;
    }

    bool timed_out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        timed_out = timed_out_;
    }

    if (handle_->cancel_requested()) {
        result.outcome = RunOutcome::CANCELLED;
    } else if (timed_out) {
        result.outcome = RunOutcome::TIMED_OUT;
    } else if (engine_failed) {
        result.outcome = RunOutcome::ENGINE_FAILURE;
    } else if (result.exit_code == 0) {
        result.outcome = RunOutcome::COMPLETED;
    } else {
        result.outcome = RunOutcome::FAILED;
        if (result.exit_code == KILLED_EXIT_CODE) {
            // SIGKILL nobody asked for: most likely the memory ceiling
            try {
                if (manager_.engine_->inspect(handle_->container_id()).oom_killed) {
                    result.outcome = RunOutcome::OUT_OF_MEMORY;
                }
            } catch (const EngineError& e) {
                std::cerr << "[Sandbox] " << handle_->id() << ": " << e.what() << std::endl;
            }
        }
    }

    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time_);

    {
        std::lock_guard<std::mutex> lock(handle_->mutex_);
        if (handle_->state_ != SandboxState::DESTROYED) {
            handle_->state_ = state_for(result.outcome);
        }
    }

    std::cout << "[Sandbox] " << handle_->id() << " finished: " << to_string(result.outcome)
              << " (exit " << result.exit_code << ", " << result.elapsed.count() << "ms)"
              << std::endl;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        result_ = result;
        finished_ = true;
    }
    finished_cv_.notify_all();
    output_.close();
}

void SandboxRun::watch() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (finished_cv_.wait_for(lock, handle_->limits().wall_clock_timeout,
                              [this] { return finished_; })) {
        return;
    }
    timed_out_ = true;
    lock.unlock();

    std::cerr << "[Sandbox] " << handle_->id() << " exceeded wall-clock limit of "
              << handle_->limits().wall_clock_timeout.count() << "ms, killing" << std::endl;
    manager_.kill_once(handle_, "timeout");
}

RunResult SandboxRun::wait() {
    if (worker_.joinable()) worker_.join();
    if (watchdog_.joinable()) watchdog_.join();
    std::lock_guard<std::mutex> lock(mutex_);
    return result_;
}

// ============================================================================
// SandboxManager
// ============================================================================

SandboxManager::SandboxManager(std::shared_ptr<ContainerEngine> engine, SandboxManagerConfig config)
    : engine_(std::move(engine)), config_(std::move(config)) {
    if (!engine_) {
        throw CloudrunError("sandbox manager needs a container engine");
    }
}

void SandboxManager::ensure_image(const std::string& image) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (known_images_.count(image)) {
            return;
        }
    }

    try {
        if (!engine_->has_image(image)) {
            engine_->pull_image(image);
        }
    } catch (const EngineError& e) {
        throw ProvisioningError("runtime image " + image + " unavailable: " + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    known_images_.insert(image);
}

std::shared_ptr<SandboxHandle> SandboxManager::create(
    std::shared_ptr<const EnvironmentDescriptor> descriptor,
    const ResourceLimits& limits,
    NetworkMode network_mode,
    const std::string& host_workspace,
    const std::string& execution_id,
    SandboxPurpose purpose
) {
    if (!descriptor) {
        throw ValidationError("no environment given");
    }
    if (descriptor->preview_only) {
        throw ValidationError("environment '" + descriptor->id + "' does not run code");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reserved_ >= config_.max_concurrent_sandboxes) {
            throw ProvisioningError("sandbox capacity reached (" +
                                    std::to_string(config_.max_concurrent_sandboxes) +
                                    " active), try again later");
        }
        ++reserved_;
    }

    const std::string purpose_name = purpose == SandboxPurpose::INSTALL ? "install" : "run";

    ContainerSpec spec;
    spec.name = container_name(descriptor->id, execution_id,
                               purpose == SandboxPurpose::INSTALL ? purpose_name : "");
    spec.image = descriptor->runtime_image;
    spec.workdir = SANDBOX_WORKDIR;
    spec.host_workspace = host_workspace;
    spec.network_enabled = network_mode == NetworkMode::ENABLED;
    spec.memory_limit_bytes = limits.memory_limit_bytes;
    spec.cpu_quota_us = limits.cpu_quota_us;
    spec.cpu_period_us = limits.cpu_period_us;
    spec.pids_limit = limits.pids_limit;
    spec.user = config_.user;
    spec.labels = {
        {SANDBOX_LABEL, "true"},
        {std::string(SANDBOX_LABEL) + ".execution", execution_id},
        {std::string(SANDBOX_LABEL) + ".purpose", purpose_name},
    };
    spec.environment = descriptor->environment;
    spec.keepalive_seconds = static_cast<int>(
        std::chrono::duration_cast<std::chrono::seconds>(limits.wall_clock_timeout).count()) +
        config_.keepalive_grace_seconds;

    std::string container_id;
    auto abandon = [&]() {
        if (!container_id.empty()) {
            try {
                engine_->remove_container(container_id);
            } catch (const EngineError& e) {
                std::cerr << "[Sandbox] Cleanup of " << spec.name << " failed: " << e.what()
                          << std::endl;
            }
        }
        std::lock_guard<std::mutex> lock(mutex_);
        --reserved_;
    };

    try {
        ensure_image(spec.image);
        container_id = engine_->create_container(spec);
        engine_->start_container(container_id);
    } catch (const ProvisioningError&) {
        abandon();
        throw;
    } catch (const EngineError& e) {
        abandon();
        throw ProvisioningError(std::string("cannot start sandbox: ") + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        live_containers_.insert(container_id);
    }

    std::cout << "[Sandbox] Created " << spec.name << " (" << spec.image << ", network "
              << (spec.network_enabled ? "enabled" : "disabled") << ")" << std::endl;

    return std::shared_ptr<SandboxHandle>(new SandboxHandle(
        spec.name, container_id, execution_id, std::move(descriptor), limits, network_mode,
        purpose));
}

std::unique_ptr<SandboxRun> SandboxManager::run(
    const std::shared_ptr<SandboxHandle>& handle,
    const std::vector<std::string>& command,
    const std::string& stdin_data,
    const std::map<std::string, std::string>& environment
) {
    bool cancelled_early = false;
    {
        std::lock_guard<std::mutex> lock(handle->mutex_);
        if (handle->state_ != SandboxState::CREATED) {
            throw CloudrunError("sandbox " + handle->id_ + " cannot run in state " +
                                to_string(handle->state_));
        }
        if (handle->cancel_requested_) {
            handle->state_ = SandboxState::CANCELLED;
            cancelled_early = true;
        } else {
            handle->state_ = SandboxState::RUNNING;
        }
    }

    std::unique_ptr<SandboxRun> run(new SandboxRun(*this, handle));
    if (cancelled_early) {
        run->finish_immediately(RunOutcome::CANCELLED);
        return run;
    }

    run->start(command, stdin_data, environment);
    return run;
}

void SandboxManager::kill_once(const std::shared_ptr<SandboxHandle>& handle, const char* reason) {
    {
        std::lock_guard<std::mutex> lock(handle->mutex_);
        if (handle->kill_sent_ || handle->state_ == SandboxState::DESTROYED) {
            return;
        }
        handle->kill_sent_ = true;
    }

    try {
        engine_->kill_container(handle->container_id());
        std::cout << "[Sandbox] Killed " << handle->id() << " (" << reason << ")" << std::endl;
    } catch (const EngineError& e) {
        std::cerr << "[Sandbox] Kill of " << handle->id() << " failed: " << e.what() << std::endl;
    }
}

void SandboxManager::cancel(const std::shared_ptr<SandboxHandle>& handle) {
    bool running;
    {
        std::lock_guard<std::mutex> lock(handle->mutex_);
        if (handle->state_ == SandboxState::DESTROYED || handle->cancel_requested_) {
            return;
        }
        handle->cancel_requested_ = true;
        running = handle->state_ == SandboxState::RUNNING;
    }

    if (running) {
        kill_once(handle, "cancelled");
    }
}

void SandboxManager::destroy(const std::shared_ptr<SandboxHandle>& handle) {
    {
        std::lock_guard<std::mutex> lock(handle->mutex_);
        if (handle->state_ == SandboxState::DESTROYED) {
            return;
        }
        handle->state_ = SandboxState::DESTROYED;
    }

    // Forced removal also stops anything still running
    try {
        engine_->remove_container(handle->container_id());
    } catch (const EngineError& e) {
        std::cerr << "[Sandbox] Removal of " << handle->id() << " failed, left for the sweep: "
                  << e.what() << std::endl;
    }
    release_slot(handle->container_id());

    std::cout << "[Sandbox] Destroyed " << handle->id() << std::endl;
}

void SandboxManager::release_slot(const std::string& container_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (live_containers_.erase(container_id) > 0) {
        --reserved_;
    }
}

size_t SandboxManager::reap_orphans() {
    std::vector<std::string> ids;
    try {
        ids = engine_->list_containers(SANDBOX_LABEL);
    } catch (const EngineError& e) {
        std::cerr << "[Sandbox] Orphan sweep skipped: " << e.what() << std::endl;
        return 0;
    }

    size_t removed = 0;
    for (const auto& id : ids) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (live_containers_.count(id)) {
                continue;
            }
        }
        try {
            engine_->remove_container(id);
            ++removed;
        } catch (const EngineError& e) {
            std::cerr << "[Sandbox] Could not remove orphan " << id << ": " << e.what() << std::endl;
        }
    }

    if (removed > 0) {
        std::cout << "[Sandbox] Removed " << removed << " orphaned sandbox(es)" << std::endl;
    }
    return removed;
}

size_t SandboxManager::active_sandboxes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_;
}

} // namespace cloudrun
