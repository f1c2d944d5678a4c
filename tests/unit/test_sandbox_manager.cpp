#include <gtest/gtest.h>
#include "sandbox_manager.h"
#include "errors.h"
#include "fake_container_engine.h"
#include <thread>

namespace cloudrun {
namespace {

using testing_support::ExecScript;
using testing_support::FakeContainerEngine;
using testing_support::fails_with;
using testing_support::hangs;
using testing_support::prints;

class SandboxManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine = std::make_shared<FakeContainerEngine>();
        SandboxManagerConfig config;
        config.max_concurrent_sandboxes = 4;
        config.user = "1000:1000";
        config.keepalive_grace_seconds = 30;
        manager = std::make_unique<SandboxManager>(engine, config);
        python = std::make_shared<const EnvironmentDescriptor>(BuiltInEnvironments::python());
    }

    std::shared_ptr<SandboxHandle> create(const std::string& exec_id = "exec_test",
                                          ResourceLimits limits = ResourceLimits{}) {
        return manager->create(python, limits, NetworkMode::DISABLED, "/tmp/ws/" + exec_id,
                               exec_id);
    }

    // Drain a run's channel, returning the stdout text
    static std::string drain(SandboxRun& run) {
        std::string out;
        while (auto chunk = run.output().pop()) {
            if (chunk->stream == OutputStream::STDOUT) out += chunk->data;
        }
        return out;
    }

    std::shared_ptr<FakeContainerEngine> engine;
    std::unique_ptr<SandboxManager> manager;
    std::shared_ptr<const EnvironmentDescriptor> python;
};

// ============================================================================
// Creation
// ============================================================================

TEST_F(SandboxManagerTest, CreateBuildsHardenedContainerSpec) {
    // Given: Default limits
    ResourceLimits limits;
    limits.wall_clock_timeout = std::chrono::seconds(10);

    // When: Creating a sandbox
    auto handle = create("exec_abc123", limits);

    // Then: The container carries every limit and label
    ASSERT_EQ(engine->specs().size(), 1u);
    const ContainerSpec spec = engine->specs().front();
    EXPECT_EQ(spec.name, "cloudrun_python_exec_abc123");
    EXPECT_EQ(spec.image, "python:3.11-slim");
    EXPECT_EQ(spec.workdir, "/workspace");
    EXPECT_EQ(spec.host_workspace, "/tmp/ws/exec_abc123");
    EXPECT_FALSE(spec.network_enabled);
    EXPECT_EQ(spec.memory_limit_bytes, static_cast<long>(DEFAULT_MEMORY_LIMIT_BYTES));
    EXPECT_EQ(spec.cpu_quota_us, DEFAULT_CPU_QUOTA_US);
    EXPECT_EQ(spec.cpu_period_us, DEFAULT_CPU_PERIOD_US);
    EXPECT_EQ(spec.pids_limit, MAX_PROCESSES_PER_SANDBOX);
    EXPECT_EQ(spec.user, "1000:1000");
    EXPECT_EQ(spec.keepalive_seconds, 40) << "Timeout plus grace";
    EXPECT_EQ(spec.labels.at("io.cloudrun.sandbox"), "true");
    EXPECT_EQ(spec.labels.at("io.cloudrun.sandbox.execution"), "exec_abc123");
    EXPECT_EQ(spec.labels.at("io.cloudrun.sandbox.purpose"), "run");
    EXPECT_EQ(spec.environment.at("PYTHONPATH"), "/workspace/.packages");

    EXPECT_EQ(handle->state(), SandboxState::CREATED);
    EXPECT_EQ(handle->id(), "cloudrun_python_exec_abc123");
    EXPECT_EQ(handle->container_id(), "cid_cloudrun_python_exec_abc123");
    EXPECT_EQ(handle->network_mode(), NetworkMode::DISABLED);
    EXPECT_EQ(engine->starts, 1);
    EXPECT_EQ(manager->active_sandboxes(), 1u);
}

TEST_F(SandboxManagerTest, InstallSandboxIsNamedAndLabelled) {
    auto handle = manager->create(python, ResourceLimits{}, NetworkMode::ENABLED, "/tmp/ws",
                                  "exec_1", SandboxPurpose::INSTALL);

    const ContainerSpec spec = engine->specs().front();
    EXPECT_EQ(spec.name, "cloudrun_python_exec_1_install");
    EXPECT_TRUE(spec.network_enabled);
    EXPECT_EQ(spec.labels.at("io.cloudrun.sandbox.purpose"), "install");
    EXPECT_EQ(handle->purpose(), SandboxPurpose::INSTALL);
}

TEST_F(SandboxManagerTest, PreviewOnlyEnvironmentCannotBeCreated) {
    auto html = std::make_shared<const EnvironmentDescriptor>(BuiltInEnvironments::html());

    EXPECT_THROW(manager->create(html, ResourceLimits{}, NetworkMode::DISABLED, "/tmp", "e"),
                 ValidationError);
    EXPECT_EQ(engine->create_count(), 0) << "Nothing should reach the engine";
}

TEST_F(SandboxManagerTest, MissingImageIsPulledOnce) {
    // Given: The image is not present locally
    engine->present_images.clear();

    // When: Two sandboxes are created for the same image
    auto first = create("exec_1");
    auto second = create("exec_2");

    // Then: One pull, cached afterwards
    EXPECT_EQ(engine->pulls, 1);
    manager->destroy(first);
    manager->destroy(second);
}

TEST_F(SandboxManagerTest, PullFailureIsProvisioningError) {
    engine->present_images.clear();
    engine->pull_fails = true;

    EXPECT_THROW(create(), ProvisioningError);
    EXPECT_EQ(engine->create_count(), 0);
    EXPECT_EQ(manager->active_sandboxes(), 0u) << "Failed create must release its slot";
}

TEST_F(SandboxManagerTest, UnreachableEngineIsProvisioningError) {
    engine->unreachable = true;

    EXPECT_THROW(create(), ProvisioningError);
    EXPECT_EQ(manager->active_sandboxes(), 0u);
}

TEST_F(SandboxManagerTest, StartFailureRemovesCreatedContainer) {
    // Given: The container is created but will not start
    engine->start_fails = true;

    // When/Then: Creation fails and leaves nothing behind
    EXPECT_THROW(create(), ProvisioningError);
    EXPECT_EQ(engine->remove_count(), 1);
    EXPECT_EQ(engine->live_containers(), 0u);
    EXPECT_EQ(manager->active_sandboxes(), 0u);
}

TEST_F(SandboxManagerTest, CapacityLimitRejectsExtraSandboxes) {
    // Given: A manager allowing a single sandbox
    SandboxManagerConfig config;
    config.max_concurrent_sandboxes = 1;
    SandboxManager small(engine, config);

    auto first = small.create(python, ResourceLimits{}, NetworkMode::DISABLED, "/tmp", "e1");

    // When/Then: A second one is refused until the first is destroyed
    EXPECT_THROW(small.create(python, ResourceLimits{}, NetworkMode::DISABLED, "/tmp", "e2"),
                 ProvisioningError);

    small.destroy(first);
    auto again = small.create(python, ResourceLimits{}, NetworkMode::DISABLED, "/tmp", "e3");
    EXPECT_EQ(again->state(), SandboxState::CREATED);
    small.destroy(again);
}

// ============================================================================
// Destroy
// ============================================================================

TEST_F(SandboxManagerTest, DestroyIsIdempotent) {
    auto handle = create();

    manager->destroy(handle);
    manager->destroy(handle);

    EXPECT_EQ(handle->state(), SandboxState::DESTROYED);
    EXPECT_EQ(engine->remove_count(), 1) << "Container removed exactly once";
    EXPECT_EQ(manager->active_sandboxes(), 0u);
}

TEST_F(SandboxManagerTest, DestroyReleasesSlotEvenWhenRemovalFails) {
    auto handle = create();
    engine->remove_fails = true;

    EXPECT_NO_THROW(manager->destroy(handle));

    EXPECT_EQ(handle->state(), SandboxState::DESTROYED);
    EXPECT_EQ(manager->active_sandboxes(), 0u);
}

TEST_F(SandboxManagerTest, GuardDestroysOnException) {
    std::shared_ptr<SandboxHandle> seen;
    try {
        SandboxGuard guard(*manager, create());
        seen = guard.handle();
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
    }

    ASSERT_TRUE(seen);
    EXPECT_EQ(seen->state(), SandboxState::DESTROYED);
    EXPECT_EQ(engine->live_containers(), 0u);
}

TEST_F(SandboxManagerTest, RunAfterDestroyIsRejected) {
    auto handle = create();
    manager->destroy(handle);

    EXPECT_THROW(manager->run(handle, {"python", "-u", "main.py"}), CloudrunError);
}

// ============================================================================
// Run outcomes
// ============================================================================

TEST_F(SandboxManagerTest, RunStreamsOutputAndCompletes) {
    // Given: A program printing two chunks
    engine->script = [](const ContainerSpec&, const std::vector<std::string>&) {
        ExecScript s;
        s.output = {{OutputStream::STDOUT, "hello "}, {OutputStream::STDERR, "warn\n"},
                    {OutputStream::STDOUT, "world\n"}};
        return s;
    };
    auto handle = create();

    // When: Running it
    auto run = manager->run(handle, {"python", "-u", "/workspace/main.py"}, "input\n");
    std::vector<OutputChunk> chunks;
    while (auto chunk = run->output().pop()) {
        chunks.push_back(*chunk);
    }
    RunResult result = run->wait();

    // Then: Chunks arrive in capture order with their stream tag
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].data, "hello ");
    EXPECT_EQ(chunks[1].stream, OutputStream::STDERR);
    EXPECT_EQ(chunks[2].data, "world\n");
    EXPECT_EQ(result.outcome, RunOutcome::COMPLETED);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(handle->state(), SandboxState::COMPLETED);

    ASSERT_EQ(engine->execs().size(), 1u);
    EXPECT_EQ(engine->execs()[0].stdin_data, "input\n");
    manager->destroy(handle);
}

TEST_F(SandboxManagerTest, NonzeroExitIsFailed) {
    engine->script = [](const ContainerSpec&, const std::vector<std::string>&) {
        return fails_with("SyntaxError: invalid syntax\n", 1);
    };
    auto handle = create();

    auto run = manager->run(handle, {"python", "x.py"});
    drain(*run);
    RunResult result = run->wait();

    EXPECT_EQ(result.outcome, RunOutcome::FAILED);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(handle->state(), SandboxState::FAILED);
    manager->destroy(handle);
}

TEST_F(SandboxManagerTest, EachSandboxRunsOnce) {
    engine->script = [](const ContainerSpec&, const std::vector<std::string>&) {
        return prints("ok\n");
    };
    auto handle = create();
    manager->run(handle, {"true"})->wait();

    EXPECT_THROW(manager->run(handle, {"true"}), CloudrunError);
    manager->destroy(handle);
}

TEST_F(SandboxManagerTest, WallClockTimeoutKillsAndReportsTimedOut) {
    // Given: A program that never ends and a 100ms limit
    engine->script = [](const ContainerSpec&, const std::vector<std::string>&) {
        return hangs("started\n");
    };
    ResourceLimits limits;
    limits.wall_clock_timeout = std::chrono::milliseconds(100);
    auto handle = create("exec_loop", limits);

    // When: Running it
    auto started = std::chrono::steady_clock::now();
    auto run = manager->run(handle, {"python", "loop.py"});
    std::string out = drain(*run);
    RunResult result = run->wait();
    auto took = std::chrono::steady_clock::now() - started;

    // Then: Killed once, reported as timed out, promptly
    EXPECT_EQ(out, "started\n");
    EXPECT_EQ(result.outcome, RunOutcome::TIMED_OUT);
    EXPECT_EQ(handle->state(), SandboxState::TIMED_OUT);
    EXPECT_EQ(engine->kill_count(), 1);
    EXPECT_LT(took, std::chrono::seconds(5)) << "Timeout must not wait for the engine safety net";

    manager->destroy(handle);
    EXPECT_EQ(engine->live_containers(), 0u);
}

TEST_F(SandboxManagerTest, MemoryKillIsReportedAsOutOfMemory) {
    engine->script = [](const ContainerSpec&, const std::vector<std::string>&) {
        ExecScript s;
        s.oom_kill = true;
        return s;
    };
    auto handle = create();

    auto run = manager->run(handle, {"python", "hog.py"});
    drain(*run);
    RunResult result = run->wait();

    EXPECT_EQ(result.outcome, RunOutcome::OUT_OF_MEMORY);
    EXPECT_EQ(result.exit_code, 137);
    manager->destroy(handle);
}

TEST_F(SandboxManagerTest, EngineFailureDuringExec) {
    engine->script = [](const ContainerSpec&, const std::vector<std::string>&) {
        ExecScript s;
        s.engine_error = true;
        return s;
    };
    auto handle = create();

    auto run = manager->run(handle, {"python", "x.py"});
    drain(*run);
    RunResult result = run->wait();

    EXPECT_EQ(result.outcome, RunOutcome::ENGINE_FAILURE);
    EXPECT_FALSE(result.error_message.empty());
    manager->destroy(handle);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(SandboxManagerTest, CancelStopsRunningProcess) {
    // Given: A hanging program
    engine->script = [](const ContainerSpec&, const std::vector<std::string>&) {
        return hangs("tick\n");
    };
    auto handle = create();
    auto run = manager->run(handle, {"python", "loop.py"});

    // When: Cancelled from another thread, twice
    std::thread canceller([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        manager->cancel(handle);
        manager->cancel(handle);
    });
    drain(*run);
    RunResult result = run->wait();
    canceller.join();

    // Then: One kill, cancelled outcome
    EXPECT_EQ(result.outcome, RunOutcome::CANCELLED);
    EXPECT_EQ(handle->state(), SandboxState::CANCELLED);
    EXPECT_TRUE(handle->cancel_requested());
    EXPECT_EQ(engine->kill_count(), 1) << "Cancel must be idempotent";
    manager->destroy(handle);
}

TEST_F(SandboxManagerTest, CancelBeforeRunSkipsExec) {
    auto handle = create();

    manager->cancel(handle);
    auto run = manager->run(handle, {"python", "x.py"});
    drain(*run);
    RunResult result = run->wait();

    EXPECT_EQ(result.outcome, RunOutcome::CANCELLED);
    EXPECT_TRUE(engine->execs().empty()) << "No process should start after cancel";
    EXPECT_EQ(engine->kill_count(), 0);
    manager->destroy(handle);
}

TEST_F(SandboxManagerTest, CancelAfterCompletionIsHarmless) {
    engine->script = [](const ContainerSpec&, const std::vector<std::string>&) {
        return prints("done\n");
    };
    auto handle = create();
    auto run = manager->run(handle, {"python", "x.py"});
    drain(*run);
    RunResult result = run->wait();

    manager->cancel(handle);
    manager->destroy(handle);
    manager->cancel(handle);

    EXPECT_EQ(result.outcome, RunOutcome::COMPLETED);
    EXPECT_EQ(handle->state(), SandboxState::DESTROYED);
    EXPECT_EQ(engine->kill_count(), 0);
}

TEST_F(SandboxManagerTest, AbandonedRunIsStoppedOnDestruction) {
    // Given: A hanging run nobody waits for
    engine->script = [](const ContainerSpec&, const std::vector<std::string>&) {
        return hangs();
    };
    auto handle = create();

    // When: The run object goes away mid-run
    {
        auto run = manager->run(handle, {"python", "loop.py"});
    }

    // Then: The process was killed so its threads could finish
    EXPECT_EQ(engine->kill_count(), 1);
    manager->destroy(handle);
}

// ============================================================================
// Orphan sweep
// ============================================================================

TEST_F(SandboxManagerTest, ReapOrphansKeepsLiveSandboxes) {
    // Given: One live sandbox and two leftovers from a previous process
    auto live = create();
    engine->orphans = {"old_1", "old_2"};

    // When: Sweeping
    size_t removed = manager->reap_orphans();

    // Then: Only the leftovers are removed
    EXPECT_EQ(removed, 2u);
    EXPECT_EQ(live->state(), SandboxState::CREATED);
    EXPECT_EQ(engine->live_containers(), 1u);
    manager->destroy(live);
}

TEST_F(SandboxManagerTest, StateNamesAreStable) {
    EXPECT_EQ(to_string(SandboxState::TIMED_OUT), "timed_out");
    EXPECT_EQ(to_string(RunOutcome::OUT_OF_MEMORY), "out_of_memory");
    EXPECT_EQ(to_string(RunOutcome::CANCELLED), "cancelled");
}

} // namespace
} // namespace cloudrun
