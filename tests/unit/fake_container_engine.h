#pragma once

#include "container_engine.h"
#include "errors.h"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace cloudrun {
namespace testing_support {

// What one exec does inside the fake engine
struct ExecScript {
    std::vector<std::pair<OutputStream, std::string>> output;
    int exit_code = 0;
    bool block_until_killed = false;  // Hang like `while True: pass`
    bool oom_kill = false;            // Die as if the memory cgroup fired
    bool engine_error = false;        // Client itself fails
};

struct ExecCall {
    std::string container_id;
    std::vector<std::string> command;
    std::map<std::string, std::string> environment;
    std::string stdin_data;
};

// In-memory ContainerEngine. Records every call and plays scripted output,
// so sandbox lifecycles can be checked without a Docker daemon.
class FakeContainerEngine : public ContainerEngine {
public:
    using ScriptFn = std::function<ExecScript(const ContainerSpec&, const std::vector<std::string>&)>;

    std::string ping() override {
        if (unreachable) throw EngineError("Cannot connect to the Docker daemon");
        return "fake-24.0";
    }

    bool has_image(const std::string& image) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (unreachable) throw EngineError("Cannot connect to the Docker daemon");
        return present_images.count(image) > 0;
    }

    void pull_image(const std::string& image) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++pulls;
        if (pull_fails) throw EngineError("pull access denied for " + image, 1);
        present_images.insert(image);
    }

    std::string create_container(const ContainerSpec& spec) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++creates;
        if (create_fails) throw EngineError("create failed", 125);
        std::string id = "cid_" + spec.name;
        specs_[id] = spec;
        created_specs.push_back(spec);
        live_.insert(id);
        return id;
    }

    void start_container(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++starts;
        if (start_fails) throw EngineError("start failed: " + id, 1);
    }

    int exec(const std::string& id,
             const std::vector<std::string>& command,
             const std::map<std::string, std::string>& environment,
             const std::string& stdin_data,
             const OutputCallback& on_output) override {
        ExecScript exec_script;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            exec_calls.push_back({id, command, environment, stdin_data});
            if (script) {
                exec_script = script(specs_[id], command);
            }
        }

        if (exec_script.engine_error) {
            throw EngineError("OCI runtime exec failed", 126);
        }

        for (const auto& [stream, data] : exec_script.output) {
            on_output(stream, data);
        }

        if (exec_script.oom_kill) {
            std::lock_guard<std::mutex> lock(mutex_);
            oom_killed_.insert(id);
            return 137;
        }

        if (exec_script.block_until_killed) {
            std::unique_lock<std::mutex> lock(mutex_);
            // Safety net so a broken test cannot hang the suite
            bool killed = killed_cv_.wait_for(lock, std::chrono::seconds(10),
                                              [&] { return killed_.count(id) > 0; });
            return killed ? 137 : 0;
        }
        return exec_script.exit_code;
    }

    bool kill_container(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++kills;
        bool was_running = !killed_.count(id);
        killed_.insert(id);
        killed_cv_.notify_all();
        return was_running;
    }

    ContainerStatus inspect(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ContainerStatus status;
        status.running = live_.count(id) > 0 && !killed_.count(id);
        status.oom_killed = oom_killed_.count(id) > 0;
        status.exit_code = status.oom_killed ? 137 : 0;
        return status;
    }

    void remove_container(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++removes;
        removed_ids.push_back(id);
        if (remove_fails) throw EngineError("removal in progress", 1);
        live_.erase(id);
        orphans.erase(id);
        // Removal also stops a blocked exec
        killed_.insert(id);
        killed_cv_.notify_all();
    }

    std::vector<std::string> list_containers(const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> ids(live_.begin(), live_.end());
        ids.insert(ids.end(), orphans.begin(), orphans.end());
        return ids;
    }

    // Containers created and not yet removed
    size_t live_containers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return live_.size();
    }

    std::vector<ExecCall> execs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return exec_calls;
    }

    std::vector<ContainerSpec> specs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return created_specs;
    }

    int create_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return creates;
    }

    int remove_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return removes;
    }

    int kill_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return kills;
    }

    // Knobs, set before use
    ScriptFn script;
    std::set<std::string> present_images{"python:3.11-slim", "node:20-alpine",
                                         "eclipse-temurin:21-jdk", "gcc:12", "ubuntu:22.04"};
    std::set<std::string> orphans;
    bool unreachable = false;
    bool pull_fails = false;
    bool create_fails = false;
    bool start_fails = false;
    bool remove_fails = false;

    int creates = 0;
    int starts = 0;
    int removes = 0;
    int kills = 0;
    int pulls = 0;
    std::vector<std::string> removed_ids;
    std::vector<ContainerSpec> created_specs;
    std::vector<ExecCall> exec_calls;

private:
    mutable std::mutex mutex_;
    std::condition_variable killed_cv_;
    std::map<std::string, ContainerSpec> specs_;
    std::set<std::string> live_;
    std::set<std::string> killed_;
    std::set<std::string> oom_killed_;
};

// Script helpers
inline ExecScript prints(const std::string& out, int exit_code = 0) {
    ExecScript s;
    if (!out.empty()) s.output.push_back({OutputStream::STDOUT, out});
    s.exit_code = exit_code;
    return s;
}

inline ExecScript fails_with(const std::string& err, int exit_code = 1) {
    ExecScript s;
    s.output.push_back({OutputStream::STDERR, err});
    s.exit_code = exit_code;
    return s;
}

inline ExecScript hangs(const std::string& first_output = "") {
    ExecScript s;
    if (!first_output.empty()) s.output.push_back({OutputStream::STDOUT, first_output});
    s.block_until_killed = true;
    return s;
}

inline bool is_install(const ContainerSpec& spec) {
    auto it = spec.labels.find("io.cloudrun.sandbox.purpose");
    return it != spec.labels.end() && it->second == "install";
}

} // namespace testing_support
} // namespace cloudrun
