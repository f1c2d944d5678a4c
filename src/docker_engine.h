#pragma once

#include "container_engine.h"
#include <mutex>
#include <set>
#include <sys/types.h>

namespace cloudrun {

// ContainerEngine backed by the docker command line client. Every operation
// is one fork/exec of the client; exec streams the client's stdout/stderr.
class DockerCliEngine : public ContainerEngine {
public:
    explicit DockerCliEngine(std::string docker_binary = "docker");

    std::string ping() override;
    bool has_image(const std::string& image) override;
    void pull_image(const std::string& image) override;
    std::string create_container(const ContainerSpec& spec) override;
    void start_container(const std::string& id) override;
    int exec(const std::string& id,
             const std::vector<std::string>& command,
             const std::map<std::string, std::string>& environment,
             const std::string& stdin_data,
             const OutputCallback& on_output) override;
    bool kill_container(const std::string& id) override;
    ContainerStatus inspect(const std::string& id) override;
    void remove_container(const std::string& id) override;
    std::vector<std::string> list_containers(const std::string& label) override;

    // Arguments after the binary name, exposed for tests
    static std::vector<std::string> build_create_args(const ContainerSpec& spec);
    static std::vector<std::string> build_exec_args(
        const std::string& id,
        const std::vector<std::string>& command,
        const std::map<std::string, std::string>& environment);

    // Parse "<running> <oom_killed> <exit_code>" from docker inspect
    static ContainerStatus parse_inspect_output(const std::string& output);

private:
    struct CommandResult {
        int exit_code = -1;
        std::string stdout_output;
        std::string stderr_output;
    };

    // Run the client to completion and capture its output
    CommandResult run_docker(const std::vector<std::string>& args);

    // Fork/exec the client, feed stdin, hand output to the callback as it
    // arrives. Returns the client's exit status (128+signal if killed).
    int run_process(const std::vector<std::string>& args,
                    const std::string& stdin_data,
                    const OutputCallback& on_output,
                    const std::string& track_container);

    void track_exec(const std::string& container, pid_t pid);
    void untrack_exec(const std::string& container, pid_t pid);

    std::string binary_;

    // docker exec clients per container, killed along with the container
    std::mutex exec_mutex_;
    std::map<std::string, std::set<pid_t>> exec_pids_;
};

} // namespace cloudrun
