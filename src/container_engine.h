#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace cloudrun {

enum class OutputStream {
    STDOUT,
    STDERR
};

// Everything needed to create one sandbox container
struct ContainerSpec {
    std::string name;
    std::string image;
    std::string workdir;                          // Inside the container
    std::string host_workspace;                   // Bind-mounted at workdir, may be empty
    bool network_enabled = false;
    long memory_limit_bytes = 0;                  // 0 = engine default
    long cpu_quota_us = 0;
    long cpu_period_us = 0;
    int pids_limit = 0;
    std::string user;                             // "uid:gid", empty = image default
    std::map<std::string, std::string> labels;
    std::map<std::string, std::string> environment;
    int keepalive_seconds = 0;                    // Container exits on its own after this
};

struct ContainerStatus {
    bool running = false;
    bool oom_killed = false;
    int exit_code = 0;
};

// Called once per chunk, in the order the bytes were read
using OutputCallback = std::function<void(OutputStream, const std::string&)>;

// Minimal container engine surface the sandbox manager needs. All methods
// throw EngineError when the engine itself fails; outcomes of the user's
// process are reported through return values.
class ContainerEngine {
public:
    virtual ~ContainerEngine() = default;

    // Engine version, throws if unreachable
    virtual std::string ping() = 0;

    virtual bool has_image(const std::string& image) = 0;
    virtual void pull_image(const std::string& image) = 0;

    // Returns the container id
    virtual std::string create_container(const ContainerSpec& spec) = 0;
    virtual void start_container(const std::string& id) = 0;

    // Run a command in a started container, streaming its output. Returns the
    // command's exit code once its output is fully drained. Must return
    // promptly after kill_container() on the same container.
    virtual int exec(const std::string& id,
                     const std::vector<std::string>& command,
                     const std::map<std::string, std::string>& environment,
                     const std::string& stdin_data,
                     const OutputCallback& on_output) = 0;

    // False when the container was not running
    virtual bool kill_container(const std::string& id) = 0;

    virtual ContainerStatus inspect(const std::string& id) = 0;

    // Removing a container that no longer exists is not an error
    virtual void remove_container(const std::string& id) = 0;

    // Ids of all containers carrying a label, running or not
    virtual std::vector<std::string> list_containers(const std::string& label) = 0;
};

} // namespace cloudrun
