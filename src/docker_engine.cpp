#include "docker_engine.h"
#include "constants.h"
#include "errors.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <sys/wait.h>
#include <tuple>
#include <unistd.h>

namespace cloudrun {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

} // namespace

DockerCliEngine::DockerCliEngine(std::string docker_binary)
    : binary_(std::move(docker_binary)) {}

std::vector<std::string> DockerCliEngine::build_create_args(const ContainerSpec& spec) {
    std::vector<std::string> args = {"create"};

    if (!spec.name.empty()) {
        args.insert(args.end(), {"--name", spec.name});
    }
    for (const auto& [key, value] : spec.labels) {
        args.insert(args.end(), {"--label", value.empty() ? key : key + "=" + value});
    }

    // Isolation
    args.insert(args.end(), {"--network", spec.network_enabled ? "bridge" : "none"});
    args.insert(args.end(), {"--cap-drop", "ALL"});
    args.insert(args.end(), {"--security-opt", "no-new-privileges"});
    args.insert(args.end(), {"--tmpfs",
        "/tmp:rw,exec,nosuid,size=" + std::to_string(TMPFS_SIZE_LIMIT)});
    if (!spec.user.empty()) {
        args.insert(args.end(), {"--user", spec.user});
    }

    // Resources
    if (spec.memory_limit_bytes > 0) {
        std::string mem = std::to_string(spec.memory_limit_bytes);
        // Same value for swap means no swap at all
        args.insert(args.end(), {"--memory", mem, "--memory-swap", mem});
    }
    if (spec.cpu_quota_us > 0 && spec.cpu_period_us > 0) {
        args.insert(args.end(), {"--cpu-quota", std::to_string(spec.cpu_quota_us),
                                 "--cpu-period", std::to_string(spec.cpu_period_us)});
    }
    if (spec.pids_limit > 0) {
        args.insert(args.end(), {"--pids-limit", std::to_string(spec.pids_limit)});
    }

    if (!spec.host_workspace.empty()) {
        args.insert(args.end(), {"-v", spec.host_workspace + ":" + spec.workdir});
    }
    if (!spec.workdir.empty()) {
        args.insert(args.end(), {"-w", spec.workdir});
    }
    for (const auto& [key, value] : spec.environment) {
        args.insert(args.end(), {"-e", key + "=" + value});
    }

    // The container only idles; work happens through exec. If the service
    // dies without cleaning up, the container still exits by itself.
    args.insert(args.end(), {"--entrypoint", "sleep", spec.image,
                             std::to_string(spec.keepalive_seconds > 0 ? spec.keepalive_seconds
                                                                       : DEFAULT_TIMEOUT_SECONDS)});
    return args;
}

std::vector<std::string> DockerCliEngine::build_exec_args(
    const std::string& id,
    const std::vector<std::string>& command,
    const std::map<std::string, std::string>& environment
) {
    std::vector<std::string> args = {"exec", "-i", "-w", SANDBOX_WORKDIR};
    for (const auto& [key, value] : environment) {
        args.insert(args.end(), {"-e", key + "=" + value});
    }
    args.push_back(id);
    args.insert(args.end(), command.begin(), command.end());
    return args;
}

ContainerStatus DockerCliEngine::parse_inspect_output(const std::string& output) {
    std::istringstream in(output);
    std::string running, oom;
    int exit_code = 0;
    if (!(in >> running >> oom >> exit_code)) {
        throw EngineError("unexpected inspect output: " + trim(output));
    }
    ContainerStatus status;
    status.running = running == "true";
    status.oom_killed = oom == "true";
    status.exit_code = exit_code;
    return status;
}

int DockerCliEngine::run_process(
    const std::vector<std::string>& args,
    const std::string& stdin_data,
    const OutputCallback& on_output,
    const std::string& track_container
) {
    // Everything the child needs is prepared before fork
    std::vector<std::string> full_args;
    full_args.reserve(args.size() + 1);
    full_args.push_back(binary_);
    full_args.insert(full_args.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& arg : full_args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int stdin_pipe[2], stdout_pipe[2], stderr_pipe[2];
    if (pipe2(stdin_pipe, O_CLOEXEC) == -1) {
        throw EngineError(std::string("failed to create pipe: ") + strerror(errno));
    }
    if (pipe2(stdout_pipe, O_CLOEXEC) == -1) {
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        throw EngineError(std::string("failed to create pipe: ") + strerror(errno));
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) == -1) {
        for (int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0], stdout_pipe[1]}) close(fd);
        throw EngineError(std::string("failed to create pipe: ") + strerror(errno));
    }

    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        for (int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0], stdout_pipe[1],
                       stderr_pipe[0], stderr_pipe[1]}) {
            close(fd);
        }
        throw EngineError(std::string("failed to fork: ") + strerror(err));
    }

    if (pid == 0) {
        // Child: dup2 clears O_CLOEXEC on the targets
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        execvp(argv[0], argv.data());
        const char msg[] = "failed to exec container engine client\n";
        ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        _exit(127);
    }

    // Parent
    if (!track_container.empty()) {
        track_exec(track_container, pid);
    }
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    int in_fd = stdin_pipe[1];
    int out_fd = stdout_pipe[0];
    int err_fd = stderr_pipe[0];

    size_t written = 0;
    if (stdin_data.empty()) {
        close_fd(in_fd);
    } else {
        fcntl(in_fd, F_SETFL, fcntl(in_fd, F_GETFL) | O_NONBLOCK);
    }

    char buffer[PIPE_BUFFER_SIZE];
    while (out_fd >= 0 || err_fd >= 0) {
        struct pollfd fds[3];
        nfds_t count = 0;
        int out_idx = -1, err_idx = -1, in_idx = -1;
        if (out_fd >= 0) { out_idx = static_cast<int>(count); fds[count++] = pollfd{out_fd, POLLIN, 0}; }
        if (err_fd >= 0) { err_idx = static_cast<int>(count); fds[count++] = pollfd{err_fd, POLLIN, 0}; }
        if (in_fd >= 0) { in_idx = static_cast<int>(count); fds[count++] = pollfd{in_fd, POLLOUT, 0}; }

        int ready = poll(fds, count, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }

        if (in_idx >= 0 && fds[in_idx].revents) {
            if (fds[in_idx].revents & (POLLERR | POLLHUP)) {
                close_fd(in_fd);
            } else {
                ssize_t n = write(in_fd, stdin_data.data() + written, stdin_data.size() - written);
                if (n > 0) {
                    written += static_cast<size_t>(n);
                } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    // Process stopped reading (EPIPE); the rest is dropped
                    close_fd(in_fd);
                }
                if (written >= stdin_data.size()) {
                    close_fd(in_fd);
                }
            }
        }

        for (auto [idx, fd_ptr, stream] : {std::make_tuple(out_idx, &out_fd, OutputStream::STDOUT),
                                           std::make_tuple(err_idx, &err_fd, OutputStream::STDERR)}) {
            if (idx < 0 || !fds[idx].revents) continue;
            ssize_t n = read(*fd_ptr, buffer, sizeof(buffer));
            if (n > 0) {
                if (on_output) {
                    on_output(stream, std::string(buffer, static_cast<size_t>(n)));
                }
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                close_fd(*fd_ptr);
            }
        }
    }
    close_fd(in_fd);
    close_fd(out_fd);
    close_fd(err_fd);

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited == -1 && errno == EINTR);

    if (!track_container.empty()) {
        untrack_exec(track_container, pid);
    }

    if (waited == -1) {
        throw EngineError(std::string("waitpid failed: ") + strerror(errno));
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

DockerCliEngine::CommandResult DockerCliEngine::run_docker(const std::vector<std::string>& args) {
    CommandResult result;
    result.exit_code = run_process(args, "", [&result](OutputStream stream, const std::string& data) {
        std::string& target = stream == OutputStream::STDOUT ? result.stdout_output
                                                             : result.stderr_output;
        if (target.size() < MAX_CAPTURED_OUTPUT) {
            target += data;
        }
    }, "");
    return result;
}

void DockerCliEngine::track_exec(const std::string& container, pid_t pid) {
    std::lock_guard<std::mutex> lock(exec_mutex_);
    exec_pids_[container].insert(pid);
}

void DockerCliEngine::untrack_exec(const std::string& container, pid_t pid) {
    std::lock_guard<std::mutex> lock(exec_mutex_);
    auto it = exec_pids_.find(container);
    if (it == exec_pids_.end()) return;
    it->second.erase(pid);
    if (it->second.empty()) {
        exec_pids_.erase(it);
    }
}

std::string DockerCliEngine::ping() {
    auto result = run_docker({"version", "--format", "{{.Server.Version}}"});
    if (result.exit_code != 0) {
        throw EngineError("engine unreachable: " + trim(result.stderr_output), result.exit_code);
    }
    return trim(result.stdout_output);
}

bool DockerCliEngine::has_image(const std::string& image) {
    auto result = run_docker({"image", "inspect", "--format", "{{.Id}}", image});
    return result.exit_code == 0;
}

void DockerCliEngine::pull_image(const std::string& image) {
    std::cout << "[Docker] Pulling image " << image << std::endl;
    auto result = run_docker({"pull", "--quiet", image});
    if (result.exit_code != 0) {
        throw EngineError("failed to pull " + image + ": " + trim(result.stderr_output),
                          result.exit_code);
    }
}

std::string DockerCliEngine::create_container(const ContainerSpec& spec) {
    auto result = run_docker(build_create_args(spec));
    if (result.exit_code != 0) {
        throw EngineError("failed to create container " + spec.name + ": " +
                          trim(result.stderr_output), result.exit_code);
    }
    std::string id = trim(result.stdout_output);
    if (id.empty()) {
        throw EngineError("engine returned no container id for " + spec.name);
    }
    return id;
}

void DockerCliEngine::start_container(const std::string& id) {
    auto result = run_docker({"start", id});
    if (result.exit_code != 0) {
        throw EngineError("failed to start container " + id + ": " +
                          trim(result.stderr_output), result.exit_code);
    }
}

int DockerCliEngine::exec(
    const std::string& id,
    const std::vector<std::string>& command,
    const std::map<std::string, std::string>& environment,
    const std::string& stdin_data,
    const OutputCallback& on_output
) {
    return run_process(build_exec_args(id, command, environment), stdin_data, on_output, id);
}

bool DockerCliEngine::kill_container(const std::string& id) {
    auto result = run_docker({"kill", "--signal", "KILL", id});

    // The exec client may outlive a dead container briefly; make sure it goes
    {
        std::lock_guard<std::mutex> lock(exec_mutex_);
        auto it = exec_pids_.find(id);
        if (it != exec_pids_.end()) {
            for (pid_t pid : it->second) {
                kill(pid, SIGKILL);
            }
        }
    }

    if (result.exit_code == 0) {
        return true;
    }
    if (contains(result.stderr_output, "is not running") ||
        contains(result.stderr_output, "No such container")) {
        return false;
    }
    throw EngineError("failed to kill container " + id + ": " + trim(result.stderr_output),
                      result.exit_code);
}

ContainerStatus DockerCliEngine::inspect(const std::string& id) {
    auto result = run_docker({"inspect", "--format",
                              "{{.State.Running}} {{.State.OOMKilled}} {{.State.ExitCode}}", id});
    if (result.exit_code != 0) {
        throw EngineError("failed to inspect container " + id + ": " +
                          trim(result.stderr_output), result.exit_code);
    }
    return parse_inspect_output(result.stdout_output);
}

void DockerCliEngine::remove_container(const std::string& id) {
    auto result = run_docker({"rm", "-f", "-v", id});
    if (result.exit_code != 0 && !contains(result.stderr_output, "No such container")) {
        throw EngineError("failed to remove container " + id + ": " +
                          trim(result.stderr_output), result.exit_code);
    }
}

std::vector<std::string> DockerCliEngine::list_containers(const std::string& label) {
    auto result = run_docker({"ps", "-aq", "--no-trunc", "--filter", "label=" + label});
    if (result.exit_code != 0) {
        throw EngineError("failed to list containers: " + trim(result.stderr_output),
                          result.exit_code);
    }
    std::vector<std::string> ids;
    std::istringstream in(result.stdout_output);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (!line.empty()) {
            ids.push_back(line);
        }
    }
    return ids;
}

} // namespace cloudrun
