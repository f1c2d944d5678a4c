#include "execution_orchestrator.h"
#include "errors.h"
#include "ids.h"
#include <iostream>
#include <regex>

namespace cloudrun {

namespace {

constexpr const char* STDIN_FILENAME = ".stdin";

void replace_all(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

bool is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

void append_capped(std::string& target, const std::string& data) {
    if (target.size() < MAX_CAPTURED_OUTPUT) {
        target.append(data, 0, MAX_CAPTURED_OUTPUT - target.size());
    }
}

std::string tail(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) return text;
    std::string cut = text.substr(text.size() - max_bytes);
    // Do not start in the middle of a UTF-8 sequence
    size_t skip = 0;
    while (skip < cut.size() && (static_cast<unsigned char>(cut[skip]) & 0xC0) == 0x80) {
        ++skip;
    }
    return cut.substr(skip);
}

std::string completion_message(const RunResult& result) {
    switch (result.outcome) {
        case RunOutcome::COMPLETED:
            return "Execution completed successfully";
        case RunOutcome::FAILED:
            return "Execution failed with exit code " + std::to_string(result.exit_code);
        case RunOutcome::TIMED_OUT:
            return "Execution timed out";
        case RunOutcome::OUT_OF_MEMORY:
            return "Execution exceeded the memory limit";
        case RunOutcome::CANCELLED:
            return "Execution cancelled";
        case RunOutcome::ENGINE_FAILURE:
            return "Execution failed: " + result.error_message;
    }
    return "Execution finished";
}

} // namespace

ExecutionOrchestrator::ExecutionOrchestrator(const EnvironmentRegistry& registry,
                                             SandboxManager& sandboxes,
                                             OrchestratorConfig config)
    : registry_(registry), sandboxes_(sandboxes), config_(std::move(config)) {}

void ExecutionOrchestrator::validate(const EnvironmentDescriptor& descriptor,
                                     const ExecutionRequest& request) {
    if (is_blank(request.source_code)) {
        throw ValidationError("Code cannot be empty");
    }
    if (request.source_code.size() > MAX_CODE_SIZE) {
        throw ValidationError("Code is too large (max 1MB)");
    }
    if (descriptor.id == "java") {
        static const std::regex public_class(R"(public\s+class\s+\w+)");
        if (!std::regex_search(request.source_code, public_class)) {
            throw ValidationError("Java code must contain a public class");
        }
    }

    std::string entry = entry_filename(descriptor, request.source_code);
    for (const auto& file : request.extra_files) {
        if (file.name == entry || file.name == STDIN_FILENAME) {
            throw ValidationError("file name '" + file.name + "' is reserved");
        }
    }
}

std::string ExecutionOrchestrator::java_class_name(const std::string& source) {
    static const std::regex public_class(R"(public\s+class\s+(\w+))");
    std::smatch match;
    if (std::regex_search(source, match, public_class)) {
        return match[1].str();
    }
    return "Main";
}

std::string ExecutionOrchestrator::entry_filename(const EnvironmentDescriptor& descriptor,
                                                  const std::string& source) {
    std::string name = descriptor.entry_filename;
    if (name.find("{classname}") != std::string::npos) {
        replace_all(name, "{classname}", java_class_name(source));
    }
    return name;
}

bool ExecutionOrchestrator::uses_stdin_file(const EnvironmentDescriptor& descriptor) {
    for (const auto& arg : descriptor.run_command) {
        if (arg.find("{stdin_file}") != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> ExecutionOrchestrator::build_run_command(
    const EnvironmentDescriptor& descriptor,
    const std::string& entry_file,
    const std::string& source
) {
    const std::string dir = SANDBOX_WORKDIR;
    const std::string classname = java_class_name(source);

    std::vector<std::string> command;
    command.reserve(descriptor.run_command.size());
    for (std::string arg : descriptor.run_command) {
        replace_all(arg, "{file}", dir + "/" + entry_file);
        replace_all(arg, "{dir}", dir);
        replace_all(arg, "{classname}", classname);
        replace_all(arg, "{stdin_file}", dir + "/" + STDIN_FILENAME);
        // Last, so placeholders inside the user's code are left alone
        replace_all(arg, "{code}", source);
        command.push_back(std::move(arg));
    }
    return command;
}

RunResult ExecutionOrchestrator::relay(SandboxRun& run, EventEmitter& events,
                                       CancellationToken& cancel, bool forward,
                                       Capture& capture) {
    // Bytes held back because a chunk ended inside a UTF-8 sequence
    std::string pending_out, pending_err;

    auto flush = [&](OutputStream stream, std::string& pending, bool final_flush) {
        size_t n = final_flush ? pending.size() : complete_utf8_prefix(pending);
        if (n == 0) return;
        std::string text = pending.substr(0, n);
        pending.erase(0, n);
        if (!forward || cancel.cancelled()) return;
        if (stream == OutputStream::STDOUT) {
            events.stdout_chunk(text);
        } else {
            events.stderr_chunk(text);
        }
    };

    while (auto chunk = run.output().pop()) {
        if (chunk->stream == OutputStream::STDOUT) {
            append_capped(capture.stdout_text, chunk->data);
        } else {
            append_capped(capture.stderr_text, chunk->data);
        }
        append_capped(capture.combined, chunk->data);

        std::string& pending = chunk->stream == OutputStream::STDOUT ? pending_out : pending_err;
        pending += chunk->data;
        flush(chunk->stream, pending, false);
    }
    flush(OutputStream::STDOUT, pending_out, true);
    flush(OutputStream::STDERR, pending_err, true);

    return run.wait();
}

RunResult ExecutionOrchestrator::install(
    const std::shared_ptr<const EnvironmentDescriptor>& descriptor,
    const std::vector<std::string>& packages,
    const Workspace& workspace,
    const std::string& execution_id,
    EventEmitter& events,
    CancellationToken& cancel
) {
    std::string command = DependencyDetector::install_command(*descriptor, packages);
    events.install_start(packages, command);
    std::cout << "[Orchestrator] " << execution_id << ": installing " << packages.size()
              << " package(s) with " << descriptor->package_manager << std::endl;

    RunResult result;
    Capture capture;
    {
        SandboxGuard guard(sandboxes_,
                           sandboxes_.create(descriptor, config_.install_limits,
                                             NetworkMode::ENABLED, workspace.path().string(),
                                             execution_id, SandboxPurpose::INSTALL));
        ScopedCancelCallback on_cancel(cancel, [this, handle = guard.handle()]() {
            sandboxes_.cancel(handle);
        });

        auto run = sandboxes_.run(guard.handle(), {"sh", "-c", command});
        result = relay(*run, events, cancel, false, capture);
    }

    bool success = result.outcome == RunOutcome::COMPLETED;
    events.install_result(success, result.exit_code, to_string(result.outcome),
                          tail(capture.combined, 8192));
    return result;
}

ExecutionSummary ExecutionOrchestrator::execute(const ExecutionRequest& request,
                                                EventEmitter& events,
                                                CancellationToken& cancel) {
    const auto start_time = std::chrono::steady_clock::now();

    ExecutionSummary summary;
    summary.execution_id = generate_id("exec_");
    summary.language_id = request.language_id;
    summary.source_code = request.source_code;

    auto finish = [&](bool success, const std::string& outcome, int exit_code,
                      const std::string& message) {
        summary.success = success;
        summary.outcome = outcome;
        summary.exit_code = exit_code;
        summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        events.complete(success, summary.elapsed, outcome, exit_code, summary.execution_id,
                        message);
        std::cout << "[Orchestrator] " << summary.execution_id << " " << outcome << " in "
                  << summary.elapsed.count() << "ms" << std::endl;
        return summary;
    };

    // 1. Resolve and validate, before any sandbox exists
    std::shared_ptr<const EnvironmentDescriptor> descriptor;
    try {
        descriptor = registry_.resolve(request.language_id);
        validate(*descriptor, request);
    } catch (const ValidationError& e) {
        std::cerr << "[Orchestrator] " << summary.execution_id << " rejected: " << e.what()
                  << std::endl;
        return finish(false, "validation_error", -1, e.what());
    }

    std::cout << "[Orchestrator] " << summary.execution_id << ": " << descriptor->id << ", "
              << request.source_code.size() << " bytes, sha256 "
              << FileUtils::sha256_string(request.source_code).substr(0, 12) << std::endl;

    if (cancel.cancelled()) {
        return finish(false, "cancelled", -1, "Execution cancelled");
    }

    // Markup is rendered by the caller; nothing runs
    if (descriptor->preview_only) {
        events.preview(request.source_code);
        return finish(true, "preview", 0, "Preview ready");
    }

    events.status("Starting execution...", "starting");

    try {
        Workspace workspace(config_.workspace_root, summary.execution_id);

        // 2. Optional install, in its own network-enabled sandbox
        if (!request.preinstall_packages.empty()) {
            if (!descriptor->supports_dependency_install) {
                events.status(descriptor->display_name +
                              " does not support package installation, skipping", "install");
            } else {
                RunResult installed = install(descriptor, request.preinstall_packages, workspace,
                                              summary.execution_id, events, cancel);
                if (installed.outcome == RunOutcome::CANCELLED || cancel.cancelled()) {
                    events.status("Execution stopped by user", "cancelled");
                    return finish(false, "cancelled", -1, "Execution cancelled");
                }
                if (installed.outcome != RunOutcome::COMPLETED) {
                    return finish(false, "install_failed", installed.exit_code,
                                  "Installation failed, code was not run");
                }
            }
        }

        // 3. Materialise the sources
        const std::string entry = entry_filename(*descriptor, request.source_code);
        workspace.write(entry, request.source_code);
        for (const auto& file : request.extra_files) {
            workspace.write(file.name, file.content);
        }
        std::string piped_stdin = request.stdin_data;
        if (uses_stdin_file(*descriptor)) {
            workspace.write(STDIN_FILENAME, request.stdin_data);
            piped_stdin.clear();
        }

        // 4. Command
        std::vector<std::string> command = build_run_command(*descriptor, entry,
                                                             request.source_code);

        if (cancel.cancelled()) {
            return finish(false, "cancelled", -1, "Execution cancelled");
        }

        // 5. Run, relaying output; the sandbox is gone when this block ends
        RunResult result;
        Capture capture;
        {
            SandboxGuard guard(sandboxes_,
                               sandboxes_.create(descriptor, config_.run_limits,
                                                 descriptor->network_enabled
                                                     ? NetworkMode::ENABLED
                                                     : NetworkMode::DISABLED,
                                                 workspace.path().string(),
                                                 summary.execution_id));
            ScopedCancelCallback on_cancel(cancel, [this, handle = guard.handle()]() {
                sandboxes_.cancel(handle);
            });

            events.status("Running...", "running");
            auto run = sandboxes_.run(guard.handle(), command, piped_stdin);
            result = relay(*run, events, cancel, true, capture);
        }

        summary.stdout_text = std::move(capture.stdout_text);
        summary.stderr_text = std::move(capture.stderr_text);
        summary.combined_output = std::move(capture.combined);

        switch (result.outcome) {
            case RunOutcome::TIMED_OUT:
                events.status("Time limit exceeded (" +
                              std::to_string(config_.run_limits.wall_clock_timeout.count()) +
                              "ms), process killed", "timed_out");
                break;
            case RunOutcome::OUT_OF_MEMORY:
                events.status("Memory limit exceeded, process killed", "out_of_memory");
                break;
            case RunOutcome::CANCELLED:
                events.status("Execution stopped by user", "cancelled");
                break;
            case RunOutcome::ENGINE_FAILURE:
                events.status(result.error_message, "engine_failure");
                break;
            default:
                break;
        }

        // 6. Advisory dependency hint; never reruns by itself
        if (result.outcome == RunOutcome::FAILED && descriptor->supports_dependency_install) {
            summary.missing_dependency = DependencyDetector::detect(summary.combined_output,
                                                                    descriptor->id);
            if (summary.missing_dependency) {
                events.dependency_missing(
                    *summary.missing_dependency,
                    DependencyDetector::install_command(
                        *descriptor, {summary.missing_dependency->package_name}));
            }
        }

        // 7. Report
        return finish(result.outcome == RunOutcome::COMPLETED, to_string(result.outcome),
                      result.exit_code, completion_message(result));

    } catch (const ProvisioningError& e) {
        std::cerr << "[Orchestrator] " << summary.execution_id << ": " << e.what() << std::endl;
        events.status(e.what(), "provisioning");
        return finish(false, "provisioning_error", -1, "Could not start a sandbox");
    } catch (const std::exception& e) {
        std::cerr << "[Orchestrator] " << summary.execution_id << " failed: " << e.what()
                  << std::endl;
        events.status(std::string("Execution error: ") + e.what(), "error");
        return finish(false, "error", -1, "Execution error");
    }
}

} // namespace cloudrun
