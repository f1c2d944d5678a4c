#pragma once

#include <cstddef>  // for size_t

namespace cloudrun {

// Memory limits
constexpr size_t DEFAULT_MEMORY_LIMIT_BYTES = 256 * 1024 * 1024;  // 256MB
constexpr size_t INSTALL_MEMORY_LIMIT_BYTES = 512 * 1024 * 1024;  // 512MB for pip/npm
constexpr size_t TMPFS_SIZE_LIMIT = 64 * 1024 * 1024;             // 64MB /tmp inside sandbox

// CPU share (docker --cpu-quota / --cpu-period)
constexpr long DEFAULT_CPU_QUOTA_US = 50000;                      // Half a core...
constexpr long DEFAULT_CPU_PERIOD_US = 100000;                    // ...per 100ms

// Time limits
constexpr int DEFAULT_TIMEOUT_SECONDS = 30;                       // User code wall clock
constexpr int INSTALL_TIMEOUT_SECONDS = 60;                       // Package install wall clock
constexpr int KILL_GRACE_SECONDS = 5;                             // Teardown after kill
constexpr int SANDBOX_KEEPALIVE_GRACE_SECONDS = 30;               // Idle container self-expiry
constexpr int FOLLOWUP_WINDOW_SECONDS = 120;                      // Wait for install-and-rerun

// Process limits
constexpr int MAX_PROCESSES_PER_SANDBOX = 64;                     // --pids-limit

// Request limits
constexpr size_t MAX_CODE_SIZE = 1000000;                         // 1MB of source
constexpr size_t MAX_FILES_PER_REQUEST = 5;
constexpr size_t MAX_MESSAGE_SIZE = 16 * 1024 * 1024;             // Largest inbound frame
constexpr size_t MAX_REQUEST_SIZE = 1024 * 1024;                  // Largest HTTP request head
constexpr size_t MAX_CAPTURED_OUTPUT = 4 * 1024 * 1024;           // Kept for dependency detection

// Admission
constexpr int DEFAULT_MAX_CONCURRENT_SANDBOXES = 16;
constexpr int MAX_CONCURRENT_SESSIONS_PER_IP = 2;
constexpr int MAX_REQUESTS_PER_MINUTE = 30;

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                         // Read buffer size
constexpr size_t INITIAL_HTTP_BUFFER = 8192;                      // Initial HTTP buffer

// Network
constexpr int DEFAULT_PORT = 8000;                                // Default server port
constexpr int LISTEN_BACKLOG = 64;                                // Socket listen backlog

// Sandbox layout
constexpr const char* SANDBOX_WORKDIR = "/workspace";
constexpr const char* SANDBOX_LABEL = "io.cloudrun.sandbox";
constexpr const char* DEFAULT_WORKSPACE_ROOT = "/tmp/cloudrun_workspaces";
constexpr const char* DEFAULT_DOCKER_BINARY = "docker";

constexpr const char* CLOUDRUN_VERSION = "0.1.0";

} // namespace cloudrun
