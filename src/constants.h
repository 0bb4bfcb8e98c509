#pragma once

#include <cstddef>  // for size_t

namespace liverun {

// Time limits
constexpr int DEFAULT_TIMEOUT_SECONDS = 120;                      // 2 minutes
constexpr int MIN_TIMEOUT_SECONDS = 1;
constexpr int MAX_TIMEOUT_SECONDS = 300;                          // 5 minutes

// Supervisor cadence
constexpr int MAILBOX_WAIT_MS = 100;                              // Bounded wait for input
constexpr int LOOP_YIELD_MS = 50;                                 // Pause between liveness checks
constexpr int PUMP_DRAIN_MS = 2000;                               // Flush budget after exit

// Resource limits for the local backend
constexpr size_t DEFAULT_MEMORY_LIMIT_BYTES = 512 * 1024 * 1024;  // 512MB
constexpr size_t MAX_FILE_SIZE_BYTES = 100 * 1024 * 1024;         // 100MB per file written
constexpr int MAX_OPEN_FILES = 256;                               // Max file descriptors

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                         // Read buffer size
constexpr size_t MAX_LINE_BYTES = 64 * 1024;                      // Longer lines are split
constexpr size_t INITIAL_HTTP_BUFFER = 8192;                      // Initial HTTP buffer
constexpr size_t MAX_REQUEST_SIZE = 10 * 1024 * 1024;             // 10MB max request

// Workspace layout
constexpr const char* WORKSPACE_PREFIX = "liverun_exec_";
constexpr const char* SOURCE_FILENAME = "program.py";
constexpr const char* CONTAINER_MOUNT_POINT = "/workspace";

// Network
constexpr int DEFAULT_PORT = 5000;                                // Default server port
constexpr int LISTEN_BACKLOG = 10;                                // Socket listen backlog

} // namespace liverun
