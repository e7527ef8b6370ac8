#pragma once

#include <cstddef>  // for size_t

namespace codepair {

// Input limits
constexpr size_t MAX_CODE_SIZE = 50000;                          // characters
constexpr size_t MAX_OUTPUT_SIZE = 1024 * 1024;                  // 1MB per stream
constexpr size_t MAX_REQUEST_SIZE = 1024 * 1024;                 // 1MB max request
constexpr size_t MAX_WS_FRAME_SIZE = 64 * 1024;                  // 64KB per event

// Sandbox defaults (overridden per language)
constexpr size_t DEFAULT_MEMORY_LIMIT_BYTES = 256 * 1024 * 1024; // 256MB
constexpr size_t DEFAULT_SCRATCH_BYTES = 64 * 1024 * 1024;       // 64MB tmpfs
constexpr size_t MAX_FILE_SIZE_BYTES = 32 * 1024 * 1024;         // 32MB per file
constexpr int DEFAULT_TIMEOUT_MS = 5000;                          // interpreted languages
constexpr int COMPILED_TIMEOUT_MS = 15000;                        // compile + run
constexpr int DEFAULT_CPU_SECONDS = 10;                           // RLIMIT_CPU
constexpr int DEFAULT_NICE = 10;                                  // CPU share
constexpr int MAX_PROCESSES_PER_SANDBOX = 64;                     // threads + processes
constexpr int MAX_OPEN_FILES = 256;                               // file descriptors

// Execution concurrency
constexpr int DEFAULT_MAX_CONCURRENT_EXECUTIONS = 4;
constexpr int DEFAULT_QUEUE_TIMEOUT_MS = 10000;

// Remote execution gateway
constexpr int GATEWAY_MAX_ATTEMPTS = 3;
constexpr int GATEWAY_RETRY_DELAY_MS = 300;
constexpr int GATEWAY_RUN_TIMEOUT_MS = 10000;                     // server-side hint
constexpr int GATEWAY_HTTP_TIMEOUT_MS = 30000;

// Cross-node bus
constexpr int BUS_RECONNECT_DELAY_MS = 1000;                     // between resubscribe attempts

// Sessions
constexpr int DEFAULT_SESSION_TTL_HOURS = 24;

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                        // Read buffer size
constexpr size_t INITIAL_HTTP_BUFFER = 8192;                     // Initial HTTP buffer

// Network
constexpr int DEFAULT_PORT = 3000;                               // Default server port
constexpr int LISTEN_BACKLOG = 64;                               // Socket listen backlog

} // namespace codepair
