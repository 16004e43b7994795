#pragma once

#include <cstddef>  // for size_t

namespace malsand {

// VM defaults
constexpr const char* DEFAULT_GUEST_USER = "kali";
constexpr const char* DEFAULT_BASE_SNAPSHOT = "CleanSnapshot1";
constexpr const char* DEFAULT_GUEST_WORK_DIR = "/home/kali/SandboxAnalysis";
constexpr const char* DEFAULT_HOST_WORK_DIR = "/tmp/malsand_jobs";
constexpr const char* DEFAULT_VMRUN_PATH = "vmrun";
constexpr const char* DEFAULT_VMRUN_HOST_TYPE = "ws";           // Workstation
constexpr const char* DEFAULT_TRACER_PATH = "/usr/bin/strace";

// Time limits
constexpr int DEFAULT_TIMEOUT_SECONDS = 100;                     // Per vmrun call
constexpr int DEFAULT_COMPILE_TIMEOUT_SECONDS = 120;
constexpr int DEFAULT_EXECUTION_TIMEOUT_SECONDS = 60;
constexpr int DEFAULT_JOB_TIMEOUT_SECONDS = 600;                 // Whole pipeline
constexpr int DEFAULT_START_TIMEOUT_SECONDS = 300;
constexpr int DEFAULT_STOP_GRACE_SECONDS = 60;
constexpr int DEFAULT_READINESS_ATTEMPTS = 30;
constexpr int DEFAULT_READINESS_INTERVAL_MS = 2000;
constexpr int KILL_GRACE_MS = 2000;                              // SIGTERM -> SIGKILL
constexpr int JOB_RETENTION_MINUTES = 60;                        // Purge finished jobs

// vmrun reports "guest program exited non-zero" with this code
constexpr int VMRUN_GUEST_PROGRAM_FAILED = 2;

// Size limits
constexpr size_t MAX_ARTIFACT_SIZE = 100 * 1024 * 1024;          // 100MB upload
constexpr size_t MAX_CAPTURED_OUTPUT = 10 * 1024 * 1024;         // Per stream
constexpr size_t MAX_REQUEST_SIZE = MAX_ARTIFACT_SIZE + 64 * 1024;
constexpr size_t MAX_REPORTED_OUTPUT = 64 * 1024;                // Output text excerpt
constexpr size_t MAX_PULLED_FILE_SIZE = 50 * 1024 * 1024;        // Per file left in the guest
constexpr size_t MAX_PULLED_FILES = 64;
constexpr size_t MAX_PULLED_TOTAL_SIZE = 200 * 1024 * 1024;      // Per job

// Guest layout
constexpr const char* TRACE_LOG_NAME = "syscall_trace.log";
constexpr const char* COMPILED_SUFFIX = "_compiled";
constexpr const char* CAPTURE_PREFIX = ".malsand_capture_";

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;
constexpr size_t INITIAL_HTTP_BUFFER = 8192;

// Network
constexpr int DEFAULT_PORT = 8443;
constexpr int LISTEN_BACKLOG = 10;

} // namespace malsand
