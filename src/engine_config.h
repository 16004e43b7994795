#pragma once

#include "constants.h"
#include "execution_pipeline.h"
#include "job_serializer.h"
#include "vm_controller.h"
#include "vmrun_hypervisor.h"

#include <json/json.h>

#include <string>

namespace malsand {

// Engine settings. Defaults come from constants.h; a JSON file, then
// command-line flags, then the environment override them.
struct EngineConfig {
    // VM
    std::string vmx_path;
    std::string guest_user = DEFAULT_GUEST_USER;
    std::string guest_password = DEFAULT_GUEST_USER;
    std::string base_snapshot = DEFAULT_BASE_SNAPSHOT;
    std::string guest_work_dir = DEFAULT_GUEST_WORK_DIR;
    std::string vmrun_path = DEFAULT_VMRUN_PATH;
    std::string vmrun_host_type = DEFAULT_VMRUN_HOST_TYPE;
    bool headless = true;
    bool power_on_after_revert = true;
    bool auto_start_vm = true;
    int readiness_attempts = DEFAULT_READINESS_ATTEMPTS;
    int readiness_interval_ms = DEFAULT_READINESS_INTERVAL_MS;

    // Timeouts (seconds)
    int command_timeout = DEFAULT_TIMEOUT_SECONDS;
    int start_timeout = DEFAULT_START_TIMEOUT_SECONDS;
    int stop_grace = DEFAULT_STOP_GRACE_SECONDS;
    int compile_timeout = DEFAULT_COMPILE_TIMEOUT_SECONDS;
    int execution_timeout = DEFAULT_EXECUTION_TIMEOUT_SECONDS;
    int job_timeout = DEFAULT_JOB_TIMEOUT_SECONDS;

    // Tracing
    bool enable_trace = true;
    std::string tracer_path = DEFAULT_TRACER_PATH;

    // Host side
    std::string host_work_dir = DEFAULT_HOST_WORK_DIR;
    int port = DEFAULT_PORT;
    size_t max_artifact_size = MAX_ARTIFACT_SIZE;
    int job_retention_minutes = JOB_RETENTION_MINUTES;

    // Throws std::invalid_argument on malformed JSON or wrong value types
    static EngineConfig from_json(const std::string& text);
    static EngineConfig load_file(const std::string& path);

    // MALSAND_GUEST_PASSWORD replaces the configured password
    void apply_environment();

    // Throws std::invalid_argument naming the first bad setting
    void validate() const;

    // Password is redacted
    Json::Value to_json() const;

    VMHandle vm_handle() const;
    LifecycleOptions lifecycle_options() const;
    VmrunOptions vmrun_options() const;
    PipelineOptions pipeline_options() const;
    SerializerOptions serializer_options() const;
};

} // namespace malsand
