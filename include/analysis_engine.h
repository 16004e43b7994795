#pragma once

#include "analysis_job.h"
#include "engine_config.h"
#include "execution_pipeline.h"
#include "guest_process_driver.h"
#include "hypervisor.h"
#include "job_serializer.h"
#include "transfer_gateway.h"
#include "vm_controller.h"

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace malsand {

// Entry point for callers (HTTP layer, CLI). Owns the VM handle, its
// controller, the pipeline and the serializer; nothing here is global.
class AnalysisEngine {
public:
    AnalysisEngine(EngineConfig config, HypervisorControl& hypervisor);
    ~AnalysisEngine();

    AnalysisEngine(const AnalysisEngine&) = delete;
    AnalysisEngine& operator=(const AnalysisEngine&) = delete;

    // Start / stop the job worker. The VM itself is started on demand
    // or through start_vm().
    void start();
    void shutdown();

    // Stages the artifact on the host and queues it. Never blocks on the
    // VM. Unsupported files end in Error right away, without a transfer.
    // Throws std::invalid_argument for empty or oversized artifacts.
    std::string submit(const std::string& filename, const std::string& content,
                       const std::string& declared_language = "");
    std::string submit_file(const std::string& host_path,
                            const std::string& declared_language = "");

    std::optional<JobSnapshot> status(const std::string& job_id) const;

    // Finished-analysis record; nullopt unless the job is Done
    std::optional<Json::Value> report(const std::string& job_id) const;

    std::optional<std::vector<ArtifactInfo>> list_result_artifacts(const std::string& job_id) const;
    std::optional<std::vector<uint8_t>> fetch_artifact(const std::string& job_id,
                                                       const std::string& filename) const;

    bool cancel(const std::string& job_id);

    // Blocks until the job is terminal or the timeout elapses
    bool wait_for(const std::string& job_id, std::chrono::milliseconds timeout) const;

    // Administrative VM control; serialized with jobs
    VMState start_vm();
    void stop_vm();
    VMState restart_vm();
    VMStatus vm_status() const;

    // Forget finished jobs older than max_age and delete their host files
    size_t purge_finished(std::chrono::minutes max_age);

    size_t queue_depth() const { return serializer_.queue_depth(); }
    std::optional<std::string> active_job() const { return serializer_.active_job(); }
    const EngineConfig& config() const { return config_; }
    const VmController& controller() const { return controller_; }

    // Observer for every job status change (monitoring, tests)
    void set_job_listener(AnalysisJob::Listener listener);

private:
    std::shared_ptr<AnalysisJob> find(const std::string& job_id) const;
    std::string generate_job_id() const;

    const EngineConfig config_;
    VmController controller_;
    TransferGateway gateway_;
    GuestProcessDriver driver_;
    ExecutionPipeline pipeline_;
    JobSerializer serializer_;

    mutable std::mutex jobs_mutex_;
    std::map<std::string, std::shared_ptr<AnalysisJob>> jobs_;
    AnalysisJob::Listener listener_;
};

} // namespace malsand
