#pragma once

#include "analysis_job.h"

#include <chrono>
#include <string>

namespace malsand {

class CancellationToken;
class GuestProcessDriver;
class TransferGateway;
class VmController;

struct PipelineOptions {
    std::chrono::seconds compile_timeout{120};
    std::chrono::seconds execution_timeout{60};
    std::chrono::seconds probe_timeout{30};
    bool enable_trace = true;
    std::string tracer_path = "/usr/bin/strace";
};

// Drives one job through Transferring -> (Compiling) -> Running ->
// (Tracing) -> Collecting -> Done inside an already acquired VM session.
//
// Outcomes that belong to the sample (compile failure, timeout, a crash)
// end the job here. Transfer and hypervisor failures are thrown to the
// caller, which also owns the snapshot revert.
class ExecutionPipeline {
public:
    ExecutionPipeline(TransferGateway& gateway, GuestProcessDriver& driver,
                      const VmController& controller, PipelineOptions options);

    void execute(AnalysisJob& job, const CancellationToken& token);

    // Guest directory that holds everything of one job
    std::string job_directory(const std::string& job_id) const;

    const PipelineOptions& options() const { return options_; }

private:
    // Ends the job if it was cancelled or ran out of time
    bool stop_requested(AnalysisJob& job, const CancellationToken& token, const std::string& stage);
    void note_trace_unavailable(AnalysisJob& job, int progress, const std::string& why);

    // Probes for the tracer first; Tracing is only entered when it exists
    TraceOutcome trace(AnalysisJob& job, const CancellationToken& token,
                       const std::string& job_dir, const ToolInvocation& run,
                       std::string& message);

    TransferGateway& gateway_;
    GuestProcessDriver& driver_;
    const VmController& controller_;
    const PipelineOptions options_;
};

} // namespace malsand
