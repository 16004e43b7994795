#pragma once

#include "analysis_job.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace malsand {

class CancellationToken;
class ExecutionPipeline;
class VmController;

struct SerializerOptions {
    std::chrono::seconds job_timeout{600};
    bool auto_start_vm = true;          // Power on a Stopped VM for the first job
};

// FIFO admission control in front of the single VM.
//
// One worker thread takes jobs in submission order. While a job occupies
// the VM the worker holds the admission lock; administrative operations
// take the same lock through run_exclusive(). Every job handed to
// enqueue() reaches Done or Error.
class JobSerializer {
public:
    JobSerializer(VmController& controller, ExecutionPipeline& pipeline,
                  SerializerOptions options = SerializerOptions{});
    ~JobSerializer();

    JobSerializer(const JobSerializer&) = delete;
    JobSerializer& operator=(const JobSerializer&) = delete;

    void start();

    // Cancels the active job, fails everything still queued, joins the worker
    void stop();

    void enqueue(std::shared_ptr<AnalysisJob> job);

    // Queued: removed and failed immediately. Active: the pipeline is
    // stopped and the VM still reverted. False if the job is neither.
    bool cancel(const std::string& job_id);

    // Blocks until no job occupies the VM, then runs operation
    void run_exclusive(const std::function<void()>& operation);

    size_t queue_depth() const;
    std::optional<std::string> active_job() const;

private:
    void worker_loop();
    void process(const std::shared_ptr<AnalysisJob>& job);
    bool claim_cancelled(const AnalysisJob& job) const;
    void drain_queue(ErrorKind kind, const std::string& reason);

    VmController& controller_;
    ExecutionPipeline& pipeline_;
    const SerializerOptions options_;

    std::mutex admission_mutex_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::shared_ptr<AnalysisJob>> queue_;
    std::shared_ptr<AnalysisJob> active_;
    std::shared_ptr<CancellationToken> active_token_;
    bool active_cancelled_ = false;     // Cancelled after the worker claimed it, before VM entry
    bool stopping_ = false;

    std::thread worker_;
};

} // namespace malsand
