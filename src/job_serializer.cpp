#include "job_serializer.h"
#include "cancellation.h"
#include "execution_pipeline.h"
#include "vm_controller.h"

#include <iostream>
#include <vector>

namespace malsand {

JobSerializer::JobSerializer(VmController& controller, ExecutionPipeline& pipeline,
                             SerializerOptions options)
    : controller_(controller), pipeline_(pipeline), options_(options) {}

JobSerializer::~JobSerializer() {
    stop();
}

void JobSerializer::start() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (worker_.joinable()) return;
    stopping_ = false;
    worker_ = std::thread(&JobSerializer::worker_loop, this);
}

void JobSerializer::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
        if (active_token_) active_token_->cancel();
    }
    queue_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    drain_queue(ErrorKind::CANCELLED, "Engine shutting down");
}

void JobSerializer::enqueue(std::shared_ptr<AnalysisJob> job) {
    bool rejected = false;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            rejected = true;
        } else {
            queue_.push_back(job);
        }
    }
    if (rejected) {
        job->fail(ErrorKind::CANCELLED, "Engine shutting down");
        return;
    }
    queue_cv_.notify_one();
}

bool JobSerializer::cancel(const std::string& job_id) {
    std::shared_ptr<AnalysisJob> dequeued;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        for (auto it = queue_.begin(); it != queue_.end(); ++it) {
            if ((*it)->id() == job_id) {
                dequeued = *it;
                queue_.erase(it);
                break;
            }
        }
        if (!dequeued) {
            if (!active_ || active_->id() != job_id) return false;
            if (active_token_) {
                std::cout << "[Serializer] Cancelling active job " << job_id << std::endl;
                active_token_->cancel();
                return true;
            }
            // Claimed by the worker but not yet in the VM (admission lock or VM start)
            active_cancelled_ = true;
            dequeued = active_;
        }
    }
    std::cout << "[Serializer] Removed queued job " << job_id << std::endl;
    dequeued->fail(ErrorKind::CANCELLED, "Cancelled while queued");
    return true;
}

void JobSerializer::run_exclusive(const std::function<void()>& operation) {
    std::lock_guard<std::mutex> admission(admission_mutex_);
    operation();
}

size_t JobSerializer::queue_depth() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

std::optional<std::string> JobSerializer::active_job() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!active_) return std::nullopt;
    return active_->id();
}

void JobSerializer::worker_loop() {
    while (true) {
        std::shared_ptr<AnalysisJob> job;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_) break;
            job = queue_.front();
            queue_.pop_front();
            active_ = job;
            active_cancelled_ = false;
        }

        std::lock_guard<std::mutex> admission(admission_mutex_);
        process(job);

        std::lock_guard<std::mutex> lock(queue_mutex_);
        active_.reset();
        active_token_.reset();
        active_cancelled_ = false;
    }
}

bool JobSerializer::claim_cancelled(const AnalysisJob& job) const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return active_cancelled_ || job.finished();
}

void JobSerializer::process(const std::shared_ptr<AnalysisJob>& job) {
    if (claim_cancelled(*job)) return;

    if (controller_.state() == VMState::STOPPED && options_.auto_start_vm) {
        try {
            controller_.start();
        } catch (const EngineError& e) {
            job->fail(e.kind(), e.what());
            drain_queue(e.kind(), std::string("VM unavailable: ") + e.what());
            return;
        }
        if (claim_cancelled(*job)) {
            std::cout << "[Serializer] Job " << job->id() << " cancelled during VM start" << std::endl;
            return;
        }
    }

    if (controller_.state() == VMState::FAULTED) {
        std::string reason = "VM is faulted: " + controller_.status().last_error;
        job->fail(ErrorKind::VM_NOT_READY, reason);
        drain_queue(ErrorKind::VM_NOT_READY, reason);
        return;
    }

    try {
        controller_.acquire();
    } catch (const EngineError& e) {
        job->fail(e.kind(), e.what());
        return;
    }

    auto token = std::make_shared<CancellationToken>(
        CancellationToken::Clock::now() + options_.job_timeout);
    bool cancelled_before_entry = false;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        // From here on cancel() goes through the token
        cancelled_before_entry = active_cancelled_ || job->finished();
        if (!cancelled_before_entry) {
            active_token_ = token;
            if (stopping_) token->cancel();
        }
    }
    if (cancelled_before_entry) {
        std::cout << "[Serializer] Job " << job->id() << " cancelled before entering the VM" << std::endl;
        try {
            controller_.release(true);
        } catch (const EngineError& e) {
            std::cerr << "[Serializer] " << e.what() << ", no further jobs admitted" << std::endl;
            drain_queue(e.kind(), std::string("VM unavailable: ") + e.what());
        }
        return;
    }
    std::cout << "[Serializer] Job " << job->id() << " entered the VM" << std::endl;

    std::string infrastructure_failure;
    try {
        pipeline_.execute(*job, *token);
    } catch (const EngineError& e) {
        std::cerr << "[Serializer] Job " << job->id() << " failed: " << e.what() << std::endl;
        job->fail(e.kind(), e.what());
        if (is_infrastructure_error(e.kind())) {
            infrastructure_failure = e.what();
        }
    } catch (const std::exception& e) {
        // Host-side staging errors (filesystem)
        std::cerr << "[Serializer] Job " << job->id() << " host error: " << e.what() << std::endl;
        job->fail(ErrorKind::TRANSFER_ERROR, std::string("Host error: ") + e.what());
    }
    if (!job->finished()) {
        job->fail(ErrorKind::GUEST_TOOL_INVOCATION_FAILED, "Pipeline ended without a result");
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        active_.reset();
        active_token_.reset();
    }

    // Isolation: the guest goes back to the snapshot whatever happened
    try {
        controller_.release(true);
    } catch (const EngineError& e) {
        std::cerr << "[Serializer] " << e.what() << ", no further jobs admitted" << std::endl;
        drain_queue(e.kind(), std::string("VM unavailable: ") + e.what());
        return;
    }

    if (!infrastructure_failure.empty()) {
        controller_.fault(infrastructure_failure);
        drain_queue(ErrorKind::VM_NOT_READY, "VM unavailable: " + infrastructure_failure);
    }
}

void JobSerializer::drain_queue(ErrorKind kind, const std::string& reason) {
    std::vector<std::shared_ptr<AnalysisJob>> drained;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        drained.assign(queue_.begin(), queue_.end());
        queue_.clear();
    }
    for (const auto& job : drained) {
        job->fail(kind, reason);
    }
}

} // namespace malsand
