#include "analysis_job.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace malsand {

std::string job_status_to_string(JobStatus status) {
    switch (status) {
        case JobStatus::QUEUED: return "queued";
        case JobStatus::TRANSFERRING: return "transferring";
        case JobStatus::COMPILING: return "compiling";
        case JobStatus::RUNNING: return "running";
        case JobStatus::TRACING: return "tracing";
        case JobStatus::COLLECTING: return "collecting";
        case JobStatus::DONE: return "done";
        case JobStatus::ERROR: return "error";
    }
    return "unknown";
}

bool is_active_status(JobStatus status) {
    return status == JobStatus::TRANSFERRING || status == JobStatus::COMPILING ||
           status == JobStatus::RUNNING || status == JobStatus::TRACING ||
           status == JobStatus::COLLECTING;
}

bool is_terminal_status(JobStatus status) {
    return status == JobStatus::DONE || status == JobStatus::ERROR;
}

AnalysisJob::AnalysisJob(std::string id, std::string host_path, std::string original_filename,
                         std::optional<LanguageProfile> profile, std::string results_dir,
                         std::string sha256)
    : id_(std::move(id)),
      host_path_(std::move(host_path)),
      original_filename_(std::move(original_filename)),
      profile_(std::move(profile)),
      results_dir_(std::move(results_dir)),
      sha256_(std::move(sha256)),
      submitted_at_(std::chrono::system_clock::now()) {
    history_.push_back(JobStatus::QUEUED);
}

void AnalysisJob::set_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

void AnalysisJob::set_status(JobStatus status, std::unique_lock<std::mutex>& lock) {
    if (status_ == status) return;
    status_ = status;
    history_.push_back(status);
    if (is_terminal_status(status)) {
        finished_at_ = std::chrono::steady_clock::now();
    }
    Listener listener = listener_;
    lock.unlock();
    if (listener) listener(id_, status);
    lock.lock();
}

void AnalysisJob::append_line(int progress, const std::string& line) {
    progress_ = std::max(progress_, std::min(progress, 100));
    if (line.empty()) return;
    std::ostringstream formatted;
    formatted << "[" << std::setw(3) << progress_ << "%] " << line << "\n";
    output_text_ += formatted.str();
}

void AnalysisJob::advance(JobStatus status, int progress, const std::string& line) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (is_terminal_status(status_)) return;
    append_line(progress, line);
    set_status(status, lock);
}

void AnalysisJob::log(int progress, const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (is_terminal_status(status_)) return;
    append_line(progress, line);
}

void AnalysisJob::append_output(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    output_text_ += text;
    if (!text.empty() && text.back() != '\n') output_text_ += "\n";
}

void AnalysisJob::complete(AnalysisResult result) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (is_terminal_status(status_)) return;
    append_line(100, "Analysis complete");
    result_ = std::move(result);
    set_status(JobStatus::DONE, lock);
}

void AnalysisJob::fail(ErrorKind kind, const std::string& reason) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (is_terminal_status(status_)) return;
    error_kind_ = kind;
    error_reason_ = reason.empty() ? error_kind_to_string(kind) : reason;
    output_text_ += "Error (" + error_kind_to_string(kind) + "): " + error_reason_ + "\n";
    set_status(JobStatus::ERROR, lock);
}

JobStatus AnalysisJob::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

bool AnalysisJob::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_terminal_status(status_);
}

std::chrono::steady_clock::time_point AnalysisJob::finished_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_at_;
}

JobSnapshot AnalysisJob::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    JobSnapshot snap;
    snap.id = id_;
    snap.original_filename = original_filename_;
    snap.language = profile_ ? profile_->name : "";
    snap.sha256 = sha256_;
    snap.submitted_at = submitted_at_;
    snap.status = status_;
    snap.progress = progress_;
    snap.output_text = output_text_;
    snap.error_kind = error_kind_;
    snap.error_reason = error_reason_;
    snap.result = result_;
    snap.history = history_;
    return snap;
}

} // namespace malsand
