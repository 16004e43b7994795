#pragma once

#include "engine_errors.h"
#include "file_utils.h"
#include "language_detector.h"
#include "result_classifier.h"
#include "trace_parser.h"

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace malsand {

enum class JobStatus {
    QUEUED,
    TRANSFERRING,
    COMPILING,
    RUNNING,
    TRACING,
    COLLECTING,
    DONE,
    ERROR
};

std::string job_status_to_string(JobStatus status);

// Transferring..Collecting: the job occupies the VM
bool is_active_status(JobStatus status);
bool is_terminal_status(JobStatus status);

// Structured outcome of a finished job
struct AnalysisResult {
    ExecutionResult execution;
    ClassifiedResult classification;
    TraceSummary behavior;
    std::vector<ArtifactInfo> artifacts;
    double duration_seconds = 0.0;
};

// Consistent copy of a job for pollers
struct JobSnapshot {
    std::string id;
    std::string original_filename;
    std::string language;                   // Empty if undetected
    std::string sha256;
    std::chrono::system_clock::time_point submitted_at;
    JobStatus status = JobStatus::QUEUED;
    int progress = 0;
    std::string output_text;
    std::optional<ErrorKind> error_kind;
    std::string error_reason;
    std::optional<AnalysisResult> result;
    std::vector<JobStatus> history;         // Every status entered, in order
};

class AnalysisJob {
public:
    using Listener = std::function<void(const std::string& job_id, JobStatus status)>;

    AnalysisJob(std::string id, std::string host_path, std::string original_filename,
                std::optional<LanguageProfile> profile, std::string results_dir,
                std::string sha256);

    const std::string& id() const { return id_; }
    const std::string& host_path() const { return host_path_; }
    const std::string& original_filename() const { return original_filename_; }
    const std::optional<LanguageProfile>& profile() const { return profile_; }
    const std::string& results_dir() const { return results_dir_; }

    void set_listener(Listener listener);

    // Enter a stage. Progress only ever grows.
    void advance(JobStatus status, int progress, const std::string& line);

    // Progress line without a stage change
    void log(int progress, const std::string& line);

    void append_output(const std::string& text);

    // Terminal transitions; ignored once the job is terminal
    void complete(AnalysisResult result);
    void fail(ErrorKind kind, const std::string& reason);

    JobStatus status() const;
    bool finished() const;
    std::chrono::steady_clock::time_point finished_at() const;
    JobSnapshot snapshot() const;

private:
    void set_status(JobStatus status, std::unique_lock<std::mutex>& lock);
    void append_line(int progress, const std::string& line);

    const std::string id_;
    const std::string host_path_;
    const std::string original_filename_;
    const std::optional<LanguageProfile> profile_;
    const std::string results_dir_;
    const std::string sha256_;
    const std::chrono::system_clock::time_point submitted_at_;

    mutable std::mutex mutex_;
    JobStatus status_ = JobStatus::QUEUED;
    int progress_ = 0;
    std::string output_text_;
    std::optional<ErrorKind> error_kind_;
    std::string error_reason_;
    std::optional<AnalysisResult> result_;
    std::vector<JobStatus> history_;
    std::chrono::steady_clock::time_point finished_at_;
    Listener listener_;
};

} // namespace malsand
