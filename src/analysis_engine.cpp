#include "analysis_engine.h"
#include "analysis_report.h"
#include "file_utils.h"
#include "guest_path.h"

#include <openssl/rand.h>

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace fs = std::filesystem;

namespace malsand {

AnalysisEngine::AnalysisEngine(EngineConfig config, HypervisorControl& hypervisor)
    : config_(std::move(config)),
      controller_(hypervisor, config_.vm_handle(), config_.lifecycle_options()),
      gateway_(hypervisor, controller_),
      driver_(hypervisor, controller_),
      pipeline_(gateway_, driver_, controller_, config_.pipeline_options()),
      serializer_(controller_, pipeline_, config_.serializer_options()) {}

AnalysisEngine::~AnalysisEngine() {
    shutdown();
}

void AnalysisEngine::start() {
    fs::create_directories(config_.host_work_dir);
    serializer_.start();
}

void AnalysisEngine::shutdown() {
    serializer_.stop();
}

void AnalysisEngine::set_job_listener(AnalysisJob::Listener listener) {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    listener_ = std::move(listener);
}

std::string AnalysisEngine::generate_job_id() const {
    unsigned char bytes[8];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("Failed to generate job id");
    }
    return "job_" + FileUtils::bytes_to_hex(bytes, sizeof(bytes));
}

std::string AnalysisEngine::submit(const std::string& filename, const std::string& content,
                                   const std::string& declared_language) {
    if (content.empty()) {
        throw std::invalid_argument("Empty artifact");
    }
    if (content.size() > config_.max_artifact_size) {
        throw std::invalid_argument("Artifact exceeds " +
                                    FileUtils::format_file_size(config_.max_artifact_size));
    }

    std::string original = filename.empty() ? "sample" : guest_path::basename(filename);
    std::string job_id = generate_job_id();
    fs::path job_root = fs::path(config_.host_work_dir) / job_id;
    std::string host_path = (job_root / "input" / guest_path::sanitize_filename(original)).string();
    FileUtils::write_file(host_path, content);

    std::optional<LanguageProfile> profile;
    std::string detection_note;
    if (!declared_language.empty()) {
        profile = LanguageDetector::for_name(declared_language);
        if (!profile) detection_note = "Unknown language '" + declared_language + "'";
    } else {
        profile = LanguageDetector::detect(original, content.substr(0, 512));
        if (!profile) detection_note = "Unsupported file type: " + original;
    }

    auto job = std::make_shared<AnalysisJob>(job_id, host_path, original, profile,
                                             (job_root / "results").string(),
                                             FileUtils::sha256_string(content));
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        if (listener_) job->set_listener(listener_);
        jobs_[job_id] = job;
    }

    std::cout << "[Engine] Submitted " << job_id << " (" << original << ", "
              << FileUtils::format_file_size(content.size()) << ")" << std::endl;

    if (!profile) {
        job->fail(ErrorKind::UNSUPPORTED_FILE_TYPE, detection_note);
        return job_id;
    }
    job->log(5, "Detected " + profile->name + " (" + profile->file_type + ")" +
                (profile->detected_by_content ? " from content" : ""));

    VMStatus vm = controller_.status();
    if (vm.state == VMState::FAULTED) {
        job->fail(ErrorKind::VM_NOT_READY, "Engine unavailable: " + vm.last_error);
        return job_id;
    }

    serializer_.enqueue(job);
    return job_id;
}

std::string AnalysisEngine::submit_file(const std::string& host_path,
                                        const std::string& declared_language) {
    return submit(fs::path(host_path).filename().string(), FileUtils::read_text_file(host_path),
                  declared_language);
}

std::shared_ptr<AnalysisJob> AnalysisEngine::find(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    auto it = jobs_.find(job_id);
    return it == jobs_.end() ? nullptr : it->second;
}

std::optional<JobSnapshot> AnalysisEngine::status(const std::string& job_id) const {
    auto job = find(job_id);
    if (!job) return std::nullopt;
    return job->snapshot();
}

std::optional<Json::Value> AnalysisEngine::report(const std::string& job_id) const {
    auto job = find(job_id);
    if (!job) return std::nullopt;
    JobSnapshot snapshot = job->snapshot();
    if (snapshot.status != JobStatus::DONE || !snapshot.result) return std::nullopt;
    return AnalysisReport::build(snapshot);
}

std::optional<std::vector<ArtifactInfo>> AnalysisEngine::list_result_artifacts(const std::string& job_id) const {
    auto job = find(job_id);
    if (!job) return std::nullopt;
    if (!job->finished()) return std::vector<ArtifactInfo>{};
    return FileUtils::list_artifacts(job->results_dir());
}

std::optional<std::vector<uint8_t>> AnalysisEngine::fetch_artifact(const std::string& job_id,
                                                                   const std::string& filename) const {
    auto job = find(job_id);
    if (!job || !job->finished()) return std::nullopt;
    if (filename.empty() || filename.find('/') != std::string::npos ||
        filename.find('\\') != std::string::npos || filename == "." || filename == "..") {
        return std::nullopt;
    }
    fs::path candidate = fs::path(job->results_dir()) / filename;
    if (!FileUtils::is_within(job->results_dir(), candidate.string()) ||
        !fs::is_regular_file(candidate)) {
        return std::nullopt;
    }
    return FileUtils::read_file(candidate.string());
}

bool AnalysisEngine::cancel(const std::string& job_id) {
    auto job = find(job_id);
    if (!job || job->finished()) return false;
    return serializer_.cancel(job_id);
}

bool AnalysisEngine::wait_for(const std::string& job_id, std::chrono::milliseconds timeout) const {
    auto job = find(job_id);
    if (!job) return false;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!job->finished()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return true;
}

VMState AnalysisEngine::start_vm() {
    VMState state = VMState::STOPPED;
    serializer_.run_exclusive([this, &state]() { state = controller_.start(); });
    return state;
}

void AnalysisEngine::stop_vm() {
    serializer_.run_exclusive([this]() { controller_.stop(); });
}

VMState AnalysisEngine::restart_vm() {
    VMState state = VMState::STOPPED;
    serializer_.run_exclusive([this, &state]() { state = controller_.restart(); });
    return state;
}

VMStatus AnalysisEngine::vm_status() const {
    return controller_.status();
}

size_t AnalysisEngine::purge_finished(std::chrono::minutes max_age) {
    auto cutoff = std::chrono::steady_clock::now() - max_age;
    std::vector<std::shared_ptr<AnalysisJob>> purged;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        for (auto it = jobs_.begin(); it != jobs_.end();) {
            if (it->second->finished() && it->second->finished_at() <= cutoff) {
                purged.push_back(it->second);
                it = jobs_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& job : purged) {
        std::error_code ec;
        fs::remove_all(fs::path(config_.host_work_dir) / job->id(), ec);
        if (ec) {
            std::cerr << "[Engine] Could not remove files of " << job->id() << ": "
                      << ec.message() << std::endl;
        }
    }
    if (!purged.empty()) {
        std::cout << "[Engine] Purged " << purged.size() << " finished job(s)" << std::endl;
    }
    return purged.size();
}

} // namespace malsand
