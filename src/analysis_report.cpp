#include "analysis_report.h"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace malsand {

namespace {

std::string iso_time(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

} // namespace

Json::Value AnalysisReport::build(const JobSnapshot& snapshot) {
    if (!snapshot.result) {
        throw std::logic_error("Job " + snapshot.id + " has no result yet");
    }
    const AnalysisResult& result = *snapshot.result;
    const ClassifiedResult& fields = result.classification;

    Json::Value report;
    report["job_id"] = snapshot.id;
    report["filename"] = snapshot.original_filename;
    report["sha256"] = snapshot.sha256;
    report["language"] = snapshot.language;
    report["submitted_at"] = iso_time(snapshot.submitted_at);
    report["classification"] = ResultClassifier::label_to_string(fields.verdict.label);
    report["confidence"] = fields.verdict.confidence;
    report["malicious"] = (fields.verdict.label == VerdictLabel::SUSPICIOUS);
    report["summary"] = fields.verdict.basis;
    report["duration_seconds"] = result.duration_seconds;

    Json::Value files(Json::arrayValue);
    for (const auto& op : result.behavior.file_operations) {
        Json::Value entry;
        entry["action"] = op.action;
        entry["path"] = op.path;
        entry["timestamp"] = op.timestamp;
        files.append(entry);
    }
    report["file_operations"] = files;

    Json::Value network(Json::arrayValue);
    for (const auto& conn : result.behavior.network_connections) {
        Json::Value entry;
        entry["protocol"] = conn.protocol;
        entry["destination_ip"] = conn.destination_ip;
        entry["port"] = conn.port;
        entry["timestamp"] = conn.timestamp;
        network.append(entry);
    }
    report["network_connections"] = network;

    Json::Value processes(Json::arrayValue);
    for (const auto& proc : result.behavior.process_creations) {
        Json::Value entry;
        entry["process_name"] = proc.process_name;
        entry["arguments"] = proc.arguments;
        entry["timestamp"] = proc.timestamp;
        processes.append(entry);
    }
    report["process_creations"] = processes;

    Json::Value& execution = report["execution"];
    execution["file_type"] = fields.file_type;
    execution["interpreter"] = fields.interpreter;
    execution["needs_compilation"] = fields.needs_compilation;
    execution["execution_result"] = fields.execution_result;
    execution["exit_code"] = result.execution.execution.exit_code;
    execution["trace_result"] = fields.trace_result;
    execution["trace_outcome"] = ResultClassifier::trace_outcome_to_string(result.execution.trace);
    execution["syscall_count"] = static_cast<Json::UInt64>(result.behavior.syscall_count);
    execution["stdout"] = result.execution.stdout_output;
    execution["stderr"] = result.execution.stderr_output;

    report["artifacts"] = artifacts(result.artifacts);
    return report;
}

Json::Value AnalysisReport::status(const JobSnapshot& snapshot) {
    Json::Value json;
    json["job_id"] = snapshot.id;
    json["filename"] = snapshot.original_filename;
    json["status"] = job_status_to_string(snapshot.status);
    json["progress"] = snapshot.progress;
    json["output"] = snapshot.output_text;
    json["submitted_at"] = iso_time(snapshot.submitted_at);
    if (!snapshot.language.empty()) {
        json["language"] = snapshot.language;
    }
    if (snapshot.error_kind) {
        json["error"]["kind"] = error_kind_to_string(*snapshot.error_kind);
        json["error"]["reason"] = snapshot.error_reason;
    }
    return json;
}

Json::Value AnalysisReport::artifacts(const std::vector<ArtifactInfo>& artifacts) {
    Json::Value list(Json::arrayValue);
    for (const auto& artifact : artifacts) {
        Json::Value entry;
        entry["filename"] = artifact.filename;
        entry["size_bytes"] = static_cast<Json::UInt64>(artifact.size_bytes);
        entry["sha256"] = artifact.sha256_hash;
        list.append(entry);
    }
    return list;
}

Json::Value AnalysisReport::vm_status(const VMStatus& status, const VMHandle& handle) {
    Json::Value json;
    json["available"] = status.analysis_available;
    json["ready"] = (status.state == VMState::READY);
    json["state"] = vm_state_to_string(status.state);
    json["vmx_path"] = handle.image_path;
    json["base_snapshot"] = handle.base_snapshot;
    json["revert_count"] = static_cast<Json::UInt64>(status.revert_count);
    if (!status.last_error.empty()) {
        json["last_error"] = status.last_error;
    }
    return json;
}

std::string AnalysisReport::to_string(const Json::Value& value, bool pretty) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = pretty ? "  " : "";
    return Json::writeString(builder, value);
}

} // namespace malsand
