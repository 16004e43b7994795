#include "execution_pipeline.h"
#include "cancellation.h"
#include "constants.h"
#include "guest_path.h"
#include "guest_process_driver.h"
#include "transfer_gateway.h"
#include "vm_controller.h"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace malsand {

namespace {

// Progress milestones
constexpr int PROGRESS_TRANSFER = 15;
constexpr int PROGRESS_COMPILE = 35;
constexpr int PROGRESS_RUN = 55;
constexpr int PROGRESS_TRACE = 75;
constexpr int PROGRESS_COLLECT = 90;

std::string first_lines(const std::string& text, size_t max_chars = 2048) {
    if (text.size() <= max_chars) return text;
    return text.substr(0, max_chars) + "...";
}

std::string execution_message(int exit_code) {
    if (exit_code == 0) {
        return "File ran successfully in sandbox (exit code 0).";
    }
    // Shells report death by signal N as 128+N
    if (exit_code > 128 && exit_code < 160) {
        return "File was killed by signal " + std::to_string(exit_code - 128) +
               " in sandbox (exit code " + std::to_string(exit_code) + ").";
    }
    return "File exited abnormally in sandbox (exit code " + std::to_string(exit_code) + ").";
}

} // namespace

ExecutionPipeline::ExecutionPipeline(TransferGateway& gateway, GuestProcessDriver& driver,
                                     const VmController& controller, PipelineOptions options)
    : gateway_(gateway), driver_(driver), controller_(controller), options_(std::move(options)) {}

std::string ExecutionPipeline::job_directory(const std::string& job_id) const {
    return guest_path::join(controller_.handle().guest_work_dir, guest_path::sanitize_filename(job_id));
}

bool ExecutionPipeline::stop_requested(AnalysisJob& job, const CancellationToken& token,
                                       const std::string& stage) {
    if (token.cancelled()) {
        job.fail(ErrorKind::CANCELLED, "Cancelled during " + stage);
        return true;
    }
    if (token.expired()) {
        job.fail(ErrorKind::EXECUTION_TIMEOUT, "Job time limit reached during " + stage);
        return true;
    }
    return false;
}

void ExecutionPipeline::execute(AnalysisJob& job, const CancellationToken& token) {
    if (!job.profile()) {
        job.fail(ErrorKind::UNSUPPORTED_FILE_TYPE, "No interpreter or toolchain for " + job.original_filename());
        return;
    }
    const LanguageProfile& profile = *job.profile();
    auto started = std::chrono::steady_clock::now();

    const std::string job_dir = job_directory(job.id());
    const std::string artifact_name = guest_path::sanitize_filename(job.original_filename());
    const std::string guest_artifact = guest_path::join(job_dir, artifact_name);
    const std::string compiled_name = guest_path::stem(artifact_name) + COMPILED_SUFFIX;
    const std::string compiled_output = guest_path::join(job_dir, compiled_name);

    // Transfer in
    job.advance(JobStatus::TRANSFERRING, PROGRESS_TRANSFER,
                "Copying " + job.original_filename() + " to " + guest_artifact);
    gateway_.ensure_guest_directory(job_dir);
    gateway_.push_file(job.host_path(), guest_artifact);
    if (stop_requested(job, token, "transfer")) return;

    if (auto prepare = LanguageDetector::prepare_command(profile, guest_artifact)) {
        GuestProcessResult r = driver_.run_in_guest(prepare->program, prepare->args, job_dir,
                                                    options_.probe_timeout, &token);
        if (r.timed_out || r.cancelled) {
            if (!stop_requested(job, token, "preparation")) {
                job.fail(ErrorKind::EXECUTION_TIMEOUT, "Preparing the artifact timed out");
            }
            return;
        }
        if (r.exit_code != 0) {
            throw TransferError(TransferFailure::GUEST_PERMISSION,
                                "Cannot mark " + guest_artifact + " executable: " + first_lines(r.stderr_output));
        }
    }

    // Compile
    if (profile.needs_compilation) {
        auto compile = LanguageDetector::compile_command(profile, guest_artifact, compiled_output);
        job.advance(JobStatus::COMPILING, PROGRESS_COMPILE, "Compiling with " + profile.toolchain);
        GuestProcessResult r = driver_.run_in_guest(compile->program, compile->args, job_dir,
                                                    options_.compile_timeout, &token);
        if (r.timed_out || r.cancelled) {
            if (!stop_requested(job, token, "compilation")) {
                job.fail(ErrorKind::EXECUTION_TIMEOUT,
                         "Compilation exceeded " + std::to_string(options_.compile_timeout.count()) + "s");
            }
            return;
        }
        if (r.exit_code != 0) {
            std::string compiler_output = r.stderr_output.empty() ? r.stdout_output : r.stderr_output;
            job.append_output("Compiler output:\n" + first_lines(compiler_output, MAX_REPORTED_OUTPUT));
            job.fail(ErrorKind::COMPILE_FAILED,
                     "Compilation failed (exit code " + std::to_string(r.exit_code) + "): " +
                     first_lines(compiler_output));
            return;
        }
        job.log(PROGRESS_COMPILE, "Compilation succeeded");
    }

    // Run
    ToolInvocation run = LanguageDetector::run_command(profile, guest_artifact, compiled_output);
    job.advance(JobStatus::RUNNING, PROGRESS_RUN, "Executing with " + profile.toolchain);
    GuestProcessResult r = driver_.run_in_guest(run.program, run.args, job_dir,
                                                options_.execution_timeout, &token);
    if (r.timed_out || r.cancelled) {
        if (!stop_requested(job, token, "execution")) {
            job.fail(ErrorKind::EXECUTION_TIMEOUT,
                     "Execution exceeded " + std::to_string(options_.execution_timeout.count()) + "s");
        }
        return;
    }

    ExecutionResult execution;
    execution.file_type = profile.file_type;
    execution.interpreter = profile.toolchain;
    execution.compilation_required = profile.needs_compilation;
    execution.execution.exit_code = r.exit_code;
    execution.execution.success = (r.exit_code == 0);
    execution.execution.message = execution_message(r.exit_code);
    execution.stdout_output = std::move(r.stdout_output);
    execution.stderr_output = std::move(r.stderr_output);
    if (r.output_truncated) {
        job.log(PROGRESS_RUN, "Program output truncated to the capture limit");
    }

    // Trace
    bool traced = false;
    if (options_.enable_trace) {
        execution.trace = trace(job, token, job_dir, run, execution.trace_message);
        if (job.finished()) return;
        traced = (execution.trace != TraceOutcome::SKIPPED);
    } else {
        execution.trace = TraceOutcome::SKIPPED;
        execution.trace_message = "Skipped (tracing disabled)";
    }

    // Transfer out
    job.advance(JobStatus::COLLECTING, PROGRESS_COLLECT, "Collecting results");
    fs::create_directories(job.results_dir());
    gateway_.pull_directory(job_dir, job.results_dir(), {artifact_name, compiled_name});

    AnalysisResult result;
    std::string trace_file = (fs::path(job.results_dir()) / TRACE_LOG_NAME).string();
    if (traced) {
        if (fs::exists(trace_file)) {
            result.behavior = TraceParser::parse(FileUtils::read_text_file(trace_file));
            if (execution.trace == TraceOutcome::SUCCESS) {
                execution.trace_message = "Syscall trace captured (" +
                    std::to_string(result.behavior.syscall_count) + " calls)";
            }
        } else {
            execution.trace = TraceOutcome::SKIPPED;
            execution.trace_message = "Skipped (no trace log produced)";
            note_trace_unavailable(job, PROGRESS_COLLECT, "no trace log produced");
        }
    }

    execution.raw_text = ResultClassifier::render(execution);
    result.classification = ResultClassifier::classify(execution.raw_text);
    result.execution = execution;
    result.artifacts = FileUtils::list_artifacts(job.results_dir());
    result.duration_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started).count();

    job.append_output(execution.raw_text);
    std::cout << "[Pipeline] Job " << job.id() << ": "
              << ResultClassifier::label_to_string(result.classification.verdict.label)
              << " (" << result.classification.verdict.basis << ")" << std::endl;
    job.complete(std::move(result));
}

// TraceUnavailable never fails the job; it is recorded in the progress log
void ExecutionPipeline::note_trace_unavailable(AnalysisJob& job, int progress, const std::string& why) {
    job.log(progress, error_kind_to_string(ErrorKind::TRACE_UNAVAILABLE) + ": " + why +
                      ", continuing without trace");
}

TraceOutcome ExecutionPipeline::trace(AnalysisJob& job, const CancellationToken& token,
                                      const std::string& job_dir, const ToolInvocation& run,
                                      std::string& message) {
    GuestProcessResult probe = driver_.run_in_guest("/usr/bin/test", {"-x", options_.tracer_path},
                                                    job_dir, options_.probe_timeout, &token);
    if (probe.timed_out || probe.cancelled) {
        if (stop_requested(job, token, "tracing")) return TraceOutcome::FAILURE;
        message = "Skipped (tracer probe timed out)";
        note_trace_unavailable(job, PROGRESS_RUN, "tracer probe timed out");
        return TraceOutcome::SKIPPED;
    }
    if (probe.exit_code != 0) {
        message = "Skipped (" + options_.tracer_path + " not available in guest)";
        note_trace_unavailable(job, PROGRESS_RUN, options_.tracer_path + " not available in guest");
        return TraceOutcome::SKIPPED;
    }

    job.advance(JobStatus::TRACING, PROGRESS_TRACE, "Tracing system calls");

    std::vector<std::string> args = {"-f", "-tt", "-o", guest_path::join(job_dir, TRACE_LOG_NAME),
                                     run.program};
    args.insert(args.end(), run.args.begin(), run.args.end());

    GuestProcessResult r = driver_.run_in_guest(options_.tracer_path, args, job_dir,
                                                options_.execution_timeout, &token);
    if (r.cancelled || token.expired()) {
        stop_requested(job, token, "tracing");
        return TraceOutcome::FAILURE;
    }
    if (r.timed_out) {
        message = "Partial trace (traced run exceeded " +
                  std::to_string(options_.execution_timeout.count()) + "s)";
        return TraceOutcome::FAILURE;
    }
    message = "Syscall trace captured";
    return TraceOutcome::SUCCESS;
}

} // namespace malsand
