#include "vmrun_hypervisor.h"
#include "engine_errors.h"
#include "constants.h"
#include "file_utils.h"
#include "guest_path.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace malsand {

namespace {

std::string failure_text(const ProcessResult& result) {
    if (result.spawn_failed) return result.error_message;
    if (result.timed_out) return "vmrun timed out";
    std::string text = result.stdout_output + result.stderr_output;
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) text.pop_back();
    if (text.empty()) text = "vmrun exited with code " + std::to_string(result.exit_code);
    return text;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

VmrunHypervisor::VmrunHypervisor(VmrunOptions options) : options_(std::move(options)) {}

std::string VmrunHypervisor::shell_quote(const std::string& word) {
    std::string out = "'";
    for (char c : word) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string VmrunHypervisor::capture_script(const GuestCommand& command,
                                            const std::string& stdout_path,
                                            const std::string& stderr_path) {
    std::ostringstream script;
    if (!command.working_dir.empty()) {
        script << "cd " << shell_quote(command.working_dir) << " && ";
    }
    script << "exec " << shell_quote(command.program);
    for (const auto& arg : command.args) {
        script << " " << shell_quote(arg);
    }
    script << " > " << shell_quote(stdout_path) << " 2> " << shell_quote(stderr_path)
           << " < /dev/null";
    return script.str();
}

int VmrunHypervisor::guest_exit_code(const ProcessResult& result) {
    std::string text = result.stdout_output + result.stderr_output;
    const std::string marker = "exit code:";
    size_t pos = text.find(marker);
    if (pos != std::string::npos) {
        pos += marker.size();
        while (pos < text.size() && text[pos] == ' ') ++pos;
        size_t end = pos;
        while (end < text.size() && (std::isdigit(static_cast<unsigned char>(text[end])) || text[end] == '-')) {
            ++end;
        }
        if (end > pos) {
            try {
                return std::stoi(text.substr(pos, end - pos));
            } catch (const std::exception&) {
                return 1;
            }
        }
        return 1;
    }
    if (result.exit_code == VMRUN_GUEST_PROGRAM_FAILED &&
        contains(text, "Guest program exited")) {
        return 1;
    }
    return -1;
}

TransferFailure VmrunHypervisor::classify_copy_failure(const std::string& message) {
    if (contains(message, "Invalid user name or password") ||
        contains(message, "authentication")) {
        return TransferFailure::AUTHENTICATION;
    }
    if (contains(message, "not found") || contains(message, "does not exist")) {
        return TransferFailure::MISSING_SOURCE;
    }
    if (contains(message, "Insufficient permissions") || contains(message, "ermission denied")) {
        return TransferFailure::GUEST_PERMISSION;
    }
    return TransferFailure::OTHER;
}

ProcessResult VmrunHypervisor::invoke(const std::vector<std::string>& args,
                                      const GuestCredentials* creds,
                                      std::chrono::milliseconds timeout,
                                      const CancelCheck& cancelled) {
    std::vector<std::string> argv = {options_.vmrun_path, "-T", options_.host_type};
    if (creds) {
        argv.insert(argv.end(), {"-gu", creds->user, "-gp", creds->password});
    }
    argv.insert(argv.end(), args.begin(), args.end());

    std::cout << "[vmrun] " << ProcessRunner::describe(argv, {"-gp"}) << std::endl;
    return ProcessRunner::run(argv, timeout, cancelled);
}

void VmrunHypervisor::invoke_checked(const std::string& what, const std::vector<std::string>& args,
                                     const GuestCredentials* creds,
                                     std::chrono::milliseconds timeout) {
    ProcessResult result = invoke(args, creds, timeout);
    if (result.spawn_failed || result.timed_out || result.exit_code != 0) {
        throw EngineError(ErrorKind::GUEST_TOOL_INVOCATION_FAILED,
                          what + " failed: " + failure_text(result));
    }
}

void VmrunHypervisor::start(const std::string& image, bool headless) {
    std::vector<std::string> args = {"start", image};
    if (headless) args.push_back("nogui");
    invoke_checked("start", args, nullptr, options_.start_timeout);
}

void VmrunHypervisor::stop(const std::string& image, StopMode mode) {
    invoke_checked(mode == StopMode::SOFT ? "soft stop" : "hard stop",
                   {"stop", image, mode == StopMode::SOFT ? "soft" : "hard"},
                   nullptr,
                   mode == StopMode::SOFT ? options_.stop_grace : options_.command_timeout);
}

void VmrunHypervisor::revert_to_snapshot(const std::string& image, const std::string& snapshot) {
    invoke_checked("revertToSnapshot", {"revertToSnapshot", image, snapshot},
                   nullptr, options_.command_timeout);
}

bool VmrunHypervisor::is_guest_ready(const std::string& image, const GuestCredentials& creds) {
    ProcessResult tools = invoke({"checkToolsState", image}, nullptr, options_.command_timeout);
    if (tools.spawn_failed) {
        throw EngineError(ErrorKind::GUEST_TOOL_INVOCATION_FAILED, failure_text(tools));
    }
    if (tools.exit_code != 0 || !contains(tools.stdout_output, "running")) {
        return false;
    }
    // Tools can report running before guest logins work
    ProcessResult probe = invoke({"runProgramInGuest", image, "/bin/true"}, &creds,
                                 options_.command_timeout);
    return !probe.spawn_failed && !probe.timed_out && probe.exit_code == 0;
}

void VmrunHypervisor::copy_file_from_host_to_guest(const std::string& image,
                                                   const GuestCredentials& creds,
                                                   const std::string& host_path,
                                                   const std::string& guest_path) {
    ProcessResult result = invoke({"copyFileFromHostToGuest", image, host_path, guest_path},
                                  &creds, options_.command_timeout);
    if (result.spawn_failed) {
        throw EngineError(ErrorKind::GUEST_TOOL_INVOCATION_FAILED, failure_text(result));
    }
    if (result.timed_out || result.exit_code != 0) {
        std::string message = failure_text(result);
        throw TransferError(classify_copy_failure(message),
                            "Copy " + host_path + " -> guest:" + guest_path + " failed: " + message);
    }
}

void VmrunHypervisor::copy_file_from_guest_to_host(const std::string& image,
                                                   const GuestCredentials& creds,
                                                   const std::string& guest_path,
                                                   const std::string& host_path) {
    ProcessResult result = invoke({"copyFileFromGuestToHost", image, guest_path, host_path},
                                  &creds, options_.command_timeout);
    if (result.spawn_failed) {
        throw EngineError(ErrorKind::GUEST_TOOL_INVOCATION_FAILED, failure_text(result));
    }
    if (result.timed_out || result.exit_code != 0) {
        std::string message = failure_text(result);
        throw TransferError(classify_copy_failure(message),
                            "Copy guest:" + guest_path + " -> " + host_path + " failed: " + message);
    }
}

std::string VmrunHypervisor::fetch_capture(const std::string& image, const GuestCredentials& creds,
                                           const std::string& guest_path) {
    std::string host_path = (fs::path(options_.capture_dir) /
                             (std::to_string(++capture_counter_) + ".txt")).string();
    std::string content;
    try {
        copy_file_from_guest_to_host(image, creds, guest_path, host_path);
        content = FileUtils::read_head(host_path, MAX_CAPTURED_OUTPUT);
    } catch (const std::runtime_error& e) {
        std::cerr << "[vmrun] Could not retrieve " << guest_path << ": " << e.what() << std::endl;
    }
    std::error_code ec;
    fs::remove(host_path, ec);

    ProcessResult removed = invoke({"deleteFileInGuest", image, guest_path}, &creds,
                                   options_.command_timeout);
    if (removed.exit_code != 0) {
        std::cerr << "[vmrun] Could not delete " << guest_path << ": "
                  << failure_text(removed) << std::endl;
    }
    return content;
}

GuestRunResult VmrunHypervisor::run_program_in_guest(const std::string& image,
                                                     const GuestCredentials& creds,
                                                     const GuestCommand& command,
                                                     std::chrono::milliseconds timeout,
                                                     const CancelCheck& cancelled) {
    std::error_code ec;
    fs::create_directories(options_.capture_dir, ec);

    std::string capture_base = command.working_dir.empty() ? "/tmp" : command.working_dir;
    std::string tag = std::string(CAPTURE_PREFIX) + std::to_string(++capture_counter_);
    std::string stdout_path = guest_path::join(capture_base, tag + ".out");
    std::string stderr_path = guest_path::join(capture_base, tag + ".err");

    ProcessResult result = invoke({"runProgramInGuest", image, "/bin/sh", "-c",
                                   capture_script(command, stdout_path, stderr_path)},
                                  &creds, timeout, cancelled);

    GuestRunResult run;
    if (result.spawn_failed) {
        throw EngineError(ErrorKind::GUEST_TOOL_INVOCATION_FAILED, failure_text(result));
    }
    if (result.timed_out || result.cancelled) {
        // The guest program is still running; the driver kills it
        run.timed_out = result.timed_out;
        run.cancelled = result.cancelled;
        run.exit_code = -1;
        return run;
    }

    if (result.exit_code == 0) {
        run.exit_code = 0;
    } else {
        int guest_code = guest_exit_code(result);
        if (guest_code < 0) {
            throw EngineError(ErrorKind::GUEST_TOOL_INVOCATION_FAILED,
                              "runProgramInGuest " + command.program + " failed: " + failure_text(result));
        }
        run.exit_code = guest_code;
    }

    run.stdout_output = fetch_capture(image, creds, stdout_path);
    run.stderr_output = fetch_capture(image, creds, stderr_path);
    return run;
}

std::vector<std::string> VmrunHypervisor::running_vms() {
    ProcessResult result = invoke({"list"}, nullptr, options_.command_timeout);
    if (result.spawn_failed || result.timed_out || result.exit_code != 0) {
        throw EngineError(ErrorKind::GUEST_TOOL_INVOCATION_FAILED,
                          "list failed: " + failure_text(result));
    }
    // "Total running VMs: N" header, then one descriptor per line
    std::vector<std::string> vms;
    std::istringstream lines(result.stdout_output);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line.compare(0, 18, "Total running VMs:") == 0) continue;
        vms.push_back(line);
    }
    return vms;
}

void VmrunHypervisor::create_directory_in_guest(const std::string& image,
                                                const GuestCredentials& creds,
                                                const std::string& guest_dir) {
    ProcessResult result = invoke({"runProgramInGuest", image, "/bin/mkdir", "-p", guest_dir},
                                  &creds, options_.command_timeout);
    if (result.spawn_failed || result.timed_out || result.exit_code != 0) {
        std::string message = failure_text(result);
        if (!result.spawn_failed && guest_exit_code(result) > 0) {
            throw TransferError(TransferFailure::GUEST_PERMISSION,
                                "mkdir -p " + guest_dir + " failed: " + message);
        }
        throw EngineError(ErrorKind::GUEST_TOOL_INVOCATION_FAILED,
                          "mkdir -p " + guest_dir + " failed: " + message);
    }
}

std::vector<std::string> VmrunHypervisor::list_directory_in_guest(const std::string& image,
                                                                  const GuestCredentials& creds,
                                                                  const std::string& guest_dir) {
    ProcessResult result = invoke({"listDirectoryInGuest", image, guest_dir}, &creds,
                                  options_.command_timeout);
    if (result.spawn_failed || result.timed_out || result.exit_code != 0) {
        std::string message = failure_text(result);
        throw TransferError(classify_copy_failure(message),
                            "listDirectoryInGuest " + guest_dir + " failed: " + message);
    }

    // "Directory list: N" header, then one name per line
    std::vector<std::string> names;
    std::istringstream lines(result.stdout_output);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line.compare(0, 15, "Directory list:") == 0) continue;
        names.push_back(line);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void VmrunHypervisor::kill_guest_processes(const std::string& image, const GuestCredentials& creds,
                                           const std::string& pattern) {
    ProcessResult result = invoke({"runProgramInGuest", image, "/usr/bin/pkill", "-KILL", "-f", pattern},
                                  &creds, options_.command_timeout);
    if (result.spawn_failed || result.timed_out) {
        throw EngineError(ErrorKind::GUEST_TOOL_INVOCATION_FAILED,
                          "pkill failed: " + failure_text(result));
    }
    // pkill exits 1 when nothing matched
    if (result.exit_code != 0 && guest_exit_code(result) < 0) {
        throw EngineError(ErrorKind::GUEST_TOOL_INVOCATION_FAILED,
                          "pkill failed: " + failure_text(result));
    }
}

} // namespace malsand
