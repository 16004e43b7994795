#pragma once

#include "engine_errors.h"
#include "file_utils.h"
#include "guest_path.h"
#include "hypervisor.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace malsand {
namespace testing_support {

// In-memory HypervisorControl for tests. The guest is a map of
// path -> content; revert_to_snapshot restores the map captured by
// take_snapshot(). Programs are scripted per absolute path.
class FakeHypervisor : public HypervisorControl {
public:
    using Handler = std::function<GuestRunResult(FakeHypervisor&, const GuestCommand&,
                                                 std::chrono::milliseconds, const CancelCheck&)>;

    std::string password = "kali";

    // Failure injection
    bool fail_start = false;
    bool fail_revert = false;
    bool fail_soft_stop = false;
    bool fail_hard_stop = false;
    bool fail_run_tool = false;         // run_program_in_guest throws GUEST_TOOL_INVOCATION_FAILED
    int probes_until_ready = 0;         // is_guest_ready false this many times after power on
    bool snapshot_powered_on = true;
    std::chrono::milliseconds start_delay{0};   // Slow power on

    FakeHypervisor() {
        install_default_programs();
        take_snapshot();
    }

    // --- HypervisorControl ---

    void start(const std::string&, bool) override {
        record("start");
        if (start_delay.count() > 0) {
            std::this_thread::sleep_for(start_delay);
        }
        if (fail_start) {
            throw EngineError(ErrorKind::GUEST_TOOL_INVOCATION_FAILED, "Error: Cannot open VM");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        powered_on_ = true;
        failed_probes_ = 0;
    }

    void stop(const std::string&, StopMode mode) override {
        record(mode == StopMode::SOFT ? "stop_soft" : "stop_hard");
        if ((mode == StopMode::SOFT && fail_soft_stop) || (mode == StopMode::HARD && fail_hard_stop)) {
            throw EngineError(ErrorKind::GUEST_TOOL_INVOCATION_FAILED, "Error: The virtual machine is not responding");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        powered_on_ = false;
    }

    void revert_to_snapshot(const std::string&, const std::string&) override {
        record("revert");
        ++reverts;
        if (fail_revert) {
            throw EngineError(ErrorKind::GUEST_TOOL_INVOCATION_FAILED, "Error: The snapshot does not exist");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        files_ = snapshot_files_;
        dirs_ = snapshot_dirs_;
        powered_on_ = snapshot_powered_on;
        failed_probes_ = 0;
    }

    bool is_guest_ready(const std::string&, const GuestCredentials&) override {
        record("probe");
        std::lock_guard<std::mutex> lock(mutex_);
        if (!powered_on_) return false;
        if (failed_probes_ < probes_until_ready) {
            ++failed_probes_;
            return false;
        }
        return true;
    }

    void copy_file_from_host_to_guest(const std::string&, const GuestCredentials& creds,
                                      const std::string& host_path,
                                      const std::string& guest_path) override {
        record("push");
        Busy busy(*this);
        check_credentials(creds);
        if (!std::filesystem::exists(host_path)) {
            throw TransferError(TransferFailure::MISSING_SOURCE, "Error: A file was not found");
        }
        std::string content = FileUtils::read_text_file(host_path);
        std::lock_guard<std::mutex> lock(mutex_);
        std::string parent = guest_path::dirname(guest_path);
        if (readonly_dirs.count(parent)) {
            throw TransferError(TransferFailure::GUEST_PERMISSION, "Error: Insufficient permissions in the guest operating system");
        }
        if (!dirs_.count(parent)) {
            throw TransferError(TransferFailure::MISSING_SOURCE, "Error: A file was not found");
        }
        files_[guest_path] = content;
    }

    void copy_file_from_guest_to_host(const std::string&, const GuestCredentials& creds,
                                      const std::string& guest_path,
                                      const std::string& host_path) override {
        record("pull");
        Busy busy(*this);
        check_credentials(creds);
        std::string content;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = files_.find(guest_path);
            if (it == files_.end()) {
                throw TransferError(TransferFailure::MISSING_SOURCE, "Error: A file was not found");
            }
            content = it->second;
        }
        FileUtils::write_file(host_path, content);
    }

    GuestRunResult run_program_in_guest(const std::string&, const GuestCredentials& creds,
                                        const GuestCommand& command,
                                        std::chrono::milliseconds timeout,
                                        const CancelCheck& cancelled) override {
        record("run:" + command.program);
        Busy busy(*this);
        if (fail_run_tool) {
            throw EngineError(ErrorKind::GUEST_TOOL_INVOCATION_FAILED, "Error: VMware Tools are not running in the guest");
        }
        check_credentials(creds);
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            commands.push_back(command);
            auto it = programs_.find(command.program);
            auto binary = files_.find(command.program);
            if (it == programs_.end() && binary != files_.end() &&
                binary->second.compare(0, 4, "ELF:") == 0) {
                GuestRunResult ran;
                ran.stdout_output = "compiled binary ran\n";
                return ran;
            }
            if (it == programs_.end()) {
                GuestRunResult missing;
                missing.exit_code = 127;
                missing.stderr_output = "sh: 1: " + command.program + ": not found\n";
                return missing;
            }
            handler = it->second;
        }
        return handler(*this, command, timeout, cancelled);
    }

    void create_directory_in_guest(const std::string&, const GuestCredentials& creds,
                                   const std::string& guest_dir) override {
        record("mkdir");
        check_credentials(creds);
        std::lock_guard<std::mutex> lock(mutex_);
        std::string dir = guest_dir;
        while (!dir.empty() && dir != "/") {
            dirs_.insert(dir);
            dir = guest_path::dirname(dir);
        }
    }

    std::vector<std::string> list_directory_in_guest(const std::string&, const GuestCredentials& creds,
                                                     const std::string& guest_dir) override {
        record("list");
        check_credentials(creds);
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> names;
        for (const auto& [path, content] : files_) {
            if (guest_path::dirname(path) == guest_dir) {
                names.push_back(guest_path::basename(path));
            }
        }
        for (const auto& dir : dirs_) {
            if (dir != guest_dir && guest_path::dirname(dir) == guest_dir) {
                names.push_back(guest_path::basename(dir));
            }
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    void kill_guest_processes(const std::string&, const GuestCredentials&,
                              const std::string& pattern) override {
        record("kill:" + pattern);
        ++kills;
    }

    // --- Test helpers ---

    void install(const std::string& program, Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        programs_[program] = std::move(handler);
    }

    void uninstall(const std::string& program) {
        std::lock_guard<std::mutex> lock(mutex_);
        programs_.erase(program);
    }

    // Current guest contents become the clean snapshot
    void take_snapshot() {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot_files_ = files_;
        snapshot_dirs_ = dirs_;
    }

    void write_guest_file(const std::string& path, const std::string& content) {
        std::lock_guard<std::mutex> lock(mutex_);
        files_[path] = content;
        std::string dir = guest_path::dirname(path);
        while (!dir.empty() && dir != "/") {
            dirs_.insert(dir);
            dir = guest_path::dirname(dir);
        }
    }

    void make_guest_dir(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        dirs_.insert(path);
    }

    bool guest_file_exists(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return files_.count(path) > 0;
    }

    std::string guest_file(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = files_.find(path);
        return it == files_.end() ? "" : it->second;
    }

    size_t guest_file_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return files_.size();
    }

    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        return calls_;
    }

    size_t count_calls(const std::string& prefix) const {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        return std::count_if(calls_.begin(), calls_.end(), [&](const std::string& call) {
            return call.compare(0, prefix.size(), prefix) == 0;
        });
    }

    bool powered_on() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return powered_on_;
    }

    // Blocks like a program that never finishes on its own
    static GuestRunResult hang(std::chrono::milliseconds timeout, const CancelCheck& cancelled) {
        GuestRunResult result;
        result.exit_code = -1;
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (cancelled && cancelled()) {
                result.cancelled = true;
                return result;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        result.timed_out = true;
        return result;
    }

    // Python stand-in: prints the argument of every print("...") call,
    // exits with N on sys.exit(N), hangs on "while True"
    static GuestRunResult run_python(FakeHypervisor& vm, const GuestCommand& command,
                                     std::chrono::milliseconds timeout, const CancelCheck& cancelled) {
        GuestRunResult result;
        if (command.args.empty() || !vm.guest_file_exists(command.args[0])) {
            result.exit_code = 2;
            result.stderr_output = "python3: can't open file: [Errno 2] No such file or directory\n";
            return result;
        }
        std::string source = vm.guest_file(command.args[0]);
        if (source.find("while True") != std::string::npos) {
            return hang(timeout, cancelled);
        }
        size_t pos = 0;
        while ((pos = source.find("print(\"", pos)) != std::string::npos) {
            pos += 7;
            size_t end = source.find("\")", pos);
            if (end == std::string::npos) break;
            result.stdout_output += source.substr(pos, end - pos) + "\n";
            pos = end;
        }
        size_t exit_pos = source.find("sys.exit(");
        if (exit_pos != std::string::npos) {
            result.exit_code = std::atoi(source.c_str() + exit_pos + 9);
        }
        size_t write_pos = source.find("open(\"");
        if (write_pos != std::string::npos) {
            size_t end = source.find('"', write_pos + 6);
            std::string name = source.substr(write_pos + 6, end - write_pos - 6);
            vm.write_guest_file(guest_path::join(command.working_dir, name), "written by sample\n");
        }
        return result;
    }

    // gcc/g++ stand-in: "SYNTAX ERROR" in the source fails the build
    static GuestRunResult run_compiler(FakeHypervisor& vm, const GuestCommand& command,
                                       std::chrono::milliseconds, const CancelCheck&) {
        GuestRunResult result;
        std::string source = command.args.empty() ? "" : vm.guest_file(command.args[0]);
        if (source.find("SYNTAX ERROR") != std::string::npos) {
            result.exit_code = 1;
            result.stderr_output = command.args[0] + ":1:1: error: expected ';' before '}' token\n";
            return result;
        }
        auto out = std::find(command.args.begin(), command.args.end(), "-o");
        if (out != command.args.end() && out + 1 != command.args.end()) {
            vm.write_guest_file(*(out + 1), "ELF:" + source);
        }
        return result;
    }

    std::atomic<int> reverts{0};
    std::atomic<int> kills{0};
    std::set<std::string> readonly_dirs;
    std::vector<GuestCommand> commands;

    int max_concurrent_operations() const { return max_busy_; }

private:
    // Counts overlapping guest operations
    struct Busy {
        explicit Busy(FakeHypervisor& vm) : vm_(vm) {
            int now = ++vm_.busy_;
            int seen = vm_.max_busy_.load();
            while (now > seen && !vm_.max_busy_.compare_exchange_weak(seen, now)) {}
        }
        ~Busy() { --vm_.busy_; }
        FakeHypervisor& vm_;
    };

    void record(const std::string& call) {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        calls_.push_back(call);
    }

    void check_credentials(const GuestCredentials& creds) const {
        if (creds.password != password) {
            throw TransferError(TransferFailure::AUTHENTICATION,
                                "Error: Invalid user name or password for the guest OS");
        }
    }

    void install_default_programs() {
        programs_["/bin/chmod"] = [](FakeHypervisor&, const GuestCommand&, std::chrono::milliseconds,
                                     const CancelCheck&) { return GuestRunResult{}; };
        programs_["/usr/bin/test"] = [](FakeHypervisor& vm, const GuestCommand& command,
                                        std::chrono::milliseconds, const CancelCheck&) {
            GuestRunResult result;
            bool found = command.args.size() == 2 && vm.has_program(command.args[1]);
            result.exit_code = found ? 0 : 1;
            return result;
        };
        programs_["/usr/bin/python3"] = &FakeHypervisor::run_python;
        programs_["/usr/bin/gcc"] = &FakeHypervisor::run_compiler;
        programs_["/usr/bin/g++"] = &FakeHypervisor::run_compiler;
    }

    bool has_program(const std::string& program) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return programs_.count(program) > 0;
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::string> files_;
    std::set<std::string> dirs_;
    std::map<std::string, std::string> snapshot_files_;
    std::set<std::string> snapshot_dirs_;
    std::map<std::string, Handler> programs_;
    bool powered_on_ = false;
    int failed_probes_ = 0;

    mutable std::mutex calls_mutex_;
    std::vector<std::string> calls_;

    std::atomic<int> busy_{0};
    std::atomic<int> max_busy_{0};
};

} // namespace testing_support
} // namespace malsand
