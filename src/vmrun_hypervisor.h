#pragma once

#include "engine_errors.h"
#include "hypervisor.h"
#include "process_runner.h"

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace malsand {

struct VmrunOptions {
    std::string vmrun_path = "vmrun";
    std::string host_type = "ws";
    std::chrono::seconds command_timeout{100};   // Any single vmrun call
    std::chrono::seconds stop_grace{60};         // Soft stop
    std::chrono::seconds start_timeout{300};
    std::string capture_dir = "/tmp/malsand_jobs/.capture";
};

// HypervisorControl over the VMware `vmrun` command-line tool.
//
// runProgramInGuest does not return the guest program's streams, so
// programs are wrapped in /bin/sh with stdout/stderr redirected to
// capture files in the working directory, which are copied back and
// deleted afterwards.
class VmrunHypervisor : public HypervisorControl {
public:
    explicit VmrunHypervisor(VmrunOptions options);

    void start(const std::string& image, bool headless) override;
    void stop(const std::string& image, StopMode mode) override;
    void revert_to_snapshot(const std::string& image, const std::string& snapshot) override;
    bool is_guest_ready(const std::string& image, const GuestCredentials& creds) override;

    void copy_file_from_host_to_guest(const std::string& image, const GuestCredentials& creds,
                                      const std::string& host_path,
                                      const std::string& guest_path) override;
    void copy_file_from_guest_to_host(const std::string& image, const GuestCredentials& creds,
                                      const std::string& guest_path,
                                      const std::string& host_path) override;

    GuestRunResult run_program_in_guest(const std::string& image, const GuestCredentials& creds,
                                        const GuestCommand& command,
                                        std::chrono::milliseconds timeout,
                                        const CancelCheck& cancelled) override;

    void create_directory_in_guest(const std::string& image, const GuestCredentials& creds,
                                   const std::string& guest_dir) override;
    std::vector<std::string> list_directory_in_guest(const std::string& image,
                                                     const GuestCredentials& creds,
                                                     const std::string& guest_dir) override;
    void kill_guest_processes(const std::string& image, const GuestCredentials& creds,
                              const std::string& pattern) override;

    // Descriptor paths of every running VM ("vmrun list")
    std::vector<std::string> running_vms();

    // Shell-quote one word for /bin/sh
    static std::string shell_quote(const std::string& word);

    // Build the /bin/sh -c script that runs command with redirected streams
    static std::string capture_script(const GuestCommand& command,
                                      const std::string& stdout_path,
                                      const std::string& stderr_path);

    // Guest exit code from a vmrun "exited with non-zero exit code" failure,
    // or -1 if the failure was not about the guest program
    static int guest_exit_code(const ProcessResult& result);

    static TransferFailure classify_copy_failure(const std::string& message);

private:
    ProcessResult invoke(const std::vector<std::string>& args,
                         const GuestCredentials* creds,
                         std::chrono::milliseconds timeout,
                         const CancelCheck& cancelled = nullptr);

    // Throws GUEST_TOOL_INVOCATION_FAILED unless vmrun exited 0
    void invoke_checked(const std::string& what, const std::vector<std::string>& args,
                        const GuestCredentials* creds, std::chrono::milliseconds timeout);

    std::string fetch_capture(const std::string& image, const GuestCredentials& creds,
                              const std::string& guest_path);

    const VmrunOptions options_;
    std::atomic<unsigned long> capture_counter_{0};
};

} // namespace malsand
