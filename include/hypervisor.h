#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace malsand {

enum class StopMode {
    SOFT,   // Ask the guest OS to shut down
    HARD    // Power off
};

struct GuestCredentials {
    std::string user;
    std::string password;
};

// A program to launch inside the guest. Paths are POSIX.
struct GuestCommand {
    std::string program;
    std::vector<std::string> args;
    std::string working_dir;
};

struct GuestRunResult {
    int exit_code = 0;
    std::string stdout_output;
    std::string stderr_output;
    bool timed_out = false;
    bool cancelled = false;
};

// Polled while a guest program runs; returning true aborts the wait
using CancelCheck = std::function<bool()>;

// Narrow synchronous boundary toward the hypervisor control tool.
//
// Every method blocks until the tool returns. Failures of the tool are
// thrown as EngineError (GUEST_TOOL_INVOCATION_FAILED) or TransferError
// for the copy operations. A guest program exiting non-zero is not a
// failure: run_program_in_guest reports it through exit_code.
class HypervisorControl {
public:
    virtual ~HypervisorControl() = default;

    virtual void start(const std::string& image, bool headless) = 0;
    virtual void stop(const std::string& image, StopMode mode) = 0;
    virtual void revert_to_snapshot(const std::string& image,
                                    const std::string& snapshot) = 0;

    // True once guest tools answer and guest commands can be run
    virtual bool is_guest_ready(const std::string& image,
                                const GuestCredentials& creds) = 0;

    virtual void copy_file_from_host_to_guest(const std::string& image,
                                              const GuestCredentials& creds,
                                              const std::string& host_path,
                                              const std::string& guest_path) = 0;

    virtual void copy_file_from_guest_to_host(const std::string& image,
                                              const GuestCredentials& creds,
                                              const std::string& guest_path,
                                              const std::string& host_path) = 0;

    virtual GuestRunResult run_program_in_guest(const std::string& image,
                                                const GuestCredentials& creds,
                                                const GuestCommand& command,
                                                std::chrono::milliseconds timeout,
                                                const CancelCheck& cancelled) = 0;

    virtual void create_directory_in_guest(const std::string& image,
                                           const GuestCredentials& creds,
                                           const std::string& guest_dir) = 0;

    // Plain file names directly under guest_dir
    virtual std::vector<std::string> list_directory_in_guest(const std::string& image,
                                                             const GuestCredentials& creds,
                                                             const std::string& guest_dir) = 0;

    // Kill every guest process whose command line contains pattern
    virtual void kill_guest_processes(const std::string& image,
                                      const GuestCredentials& creds,
                                      const std::string& pattern) = 0;
};

} // namespace malsand
