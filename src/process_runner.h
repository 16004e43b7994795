#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace malsand {

// Outcome of one host-side child process
struct ProcessResult {
    int exit_code = -1;           // Negative: killed by signal -exit_code
    std::string stdout_output;
    std::string stderr_output;
    bool timed_out = false;
    bool cancelled = false;
    bool spawn_failed = false;    // fork/exec never produced the program
    std::string error_message;
    std::chrono::milliseconds wall_time{0};
};

// Runs host programs (the hypervisor control tool) with a hard
// wall-clock limit. The child gets its own process group so the whole
// tree is signalled on timeout or cancellation.
class ProcessRunner {
public:
    static ProcessResult run(const std::vector<std::string>& argv,
                             std::chrono::milliseconds timeout,
                             const std::function<bool()>& cancelled = nullptr);

    // Render argv for logs, replacing the values that follow any flag
    // in redact_after (e.g. "-gp") with "<hidden>"
    static std::string describe(const std::vector<std::string>& argv,
                                const std::vector<std::string>& redact_after = {});
};

} // namespace malsand
