#pragma once

#include "constants.h"
#include "hypervisor.h"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace malsand {

class CancellationToken;
class VmController;

struct GuestProcessResult {
    int exit_code = 0;
    std::string stdout_output;
    std::string stderr_output;
    bool timed_out = false;
    bool cancelled = false;
    bool output_truncated = false;      // A stream hit the capture limit
    std::chrono::milliseconds wall_time{0};
};

// Runs one command inside the guest with a hard wall-clock bound. This
// is what limits how long a job can hold the VM: on timeout or
// cancellation the guest processes started from cwd are killed and the
// call returns instead of blocking. Exit codes are passed through.
// Each captured stream is cut to max_output bytes.
class GuestProcessDriver {
public:
    GuestProcessDriver(HypervisorControl& hypervisor, const VmController& controller,
                       size_t max_output = MAX_CAPTURED_OUTPUT);

    GuestProcessResult run_in_guest(const std::string& command,
                                    const std::vector<std::string>& args,
                                    const std::string& cwd,
                                    std::chrono::milliseconds timeout,
                                    const CancellationToken* token = nullptr);

private:
    void terminate_guest_tree(const std::string& cwd);
    bool clamp_output(std::string& stream) const;

    HypervisorControl& hypervisor_;
    const VmController& controller_;
    const size_t max_output_;
};

} // namespace malsand
