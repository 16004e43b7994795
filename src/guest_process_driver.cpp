#include "guest_process_driver.h"
#include "cancellation.h"
#include "engine_errors.h"
#include "guest_path.h"
#include "vm_controller.h"

#include <algorithm>
#include <iostream>

namespace malsand {

GuestProcessDriver::GuestProcessDriver(HypervisorControl& hypervisor, const VmController& controller,
                                       size_t max_output)
    : hypervisor_(hypervisor), controller_(controller), max_output_(max_output) {}

GuestProcessResult GuestProcessDriver::run_in_guest(const std::string& command,
                                                    const std::vector<std::string>& args,
                                                    const std::string& cwd,
                                                    std::chrono::milliseconds timeout,
                                                    const CancellationToken* token) {
    VMState state = controller_.state();
    if (state != VMState::BUSY) {
        throw EngineError(ErrorKind::VM_NOT_READY,
                          "Guest commands need an acquired VM, state is " + vm_state_to_string(state));
    }

    GuestCommand guest_command;
    guest_command.program = guest_path::normalize(command);
    guest_command.working_dir = guest_path::normalize(cwd);
    for (const auto& arg : args) {
        guest_command.args.push_back(arg);
    }

    GuestProcessResult result;
    if (token) {
        if (token->cancelled()) {
            result.cancelled = true;
            return result;
        }
        timeout = std::min(timeout, token->remaining());
        if (timeout.count() <= 0) {
            result.timed_out = true;
            return result;
        }
    }

    CancelCheck cancelled = [token]() { return token != nullptr && token->cancelled(); };

    const VMHandle& vm = controller_.handle();
    auto start_time = std::chrono::steady_clock::now();
    GuestRunResult run = hypervisor_.run_program_in_guest(vm.image_path, vm.credentials,
                                                          guest_command, timeout, cancelled);
    result.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    result.exit_code = run.exit_code;
    result.stdout_output = std::move(run.stdout_output);
    result.stderr_output = std::move(run.stderr_output);
    result.timed_out = run.timed_out;
    result.cancelled = run.cancelled;

    bool cut_stdout = clamp_output(result.stdout_output);
    bool cut_stderr = clamp_output(result.stderr_output);
    if (cut_stdout || cut_stderr) {
        result.output_truncated = true;
        std::cerr << "[Driver] " << guest_command.program << " output cut to "
                  << max_output_ << " bytes per stream" << std::endl;
    }

    if (result.timed_out || result.cancelled) {
        std::cerr << "[Driver] " << guest_command.program
                  << (result.timed_out ? " timed out after " + std::to_string(timeout.count()) + "ms"
                                       : std::string(" cancelled"))
                  << ", killing guest processes" << std::endl;
        terminate_guest_tree(guest_command.working_dir);
    }
    return result;
}

bool GuestProcessDriver::clamp_output(std::string& stream) const {
    if (stream.size() <= max_output_) return false;
    stream.resize(max_output_);
    stream.shrink_to_fit();
    return true;
}

void GuestProcessDriver::terminate_guest_tree(const std::string& cwd) {
    const VMHandle& vm = controller_.handle();
    try {
        hypervisor_.kill_guest_processes(vm.image_path, vm.credentials, cwd);
    } catch (const EngineError& e) {
        // The snapshot revert that follows discards the guest anyway
        std::cerr << "[Driver] Could not kill guest processes under " << cwd
                  << ": " << e.what() << std::endl;
    }
}

} // namespace malsand
