#pragma once

#include "hypervisor.h"

#include <chrono>
#include <functional>
#include <mutex>
#include <string>

namespace malsand {

// Identity of the controlled VM
struct VMHandle {
    std::string image_path;             // .vmx descriptor
    GuestCredentials credentials;
    std::string base_snapshot;
    std::string guest_work_dir;         // POSIX
    std::chrono::seconds default_timeout{100};
};

enum class VMState {
    STOPPED,
    STARTING,
    READY,
    BUSY,
    REVERTING_SNAPSHOT,
    FAULTED
};

struct VMStatus {
    VMState state = VMState::STOPPED;
    bool analysis_available = false;
    size_t revert_count = 0;
    std::string last_error;
};

struct LifecycleOptions {
    int readiness_attempts = 30;
    std::chrono::milliseconds readiness_interval{2000};
    std::chrono::seconds start_timeout{300};
    bool headless = true;
    // Snapshots taken powered-off leave the VM off after a revert
    bool power_on_after_revert = true;
};

std::string vm_state_to_string(VMState state);

// Authoritative state machine for the single VM instance.
//
// The controller only guards its own state; callers that must not race
// each other (jobs, administrative start/stop) serialize through the
// JobSerializer's admission lock.
class VmController {
public:
    VmController(HypervisorControl& hypervisor, VMHandle handle,
                 LifecycleOptions options = LifecycleOptions{});

    // Stopped|Faulted -> Starting -> Ready, or Faulted with VM_START_FAILED.
    // No-op returning the current state otherwise.
    VMState start();

    // Ready -> Busy; throws VM_NOT_READY otherwise
    void acquire();

    // Busy -> RevertingSnapshot -> Ready (revert), Busy -> Ready (!revert).
    // A failed revert leaves the VM Faulted and throws SNAPSHOT_REVERT_FAILED.
    void release(bool revert);

    // Any state -> Stopped; soft shutdown first, then power off
    void stop();

    // stop() then start(); the operator path out of Faulted
    VMState restart();

    // Take the engine out of service after an infrastructure failure
    void fault(const std::string& reason);

    VMStatus status() const;
    VMState state() const;
    const VMHandle& handle() const { return handle_; }

    // Called after every state change (outside the internal lock)
    void set_state_listener(std::function<void(VMState)> listener);

private:
    bool wait_until_ready();
    void transition(VMState to, const std::string& error = "");

    HypervisorControl& hypervisor_;
    const VMHandle handle_;
    const LifecycleOptions options_;

    mutable std::mutex mutex_;
    VMState state_ = VMState::STOPPED;
    size_t revert_count_ = 0;
    std::string last_error_;
    std::function<void(VMState)> listener_;
};

} // namespace malsand
