#include "vm_controller.h"
#include "engine_errors.h"

#include <iostream>
#include <thread>

namespace malsand {

std::string vm_state_to_string(VMState state) {
    switch (state) {
        case VMState::STOPPED: return "stopped";
        case VMState::STARTING: return "starting";
        case VMState::READY: return "ready";
        case VMState::BUSY: return "busy";
        case VMState::REVERTING_SNAPSHOT: return "reverting_snapshot";
        case VMState::FAULTED: return "faulted";
    }
    return "unknown";
}

VmController::VmController(HypervisorControl& hypervisor, VMHandle handle,
                           LifecycleOptions options)
    : hypervisor_(hypervisor), handle_(std::move(handle)), options_(options) {}

void VmController::set_state_listener(std::function<void(VMState)> listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

void VmController::transition(VMState to, const std::string& error) {
    std::function<void(VMState)> listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != to) {
            std::cout << "[VM] " << vm_state_to_string(state_) << " -> "
                      << vm_state_to_string(to) << std::endl;
        }
        state_ = to;
        if (!error.empty()) last_error_ = error;
        listener = listener_;
    }
    if (listener) listener(to);
}

VMState VmController::start() {
    std::function<void(VMState)> listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != VMState::STOPPED && state_ != VMState::FAULTED) {
            return state_;
        }
        std::cout << "[VM] " << vm_state_to_string(state_) << " -> starting" << std::endl;
        state_ = VMState::STARTING;
        listener = listener_;
    }
    if (listener) listener(VMState::STARTING);

    std::cout << "[VM] Powering on " << handle_.image_path
              << (options_.headless ? " (headless)" : "") << std::endl;
    try {
        hypervisor_.start(handle_.image_path, options_.headless);
    } catch (const EngineError& e) {
        transition(VMState::FAULTED, e.what());
        throw EngineError(ErrorKind::VM_START_FAILED,
                          std::string("Failed to power on VM: ") + e.what());
    }

    if (!wait_until_ready()) {
        std::string reason = "Guest did not become ready within " +
            std::to_string(options_.readiness_attempts) + " probes";
        transition(VMState::FAULTED, reason);
        throw EngineError(ErrorKind::VM_START_FAILED, reason);
    }

    try {
        hypervisor_.create_directory_in_guest(handle_.image_path, handle_.credentials,
                                              handle_.guest_work_dir);
    } catch (const EngineError& e) {
        transition(VMState::FAULTED, e.what());
        throw EngineError(ErrorKind::VM_START_FAILED,
                          std::string("Cannot create guest working directory: ") + e.what());
    }

    transition(VMState::READY);
    return VMState::READY;
}

bool VmController::wait_until_ready() {
    auto deadline = std::chrono::steady_clock::now() + options_.start_timeout;
    for (int attempt = 1; attempt <= options_.readiness_attempts; ++attempt) {
        try {
            if (hypervisor_.is_guest_ready(handle_.image_path, handle_.credentials)) {
                return true;
            }
        } catch (const EngineError& e) {
            std::cerr << "[VM] Readiness probe " << attempt << " failed: " << e.what() << std::endl;
        }
        if (attempt == options_.readiness_attempts ||
            std::chrono::steady_clock::now() + options_.readiness_interval > deadline) {
            break;
        }
        std::this_thread::sleep_for(options_.readiness_interval);
    }
    return false;
}

void VmController::acquire() {
    std::function<void(VMState)> listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != VMState::READY) {
            throw EngineError(ErrorKind::VM_NOT_READY,
                              "VM is " + vm_state_to_string(state_) + ", not ready");
        }
        state_ = VMState::BUSY;
        listener = listener_;
    }
    if (listener) listener(VMState::BUSY);
}

void VmController::release(bool revert) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != VMState::BUSY) {
            throw EngineError(ErrorKind::VM_NOT_READY,
                              "release() while VM is " + vm_state_to_string(state_));
        }
    }

    if (!revert) {
        transition(VMState::READY);
        return;
    }

    transition(VMState::REVERTING_SNAPSHOT);
    std::cout << "[VM] Reverting to snapshot " << handle_.base_snapshot << std::endl;
    try {
        hypervisor_.revert_to_snapshot(handle_.image_path, handle_.base_snapshot);
    } catch (const EngineError& e) {
        std::string reason = std::string("Snapshot revert failed: ") + e.what();
        transition(VMState::FAULTED, reason);
        throw EngineError(ErrorKind::SNAPSHOT_REVERT_FAILED, reason);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++revert_count_;
    }

    if (options_.power_on_after_revert) {
        bool ready = false;
        try {
            ready = hypervisor_.is_guest_ready(handle_.image_path, handle_.credentials);
        } catch (const EngineError&) {
            ready = false;
        }
        if (!ready) {
            try {
                hypervisor_.start(handle_.image_path, options_.headless);
            } catch (const EngineError& e) {
                std::string reason = std::string("Guest did not restart after revert: ") + e.what();
                transition(VMState::FAULTED, reason);
                throw EngineError(ErrorKind::SNAPSHOT_REVERT_FAILED, reason);
            }
            if (!wait_until_ready()) {
                std::string reason = "Guest did not become ready after revert";
                transition(VMState::FAULTED, reason);
                throw EngineError(ErrorKind::SNAPSHOT_REVERT_FAILED, reason);
            }
        }
    }

    transition(VMState::READY);
}

void VmController::stop() {
    std::cout << "[VM] Stopping " << handle_.image_path << std::endl;
    try {
        hypervisor_.stop(handle_.image_path, StopMode::SOFT);
    } catch (const EngineError& soft_error) {
        std::cerr << "[VM] Soft stop failed (" << soft_error.what()
                  << "), forcing power off" << std::endl;
        try {
            hypervisor_.stop(handle_.image_path, StopMode::HARD);
        } catch (const EngineError& hard_error) {
            transition(VMState::FAULTED, hard_error.what());
            throw EngineError(ErrorKind::GUEST_TOOL_INVOCATION_FAILED,
                              std::string("Failed to power off VM: ") + hard_error.what());
        }
    }
    transition(VMState::STOPPED);
}

VMState VmController::restart() {
    stop();
    return start();
}

void VmController::fault(const std::string& reason) {
    std::cerr << "[VM] Taken out of service: " << reason << std::endl;
    transition(VMState::FAULTED, reason);
}

VMStatus VmController::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    VMStatus s;
    s.state = state_;
    s.analysis_available = (state_ == VMState::READY || state_ == VMState::BUSY);
    s.revert_count = revert_count_;
    s.last_error = last_error_;
    return s;
}

VMState VmController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

} // namespace malsand
