#include "transfer_gateway.h"
#include "constants.h"
#include "engine_errors.h"
#include "guest_path.h"
#include "vm_controller.h"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <iostream>

namespace malsand {

namespace fs = std::filesystem;

TransferGateway::TransferGateway(HypervisorControl& hypervisor, const VmController& controller,
                                 TransferLimits limits)
    : hypervisor_(hypervisor), controller_(controller), limits_(limits) {}

void TransferGateway::require_session() const {
    VMState state = controller_.state();
    if (state != VMState::BUSY) {
        throw EngineError(ErrorKind::VM_NOT_READY,
                          "Transfers need an acquired VM, state is " + vm_state_to_string(state));
    }
}

std::string TransferGateway::push_file(const std::string& host_path, const std::string& guest_path) {
    require_session();
    std::string target = guest_path::require_absolute(guest_path);

    std::error_code ec;
    if (!fs::is_regular_file(host_path, ec)) {
        throw TransferError(TransferFailure::MISSING_SOURCE,
                            "Host file not found: " + host_path);
    }

    const VMHandle& vm = controller_.handle();
    std::cout << "[Transfer] " << host_path << " -> guest:" << target << std::endl;
    hypervisor_.copy_file_from_host_to_guest(vm.image_path, vm.credentials, host_path, target);
    return target;
}

void TransferGateway::pull_file(const std::string& guest_path, const std::string& host_path) {
    require_session();
    std::string source = guest_path::require_absolute(guest_path);

    fs::path parent = fs::path(host_path).parent_path();
    std::error_code ec;
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            throw TransferError(TransferFailure::OTHER,
                                "Cannot create host directory " + parent.string() + ": " + ec.message());
        }
    }

    const VMHandle& vm = controller_.handle();
    std::cout << "[Transfer] guest:" << source << " -> " << host_path << std::endl;
    hypervisor_.copy_file_from_guest_to_host(vm.image_path, vm.credentials, source, host_path);

    if (!fs::is_regular_file(host_path, ec)) {
        throw TransferError(TransferFailure::OTHER,
                            "Copy reported success but " + host_path + " is missing");
    }
}

std::vector<std::string> TransferGateway::pull_directory(const std::string& guest_dir,
                                                         const std::string& host_dir,
                                                         const std::set<std::string>& exclude) {
    require_session();
    std::string source_dir = guest_path::require_absolute(guest_dir);

    const VMHandle& vm = controller_.handle();
    std::vector<std::string> names =
        hypervisor_.list_directory_in_guest(vm.image_path, vm.credentials, source_dir);

    std::vector<std::string> pulled;
    size_t total_size = 0;
    for (const auto& name : names) {
        std::string leaf = guest_path::basename(name);
        if (leaf.empty() || exclude.count(leaf) ||
            leaf.compare(0, std::strlen(CAPTURE_PREFIX), CAPTURE_PREFIX) == 0) {
            continue;
        }
        if (pulled.size() >= limits_.max_files) {
            std::cerr << "[Transfer] Skipping " << leaf << ": already pulled "
                      << limits_.max_files << " files" << std::endl;
            continue;
        }
        // Guest-chosen names never pick the host location
        std::string host_path = (fs::path(host_dir) / guest_path::sanitize_filename(leaf)).string();
        try {
            pull_file(guest_path::join(source_dir, leaf), host_path);
        } catch (const TransferError& e) {
            // Subdirectories and files the sample removed or locked
            if (e.reason() != TransferFailure::MISSING_SOURCE &&
                e.reason() != TransferFailure::GUEST_PERMISSION) {
                throw;
            }
            std::cerr << "[Transfer] Skipping " << leaf << ": " << e.what() << std::endl;
            continue;
        }

        std::error_code ec;
        std::uintmax_t size = fs::file_size(host_path, ec);
        if (ec) size = 0;
        const char* over = nullptr;
        if (size > limits_.max_file_size) {
            over = "file size limit";
        } else if (total_size + size > limits_.max_total_size) {
            over = "total size limit";
        }
        if (over) {
            std::cerr << "[Transfer] Skipping " << leaf << ": " << size << " bytes exceeds the "
                      << over << std::endl;
            fs::remove(host_path, ec);
            continue;
        }
        total_size += size;
        pulled.push_back(host_path);
    }
    return pulled;
}

void TransferGateway::ensure_guest_directory(const std::string& guest_dir) {
    require_session();
    const VMHandle& vm = controller_.handle();
    hypervisor_.create_directory_in_guest(vm.image_path, vm.credentials,
                                          guest_path::require_absolute(guest_dir));
}

} // namespace malsand
