#pragma once

#include "constants.h"
#include "hypervisor.h"

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace malsand {

class VmController;

// Bounds on what pull_directory brings back from one guest directory
struct TransferLimits {
    size_t max_file_size = MAX_PULLED_FILE_SIZE;
    size_t max_files = MAX_PULLED_FILES;
    size_t max_total_size = MAX_PULLED_TOTAL_SIZE;
};

// Host<->guest file copies. Only valid while the VM is Busy (inside an
// acquired session). Failures throw TransferError and are never retried.
class TransferGateway {
public:
    TransferGateway(HypervisorControl& hypervisor, const VmController& controller,
                    TransferLimits limits = TransferLimits{});

    // Returns the normalized guest path written
    std::string push_file(const std::string& host_path, const std::string& guest_path);

    void pull_file(const std::string& guest_path, const std::string& host_path);

    // Pull every plain file in guest_dir whose name is not in exclude,
    // within the transfer limits. Files over a limit are skipped and
    // logged. Returns the host paths written.
    std::vector<std::string> pull_directory(const std::string& guest_dir,
                                            const std::string& host_dir,
                                            const std::set<std::string>& exclude = {});

    void ensure_guest_directory(const std::string& guest_dir);

private:
    void require_session() const;

    HypervisorControl& hypervisor_;
    const VmController& controller_;
    const TransferLimits limits_;
};

} // namespace malsand
