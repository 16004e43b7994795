#pragma once

#include <stdexcept>
#include <string>

namespace malsand {

// Engine failure categories
enum class ErrorKind {
    VM_START_FAILED,
    VM_NOT_READY,
    TRANSFER_ERROR,
    UNSUPPORTED_FILE_TYPE,
    COMPILE_FAILED,
    EXECUTION_TIMEOUT,
    TRACE_UNAVAILABLE,            // Never fails a job
    SNAPSHOT_REVERT_FAILED,
    GUEST_TOOL_INVOCATION_FAILED, // The control command itself could not run
    CANCELLED
};

// Why a host<->guest copy failed
enum class TransferFailure {
    AUTHENTICATION,
    MISSING_SOURCE,
    GUEST_PERMISSION,
    INVALID_PATH,
    OTHER
};

std::string error_kind_to_string(ErrorKind kind);
std::string transfer_failure_to_string(TransferFailure reason);

// Infrastructure failures take the whole engine out of service
bool is_infrastructure_error(ErrorKind kind);

class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class TransferError : public EngineError {
public:
    TransferError(TransferFailure reason, const std::string& message)
        : EngineError(ErrorKind::TRANSFER_ERROR, message), reason_(reason) {}

    TransferFailure reason() const { return reason_; }

private:
    TransferFailure reason_;
};

} // namespace malsand
