#include "engine_errors.h"

namespace malsand {

std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VM_START_FAILED: return "VMStartFailed";
        case ErrorKind::VM_NOT_READY: return "VMNotReady";
        case ErrorKind::TRANSFER_ERROR: return "TransferError";
        case ErrorKind::UNSUPPORTED_FILE_TYPE: return "UnsupportedFileType";
        case ErrorKind::COMPILE_FAILED: return "CompileFailed";
        case ErrorKind::EXECUTION_TIMEOUT: return "Timeout";
        case ErrorKind::TRACE_UNAVAILABLE: return "TraceUnavailable";
        case ErrorKind::SNAPSHOT_REVERT_FAILED: return "SnapshotRevertFailed";
        case ErrorKind::GUEST_TOOL_INVOCATION_FAILED: return "GuestToolInvocationFailed";
        case ErrorKind::CANCELLED: return "Cancelled";
    }
    return "Unknown";
}

std::string transfer_failure_to_string(TransferFailure reason) {
    switch (reason) {
        case TransferFailure::AUTHENTICATION: return "authentication";
        case TransferFailure::MISSING_SOURCE: return "missing_source";
        case TransferFailure::GUEST_PERMISSION: return "guest_permission";
        case TransferFailure::INVALID_PATH: return "invalid_path";
        case TransferFailure::OTHER: return "other";
    }
    return "other";
}

bool is_infrastructure_error(ErrorKind kind) {
    return kind == ErrorKind::VM_START_FAILED ||
           kind == ErrorKind::SNAPSHOT_REVERT_FAILED ||
           kind == ErrorKind::GUEST_TOOL_INVOCATION_FAILED;
}

} // namespace malsand
