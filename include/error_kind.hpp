#pragma once

#include <string>

namespace voxbridge {

// Stable error kinds. Worker-reported kinds drive host branching; numeric
// codes are only protocol plumbing.
enum class ErrorKind {
    None,

    // Reported by the worker
    MethodNotFound,
    InvalidParams,
    NotReady,
    MicPermissionDenied,
    DeviceNotFound,
    AudioIoFailure,
    NetworkFailure,
    DiskFull,
    CacheCorrupt,
    ModelLoadFailure,
    TranscriptionFailure,
    InternalError,

    // Raised by the host
    WorkerCrashed,
    WorkerHung,
    CircuitOpen,
    TranscriptionTimeout,
    InjectionFailed,
    Timeout,
    Disconnected,
    ProtocolError,

    Unknown
};

enum class ErrorCategory {
    None,
    Transport,      // Oversized or malformed frames
    Protocol,       // Bad method or params
    Capability,     // Permission denied, device missing
    Resource,       // Disk full, network unreachable, corrupt cache
    WorkerHealth,   // Crash, hang, timeouts
    Internal
};

enum class Remediation {
    None,
    Retry,
    RestartWorker,
    OpenAudioSettings,
    GrantMicPermission,
    FreeDiskSpace,
    CheckNetwork,
    ReinstallModel
};

// Accepts the kebab-case wire names and the legacy E_* aliases.
// Unrecognized strings map to ErrorKind::Unknown.
ErrorKind parse_error_kind(const std::string& name);

// Fallback when a response carries a code but no kind
ErrorKind error_kind_from_code(int code);

const char* error_kind_name(ErrorKind kind);
ErrorCategory error_category(ErrorKind kind);
const char* error_category_name(ErrorCategory category);

Remediation remediation_for(ErrorKind kind);
const char* remediation_name(Remediation remediation);
std::string remediation_text(Remediation remediation);

} // namespace voxbridge
