#include "error_kind.hpp"
#include <map>

namespace voxbridge {

ErrorKind parse_error_kind(const std::string& name) {
    static const std::map<std::string, ErrorKind> kinds = {
        {"method-not-found", ErrorKind::MethodNotFound},
        {"invalid-params", ErrorKind::InvalidParams},
        {"not-ready", ErrorKind::NotReady},
        {"microphone-permission-denied", ErrorKind::MicPermissionDenied},
        {"device-not-found", ErrorKind::DeviceNotFound},
        {"audio-io-failure", ErrorKind::AudioIoFailure},
        {"network-failure", ErrorKind::NetworkFailure},
        {"disk-full", ErrorKind::DiskFull},
        {"cache-corrupt", ErrorKind::CacheCorrupt},
        {"model-load-failure", ErrorKind::ModelLoadFailure},
        {"transcription-failure", ErrorKind::TranscriptionFailure},
        {"internal-error", ErrorKind::InternalError},

        // Legacy aliases still emitted by older workers
        {"E_METHOD_NOT_FOUND", ErrorKind::MethodNotFound},
        {"E_INVALID_PARAMS", ErrorKind::InvalidParams},
        {"E_NOT_READY", ErrorKind::NotReady},
        {"E_MIC_PERMISSION", ErrorKind::MicPermissionDenied},
        {"E_DEVICE_NOT_FOUND", ErrorKind::DeviceNotFound},
        {"E_AUDIO_IO", ErrorKind::AudioIoFailure},
        {"E_NETWORK", ErrorKind::NetworkFailure},
        {"E_DISK_FULL", ErrorKind::DiskFull},
        {"E_CACHE_CORRUPT", ErrorKind::CacheCorrupt},
        {"E_MODEL_LOAD", ErrorKind::ModelLoadFailure},
        {"E_TRANSCRIBE", ErrorKind::TranscriptionFailure},
        {"E_INTERNAL", ErrorKind::InternalError},

        {"worker-crashed", ErrorKind::WorkerCrashed},
        {"worker-hung", ErrorKind::WorkerHung},
        {"circuit-open", ErrorKind::CircuitOpen},
        {"transcription-timeout", ErrorKind::TranscriptionTimeout},
        {"injection-failed", ErrorKind::InjectionFailed},
        {"rpc-timeout", ErrorKind::Timeout},
        {"disconnected", ErrorKind::Disconnected},
        {"protocol-error", ErrorKind::ProtocolError},
    };

    if (name.empty()) return ErrorKind::None;
    auto it = kinds.find(name);
    return it != kinds.end() ? it->second : ErrorKind::Unknown;
}

ErrorKind error_kind_from_code(int code) {
    switch (code) {
        case -32700: return ErrorKind::ProtocolError;
        case -32600: return ErrorKind::ProtocolError;
        case -32601: return ErrorKind::MethodNotFound;
        case -32602: return ErrorKind::InvalidParams;
        case -32603: return ErrorKind::InternalError;
        case -32001: return ErrorKind::NotReady;
        case -32002: return ErrorKind::MicPermissionDenied;
        case -32003: return ErrorKind::DeviceNotFound;
        case -32004: return ErrorKind::AudioIoFailure;
        case -32005: return ErrorKind::NetworkFailure;
        case -32006: return ErrorKind::DiskFull;
        case -32007: return ErrorKind::CacheCorrupt;
        case -32008: return ErrorKind::ModelLoadFailure;
        case -32009: return ErrorKind::TranscriptionFailure;
        default: return ErrorKind::Unknown;
    }
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::MethodNotFound: return "method-not-found";
        case ErrorKind::InvalidParams: return "invalid-params";
        case ErrorKind::NotReady: return "not-ready";
        case ErrorKind::MicPermissionDenied: return "microphone-permission-denied";
        case ErrorKind::DeviceNotFound: return "device-not-found";
        case ErrorKind::AudioIoFailure: return "audio-io-failure";
        case ErrorKind::NetworkFailure: return "network-failure";
        case ErrorKind::DiskFull: return "disk-full";
        case ErrorKind::CacheCorrupt: return "cache-corrupt";
        case ErrorKind::ModelLoadFailure: return "model-load-failure";
        case ErrorKind::TranscriptionFailure: return "transcription-failure";
        case ErrorKind::InternalError: return "internal-error";
        case ErrorKind::WorkerCrashed: return "worker-crashed";
        case ErrorKind::WorkerHung: return "worker-hung";
        case ErrorKind::CircuitOpen: return "circuit-open";
        case ErrorKind::TranscriptionTimeout: return "transcription-timeout";
        case ErrorKind::InjectionFailed: return "injection-failed";
        case ErrorKind::Timeout: return "rpc-timeout";
        case ErrorKind::Disconnected: return "disconnected";
        case ErrorKind::ProtocolError: return "protocol-error";
        case ErrorKind::Unknown: return "unknown";
    }
    return "unknown";
}

ErrorCategory error_category(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return ErrorCategory::None;
        case ErrorKind::ProtocolError:
            return ErrorCategory::Transport;
        case ErrorKind::MethodNotFound:
        case ErrorKind::InvalidParams:
        case ErrorKind::NotReady:
            return ErrorCategory::Protocol;
        case ErrorKind::MicPermissionDenied:
        case ErrorKind::DeviceNotFound:
        case ErrorKind::AudioIoFailure:
            return ErrorCategory::Capability;
        case ErrorKind::NetworkFailure:
        case ErrorKind::DiskFull:
        case ErrorKind::CacheCorrupt:
        case ErrorKind::ModelLoadFailure:
            return ErrorCategory::Resource;
        case ErrorKind::WorkerCrashed:
        case ErrorKind::WorkerHung:
        case ErrorKind::CircuitOpen:
        case ErrorKind::TranscriptionTimeout:
        case ErrorKind::Timeout:
        case ErrorKind::Disconnected:
            return ErrorCategory::WorkerHealth;
        case ErrorKind::TranscriptionFailure:
        case ErrorKind::InternalError:
        case ErrorKind::InjectionFailed:
        case ErrorKind::Unknown:
            return ErrorCategory::Internal;
    }
    return ErrorCategory::Internal;
}

const char* error_category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None: return "none";
        case ErrorCategory::Transport: return "transport";
        case ErrorCategory::Protocol: return "protocol";
        case ErrorCategory::Capability: return "capability";
        case ErrorCategory::Resource: return "resource";
        case ErrorCategory::WorkerHealth: return "worker-health";
        case ErrorCategory::Internal: return "internal";
    }
    return "internal";
}

Remediation remediation_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MicPermissionDenied:
            return Remediation::GrantMicPermission;
        case ErrorKind::DeviceNotFound:
        case ErrorKind::AudioIoFailure:
            return Remediation::OpenAudioSettings;
        case ErrorKind::NetworkFailure:
            return Remediation::CheckNetwork;
        case ErrorKind::DiskFull:
            return Remediation::FreeDiskSpace;
        case ErrorKind::CacheCorrupt:
        case ErrorKind::ModelLoadFailure:
            return Remediation::ReinstallModel;
        case ErrorKind::WorkerCrashed:
        case ErrorKind::WorkerHung:
        case ErrorKind::CircuitOpen:
        case ErrorKind::TranscriptionTimeout:
        case ErrorKind::Timeout:
        case ErrorKind::Disconnected:
        case ErrorKind::ProtocolError:
        case ErrorKind::InternalError:
            return Remediation::RestartWorker;
        case ErrorKind::NotReady:
        case ErrorKind::TranscriptionFailure:
        case ErrorKind::InjectionFailed:
        case ErrorKind::Unknown:
            return Remediation::Retry;
        case ErrorKind::None:
        case ErrorKind::MethodNotFound:
        case ErrorKind::InvalidParams:
            return Remediation::None;
    }
    return Remediation::None;
}

const char* remediation_name(Remediation remediation) {
    switch (remediation) {
        case Remediation::None: return "none";
        case Remediation::Retry: return "retry";
        case Remediation::RestartWorker: return "restart-worker";
        case Remediation::OpenAudioSettings: return "open-audio-settings";
        case Remediation::GrantMicPermission: return "grant-microphone-permission";
        case Remediation::FreeDiskSpace: return "free-disk-space";
        case Remediation::CheckNetwork: return "check-network";
        case Remediation::ReinstallModel: return "reinstall-model";
    }
    return "none";
}

std::string remediation_text(Remediation remediation) {
    switch (remediation) {
        case Remediation::None:
            return "";
        case Remediation::Retry:
            return "Try again.";
        case Remediation::RestartWorker:
            return "Restart the speech worker.";
        case Remediation::OpenAudioSettings:
            return "Check that the microphone is connected and selected in audio settings.";
        case Remediation::GrantMicPermission:
            return "Allow microphone access for voxbridge and try again.";
        case Remediation::FreeDiskSpace:
            return "Free up disk space, then download the model again.";
        case Remediation::CheckNetwork:
            return "Check your network connection, then retry the download.";
        case Remediation::ReinstallModel:
            return "Purge the model cache and download the model again.";
    }
    return "";
}

} // namespace voxbridge
