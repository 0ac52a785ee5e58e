#include "recording_controller.hpp"
#include <iostream>

namespace voxbridge {

// Faults after which the supervisor is bringing up a new worker.
// A deadline miss or one slow call leaves the worker running.
static bool worker_restart_pending(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::WorkerCrashed:
        case ErrorKind::WorkerHung:
        case ErrorKind::CircuitOpen:
        case ErrorKind::Disconnected:
        case ErrorKind::ProtocolError:
            return true;
        default:
            return false;
    }
}

RecordingController::RecordingController(const RecordingConfig& config, HotkeyMode mode, int double_tap_window_ms,
                                         RpcChannel& channel, SessionStateMachine& session, EventEmitter& events)
    : config_(config)
    , mode_(mode)
    , double_tap_window_ms_(double_tap_window_ms)
    , channel_(channel)
    , session_(session)
    , events_(events) {
}

void RecordingController::set_mode(HotkeyMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    mode_ = mode;
    have_press_ = false;
}

HotkeyMode RecordingController::mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mode_;
}

void RecordingController::set_device(const std::string& device_uid) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.device_uid = device_uid;
}

ControlResult RecordingController::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    return start_locked(now());
}

ControlResult RecordingController::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_locked(now(), "recording stopped");
}

ControlResult RecordingController::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancel_locked("cancelled");
}

ControlResult RecordingController::on_hotkey(bool pressed) {
    std::lock_guard<std::mutex> lock(mutex_);
    Clock::time_point t = now();

    if (mode_ == HotkeyMode::Hold) {
        return pressed ? start_locked(t) : stop_locked(t, "hotkey released");
    }

    ControlResult result;
    if (!pressed) {
        result.noop = true;
        return result;
    }

    bool double_tap = have_press_ && (t - last_press_) <= std::chrono::milliseconds(double_tap_window_ms_);
    have_press_ = true;
    last_press_ = t;

    if (session_.phase() == Phase::Recording) {
        if (double_tap) {
            have_press_ = false;
            return cancel_locked("double tap");
        }
        return stop_locked(t, "hotkey pressed");
    }
    return start_locked(t);
}

ControlResult RecordingController::start_locked(Clock::time_point now) {
    ControlResult result;
    SessionSnapshot snap = session_.snapshot();

    if (snap.phase == Phase::Recording && snap.session_active) {
        result.success = true;
        result.noop = true;
        result.session_id = snap.session_id;
        result.message = "Already recording";
        return result;
    }

    // Worker faults clear when the supervisor brings a worker back
    if (snap.phase == Phase::Error && worker_restart_pending(snap.error_kind)) {
        result.kind = snap.error_kind;
        result.message = "Worker is restarting after " + std::string(error_kind_name(snap.error_kind)) +
                         ": " + remediation_text(snap.remediation);
        std::cerr << "Start rejected: " << result.message << std::endl;
        return result;
    }

    std::string reason;
    if (is_ready_ && !is_ready_(reason)) {
        result.kind = ErrorKind::NotReady;
        result.message = reason.empty() ? "Model is not ready" : reason;
        std::cerr << "Start rejected: " << result.message << std::endl;
        events_.user_message("warning", result.message);
        return result;
    }

    if (snap.phase == Phase::Error) {
        std::cout << "Clearing " << error_kind_name(snap.error_kind) << " to start a new recording" << std::endl;
        session_.recover();
    }

    std::string session_id = session_.begin_session(now, &reason);
    if (session_id.empty()) {
        result.message = reason;
        std::cerr << "Start rejected: " << reason << std::endl;
        return result;
    }

    Json::Value params(Json::objectValue);
    params["session_id"] = session_id;
    params["device_uid"] = config_.device_uid.empty() ? Json::Value(Json::nullValue) : Json::Value(config_.device_uid);

    RpcResult call = channel_.call("recording.start", params);
    if (!call.success) {
        result.kind = call.error.kind;
        result.session_id = session_id;
        result.message = "Could not start recording: " + call.error.message;
        std::cerr << result.message << std::endl;
        session_.fail_session(session_id, call.error.kind, remediation_for(call.error.kind), result.message);
        return result;
    }

    std::cout << "Recording started (" << session_id << ")" << std::endl;
    result.success = true;
    result.session_id = session_id;
    return result;
}

ControlResult RecordingController::stop_locked(Clock::time_point now, const std::string& reason) {
    ControlResult result;
    SessionSnapshot snap = session_.snapshot();

    if (snap.phase != Phase::Recording || !snap.session_active) {
        result.success = snap.phase == Phase::Transcribing;
        result.noop = true;
        result.session_id = snap.session_active ? snap.session_id : "";
        result.message = snap.phase == Phase::Transcribing ? "Already stopped" : "Not recording";
        return result;
    }

    const std::string& session_id = snap.session_id;
    result.session_id = session_id;

    if (now - snap.started_at < std::chrono::milliseconds(config_.min_duration_ms)) {
        session_.retire_session(session_id, "recording too short");
        abandon(session_id);

        Json::Value params(Json::objectValue);
        params["session_id"] = session_id;
        RpcResult call = channel_.call("recording.cancel", params);
        if (!call.success) {
            std::cerr << "recording.cancel after short recording failed (ignored): "
                      << call.error.message << std::endl;
        }

        result.success = true;
        result.message = "Recording too short";
        std::cout << result.message << " (" << session_id << ")" << std::endl;
        events_.user_message("info", "Recording too short. Hold the hotkey a little longer.");
        return result;
    }

    if (on_stop_) on_stop_(session_id);
    if (!session_.mark_transcribing(session_id, now)) {
        // Completed or failed while we were getting here
        abandon(session_id);
        result.noop = true;
        result.message = "Session already ended";
        return result;
    }

    Json::Value params(Json::objectValue);
    params["session_id"] = session_id;
    RpcResult call = channel_.call("recording.stop", params);
    if (!call.success) {
        result.kind = call.error.kind;
        result.message = "Could not stop recording: " + call.error.message;
        std::cerr << result.message << std::endl;
        session_.fail_session(session_id, call.error.kind, remediation_for(call.error.kind), result.message);
        abandon(session_id);
        return result;
    }

    deadline_session_ = session_id;
    deadline_ = now + std::chrono::milliseconds(config_.transcription_timeout_ms);

    std::cout << "Recording stopped (" << reason << "), transcribing..." << std::endl;
    result.success = true;
    return result;
}

ControlResult RecordingController::cancel_locked(const std::string& reason) {
    ControlResult result;
    SessionSnapshot snap = session_.snapshot();

    if (!snap.session_active ||
        (snap.phase != Phase::Recording && snap.phase != Phase::Transcribing)) {
        result.success = true;
        result.noop = true;
        result.message = "Nothing to cancel";
        return result;
    }

    const std::string& session_id = snap.session_id;
    result.session_id = session_id;

    // Retire first: a completion racing with the cancel is now stale
    session_.retire_session(session_id, reason);
    abandon(session_id);
    if (deadline_session_ == session_id) deadline_session_.clear();

    Json::Value params(Json::objectValue);
    params["session_id"] = session_id;
    RpcResult call = channel_.call("recording.cancel", params);
    if (!call.success) {
        std::cerr << "recording.cancel failed (ignored): " << call.error.message << std::endl;
    }

    std::cout << "Recording cancelled (" << session_id << ")" << std::endl;
    result.success = true;
    result.message = "Cancelled";
    return result;
}

void RecordingController::tick() {
    std::lock_guard<std::mutex> lock(mutex_);
    Clock::time_point t = now();
    SessionSnapshot snap = session_.snapshot();
    if (!snap.session_active) return;

    if (snap.phase == Phase::Recording &&
        t - snap.started_at >= std::chrono::milliseconds(config_.max_duration_ms)) {
        std::cout << "Max recording duration reached (" << config_.max_duration_ms / 1000 << "s)" << std::endl;
        events_.user_message("info", "Maximum recording length reached");
        stop_locked(t, "max duration");
        return;
    }

    if (snap.phase == Phase::Transcribing && snap.session_id == deadline_session_ && t >= deadline_) {
        std::string message = "No transcript within " + std::to_string(config_.transcription_timeout_ms / 1000) + "s";
        std::cerr << message << " (" << snap.session_id << ")" << std::endl;
        if (session_.fail_session(snap.session_id, ErrorKind::TranscriptionTimeout,
                                  Remediation::RestartWorker, message)) {
            abandon(snap.session_id);
        }
        deadline_session_.clear();
    }
}

void RecordingController::abandon(const std::string& session_id) {
    if (on_abandon_) on_abandon_(session_id);
}

} // namespace voxbridge
