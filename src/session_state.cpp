#include "session_state.hpp"
#include <iostream>
#include <random>
#include <cstdio>

namespace voxbridge {

const char* phase_name(Phase phase) {
    switch (phase) {
        case Phase::Idle: return "idle";
        case Phase::LoadingModel: return "loading_model";
        case Phase::Recording: return "recording";
        case Phase::Transcribing: return "transcribing";
        case Phase::Error: return "error";
    }
    return "unknown";
}

bool is_valid_transition(Phase from, Phase to) {
    if (from == to) return false;
    if (to == Phase::Error) return true;

    switch (from) {
        case Phase::Idle:
            return to == Phase::LoadingModel || to == Phase::Recording;
        case Phase::LoadingModel:
            return to == Phase::Idle || to == Phase::Recording;
        case Phase::Recording:
            return to == Phase::Transcribing || to == Phase::Idle;
        case Phase::Transcribing:
            return to == Phase::Idle;
        case Phase::Error:
            return to == Phase::Idle || to == Phase::LoadingModel;
    }
    return false;
}

SessionStateMachine::SessionStateMachine(EventEmitter& events)
    : events_(events) {
}

SessionSnapshot SessionStateMachine::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionSnapshot snap;
    snap.phase = phase_;
    snap.session_id = session_id_;
    snap.session_active = session_active_;
    snap.session_seq = session_seq_;
    snap.started_at = started_at_;
    snap.stopped_at = stopped_at_;
    snap.error_kind = error_kind_;
    snap.remediation = remediation_;
    snap.error_message = error_message_;
    snap.enabled = enabled_;
    return snap;
}

Phase SessionStateMachine::phase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_;
}

std::string SessionStateMachine::current_session_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_active_ ? session_id_ : std::string();
}

std::string SessionStateMachine::begin_session(Clock::time_point now, std::string* reject_reason) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string reason;
    if (!enabled_) {
        reason = "Dictation is paused";
    } else if (phase_ == Phase::LoadingModel) {
        reason = "Model is still loading";
    } else if (phase_ == Phase::Recording) {
        reason = "Already recording";
    } else if (phase_ == Phase::Transcribing) {
        reason = "Still transcribing the previous recording";
    } else if (phase_ == Phase::Error) {
        reason = "Cannot record while in error state: " + error_message_;
    }
    if (!reason.empty()) {
        if (reject_reason) *reject_reason = reason;
        return "";
    }

    session_id_ = generate_session_id();
    session_active_ = true;
    session_seq_ = 0;
    started_at_ = now;
    stopped_at_ = Clock::time_point();

    transition_locked(Phase::Recording, "recording started");
    return session_id_;
}

bool SessionStateMachine::mark_transcribing(const std::string& session_id, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_active_ || session_id != session_id_ || phase_ != Phase::Recording) {
        return false;
    }
    stopped_at_ = now;
    return transition_locked(Phase::Transcribing, "recording stopped");
}

bool SessionStateMachine::retire_session(const std::string& session_id, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_active_ || session_id != session_id_) return false;

    session_active_ = false;
    if (phase_ == Phase::Recording || phase_ == Phase::Transcribing) {
        transition_locked(Phase::Idle, reason);
    }
    return true;
}

bool SessionStateMachine::is_current(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_active_ && !session_id.empty() && session_id == session_id_;
}

bool SessionStateMachine::accept_completion(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_active_ || session_id.empty() || session_id != session_id_) return false;

    session_active_ = false;
    if (phase_ == Phase::Recording || phase_ == Phase::Transcribing) {
        transition_locked(Phase::Idle, "transcription complete");
    }
    return true;
}

bool SessionStateMachine::accept_error(const std::string& session_id, ErrorKind kind,
                                       const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_active_ || session_id.empty() || session_id != session_id_) return false;

    session_active_ = false;
    set_error_locked(kind, remediation_for(kind), message);
    transition_locked(Phase::Error, "transcription failed");
    return true;
}

bool SessionStateMachine::fail_session(const std::string& session_id, ErrorKind kind,
                                       Remediation remediation, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_active_ || session_id != session_id_) return false;

    session_active_ = false;
    set_error_locked(kind, remediation, message);
    return transition_locked(Phase::Error, message);
}

bool SessionStateMachine::force_error(ErrorKind kind, Remediation remediation, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_active_ = false;
    if (phase_ == Phase::Error) return false;

    set_error_locked(kind, remediation, message);
    return transition_locked(Phase::Error, message);
}

bool SessionStateMachine::recover() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ != Phase::Error) return false;

    ErrorKind previous = error_kind_;
    set_error_locked(ErrorKind::None, Remediation::None, "");
    transition_locked(Phase::Idle, std::string("recovered from ") + error_kind_name(previous));
    return true;
}

bool SessionStateMachine::begin_loading() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ != Phase::Idle && phase_ != Phase::Error) return false;

    set_error_locked(ErrorKind::None, Remediation::None, "");
    return transition_locked(Phase::LoadingModel, "initializing model");
}

bool SessionStateMachine::finish_loading(bool success, ErrorKind kind, Remediation remediation,
                                         const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ != Phase::LoadingModel) return false;

    if (success) {
        return transition_locked(Phase::Idle, "model ready");
    }
    set_error_locked(kind, remediation, message);
    return transition_locked(Phase::Error, message);
}

uint64_t SessionStateMachine::next_event_seq(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_active_ || session_id != session_id_) return 0;
    return ++session_seq_;
}

void SessionStateMachine::set_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    enabled_ = enabled;
}

bool SessionStateMachine::enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_;
}

std::string SessionStateMachine::generate_session_id() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    uint64_t hi = rng();
    uint64_t lo = rng();

    // Version 4, variant 10
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

bool SessionStateMachine::transition_locked(Phase to, const std::string& reason) {
    if (!is_valid_transition(phase_, to)) {
        if (phase_ != to) {
            std::cerr << "Rejected transition " << phase_name(phase_) << " -> " << phase_name(to) << std::endl;
        }
        return false;
    }

    Phase from = phase_;
    phase_ = to;

    Json::Value payload(Json::objectValue);
    payload["phase"] = phase_name(to);
    payload["previous"] = phase_name(from);
    payload["reason"] = reason;
    if (!session_id_.empty()) {
        payload["session_id"] = session_id_;
    }
    if (to == Phase::Error) {
        Json::Value error(Json::objectValue);
        error["kind"] = error_kind_name(error_kind_);
        error["category"] = error_category_name(error_category(error_kind_));
        error["message"] = error_message_;
        error["remediation"] = remediation_name(remediation_);
        error["remediation_text"] = remediation_text(remediation_);
        payload["error"] = error;
    }

    std::cout << "[state] " << phase_name(from) << " -> " << phase_name(to);
    if (!reason.empty()) std::cout << " (" << reason << ")";
    std::cout << std::endl;

    // Emitted under the lock so observers see phase changes in order
    events_.emit(UiEventType::PhaseChanged, std::move(payload));
    return true;
}

void SessionStateMachine::set_error_locked(ErrorKind kind, Remediation remediation, const std::string& message) {
    error_kind_ = kind;
    remediation_ = remediation;
    error_message_ = message;
}

} // namespace voxbridge
