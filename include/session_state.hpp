#pragma once

#include "error_kind.hpp"
#include "ui_events.hpp"

#include <string>
#include <mutex>
#include <chrono>
#include <cstdint>

namespace voxbridge {

enum class Phase {
    Idle,
    LoadingModel,
    Recording,
    Transcribing,
    Error
};

const char* phase_name(Phase phase);

// Self-transitions are not listed; callers treat them as no-ops
bool is_valid_transition(Phase from, Phase to);

// Value copy of the machine's state for readers
struct SessionSnapshot {
    Phase phase = Phase::Idle;
    std::string session_id;         // Most recent session, retired or not
    bool session_active = false;    // Recording or Transcribing and not yet retired
    uint64_t session_seq = 0;
    std::chrono::steady_clock::time_point started_at;
    std::chrono::steady_clock::time_point stopped_at;
    ErrorKind error_kind = ErrorKind::None;
    Remediation remediation = Remediation::None;
    std::string error_message;
    bool enabled = true;
};

// Authoritative pipeline state. Mints session ids, filters stale events
// and is the only place the phase changes. Every change is published as a
// phase_changed event.
class SessionStateMachine {
public:
    using Clock = std::chrono::steady_clock;

    explicit SessionStateMachine(EventEmitter& events);

    SessionSnapshot snapshot() const;
    Phase phase() const;
    std::string current_session_id() const;

    // Idle -> Recording under a fresh session id.
    // Returns the id, or empty with reject_reason set.
    std::string begin_session(Clock::time_point now, std::string* reject_reason = nullptr);

    // Recording -> Transcribing for the given session
    bool mark_transcribing(const std::string& session_id, Clock::time_point now);

    // Recording/Transcribing -> Idle without a result (cancel, too short).
    // Any later event for the session is stale.
    bool retire_session(const std::string& session_id, const std::string& reason);

    // True only for the live (not yet retired) session
    bool is_current(const std::string& session_id) const;

    // Accept a transcription result at most once. Moves to Idle.
    bool accept_completion(const std::string& session_id);

    // Accept a worker-reported failure at most once. Moves to Error.
    bool accept_error(const std::string& session_id, ErrorKind kind, const std::string& message);

    // Fail the given session if it is still live
    bool fail_session(const std::string& session_id, ErrorKind kind, Remediation remediation,
                      const std::string& message);

    // Any state -> Error. Retires the live session, if any.
    bool force_error(ErrorKind kind, Remediation remediation, const std::string& message);

    // Error -> Idle
    bool recover();

    // Idle|Error -> LoadingModel and back
    bool begin_loading();
    bool finish_loading(bool success, ErrorKind kind = ErrorKind::None,
                        Remediation remediation = Remediation::None,
                        const std::string& message = "");

    // Bump and return the per-session event counter; 0 if stale
    uint64_t next_event_seq(const std::string& session_id);

    // A paused machine refuses new sessions
    void set_enabled(bool enabled);
    bool enabled() const;

    // RFC 4122 version 4, lowercase hex
    static std::string generate_session_id();

private:
    bool transition_locked(Phase to, const std::string& reason);
    void set_error_locked(ErrorKind kind, Remediation remediation, const std::string& message);

    EventEmitter& events_;

    mutable std::mutex mutex_;
    Phase phase_ = Phase::Idle;
    std::string session_id_;
    bool session_active_ = false;
    uint64_t session_seq_ = 0;
    Clock::time_point started_at_;
    Clock::time_point stopped_at_;
    ErrorKind error_kind_ = ErrorKind::None;
    Remediation remediation_ = Remediation::None;
    std::string error_message_;
    bool enabled_ = true;
};

} // namespace voxbridge
