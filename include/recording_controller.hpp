#pragma once

#include "config.hpp"
#include "error_kind.hpp"
#include "rpc_client.hpp"
#include "session_state.hpp"
#include "ui_events.hpp"

#include <string>
#include <mutex>
#include <chrono>
#include <functional>

namespace voxbridge {

struct ControlResult {
    bool success = false;
    bool noop = false;          // Duplicate trigger, nothing changed
    std::string session_id;
    std::string message;
    ErrorKind kind = ErrorKind::None;
};

// Turns user intent (start, stop, cancel, hotkey) into session transitions
// and worker calls. Enforces the recording time limits.
class RecordingController {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;
    using ReadinessCheck = std::function<bool(std::string& reason)>;
    using SessionHook = std::function<void(const std::string& session_id)>;

    RecordingController(const RecordingConfig& config, HotkeyMode mode, int double_tap_window_ms,
                        RpcChannel& channel, SessionStateMachine& session, EventEmitter& events);

    void set_clock(ClockFn clock) { clock_ = std::move(clock); }
    void set_readiness_check(ReadinessCheck check) { is_ready_ = std::move(check); }
    // Runs right before Recording -> Transcribing
    void set_stop_hook(SessionHook hook) { on_stop_ = std::move(hook); }
    // Runs when a session ends without a transcript
    void set_abandon_hook(SessionHook hook) { on_abandon_ = std::move(hook); }

    ControlResult start();
    ControlResult stop();
    ControlResult cancel();

    // Hotkey edge. Hold: press starts, release stops. Toggle: press
    // toggles, a second press inside the double-tap window cancels.
    ControlResult on_hotkey(bool pressed);

    // Max duration and transcription deadline; call periodically
    void tick();

    void set_mode(HotkeyMode mode);
    HotkeyMode mode() const;

    void set_device(const std::string& device_uid);

private:
    Clock::time_point now() const { return clock_ ? clock_() : Clock::now(); }
    ControlResult start_locked(Clock::time_point now);
    ControlResult stop_locked(Clock::time_point now, const std::string& reason);
    ControlResult cancel_locked(const std::string& reason);
    void abandon(const std::string& session_id);

    RecordingConfig config_;
    HotkeyMode mode_;
    int double_tap_window_ms_;
    RpcChannel& channel_;
    SessionStateMachine& session_;
    EventEmitter& events_;

    ClockFn clock_;
    ReadinessCheck is_ready_;
    SessionHook on_stop_;
    SessionHook on_abandon_;

    // Serializes user actions; the session machine has its own lock
    mutable std::mutex mutex_;
    std::string deadline_session_;
    Clock::time_point deadline_;
    bool have_press_ = false;
    Clock::time_point last_press_;
};

} // namespace voxbridge
