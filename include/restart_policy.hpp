#pragma once

#include "config.hpp"

namespace voxbridge {

enum class CircuitState {
    Closed,     // Automatic restarts allowed
    Open,       // Too many consecutive failures; waiting for the user
    HalfOpen    // User asked for one more try
};

const char* circuit_state_name(CircuitState state);

// Crash-loop circuit breaker with exponential backoff.
// Not thread-safe; the supervisor serializes access.
class RestartPolicy {
public:
    explicit RestartPolicy(const SupervisorConfig& config);

    // Count one failed start or crash. Returns true if an automatic
    // restart may follow, false once the circuit is open.
    bool record_failure();

    // Handshake succeeded. Closes a half-open circuit.
    void record_success();

    // The worker stayed healthy long enough to forget past failures
    void record_healthy_period();

    // Explicit user restart: allow one more attempt
    void manual_reset();

    // Backoff before the next automatic restart
    int next_delay_ms() const;

    // min(base * 2^(attempt-1), ceiling) for attempt >= 1
    static int delay_for_attempt(int attempt, int base_ms, int max_ms);

    int consecutive_failures() const { return failures_; }
    CircuitState state() const { return state_; }
    bool allows_restart() const { return state_ != CircuitState::Open; }

private:
    SupervisorConfig config_;
    int failures_ = 0;
    CircuitState state_ = CircuitState::Closed;
};

} // namespace voxbridge
