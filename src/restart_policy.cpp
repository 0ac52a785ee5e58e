#include "restart_policy.hpp"
#include <iostream>
#include <algorithm>

namespace voxbridge {

const char* circuit_state_name(CircuitState state) {
    switch (state) {
        case CircuitState::Closed: return "closed";
        case CircuitState::Open: return "open";
        case CircuitState::HalfOpen: return "half-open";
    }
    return "closed";
}

RestartPolicy::RestartPolicy(const SupervisorConfig& config)
    : config_(config) {
}

bool RestartPolicy::record_failure() {
    ++failures_;

    if (state_ == CircuitState::HalfOpen) {
        // The trial attempt failed
        state_ = CircuitState::Open;
    } else if (failures_ >= config_.max_attempts) {
        state_ = CircuitState::Open;
    }

    if (state_ == CircuitState::Open) {
        std::cerr << "Worker failed " << failures_ << " consecutive times; circuit open" << std::endl;
        return false;
    }
    return true;
}

void RestartPolicy::record_success() {
    if (state_ == CircuitState::HalfOpen) {
        state_ = CircuitState::Closed;
        failures_ = 0;
    }
}

void RestartPolicy::record_healthy_period() {
    if (state_ == CircuitState::Closed) {
        failures_ = 0;
    }
}

void RestartPolicy::manual_reset() {
    state_ = CircuitState::HalfOpen;
    failures_ = 0;
}

int RestartPolicy::next_delay_ms() const {
    return delay_for_attempt(std::max(failures_, 1), config_.base_delay_ms, config_.max_delay_ms);
}

int RestartPolicy::delay_for_attempt(int attempt, int base_ms, int max_ms) {
    if (attempt < 1) attempt = 1;
    long long delay = base_ms;
    for (int i = 1; i < attempt && delay < max_ms; ++i) {
        delay *= 2;
    }
    return static_cast<int>(std::min<long long>(delay, max_ms));
}

} // namespace voxbridge
