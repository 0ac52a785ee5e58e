#pragma once

#include "config.hpp"
#include "rpc_client.hpp"

#include <string>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <thread>
#include <chrono>
#include <functional>

namespace voxbridge {

enum class HealthStatus {
    Healthy,
    Unhealthy,  // Missed probe(s), still inside the hang window
    Hung,       // No successful probe for longer than the hang window
    NotRunning
};

const char* health_status_name(HealthStatus status);

enum class PowerEvent {
    Suspending,
    Resumed
};

// Liveness prober independent of process-exit detection. A worker that is
// alive but unresponsive past the hang window is reported as hung. Also
// re-validates the worker after suspend/resume.
class Watchdog {
public:
    using Clock = std::chrono::steady_clock;
    using WallClock = std::chrono::system_clock;

    Watchdog(const WatchdogConfig& config, RpcChannel& channel);
    ~Watchdog();

    // Hooks, set before start()
    void set_ready_check(std::function<bool()> check) { is_ready_ = std::move(check); }
    void set_hang_handler(std::function<void(const std::string&)> handler) { on_hang_ = std::move(handler); }
    void set_probe_listener(std::function<void()> listener) { on_probe_ok_ = std::move(listener); }
    void set_resume_handler(std::function<void()> handler) { on_resume_ = std::move(handler); }

    void start();
    void stop();

    // Fold one probe outcome into the health verdict
    HealthStatus record_probe(bool ok, Clock::time_point now);

    // Worker (re)started: the hang window begins at now
    void reset(Clock::time_point now);

    // True when the wall-clock gap since the previous check implies the
    // machine slept. The first call only records the time.
    bool check_resume_gap(WallClock::time_point now);

    void on_power_event(PowerEvent event);

    // Probe reachability, devices and model readiness after a resume
    void revalidate();

    HealthStatus status() const;
    int missed_probes() const;
    int resume_gap_ms() const;

private:
    void run_loop();
    bool probe_once();

    WatchdogConfig config_;
    RpcChannel& channel_;

    std::function<bool()> is_ready_;
    std::function<void(const std::string&)> on_hang_;
    std::function<void()> on_probe_ok_;
    std::function<void()> on_resume_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    HealthStatus status_ = HealthStatus::NotRunning;
    Clock::time_point last_success_;
    int missed_ = 0;
    bool have_wall_ = false;
    WallClock::time_point last_wall_;
    bool suspended_ = false;
    bool resume_pending_ = false;

    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace voxbridge
