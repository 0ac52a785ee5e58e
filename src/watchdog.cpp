#include "watchdog.hpp"
#include <iostream>
#include <algorithm>

namespace voxbridge {

const char* health_status_name(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy: return "healthy";
        case HealthStatus::Unhealthy: return "unhealthy";
        case HealthStatus::Hung: return "hung";
        case HealthStatus::NotRunning: return "not_running";
    }
    return "not_running";
}

Watchdog::Watchdog(const WatchdogConfig& config, RpcChannel& channel)
    : config_(config), channel_(channel) {
}

Watchdog::~Watchdog() {
    stop();
}

void Watchdog::start() {
    if (running_.load() || !config_.enabled) return;

    running_.store(true);
    thread_ = std::thread([this]() {
        run_loop();
    });
}

void Watchdog::stop() {
    if (!running_.exchange(false)) return;
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

HealthStatus Watchdog::record_probe(bool ok, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ok) {
        last_success_ = now;
        missed_ = 0;
        status_ = HealthStatus::Healthy;
        return status_;
    }

    ++missed_;
    auto silent = now - last_success_;
    if (silent > std::chrono::milliseconds(config_.hang_window_ms)) {
        status_ = HealthStatus::Hung;
    } else {
        status_ = HealthStatus::Unhealthy;
    }
    return status_;
}

void Watchdog::reset(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_success_ = now;
    missed_ = 0;
    status_ = HealthStatus::Healthy;
}

int Watchdog::resume_gap_ms() const {
    return std::max(3 * config_.interval_ms, config_.resume_gap_min_ms);
}

bool Watchdog::check_resume_gap(WallClock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool resumed = false;
    if (have_wall_) {
        auto gap = now - last_wall_;
        resumed = gap > std::chrono::milliseconds(resume_gap_ms());
    }
    have_wall_ = true;
    last_wall_ = now;
    return resumed;
}

void Watchdog::on_power_event(PowerEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (event == PowerEvent::Suspending) {
            suspended_ = true;
        } else {
            suspended_ = false;
            resume_pending_ = true;
        }
    }
    std::cout << "[watchdog] power event: "
              << (event == PowerEvent::Suspending ? "suspending" : "resumed") << std::endl;
    cv_.notify_all();
}

void Watchdog::revalidate() {
    std::cout << "[watchdog] re-validating worker after resume" << std::endl;

    // The hang window restarts: time spent asleep is not silence
    reset(Clock::now());

    if (!probe_once()) {
        std::cerr << "[watchdog] worker unreachable after resume" << std::endl;
        return;
    }

    RpcResult devices = channel_.call("audio.list_devices", Json::Value(Json::objectValue));
    if (devices.success) {
        const Json::Value& list = devices.result.isObject() ? devices.result["devices"] : devices.result;
        std::cout << "[watchdog] " << (list.isArray() ? list.size() : 0u)
                  << " audio device(s) available" << std::endl;
    } else {
        std::cerr << "[watchdog] device check failed: " << devices.error.message << std::endl;
    }

    if (on_resume_) on_resume_();
}

HealthStatus Watchdog::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

int Watchdog::missed_probes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return missed_;
}

bool Watchdog::probe_once() {
    RpcResult result = channel_.call("system.ping", Json::Value(Json::objectValue));
    HealthStatus status = record_probe(result.success, Clock::now());
    if (result.success) {
        if (on_probe_ok_) on_probe_ok_();
        return true;
    }

    std::cerr << "[watchdog] probe failed (" << result.error.message << "), status "
              << health_status_name(status) << std::endl;
    if (status == HealthStatus::Hung) {
        std::string detail = "no response to liveness probe for over " +
                             std::to_string(config_.hang_window_ms / 1000) + "s";
        if (on_hang_) on_hang_(detail);
        // A fresh window starts with the next worker
        reset(Clock::now());
    }
    return false;
}

void Watchdog::run_loop() {
    bool was_ready = false;
    check_resume_gap(WallClock::now());

    while (running_.load()) {
        bool resume = false;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, std::chrono::milliseconds(config_.interval_ms), [this]() {
                return !running_.load() || resume_pending_;
            });
            if (!running_.load()) break;
            resume = resume_pending_;
            resume_pending_ = false;
            if (suspended_) continue;
        }

        resume = check_resume_gap(WallClock::now()) || resume;

        bool ready = is_ready_ ? is_ready_() : true;
        if (!ready) {
            std::lock_guard<std::mutex> lock(mutex_);
            status_ = HealthStatus::NotRunning;
            was_ready = false;
            continue;
        }
        if (!was_ready) {
            // First tick with this worker: start the hang window now
            reset(Clock::now());
            was_ready = true;
        }

        if (resume) {
            revalidate();
        } else {
            probe_once();
        }
    }
}

} // namespace voxbridge
