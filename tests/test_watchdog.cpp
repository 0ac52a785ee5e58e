// Tests for the Watchdog and the restart policy

#include "watchdog.hpp"
#include "restart_policy.hpp"
#include "test_support.hpp"
#include <iostream>
#include <cassert>
#include <atomic>
#include <thread>

using namespace voxbridge;
using namespace voxbridge::testing;

static bool wait_until(const std::function<bool()>& done, int timeout_ms = 3000) {
    for (int waited = 0; waited < timeout_ms; waited += 10) {
        if (done()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return done();
}

static RpcResult probe_timeout(const std::string& method, const Json::Value&) {
    if (method == "system.ping") {
        return RpcResult::failure(RpcStatus::Timeout, ErrorKind::Timeout, "system.ping timed out");
    }
    return RpcResult::ok(Json::Value(Json::objectValue));
}

void test_backoff_schedule() {
    std::cout << "Testing restart backoff schedule..." << std::endl;

    assert(RestartPolicy::delay_for_attempt(1, 250, 10000) == 250);
    assert(RestartPolicy::delay_for_attempt(2, 250, 10000) == 500);
    assert(RestartPolicy::delay_for_attempt(3, 250, 10000) == 1000);
    assert(RestartPolicy::delay_for_attempt(4, 250, 10000) == 2000);
    assert(RestartPolicy::delay_for_attempt(5, 250, 10000) == 4000);
    assert(RestartPolicy::delay_for_attempt(7, 250, 10000) == 10000);
    assert(RestartPolicy::delay_for_attempt(60, 250, 10000) == 10000);
    assert(RestartPolicy::delay_for_attempt(0, 250, 10000) == 250);

    std::cout << "  PASS" << std::endl;
}

void test_circuit_opens() {
    std::cout << "Testing circuit opens after repeated failures..." << std::endl;

    SupervisorConfig config;
    RestartPolicy policy(config);
    assert(policy.state() == CircuitState::Closed);
    assert(policy.next_delay_ms() == 250);

    for (int i = 1; i <= 4; ++i) {
        assert(policy.record_failure());
        assert(policy.allows_restart());
    }
    assert(policy.next_delay_ms() == 2000);

    assert(!policy.record_failure());
    assert(policy.state() == CircuitState::Open);
    assert(!policy.allows_restart());
    assert(policy.consecutive_failures() == 5);

    std::cout << "  PASS" << std::endl;
}

void test_half_open() {
    std::cout << "Testing half-open trial..." << std::endl;

    SupervisorConfig config;
    config.max_attempts = 2;
    RestartPolicy policy(config);
    policy.record_failure();
    policy.record_failure();
    assert(policy.state() == CircuitState::Open);

    // User restart, the trial fails: straight back to open
    policy.manual_reset();
    assert(policy.state() == CircuitState::HalfOpen);
    assert(policy.allows_restart());
    assert(!policy.record_failure());
    assert(policy.state() == CircuitState::Open);

    // User restart, the trial succeeds
    policy.manual_reset();
    policy.record_success();
    assert(policy.state() == CircuitState::Closed);
    assert(policy.consecutive_failures() == 0);

    // A long healthy run forgets earlier crashes
    assert(policy.record_failure());
    policy.record_healthy_period();
    assert(policy.consecutive_failures() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_hang_window() {
    std::cout << "Testing hang verdict after the window..." << std::endl;

    FakeChannel channel;
    WatchdogConfig config;
    config.interval_ms = 6000;
    config.hang_window_ms = 30000;
    Watchdog watchdog(config, channel);

    auto t0 = Watchdog::Clock::now();
    watchdog.reset(t0);
    assert(watchdog.status() == HealthStatus::Healthy);

    // Probes every 6s fail; silence reaches 30s on the fifth
    for (int i = 1; i <= 5; ++i) {
        HealthStatus s = watchdog.record_probe(false, t0 + std::chrono::seconds(6 * i));
        assert(s == HealthStatus::Unhealthy);
    }
    assert(watchdog.missed_probes() == 5);
    assert(watchdog.record_probe(false, t0 + std::chrono::seconds(36)) == HealthStatus::Hung);

    // One answer clears it
    assert(watchdog.record_probe(true, t0 + std::chrono::seconds(40)) == HealthStatus::Healthy);
    assert(watchdog.missed_probes() == 0);
    assert(watchdog.record_probe(false, t0 + std::chrono::seconds(50)) == HealthStatus::Unhealthy);

    std::cout << "  PASS" << std::endl;
}

void test_resume_gap() {
    std::cout << "Testing suspend detection from the wall clock..." << std::endl;

    FakeChannel channel;
    WatchdogConfig config;
    config.interval_ms = 10000;
    Watchdog watchdog(config, channel);
    assert(watchdog.resume_gap_ms() == 30000);

    auto w0 = Watchdog::WallClock::now();
    assert(!watchdog.check_resume_gap(w0));
    assert(!watchdog.check_resume_gap(w0 + std::chrono::seconds(10)));
    assert(!watchdog.check_resume_gap(w0 + std::chrono::seconds(40)));
    assert(watchdog.check_resume_gap(w0 + std::chrono::seconds(41 + 30)));

    WatchdogConfig fast;
    fast.interval_ms = 100;
    Watchdog quick(fast, channel);
    assert(quick.resume_gap_ms() == 20000);

    std::cout << "  PASS" << std::endl;
}

void test_revalidate() {
    std::cout << "Testing re-validation after resume..." << std::endl;

    FakeChannel channel;
    Json::Value devices(Json::objectValue);
    devices["devices"] = Json::Value(Json::arrayValue);
    devices["devices"].append(Json::Value(Json::objectValue));
    channel.reply_ok("audio.list_devices", devices);

    Watchdog watchdog(WatchdogConfig(), channel);
    int resumed = 0;
    watchdog.set_resume_handler([&]() { ++resumed; });

    watchdog.revalidate();
    assert(channel.count("system.ping") == 1);
    assert(channel.count("audio.list_devices") == 1);
    assert(resumed == 1);
    assert(watchdog.status() == HealthStatus::Healthy);

    // Worker unreachable: nothing else is checked
    channel.set_handler(probe_timeout);
    watchdog.revalidate();
    assert(channel.count("audio.list_devices") == 1);
    assert(resumed == 1);
    assert(watchdog.status() == HealthStatus::Unhealthy);

    std::cout << "  PASS" << std::endl;
}

void test_loop_reports_hang() {
    std::cout << "Testing probe loop reports a hung worker..." << std::endl;

    FakeChannel channel;
    channel.set_handler(probe_timeout);

    WatchdogConfig config;
    config.interval_ms = 50;
    config.hang_window_ms = 200;
    Watchdog watchdog(config, channel);

    std::atomic<int> hangs{0};
    watchdog.set_ready_check([]() { return true; });
    watchdog.set_hang_handler([&](const std::string&) { hangs.fetch_add(1); });
    watchdog.start();

    assert(wait_until([&]() { return hangs.load() >= 1; }));
    watchdog.stop();

    // Several probes missed before the verdict
    assert(channel.count("system.ping") >= 4);

    std::cout << "  PASS" << std::endl;
}

void test_loop_healthy_and_idle() {
    std::cout << "Testing probe loop with a healthy worker..." << std::endl;

    FakeChannel channel;
    WatchdogConfig config;
    config.interval_ms = 30;
    Watchdog watchdog(config, channel);

    std::atomic<bool> ready{false};
    std::atomic<int> ok{0};
    watchdog.set_ready_check([&]() { return ready.load(); });
    watchdog.set_probe_listener([&]() { ok.fetch_add(1); });
    watchdog.start();

    // No worker, no probes
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    assert(channel.count("system.ping") == 0);
    assert(watchdog.status() == HealthStatus::NotRunning);

    ready.store(true);
    assert(wait_until([&]() { return ok.load() >= 3; }));
    assert(watchdog.status() == HealthStatus::Healthy);
    watchdog.stop();

    std::cout << "  PASS" << std::endl;
}

void test_power_resume_event() {
    std::cout << "Testing resume notification triggers re-validation..." << std::endl;

    FakeChannel channel;
    WatchdogConfig config;
    config.interval_ms = 60000;
    Watchdog watchdog(config, channel);

    std::atomic<int> resumed{0};
    watchdog.set_resume_handler([&]() { resumed.fetch_add(1); });
    watchdog.start();

    watchdog.on_power_event(PowerEvent::Suspending);
    watchdog.on_power_event(PowerEvent::Resumed);
    assert(wait_until([&]() { return resumed.load() == 1; }));
    assert(channel.count("audio.list_devices") == 1);
    watchdog.stop();

    std::cout << "  PASS" << std::endl;
}

void test_disabled() {
    std::cout << "Testing disabled watchdog..." << std::endl;

    FakeChannel channel;
    WatchdogConfig config;
    config.enabled = false;
    config.interval_ms = 10;
    Watchdog watchdog(config, channel);
    watchdog.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    watchdog.stop();
    assert(channel.calls().empty());

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Watchdog Test Suite ===" << std::endl << std::endl;

    test_backoff_schedule();
    test_circuit_opens();
    test_half_open();
    test_hang_window();
    test_resume_gap();
    test_revalidate();
    test_loop_reports_hang();
    test_loop_healthy_and_idle();
    test_power_resume_event();
    test_disabled();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
