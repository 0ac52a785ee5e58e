#pragma once

#include "config.hpp"
#include "capabilities.hpp"
#include "ui_events.hpp"
#include "session_state.hpp"
#include "worker_supervisor.hpp"
#include "watchdog.hpp"
#include "model_cache.hpp"
#include "notification_router.hpp"
#include "recording_controller.hpp"
#include "injection_controller.hpp"
#include "transcript_history.hpp"
#include "replacement_rules.hpp"
#include "hotkey_manager.hpp"
#include "clipboard.hpp"

#include <memory>
#include <atomic>
#include <string>
#include <vector>
#include <mutex>
#include <condition_variable>
#include <thread>

namespace voxbridge {

class App {
public:
    App();
    ~App();

    // Initialize all components and start the worker
    bool initialize(const Config& config);
    void shutdown();

    // Run the application (blocking)
    int run();

    // Stop the application
    void quit();
    bool quitting() const { return should_quit_.load(); }

    Phase phase() const;

    // Enable/disable hotkey listening
    void set_enabled(bool enabled);
    bool is_enabled() const;

    // Block until the worker completed its handshake
    bool wait_for_worker(int timeout_ms);

    // Actions for a UI layer
    ControlResult start_recording();
    ControlResult stop_recording();
    ControlResult cancel_recording();
    void restart_worker();
    ModelActionResult download_model(const std::string& model_id = "");
    ModelActionResult purge_model(const std::string& model_id = "");
    ModelActionResult load_model(const std::string& model_id = "");
    bool acknowledge_error();

    Json::Value list_devices();
    bool set_device(const std::string& device_uid);
    bool meter_start();
    bool meter_stop();

    void on_power_event(PowerEvent event);

    Capabilities capabilities() const;
    void refresh_capabilities();

    EventEmitter& events() { return events_; }
    const TranscriptHistory& history() const { return history_; }
    ModelStatus model_status() const;
    WorkerHealth worker_health() const;

private:
    void on_hotkey(bool pressed);
    void on_transcript(const std::string& session_id, const std::string& text);
    void on_injection_done(const InjectionResult& result);
    bool check_ready(std::string& reason) const;

    // Post-handshake work, off the supervisor thread
    void maintenance_loop();
    void prepare_worker();

    Config config_;
    EventEmitter events_;
    TranscriptHistory history_;
    std::vector<ReplacementRule> rules_;

    mutable std::mutex caps_mutex_;
    Capabilities caps_;

    std::unique_ptr<SessionStateMachine> session_;
    std::unique_ptr<WorkerSupervisor> supervisor_;
    std::unique_ptr<Watchdog> watchdog_;
    std::unique_ptr<ModelCache> models_;
    std::unique_ptr<NotificationRouter> router_;
    std::unique_ptr<InjectionBackend> backend_;
    std::unique_ptr<InjectionController> injector_;
    std::unique_ptr<RecordingController> recorder_;
    std::unique_ptr<HotkeyManager> hotkey_;

    std::mutex work_mutex_;
    std::condition_variable work_cv_;
    bool prepare_pending_ = false;
    bool init_pending_ = false;
    std::atomic<bool> awaiting_model_{false};
    std::thread maintenance_thread_;

    std::atomic<bool> should_quit_{false};
    bool initialized_ = false;
};

// Platform-specific status indicator
bool create_status_indicator(App* app);
void destroy_status_indicator();

} // namespace voxbridge
