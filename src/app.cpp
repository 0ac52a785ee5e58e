#include "app.hpp"
#include <iostream>
#include <chrono>

namespace voxbridge {

App::App() = default;

App::~App() {
    shutdown();
}

bool App::initialize(const Config& config) {
    config_ = config;
    sanitize_config(config_);
    history_.resize(config_.history_size);

    {
        std::lock_guard<std::mutex> lock(caps_mutex_);
        caps_ = detect_capabilities(config_);
    }
    Capabilities caps = capabilities();
    std::cout << "Display server: " << display_server_name(caps.display_server)
              << ", paste: " << (caps.effective_auto_paste ? "auto" : "clipboard only")
              << ", hotkey mode: " << hotkey_mode_name(caps.effective_hotkey_mode) << std::endl;
    if (!caps.reason.empty()) {
        std::cout << "Note: " << caps.reason << std::endl;
    }

    session_ = std::make_unique<SessionStateMachine>(events_);
    supervisor_ = std::make_unique<WorkerSupervisor>(config_, *session_, events_);
    models_ = std::make_unique<ModelCache>(config_.model, *supervisor_, *session_, events_);
    router_ = std::make_unique<NotificationRouter>(*session_, *models_, events_, config_.log_stale_events);

    backend_ = create_platform_backend();
    injector_ = std::make_unique<InjectionController>(config_.injection, *backend_, caps);

    recorder_ = std::make_unique<RecordingController>(
        config_.recording,
        caps.effective_hotkey_mode,
        config_.hotkey.double_tap_window_ms,
        *supervisor_, *session_, events_
    );

    watchdog_ = std::make_unique<Watchdog>(config_.watchdog, *supervisor_);

    // Replacement rules are pushed to every new worker
    rules_ = ReplacementRuleLoader::load_user_rules();
    ReplacementRuleLoader::create_default_rules_file();

    // Worker -> router -> session/model/UI
    supervisor_->set_notification_sink([this](Notification n) { router_->push(std::move(n)); });
    supervisor_->set_ready_callback([this](const WorkerInfo& info) {
        std::cout << "Worker ready (version " << (info.version.empty() ? "unknown" : info.version)
                  << ", protocol " << (info.protocol.empty() ? "unknown" : info.protocol) << ")" << std::endl;
        models_->reset_engine();
        {
            std::lock_guard<std::mutex> lock(work_mutex_);
            prepare_pending_ = true;
        }
        work_cv_.notify_all();
    });

    router_->set_transcript_handler([this](const std::string& session_id, const std::string& text) {
        on_transcript(session_id, text);
    });

    models_->set_ready_listener([this](const std::string& model_id) {
        if (model_id != config_.model.model_id || !awaiting_model_.exchange(false)) return;
        {
            std::lock_guard<std::mutex> lock(work_mutex_);
            init_pending_ = true;
        }
        work_cv_.notify_all();
    });

    recorder_->set_readiness_check([this](std::string& reason) { return check_ready(reason); });
    recorder_->set_stop_hook([this](const std::string& id) { injector_->capture_focus(id); });
    recorder_->set_abandon_hook([this](const std::string& id) { injector_->discard_focus(id); });

    watchdog_->set_ready_check([this]() { return supervisor_->health() == WorkerHealth::Ready; });
    watchdog_->set_probe_listener([this]() { supervisor_->note_probe_success(); });
    watchdog_->set_hang_handler([this](const std::string& detail) {
        supervisor_->force_restart(ErrorKind::WorkerHung, detail);
    });
    watchdog_->set_resume_handler([this]() { models_->refresh(); });

    // Initialize hotkey manager
    hotkey_ = std::make_unique<HotkeyManager>();
    if (!hotkey_->initialize()) {
        std::cerr << "Failed to initialize hotkey manager" << std::endl;
        return false;
    }
    uint32_t keycode = config_.hotkey.keycode != 0 ? config_.hotkey.keycode : DEFAULT_HOTKEY;
    hotkey_->set_hotkey(keycode);
    hotkey_->set_callback([this](bool pressed) { on_hotkey(pressed); });
    std::cout << "Hotkey manager initialized (keycode " << keycode << ")" << std::endl;

    if (!create_status_indicator(this)) {
        std::cerr << "Failed to create status indicator" << std::endl;
        // Continue anyway - not critical
    }

    router_->start();
    injector_->start();
    maintenance_thread_ = std::thread([this]() {
        maintenance_loop();
    });

    if (!supervisor_->start()) {
        std::cerr << "Failed to start worker supervision" << std::endl;
        initialized_ = true;
        shutdown();
        return false;
    }
    watchdog_->start();

    initialized_ = true;
    return true;
}

void App::shutdown() {
    if (!initialized_) return;
    initialized_ = false;
    quit();

    if (hotkey_) {
        hotkey_->stop();
    }
    if (watchdog_) {
        watchdog_->stop();
    }

    // Fails any in-flight call so the maintenance thread can finish
    if (supervisor_) {
        supervisor_->stop();
    }
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }

    if (router_) {
        router_->stop();
    }
    if (injector_) {
        injector_->stop();
    }

    destroy_status_indicator();
}

void App::quit() {
    should_quit_.store(true);
    work_cv_.notify_all();
}

int App::run() {
    if (!hotkey_->start()) {
        std::cerr << "Failed to start hotkey listener" << std::endl;
        return 1;
    }

    std::cout << "\n=== voxbridge ready ===" << std::endl;
    if (recorder_->mode() == HotkeyMode::Hold) {
        std::cout << "Hold the hotkey to record, release to transcribe and paste." << std::endl;
    } else {
        std::cout << "Press the hotkey to start recording, again to stop. Double-tap to cancel." << std::endl;
    }
    std::cout << std::endl;

    while (!should_quit_.load()) {
        recorder_->tick();
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    return 0;
}

Phase App::phase() const {
    return session_ ? session_->phase() : Phase::Idle;
}

void App::set_enabled(bool enabled) {
    session_->set_enabled(enabled);
    std::cout << (enabled ? "Dictation enabled" : "Dictation paused") << std::endl;
}

bool App::is_enabled() const {
    return session_ && session_->enabled();
}

bool App::wait_for_worker(int timeout_ms) {
    return supervisor_ && supervisor_->wait_for_ready(timeout_ms);
}

Capabilities App::capabilities() const {
    std::lock_guard<std::mutex> lock(caps_mutex_);
    return caps_;
}

void App::refresh_capabilities() {
    Capabilities caps = detect_capabilities(config_);
    {
        std::lock_guard<std::mutex> lock(caps_mutex_);
        caps_ = caps;
    }
    injector_->set_capabilities(caps);
    recorder_->set_mode(caps.effective_hotkey_mode);
    std::cout << "Capabilities refreshed: " << display_server_name(caps.display_server)
              << ", paste " << (caps.effective_auto_paste ? "available" : "unavailable") << std::endl;
}

ModelStatus App::model_status() const {
    return models_->status();
}

WorkerHealth App::worker_health() const {
    return supervisor_->health();
}

bool App::check_ready(std::string& reason) const {
    if (supervisor_->health() != WorkerHealth::Ready) {
        reason = std::string("Speech worker is not running (") + worker_health_name(supervisor_->health()) + ")";
        return false;
    }
    if (!models_->engine_ready()) {
        ModelStatus status = models_->status();
        reason = "Model " + status.model_id + " is not ready (" + model_state_name(status.state) + ")";
        return false;
    }
    return true;
}

void App::on_hotkey(bool pressed) {
    ControlResult result = recorder_->on_hotkey(pressed);
    if (!result.success && !result.noop && !result.message.empty()) {
        events_.user_message("warning", result.message);
    }
}

ControlResult App::start_recording() {
    return recorder_->start();
}

ControlResult App::stop_recording() {
    return recorder_->stop();
}

ControlResult App::cancel_recording() {
    return recorder_->cancel();
}

void App::restart_worker() {
    models_->reset_engine();
    supervisor_->restart();
}

ModelActionResult App::download_model(const std::string& model_id) {
    std::string id = model_id.empty() ? config_.model.model_id : model_id;
    if (id == config_.model.model_id && config_.model.auto_initialize) {
        awaiting_model_.store(true);
    }
    ModelActionResult result = models_->install(id);
    if (!result.success) awaiting_model_.store(false);
    return result;
}

ModelActionResult App::purge_model(const std::string& model_id) {
    return models_->purge(model_id);
}

ModelActionResult App::load_model(const std::string& model_id) {
    return models_->initialize_engine(model_id);
}

bool App::acknowledge_error() {
    return session_->recover();
}

Json::Value App::list_devices() {
    RpcResult result = supervisor_->call("audio.list_devices", Json::Value(Json::objectValue));
    if (!result.success) {
        std::cerr << "Could not list audio devices: " << result.error.message << std::endl;
        return Json::Value(Json::arrayValue);
    }
    if (result.result.isObject() && result.result["devices"].isArray()) {
        return result.result["devices"];
    }
    return result.result.isArray() ? result.result : Json::Value(Json::arrayValue);
}

bool App::set_device(const std::string& device_uid) {
    Json::Value params(Json::objectValue);
    params["device_uid"] = device_uid.empty() ? Json::Value(Json::nullValue) : Json::Value(device_uid);

    RpcResult result = supervisor_->call("audio.set_device", params);
    if (!result.success) {
        std::cerr << "Could not select audio device: " << result.error.message << std::endl;
        events_.user_message("error", "Could not select the audio device: " + result.error.message);
        return false;
    }
    recorder_->set_device(device_uid);
    std::cout << "Audio device: " << (device_uid.empty() ? "system default" : device_uid) << std::endl;
    return true;
}

bool App::meter_start() {
    RpcResult result = supervisor_->call("audio.meter_start", Json::Value(Json::objectValue));
    if (!result.success) {
        std::cerr << "Could not start the level meter: " << result.error.message << std::endl;
    }
    return result.success;
}

bool App::meter_stop() {
    RpcResult result = supervisor_->call("audio.meter_stop", Json::Value(Json::objectValue));
    if (!result.success) {
        std::cerr << "Could not stop the level meter: " << result.error.message << std::endl;
    }
    return result.success;
}

void App::on_power_event(PowerEvent event) {
    watchdog_->on_power_event(event);
}

void App::on_transcript(const std::string& session_id, const std::string& text) {
    TranscriptEntry entry;
    entry.session_id = session_id;
    entry.text = text;
    entry.timestamp = std::chrono::system_clock::now();
    entry.injection = "pending";
    history_.add(entry);

    std::cout << "Transcript: " << text << std::endl;
    injector_->enqueue(session_id, text, [this](const InjectionResult& result) {
        on_injection_done(result);
    });
}

void App::on_injection_done(const InjectionResult& result) {
    history_.set_outcome(result.session_id, injection_status_name(result.status), result.warning);

    switch (result.status) {
        case InjectionStatus::Injected:
            break;
        case InjectionStatus::ClipboardOnly:
            if (!result.warning.empty()) {
                events_.user_message("warning", result.message);
            }
            break;
        case InjectionStatus::Failed:
            events_.user_message("error", result.message + " The text is kept in history.");
            break;
    }
}

void App::maintenance_loop() {
    while (true) {
        bool prepare = false;
        bool init = false;
        {
            std::unique_lock<std::mutex> lock(work_mutex_);
            work_cv_.wait(lock, [this]() {
                return should_quit_.load() || prepare_pending_ || init_pending_;
            });
            if (should_quit_.load()) break;
            prepare = prepare_pending_;
            init = init_pending_;
            prepare_pending_ = false;
            init_pending_ = false;
        }

        if (prepare) {
            prepare_worker();
        } else if (init) {
            models_->initialize_engine();
        }
    }
}

void App::prepare_worker() {
    if (!rules_.empty()) {
        RpcResult result = supervisor_->call("replacements.set_rules", ReplacementRuleLoader::to_params(rules_));
        if (!result.success) {
            std::cerr << "Failed to push replacement rules: " << result.error.message << std::endl;
        }
    }

    if (!models_->refresh() || !config_.model.auto_initialize) return;

    ModelStatus status = models_->status();
    switch (status.state) {
        case ModelState::Missing:
            events_.user_message("info", "Downloading model " + status.model_id);
            download_model(status.model_id);
            break;
        case ModelState::Downloading:
        case ModelState::Verifying:
            awaiting_model_.store(true);
            break;
        default:
            models_->initialize_engine();
            break;
    }
}

} // namespace voxbridge
