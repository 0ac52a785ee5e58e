// Tests for configuration loading, error kinds, capability policy,
// hotkey edges and the UI event emitter

#include "config.hpp"
#include "error_kind.hpp"
#include "capabilities.hpp"
#include "hotkey_manager.hpp"
#include "ui_events.hpp"
#include <iostream>
#include <cassert>
#include <fstream>
#include <filesystem>
#include <unistd.h>

using namespace voxbridge;

static std::string write_temp(const std::string& name, const std::string& contents) {
    std::string path = (std::filesystem::temp_directory_path() /
                        ("voxbridge_" + std::to_string(getpid()) + "_" + name)).string();
    std::ofstream file(path);
    file << contents;
    return path;
}

void test_defaults() {
    std::cout << "Testing config defaults..." << std::endl;

    Config config;
    assert(config.recording.max_duration_ms == 60000);
    assert(config.recording.min_duration_ms == 250);
    assert(config.supervisor.base_delay_ms == 250);
    assert(config.supervisor.max_delay_ms == 10000);
    assert(config.supervisor.max_attempts == 5);
    assert(config.watchdog.interval_ms == 10000);
    assert(config.watchdog.hang_window_ms == 30000);
    assert(config.injection.paste_delay_ms >= MIN_PASTE_DELAY_MS);
    assert(config.rpc.method_timeout_ms.at("asr.initialize") == 1200000);
    assert(config.hotkey.mode == HotkeyMode::Hold);

    std::cout << "  PASS" << std::endl;
}

void test_load_file() {
    std::cout << "Testing config file overlay..." << std::endl;

    std::string path = write_temp("config.json", R"({
        "worker": {"command": "/opt/worker", "args": ["--verbose"]},
        "rpc": {"method_timeout_ms": {"recording.stop": 4000}},
        "recording": {"max_duration_ms": 90000, "device_uid": "usb-1"},
        "injection": {"auto_paste": false, "app_overrides": {"kitty": {"use_clipboard_only": true}}},
        "model": {"model_id": "tiny-en"},
        "hotkey": {"keycode": 97, "mode": "toggle"},
        "history_size": 20
    })");

    Config config;
    std::string error;
    assert(load_config_file(path, config, &error));
    assert(config.worker.command == "/opt/worker");
    assert(config.worker.args.size() == 1 && config.worker.args[0] == "--verbose");
    assert(config.rpc.method_timeout_ms["recording.stop"] == 4000);
    // Untouched entries keep their defaults
    assert(config.rpc.method_timeout_ms["system.ping"] == 1000);
    assert(config.recording.max_duration_ms == 90000);
    assert(config.recording.device_uid == "usb-1");
    assert(!config.injection.auto_paste);
    assert(config.injection.app_overrides["kitty"].use_clipboard_only);
    assert(config.model.model_id == "tiny-en");
    assert(config.hotkey.keycode == 97);
    assert(config.hotkey.mode == HotkeyMode::Toggle);
    assert(config.history_size == 20);

    std::filesystem::remove(path);
    std::cout << "  PASS" << std::endl;
}

void test_load_errors() {
    std::cout << "Testing missing and malformed config files..." << std::endl;

    Config config;
    assert(load_config_file("", config));
    assert(load_config_file("/nonexistent/voxbridge/config.json", config));

    std::string path = write_temp("bad.json", "{ \"worker\": ");
    config.model.model_id = "keep-me";
    std::string error;
    assert(!load_config_file(path, config, &error));
    assert(!error.empty());
    assert(config.model.model_id == "keep-me");
    std::filesystem::remove(path);

    path = write_temp("array.json", "[1, 2, 3]");
    assert(!load_config_file(path, config, &error));
    std::filesystem::remove(path);

    // An unknown mode keeps the previous one
    path = write_temp("mode.json", R"({"hotkey": {"mode": "chord"}})");
    config.hotkey.mode = HotkeyMode::Toggle;
    assert(load_config_file(path, config));
    assert(config.hotkey.mode == HotkeyMode::Toggle);
    std::filesystem::remove(path);

    std::cout << "  PASS" << std::endl;
}

void test_sanitize() {
    std::cout << "Testing config clamping..." << std::endl;

    Config config;
    config.recording.max_duration_ms = 3600000;
    config.recording.min_duration_ms = -5;
    config.recording.transcription_timeout_ms = 10;
    config.injection.paste_delay_ms = 0;
    config.injection.restore_delay_ms = 99999;
    config.injection.app_overrides["slow"].paste_delay_ms = 10000;
    config.supervisor.base_delay_ms = 0;
    config.supervisor.max_delay_ms = -1;
    config.supervisor.max_attempts = 0;
    config.watchdog.interval_ms = 5;
    config.watchdog.hang_window_ms = 1;
    config.history_size = 0;

    sanitize_config(config);
    assert(config.recording.max_duration_ms == MAX_RECORDING_HARD_LIMIT_MS);
    assert(config.recording.min_duration_ms == 0);
    assert(config.recording.transcription_timeout_ms == 1000);
    assert(config.injection.paste_delay_ms == MIN_PASTE_DELAY_MS);
    assert(config.injection.restore_delay_ms == 1000);
    assert(config.injection.app_overrides["slow"].paste_delay_ms == MAX_PASTE_DELAY_MS);
    assert(config.supervisor.base_delay_ms == 1);
    assert(config.supervisor.max_delay_ms == 1);
    assert(config.supervisor.max_attempts == 1);
    assert(config.watchdog.interval_ms == 100);
    assert(config.watchdog.hang_window_ms == 100);
    assert(config.history_size == 1);

    std::cout << "  PASS" << std::endl;
}

void test_error_kinds() {
    std::cout << "Testing error kinds..." << std::endl;

    assert(parse_error_kind("disk-full") == ErrorKind::DiskFull);
    assert(parse_error_kind("E_DISK_FULL") == ErrorKind::DiskFull);
    assert(parse_error_kind("microphone-permission-denied") == ErrorKind::MicPermissionDenied);
    assert(parse_error_kind("") == ErrorKind::None);
    assert(parse_error_kind("new-kind") == ErrorKind::Unknown);
    assert(error_kind_from_code(-32601) == ErrorKind::MethodNotFound);
    assert(error_kind_from_code(1) == ErrorKind::Unknown);

    // Names survive a round trip for every worker-reported kind
    for (ErrorKind k : {ErrorKind::NotReady, ErrorKind::DeviceNotFound, ErrorKind::NetworkFailure,
                        ErrorKind::CacheCorrupt, ErrorKind::ModelLoadFailure}) {
        assert(parse_error_kind(error_kind_name(k)) == k);
    }

    assert(error_category(ErrorKind::WorkerHung) == ErrorCategory::WorkerHealth);
    assert(error_category(ErrorKind::TranscriptionTimeout) == ErrorCategory::WorkerHealth);
    assert(error_category(ErrorKind::DeviceNotFound) == ErrorCategory::Capability);
    assert(error_category(ErrorKind::DiskFull) == ErrorCategory::Resource);
    assert(error_category(ErrorKind::ProtocolError) == ErrorCategory::Transport);

    assert(remediation_for(ErrorKind::MicPermissionDenied) == Remediation::GrantMicPermission);
    assert(remediation_for(ErrorKind::NetworkFailure) == Remediation::CheckNetwork);
    assert(remediation_for(ErrorKind::WorkerCrashed) == Remediation::RestartWorker);
    assert(remediation_for(ErrorKind::InvalidParams) == Remediation::None);
    assert(remediation_text(Remediation::None).empty());
    assert(!remediation_text(Remediation::ReinstallModel).empty());

    std::cout << "  PASS" << std::endl;
}

void test_effective_modes() {
    std::cout << "Testing capability policy..." << std::endl;

    Config config;
    Capabilities caps;
    caps.display_server = DisplayServer::X11;
    caps.paste_synthesis = true;
    caps.hotkey_release = true;
    apply_effective_modes(caps, config);
    assert(caps.effective_auto_paste);
    assert(caps.effective_hotkey_mode == HotkeyMode::Hold);
    assert(caps.reason.empty());

    // Wayland: no synthesized paste, no key release
    caps.display_server = DisplayServer::Wayland;
    caps.paste_synthesis = false;
    caps.hotkey_release = false;
    apply_effective_modes(caps, config);
    assert(!caps.effective_auto_paste);
    assert(caps.effective_hotkey_mode == HotkeyMode::Toggle);
    assert(caps.reason.find("Wayland") != std::string::npos);
    assert(caps.reason.find("toggle") != std::string::npos);

    // The user already chose clipboard-only and toggle: nothing to explain
    config.injection.auto_paste = false;
    config.hotkey.mode = HotkeyMode::Toggle;
    apply_effective_modes(caps, config);
    assert(caps.reason.empty());

    Json::Value json = caps.to_json();
    assert(json["display_server"].asString() == "wayland");
    assert(json["effective_hotkey_mode"].asString() == "toggle");

    std::cout << "  PASS" << std::endl;
}

void test_key_edges() {
    std::cout << "Testing hotkey edge detection..." << std::endl;

    KeyEdgeDetector keys(100);
    assert(keys.feed(30, 1) == 0);
    assert(keys.feed(100, 1) == 1);
    assert(keys.is_down());

    // Auto-repeat and duplicate presses
    assert(keys.feed(100, 2) == 0);
    assert(keys.feed(100, 2) == 0);
    assert(keys.feed(100, 1) == 0);

    assert(keys.feed(100, 0) == -1);
    assert(keys.feed(100, 0) == 0);
    assert(!keys.is_down());

    keys.feed(100, 1);
    keys.set_keycode(54);
    assert(!keys.is_down());
    assert(keys.feed(100, 0) == 0);
    assert(keys.feed(54, 1) == 1);

    std::cout << "  PASS" << std::endl;
}

void test_event_emitter() {
    std::cout << "Testing UI event fan-out..." << std::endl;

    EventEmitter events;
    std::vector<UiEvent> a;
    std::vector<UiEvent> b;
    int ta = events.subscribe([&](const UiEvent& e) { a.push_back(e); });
    events.subscribe([&](const UiEvent& e) { b.push_back(e); });

    uint64_t s1 = events.emit(UiEventType::WorkerHealth, Json::Value(Json::objectValue));
    uint64_t s2 = events.user_message("warning", "Check the microphone", true);
    assert(s2 == s1 + 1);
    assert(events.last_seq() == s2);

    assert(a.size() == 2 && b.size() == 2);
    assert(a[1].type == UiEventType::UserMessage);
    assert(a[1].payload["level"].asString() == "warning");
    assert(a[1].payload["blocking"].asBool());
    assert(a[1].payload["seq"].asUInt64() == s2);

    events.unsubscribe(ta);
    events.emit(UiEventType::AudioLevel, Json::Value(Json::objectValue));
    assert(a.size() == 2 && b.size() == 3);
    assert(std::string(ui_event_type_name(b[2].type)) == "audio_level");

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Config Test Suite ===" << std::endl << std::endl;

    test_defaults();
    test_load_file();
    test_load_errors();
    test_sanitize();
    test_error_kinds();
    test_effective_modes();
    test_key_edges();
    test_event_emitter();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
