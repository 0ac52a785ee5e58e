#pragma once

#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace voxbridge {

// Hard ceiling for the recording cap, whatever the config file says
constexpr int MAX_RECORDING_HARD_LIMIT_MS = 300000;

// Paste delay is clamped into this range
constexpr int MIN_PASTE_DELAY_MS = 10;
constexpr int MAX_PASTE_DELAY_MS = 500;

// Per-method request timeouts in milliseconds
inline std::map<std::string, int> default_method_timeouts() {
    return {
        {"system.ping", 1000},
        {"system.info", 2000},
        {"system.shutdown", 2000},
        {"audio.list_devices", 2000},
        {"audio.set_device", 2000},
        {"audio.meter_start", 2000},
        {"audio.meter_stop", 2000},
        {"model.get_status", 2000},
        {"model.install", 10000},
        {"model.purge_cache", 10000},
        {"asr.initialize", 1200000},
        {"recording.start", 2000},
        {"recording.stop", 2000},
        {"recording.cancel", 2000},
        {"replacements.set_rules", 2000},
        {"status.get", 2000},
    };
}

struct WorkerConfig {
    std::string command = "voxbridge-worker";
    std::vector<std::string> args;
    bool echo_stderr = false;       // Mirror worker stderr to our stderr
    size_t log_max_lines = 500;
    size_t log_max_bytes = 256 * 1024;
    int shutdown_grace_ms = 500;    // After system.shutdown, before SIGTERM
};

struct RpcConfig {
    int default_timeout_ms = 5000;
    std::map<std::string, int> method_timeout_ms = default_method_timeouts();
    // A timeout on one of these is fatal instead of retried
    std::vector<std::string> long_running_methods = {"asr.initialize"};
};

struct SupervisorConfig {
    int base_delay_ms = 250;
    int max_delay_ms = 10000;
    int max_attempts = 5;           // Consecutive failures before the circuit opens
    int healthy_reset_ms = 60000;   // Uptime that clears the failure count
};

struct WatchdogConfig {
    bool enabled = true;
    int interval_ms = 10000;
    int hang_window_ms = 30000;
    int resume_gap_min_ms = 20000;  // Gap is max(3 * interval, this)
};

struct RecordingConfig {
    int max_duration_ms = 60000;
    int min_duration_ms = 250;
    int transcription_timeout_ms = 60000;
    std::string device_uid;         // Empty = system default
};

// Per-application injection override, keyed by process name
struct AppOverride {
    int paste_delay_ms = -1;        // -1 = use the global delay
    bool use_clipboard_only = false;
};

struct InjectionConfig {
    bool auto_paste = true;
    int paste_delay_ms = 40;
    bool restore_clipboard = true;
    int restore_delay_ms = 50;
    std::string suffix = " ";
    bool focus_guard_enabled = true;
    std::map<std::string, AppOverride> app_overrides;
};

struct ModelConfig {
    std::string model_id = "parakeet-tdt-0.6b-v3";
    std::string device_pref = "auto";
    bool auto_initialize = true;    // Run asr.initialize after every worker start
};

enum class HotkeyMode {
    Hold,       // Press to record, release to stop
    Toggle      // Press to start, press again to stop
};

struct HotkeyConfig {
    uint32_t keycode = 0;           // Platform-specific, 0 = default
    HotkeyMode mode = HotkeyMode::Hold;
    int double_tap_window_ms = 300; // Toggle mode: second press inside this cancels
};

struct Config {
    WorkerConfig worker;
    RpcConfig rpc;
    SupervisorConfig supervisor;
    WatchdogConfig watchdog;
    RecordingConfig recording;
    InjectionConfig injection;
    ModelConfig model;
    HotkeyConfig hotkey;

    size_t history_size = 100;
    bool log_stale_events = true;
};

// ~/.voxbridge/config.json
std::string default_config_path();

// Overlay values found in a JSON config file onto config.
// A missing file is not an error. A malformed file leaves config untouched.
bool load_config_file(const std::string& path, Config& config, std::string* error = nullptr);

// Clamp values into their supported ranges
void sanitize_config(Config& config);

const char* hotkey_mode_name(HotkeyMode mode);
bool parse_hotkey_mode(const std::string& name, HotkeyMode& mode);

// Default hotkey codes
#ifdef PLATFORM_LINUX
    constexpr uint32_t DEFAULT_HOTKEY = 108; // Right Alt key
#else
    constexpr uint32_t DEFAULT_HOTKEY = 0;
#endif

} // namespace voxbridge
