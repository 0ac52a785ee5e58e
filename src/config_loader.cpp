#include "config.hpp"
#include "json_util.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdlib>

namespace voxbridge {

namespace {

void read_int(const Json::Value& obj, const char* key, int& target) {
    if (obj.isObject() && obj[key].isInt()) target = obj[key].asInt();
}

void read_size(const Json::Value& obj, const char* key, size_t& target) {
    if (obj.isObject() && obj[key].isUInt64()) target = static_cast<size_t>(obj[key].asUInt64());
}

void read_bool(const Json::Value& obj, const char* key, bool& target) {
    if (obj.isObject() && obj[key].isBool()) target = obj[key].asBool();
}

void read_string(const Json::Value& obj, const char* key, std::string& target) {
    if (obj.isObject() && obj[key].isString()) target = obj[key].asString();
}

void apply_worker(const Json::Value& v, WorkerConfig& c) {
    if (!v.isObject()) return;
    read_string(v, "command", c.command);
    if (v["args"].isArray()) {
        c.args.clear();
        for (const auto& arg : v["args"]) {
            if (arg.isString()) c.args.push_back(arg.asString());
        }
    }
    read_bool(v, "echo_stderr", c.echo_stderr);
    read_size(v, "log_max_lines", c.log_max_lines);
    read_size(v, "log_max_bytes", c.log_max_bytes);
    read_int(v, "shutdown_grace_ms", c.shutdown_grace_ms);
}

void apply_rpc(const Json::Value& v, RpcConfig& c) {
    if (!v.isObject()) return;
    read_int(v, "default_timeout_ms", c.default_timeout_ms);
    const Json::Value& timeouts = v["method_timeout_ms"];
    if (timeouts.isObject()) {
        for (const auto& name : timeouts.getMemberNames()) {
            if (timeouts[name].isInt()) c.method_timeout_ms[name] = timeouts[name].asInt();
        }
    }
    if (v["long_running_methods"].isArray()) {
        c.long_running_methods.clear();
        for (const auto& m : v["long_running_methods"]) {
            if (m.isString()) c.long_running_methods.push_back(m.asString());
        }
    }
}

void apply_injection(const Json::Value& v, InjectionConfig& c) {
    if (!v.isObject()) return;
    read_bool(v, "auto_paste", c.auto_paste);
    read_int(v, "paste_delay_ms", c.paste_delay_ms);
    read_bool(v, "restore_clipboard", c.restore_clipboard);
    read_int(v, "restore_delay_ms", c.restore_delay_ms);
    read_string(v, "suffix", c.suffix);
    read_bool(v, "focus_guard_enabled", c.focus_guard_enabled);

    const Json::Value& overrides = v["app_overrides"];
    if (overrides.isObject()) {
        for (const auto& app : overrides.getMemberNames()) {
            AppOverride o;
            read_int(overrides[app], "paste_delay_ms", o.paste_delay_ms);
            read_bool(overrides[app], "use_clipboard_only", o.use_clipboard_only);
            c.app_overrides[app] = o;
        }
    }
}

} // namespace

std::string default_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.voxbridge/config.json";
}

bool load_config_file(const std::string& path, Config& config, std::string* error) {
    if (path.empty()) return true;

    std::ifstream file(path);
    if (!file.is_open()) {
        // No config file yet - defaults apply
        return true;
    }

    std::stringstream contents;
    contents << file.rdbuf();

    Json::Value root;
    std::string parse_error;
    if (!parse_json(contents.str(), root, &parse_error) || !root.isObject()) {
        std::cerr << "Ignoring malformed config file " << path << ": " << parse_error << std::endl;
        if (error) *error = parse_error.empty() ? "config root is not an object" : parse_error;
        return false;
    }

    Config loaded = config;

    apply_worker(root["worker"], loaded.worker);
    apply_rpc(root["rpc"], loaded.rpc);

    const Json::Value& sup = root["supervisor"];
    read_int(sup, "base_delay_ms", loaded.supervisor.base_delay_ms);
    read_int(sup, "max_delay_ms", loaded.supervisor.max_delay_ms);
    read_int(sup, "max_attempts", loaded.supervisor.max_attempts);
    read_int(sup, "healthy_reset_ms", loaded.supervisor.healthy_reset_ms);

    const Json::Value& wd = root["watchdog"];
    read_bool(wd, "enabled", loaded.watchdog.enabled);
    read_int(wd, "interval_ms", loaded.watchdog.interval_ms);
    read_int(wd, "hang_window_ms", loaded.watchdog.hang_window_ms);
    read_int(wd, "resume_gap_min_ms", loaded.watchdog.resume_gap_min_ms);

    const Json::Value& rec = root["recording"];
    read_int(rec, "max_duration_ms", loaded.recording.max_duration_ms);
    read_int(rec, "min_duration_ms", loaded.recording.min_duration_ms);
    read_int(rec, "transcription_timeout_ms", loaded.recording.transcription_timeout_ms);
    read_string(rec, "device_uid", loaded.recording.device_uid);

    apply_injection(root["injection"], loaded.injection);

    const Json::Value& model = root["model"];
    read_string(model, "model_id", loaded.model.model_id);
    read_string(model, "device_pref", loaded.model.device_pref);
    read_bool(model, "auto_initialize", loaded.model.auto_initialize);

    const Json::Value& hotkey = root["hotkey"];
    if (hotkey.isObject() && hotkey["keycode"].isUInt()) {
        loaded.hotkey.keycode = hotkey["keycode"].asUInt();
    }
    std::string mode;
    read_string(hotkey, "mode", mode);
    if (!mode.empty() && !parse_hotkey_mode(mode, loaded.hotkey.mode)) {
        std::cerr << "Unknown hotkey mode '" << mode << "', keeping "
                  << hotkey_mode_name(loaded.hotkey.mode) << std::endl;
    }
    read_int(hotkey, "double_tap_window_ms", loaded.hotkey.double_tap_window_ms);

    read_size(root, "history_size", loaded.history_size);
    read_bool(root, "log_stale_events", loaded.log_stale_events);

    sanitize_config(loaded);
    config = loaded;

    std::cout << "Loaded config: " << path << std::endl;
    return true;
}

void sanitize_config(Config& config) {
    auto& rec = config.recording;
    rec.max_duration_ms = std::clamp(rec.max_duration_ms, 1000, MAX_RECORDING_HARD_LIMIT_MS);
    rec.min_duration_ms = std::clamp(rec.min_duration_ms, 0, rec.max_duration_ms);
    rec.transcription_timeout_ms = std::max(rec.transcription_timeout_ms, 1000);

    auto& inj = config.injection;
    inj.paste_delay_ms = std::clamp(inj.paste_delay_ms, MIN_PASTE_DELAY_MS, MAX_PASTE_DELAY_MS);
    inj.restore_delay_ms = std::clamp(inj.restore_delay_ms, 0, 1000);
    for (auto& entry : inj.app_overrides) {
        if (entry.second.paste_delay_ms >= 0) {
            entry.second.paste_delay_ms = std::clamp(entry.second.paste_delay_ms,
                                                     MIN_PASTE_DELAY_MS, MAX_PASTE_DELAY_MS);
        }
    }

    auto& sup = config.supervisor;
    sup.base_delay_ms = std::max(sup.base_delay_ms, 1);
    sup.max_delay_ms = std::max(sup.max_delay_ms, sup.base_delay_ms);
    sup.max_attempts = std::max(sup.max_attempts, 1);

    auto& wd = config.watchdog;
    wd.interval_ms = std::max(wd.interval_ms, 100);
    wd.hang_window_ms = std::max(wd.hang_window_ms, wd.interval_ms);

    config.rpc.default_timeout_ms = std::max(config.rpc.default_timeout_ms, 1);
    if (config.history_size == 0) config.history_size = 1;
    config.hotkey.double_tap_window_ms = std::max(config.hotkey.double_tap_window_ms, 0);
}

const char* hotkey_mode_name(HotkeyMode mode) {
    switch (mode) {
        case HotkeyMode::Hold: return "hold";
        case HotkeyMode::Toggle: return "toggle";
    }
    return "hold";
}

bool parse_hotkey_mode(const std::string& name, HotkeyMode& mode) {
    if (name == "hold") {
        mode = HotkeyMode::Hold;
        return true;
    }
    if (name == "toggle") {
        mode = HotkeyMode::Toggle;
        return true;
    }
    return false;
}

} // namespace voxbridge
