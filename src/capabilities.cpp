#include "capabilities.hpp"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <unistd.h>

namespace voxbridge {

const char* display_server_name(DisplayServer server) {
    switch (server) {
        case DisplayServer::X11: return "x11";
        case DisplayServer::Wayland: return "wayland";
        case DisplayServer::Unknown: return "unknown";
    }
    return "unknown";
}

Json::Value Capabilities::to_json() const {
    Json::Value v(Json::objectValue);
    v["display_server"] = display_server_name(display_server);
    v["focus_capture"] = focus_capture;
    v["paste_synthesis"] = paste_synthesis;
    v["clipboard_tool"] = clipboard_tool;
    v["hotkey_release"] = hotkey_release;
    v["effective_auto_paste"] = effective_auto_paste;
    v["effective_hotkey_mode"] = hotkey_mode_name(effective_hotkey_mode);
    v["reason"] = reason;
    return v;
}

bool find_on_path(const std::string& program) {
    const char* path = std::getenv("PATH");
    if (!path) return false;

    std::stringstream dirs(path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) continue;
        std::string candidate = dir + "/" + program;
        if (access(candidate.c_str(), X_OK) == 0) return true;
    }
    return false;
}

void apply_effective_modes(Capabilities& caps, const Config& config) {
    caps.reason.clear();

    caps.effective_auto_paste = config.injection.auto_paste && caps.paste_synthesis;
    if (config.injection.auto_paste && !caps.paste_synthesis) {
        caps.reason = (caps.display_server == DisplayServer::Wayland)
            ? "Wayland does not allow synthesized paste; text is copied to the clipboard"
            : "Paste synthesis unavailable; text is copied to the clipboard";
    }

    caps.effective_hotkey_mode = config.hotkey.mode;
    if (config.hotkey.mode == HotkeyMode::Hold && !caps.hotkey_release) {
        caps.effective_hotkey_mode = HotkeyMode::Toggle;
        if (!caps.reason.empty()) caps.reason += "; ";
        caps.reason += "Key release is not reported here; using toggle mode";
    }
}

} // namespace voxbridge
