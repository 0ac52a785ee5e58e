#pragma once

#include "config.hpp"

#include <json/json.h>
#include <string>

namespace voxbridge {

enum class DisplayServer {
    X11,
    Wayland,
    Unknown
};

const char* display_server_name(DisplayServer server);

// What this machine can do, computed once and handed to controllers as data
struct Capabilities {
    DisplayServer display_server = DisplayServer::Unknown;
    bool focus_capture = false;     // Active window can be identified
    bool paste_synthesis = false;   // Ctrl+V can be injected
    bool clipboard_tool = false;    // xclip or xsel on PATH
    bool hotkey_release = false;    // Key-up events are delivered

    // Configured behavior after platform constraints
    bool effective_auto_paste = false;
    HotkeyMode effective_hotkey_mode = HotkeyMode::Hold;
    std::string reason;             // Why effective differs from configured

    Json::Value to_json() const;
};

// Inspects the environment (DISPLAY, WAYLAND_DISPLAY, PATH) and the X server
Capabilities detect_capabilities(const Config& config);

// Pure policy: fold configured behavior into what the probed platform allows
void apply_effective_modes(Capabilities& caps, const Config& config);

// Looks for an executable on PATH
bool find_on_path(const std::string& program);

} // namespace voxbridge
