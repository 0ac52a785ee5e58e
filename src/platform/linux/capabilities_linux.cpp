#include "capabilities.hpp"
#include "clipboard.hpp"
#include <iostream>
#include <string>
#include <cstdlib>

namespace voxbridge {

static DisplayServer detect_display_server() {
    const char* session = std::getenv("XDG_SESSION_TYPE");
    if (session && std::string(session) == "wayland") return DisplayServer::Wayland;
    if (std::getenv("WAYLAND_DISPLAY")) return DisplayServer::Wayland;
    if (session && std::string(session) == "x11") return DisplayServer::X11;
    if (std::getenv("DISPLAY")) return DisplayServer::X11;
    return DisplayServer::Unknown;
}

Capabilities detect_capabilities(const Config& config) {
    Capabilities caps;
    caps.display_server = detect_display_server();
    caps.clipboard_tool = find_on_path("xclip") || find_on_path("xsel");

    if (caps.display_server == DisplayServer::X11) {
        caps.paste_synthesis = X11Clipboard::paste_supported();
        caps.focus_capture = caps.paste_synthesis;
    }
    // evdev delivers key-up regardless of the display server
    caps.hotkey_release = true;

    apply_effective_modes(caps, config);

    std::cout << "Capabilities: display=" << display_server_name(caps.display_server)
              << " paste=" << (caps.paste_synthesis ? "yes" : "no")
              << " clipboard=" << (caps.clipboard_tool ? "yes" : "no") << std::endl;
    if (!caps.reason.empty()) {
        std::cout << "  " << caps.reason << std::endl;
    }
    return caps;
}

} // namespace voxbridge
