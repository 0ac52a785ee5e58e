#pragma once

#include <string>
#include <memory>
#include <chrono>
#include <cstdint>

namespace voxbridge {

// Which UI target had input focus
struct FocusSignature {
    bool valid = false;
    std::string window_id;
    int pid = -1;
    std::string process_name;
    std::string app_name;
    std::chrono::steady_clock::time_point captured_at;

    bool same_target(const FocusSignature& other) const {
        return valid && other.valid && window_id == other.window_id;
    }
};

// OS-facing half of injection: focus capture, clipboard, synthesized paste
class InjectionBackend {
public:
    virtual ~InjectionBackend() = default;

    virtual FocusSignature capture_focus() = 0;

    // Set text to clipboard
    virtual bool set_clipboard(const std::string& text) = 0;

    // Get text from clipboard
    virtual std::string get_clipboard() = 0;

    // Paste clipboard content (simulates Ctrl+V)
    virtual bool paste() = 0;
};

// X11 implementation: xclip/xsel for the clipboard, XTest for the paste,
// EWMH properties for focus
class X11Clipboard : public InjectionBackend {
public:
    FocusSignature capture_focus() override;
    bool set_clipboard(const std::string& text) override;
    std::string get_clipboard() override;
    bool paste() override;

    // Display reachable and the XTest extension present
    static bool paste_supported();
};

std::unique_ptr<InjectionBackend> create_platform_backend();

} // namespace voxbridge
