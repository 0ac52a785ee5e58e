#include "clipboard.hpp"
#include <iostream>
#include <fstream>
#include <cstdio>
#include <cstring>
#include <array>
#include <memory>

#include <X11/Xlib.h>
#include <X11/Xatom.h>
#include <X11/Xutil.h>
#include <X11/keysym.h>
#include <X11/extensions/XTest.h>

namespace voxbridge {

// Run a command and capture its stdout
static std::string exec_command(const char* cmd) {
    std::array<char, 128> buffer;
    std::string result;
    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(cmd, "r"), pclose);
    if (!pipe) return "";
    while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
        result += buffer.data();
    }
    return result;
}

// Feed text to a command's stdin; true if it exited cleanly
static bool pipe_to_command(const char* cmd, const std::string& text) {
    FILE* pipe = popen(cmd, "w");
    if (!pipe) return false;
    size_t written = fwrite(text.data(), 1, text.size(), pipe);
    int ret = pclose(pipe);
    return ret == 0 && written == text.size();
}

// Read a single-valued window property (CARDINAL or WINDOW)
static bool read_long_property(Display* display, Window window, Atom property, Atom type, unsigned long& out) {
    Atom actual_type;
    int actual_format;
    unsigned long n_items, bytes_after;
    unsigned char* data = nullptr;

    int status = XGetWindowProperty(display, window, property, 0, 1, False, type,
                                    &actual_type, &actual_format, &n_items, &bytes_after, &data);
    if (status != Success || !data) return false;

    bool ok = n_items > 0 && actual_format == 32;
    if (ok) out = reinterpret_cast<unsigned long*>(data)[0];
    XFree(data);
    return ok;
}

static std::string read_process_name(int pid) {
    std::ifstream comm("/proc/" + std::to_string(pid) + "/comm");
    std::string name;
    if (comm.is_open()) std::getline(comm, name);
    return name;
}

FocusSignature X11Clipboard::capture_focus() {
    FocusSignature sig;
    sig.captured_at = std::chrono::steady_clock::now();

    Display* display = XOpenDisplay(nullptr);
    if (!display) {
        std::cerr << "Failed to open X display" << std::endl;
        return sig;
    }

    Window root = DefaultRootWindow(display);
    Atom active_atom = XInternAtom(display, "_NET_ACTIVE_WINDOW", True);
    Atom pid_atom = XInternAtom(display, "_NET_WM_PID", True);

    unsigned long active = 0;
    if (active_atom != None && read_long_property(display, root, active_atom, XA_WINDOW, active) && active != 0) {
        Window window = static_cast<Window>(active);
        sig.valid = true;
        sig.window_id = std::to_string(active);

        unsigned long pid = 0;
        if (pid_atom != None && read_long_property(display, window, pid_atom, XA_CARDINAL, pid)) {
            sig.pid = static_cast<int>(pid);
            sig.process_name = read_process_name(sig.pid);
        }

        char* name = nullptr;
        if (XFetchName(display, window, &name) && name) {
            sig.app_name = name;
            XFree(name);
        }
        if (sig.app_name.empty()) sig.app_name = sig.process_name;
    }

    XCloseDisplay(display);
    return sig;
}

bool X11Clipboard::set_clipboard(const std::string& text) {
    // Use xclip or xsel for clipboard
    if (pipe_to_command("xclip -selection clipboard 2>/dev/null", text)) return true;
    if (pipe_to_command("xsel --clipboard --input 2>/dev/null", text)) return true;

    std::cerr << "Failed to set clipboard. Install xclip or xsel." << std::endl;
    return false;
}

std::string X11Clipboard::get_clipboard() {
    std::string result = exec_command("xclip -selection clipboard -o 2>/dev/null");
    if (!result.empty()) return result;
    return exec_command("xsel --clipboard --output 2>/dev/null");
}

bool X11Clipboard::paste() {
    Display* display = XOpenDisplay(nullptr);
    if (!display) {
        std::cerr << "Failed to open X display" << std::endl;
        return false;
    }

    // Simulate Ctrl+V
    KeyCode ctrl_keycode = XKeysymToKeycode(display, XK_Control_L);
    KeyCode v_keycode = XKeysymToKeycode(display, XK_v);

    if (ctrl_keycode == 0 || v_keycode == 0) {
        std::cerr << "Failed to get keycodes" << std::endl;
        XCloseDisplay(display);
        return false;
    }

    bool ok = XTestFakeKeyEvent(display, ctrl_keycode, True, 0) &&
              XTestFakeKeyEvent(display, v_keycode, True, 0) &&
              XTestFakeKeyEvent(display, v_keycode, False, 0);
    // Never leave Ctrl held down
    ok = XTestFakeKeyEvent(display, ctrl_keycode, False, 0) && ok;
    XFlush(display);

    XCloseDisplay(display);
    if (!ok) std::cerr << "XTest rejected the synthesized paste" << std::endl;
    return ok;
}

bool X11Clipboard::paste_supported() {
    Display* display = XOpenDisplay(nullptr);
    if (!display) return false;

    int event_base, error_base, major, minor;
    bool supported = XTestQueryExtension(display, &event_base, &error_base, &major, &minor);
    XCloseDisplay(display);
    return supported;
}

std::unique_ptr<InjectionBackend> create_platform_backend() {
    return std::make_unique<X11Clipboard>();
}

} // namespace voxbridge
