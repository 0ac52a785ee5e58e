#include "hotkey_manager.hpp"
#include <iostream>
#include <vector>
#include <algorithm>
#include <filesystem>
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <linux/input.h>
#include <poll.h>

#ifdef HAS_LIBEVDEV
#include <libevdev/libevdev.h>
#endif

namespace voxbridge {

struct LinuxHotkeyState {
    int keyboard_fd = -1;
#ifdef HAS_LIBEVDEV
    struct libevdev* dev = nullptr;
#endif
};

static LinuxHotkeyState* state_of(void* handle) {
    return static_cast<LinuxHotkeyState*>(handle);
}

// Event device nodes in numeric order
static std::vector<std::string> list_event_devices() {
    std::vector<std::string> paths;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator("/dev/input", ec)) {
        std::string name = entry.path().filename().string();
        if (name.compare(0, 5, "event") == 0) {
            paths.push_back(entry.path().string());
        }
    }
    std::sort(paths.begin(), paths.end(), [](const std::string& a, const std::string& b) {
        return a.size() != b.size() ? a.size() < b.size() : a < b;
    });
    return paths;
}

#ifndef HAS_LIBEVDEV
static bool device_has_key(int fd, uint32_t keycode) {
    unsigned char bits[KEY_MAX / 8 + 1] = {0};
    if (ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(bits)), bits) < 0) return false;
    return keycode <= KEY_MAX && (bits[keycode / 8] & (1 << (keycode % 8)));
}
#endif

HotkeyManager::HotkeyManager() = default;

HotkeyManager::~HotkeyManager() {
    shutdown();
}

void HotkeyManager::set_hotkey(uint32_t keycode) {
    edges_.set_keycode(keycode);
}

bool HotkeyManager::initialize() {
    if (platform_handle_) return true;
    platform_handle_ = new LinuxHotkeyState();
    return true;
}

void HotkeyManager::shutdown() {
    stop();

    LinuxHotkeyState* state = state_of(platform_handle_);
    if (state) {
#ifdef HAS_LIBEVDEV
        if (state->dev) {
            libevdev_free(state->dev);
        }
#endif
        if (state->keyboard_fd >= 0) {
            close(state->keyboard_fd);
        }
        delete state;
    }
    platform_handle_ = nullptr;
}

bool HotkeyManager::start() {
    if (running_.load()) return true;
    LinuxHotkeyState* state = state_of(platform_handle_);
    if (!state) return false;

    edges_.reset();
    uint32_t keycode = edges_.keycode();

    // First device that can actually produce the hotkey
    for (const auto& path : list_event_devices()) {
        if (state->keyboard_fd >= 0) break;
        int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0) continue;
#ifdef HAS_LIBEVDEV
        int rc = libevdev_new_from_fd(fd, &state->dev);
        if (rc >= 0) {
            if (libevdev_has_event_type(state->dev, EV_KEY) &&
                libevdev_has_event_code(state->dev, EV_KEY, keycode)) {
                state->keyboard_fd = fd;
                device_path_ = path;
                break;
            }
            libevdev_free(state->dev);
            state->dev = nullptr;
        }
#else
        if (device_has_key(fd, keycode)) {
            state->keyboard_fd = fd;
            device_path_ = path;
            break;
        }
#endif
        close(fd);
    }

    if (state->keyboard_fd < 0) {
        std::cerr << "Failed to open a keyboard device with key " << keycode
                  << ". Add your user to the input group or run with sudo." << std::endl;
        return false;
    }
    std::cout << "Using keyboard: " << device_path_ << std::endl;

    running_.store(true);
    listener_thread_ = std::thread([this]() {
        run_loop();
    });

    return true;
}

void HotkeyManager::stop() {
    if (!running_.load()) return;

    running_.store(false);

    if (listener_thread_.joinable()) {
        listener_thread_.join();
    }
}

void HotkeyManager::dispatch(uint32_t code, int value) {
    int edge = edges_.feed(code, value);
    if (edge != 0 && callback_) {
        callback_(edge > 0);
    }
}

void HotkeyManager::run_loop() {
    LinuxHotkeyState* state = state_of(platform_handle_);
    struct input_event ev;

    while (running_.load()) {
        struct pollfd pfd;
        pfd.fd = state->keyboard_fd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ret = poll(&pfd, 1, 100);
        if (ret <= 0) continue;
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
            std::cerr << "Keyboard device went away: " << device_path_ << std::endl;
            running_.store(false);
            break;
        }

#ifdef HAS_LIBEVDEV
        int rc;
        do {
            rc = libevdev_next_event(state->dev, LIBEVDEV_READ_FLAG_NORMAL, &ev);
            if (rc == LIBEVDEV_READ_STATUS_SYNC) {
                // Dropped events: resync and forget the key state
                while (rc == LIBEVDEV_READ_STATUS_SYNC) {
                    rc = libevdev_next_event(state->dev, LIBEVDEV_READ_FLAG_SYNC, &ev);
                }
                edges_.reset();
                continue;
            }
            if (rc == LIBEVDEV_READ_STATUS_SUCCESS && ev.type == EV_KEY) {
                dispatch(ev.code, ev.value);
            }
        } while (rc == LIBEVDEV_READ_STATUS_SUCCESS || rc == LIBEVDEV_READ_STATUS_SYNC);
#else
        while (read(state->keyboard_fd, &ev, sizeof(ev)) == static_cast<ssize_t>(sizeof(ev))) {
            if (ev.type == EV_KEY) {
                dispatch(ev.code, ev.value);
            }
        }
#endif
    }
}

} // namespace voxbridge
