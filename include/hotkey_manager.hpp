#pragma once

#include <functional>
#include <atomic>
#include <thread>
#include <string>
#include <cstdint>

namespace voxbridge {

// Turns raw key events for one keycode into press/release edges.
// Auto-repeat (value 2) and repeated presses never fire twice.
class KeyEdgeDetector {
public:
    explicit KeyEdgeDetector(uint32_t keycode = 0) : keycode_(keycode) {}

    void set_keycode(uint32_t keycode) { keycode_ = keycode; down_ = false; }
    uint32_t keycode() const { return keycode_; }

    // Returns 1 on a press edge, -1 on a release edge, 0 otherwise
    int feed(uint32_t code, int value);

    bool is_down() const { return down_; }
    void reset() { down_ = false; }

private:
    uint32_t keycode_;
    bool down_ = false;
};

// Global hotkey listener (evdev on Linux)
class HotkeyManager {
public:
    using HotkeyCallback = std::function<void(bool pressed)>;

    HotkeyManager();
    ~HotkeyManager();

    bool initialize();
    void shutdown();

    // Set the hotkey (keycode is platform-specific)
    void set_hotkey(uint32_t keycode);
    uint32_t hotkey() const { return edges_.keycode(); }

    // Runs on the listener thread
    void set_callback(HotkeyCallback callback) { callback_ = std::move(callback); }

    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    const std::string& device_path() const { return device_path_; }

private:
    void run_loop();
    void dispatch(uint32_t code, int value);

    KeyEdgeDetector edges_;
    HotkeyCallback callback_;
    std::string device_path_;

    std::atomic<bool> running_{false};
    std::thread listener_thread_;

    // Platform-specific handle
    void* platform_handle_ = nullptr;
};

} // namespace voxbridge
