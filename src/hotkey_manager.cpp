#include "hotkey_manager.hpp"

namespace voxbridge {

int KeyEdgeDetector::feed(uint32_t code, int value) {
    if (code != keycode_) return 0;

    if (value == 1 && !down_) {
        down_ = true;
        return 1;
    }
    if (value == 0 && down_) {
        down_ = false;
        return -1;
    }
    return 0;
}

// HotkeyManager itself is implemented in platform/*/hotkey_*.cpp

} // namespace voxbridge
