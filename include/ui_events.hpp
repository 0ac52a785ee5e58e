#pragma once

#include <json/json.h>
#include <string>
#include <functional>
#include <map>
#include <mutex>
#include <atomic>
#include <cstdint>

namespace voxbridge {

enum class UiEventType {
    PhaseChanged,
    ModelStatus,
    AudioLevel,
    TranscriptReady,
    WorkerHealth,
    UserMessage
};

const char* ui_event_type_name(UiEventType type);

struct UiEvent {
    uint64_t seq = 0;   // Process-wide, strictly increasing
    UiEventType type = UiEventType::UserMessage;
    Json::Value payload;
};

// Fan-out of host state to observers (console, tray, UI layer).
// Listeners run on the emitting thread and must not call back into the
// component that emitted.
class EventEmitter {
public:
    using Listener = std::function<void(const UiEvent&)>;

    int subscribe(Listener listener);
    void unsubscribe(int token);

    uint64_t emit(UiEventType type, Json::Value payload);

    // Convenience for user-facing notices
    uint64_t user_message(const std::string& level, const std::string& text, bool blocking = false);

    uint64_t last_seq() const { return seq_.load(); }

private:
    std::atomic<uint64_t> seq_{0};
    std::mutex mutex_;
    std::map<int, Listener> listeners_;
    int next_token_ = 1;
};

} // namespace voxbridge
