#include "ui_events.hpp"
#include <vector>

namespace voxbridge {

const char* ui_event_type_name(UiEventType type) {
    switch (type) {
        case UiEventType::PhaseChanged: return "phase_changed";
        case UiEventType::ModelStatus: return "model_status";
        case UiEventType::AudioLevel: return "audio_level";
        case UiEventType::TranscriptReady: return "transcript_ready";
        case UiEventType::WorkerHealth: return "worker_health";
        case UiEventType::UserMessage: return "user_message";
    }
    return "unknown";
}

int EventEmitter::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    int token = next_token_++;
    listeners_[token] = std::move(listener);
    return token;
}

void EventEmitter::unsubscribe(int token) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(token);
}

uint64_t EventEmitter::emit(UiEventType type, Json::Value payload) {
    UiEvent event;
    event.type = type;
    event.payload = std::move(payload);

    std::vector<Listener> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        event.seq = seq_.fetch_add(1) + 1;
        targets.reserve(listeners_.size());
        for (const auto& entry : listeners_) {
            targets.push_back(entry.second);
        }
    }
    event.payload["seq"] = Json::UInt64(event.seq);

    for (const auto& listener : targets) {
        listener(event);
    }
    return event.seq;
}

uint64_t EventEmitter::user_message(const std::string& level, const std::string& text, bool blocking) {
    Json::Value payload(Json::objectValue);
    payload["level"] = level;
    payload["message"] = text;
    payload["blocking"] = blocking;
    return emit(UiEventType::UserMessage, std::move(payload));
}

} // namespace voxbridge
