#pragma once

#include "rpc_client.hpp"
#include "session_state.hpp"
#include "model_cache.hpp"
#include "ui_events.hpp"

#include <json/json.h>
#include <string>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <thread>
#include <functional>
#include <cstdint>

namespace voxbridge {

// Single ordered consumer of worker notifications. The RPC reader only
// pushes; this thread applies them to the session, the model cache and
// the UI in wire order.
class NotificationRouter {
public:
    using TranscriptHandler = std::function<void(const std::string& session_id, const std::string& text)>;

    NotificationRouter(SessionStateMachine& session, ModelCache& models, EventEmitter& events,
                       bool log_stale_events);
    ~NotificationRouter();

    void set_transcript_handler(TranscriptHandler handler) { on_transcript_ = std::move(handler); }

    void start();
    void stop();

    // Called from the RPC reader thread
    void push(Notification notification);

    // Apply one notification on the calling thread
    void dispatch(const Notification& notification);

    bool wait_idle(int timeout_ms);

    uint64_t dispatched() const { return dispatched_.load(); }
    uint64_t stale_dropped() const { return stale_.load(); }

private:
    void run_loop();
    void on_transcription_complete(const Json::Value& params);
    void on_transcription_error(const Json::Value& params);
    void on_audio_level(const Json::Value& params);
    void drop_stale(const std::string& method, const std::string& session_id);

    SessionStateMachine& session_;
    ModelCache& models_;
    EventEmitter& events_;
    bool log_stale_;
    TranscriptHandler on_transcript_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<Notification> queue_;
    bool busy_ = false;

    std::atomic<uint64_t> dispatched_{0};
    std::atomic<uint64_t> stale_{0};
    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace voxbridge
