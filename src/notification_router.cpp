#include "notification_router.hpp"
#include "json_util.hpp"
#include <iostream>
#include <chrono>

namespace voxbridge {

NotificationRouter::NotificationRouter(SessionStateMachine& session, ModelCache& models, EventEmitter& events,
                                       bool log_stale_events)
    : session_(session), models_(models), events_(events), log_stale_(log_stale_events) {
}

NotificationRouter::~NotificationRouter() {
    stop();
}

void NotificationRouter::start() {
    if (running_.load()) return;
    running_.store(true);
    thread_ = std::thread([this]() {
        run_loop();
    });
}

void NotificationRouter::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) return;
        running_.store(false);
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void NotificationRouter::push(Notification notification) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(notification));
    }
    cv_.notify_one();
}

bool NotificationRouter::wait_idle(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this]() {
        return queue_.empty() && !busy_;
    });
}

void NotificationRouter::run_loop() {
    while (true) {
        Notification next;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return !running_.load() || !queue_.empty(); });
            if (!running_.load()) break;
            next = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }

        dispatch(next);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
        }
        idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}

void NotificationRouter::dispatch(const Notification& notification) {
    dispatched_.fetch_add(1);
    const std::string& method = notification.method;
    const Json::Value& params = notification.params;

    if (method == "event.transcription_complete") {
        on_transcription_complete(params);
    } else if (method == "event.transcription_error") {
        on_transcription_error(params);
    } else if (method == "event.audio_level") {
        on_audio_level(params);
    } else if (method == "event.model_status") {
        models_.on_model_status(params);
    } else if (method == "event.model_progress") {
        models_.on_model_progress(params);
    } else if (method == "event.status_changed") {
        std::string state = json_string(params, "state");
        std::string detail = json_string(params, "detail");
        if (state == "error") {
            std::cerr << "[worker] status: error" << (detail.empty() ? "" : ": " + detail) << std::endl;
        }
        models_.on_status_changed(params);
    } else {
        std::cerr << "Ignoring unknown notification: " << method << std::endl;
    }
}

void NotificationRouter::drop_stale(const std::string& method, const std::string& session_id) {
    stale_.fetch_add(1);
    if (log_stale_) {
        std::cout << "Dropped stale " << method << " for session "
                  << (session_id.empty() ? "<none>" : session_id) << std::endl;
    }
}

void NotificationRouter::on_transcription_complete(const Json::Value& params) {
    std::string session_id = json_string(params, "session_id");
    uint64_t seq = session_.next_event_seq(session_id);

    // Completion is honored once, and only for the live session
    if (seq == 0 || !session_.accept_completion(session_id)) {
        drop_stale("event.transcription_complete", session_id);
        return;
    }

    std::string text = json_string(params, "text");
    Json::Value payload(Json::objectValue);
    payload["session_id"] = session_id;
    payload["session_seq"] = Json::UInt64(seq);
    payload["text"] = text;
    payload["duration_ms"] = Json::Int64(json_int(params, "duration_ms"));
    if (params.isObject() && params["confidence"].isNumeric()) {
        payload["confidence"] = params["confidence"].asDouble();
    }
    events_.emit(UiEventType::TranscriptReady, payload);

    if (text.empty()) {
        events_.user_message("info", "No speech detected");
        return;
    }
    if (on_transcript_) on_transcript_(session_id, text);
}

void NotificationRouter::on_transcription_error(const Json::Value& params) {
    std::string session_id = json_string(params, "session_id");
    ErrorKind kind = parse_error_kind(json_string(params, "kind"));
    if (kind == ErrorKind::None) kind = ErrorKind::TranscriptionFailure;
    std::string message = json_string(params, "message", "Transcription failed");

    if (session_.next_event_seq(session_id) == 0 || !session_.accept_error(session_id, kind, message)) {
        drop_stale("event.transcription_error", session_id);
        return;
    }

    std::cerr << "Transcription failed (" << error_kind_name(kind) << "): " << message << std::endl;
    std::string hint = remediation_text(remediation_for(kind));
    events_.user_message("error", hint.empty() ? message : message + ". " + hint);
}

void NotificationRouter::on_audio_level(const Json::Value& params) {
    std::string source = json_string(params, "source", "meter");
    std::string session_id = json_string(params, "session_id");

    Json::Value payload(Json::objectValue);
    payload["source"] = source;
    payload["rms"] = json_double(params, "rms");
    payload["peak"] = json_double(params, "peak");

    if (source == "recording" || !session_id.empty()) {
        uint64_t seq = session_.next_event_seq(session_id);
        if (seq == 0) {
            drop_stale("event.audio_level", session_id);
            return;
        }
        payload["session_id"] = session_id;
        payload["session_seq"] = Json::UInt64(seq);
    }
    events_.emit(UiEventType::AudioLevel, payload);
}

} // namespace voxbridge
