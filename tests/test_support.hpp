#pragma once

// Shared fakes for the unit tests

#include "rpc_client.hpp"
#include "clipboard.hpp"
#include "ui_events.hpp"

#include <json/json.h>
#include <string>
#include <vector>
#include <deque>
#include <map>
#include <mutex>
#include <chrono>
#include <functional>

namespace voxbridge {
namespace testing {

struct RecordedCall {
    std::string method;
    Json::Value params;
};

// Scripted worker: per-method queued replies, falling back to a handler,
// falling back to an empty success
class FakeChannel : public RpcChannel {
public:
    using Handler = std::function<RpcResult(const std::string&, const Json::Value&)>;

    RpcResult call(const std::string& method, const Json::Value& params) override {
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(RecordedCall{method, params});
            auto it = replies_.find(method);
            if (it != replies_.end() && !it->second.empty()) {
                RpcResult reply = it->second.front();
                it->second.pop_front();
                return reply;
            }
            handler = handler_;
        }
        if (handler) return handler(method, params);
        return RpcResult::ok(Json::Value(Json::objectValue));
    }

    void reply(const std::string& method, RpcResult result) {
        std::lock_guard<std::mutex> lock(mutex_);
        replies_[method].push_back(std::move(result));
    }

    void reply_ok(const std::string& method, Json::Value value) {
        reply(method, RpcResult::ok(std::move(value)));
    }

    void reply_error(const std::string& method, ErrorKind kind, const std::string& message,
                     Json::Value details = Json::Value()) {
        RpcResult r = RpcResult::failure(RpcStatus::Remote, kind, message);
        r.error.details = std::move(details);
        reply(method, r);
    }

    void reply_timeout(const std::string& method, bool fatal) {
        RpcResult r = RpcResult::failure(RpcStatus::Timeout, ErrorKind::Timeout, method + " timed out");
        r.fatal = fatal;
        r.attempts = fatal ? 1 : 2;
        reply(method, r);
    }

    void set_handler(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    std::vector<RecordedCall> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    int count(const std::string& method) const {
        std::lock_guard<std::mutex> lock(mutex_);
        int n = 0;
        for (const auto& c : calls_) {
            if (c.method == method) ++n;
        }
        return n;
    }

    RecordedCall last(const std::string& method) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = calls_.rbegin(); it != calls_.rend(); ++it) {
            if (it->method == method) return *it;
        }
        return RecordedCall();
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::deque<RpcResult>> replies_;
    std::vector<RecordedCall> calls_;
    Handler handler_;
};

inline FocusSignature make_focus(const std::string& window, int pid, const std::string& process) {
    FocusSignature sig;
    sig.valid = true;
    sig.window_id = window;
    sig.pid = pid;
    sig.process_name = process;
    sig.app_name = process;
    sig.captured_at = std::chrono::steady_clock::now();
    return sig;
}

// In-memory clipboard and keyboard
class FakeBackend : public InjectionBackend {
public:
    FocusSignature capture_focus() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!focus_script.empty()) {
            FocusSignature next = focus_script.front();
            focus_script.pop_front();
            return next;
        }
        return focus;
    }

    bool set_clipboard(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!clipboard_works) return false;
        clipboard = text;
        clipboard_writes.push_back(text);
        return true;
    }

    std::string get_clipboard() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return clipboard;
    }

    bool paste() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++paste_count;
        if (paste_works) pasted.push_back(clipboard);
        return paste_works;
    }

    std::mutex mutex_;
    FocusSignature focus;
    std::deque<FocusSignature> focus_script;    // Consumed before focus
    bool clipboard_works = true;
    bool paste_works = true;
    std::string clipboard;
    std::vector<std::string> clipboard_writes;
    std::vector<std::string> pasted;
    int paste_count = 0;
};

// Deterministic time source for controllers
class ManualClock {
public:
    using Clock = std::chrono::steady_clock;

    ManualClock() : now_(Clock::now()) {}

    Clock::time_point now() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(int ms) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += std::chrono::milliseconds(ms);
    }

    std::function<Clock::time_point()> fn() {
        return [this]() { return now(); };
    }

private:
    mutable std::mutex mutex_;
    Clock::time_point now_;
};

// Collects every UI event
class EventLog {
public:
    explicit EventLog(EventEmitter& events) : events_(events) {
        token_ = events_.subscribe([this](const UiEvent& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            log_.push_back(e);
        });
    }

    ~EventLog() {
        events_.unsubscribe(token_);
    }

    std::vector<UiEvent> all() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return log_;
    }

    std::vector<UiEvent> of(UiEventType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<UiEvent> out;
        for (const auto& e : log_) {
            if (e.type == type) out.push_back(e);
        }
        return out;
    }

    bool has_message_containing(const std::string& needle) const {
        for (const auto& e : of(UiEventType::UserMessage)) {
            if (e.payload["message"].asString().find(needle) != std::string::npos) return true;
        }
        return false;
    }

private:
    EventEmitter& events_;
    int token_ = 0;
    mutable std::mutex mutex_;
    std::vector<UiEvent> log_;
};

} // namespace testing
} // namespace voxbridge
