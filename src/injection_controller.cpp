#include "injection_controller.hpp"
#include <iostream>
#include <algorithm>
#include <chrono>
#include <cctype>
#include <unistd.h>

namespace voxbridge {

const char* injection_status_name(InjectionStatus status) {
    switch (status) {
        case InjectionStatus::Injected: return "injected";
        case InjectionStatus::ClipboardOnly: return "clipboard_only";
        case InjectionStatus::Failed: return "failed";
    }
    return "failed";
}

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

InjectionController::InjectionController(const InjectionConfig& config, InjectionBackend& backend,
                                         const Capabilities& caps)
    : config_(config), backend_(backend), caps_(caps) {
}

InjectionController::~InjectionController() {
    stop();
}

void InjectionController::start() {
    if (running_.load()) return;
    running_.store(true);
    thread_ = std::thread([this]() {
        run_loop();
    });
}

void InjectionController::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_.load()) return;
        running_.store(false);
    }
    queue_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void InjectionController::capture_focus(const std::string& session_id) {
    FocusSignature sig = backend_.capture_focus();
    if (!sig.valid) {
        std::cerr << "Focus capture unavailable; focus guard cannot verify target" << std::endl;
    }
    std::lock_guard<std::mutex> lock(focus_mutex_);
    // Sessions that failed never consume their signature
    auto cutoff = std::chrono::steady_clock::now() - std::chrono::minutes(10);
    for (auto it = focus_by_session_.begin(); it != focus_by_session_.end();) {
        if (it->second.captured_at < cutoff) {
            it = focus_by_session_.erase(it);
        } else {
            ++it;
        }
    }
    focus_by_session_[session_id] = sig;
}

void InjectionController::discard_focus(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(focus_mutex_);
    focus_by_session_.erase(session_id);
}

void InjectionController::set_capabilities(const Capabilities& caps) {
    std::lock_guard<std::mutex> lock(caps_mutex_);
    caps_ = caps;
}

void InjectionController::enqueue(const std::string& session_id, const std::string& text, Completion done) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(Job{session_id, text, std::move(done)});
    }
    queue_cv_.notify_one();
}

size_t InjectionController::queue_depth() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size() + (busy_ ? 1 : 0);
}

bool InjectionController::wait_idle(int timeout_ms) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this]() {
        return queue_.empty() && !busy_;
    });
}

void InjectionController::run_loop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return !running_.load() || !queue_.empty(); });
            // Drain what is queued before exiting; transcripts are never dropped
            if (queue_.empty()) break;
            job = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }

        InjectionResult result = inject_now(job.session_id, job.text);
        if (job.done) job.done(result);

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            busy_ = false;
        }
        idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}

bool InjectionController::is_self(const FocusSignature& focus) const {
    if (!focus.valid) return false;
    if (focus.pid > 0 && focus.pid == static_cast<int>(getpid())) return true;
    if (self_name_.empty()) return false;
    return to_lower(focus.process_name).find(to_lower(self_name_)) != std::string::npos;
}

std::string InjectionController::decorate(const std::string& text) const {
    const std::string& suffix = config_.suffix;
    if (suffix.empty() || text.size() < suffix.size()) return text + suffix;
    if (text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0) return text;
    return text + suffix;
}

InjectionResult InjectionController::inject_now(const std::string& session_id, const std::string& text) {
    InjectionResult result;
    result.session_id = session_id;

    FocusSignature expected;
    {
        std::lock_guard<std::mutex> lock(focus_mutex_);
        auto it = focus_by_session_.find(session_id);
        if (it != focus_by_session_.end()) {
            expected = it->second;
            focus_by_session_.erase(it);
        }
    }

    if (text.empty()) {
        result.status = InjectionStatus::Failed;
        result.message = "Nothing to inject: empty transcript";
        return result;
    }

    Capabilities caps;
    {
        std::lock_guard<std::mutex> lock(caps_mutex_);
        caps = caps_;
    }

    result.text = decorate(text);
    FocusSignature current = backend_.capture_focus();
    result.target_app = current.app_name;

    const AppOverride* app_override = nullptr;
    auto ov = config_.app_overrides.find(current.process_name);
    if (current.valid && ov != config_.app_overrides.end()) {
        app_override = &ov->second;
    }

    std::string previous;
    bool restore = config_.restore_clipboard;
    if (restore) previous = backend_.get_clipboard();

    // The clipboard always gets the text first; everything after is optional
    if (!backend_.set_clipboard(result.text)) {
        result.status = InjectionStatus::Failed;
        result.message = "Could not set the clipboard. Install xclip or xsel.";
        std::cerr << "Injection failed for session " << session_id << ": clipboard unavailable" << std::endl;
        return result;
    }

    result.status = InjectionStatus::ClipboardOnly;
    if (is_self(current)) {
        result.warning = "self_injection";
        result.message = "voxbridge itself has focus; text copied to the clipboard instead";
    } else if (!config_.auto_paste || (app_override && app_override->use_clipboard_only)) {
        result.message = "Text copied to the clipboard";
    } else if (!caps.paste_synthesis) {
        result.warning = "paste_unavailable";
        result.message = caps.reason.empty() ? "Paste is unavailable; text copied to the clipboard" : caps.reason;
    } else if (config_.focus_guard_enabled && expected.valid && !expected.same_target(current)) {
        result.warning = "focus_changed";
        result.message = "Focus changed from " + expected.app_name + " to " + current.app_name +
                         "; text copied to the clipboard. Press Ctrl+V to paste.";
    }
    if (!result.message.empty()) {
        std::cout << "Injection (" << session_id << "): " << result.message << std::endl;
        return result;
    }

    int delay_ms = (app_override && app_override->paste_delay_ms >= 0)
        ? app_override->paste_delay_ms
        : config_.paste_delay_ms;
    delay_ms = std::clamp(delay_ms, MIN_PASTE_DELAY_MS, MAX_PASTE_DELAY_MS);
    std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));

    // No retry: a blind second paste could inject the text twice
    if (!backend_.paste()) {
        result.warning = "paste_failed";
        result.message = "Paste failed; text is on the clipboard. Press Ctrl+V to paste.";
        std::cerr << "Injection (" << session_id << "): " << result.message << std::endl;
        return result;
    }

    result.status = InjectionStatus::Injected;
    if (restore && !previous.empty()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.restore_delay_ms));
        if (!backend_.set_clipboard(previous)) {
            std::cerr << "Could not restore the previous clipboard contents" << std::endl;
        }
    }
    return result;
}

} // namespace voxbridge
