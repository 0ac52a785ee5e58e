#pragma once

#include "config.hpp"
#include "clipboard.hpp"
#include "capabilities.hpp"

#include <string>
#include <map>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <thread>
#include <functional>

namespace voxbridge {

enum class InjectionStatus {
    Injected,       // Clipboard set and paste synthesized
    ClipboardOnly,  // Text is on the clipboard, no paste
    Failed          // Not even the clipboard could be set
};

const char* injection_status_name(InjectionStatus status);

struct InjectionResult {
    std::string session_id;
    InjectionStatus status = InjectionStatus::Failed;
    std::string warning;    // focus_changed, self_injection, paste_failed, paste_unavailable
    std::string message;    // Actionable text for the user
    std::string text;       // What was placed on the clipboard
    std::string target_app;
};

// Delivers finished transcripts to the focused application. Every attempt
// runs on one queue thread so two sessions never interleave keystrokes.
class InjectionController {
public:
    using Completion = std::function<void(const InjectionResult&)>;

    InjectionController(const InjectionConfig& config, InjectionBackend& backend, const Capabilities& caps);
    ~InjectionController();

    void start();
    void stop();

    // Focus Guard: remember the target at recording stop
    void capture_focus(const std::string& session_id);
    void discard_focus(const std::string& session_id);

    void enqueue(const std::string& session_id, const std::string& text, Completion done);

    // One attempt on the calling thread
    InjectionResult inject_now(const std::string& session_id, const std::string& text);

    void set_capabilities(const Capabilities& caps);
    void set_self_process_name(const std::string& name) { self_name_ = name; }

    size_t queue_depth() const;
    bool wait_idle(int timeout_ms);

private:
    struct Job {
        std::string session_id;
        std::string text;
        Completion done;
    };

    void run_loop();
    bool is_self(const FocusSignature& focus) const;
    std::string decorate(const std::string& text) const;

    InjectionConfig config_;
    InjectionBackend& backend_;
    std::string self_name_ = "voxbridge";

    mutable std::mutex caps_mutex_;
    Capabilities caps_;

    std::mutex focus_mutex_;
    std::map<std::string, FocusSignature> focus_by_session_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<Job> queue_;
    bool busy_ = false;

    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace voxbridge
