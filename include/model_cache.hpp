#pragma once

#include "config.hpp"
#include "error_kind.hpp"
#include "rpc_client.hpp"
#include "session_state.hpp"
#include "ui_events.hpp"

#include <json/json.h>
#include <string>
#include <map>
#include <mutex>
#include <atomic>
#include <functional>
#include <cstdint>

namespace voxbridge {

enum class ModelState {
    Unknown,
    Missing,
    Downloading,
    Verifying,
    Loading,
    Ready,
    Error
};

const char* model_state_name(ModelState state);
ModelState parse_model_state(const std::string& name);

struct ModelProgress {
    bool valid = false;
    uint64_t current = 0;
    uint64_t total = 0;     // 0 when the worker does not know
    std::string unit = "bytes";
    std::string stage;
};

// Last status the worker reported for one model
struct ModelStatus {
    std::string model_id;
    std::string revision;
    ModelState state = ModelState::Unknown;
    std::string cache_path;
    ModelProgress progress;
    std::string error;

    Json::Value to_json() const;
};

struct ModelActionResult {
    bool success = false;
    bool blocking = false;      // User must acknowledge the message
    std::string message;
    ErrorKind kind = ErrorKind::None;
    Json::Value details;
};

// Mirrors the worker's model cache and drives install, purge and engine
// initialization. Never declares a model ready on its own.
class ModelCache {
public:
    using ReadyListener = std::function<void(const std::string& model_id)>;

    ModelCache(const ModelConfig& config, RpcChannel& channel, SessionStateMachine& session,
               EventEmitter& events);

    // Called when the worker reports a model as ready after it was not
    void set_ready_listener(ReadyListener listener) { on_ready_ = std::move(listener); }

    // model.get_status; empty id = configured model
    bool refresh(const std::string& model_id = "");

    ModelActionResult install(const std::string& model_id = "");
    ModelActionResult purge(const std::string& model_id = "");

    // asr.initialize with the long timeout. Drives LoadingModel.
    ModelActionResult initialize_engine(const std::string& model_id = "", const std::string& device_pref = "");

    // Worker notifications
    void on_model_status(const Json::Value& params);
    void on_model_progress(const Json::Value& params);
    void on_status_changed(const Json::Value& params);

    ModelStatus status(const std::string& model_id = "") const;

    // asr.initialize succeeded on the current worker
    bool engine_ready() const { return engine_ready_.load(); }

    // The worker went away; its engine went with it
    void reset_engine();

    const std::string& default_model() const { return config_.model_id; }

private:
    std::string resolve(const std::string& model_id) const;
    void store(const ModelStatus& status);
    ModelActionResult failure_from(const RpcResult& result, const std::string& action);

    ModelConfig config_;
    RpcChannel& channel_;
    SessionStateMachine& session_;
    EventEmitter& events_;
    ReadyListener on_ready_;

    mutable std::mutex mutex_;
    std::map<std::string, ModelStatus> models_;
    std::atomic<bool> engine_ready_{false};
};

} // namespace voxbridge
