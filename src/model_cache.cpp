#include "model_cache.hpp"
#include "json_util.hpp"
#include <iostream>
#include <algorithm>

namespace voxbridge {

const char* model_state_name(ModelState state) {
    switch (state) {
        case ModelState::Unknown: return "unknown";
        case ModelState::Missing: return "missing";
        case ModelState::Downloading: return "downloading";
        case ModelState::Verifying: return "verifying";
        case ModelState::Loading: return "loading";
        case ModelState::Ready: return "ready";
        case ModelState::Error: return "error";
    }
    return "unknown";
}

ModelState parse_model_state(const std::string& name) {
    if (name == "missing") return ModelState::Missing;
    if (name == "downloading") return ModelState::Downloading;
    if (name == "verifying") return ModelState::Verifying;
    if (name == "loading") return ModelState::Loading;
    if (name == "ready") return ModelState::Ready;
    if (name == "error") return ModelState::Error;
    return ModelState::Unknown;
}

static ModelProgress parse_progress(const Json::Value& obj) {
    ModelProgress progress;
    if (!obj.isObject()) return progress;
    progress.valid = true;
    progress.current = static_cast<uint64_t>(std::max<int64_t>(0, json_int(obj, "current")));
    progress.total = static_cast<uint64_t>(std::max<int64_t>(0, json_int(obj, "total")));
    progress.unit = json_string(obj, "unit", "bytes");
    progress.stage = json_string(obj, "stage");
    return progress;
}

Json::Value ModelStatus::to_json() const {
    Json::Value out(Json::objectValue);
    out["model_id"] = model_id;
    out["status"] = model_state_name(state);
    if (!revision.empty()) out["revision"] = revision;
    if (!cache_path.empty()) out["cache_path"] = cache_path;
    if (progress.valid) {
        Json::Value p(Json::objectValue);
        p["current"] = Json::UInt64(progress.current);
        p["total"] = Json::UInt64(progress.total);
        p["unit"] = progress.unit;
        if (!progress.stage.empty()) p["stage"] = progress.stage;
        out["progress"] = p;
    }
    if (!error.empty()) out["error"] = error;
    return out;
}

ModelCache::ModelCache(const ModelConfig& config, RpcChannel& channel, SessionStateMachine& session,
                       EventEmitter& events)
    : config_(config), channel_(channel), session_(session), events_(events) {
}

std::string ModelCache::resolve(const std::string& model_id) const {
    return model_id.empty() ? config_.model_id : model_id;
}

void ModelCache::store(const ModelStatus& status) {
    bool became_ready = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = models_.find(status.model_id);
        ModelState previous = it != models_.end() ? it->second.state : ModelState::Unknown;
        became_ready = status.state == ModelState::Ready && previous != ModelState::Ready;
        models_[status.model_id] = status;
    }
    events_.emit(UiEventType::ModelStatus, status.to_json());
    if (became_ready && on_ready_) on_ready_(status.model_id);
}

ModelStatus ModelCache::status(const std::string& model_id) const {
    std::string id = resolve(model_id);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = models_.find(id);
    if (it != models_.end()) return it->second;

    ModelStatus unknown;
    unknown.model_id = id;
    return unknown;
}

bool ModelCache::refresh(const std::string& model_id) {
    std::string id = resolve(model_id);
    Json::Value params(Json::objectValue);
    params["model_id"] = id;

    RpcResult result = channel_.call("model.get_status", params);
    if (!result.success) {
        std::cerr << "Model status query failed: " << result.error.message << std::endl;
        return false;
    }

    const Json::Value& r = result.result;
    ModelStatus status;
    status.model_id = json_string(r, "model_id", id);
    status.revision = json_string(r, "revision");
    status.state = parse_model_state(json_string(r, "status"));
    status.cache_path = json_string(r, "cache_path");
    if (r.isObject()) status.progress = parse_progress(r["progress"]);
    status.error = json_string(r, "error", json_string(r, "error_message"));
    store(status);
    return true;
}

ModelActionResult ModelCache::failure_from(const RpcResult& result, const std::string& action) {
    ModelActionResult out;
    out.kind = result.error.kind;
    out.details = result.error.details;

    std::string message = action + " failed: " + result.error.message;
    const Json::Value& d = result.error.details;
    if (d.isObject() && d.isMember("required_bytes")) {
        message += " (needs " + std::to_string(json_int(d, "required_bytes")) + " bytes";
        if (d.isMember("available_bytes")) {
            message += ", " + std::to_string(json_int(d, "available_bytes")) + " available";
        }
        message += ")";
    }
    std::string hint = remediation_text(remediation_for(result.error.kind));
    if (!hint.empty()) message += ". " + hint;
    out.message = message;

    std::cerr << out.message << std::endl;
    events_.user_message("error", out.message);
    return out;
}

ModelActionResult ModelCache::install(const std::string& model_id) {
    std::string id = resolve(model_id);
    Json::Value params(Json::objectValue);
    params["model_id"] = id;

    std::cout << "Installing model " << id << "..." << std::endl;
    RpcResult result = channel_.call("model.install", params);
    if (!result.success) {
        return failure_from(result, "Model install");
    }

    // Install runs in the worker; progress arrives as notifications
    ModelActionResult out;
    out.success = true;
    out.message = "Installing " + id;
    if (result.result.isObject() && result.result.isMember("status")) {
        ModelStatus status = this->status(id);
        status.state = parse_model_state(json_string(result.result, "status"));
        store(status);
    }
    return out;
}

ModelActionResult ModelCache::purge(const std::string& model_id) {
    std::string id = resolve(model_id);
    Json::Value params(Json::objectValue);
    params["model_id"] = id;

    RpcResult result = channel_.call("model.purge_cache", params);
    if (!result.success) {
        if (result.error.kind == ErrorKind::NotReady) {
            ModelActionResult out;
            out.kind = ErrorKind::NotReady;
            out.blocking = true;
            out.details = result.error.details;
            out.message = "Model " + id + " is in use and cannot be removed. "
                          "Finish or cancel dictation, then try again.";
            std::cerr << "Purge refused: " << result.error.message << std::endl;
            events_.user_message("error", out.message, true);
            return out;
        }
        return failure_from(result, "Model purge");
    }

    ModelActionResult out;
    out.success = true;
    out.message = "Removed cached files for " + id;
    std::cout << out.message << std::endl;
    refresh(id);
    return out;
}

ModelActionResult ModelCache::initialize_engine(const std::string& model_id, const std::string& device_pref) {
    std::string id = resolve(model_id);
    std::string device = device_pref.empty() ? config_.device_pref : device_pref;

    ModelActionResult out;
    if (!session_.begin_loading()) {
        out.message = std::string("Cannot load the model while ") + phase_name(session_.phase());
        std::cerr << out.message << std::endl;
        return out;
    }

    engine_ready_.store(false);
    Json::Value params(Json::objectValue);
    params["model_id"] = id;
    params["device_pref"] = device;

    std::cout << "Initializing " << id << " on " << device << "..." << std::endl;
    RpcResult result = channel_.call("asr.initialize", params);
    if (result.success) {
        engine_ready_.store(true);
        session_.finish_loading(true);
        out.success = true;
        out.message = "Model " + id + " ready";
        std::cout << out.message << std::endl;
        return out;
    }

    out.kind = result.error.kind;
    out.details = result.error.details;
    if (result.fatal || result.status == RpcStatus::Timeout) {
        out.kind = ErrorKind::Timeout;
        out.message = "Model initialization timed out";
        session_.finish_loading(false, ErrorKind::Timeout, Remediation::RestartWorker, out.message);
    } else if (result.status == RpcStatus::Disconnected || result.status == RpcStatus::Protocol) {
        out.message = "Worker went away during model initialization: " + result.error.message;
        session_.finish_loading(false, result.error.kind, Remediation::RestartWorker, out.message);
    } else {
        out.message = "Model initialization failed: " + result.error.message;
        session_.finish_loading(false, result.error.kind, remediation_for(result.error.kind), out.message);
    }
    std::cerr << out.message << std::endl;
    return out;
}

void ModelCache::on_model_status(const Json::Value& params) {
    std::string id = json_string(params, "model_id", config_.model_id);
    ModelStatus status = this->status(id);
    status.state = parse_model_state(json_string(params, "status"));
    status.error = json_string(params, "error");
    if (params.isObject() && params.isMember("revision")) status.revision = json_string(params, "revision");
    if (params.isObject() && params.isMember("cache_path")) status.cache_path = json_string(params, "cache_path");
    if (status.state != ModelState::Downloading && status.state != ModelState::Verifying) {
        status.progress = ModelProgress();
    }
    store(status);
}

void ModelCache::on_model_progress(const Json::Value& params) {
    std::string id = json_string(params, "model_id", config_.model_id);
    ModelStatus status = this->status(id);
    status.progress = parse_progress(params);

    std::string stage = status.progress.stage;
    if (stage == "verifying") {
        status.state = ModelState::Verifying;
    } else if (stage == "loading") {
        status.state = ModelState::Loading;
    } else if (status.state != ModelState::Ready) {
        status.state = ModelState::Downloading;
    }
    store(status);
}

void ModelCache::on_status_changed(const Json::Value& params) {
    if (!params.isObject()) return;
    const Json::Value& model = params["model"];
    if (!model.isObject()) return;

    std::string id = json_string(model, "model_id", config_.model_id);
    ModelStatus status = this->status(id);
    if (model.isMember("status")) status.state = parse_model_state(json_string(model, "status"));
    if (params["progress"].isObject()) status.progress = parse_progress(params["progress"]);
    store(status);
}

void ModelCache::reset_engine() {
    engine_ready_.store(false);
}

} // namespace voxbridge
