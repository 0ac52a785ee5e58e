#include "rpc_client.hpp"
#include "json_util.hpp"
#include <iostream>
#include <algorithm>

namespace voxbridge {

// Reader poll granularity; bounds how long close() waits for the thread
static constexpr int READ_POLL_MS = 100;

const char* rpc_status_name(RpcStatus status) {
    switch (status) {
        case RpcStatus::Ok: return "ok";
        case RpcStatus::Remote: return "remote";
        case RpcStatus::Timeout: return "timeout";
        case RpcStatus::Disconnected: return "disconnected";
        case RpcStatus::Protocol: return "protocol";
    }
    return "unknown";
}

RpcResult RpcResult::ok(Json::Value value) {
    RpcResult r;
    r.success = true;
    r.status = RpcStatus::Ok;
    r.result = std::move(value);
    r.attempts = 1;
    return r;
}

RpcResult RpcResult::failure(RpcStatus status, ErrorKind kind, const std::string& message) {
    RpcResult r;
    r.success = false;
    r.status = status;
    r.error.kind = kind;
    r.error.kind_name = error_kind_name(kind);
    r.error.message = message;
    r.attempts = 1;
    return r;
}

RpcError parse_rpc_error(const Json::Value& error) {
    RpcError err;
    if (!error.isObject()) {
        err.kind = ErrorKind::ProtocolError;
        err.kind_name = error_kind_name(err.kind);
        err.message = "malformed error object";
        return err;
    }

    err.code = static_cast<int>(json_int(error, "code", 0));
    err.message = json_string(error, "message");

    const Json::Value& data = error["data"];
    err.kind_name = json_string(error, "kind");
    if (err.kind_name.empty()) err.kind_name = json_string(data, "kind");

    if (error.isMember("details")) {
        err.details = error["details"];
    } else if (data.isObject() && data.isMember("details")) {
        err.details = data["details"];
    }

    err.kind = parse_error_kind(err.kind_name);
    if (err.kind == ErrorKind::None || err.kind == ErrorKind::Unknown) {
        ErrorKind from_code = error_kind_from_code(err.code);
        if (from_code != ErrorKind::Unknown || err.kind == ErrorKind::None) {
            err.kind = from_code;
        }
    }
    if (err.kind_name.empty()) err.kind_name = error_kind_name(err.kind);
    return err;
}

RpcClient::RpcClient(std::unique_ptr<FramedTransport> transport, const RpcConfig& config)
    : transport_(std::move(transport)), config_(config) {
}

RpcClient::~RpcClient() {
    close();
}

bool RpcClient::start() {
    if (running_.load()) return true;
    if (!transport_ || !transport_->is_open()) {
        std::cerr << "Cannot start RPC client: transport is closed" << std::endl;
        return false;
    }

    running_.store(true);
    reader_thread_ = std::thread([this]() {
        reader_loop();
    });
    return true;
}

void RpcClient::close() {
    bool was_closed = closed_.exchange(true);
    running_.store(false);

    if (!was_closed && transport_) {
        transport_->close();
    }

    if (reader_thread_.joinable() && reader_thread_.get_id() != std::this_thread::get_id()) {
        reader_thread_.join();
    }

    fail_all_pending("channel closed");
}

int RpcClient::timeout_for(const std::string& method) const {
    auto it = config_.method_timeout_ms.find(method);
    if (it != config_.method_timeout_ms.end()) return it->second;
    return config_.default_timeout_ms;
}

bool RpcClient::is_long_running(const std::string& method) const {
    const auto& longs = config_.long_running_methods;
    return std::find(longs.begin(), longs.end(), method) != longs.end();
}

size_t RpcClient::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

RpcResult RpcClient::call(const std::string& method, const Json::Value& params) {
    int timeout_ms = timeout_for(method);
    RpcResult result = call_once(method, params, timeout_ms);
    if (result.status != RpcStatus::Timeout) return result;

    if (is_long_running(method)) {
        std::cerr << method << " timed out after " << timeout_ms << "ms; treating as fatal" << std::endl;
        result.fatal = true;
        return result;
    }

    std::cerr << method << " timed out after " << timeout_ms << "ms, retrying once" << std::endl;
    result = call_once(method, params, timeout_ms);
    result.attempts = 2;
    return result;
}

RpcResult RpcClient::call_once(const std::string& method, const Json::Value& params, int timeout_ms) {
    uint64_t id = next_id_.fetch_add(1);
    auto now = std::chrono::steady_clock::now();

    std::future<RpcResult> future;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (closed_.load()) {
            return RpcResult::failure(RpcStatus::Disconnected, ErrorKind::Disconnected,
                                      "worker channel is closed");
        }
        PendingCall& pending = pending_[id];
        pending.method = method;
        pending.issued = now;
        pending.deadline = now + std::chrono::milliseconds(timeout_ms);
        future = pending.promise.get_future();
    }

    Json::Value request(Json::objectValue);
    request["jsonrpc"] = "2.0";
    request["id"] = Json::UInt64(id);
    request["method"] = method;
    request["params"] = params.isNull() ? Json::Value(Json::objectValue) : params;

    if (!transport_->write_message(to_json_line(request))) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(id);
        if (it != pending_.end()) {
            pending_.erase(it);
            return RpcResult::failure(RpcStatus::Disconnected, ErrorKind::Disconnected,
                                      "failed to write " + method + " request");
        }
        // fail_all_pending already completed it
    }

    if (future.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(id);
        if (it != pending_.end()) {
            pending_.erase(it);
            return RpcResult::failure(RpcStatus::Timeout, ErrorKind::Timeout,
                                      method + " timed out after " + std::to_string(timeout_ms) + "ms");
        }
        // The reader claimed it just now; its value is on the way
    }
    return future.get();
}

void RpcClient::reader_loop() {
    while (running_.load()) {
        std::string line;
        auto status = transport_->read_message(line, READ_POLL_MS);

        if (status == FramedTransport::ReadStatus::Message) {
            handle_line(line);
            continue;
        }
        if (status == FramedTransport::ReadStatus::Timeout) {
            continue;
        }

        std::string reason = (status == FramedTransport::ReadStatus::Fatal)
            ? "framing error from worker"
            : "worker closed the channel";

        bool intentional = closed_.exchange(true);
        running_.store(false);
        transport_->close();
        fail_all_pending(reason);

        if (!intentional) {
            std::cerr << "RPC channel lost: " << reason << std::endl;
            if (on_fatal_) on_fatal_(reason);
        }
        return;
    }
}

void RpcClient::handle_line(const std::string& line) {
    Json::Value message;
    std::string error;
    if (!parse_json(line, message, &error) || !message.isObject()) {
        // A line we cannot parse means the stream is out of sync
        std::cerr << "Malformed line from worker (" << line.size() << " bytes): " << error << std::endl;
        bool intentional = closed_.exchange(true);
        running_.store(false);
        transport_->close();
        fail_all_pending("malformed line from worker");
        if (!intentional && on_fatal_) on_fatal_("malformed line from worker");
        return;
    }

    bool has_id = message.isMember("id") && !message["id"].isNull();
    if (has_id && (message.isMember("result") || message.isMember("error"))) {
        handle_response(message);
        return;
    }

    if (!has_id && message["method"].isString()) {
        Notification notification;
        notification.method = message["method"].asString();
        notification.params = message.isMember("params") ? message["params"] : Json::Value(Json::objectValue);
        if (sink_) {
            sink_(std::move(notification));
        }
        return;
    }

    std::cerr << "Dropping unrecognized message from worker" << std::endl;
}

void RpcClient::handle_response(const Json::Value& message) {
    const Json::Value& id_value = message["id"];
    if (!id_value.isUInt64()) {
        dropped_.fetch_add(1);
        std::cerr << "Dropping response with non-numeric id" << std::endl;
        return;
    }
    uint64_t id = id_value.asUInt64();

    std::promise<RpcResult> promise;
    std::string method;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            dropped_.fetch_add(1);
            std::cerr << "Dropping response for unknown or expired id " << id << std::endl;
            return;
        }
        promise = std::move(it->second.promise);
        method = it->second.method;
        pending_.erase(it);
    }

    RpcResult result;
    result.attempts = 1;
    if (message.isMember("error") && !message["error"].isNull()) {
        result.success = false;
        result.status = RpcStatus::Remote;
        result.error = parse_rpc_error(message["error"]);
    } else {
        result.success = true;
        result.status = RpcStatus::Ok;
        result.result = message["result"];
    }
    promise.set_value(std::move(result));
}

void RpcClient::fail_all_pending(const std::string& reason) {
    std::map<uint64_t, PendingCall> failed;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        failed.swap(pending_);
    }
    for (auto& entry : failed) {
        entry.second.promise.set_value(
            RpcResult::failure(RpcStatus::Disconnected, ErrorKind::Disconnected,
                               entry.second.method + ": " + reason));
    }
}

} // namespace voxbridge
