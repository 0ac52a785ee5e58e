#pragma once

#include "config.hpp"
#include "error_kind.hpp"
#include "framed_transport.hpp"

#include <json/json.h>
#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <thread>
#include <future>
#include <chrono>
#include <functional>
#include <cstdint>

namespace voxbridge {

enum class RpcStatus {
    Ok,
    Remote,         // Worker answered with an error object
    Timeout,
    Disconnected,
    Protocol
};

const char* rpc_status_name(RpcStatus status);

struct RpcError {
    int code = 0;
    std::string message;
    ErrorKind kind = ErrorKind::None;
    std::string kind_name;          // Kind string as sent on the wire
    Json::Value details;
};

struct RpcResult {
    bool success = false;
    RpcStatus status = RpcStatus::Disconnected;
    Json::Value result;
    RpcError error;
    bool fatal = false;             // Long-running call timed out; worker must be restarted
    int attempts = 0;

    static RpcResult ok(Json::Value value);
    static RpcResult failure(RpcStatus status, ErrorKind kind, const std::string& message);
};

// Unsolicited worker push: method + params, no id
struct Notification {
    std::string method;
    Json::Value params;
};

using NotificationSink = std::function<void(Notification)>;

// Anything that can issue a call to the worker
class RpcChannel {
public:
    virtual ~RpcChannel() = default;
    virtual RpcResult call(const std::string& method, const Json::Value& params) = 0;
};

// Request/response correlator on top of a FramedTransport.
// A reader thread completes pending calls by id and forwards notifications,
// in wire order, to the sink.
class RpcClient : public RpcChannel {
public:
    using FatalCallback = std::function<void(const std::string& reason)>;

    RpcClient(std::unique_ptr<FramedTransport> transport, const RpcConfig& config);
    ~RpcClient() override;

    // Set both before start()
    void set_notification_sink(NotificationSink sink) { sink_ = std::move(sink); }
    void set_fatal_callback(FatalCallback callback) { on_fatal_ = std::move(callback); }

    bool start();
    void close();

    // Applies the per-method timeout and retry policy
    RpcResult call(const std::string& method, const Json::Value& params) override;

    // Exactly one attempt with an explicit timeout
    RpcResult call_once(const std::string& method, const Json::Value& params, int timeout_ms);

    int timeout_for(const std::string& method) const;
    bool is_long_running(const std::string& method) const;

    bool is_open() const { return !closed_.load(); }
    size_t pending_count() const;
    uint64_t dropped_responses() const { return dropped_.load(); }

private:
    struct PendingCall {
        std::string method;
        std::chrono::steady_clock::time_point issued;
        std::chrono::steady_clock::time_point deadline;
        std::promise<RpcResult> promise;
    };

    void reader_loop();
    void handle_line(const std::string& line);
    void handle_response(const Json::Value& message);
    void fail_all_pending(const std::string& reason);

    std::unique_ptr<FramedTransport> transport_;
    RpcConfig config_;

    mutable std::mutex pending_mutex_;
    std::map<uint64_t, PendingCall> pending_;
    std::atomic<uint64_t> next_id_{1};
    std::atomic<uint64_t> dropped_{0};

    NotificationSink sink_;
    FatalCallback on_fatal_;

    std::thread reader_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> closed_{false};
};

// Decode a JSON-RPC error object. Accepts error.kind or error.data.kind.
RpcError parse_rpc_error(const Json::Value& error);

} // namespace voxbridge
