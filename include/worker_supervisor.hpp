#pragma once

#include "config.hpp"
#include "rpc_client.hpp"
#include "restart_policy.hpp"
#include "worker_process.hpp"
#include "log_buffer.hpp"
#include "session_state.hpp"
#include "ui_events.hpp"

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <thread>
#include <chrono>
#include <functional>

namespace voxbridge {

enum class WorkerHealth {
    Stopped,
    Starting,
    Ready,
    Restarting,
    Failed      // Circuit open; needs an explicit restart
};

const char* worker_health_name(WorkerHealth health);

// Result of the startup handshake
struct WorkerInfo {
    std::string version;
    std::string protocol;
    std::vector<std::string> capabilities;
    Json::Value raw;
};

// Owns the worker process and its RPC client. Spawns, handshakes, watches
// for exit or channel loss, and restarts with backoff until the circuit
// opens. Calls from other components go through call().
class WorkerSupervisor : public RpcChannel {
public:
    using ReadyCallback = std::function<void(const WorkerInfo&)>;

    WorkerSupervisor(const Config& config, SessionStateMachine& session, EventEmitter& events);
    ~WorkerSupervisor() override;

    // Set before start()
    void set_notification_sink(NotificationSink sink) { sink_ = std::move(sink); }
    void set_ready_callback(ReadyCallback callback) { on_ready_ = std::move(callback); }

    // Start supervising in the background
    bool start();

    // Block until the worker is ready or supervision gave up
    bool wait_for_ready(int timeout_ms);

    // Graceful shutdown; no restart follows
    void stop();

    // User action. Reopens the circuit or restarts a running worker.
    void restart();

    // Tear down the current worker and count it as a failure
    // (hang, fatal timeout).
    void force_restart(ErrorKind reason, const std::string& detail);

    RpcResult call(const std::string& method, const Json::Value& params) override;

    WorkerHealth health() const;
    WorkerInfo info() const;
    CircuitState circuit_state() const;
    int consecutive_failures() const;
    int restart_count() const { return restarts_.load(); }
    pid_t pid() const;
    const LogBuffer& log() const { return log_; }

    // Watchdog bookkeeping
    void note_probe_success();
    std::chrono::steady_clock::time_point last_probe_success() const;

private:
    enum class Fault {
        None,
        Exited,
        ChannelLost,
        Forced,
        Manual,
        Stopping
    };

    void supervise_loop();
    bool launch(std::string& error);
    Fault watch(std::string& detail);
    void teardown(bool graceful);
    bool handle_failure(ErrorKind kind, const std::string& detail);
    void set_health(WorkerHealth health, const std::string& message);
    bool sleep_interruptible(int delay_ms);
    void on_channel_fatal(uint64_t generation, const std::string& reason);

    Config config_;
    SessionStateMachine& session_;
    EventEmitter& events_;
    NotificationSink sink_;
    ReadyCallback on_ready_;

    LogBuffer log_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unique_ptr<WorkerProcess> process_;
    std::shared_ptr<RpcClient> client_;
    WorkerInfo info_;
    WorkerHealth health_ = WorkerHealth::Stopped;
    RestartPolicy policy_;
    uint64_t generation_ = 0;

    // Wake-up reasons for the supervise thread
    bool stop_requested_ = false;
    bool manual_requested_ = false;
    bool forced_ = false;
    ErrorKind forced_kind_ = ErrorKind::None;
    std::string forced_detail_;
    std::string channel_fault_;

    std::chrono::steady_clock::time_point ready_since_;
    std::chrono::steady_clock::time_point last_probe_ok_;

    std::atomic<int> restarts_{0};
    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace voxbridge
