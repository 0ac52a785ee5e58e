#include "worker_supervisor.hpp"
#include "json_util.hpp"
#include <iostream>

namespace voxbridge {

static constexpr int WATCH_POLL_MS = 100;

const char* worker_health_name(WorkerHealth health) {
    switch (health) {
        case WorkerHealth::Stopped: return "stopped";
        case WorkerHealth::Starting: return "starting";
        case WorkerHealth::Ready: return "ready";
        case WorkerHealth::Restarting: return "restarting";
        case WorkerHealth::Failed: return "failed";
    }
    return "stopped";
}

WorkerSupervisor::WorkerSupervisor(const Config& config, SessionStateMachine& session, EventEmitter& events)
    : config_(config),
      session_(session),
      events_(events),
      log_(config.worker.log_max_lines, config.worker.log_max_bytes),
      policy_(config.supervisor) {
}

WorkerSupervisor::~WorkerSupervisor() {
    stop();
}

bool WorkerSupervisor::start() {
    if (running_.load()) return true;
    if (config_.worker.command.empty()) {
        std::cerr << "No worker command configured" << std::endl;
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
        manual_requested_ = false;
        forced_ = false;
    }

    running_.store(true);
    thread_ = std::thread([this]() {
        supervise_loop();
    });
    return true;
}

bool WorkerSupervisor::wait_for_ready(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this]() {
        return health_ == WorkerHealth::Ready || health_ == WorkerHealth::Failed || stop_requested_;
    });
    return health_ == WorkerHealth::Ready;
}

void WorkerSupervisor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();

    bool was_running = running_.exchange(false);
    if (thread_.joinable()) {
        thread_.join();
    }

    teardown(true);
    if (was_running) {
        set_health(WorkerHealth::Stopped, "worker stopped");
    }
}

void WorkerSupervisor::restart() {
    if (!running_.load()) {
        std::cout << "Starting worker on request" << std::endl;
        start();
        return;
    }

    std::cout << "Worker restart requested" << std::endl;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        manual_requested_ = true;
    }
    cv_.notify_all();
}

void WorkerSupervisor::force_restart(ErrorKind reason, const std::string& detail) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (health_ != WorkerHealth::Ready) return;
        forced_ = true;
        forced_kind_ = reason;
        forced_detail_ = detail;
    }
    std::cerr << "Forcing worker restart: " << detail << std::endl;
    cv_.notify_all();
}

RpcResult WorkerSupervisor::call(const std::string& method, const Json::Value& params) {
    std::shared_ptr<RpcClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (health_ == WorkerHealth::Ready) client = client_;
    }
    if (!client) {
        return RpcResult::failure(RpcStatus::Disconnected, ErrorKind::Disconnected,
                                  "worker is not ready");
    }

    RpcResult result = client->call(method, params);
    if (result.fatal) {
        force_restart(ErrorKind::Timeout, method + " did not finish in time");
    }
    return result;
}

WorkerHealth WorkerSupervisor::health() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return health_;
}

WorkerInfo WorkerSupervisor::info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return info_;
}

CircuitState WorkerSupervisor::circuit_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return policy_.state();
}

int WorkerSupervisor::consecutive_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return policy_.consecutive_failures();
}

pid_t WorkerSupervisor::pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return process_ ? process_->pid() : -1;
}

void WorkerSupervisor::note_probe_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_probe_ok_ = std::chrono::steady_clock::now();
}

std::chrono::steady_clock::time_point WorkerSupervisor::last_probe_success() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_probe_ok_;
}

void WorkerSupervisor::supervise_loop() {
    bool first = true;

    while (running_.load()) {
        set_health(first ? WorkerHealth::Starting : WorkerHealth::Restarting,
                   first ? "starting worker" : "restarting worker");
        first = false;

        std::string detail;
        ErrorKind kind = ErrorKind::WorkerCrashed;

        if (launch(detail)) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                policy_.record_success();
                ready_since_ = std::chrono::steady_clock::now();
                last_probe_ok_ = ready_since_;
            }
            set_health(WorkerHealth::Ready, "worker ready");

            // Errors caused by the previous worker are over now
            SessionSnapshot snap = session_.snapshot();
            if (snap.phase == Phase::Error &&
                error_category(snap.error_kind) == ErrorCategory::WorkerHealth) {
                session_.recover();
            }

            if (on_ready_) on_ready_(info());

            Fault fault = watch(detail);
            if (fault == Fault::Stopping) break;
            if (fault == Fault::Manual) {
                teardown(true);
                continue;
            }
            if (fault == Fault::Forced) {
                std::lock_guard<std::mutex> lock(mutex_);
                kind = forced_kind_;
            } else if (fault == Fault::ChannelLost) {
                kind = ErrorKind::ProtocolError;
            }
            teardown(false);
        } else {
            std::cerr << "Worker start failed: " << detail << std::endl;
            teardown(false);
        }

        if (!running_.load()) break;
        if (!handle_failure(kind, detail)) break;
    }
}

bool WorkerSupervisor::launch(std::string& error) {
    auto process = std::make_unique<WorkerProcess>();
    if (!process->spawn(config_.worker.command, config_.worker.args, &log_, config_.worker.echo_stderr)) {
        error = "failed to spawn " + config_.worker.command;
        return false;
    }

    auto transport = std::make_unique<FramedTransport>(process->take_stdout_fd(), process->take_stdin_fd());
    auto client = std::make_shared<RpcClient>(std::move(transport), config_.rpc);

    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation = ++generation_;
        channel_fault_.clear();
        forced_ = false;
        process_ = std::move(process);
        client_ = client;
    }

    client->set_notification_sink(sink_);
    client->set_fatal_callback([this, generation](const std::string& reason) {
        on_channel_fatal(generation, reason);
    });
    if (!client->start()) {
        error = "failed to start RPC client";
        return false;
    }

    RpcResult ping = client->call("system.ping", Json::Value(Json::objectValue));
    if (!ping.success) {
        error = "handshake failed: system.ping: " + ping.error.message;
        return false;
    }

    RpcResult info = client->call("system.info", Json::Value(Json::objectValue));
    if (!info.success) {
        error = "handshake failed: system.info: " + info.error.message;
        return false;
    }

    WorkerInfo worker_info;
    worker_info.version = json_string(info.result, "version", json_string(ping.result, "version"));
    worker_info.protocol = json_string(info.result, "protocol", json_string(ping.result, "protocol"));
    if (info.result.isObject() && info.result["capabilities"].isArray()) {
        for (const auto& cap : info.result["capabilities"]) {
            if (cap.isString()) worker_info.capabilities.push_back(cap.asString());
        }
    }
    worker_info.raw = info.result;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        info_ = worker_info;
    }

    std::cout << "Worker handshake complete: version " << worker_info.version
              << ", protocol " << worker_info.protocol
              << ", " << worker_info.capabilities.size() << " capabilities" << std::endl;
    return true;
}

WorkerSupervisor::Fault WorkerSupervisor::watch(std::string& detail) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (stop_requested_) return Fault::Stopping;

        if (manual_requested_) {
            manual_requested_ = false;
            detail = "restart requested";
            return Fault::Manual;
        }
        if (forced_) {
            forced_ = false;
            detail = forced_detail_;
            return Fault::Forced;
        }
        if (!channel_fault_.empty()) {
            detail = channel_fault_;
            channel_fault_.clear();
            // EOF usually means the process died; report that as a crash
            if (process_ && process_->wait_exit(WATCH_POLL_MS)) {
                detail = "worker " + WorkerProcess::describe_status(*process_->poll_exit());
                return Fault::Exited;
            }
            return Fault::ChannelLost;
        }
        if (process_) {
            auto status = process_->poll_exit();
            if (status.has_value()) {
                detail = "worker " + WorkerProcess::describe_status(*status);
                return Fault::Exited;
            }
        }

        auto uptime = std::chrono::steady_clock::now() - ready_since_;
        if (policy_.consecutive_failures() > 0 &&
            uptime >= std::chrono::milliseconds(config_.supervisor.healthy_reset_ms)) {
            std::cout << "Worker healthy for " << config_.supervisor.healthy_reset_ms
                      << "ms, clearing failure count" << std::endl;
            policy_.record_healthy_period();
        }

        cv_.wait_for(lock, std::chrono::milliseconds(WATCH_POLL_MS));
    }
}

void WorkerSupervisor::teardown(bool graceful) {
    std::shared_ptr<RpcClient> client;
    std::unique_ptr<WorkerProcess> process;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        client = std::move(client_);
        process = std::move(process_);
    }
    if (!client && !process) return;

    int grace = config_.worker.shutdown_grace_ms;
    if (graceful && client && client->is_open() && process && process->is_running()) {
        client->call_once("system.shutdown", Json::Value(Json::objectValue), grace);
        process->wait_exit(grace);
    }

    if (client) client->close();
    if (process) {
        process->terminate(grace);
        auto status = process->poll_exit();
        if (status.has_value()) {
            std::cout << "Worker " << process->pid() << " "
                      << WorkerProcess::describe_status(*status) << std::endl;
        }
    }
}

bool WorkerSupervisor::handle_failure(ErrorKind kind, const std::string& detail) {
    bool allowed;
    int delay_ms;
    int failures;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        allowed = policy_.record_failure();
        delay_ms = policy_.next_delay_ms();
        failures = policy_.consecutive_failures();
    }

    if (!allowed) {
        std::string message = "Worker failed " + std::to_string(failures) +
                              " times in a row (" + detail + "); restart it manually";
        // Session goes to Error before anyone can observe the failed state
        session_.force_error(ErrorKind::CircuitOpen, Remediation::RestartWorker, message);
        set_health(WorkerHealth::Failed, message);

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return stop_requested_ || manual_requested_; });
        if (stop_requested_) return false;
        manual_requested_ = false;
        policy_.manual_reset();
        return true;
    }

    SessionSnapshot snap = session_.snapshot();
    if (snap.session_active || snap.phase == Phase::LoadingModel) {
        session_.force_error(kind, Remediation::RestartWorker, "Worker failure: " + detail);
    }

    restarts_.fetch_add(1);
    set_health(WorkerHealth::Restarting,
               "restarting in " + std::to_string(delay_ms) + "ms after: " + detail);
    return sleep_interruptible(delay_ms);
}

bool WorkerSupervisor::sleep_interruptible(int delay_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, std::chrono::milliseconds(delay_ms), [this]() {
        return stop_requested_ || manual_requested_;
    });
    manual_requested_ = false;
    return !stop_requested_;
}

void WorkerSupervisor::set_health(WorkerHealth health, const std::string& message) {
    Json::Value payload(Json::objectValue);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        health_ = health;
        payload["state"] = worker_health_name(health);
        payload["message"] = message;
        payload["restart_count"] = restarts_.load();
        payload["consecutive_failures"] = policy_.consecutive_failures();
        payload["circuit"] = circuit_state_name(policy_.state());
        payload["pid"] = process_ ? static_cast<int>(process_->pid()) : -1;
    }
    cv_.notify_all();

    std::cout << "[worker] " << worker_health_name(health) << ": " << message << std::endl;
    events_.emit(UiEventType::WorkerHealth, std::move(payload));
}

void WorkerSupervisor::on_channel_fatal(uint64_t generation, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) return;
        channel_fault_ = reason;
    }
    cv_.notify_all();
}

} // namespace voxbridge
