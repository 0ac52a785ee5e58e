#pragma once

#include "log_buffer.hpp"

#include <string>
#include <vector>
#include <thread>
#include <mutex>
#include <optional>
#include <sys/types.h>

namespace voxbridge {

// One worker subprocess with stdin/stdout pipes for the protocol and a
// stderr pipe drained into a LogBuffer.
class WorkerProcess {
public:
    WorkerProcess();
    ~WorkerProcess();

    WorkerProcess(const WorkerProcess&) = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;

    bool spawn(const std::string& command, const std::vector<std::string>& args,
               LogBuffer* log, bool echo_stderr);

    // Hand the protocol pipes to a transport. Returns -1 once taken.
    int take_stdin_fd();
    int take_stdout_fd();

    pid_t pid() const { return pid_; }

    // Reaps the child if it has exited. Returns the wait status once known.
    std::optional<int> poll_exit();
    bool is_running() { return pid_ > 0 && !poll_exit().has_value(); }

    // Wait up to timeout_ms for a voluntary exit
    bool wait_exit(int timeout_ms);

    // SIGTERM, wait up to grace_ms, then SIGKILL. Always reaps.
    void terminate(int grace_ms);

    // "exited with status N" / "killed by signal N"
    static std::string describe_status(int wait_status);

private:
    void stderr_loop();
    void close_fds();

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;

    std::mutex mutex_;
    std::optional<int> exit_status_;

    LogBuffer* log_ = nullptr;
    bool echo_stderr_ = false;
    std::thread stderr_thread_;
};

} // namespace voxbridge
