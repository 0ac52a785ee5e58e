#include "worker_process.hpp"
#include <iostream>
#include <chrono>
#include <cstring>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <unistd.h>
#include <sys/wait.h>

namespace voxbridge {

static constexpr int EXIT_POLL_MS = 10;
static constexpr size_t MAX_STDERR_LINE = 64 * 1024;

WorkerProcess::WorkerProcess() = default;

WorkerProcess::~WorkerProcess() {
    if (pid_ > 0 && !exit_status_.has_value()) {
        terminate(0);
    }
    close_fds();
    if (stderr_thread_.joinable()) {
        stderr_thread_.join();
    }
    if (stderr_fd_ >= 0) {
        ::close(stderr_fd_);
        stderr_fd_ = -1;
    }
}

bool WorkerProcess::spawn(const std::string& command, const std::vector<std::string>& args,
                          LogBuffer* log, bool echo_stderr) {
    if (pid_ > 0) {
        std::cerr << "Worker already spawned (pid " << pid_ << ")" << std::endl;
        return false;
    }

    int in_pipe[2], out_pipe[2], err_pipe[2];
    if (pipe2(in_pipe, O_CLOEXEC) != 0) {
        std::cerr << "pipe failed: " << std::strerror(errno) << std::endl;
        return false;
    }
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        std::cerr << "pipe failed: " << std::strerror(errno) << std::endl;
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        return false;
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        std::cerr << "pipe failed: " << std::strerror(errno) << std::endl;
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return false;
    }

    // Build argv before fork; only async-signal-safe calls in the child
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(command.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "fork failed: " << std::strerror(errno) << std::endl;
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
            ::close(fd);
        }
        return false;
    }

    if (pid == 0) {
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        execvp(argv[0], argv.data());

        const char msg[] = "voxbridge: exec of worker failed\n";
        ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        _exit(127);
    }

    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    pid_ = pid;
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];
    log_ = log;
    echo_stderr_ = echo_stderr;

    stderr_thread_ = std::thread([this]() {
        stderr_loop();
    });

    std::cout << "Spawned worker " << command << " (pid " << pid_ << ")" << std::endl;
    return true;
}

int WorkerProcess::take_stdin_fd() {
    int fd = stdin_fd_;
    stdin_fd_ = -1;
    return fd;
}

int WorkerProcess::take_stdout_fd() {
    int fd = stdout_fd_;
    stdout_fd_ = -1;
    return fd;
}

std::optional<int> WorkerProcess::poll_exit() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (exit_status_.has_value() || pid_ <= 0) return exit_status_;

    int status = 0;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        exit_status_ = status;
    } else if (ret < 0 && errno == ECHILD) {
        // Reaped elsewhere; treat as exited
        exit_status_ = 0;
    }
    return exit_status_;
}

bool WorkerProcess::wait_exit(int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        if (poll_exit().has_value()) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(EXIT_POLL_MS));
    }
}

void WorkerProcess::terminate(int grace_ms) {
    if (pid_ <= 0 || poll_exit().has_value()) return;

    kill(pid_, SIGTERM);
    if (wait_exit(grace_ms)) return;

    std::cerr << "Worker " << pid_ << " ignored SIGTERM, killing" << std::endl;
    kill(pid_, SIGKILL);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!exit_status_.has_value()) {
        int status = 0;
        if (waitpid(pid_, &status, 0) == pid_) {
            exit_status_ = status;
        } else {
            exit_status_ = 0;
        }
    }
}

std::string WorkerProcess::describe_status(int wait_status) {
    if (WIFEXITED(wait_status)) {
        return "exited with status " + std::to_string(WEXITSTATUS(wait_status));
    }
    if (WIFSIGNALED(wait_status)) {
        return "killed by signal " + std::to_string(WTERMSIG(wait_status));
    }
    return "stopped";
}

void WorkerProcess::stderr_loop() {
    std::string pending;
    char buffer[4096];

    while (true) {
        ssize_t n = ::read(stderr_fd_, buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;

        pending.append(buffer, static_cast<size_t>(n));
        size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, pos);
            pending.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();

            if (echo_stderr_) std::cerr << "[worker] " << line << std::endl;
            if (log_) log_->append(std::move(line));
        }

        // Runaway output without newlines is flushed as one line
        if (pending.size() > MAX_STDERR_LINE) {
            if (log_) log_->append(pending);
            pending.clear();
        }
    }

    if (!pending.empty()) {
        if (echo_stderr_) std::cerr << "[worker] " << pending << std::endl;
        if (log_) log_->append(std::move(pending));
    }
}

void WorkerProcess::close_fds() {
    if (stdin_fd_ >= 0) {
        ::close(stdin_fd_);
        stdin_fd_ = -1;
    }
    if (stdout_fd_ >= 0) {
        ::close(stdout_fd_);
        stdout_fd_ = -1;
    }
    // stderr_fd_ is closed only after the drain thread is done with it
}

} // namespace voxbridge
