#include "framed_transport.hpp"
#include <iostream>
#include <cstring>
#include <cerrno>
#include <poll.h>
#include <unistd.h>

namespace voxbridge {

LineFramer::LineFramer(size_t max_line)
    : max_line_(max_line) {
}

bool LineFramer::feed(const char* data, size_t len, std::vector<std::string>& out) {
    if (failed_) return false;

    size_t pos = 0;
    while (pos < len) {
        const void* hit = std::memchr(data + pos, '\n', len - pos);
        if (!hit) {
            buffer_.append(data + pos, len - pos);
            break;
        }

        size_t segment = static_cast<size_t>(static_cast<const char*>(hit) - (data + pos));
        buffer_.append(data + pos, segment);
        pos += segment + 1;

        if (!buffer_.empty() && buffer_.back() == '\r') {
            buffer_.pop_back();
        }
        if (buffer_.size() > max_line_) {
            failed_ = true;
            buffer_.clear();
            return false;
        }
        if (!buffer_.empty()) {
            out.push_back(std::move(buffer_));
        }
        buffer_.clear();
    }

    // An unterminated line is already fatal once it cannot fit.
    // One extra byte is allowed for a trailing CR.
    if (buffer_.size() > max_line_ + 1) {
        failed_ = true;
        buffer_.clear();
        return false;
    }
    return true;
}

FramedTransport::FramedTransport(int read_fd, int write_fd, size_t max_line)
    : read_fd_(read_fd), write_fd_(write_fd), framer_(max_line) {
}

FramedTransport::~FramedTransport() {
    close();
    if (read_fd_ >= 0) {
        ::close(read_fd_);
        read_fd_ = -1;
    }
}

bool FramedTransport::write_message(const std::string& body) {
    if (body.find('\n') != std::string::npos) {
        std::cerr << "Refusing to frame a message with an embedded newline" << std::endl;
        return false;
    }

    std::string frame = body;
    frame += '\n';

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!open_.load() || write_fd_ < 0) return false;

    size_t written = 0;
    while (written < frame.size()) {
        ssize_t n = ::write(write_fd_, frame.data() + written, frame.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::cerr << "Write to worker failed: " << std::strerror(errno) << std::endl;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

FramedTransport::ReadStatus FramedTransport::read_message(std::string& out, int timeout_ms) {
    if (!ready_.empty()) {
        out = std::move(ready_.front());
        ready_.pop_front();
        return ReadStatus::Message;
    }
    if (framer_.failed()) return ReadStatus::Fatal;
    if (eof_ || read_fd_ < 0) return ReadStatus::Closed;

    struct pollfd pfd;
    pfd.fd = read_fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ret = ::poll(&pfd, 1, timeout_ms);
    if (ret < 0) {
        if (errno == EINTR) return ReadStatus::Timeout;
        eof_ = true;
        return ReadStatus::Closed;
    }
    if (ret == 0) return ReadStatus::Timeout;

    char buffer[65536];
    ssize_t n = ::read(read_fd_, buffer, sizeof(buffer));
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) return ReadStatus::Timeout;
        eof_ = true;
        return ReadStatus::Closed;
    }
    if (n == 0) {
        eof_ = true;
        return ReadStatus::Closed;
    }

    std::vector<std::string> lines;
    bool ok = framer_.feed(buffer, static_cast<size_t>(n), lines);
    for (auto& line : lines) {
        ready_.push_back(std::move(line));
    }
    if (!ok) {
        std::cerr << "Framing error: line exceeds " << framer_.max_line() << " bytes" << std::endl;
    }

    // Lines completed before the violation are still delivered first
    if (!ready_.empty()) {
        out = std::move(ready_.front());
        ready_.pop_front();
        return ReadStatus::Message;
    }
    return ok ? ReadStatus::Timeout : ReadStatus::Fatal;
}

void FramedTransport::close() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    open_.store(false);
    if (write_fd_ >= 0) {
        ::close(write_fd_);
        write_fd_ = -1;
    }
}

} // namespace voxbridge
