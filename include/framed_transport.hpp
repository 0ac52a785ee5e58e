#pragma once

#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <atomic>
#include <cstddef>

namespace voxbridge {

// Maximum length of one framed line, excluding the delimiter
constexpr size_t MAX_LINE_BYTES = 1024 * 1024;

// Splits a byte stream into newline-terminated lines.
// Keeps partial input across feed() calls and strips one CR before LF.
// Blank lines are skipped. Once a line exceeds the limit the framer
// stays failed; the stream behind it can no longer be trusted.
class LineFramer {
public:
    explicit LineFramer(size_t max_line = MAX_LINE_BYTES);

    // Append bytes, pushing every completed line into out.
    // Returns false on an oversized line (latched).
    bool feed(const char* data, size_t len, std::vector<std::string>& out);

    bool failed() const { return failed_; }
    size_t buffered() const { return buffer_.size(); }
    size_t max_line() const { return max_line_; }

private:
    size_t max_line_;
    std::string buffer_;
    bool failed_ = false;
};

// Line-framed message channel over a pair of file descriptors.
// Takes ownership of both descriptors.
class FramedTransport {
public:
    enum class ReadStatus {
        Message,    // out holds one complete line
        Timeout,    // nothing complete yet
        Closed,     // EOF or read error
        Fatal       // framing violation, channel must be dropped
    };

    FramedTransport(int read_fd, int write_fd, size_t max_line = MAX_LINE_BYTES);
    ~FramedTransport();

    FramedTransport(const FramedTransport&) = delete;
    FramedTransport& operator=(const FramedTransport&) = delete;

    // Write one message plus '\n'. Rejects bodies with embedded newlines.
    // Safe to call from several threads.
    bool write_message(const std::string& body);

    // Single reader only
    ReadStatus read_message(std::string& out, int timeout_ms);

    // Stop writing and mark closed. The read side is released in the destructor
    // so a concurrent reader never polls a recycled descriptor.
    void close();
    bool is_open() const { return open_.load(); }

private:
    int read_fd_;
    int write_fd_;
    LineFramer framer_;
    std::deque<std::string> ready_;
    bool eof_ = false;

    std::mutex write_mutex_;
    std::atomic<bool> open_{true};
};

} // namespace voxbridge
