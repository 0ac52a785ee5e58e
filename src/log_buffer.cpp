#include "log_buffer.hpp"
#include <algorithm>

namespace voxbridge {

LogBuffer::LogBuffer(size_t max_lines, size_t max_bytes)
    : max_lines_(std::max<size_t>(max_lines, 1)),
      max_bytes_(std::max<size_t>(max_bytes, 1)) {
}

void LogBuffer::append(std::string line) {
    if (line.size() > max_bytes_) {
        line.resize(max_bytes_);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    bytes_ += line.size();
    lines_.push_back(std::move(line));

    while (!lines_.empty() && (lines_.size() > max_lines_ || bytes_ > max_bytes_)) {
        bytes_ -= lines_.front().size();
        lines_.pop_front();
    }
}

std::vector<std::string> LogBuffer::lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(lines_.begin(), lines_.end());
}

std::vector<std::string> LogBuffer::tail(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = std::min(count, lines_.size());
    return std::vector<std::string>(lines_.end() - static_cast<std::ptrdiff_t>(n), lines_.end());
}

size_t LogBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

size_t LogBuffer::bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_;
}

void LogBuffer::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
    bytes_ = 0;
}

} // namespace voxbridge
