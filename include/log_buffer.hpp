#pragma once

#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <cstddef>

namespace voxbridge {

// Bounded ring of diagnostic lines captured from the worker's stderr.
// Oldest lines are evicted first once either limit is reached.
class LogBuffer {
public:
    LogBuffer(size_t max_lines = 500, size_t max_bytes = 256 * 1024);

    void append(std::string line);

    std::vector<std::string> lines() const;
    std::vector<std::string> tail(size_t count) const;

    size_t size() const;
    size_t bytes() const;
    void clear();

private:
    size_t max_lines_;
    size_t max_bytes_;

    mutable std::mutex mutex_;
    std::deque<std::string> lines_;
    size_t bytes_ = 0;
};

} // namespace voxbridge
