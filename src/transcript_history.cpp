#include "transcript_history.hpp"

namespace voxbridge {

TranscriptHistory::TranscriptHistory(size_t max_size)
    : max_size_(max_size == 0 ? 1 : max_size) {
}

void TranscriptHistory::add(TranscriptEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(std::move(entry));
    while (entries_.size() > max_size_) {
        entries_.pop_front();
    }
}

bool TranscriptHistory::set_outcome(const std::string& session_id, const std::string& injection,
                                    const std::string& warning) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->session_id == session_id) {
            it->injection = injection;
            it->warning = warning;
            return true;
        }
    }
    return false;
}

std::optional<TranscriptEntry> TranscriptHistory::last() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.empty()) return std::nullopt;
    return entries_.back();
}

std::vector<TranscriptEntry> TranscriptHistory::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<TranscriptEntry>(entries_.rbegin(), entries_.rend());
}

size_t TranscriptHistory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t TranscriptHistory::max_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_size_;
}

void TranscriptHistory::resize(size_t max_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_size_ = max_size == 0 ? 1 : max_size;
    while (entries_.size() > max_size_) {
        entries_.pop_front();
    }
}

void TranscriptHistory::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

} // namespace voxbridge
