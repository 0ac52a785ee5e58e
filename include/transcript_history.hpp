#pragma once

#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <chrono>
#include <optional>

namespace voxbridge {

struct TranscriptEntry {
    std::string session_id;
    std::string text;
    std::chrono::system_clock::time_point timestamp;
    std::string injection;      // injected, clipboard_only, failed, pending
    std::string warning;
};

// Bounded, newest-last list of delivered transcripts
class TranscriptHistory {
public:
    explicit TranscriptHistory(size_t max_size = 100);

    void add(TranscriptEntry entry);

    // Record how delivery went for an entry already added
    bool set_outcome(const std::string& session_id, const std::string& injection, const std::string& warning);

    std::optional<TranscriptEntry> last() const;

    // Newest first
    std::vector<TranscriptEntry> entries() const;

    size_t size() const;
    size_t max_size() const;
    void resize(size_t max_size);
    void clear();

private:
    mutable std::mutex mutex_;
    std::deque<TranscriptEntry> entries_;
    size_t max_size_;
};

} // namespace voxbridge
