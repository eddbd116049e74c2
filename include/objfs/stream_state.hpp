#pragma once

#include "types.hpp"
#include <cstdint>

namespace objfs {

enum class AccessPattern { Initial, Sequential, Random };

const char* AccessPatternName(AccessPattern pattern);

// Chunks [first, last) to prefetch after a read. Empty when first >= last.
struct PrefetchPlan {
    std::uint64_t first = 0;
    std::uint64_t last = 0;

    bool empty() const { return first >= last; }
    std::uint64_t count() const { return empty() ? 0 : last - first; }
};

/**
 * @class StreamState
 * @brief Read-pattern state machine of one open handle.
 *
 * Reads are classified by chunk index against the highest chunk read so far:
 *   - a read past every earlier read offset whose first chunk is the highest
 *     chunk or the one after it advances the stream and bumps the sequential
 *     counter; after 'sequential_threshold' such reads the stream is
 *     Sequential and its window grows by 'prefetch_window_step' per read, up
 *     to 'prefetch_window_max';
 *   - a read within 'sequential_reorder_chunks' of that range (a repeat, a
 *     late arrival or a short skip) keeps the current state;
 *   - any other read makes the stream Random, resets the counter to one and
 *     the window to 'prefetch_window_min'.
 * Only Sequential streams prefetch. Not thread-safe; owned by one handle.
 */
class StreamState {
public:
    StreamState(ObjectId object, const Config& cfg);

    // Records a read of [offset, offset + length) and returns what to prefetch.
    PrefetchPlan OnRead(std::uint64_t offset, std::uint64_t length);

    // The scheduler covered chunks up to 'last' (exclusive).
    void OnPrefetchIssued(std::uint64_t last);

    const ObjectId& object() const { return object_; }
    AccessPattern pattern() const { return pattern_; }
    std::uint32_t window() const { return window_; }
    std::uint64_t sequential_count() const { return sequential_count_; }
    std::uint64_t last_offset() const { return last_offset_; }
    std::uint64_t prefetched_until() const { return prefetched_until_; }
    std::uint64_t chunk_count() const { return chunk_count_; }

private:
    const ObjectId object_;
    const std::uint64_t chunk_size_;
    const std::uint64_t chunk_count_;
    const std::uint32_t sequential_threshold_;
    const std::uint32_t window_min_;
    const std::uint32_t window_step_;
    const std::uint32_t window_max_;
    const std::uint64_t reorder_chunks_;

    AccessPattern pattern_ = AccessPattern::Initial;
    std::uint32_t window_;
    std::uint64_t sequential_count_ = 0;
    std::uint64_t last_offset_ = 0;
    std::uint64_t highest_offset_ = 0;
    std::uint64_t highest_chunk_ = 0;
    std::uint64_t prefetched_until_ = 0;
};

} // namespace objfs
