#include "objfs/stream_state.hpp"

#include <algorithm>
#include <glog/logging.h>

namespace objfs {

const char* AccessPatternName(AccessPattern pattern) {
    switch (pattern) {
        case AccessPattern::Initial: return "initial";
        case AccessPattern::Sequential: return "sequential";
        case AccessPattern::Random: return "random";
    }
    return "unknown";
}

StreamState::StreamState(ObjectId object, const Config& cfg)
    : object_(std::move(object)),
      chunk_size_(cfg.chunk_size),
      chunk_count_((object_.size + cfg.chunk_size - 1) / cfg.chunk_size),
      sequential_threshold_(cfg.sequential_threshold),
      window_min_(cfg.prefetch_window_min),
      window_step_(cfg.prefetch_window_step),
      window_max_(cfg.prefetch_window_max),
      reorder_chunks_(cfg.sequential_reorder_chunks),
      window_(cfg.prefetch_window_min) {}

PrefetchPlan StreamState::OnRead(std::uint64_t offset, std::uint64_t length) {
    if (length == 0) {
        return {};
    }
    const std::uint64_t first_chunk = offset / chunk_size_;
    const std::uint64_t last_chunk = (offset + length - 1) / chunk_size_;
    const AccessPattern before = pattern_;

    if (sequential_count_ == 0) {
        sequential_count_ = 1;
        highest_chunk_ = last_chunk;
        highest_offset_ = offset;
    } else if (offset > highest_offset_ && first_chunk >= highest_chunk_ &&
               first_chunk <= highest_chunk_ + 1) {
        ++sequential_count_;
        highest_chunk_ = std::max(highest_chunk_, last_chunk);
        highest_offset_ = offset;
        if (pattern_ == AccessPattern::Sequential) {
            window_ = std::min(window_ + window_step_, window_max_);
        } else if (sequential_count_ >= sequential_threshold_) {
            pattern_ = AccessPattern::Sequential;
            window_ = window_min_;
        }
    } else if (last_chunk + reorder_chunks_ >= highest_chunk_ &&
               first_chunk <= highest_chunk_ + 1 + reorder_chunks_) {
        highest_chunk_ = std::max(highest_chunk_, last_chunk);
        highest_offset_ = std::max(highest_offset_, offset);
    } else {
        pattern_ = AccessPattern::Random;
        sequential_count_ = 1;
        window_ = window_min_;
        highest_chunk_ = last_chunk;
        highest_offset_ = offset;
        prefetched_until_ = 0;
    }

    if (pattern_ != before) {
        VLOG(3) << object_.key << ": stream " << AccessPatternName(before) << " -> "
                << AccessPatternName(pattern_) << " at chunk " << first_chunk;
    }
    last_offset_ = offset;

    PrefetchPlan plan;
    if (pattern_ != AccessPattern::Sequential) {
        return plan;
    }
    plan.first = std::max(highest_chunk_ + 1, prefetched_until_);
    plan.last = std::min<std::uint64_t>(highest_chunk_ + 1 + window_, chunk_count_);
    return plan;
}

void StreamState::OnPrefetchIssued(std::uint64_t last) {
    prefetched_until_ = std::max(prefetched_until_, last);
}

} // namespace objfs
