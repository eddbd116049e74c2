#pragma once

#include "types.hpp"
#include <array>
#include <atomic>
#include <cstdint>

namespace objfs {

// Counters shared by the data path components. All members are updated with
// relaxed atomics and may be read from any thread.
class Metrics {
public:
    // Upper bounds (exclusive, milliseconds) of the latency buckets; the last
    // bucket holds everything slower.
    static constexpr std::array<std::uint64_t, 11> kLatencyBoundsMs = {
        1, 2, 4, 8, 16, 32, 64, 128, 256, 512, 1024};

    std::atomic<std::uint64_t> cache_hits{0};
    std::atomic<std::uint64_t> cache_misses{0};
    std::atomic<std::uint64_t> joined_fetches{0};
    std::atomic<std::uint64_t> remote_requests{0};
    std::atomic<std::uint64_t> bytes_fetched{0};
    std::atomic<std::uint64_t> retries{0};
    std::atomic<std::uint64_t> fetch_errors{0};
    std::atomic<std::uint64_t> prefetches_issued{0};
    std::atomic<std::uint64_t> prefetches_wasted{0};
    std::atomic<std::uint64_t> evictions{0};

    void RecordFetchLatency(std::uint64_t micros);

    MetricsSnapshot Snapshot() const;

private:
    std::array<std::atomic<std::uint64_t>, kLatencyBoundsMs.size() + 1> latency_buckets_{};
};

} // namespace objfs
