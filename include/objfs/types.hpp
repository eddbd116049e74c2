#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace objfs {

// Identity of a remote object as resolved at open time. Immutable for the
// lifetime of a stream handle.
struct ObjectId {
    std::string key;
    std::uint64_t size = 0;
    std::string etag;
};

inline bool operator==(const ObjectId& a, const ObjectId& b) {
    return a.key == b.key && a.size == b.size && a.etag == b.etag;
}

struct ChunkId {
    std::string key;
    std::string etag;
    std::uint64_t index;
};

inline bool operator==(const ChunkId& a, const ChunkId& b) {
    return a.index == b.index && a.key == b.key && a.etag == b.etag;
}

inline bool operator!=(const ChunkId& a, const ChunkId& b) {
    return !(a == b);
}

using StreamHandle = std::uint64_t;

struct Config {
    // Data path
    std::uint64_t chunk_size = 8ull * 1024 * 1024;              // 8 MiB
    std::uint64_t cache_capacity_bytes = 1024ull * 1024 * 1024; // 1 GiB
    std::uint32_t max_concurrent_fetches = 16;
    std::uint32_t max_prefetch_per_stream = 4;
    std::uint32_t max_coalesced_chunks = 4;

    // Prefetch window, in chunks
    std::uint32_t sequential_threshold = 2;
    std::uint32_t prefetch_window_min = 1;
    std::uint32_t prefetch_window_step = 1;
    std::uint32_t prefetch_window_max = 16;
    // Out-of-order reads this many chunks behind or ahead neither count nor reset
    std::uint32_t sequential_reorder_chunks = 2;

    // Retries
    std::uint32_t max_attempts = 3;
    std::uint32_t retry_base_delay_ms = 100;
    std::uint32_t retry_max_delay_ms = 2000;

    // S3 Configuration
    std::string s3_endpoint;
    std::string s3_region;
    std::string s3_bucket;
    std::string aws_access_key_id;
    std::string aws_secret_access_key;
    bool s3_use_path_style = true;
};

// Point-in-time copy of the data path counters.
struct MetricsSnapshot {
    std::uint64_t cache_hits = 0;
    std::uint64_t cache_misses = 0;
    std::uint64_t joined_fetches = 0;
    std::uint64_t remote_requests = 0;
    std::uint64_t bytes_fetched = 0;
    std::uint64_t retries = 0;
    std::uint64_t fetch_errors = 0;
    std::uint64_t prefetches_issued = 0;
    std::uint64_t prefetches_wasted = 0;
    std::uint64_t evictions = 0;
    std::vector<std::uint64_t> fetch_latency_buckets;
};

} // namespace objfs
