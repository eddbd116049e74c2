#include "objfs/metrics.hpp"

namespace objfs {

void Metrics::RecordFetchLatency(std::uint64_t micros) {
    std::size_t bucket = 0;
    while (bucket < kLatencyBoundsMs.size() && micros >= kLatencyBoundsMs[bucket] * 1000) {
        ++bucket;
    }
    latency_buckets_[bucket].fetch_add(1, std::memory_order_relaxed);
}

MetricsSnapshot Metrics::Snapshot() const {
    MetricsSnapshot s;
    s.cache_hits = cache_hits.load(std::memory_order_relaxed);
    s.cache_misses = cache_misses.load(std::memory_order_relaxed);
    s.joined_fetches = joined_fetches.load(std::memory_order_relaxed);
    s.remote_requests = remote_requests.load(std::memory_order_relaxed);
    s.bytes_fetched = bytes_fetched.load(std::memory_order_relaxed);
    s.retries = retries.load(std::memory_order_relaxed);
    s.fetch_errors = fetch_errors.load(std::memory_order_relaxed);
    s.prefetches_issued = prefetches_issued.load(std::memory_order_relaxed);
    s.prefetches_wasted = prefetches_wasted.load(std::memory_order_relaxed);
    s.evictions = evictions.load(std::memory_order_relaxed);
    s.fetch_latency_buckets.reserve(latency_buckets_.size());
    for (const auto& b : latency_buckets_) {
        s.fetch_latency_buckets.push_back(b.load(std::memory_order_relaxed));
    }
    return s;
}

} // namespace objfs
