#pragma once

#include "types.hpp"
#include "status.hpp"
#include "metrics.hpp"
#include "object_client.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace objfs {

// Range fetches against an ObjectClient with version checking and bounded
// exponential backoff. Only Transient failures are retried; once the attempt
// budget is spent they surface as Unavailable. Thread-safe.
class RemoteClient {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    RemoteClient(std::shared_ptr<ObjectClient> transport, const Config& cfg, Metrics* metrics);

    // Fetches [offset, offset + length) of 'obj', clamped to its size. The
    // returned bytes always belong to the version named by obj.etag.
    Status Fetch(const ObjectId& obj, std::uint64_t offset, std::uint64_t length,
                 std::vector<std::uint8_t>* out);

    Status Head(const std::string& key, ObjectId* out);

    // Delay before retry number 'attempt' (1-based), without jitter.
    std::chrono::milliseconds BackoffDelay(std::uint32_t attempt) const;

    // Replaces the sleep between attempts. Used by tests.
    void SetSleepFunction(SleepFn fn) { sleep_ = std::move(fn); }

private:
    Status FetchOnce(const ObjectId& obj, std::uint64_t offset, std::uint64_t length,
                     std::vector<std::uint8_t>* out);
    std::chrono::milliseconds Jittered(std::chrono::milliseconds delay);

    std::shared_ptr<ObjectClient> transport_;
    std::uint32_t max_attempts_;
    std::uint32_t base_delay_ms_;
    std::uint32_t max_delay_ms_;
    Metrics* metrics_;
    SleepFn sleep_;

    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

} // namespace objfs
