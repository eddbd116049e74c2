#pragma once

#include "object_client.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace objfs {

/**
 * @class MockClient
 * @brief In-memory object store implementing ObjectClient.
 *
 * Objects get an entity tag derived from their contents, so replacing an
 * object with different bytes changes its tag. Failures can be queued per key
 * and requests can be held back to make concurrency deterministic in tests.
 * Thread-safe.
 */
class MockClient : public ObjectClient {
public:
    MockClient() = default;

    Status GetObjectRange(const std::string& key,
                          std::uint64_t offset,
                          std::uint64_t length,
                          const std::string& if_match,
                          RangeResponse* out) override;

    Status HeadObject(const std::string& key, ObjectId* out) override;

    // Adds or replaces an object and returns its identity.
    ObjectId AddObject(const std::string& key, std::vector<std::uint8_t> contents);
    void RemoveObject(const std::string& key);

    // The next requests for 'key' fail with these kinds, in order.
    void InjectFailures(const std::string& key, const std::vector<ErrorKind>& kinds);

    // Added to every GetObjectRange call.
    void SetLatency(std::chrono::microseconds latency);

    // While paused, GetObjectRange calls block before touching any object.
    // Resume() also lifts every per-key hold.
    void Pause();
    void Resume();

    // Holds back requests for one key only.
    void PauseKey(const std::string& key);
    void ResumeKey(const std::string& key);

    // Waits until at least 'count' requests are held back.
    bool WaitForPending(std::size_t count, std::chrono::milliseconds timeout);

    std::uint64_t RequestCount(const std::string& key) const;
    std::uint64_t TotalRequests() const;
    std::uint32_t PeakConcurrency() const;
    // Ranges requested for 'key' as (offset, length), in arrival order.
    std::vector<std::pair<std::uint64_t, std::uint64_t>> RequestedRanges(const std::string& key) const;

private:
    struct MockObject {
        std::vector<std::uint8_t> contents;
        std::string etag;
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, MockObject> objects_;
    std::map<std::string, std::deque<ErrorKind>> failures_;
    std::map<std::string, std::vector<std::pair<std::uint64_t, std::uint64_t>>> ranges_;
    std::chrono::microseconds latency_{0};
    bool paused_ = false;
    std::set<std::string> paused_keys_;
    std::size_t pending_ = 0;
    std::uint64_t total_requests_ = 0;
    std::uint32_t running_ = 0;
    std::uint32_t peak_running_ = 0;
};

} // namespace objfs
