#pragma once

#include "types.hpp"
#include "chunk_cache.hpp"
#include "metrics.hpp"
#include "remote_client.hpp"
#include "stream_state.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace objfs {

// Number of prefetches a stream has queued or running.
using PrefetchCounter = std::shared_ptr<std::atomic<std::uint32_t>>;

/**
 * @class ChunkScheduler
 * @brief Runs chunk fetches on a fixed pool of workers.
 *
 * The pool size is the global bound on concurrent remote fetches. Blocking
 * fetches (a reader is waiting) are always dequeued before prefetches.
 * Adjacent pending fetches of the same object are merged into one range
 * request of at most 'max_coalesced_chunks' chunks.
 */
class ChunkScheduler {
public:
    ChunkScheduler(const Config& cfg, RemoteClient* remote, ChunkCache* cache, Metrics* metrics);
    ~ChunkScheduler();

    ChunkScheduler(const ChunkScheduler&) = delete;
    ChunkScheduler& operator=(const ChunkScheduler&) = delete;

    // Queues the fetch for a freshly reserved chunk at blocking priority.
    void SubmitBlocking(const ObjectId& object, std::shared_ptr<FetchTicket> ticket);

    // Moves a queued prefetch covering 'id' to the blocking queue, because a
    // reader now waits on it. Returns false if no queued prefetch covers it.
    bool Promote(const ChunkId& id);

    /**
     * @brief Reserves and queues prefetches for the chunks of 'plan', in order.
     *
     * Stops at the first chunk that would exceed the global slot count or the
     * stream's 'max_prefetch_per_stream'. Chunks already resident or in flight
     * are skipped.
     * @return One past the last chunk covered, or plan.first if none was.
     */
    std::uint64_t SubmitPrefetch(const ObjectId& object, const PrefetchPlan& plan,
                                 const PrefetchCounter& outstanding);

    // Blocks until no fetch is queued or running. Never returns while
    // suspended with work queued.
    void WaitIdle();

    // While suspended, running fetches finish but no queued job is started.
    void Suspend();
    void Resume();

    // Chunks waiting in either queue.
    std::size_t Queued() const;

private:
    struct Slot {
        std::shared_ptr<FetchTicket> ticket;
        PrefetchCounter outstanding;  // null for blocking fetches
    };

    struct FetchJob {
        ObjectId object;
        std::uint64_t first = 0;
        std::vector<Slot> slots;  // chunks first, first + 1, ...
    };

    // Assumes lock is held
    void EnqueueLocked(std::deque<FetchJob>& queue, const ObjectId& object, Slot slot);
    bool HasFreeSlotLocked() const;

    void WorkerLoop();
    void Execute(FetchJob& job);
    void Abandon(FetchJob& job, const Status& status);

    const std::uint64_t chunk_size_;
    const std::uint32_t max_concurrent_;
    const std::uint32_t max_prefetch_per_stream_;
    const std::uint32_t max_coalesced_;
    RemoteClient* remote_;
    ChunkCache* cache_;
    Metrics* metrics_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<FetchJob> blocking_;
    std::deque<FetchJob> prefetch_;
    std::size_t running_ = 0;
    bool suspended_ = false;
    bool stopping_ = false;
    std::vector<std::thread> workers_;
};

} // namespace objfs
