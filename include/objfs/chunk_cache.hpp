#pragma once

#include "types.hpp"
#include "status.hpp"
#include "hash.hpp"
#include "metrics.hpp"
#include "span_compat.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace objfs {

using ChunkBuffer = std::vector<std::uint8_t>;
using ChunkData = std::shared_ptr<const ChunkBuffer>;

class ChunkCache;

/**
 * @class FetchTicket
 * @brief Completion slot shared by everyone waiting on one in-flight chunk.
 *
 * Resolved once, with data or with an error; later resolutions are ignored.
 * Waiters that give up (their stream was closed) detach without affecting
 * the others.
 */
class FetchTicket {
public:
    explicit FetchTicket(ChunkId id) : id_(std::move(id)) {}

    const ChunkId& id() const { return id_; }

    /**
     * @brief Blocks until the ticket is resolved or '*cancelled' becomes true.
     * @param cancelled Optional flag, re-checked on every wakeup.
     * @param out Receives the chunk bytes on success.
     * @return The fetch result, or Cancelled if the waiter detached first.
     */
    Status Wait(const std::atomic<bool>* cancelled, ChunkData* out);

    // Wakes every waiter so it re-checks its cancellation flag.
    void Interrupt();

    bool Done() const;
    std::size_t Waiters() const;

private:
    friend class ChunkCache;
    // Returns false if the ticket was already resolved.
    bool Resolve(Status status, ChunkData data);

    const ChunkId id_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool done_ = false;
    Status status_;
    ChunkData data_;
    std::size_t waiters_ = 0;
};

/**
 * @class ChunkRef
 * @brief Pinned reference to a resident chunk. The chunk cannot be evicted
 * while a ChunkRef to it is alive. Move-only.
 */
class ChunkRef {
public:
    ChunkRef() = default;
    ~ChunkRef();

    ChunkRef(ChunkRef&& other) noexcept;
    ChunkRef& operator=(ChunkRef&& other) noexcept;
    ChunkRef(const ChunkRef&) = delete;
    ChunkRef& operator=(const ChunkRef&) = delete;

    explicit operator bool() const { return data_ != nullptr; }
    bytes_view bytes() const { return data_ ? bytes_view(*data_) : bytes_view(); }
    const ChunkId& id() const { return id_; }

    // Drops the pin early.
    void Reset();

private:
    friend class ChunkCache;
    ChunkRef(ChunkCache* cache, ChunkId id, std::uint64_t generation, ChunkData data)
        : cache_(cache), id_(std::move(id)), generation_(generation), data_(std::move(data)) {}

    ChunkCache* cache_ = nullptr;
    ChunkId id_;
    std::uint64_t generation_ = 0;
    ChunkData data_;
};

// Outcome of ChunkCache::Acquire. Exactly one of 'ref' and 'ticket' is set.
struct Acquisition {
    ChunkRef ref;                         // resident: pinned bytes
    std::shared_ptr<FetchTicket> ticket;  // in flight: wait on this
    bool is_new = false;                  // the caller must start the fetch
    std::uint64_t generation = 0;         // identifies the waiter's pin
};

/**
 * @class ChunkCache
 * @brief Byte-budgeted store of fetched chunks with in-flight deduplication.
 *
 * A chunk is absent, in flight or resident. Resident chunks without pins are
 * kept in LRU order and evicted once resident bytes exceed the budget; pinned
 * or in-flight chunks are never evicted, so the budget can be exceeded while
 * everything is pinned. All state transitions happen under one mutex.
 */
class ChunkCache {
public:
    ChunkCache(std::uint64_t capacity_bytes, std::uint64_t chunk_size, Metrics* metrics);
    ~ChunkCache();

    ChunkCache(const ChunkCache&) = delete;
    ChunkCache& operator=(const ChunkCache&) = delete;

    // Pinned bytes of a resident chunk, or an empty ref.
    ChunkRef Get(const ChunkId& id);

    // Makes a chunk resident. Resolves the chunk's ticket if it is in flight.
    void Insert(const ChunkId& id, ChunkBuffer bytes);

    /**
     * @brief Ticket for an in-flight chunk, creating one if the chunk is absent.
     * @return The ticket and whether it was created by this call, or
     * std::nullopt if the chunk is already resident.
     */
    std::optional<std::pair<std::shared_ptr<FetchTicket>, bool>> Reserve(const ChunkId& id,
                                                                        bool prefetch = false);

    /**
     * @brief Resident lookup and reservation in one step, taking a reader pin.
     *
     * If the chunk is resident the returned ref holds the pin. Otherwise the
     * pin is attached to the chunk's entry until the caller converts it with
     * Adopt() or drops it with ReleasePin().
     */
    Acquisition Acquire(const ChunkId& id);

    // Turns the pin taken by Acquire() into a ChunkRef once the ticket resolved.
    ChunkRef Adopt(const ChunkId& id, std::uint64_t generation, ChunkData data);

    void ReleasePin(const ChunkId& id, std::uint64_t generation);

    /**
     * Resolves an in-flight chunk. Complete() tolerates a ticket nobody waits
     * on. If Insert() already made the chunk resident, the inserted bytes win
     * and both calls leave the entry alone.
     */
    void Complete(const std::shared_ptr<FetchTicket>& ticket, ChunkData data);
    void Fail(const std::shared_ptr<FetchTicket>& ticket, const Status& status);

    // Drops every unpinned resident chunk of one object version; returns how many.
    std::size_t Invalidate(const std::string& key, const std::string& etag);

    std::uint64_t ResidentBytes() const;
    std::uint64_t CapacityBytes() const;
    std::size_t ResidentChunks() const;
    std::size_t InFlightChunks() const;

private:
    enum class ChunkState { InFlight, Resident };

    struct Entry {
        ChunkState state = ChunkState::InFlight;
        std::uint64_t generation = 0;
        std::uint32_t pins = 0;
        bool prefetched_unread = false;
        std::shared_ptr<FetchTicket> ticket;
        ChunkData data;
        std::list<ChunkId>::iterator lru_it;
        bool in_lru = false;
    };

    friend class ChunkRef;
    void Unpin(const ChunkId& id, std::uint64_t generation);

    // Assumes lock is held
    void MakeResident(const ChunkId& id, Entry& entry, ChunkData data);
    void PinLocked(Entry& entry);
    void TouchLocked(const ChunkId& id, Entry& entry);
    void UnlinkLocked(Entry& entry);
    void EvictLocked();

    const std::uint64_t capacity_bytes_;
    Metrics* metrics_;

    mutable std::mutex mutex_;
    std::unordered_map<ChunkId, Entry, ChunkIdHash> entries_;
    std::list<ChunkId> lru_list_; // unpinned resident chunks, MRU at front
    std::uint64_t resident_bytes_ = 0;
    std::size_t resident_chunks_ = 0;
    std::uint64_t next_generation_ = 1;
};

} // namespace objfs
