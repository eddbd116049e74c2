#include "objfs/chunk_cache.hpp"

#include <fmt/format.h>
#include <glog/logging.h>

namespace objfs {

// --- FetchTicket ---

Status FetchTicket::Wait(const std::atomic<bool>* cancelled, ChunkData* out) {
    std::unique_lock<std::mutex> lock(mutex_);
    ++waiters_;
    cv_.wait(lock, [&] {
        return done_ || (cancelled != nullptr && cancelled->load());
    });
    --waiters_;

    if (!done_) {
        return Status::Cancelled(fmt::format("{} chunk {}: waiter detached", id_.key, id_.index));
    }
    if (status_.ok()) {
        *out = data_;
    }
    return status_;
}

void FetchTicket::Interrupt() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
    }
    cv_.notify_all();
}

bool FetchTicket::Resolve(Status status, ChunkData data) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (done_) {
            return false;
        }
        done_ = true;
        status_ = std::move(status);
        data_ = std::move(data);
    }
    cv_.notify_all();
    return true;
}

bool FetchTicket::Done() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return done_;
}

std::size_t FetchTicket::Waiters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_;
}

// --- ChunkRef ---

ChunkRef::~ChunkRef() {
    Reset();
}

ChunkRef::ChunkRef(ChunkRef&& other) noexcept
    : cache_(other.cache_),
      id_(std::move(other.id_)),
      generation_(other.generation_),
      data_(std::move(other.data_)) {
    other.cache_ = nullptr;
}

ChunkRef& ChunkRef::operator=(ChunkRef&& other) noexcept {
    if (this != &other) {
        Reset();
        cache_ = other.cache_;
        id_ = std::move(other.id_);
        generation_ = other.generation_;
        data_ = std::move(other.data_);
        other.cache_ = nullptr;
    }
    return *this;
}

void ChunkRef::Reset() {
    if (cache_ != nullptr) {
        cache_->Unpin(id_, generation_);
        cache_ = nullptr;
    }
    data_.reset();
}

// --- ChunkCache ---

ChunkCache::ChunkCache(std::uint64_t capacity_bytes, std::uint64_t chunk_size, Metrics* metrics)
    : capacity_bytes_(capacity_bytes), metrics_(metrics) {
    CHECK(metrics_) << "ChunkCache needs a metrics sink";
    // Size the index once for the resident set plus in-flight headroom
    if (chunk_size > 0) {
        entries_.reserve(static_cast<std::size_t>(capacity_bytes / chunk_size) * 2 + 16);
    }
}

ChunkCache::~ChunkCache() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t in_flight = entries_.size() - resident_chunks_;
    LOG_IF(WARNING, in_flight > 0) << in_flight << " chunks still in flight at cache shutdown";
}

void ChunkCache::PinLocked(Entry& entry) {
    UnlinkLocked(entry);
    ++entry.pins;
    entry.prefetched_unread = false;
}

void ChunkCache::TouchLocked(const ChunkId& id, Entry& entry) {
    if (entry.in_lru) {
        lru_list_.splice(lru_list_.begin(), lru_list_, entry.lru_it);
    } else {
        lru_list_.push_front(id);
        entry.lru_it = lru_list_.begin();
        entry.in_lru = true;
    }
}

void ChunkCache::UnlinkLocked(Entry& entry) {
    if (entry.in_lru) {
        lru_list_.erase(entry.lru_it);
        entry.in_lru = false;
    }
}

void ChunkCache::MakeResident(const ChunkId& id, Entry& entry, ChunkData data) {
    entry.state = ChunkState::Resident;
    entry.ticket.reset();
    resident_bytes_ += data->size();
    ++resident_chunks_;
    entry.data = std::move(data);
    if (entry.pins == 0) {
        TouchLocked(id, entry);
    }
}

void ChunkCache::EvictLocked() {
    while (resident_bytes_ > capacity_bytes_) {
        if (lru_list_.empty()) {
            // Everything resident is pinned; shrink again on the next unpin
            VLOG(4) << fmt::format("cache over budget with all chunks pinned: {} > {}",
                                   resident_bytes_, capacity_bytes_);
            return;
        }
        auto it = entries_.find(lru_list_.back());
        CHECK(it != entries_.end());
        lru_list_.pop_back();
        Entry& entry = it->second;
        CHECK(entry.state == ChunkState::Resident && entry.pins == 0);

        resident_bytes_ -= entry.data->size();
        --resident_chunks_;
        metrics_->evictions.fetch_add(1, std::memory_order_relaxed);
        if (entry.prefetched_unread) {
            metrics_->prefetches_wasted.fetch_add(1, std::memory_order_relaxed);
        }
        VLOG(5) << fmt::format("evict {} chunk {}", it->first.key, it->first.index);
        entries_.erase(it);
    }
}

ChunkRef ChunkCache::Get(const ChunkId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end() || it->second.state != ChunkState::Resident) {
        return ChunkRef();
    }
    PinLocked(it->second);
    return ChunkRef(this, id, it->second.generation, it->second.data);
}

void ChunkCache::Insert(const ChunkId& id, ChunkBuffer bytes) {
    auto data = std::make_shared<const ChunkBuffer>(std::move(bytes));
    std::shared_ptr<FetchTicket> ticket;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            Entry& entry = entries_[id];
            entry.generation = next_generation_++;
            MakeResident(id, entry, data);
        } else if (it->second.state == ChunkState::InFlight) {
            ticket = it->second.ticket;
            MakeResident(id, it->second, data);
        } else if (it->second.pins == 0) {
            TouchLocked(id, it->second);
        }
        EvictLocked();
    }
    if (ticket) {
        ticket->Resolve(Status::OK(), data);
    }
}

std::optional<std::pair<std::shared_ptr<FetchTicket>, bool>> ChunkCache::Reserve(const ChunkId& id,
                                                                                 bool prefetch) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it != entries_.end()) {
        if (it->second.state == ChunkState::Resident) {
            return std::nullopt;
        }
        return std::make_pair(it->second.ticket, false);
    }

    Entry& entry = entries_[id];
    entry.generation = next_generation_++;
    entry.prefetched_unread = prefetch;
    entry.ticket = std::make_shared<FetchTicket>(id);
    return std::make_pair(entry.ticket, true);
}

Acquisition ChunkCache::Acquire(const ChunkId& id) {
    Acquisition acq;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        Entry& entry = entries_[id];
        entry.generation = next_generation_++;
        entry.ticket = std::make_shared<FetchTicket>(id);
        entry.pins = 1;
        acq.ticket = entry.ticket;
        acq.is_new = true;
        acq.generation = entry.generation;
        return acq;
    }

    Entry& entry = it->second;
    PinLocked(entry);
    acq.generation = entry.generation;
    if (entry.state == ChunkState::Resident) {
        acq.ref = ChunkRef(this, id, entry.generation, entry.data);
    } else {
        acq.ticket = entry.ticket;
    }
    return acq;
}

ChunkRef ChunkCache::Adopt(const ChunkId& id, std::uint64_t generation, ChunkData data) {
    return ChunkRef(this, id, generation, std::move(data));
}

void ChunkCache::ReleasePin(const ChunkId& id, std::uint64_t generation) {
    Unpin(id, generation);
}

void ChunkCache::Unpin(const ChunkId& id, std::uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    // A failed fetch removes the entry; a later reservation starts a new generation
    if (it == entries_.end() || it->second.generation != generation) {
        return;
    }
    Entry& entry = it->second;
    CHECK_GT(entry.pins, 0u) << "unbalanced unpin of " << id.key << " chunk " << id.index;
    if (--entry.pins == 0 && entry.state == ChunkState::Resident) {
        TouchLocked(id, entry);
        EvictLocked();
    }
}

void ChunkCache::Complete(const std::shared_ptr<FetchTicket>& ticket, ChunkData data) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(ticket->id());
        if (it != entries_.end() && it->second.ticket == ticket) {
            MakeResident(ticket->id(), it->second, data);
            EvictLocked();
        } else {
            VLOG(2) << fmt::format("completed {} chunk {} no longer reserved",
                                   ticket->id().key, ticket->id().index);
        }
    }
    if (!ticket->Resolve(Status::OK(), std::move(data))) {
        VLOG(2) << fmt::format("{} chunk {} was inserted while its fetch ran",
                               ticket->id().key, ticket->id().index);
    }
}

void ChunkCache::Fail(const std::shared_ptr<FetchTicket>& ticket, const Status& status) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(ticket->id());
        if (it != entries_.end() && it->second.ticket == ticket) {
            entries_.erase(it);
        }
    }
    if (!ticket->Resolve(status, nullptr)) {
        VLOG(2) << fmt::format("{} chunk {} was inserted before its fetch failed: {}",
                               ticket->id().key, ticket->id().index, status.ToString());
    }
}

std::size_t ChunkCache::Invalidate(const std::string& key, const std::string& etag) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t dropped = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        const Entry& entry = it->second;
        if (it->first.key == key && it->first.etag == etag && entry.state == ChunkState::Resident && entry.pins == 0) {
            lru_list_.erase(entry.lru_it);
            resident_bytes_ -= entry.data->size();
            --resident_chunks_;
            it = entries_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

std::uint64_t ChunkCache::ResidentBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resident_bytes_;
}

std::uint64_t ChunkCache::CapacityBytes() const {
    return capacity_bytes_;
}

std::size_t ChunkCache::ResidentChunks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resident_chunks_;
}

std::size_t ChunkCache::InFlightChunks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size() - resident_chunks_;
}

} // namespace objfs
