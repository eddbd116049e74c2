#include "objfs/scheduler.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <glog/logging.h>

namespace objfs {

namespace {

bool SameObject(const ObjectId& a, const ObjectId& b) {
    return a.key == b.key && a.etag == b.etag;
}

} // namespace

ChunkScheduler::ChunkScheduler(const Config& cfg, RemoteClient* remote, ChunkCache* cache, Metrics* metrics)
    : chunk_size_(cfg.chunk_size),
      max_concurrent_(cfg.max_concurrent_fetches),
      max_prefetch_per_stream_(cfg.max_prefetch_per_stream),
      max_coalesced_(cfg.max_coalesced_chunks),
      remote_(remote),
      cache_(cache),
      metrics_(metrics) {
    CHECK(remote_ && cache_ && metrics_);
    workers_.reserve(max_concurrent_);
    for (std::uint32_t i = 0; i < max_concurrent_; ++i) {
        workers_.emplace_back(&ChunkScheduler::WorkerLoop, this);
    }
}

ChunkScheduler::~ChunkScheduler() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    work_cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) {
            t.join();
        }
    }

    // Waiters on fetches that never started are released with an error
    std::deque<FetchJob> leftover;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        leftover.swap(blocking_);
        for (auto& job : prefetch_) {
            leftover.push_back(std::move(job));
        }
        prefetch_.clear();
    }
    for (auto& job : leftover) {
        Abandon(job, Status::Cancelled("scheduler shut down"));
    }
    idle_cv_.notify_all();
}

void ChunkScheduler::EnqueueLocked(std::deque<FetchJob>& queue, const ObjectId& object, Slot slot) {
    const std::uint64_t index = slot.ticket->id().index;
    const bool per_stream = &queue == &prefetch_;

    for (auto& job : queue) {
        if (job.slots.size() >= max_coalesced_ || !SameObject(job.object, object)) {
            continue;
        }
        // Prefetches are only merged within the stream that asked for them
        if (per_stream && job.slots.front().outstanding != slot.outstanding) {
            continue;
        }
        if (index == job.first + job.slots.size()) {
            job.slots.push_back(std::move(slot));
            VLOG(4) << fmt::format("coalesced {} chunk {} into [{}, +{})",
                                   object.key, index, job.first, job.slots.size());
            return;
        }
        if (index + 1 == job.first) {
            job.slots.insert(job.slots.begin(), std::move(slot));
            job.first = index;
            VLOG(4) << fmt::format("coalesced {} chunk {} into [{}, +{})",
                                   object.key, index, job.first, job.slots.size());
            return;
        }
    }

    FetchJob job;
    job.object = object;
    job.first = index;
    job.slots.push_back(std::move(slot));
    queue.push_back(std::move(job));
}

bool ChunkScheduler::HasFreeSlotLocked() const {
    return running_ + blocking_.size() + prefetch_.size() < max_concurrent_;
}

void ChunkScheduler::SubmitBlocking(const ObjectId& object, std::shared_ptr<FetchTicket> ticket) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stopping_) {
            EnqueueLocked(blocking_, object, Slot{std::move(ticket), nullptr});
            work_cv_.notify_one();
            return;
        }
    }
    cache_->Fail(ticket, Status::Cancelled("scheduler shut down"));
}

bool ChunkScheduler::Promote(const ChunkId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = prefetch_.begin(); it != prefetch_.end(); ++it) {
        const auto& job = *it;
        if (job.object.key != id.key || job.object.etag != id.etag ||
            id.index < job.first || id.index >= job.first + job.slots.size()) {
            continue;
        }
        VLOG(3) << fmt::format("promoting prefetch of {} chunks [{}, +{}) for a waiting reader",
                               job.object.key, job.first, job.slots.size());
        blocking_.push_back(std::move(*it));
        prefetch_.erase(it);
        return true;
    }
    return false;
}

std::uint64_t ChunkScheduler::SubmitPrefetch(const ObjectId& object, const PrefetchPlan& plan,
                                             const PrefetchCounter& outstanding) {
    std::uint64_t covered = plan.first;
    std::size_t issued = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (std::uint64_t index = plan.first; index < plan.last && !stopping_; ++index) {
            if (!HasFreeSlotLocked() || outstanding->load() >= max_prefetch_per_stream_) {
                break;
            }

            ChunkId id{object.key, object.etag, index};
            auto reservation = cache_->Reserve(id, /*prefetch=*/true);
            if (reservation && reservation->second) {
                outstanding->fetch_add(1);
                EnqueueLocked(prefetch_, object, Slot{reservation->first, outstanding});
                ++issued;
            }
            covered = index + 1;
        }
    }

    if (issued > 0) {
        metrics_->prefetches_issued.fetch_add(issued, std::memory_order_relaxed);
        VLOG(2) << fmt::format("{}: prefetch {} chunks, covered up to {}", object.key, issued, covered);
        work_cv_.notify_all();
    }
    return covered;
}

void ChunkScheduler::WorkerLoop() {
    for (;;) {
        FetchJob job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] {
                return stopping_ || (!suspended_ && (!blocking_.empty() || !prefetch_.empty()));
            });
            if (stopping_) {
                return;
            }
            auto& queue = blocking_.empty() ? prefetch_ : blocking_;
            job = std::move(queue.front());
            queue.pop_front();
            ++running_;
        }

        Execute(job);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --running_;
        }
        idle_cv_.notify_all();
    }
}

void ChunkScheduler::Execute(FetchJob& job) {
    const std::uint64_t count = job.slots.size();
    const std::uint64_t offset = job.first * chunk_size_;
    const std::uint64_t end = std::min((job.first + count) * chunk_size_, job.object.size);

    std::vector<std::uint8_t> bytes;
    Status st = remote_->Fetch(job.object, offset, end - offset, &bytes);
    if (!st.ok()) {
        bool speculative = std::all_of(job.slots.begin(), job.slots.end(), [](const Slot& s) {
            return s.outstanding != nullptr && s.ticket->Waiters() == 0;
        });
        if (speculative) {
            LOG(WARNING) << fmt::format("prefetch of {} [{}, +{}) failed: {}",
                                        job.object.key, job.first, count, st.ToString());
        }
        Abandon(job, st);
        return;
    }

    VLOG(2) << fmt::format("fetched {} chunks [{}, +{}) = {} bytes",
                           job.object.key, job.first, count, bytes.size());
    for (std::uint64_t k = 0; k < count; ++k) {
        const std::uint64_t begin = std::min<std::uint64_t>(k * chunk_size_, bytes.size());
        const std::uint64_t stop = std::min<std::uint64_t>(begin + chunk_size_, bytes.size());
        auto data = std::make_shared<const ChunkBuffer>(bytes.begin() + begin, bytes.begin() + stop);
        Slot& slot = job.slots[k];
        cache_->Complete(slot.ticket, std::move(data));
        if (slot.outstanding) {
            slot.outstanding->fetch_sub(1);
        }
    }
}

void ChunkScheduler::Abandon(FetchJob& job, const Status& status) {
    for (auto& slot : job.slots) {
        cache_->Fail(slot.ticket, status);
        if (slot.outstanding) {
            slot.outstanding->fetch_sub(1);
        }
    }
}

void ChunkScheduler::WaitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] {
        return running_ == 0 && ((blocking_.empty() && prefetch_.empty()) || stopping_);
    });
}

void ChunkScheduler::Suspend() {
    std::lock_guard<std::mutex> lock(mutex_);
    suspended_ = true;
}

void ChunkScheduler::Resume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        suspended_ = false;
    }
    work_cv_.notify_all();
}

std::size_t ChunkScheduler::Queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = 0;
    for (const auto& job : blocking_) n += job.slots.size();
    for (const auto& job : prefetch_) n += job.slots.size();
    return n;
}

} // namespace objfs
