#include "objfs/api.hpp"
#include "objfs/chunk_cache.hpp"
#include "objfs/metrics.hpp"
#include "objfs/remote_client.hpp"
#include "objfs/s3_client.hpp"
#include "objfs/scheduler.hpp"
#include "objfs/settings.hpp"
#include "objfs/stream_state.hpp"

#include <algorithm>
#include <atomic>
#include <list>
#include <mutex>
#include <unordered_map>

#include <fmt/format.h>
#include <glog/logging.h>

namespace objfs {

// --- Internal Data Structures ---

// Per-handle state. 'state', 'object_changed' and 'waiting' are guarded by 'mutex'.
struct Stream {
    Stream(StreamHandle h, ObjectId obj, const Config& cfg)
        : handle(h),
          object(obj),
          state(std::move(obj), cfg),
          outstanding(std::make_shared<std::atomic<std::uint32_t>>(0)) {}

    const StreamHandle handle;
    const ObjectId object;

    std::mutex mutex;
    StreamState state;
    bool object_changed = false;
    std::list<std::shared_ptr<FetchTicket>> waiting;

    std::atomic<bool> closed{false};
    PrefetchCounter outstanding;
};

// One covering chunk of a read
struct ChunkPart {
    std::uint64_t index;
    ChunkRef ref;
    std::shared_ptr<FetchTicket> ticket;
    std::uint64_t generation = 0;
};

// PIMPL: Private Implementation
class ReadDispatcherImpl {
public:
    ReadDispatcherImpl(const Config& cfg, std::shared_ptr<ObjectClient> client);
    ~ReadDispatcherImpl();

    Status Open(const ObjectId& object, StreamHandle* out);
    Status Open(const std::string& key, StreamHandle* out);
    Status Read(StreamHandle handle, std::uint64_t offset, std::uint64_t length,
                std::vector<std::uint8_t>* out);
    void Close(StreamHandle handle);

    MetricsSnapshot Snapshot() const { return metrics_.Snapshot(); }
    std::uint64_t ResidentBytes() const { return cache_->ResidentBytes(); }
    std::uint64_t CapacityBytes() const { return cache_->CapacityBytes(); }
    std::size_t OpenStreams() const;
    void WaitForIdle() { scheduler_->WaitIdle(); }

private:
    std::shared_ptr<Stream> FindStream(StreamHandle handle) const;
    Status WaitForPart(Stream& stream, ChunkPart& part);

    Config config_;
    Metrics metrics_;
    std::unique_ptr<RemoteClient> remote_;
    std::unique_ptr<ChunkCache> cache_;
    // Destroyed before cache_ and remote_
    std::unique_ptr<ChunkScheduler> scheduler_;

    mutable std::mutex streams_mutex_;
    std::unordered_map<StreamHandle, std::shared_ptr<Stream>> streams_;
    StreamHandle next_handle_ = 1;
};


// --- ReadDispatcherImpl Implementation ---

ReadDispatcherImpl::ReadDispatcherImpl(const Config& cfg, std::shared_ptr<ObjectClient> client)
    : config_(cfg) {
    ApplyConfigDefaults(config_);
    ValidateConfig(config_);

    remote_ = std::make_unique<RemoteClient>(std::move(client), config_, &metrics_);
    cache_ = std::make_unique<ChunkCache>(config_.cache_capacity_bytes, config_.chunk_size, &metrics_);
    scheduler_ = std::make_unique<ChunkScheduler>(config_, remote_.get(), cache_.get(), &metrics_);

    LOG(INFO) << fmt::format("read dispatcher: chunk={}B cache={}B fetches={} prefetch/stream={} window=[{}, {}]",
                             config_.chunk_size, config_.cache_capacity_bytes,
                             config_.max_concurrent_fetches, config_.max_prefetch_per_stream,
                             config_.prefetch_window_min, config_.prefetch_window_max);
}

ReadDispatcherImpl::~ReadDispatcherImpl() {
    std::vector<StreamHandle> handles;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        for (const auto& kv : streams_) {
            handles.push_back(kv.first);
        }
    }
    for (StreamHandle h : handles) {
        Close(h);
    }
    scheduler_.reset();
}

std::shared_ptr<Stream> ReadDispatcherImpl::FindStream(StreamHandle handle) const {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    auto it = streams_.find(handle);
    return it == streams_.end() ? nullptr : it->second;
}

std::size_t ReadDispatcherImpl::OpenStreams() const {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    return streams_.size();
}

Status ReadDispatcherImpl::Open(const ObjectId& object, StreamHandle* out) {
    if (object.key.empty()) {
        return Status::InvalidArgument("empty object key");
    }
    std::lock_guard<std::mutex> lock(streams_mutex_);
    StreamHandle handle = next_handle_++;
    streams_.emplace(handle, std::make_shared<Stream>(handle, object, config_));
    *out = handle;
    VLOG(1) << fmt::format("open {} (size={} etag={}) -> handle {}",
                           object.key, object.size, object.etag, handle);
    return Status::OK();
}

Status ReadDispatcherImpl::Open(const std::string& key, StreamHandle* out) {
    ObjectId object;
    Status st = remote_->Head(key, &object);
    if (!st.ok()) {
        VLOG(1) << "open " << key << " failed: " << st.ToString();
        return st;
    }
    return Open(object, out);
}

void ReadDispatcherImpl::Close(StreamHandle handle) {
    std::shared_ptr<Stream> stream;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        auto it = streams_.find(handle);
        if (it == streams_.end()) {
            return;
        }
        stream = std::move(it->second);
        streams_.erase(it);
    }

    std::vector<std::shared_ptr<FetchTicket>> waiting;
    {
        std::lock_guard<std::mutex> lock(stream->mutex);
        stream->closed = true;
        waiting.assign(stream->waiting.begin(), stream->waiting.end());
    }
    for (auto& ticket : waiting) {
        ticket->Interrupt();
    }
    VLOG(1) << fmt::format("close handle {} ({}), {} readers interrupted, {} prefetches left running",
                           handle, stream->object.key, waiting.size(), stream->outstanding->load());
}

Status ReadDispatcherImpl::WaitForPart(Stream& stream, ChunkPart& part) {
    std::list<std::shared_ptr<FetchTicket>>::iterator pos;
    {
        std::lock_guard<std::mutex> lock(stream.mutex);
        if (stream.closed) {
            return Status::Cancelled(fmt::format("handle {} closed", stream.handle));
        }
        pos = stream.waiting.insert(stream.waiting.end(), part.ticket);
    }

    ChunkData data;
    Status st = part.ticket->Wait(&stream.closed, &data);
    {
        std::lock_guard<std::mutex> lock(stream.mutex);
        stream.waiting.erase(pos);
    }
    if (st.ok()) {
        part.ref = cache_->Adopt(part.ticket->id(), part.generation, std::move(data));
    }
    return st;
}

Status ReadDispatcherImpl::Read(StreamHandle handle, std::uint64_t offset, std::uint64_t length,
                                std::vector<std::uint8_t>* out) {
    out->clear();
    std::shared_ptr<Stream> stream = FindStream(handle);
    if (!stream) {
        return Status::InvalidArgument(fmt::format("unknown handle {}", handle));
    }
    const ObjectId& object = stream->object;
    const std::uint64_t chunk_size = config_.chunk_size;

    PrefetchPlan plan;
    std::uint64_t end = 0;
    {
        std::lock_guard<std::mutex> lock(stream->mutex);
        if (stream->object_changed) {
            return Status::ObjectChanged(fmt::format("{} changed since open; reopen the file", object.key));
        }
        if (offset >= object.size || length == 0) {
            return Status::OK();
        }
        end = std::min(object.size - offset, length) + offset;
        plan = stream->state.OnRead(offset, end - offset);
    }

    // Resolve every covering chunk before waiting, so all misses are in flight together
    const std::uint64_t first = offset / chunk_size;
    const std::uint64_t last = (end - 1) / chunk_size;
    std::vector<ChunkPart> parts;
    parts.reserve(last - first + 1);
    for (std::uint64_t index = first; index <= last; ++index) {
        ChunkId id{object.key, object.etag, index};
        Acquisition acq = cache_->Acquire(id);
        ChunkPart part;
        part.index = index;
        if (acq.ref) {
            metrics_.cache_hits.fetch_add(1, std::memory_order_relaxed);
            part.ref = std::move(acq.ref);
        } else {
            metrics_.cache_misses.fetch_add(1, std::memory_order_relaxed);
            if (acq.is_new) {
                scheduler_->SubmitBlocking(object, acq.ticket);
            } else {
                metrics_.joined_fetches.fetch_add(1, std::memory_order_relaxed);
                scheduler_->Promote(id);
            }
            part.ticket = std::move(acq.ticket);
            part.generation = acq.generation;
        }
        parts.push_back(std::move(part));
    }

    if (!plan.empty() && !stream->closed) {
        std::uint64_t covered = scheduler_->SubmitPrefetch(object, plan, stream->outstanding);
        std::lock_guard<std::mutex> lock(stream->mutex);
        stream->state.OnPrefetchIssued(covered);
    }

    Status result;
    for (auto& part : parts) {
        if (part.ref) {
            continue;
        }
        Status st = result.ok() ? WaitForPart(*stream, part) : result;
        if (!st.ok()) {
            // Detach this reader's pin; the fetch itself keeps running
            cache_->ReleasePin(part.ticket->id(), part.generation);
            if (result.ok()) {
                result = st;
            }
        }
    }

    if (!result.ok()) {
        if (result.kind() == ErrorKind::ObjectChanged) {
            {
                std::lock_guard<std::mutex> lock(stream->mutex);
                stream->object_changed = true;
            }
            std::size_t dropped = cache_->Invalidate(object.key, object.etag);
            LOG(WARNING) << fmt::format("{} changed under handle {}; dropped {} cached chunks",
                                        object.key, handle, dropped);
        }
        return result;
    }

    out->reserve(end - offset);
    for (const auto& part : parts) {
        const std::uint64_t chunk_start = part.index * chunk_size;
        const std::uint64_t from = std::max(offset, chunk_start) - chunk_start;
        bytes_view slice = part.ref.bytes().subview(from, end - chunk_start - from);
        out->insert(out->end(), slice.begin(), slice.end());
    }
    return Status::OK();
}


// --- ReadDispatcher Public API (forwarding to PIMPL) ---

ReadDispatcher::ReadDispatcher(const Config& cfg)
    : p_impl(std::make_unique<ReadDispatcherImpl>(cfg, std::make_shared<S3Client>(cfg))) {}
ReadDispatcher::ReadDispatcher(const Config& cfg, std::shared_ptr<ObjectClient> client)
    : p_impl(std::make_unique<ReadDispatcherImpl>(cfg, std::move(client))) {}
ReadDispatcher::~ReadDispatcher() = default;
Status ReadDispatcher::Open(const ObjectId& object, StreamHandle* out) { return p_impl->Open(object, out); }
Status ReadDispatcher::Open(const std::string& key, StreamHandle* out) { return p_impl->Open(key, out); }
Status ReadDispatcher::Read(StreamHandle handle, std::uint64_t offset, std::uint64_t length,
                            std::vector<std::uint8_t>* out) {
    return p_impl->Read(handle, offset, length, out);
}
void ReadDispatcher::Close(StreamHandle handle) { p_impl->Close(handle); }
MetricsSnapshot ReadDispatcher::Stats() const { return p_impl->Snapshot(); }
std::uint64_t ReadDispatcher::ResidentBytes() const { return p_impl->ResidentBytes(); }
std::uint64_t ReadDispatcher::CapacityBytes() const { return p_impl->CapacityBytes(); }
std::size_t ReadDispatcher::OpenStreams() const { return p_impl->OpenStreams(); }
void ReadDispatcher::WaitForIdle() { p_impl->WaitForIdle(); }

} // namespace objfs
