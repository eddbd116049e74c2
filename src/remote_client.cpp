#include "objfs/remote_client.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <glog/logging.h>
#include <thread>

namespace objfs {

RemoteClient::RemoteClient(std::shared_ptr<ObjectClient> transport, const Config& cfg, Metrics* metrics)
    : transport_(std::move(transport)),
      max_attempts_(cfg.max_attempts),
      base_delay_ms_(cfg.retry_base_delay_ms),
      max_delay_ms_(cfg.retry_max_delay_ms),
      metrics_(metrics),
      sleep_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }),
      rng_(std::random_device{}()) {
    CHECK(transport_) << "RemoteClient needs a transport";
    CHECK(metrics_) << "RemoteClient needs a metrics sink";
}

std::chrono::milliseconds RemoteClient::BackoffDelay(std::uint32_t attempt) const {
    std::uint64_t delay = base_delay_ms_;
    for (std::uint32_t i = 1; i < attempt && delay < max_delay_ms_; ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min<std::uint64_t>(delay, max_delay_ms_));
}

// Equal jitter: half the delay is fixed, the other half random.
std::chrono::milliseconds RemoteClient::Jittered(std::chrono::milliseconds delay) {
    auto half = delay.count() / 2;
    if (half == 0) {
        return delay;
    }
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_int_distribution<long long> dist(0, half);
    return std::chrono::milliseconds(delay.count() - half + dist(rng_));
}

Status RemoteClient::FetchOnce(const ObjectId& obj, std::uint64_t offset, std::uint64_t length,
                               std::vector<std::uint8_t>* out) {
    RangeResponse resp;
    metrics_->remote_requests.fetch_add(1, std::memory_order_relaxed);
    auto start = std::chrono::steady_clock::now();
    Status st = transport_->GetObjectRange(obj.key, offset, length, obj.etag, &resp);
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    metrics_->RecordFetchLatency(static_cast<std::uint64_t>(elapsed.count()));
    if (!st.ok()) {
        return st;
    }

    // Stores that ignore If-Match still report the tag they served
    if (!obj.etag.empty() && !resp.etag.empty() && resp.etag != obj.etag) {
        return Status::ObjectChanged(fmt::format("{}: etag {} != expected {}",
                                                 obj.key, resp.etag, obj.etag));
    }
    if (resp.bytes.size() != length) {
        return Status::Transient(fmt::format("{}: short read at {}, got {} of {} bytes",
                                             obj.key, offset, resp.bytes.size(), length));
    }

    metrics_->bytes_fetched.fetch_add(resp.bytes.size(), std::memory_order_relaxed);
    *out = std::move(resp.bytes);
    return Status::OK();
}

Status RemoteClient::Fetch(const ObjectId& obj, std::uint64_t offset, std::uint64_t length,
                           std::vector<std::uint8_t>* out) {
    if (offset >= obj.size || length == 0) {
        out->clear();
        return Status::OK();
    }
    length = std::min(length, obj.size - offset);

    Status st;
    for (std::uint32_t attempt = 1; attempt <= max_attempts_; ++attempt) {
        st = FetchOnce(obj, offset, length, out);
        if (st.kind() != ErrorKind::Transient) {
            break;
        }
        if (attempt == max_attempts_) {
            metrics_->fetch_errors.fetch_add(1, std::memory_order_relaxed);
            LOG(ERROR) << fmt::format("{} [{}, +{}) unavailable after {} attempts: {}",
                                      obj.key, offset, length, attempt, st.ToString());
            return Status::Unavailable(st.message());
        }

        auto delay = Jittered(BackoffDelay(attempt));
        metrics_->retries.fetch_add(1, std::memory_order_relaxed);
        LOG(WARNING) << fmt::format("{} [{}, +{}) attempt {} failed: {}; retrying in {}ms",
                                    obj.key, offset, length, attempt, st.ToString(), delay.count());
        sleep_(delay);
    }

    if (!st.ok()) {
        metrics_->fetch_errors.fetch_add(1, std::memory_order_relaxed);
        VLOG(1) << fmt::format("{} [{}, +{}) failed: {}", obj.key, offset, length, st.ToString());
    }
    return st;
}

Status RemoteClient::Head(const std::string& key, ObjectId* out) {
    Status st;
    for (std::uint32_t attempt = 1; attempt <= max_attempts_; ++attempt) {
        st = transport_->HeadObject(key, out);
        if (st.kind() != ErrorKind::Transient) {
            return st;
        }
        if (attempt < max_attempts_) {
            metrics_->retries.fetch_add(1, std::memory_order_relaxed);
            sleep_(Jittered(BackoffDelay(attempt)));
        }
    }
    return Status::Unavailable(st.message());
}

} // namespace objfs
