#include "objfs/mock_client.hpp"
#include "objfs/hash.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <thread>

namespace objfs {

ObjectId MockClient::AddObject(const std::string& key, std::vector<std::uint8_t> contents) {
    MockObject obj;
    obj.etag = "\"" + ToHex(MakeContentDigest(contents)) + "\"";
    obj.contents = std::move(contents);

    ObjectId id{key, obj.contents.size(), obj.etag};
    std::lock_guard<std::mutex> lock(mutex_);
    objects_[key] = std::move(obj);
    return id;
}

void MockClient::RemoveObject(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    objects_.erase(key);
}

void MockClient::InjectFailures(const std::string& key, const std::vector<ErrorKind>& kinds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& queue = failures_[key];
    queue.insert(queue.end(), kinds.begin(), kinds.end());
}

void MockClient::SetLatency(std::chrono::microseconds latency) {
    std::lock_guard<std::mutex> lock(mutex_);
    latency_ = latency;
}

void MockClient::Pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    paused_ = true;
}

void MockClient::Resume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_ = false;
        paused_keys_.clear();
    }
    cv_.notify_all();
}

void MockClient::PauseKey(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    paused_keys_.insert(key);
}

void MockClient::ResumeKey(const std::string& key) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_keys_.erase(key);
    }
    cv_.notify_all();
}

bool MockClient::WaitForPending(std::size_t count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this, count] { return pending_ >= count; });
}

Status MockClient::GetObjectRange(const std::string& key,
                                  std::uint64_t offset,
                                  std::uint64_t length,
                                  const std::string& if_match,
                                  RangeResponse* out) {
    std::unique_lock<std::mutex> lock(mutex_);
    ++total_requests_;
    ranges_[key].emplace_back(offset, length);
    ++running_;
    peak_running_ = std::max(peak_running_, running_);

    auto held = [this, &key] { return paused_ || paused_keys_.count(key) > 0; };
    if (held()) {
        ++pending_;
        cv_.notify_all();
        cv_.wait(lock, [&held] { return !held(); });
        --pending_;
    }

    if (latency_.count() > 0) {
        auto latency = latency_;
        lock.unlock();
        std::this_thread::sleep_for(latency);
        lock.lock();
    }

    Status st;
    auto fail_it = failures_.find(key);
    auto obj_it = objects_.find(key);
    if (fail_it != failures_.end() && !fail_it->second.empty()) {
        ErrorKind kind = fail_it->second.front();
        fail_it->second.pop_front();
        st = Status(kind, fmt::format("injected failure for {}", key));
    } else if (obj_it == objects_.end()) {
        st = Status::NotFound(fmt::format("no such key: {}", key));
    } else if (!if_match.empty() && if_match != obj_it->second.etag) {
        st = Status::ObjectChanged(fmt::format("{}: precondition failed", key));
    } else {
        const auto& contents = obj_it->second.contents;
        if (offset > contents.size() || (offset == contents.size() && length > 0)) {
            st = Status::NotFound(fmt::format("{}: range {}+{} not satisfiable", key, offset, length));
        } else {
            std::uint64_t end = std::min<std::uint64_t>(offset + length, contents.size());
            out->bytes.assign(contents.begin() + offset, contents.begin() + end);
            out->etag = obj_it->second.etag;
        }
    }

    --running_;
    return st;
}

Status MockClient::HeadObject(const std::string& key, ObjectId* out) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        return Status::NotFound(fmt::format("no such key: {}", key));
    }
    out->key = key;
    out->size = it->second.contents.size();
    out->etag = it->second.etag;
    return Status::OK();
}

std::uint64_t MockClient::RequestCount(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ranges_.find(key);
    return it == ranges_.end() ? 0 : it->second.size();
}

std::uint64_t MockClient::TotalRequests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_requests_;
}

std::uint32_t MockClient::PeakConcurrency() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_running_;
}

std::vector<std::pair<std::uint64_t, std::uint64_t>> MockClient::RequestedRanges(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ranges_.find(key);
    if (it == ranges_.end()) {
        return {};
    }
    return it->second;
}

} // namespace objfs
