#pragma once

#include "types.hpp"
#include "status.hpp"
#include "object_client.hpp"
#include <vector>
#include <memory>
#include <string>
#include <cstdint>

namespace objfs {

// Forward declaration of internal state
class ReadDispatcherImpl;

/**
 * @class ReadDispatcher
 * @brief Entry point of the read data path: one instance per mounted bucket.
 *
 * Open() hands out stream handles for immutable object versions, Read()
 * serves byte ranges through the chunk cache and Close() releases a handle.
 * All methods are thread-safe; concurrent reads on the same handle are allowed.
 */
class ReadDispatcher {
public:
    // Reads through an S3Client built from 'cfg'.
    explicit ReadDispatcher(const Config& cfg);
    ReadDispatcher(const Config& cfg, std::shared_ptr<ObjectClient> client);
    ~ReadDispatcher();

    // Opens a stream on an already resolved object version.
    Status Open(const ObjectId& object, StreamHandle* out);

    // Resolves the current version of 'key' and opens a stream on it.
    Status Open(const std::string& key, StreamHandle* out);

    /**
     * @brief Reads [offset, offset + length) of the stream's object into 'out'.
     *
     * Blocks only while a covering chunk is being fetched. Reads past the end
     * of the object are short and not an error. Fails with the first error of
     * any covering chunk, in offset order.
     */
    Status Read(StreamHandle handle, std::uint64_t offset, std::uint64_t length,
                std::vector<std::uint8_t>* out);

    // Releases the handle. Reads still waiting on it return Cancelled; fetches
    // already dispatched run to completion and stay cached.
    void Close(StreamHandle handle);

    // Introspection
    MetricsSnapshot Stats() const;
    std::uint64_t ResidentBytes() const;
    std::uint64_t CapacityBytes() const;
    std::size_t OpenStreams() const;

    // Blocks until every queued and running fetch has finished.
    void WaitForIdle();

private:
    // PIMPL Idiom
    std::unique_ptr<ReadDispatcherImpl> p_impl;

    // Disable copy/move
    ReadDispatcher(const ReadDispatcher&) = delete;
    ReadDispatcher& operator=(const ReadDispatcher&) = delete;
    ReadDispatcher(ReadDispatcher&&) = delete;
    ReadDispatcher& operator=(ReadDispatcher&&) = delete;
};

} // namespace objfs
