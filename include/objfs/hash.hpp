#pragma once

#include "types.hpp"
#include "span_compat.hpp"
#include <cstdint>
#include <cstddef>
#include <string>
#include <array>

namespace objfs {

using Digest128 = std::array<std::uint8_t, 16>;

// Stable 64-bit hash of a chunk id (key, etag and index).
std::uint64_t HashChunkId(const ChunkId& id);

// Content-derived entity tag, used by the in-memory object store.
Digest128 MakeContentDigest(bytes_view data);

std::string ToHex(const Digest128& digest);

struct ChunkIdHash {
    std::size_t operator()(const ChunkId& id) const {
        return static_cast<std::size_t>(HashChunkId(id));
    }
};

} // namespace objfs
