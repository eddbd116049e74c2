#include "objfs/hash.hpp"
#define XXH_STATIC_LINKING_ONLY
#include <xxhash.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <cstring>

namespace objfs {

namespace {

void Update(XXH3_state_t* state, const void* data, std::size_t size) {
    if (XXH3_64bits_update(state, data, size) != XXH_OK) {
        throw std::runtime_error("XXH3 update failed");
    }
}

// Feeds 'value' to the hash in little-endian byte order
template <typename T>
void UpdateLe(XXH3_state_t* state, T value) {
    std::uint8_t bytes[sizeof(T)];
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        bytes[i] = static_cast<std::uint8_t>((value >> (i * 8)) & 0xFF);
    }
    Update(state, bytes, sizeof(T));
}

} // namespace

std::uint64_t HashChunkId(const ChunkId& id) {
    // Length-prefixed fields: key, etag, then the chunk index.
    if (id.key.size() > UINT32_MAX || id.etag.size() > UINT32_MAX) {
        throw std::length_error("Chunk key or etag is too long.");
    }

    XXH3_state_t state;
    if (XXH3_64bits_reset(&state) != XXH_OK) {
        throw std::runtime_error("XXH3 reset failed");
    }
    UpdateLe(&state, static_cast<std::uint32_t>(id.key.size()));
    Update(&state, id.key.data(), id.key.size());
    UpdateLe(&state, static_cast<std::uint32_t>(id.etag.size()));
    Update(&state, id.etag.data(), id.etag.size());
    UpdateLe(&state, id.index);
    return XXH3_64bits_digest(&state);
}

Digest128 MakeContentDigest(bytes_view data) {
    XXH128_hash_t hash = XXH3_128bits(data.data(), data.size());

    // Canonical (big-endian) form so the hex string is stable across platforms
    XXH128_canonical_t canonical;
    XXH128_canonicalFromHash(&canonical, hash);

    Digest128 digest;
    std::memcpy(digest.data(), canonical.digest, digest.size());
    return digest;
}

std::string ToHex(const Digest128& digest) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (const auto& byte : digest) {
        ss << std::setw(2) << static_cast<int>(byte);
    }
    return ss.str();
}

} // namespace objfs
