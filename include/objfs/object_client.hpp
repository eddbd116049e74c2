#pragma once

#include "types.hpp"
#include "status.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace objfs {

struct RangeResponse {
    std::vector<std::uint8_t> bytes;
    // Entity tag the store reported for the object it served.
    std::string etag;
};

// Transport to an S3-like blob store. Implementations classify their raw
// failures into ErrorKind values but never retry.
class ObjectClient {
public:
    virtual ~ObjectClient() = default;

    // Fetches [offset, offset + length) of 'key'. The range is clamped to the
    // object size by the store. A non-empty 'if_match' makes the store reject
    // the request with ObjectChanged when the current entity tag differs.
    virtual Status GetObjectRange(const std::string& key,
                                  std::uint64_t offset,
                                  std::uint64_t length,
                                  const std::string& if_match,
                                  RangeResponse* out) = 0;

    // Resolves size and entity tag of 'key'.
    virtual Status HeadObject(const std::string& key, ObjectId* out) = 0;
};

} // namespace objfs
