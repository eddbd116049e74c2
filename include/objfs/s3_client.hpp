#pragma once

#include "types.hpp"
#include "object_client.hpp"
#include <memory>
#include <string>
#include <vector>
#include <cstdint>

namespace Aws {
    namespace S3 {
        class S3Client;
    }
}

namespace objfs {

// ObjectClient backed by the AWS SDK. The SDK's own retries are disabled;
// RemoteClient owns the retry policy.
class S3Client : public ObjectClient {
public:
    explicit S3Client(const Config& cfg);
    ~S3Client() override;

    Status GetObjectRange(const std::string& key,
                          std::uint64_t offset,
                          std::uint64_t length,
                          const std::string& if_match,
                          RangeResponse* out) override;

    Status HeadObject(const std::string& key, ObjectId* out) override;

private:
    struct S3ClientImpl;
    std::unique_ptr<S3ClientImpl> p_impl;

    S3Client(const S3Client&) = delete;
    S3Client& operator=(const S3Client&) = delete;
};

} // namespace objfs
