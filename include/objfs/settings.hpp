#pragma once

#include "types.hpp"
#include <string>
#include <cstdint>
#include <cstdlib>

namespace objfs {

namespace s3_defaults {
    constexpr char kEndpoint[] = "http://127.0.0.1:9000";
    constexpr char kRegion[] = "us-east-1";
    constexpr char kBucket[] = "objfs";
    constexpr char kAccessKeyId[] = "minioadmin";
    constexpr char kSecretAccessKey[] = "minioadmin";
    constexpr bool kUsePathStyle = true;
}

inline std::string GetEnv(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

inline bool GetEnvBool(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (!value) return defaultValue;
    return std::string(value) == "1" || std::string(value) == "true" || std::string(value) == "TRUE";
}

// Unparsable values fall back to the default.
inline std::uint64_t GetEnvU64(const char* name, std::uint64_t defaultValue) {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') return defaultValue;
    char* end = nullptr;
    unsigned long long parsed = std::strtoull(value, &end, 10);
    if (end == value || *end != '\0') return defaultValue;
    return static_cast<std::uint64_t>(parsed);
}

// Fills empty S3 settings from OBJFS_* environment variables, falling back to
// a local MinIO endpoint, and lets the environment override the main tuning
// knobs of the data path.
void ApplyConfigDefaults(Config& cfg);

// Throws std::invalid_argument on a configuration the data path cannot run with.
void ValidateConfig(const Config& cfg);

} // namespace objfs
