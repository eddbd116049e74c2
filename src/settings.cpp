#include "objfs/settings.hpp"

#include <fmt/format.h>
#include <stdexcept>

namespace objfs {

void ApplyConfigDefaults(Config& cfg) {
    if (cfg.s3_endpoint.empty())
        cfg.s3_endpoint = GetEnv("OBJFS_S3_ENDPOINT", s3_defaults::kEndpoint);
    if (cfg.s3_region.empty())
        cfg.s3_region = GetEnv("OBJFS_S3_REGION", s3_defaults::kRegion);
    if (cfg.s3_bucket.empty())
        cfg.s3_bucket = GetEnv("OBJFS_S3_BUCKET", s3_defaults::kBucket);
    if (cfg.aws_access_key_id.empty())
        cfg.aws_access_key_id = GetEnv("OBJFS_AWS_ACCESS_KEY_ID", s3_defaults::kAccessKeyId);
    if (cfg.aws_secret_access_key.empty())
        cfg.aws_secret_access_key = GetEnv("OBJFS_AWS_SECRET_ACCESS_KEY", s3_defaults::kSecretAccessKey);

    // Presence of the variable overrides whatever the caller set
    if (std::getenv("OBJFS_S3_USE_PATH_STYLE")) {
        cfg.s3_use_path_style = GetEnvBool("OBJFS_S3_USE_PATH_STYLE", s3_defaults::kUsePathStyle);
    }

    cfg.chunk_size = GetEnvU64("OBJFS_CHUNK_SIZE", cfg.chunk_size);
    cfg.cache_capacity_bytes = GetEnvU64("OBJFS_CACHE_BYTES", cfg.cache_capacity_bytes);
    cfg.max_concurrent_fetches = static_cast<std::uint32_t>(
        GetEnvU64("OBJFS_MAX_FETCHES", cfg.max_concurrent_fetches));
}

void ValidateConfig(const Config& cfg) {
    if (cfg.chunk_size == 0) {
        throw std::invalid_argument("chunk_size must be positive");
    }
    if (cfg.max_concurrent_fetches == 0) {
        throw std::invalid_argument("max_concurrent_fetches must be positive");
    }
    if (cfg.max_coalesced_chunks == 0) {
        throw std::invalid_argument("max_coalesced_chunks must be positive");
    }
    if (cfg.max_attempts == 0) {
        throw std::invalid_argument("max_attempts must be positive");
    }
    if (cfg.prefetch_window_min > cfg.prefetch_window_max) {
        throw std::invalid_argument(fmt::format(
            "prefetch window min {} exceeds max {}",
            cfg.prefetch_window_min, cfg.prefetch_window_max));
    }
    if (cfg.retry_base_delay_ms > cfg.retry_max_delay_ms) {
        throw std::invalid_argument(fmt::format(
            "retry base delay {}ms exceeds max delay {}ms",
            cfg.retry_base_delay_ms, cfg.retry_max_delay_ms));
    }
}

} // namespace objfs
