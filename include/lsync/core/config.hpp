#pragma once

#include "lsync/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace lsync {

struct StoreConfig {
    std::string path = "lsync.db";      ///< ":memory:" keeps everything in RAM
    std::size_t scan_page_size = 256;   ///< Rows fetched per lazy-scan page
};

struct CacheConfig {
    /// Counts decoded payload bytes. Payloads are stored hex-encoded, so the
    /// database holds roughly twice this much cache data at capacity.
    std::uint64_t capacity_bytes = 64ULL * 1024 * 1024;
    double eviction_target_ratio = 0.8;
    std::chrono::milliseconds default_ttl{0};   ///< 0 = entries never expire
};

struct DownloadConfig {
    std::size_t max_concurrent = 2;
    std::size_t chunk_size = 64 * 1024;
    double progress_step_percent = 1.0;
    std::chrono::milliseconds progress_interval{250};
    std::uint64_t quota_bytes = 0;              ///< 0 = unlimited
    std::uint64_t reserve_free_bytes = 0;       ///< Free space that must remain on the volume
    std::uint32_t max_retries = 3;
    std::chrono::milliseconds retry_backoff{200};
    std::chrono::milliseconds retry_backoff_max{5000};
};

struct QueueConfig {
    std::uint32_t max_retries = 3;
    std::size_t concurrency = 4;
    std::chrono::milliseconds backoff_base{1000};
    std::chrono::milliseconds backoff_max{60000};
    std::chrono::milliseconds max_action_age{0};  ///< 0 = actions never age out
};

struct SyncConfig {
    std::vector<std::string> collections;
    std::chrono::milliseconds sync_interval{0};          ///< 0 = no periodic trigger
    std::chrono::milliseconds connectivity_debounce{500};
    std::chrono::milliseconds stale_after{std::chrono::hours(24)};
    std::chrono::milliseconds download_cleanup_age{0};   ///< 0 = keep downloads forever
    bool start_online = false;
};

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

struct EngineConfig {
    StoreConfig store;
    CacheConfig cache;
    DownloadConfig download;
    QueueConfig queue;
    SyncConfig sync;
    LoggingConfig logging;
};

/**
 * @brief Builds an EngineConfig from a JSON document
 *
 * Every key is optional; missing keys keep their defaults. Durations are
 * given in milliseconds and carry an "_ms" suffix, e.g.
 *
 *   { "cache": { "capacity_bytes": 1048576, "default_ttl_ms": 60000 },
 *     "sync":  { "collections": ["courses", "lessons"] } }
 */
class ConfigLoader {
public:
    static Result<EngineConfig> from_file(const std::filesystem::path& path);
    static Result<EngineConfig> from_string(const std::string& text);

    /// Range checks shared by both entry points.
    static Result<void> validate(const EngineConfig& config);
};

/// Applies level and pattern to the default spdlog logger.
void configure_logging(const LoggingConfig& config);

} // namespace lsync
