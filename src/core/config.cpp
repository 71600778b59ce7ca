#include "lsync/core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace lsync {
namespace {

using json = nlohmann::json;

void read_ms(const json& section, const char* key, std::chrono::milliseconds& target) {
    if (section.contains(key)) {
        target = std::chrono::milliseconds(section.at(key).get<std::int64_t>());
    }
}

template<typename T>
void read_value(const json& section, const char* key, T& target) {
    if (section.contains(key)) {
        target = section.at(key).get<T>();
    }
}

void parse_store(const json& j, StoreConfig& store) {
    read_value(j, "path", store.path);
    read_value(j, "scan_page_size", store.scan_page_size);
}

void parse_cache(const json& j, CacheConfig& cache) {
    read_value(j, "capacity_bytes", cache.capacity_bytes);
    read_value(j, "eviction_target_ratio", cache.eviction_target_ratio);
    read_ms(j, "default_ttl_ms", cache.default_ttl);
}

void parse_download(const json& j, DownloadConfig& download) {
    read_value(j, "max_concurrent", download.max_concurrent);
    read_value(j, "chunk_size", download.chunk_size);
    read_value(j, "progress_step_percent", download.progress_step_percent);
    read_ms(j, "progress_interval_ms", download.progress_interval);
    read_value(j, "quota_bytes", download.quota_bytes);
    read_value(j, "reserve_free_bytes", download.reserve_free_bytes);
    read_value(j, "max_retries", download.max_retries);
    read_ms(j, "retry_backoff_ms", download.retry_backoff);
    read_ms(j, "retry_backoff_max_ms", download.retry_backoff_max);
}

void parse_queue(const json& j, QueueConfig& queue) {
    read_value(j, "max_retries", queue.max_retries);
    read_value(j, "concurrency", queue.concurrency);
    read_ms(j, "backoff_base_ms", queue.backoff_base);
    read_ms(j, "backoff_max_ms", queue.backoff_max);
    read_ms(j, "max_action_age_ms", queue.max_action_age);
}

void parse_sync(const json& j, SyncConfig& sync) {
    read_value(j, "collections", sync.collections);
    read_ms(j, "sync_interval_ms", sync.sync_interval);
    read_ms(j, "connectivity_debounce_ms", sync.connectivity_debounce);
    read_ms(j, "stale_after_ms", sync.stale_after);
    read_ms(j, "download_cleanup_age_ms", sync.download_cleanup_age);
    read_value(j, "start_online", sync.start_online);
}

void parse_logging(const json& j, LoggingConfig& logging) {
    read_value(j, "level", logging.level);
    read_value(j, "pattern", logging.pattern);
}

} // namespace

Result<EngineConfig> ConfigLoader::from_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::error("[Config] cannot open {}", path.string());
        return Err<EngineConfig>(ErrorCode::NotFound, "Config file not found: " + path.string());
    }
    std::ostringstream content;
    content << file.rdbuf();
    spdlog::debug("[Config] read {} bytes from {}", content.str().size(), path.string());
    return from_string(content.str());
}

Result<EngineConfig> ConfigLoader::from_string(const std::string& text) {
    EngineConfig config;
    try {
        const json j = json::parse(text);
        if (!j.is_object()) {
            return Err<EngineConfig>(ErrorCode::InvalidArgument, "Config root must be a JSON object");
        }
        if (j.contains("store")) {
            parse_store(j.at("store"), config.store);
        }
        if (j.contains("cache")) {
            parse_cache(j.at("cache"), config.cache);
        }
        if (j.contains("download")) {
            parse_download(j.at("download"), config.download);
        }
        if (j.contains("queue")) {
            parse_queue(j.at("queue"), config.queue);
        }
        if (j.contains("sync")) {
            parse_sync(j.at("sync"), config.sync);
        }
        if (j.contains("logging")) {
            parse_logging(j.at("logging"), config.logging);
        }
    } catch (const json::exception& e) {
        return Err<EngineConfig>(ErrorCode::InvalidArgument, std::string("Invalid config: ") + e.what());
    }

    auto valid = validate(config);
    if (valid.is_error()) {
        return Err<EngineConfig>(valid.error());
    }
    return Ok(config);
}

Result<void> ConfigLoader::validate(const EngineConfig& config) {
    if (config.store.path.empty()) {
        return Err<void>(ErrorCode::InvalidArgument, "store.path must not be empty");
    }
    if (config.store.scan_page_size == 0) {
        return Err<void>(ErrorCode::InvalidArgument, "store.scan_page_size must be > 0");
    }
    if (config.cache.capacity_bytes == 0) {
        return Err<void>(ErrorCode::InvalidArgument, "cache.capacity_bytes must be > 0");
    }
    if (config.cache.eviction_target_ratio <= 0.0 || config.cache.eviction_target_ratio > 1.0) {
        return Err<void>(ErrorCode::InvalidArgument, "cache.eviction_target_ratio must be in (0, 1]");
    }
    if (config.download.max_concurrent == 0) {
        return Err<void>(ErrorCode::InvalidArgument, "download.max_concurrent must be > 0");
    }
    if (config.download.chunk_size == 0) {
        return Err<void>(ErrorCode::InvalidArgument, "download.chunk_size must be > 0");
    }
    if (config.download.progress_step_percent < 0.0) {
        return Err<void>(ErrorCode::InvalidArgument, "download.progress_step_percent must be >= 0");
    }
    if (config.queue.concurrency == 0) {
        return Err<void>(ErrorCode::InvalidArgument, "queue.concurrency must be > 0");
    }
    for (const auto& collection : config.sync.collections) {
        if (collection.empty() || collection.front() == '_') {
            return Err<void>(ErrorCode::InvalidArgument,
                             "sync.collections entries must be non-empty and not start with '_'");
        }
    }
    if (config.sync.sync_interval.count() < 0 || config.sync.connectivity_debounce.count() < 0) {
        return Err<void>(ErrorCode::InvalidArgument, "sync durations must be >= 0");
    }
    return Ok();
}

void configure_logging(const LoggingConfig& config) {
    spdlog::set_level(spdlog::level::from_str(config.level));
    if (!config.pattern.empty()) {
        spdlog::set_pattern(config.pattern);
    }
}

} // namespace lsync
