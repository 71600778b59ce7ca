#pragma once

/**
 * @file cache_engine.hpp
 * @brief Bounded, persistent cache of remote payloads with priority-aware LRU
 *
 * WHY THIS FILE EXISTS:
 * Remote responses (catalog pages, lesson metadata, thumbnails) are reused
 * offline, but the device budget is fixed. This engine is the single
 * owner of that budget.
 *
 * EVICTION:
 * Runs when an insert would push the total over capacity. Expired entries
 * go first; then live entries ordered by (priority asc, last access asc,
 * insertion order) until the total plus the incoming payload fits in
 * eviction_target_ratio * capacity. The gap between the target and the
 * capacity keeps every insert from triggering another eviction round.
 *
 * PERSISTENCE:
 * Entry metadata lives in "_cache_entries" and payloads in
 * "_cache_payloads", written together in one store transaction. The
 * in-memory index is reloaded whenever the store revision moved without
 * this engine knowing.
 *
 * THREAD SAFETY:
 * All operations are safe from any thread. Loaders run without the cache
 * lock held, so a slow network fetch never blocks other keys.
 */

#include "lsync/cache/cache_entry.hpp"
#include "lsync/core/clock.hpp"
#include "lsync/core/config.hpp"
#include "lsync/core/result.hpp"
#include "lsync/events/event_bus.hpp"
#include "lsync/events/events.hpp"
#include "lsync/store/local_store.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lsync::cache {

using CacheLoader = std::function<Result<std::string>()>;

class CacheEngine {
public:
    CacheEngine(store::LocalStore& store, events::EventBus& bus, const Clock& clock, CacheConfig config);

    CacheEngine(const CacheEngine&) = delete;
    CacheEngine& operator=(const CacheEngine&) = delete;

    /**
     * Return the cached payload for key, or run loader and cache its result.
     *
     * The loader runs only on a miss or when the entry expired. A loader
     * error is returned as-is and nothing is cached. A payload larger than
     * the whole capacity is returned but not cached.
     *
     * @param ttl overrides the configured default TTL; zero means no expiry
     */
    Result<std::string> fetch_or_compute(const std::string& key,
                                         std::int32_t priority,
                                         const CacheLoader& loader,
                                         std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    /// Drops every entry whose key starts with prefix; returns how many.
    std::size_t invalidate(const std::string& key_prefix);

    Result<void> remove(const std::string& key);

    /// Removes expired entries regardless of priority; returns how many.
    std::size_t sweep_expired();

    Result<void> clear();

    CacheStats stats() const;

    std::optional<CacheEntry> entry(const std::string& key) const;

private:
    struct Victim {
        CacheEntry entry;
        EvictionReason reason;
    };

    void refresh_index_locked() const;
    Result<std::string> load_payload_locked(const CacheEntry& entry) const;

    void select_victims_locked(const std::string& incoming_key,
                               std::uint64_t incoming_size,
                               Timestamp now,
                               std::vector<Victim>& victims) const;

    Result<void> remove_entries_locked(const std::vector<Victim>& victims);

    void emit_evictions(const std::vector<Victim>& victims);

    store::LocalStore& store_;
    events::EventBus& bus_;
    const Clock& clock_;
    CacheConfig config_;

    mutable std::mutex mutex_;
    mutable std::unordered_map<std::string, CacheEntry> index_;
    mutable std::uint64_t total_size_ = 0;
    mutable std::uint64_t next_seq_ = 1;
    mutable std::optional<std::uint64_t> known_revision_;

    std::uint64_t hits_ = 0;
    std::uint64_t misses_ = 0;
    std::uint64_t evictions_ = 0;
};

} // namespace lsync::cache
