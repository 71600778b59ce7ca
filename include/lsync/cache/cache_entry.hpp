#pragma once

#include "lsync/core/clock.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace lsync::cache {

/**
 * @brief Metadata for one cached payload
 *
 * The payload itself lives under payload_ref in the payload collection;
 * entries are small so the whole index fits in memory.
 */
struct CacheEntry {
    std::string key;
    std::string payload_ref;
    std::uint64_t size_bytes = 0;
    std::int32_t priority = 0;       ///< Lower priorities are evicted first
    Timestamp last_accessed_at = 0;
    Timestamp expires_at = 0;        ///< 0 = never expires
    Timestamp created_at = 0;
    std::uint64_t insert_seq = 0;    ///< Tie-breaker between equal (priority, last_accessed_at)

    [[nodiscard]] bool expired(Timestamp now) const noexcept {
        return expires_at != 0 && expires_at <= now;
    }
};

void to_json(nlohmann::json& j, const CacheEntry& entry);
void from_json(const nlohmann::json& j, CacheEntry& entry);

enum class EvictionReason {
    Capacity,
    Expired,
    Invalidated
};

const char* to_string(EvictionReason reason) noexcept;

struct CacheStats {
    std::uint64_t total_size = 0;
    std::size_t entry_count = 0;
    std::uint64_t capacity = 0;
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t evictions = 0;
};

} // namespace lsync::cache
