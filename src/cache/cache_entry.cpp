#include "lsync/cache/cache_entry.hpp"

namespace lsync::cache {

void to_json(nlohmann::json& j, const CacheEntry& entry) {
    j = nlohmann::json{
        {"key", entry.key},
        {"payloadRef", entry.payload_ref},
        {"sizeBytes", entry.size_bytes},
        {"priority", entry.priority},
        {"lastAccessedAt", entry.last_accessed_at},
        {"expiresAt", entry.expires_at},
        {"createdAt", entry.created_at},
        {"insertSeq", entry.insert_seq},
    };
}

void from_json(const nlohmann::json& j, CacheEntry& entry) {
    j.at("key").get_to(entry.key);
    j.at("payloadRef").get_to(entry.payload_ref);
    j.at("sizeBytes").get_to(entry.size_bytes);
    entry.priority = j.value("priority", std::int32_t{0});
    entry.last_accessed_at = j.value("lastAccessedAt", Timestamp{0});
    entry.expires_at = j.value("expiresAt", Timestamp{0});
    entry.created_at = j.value("createdAt", Timestamp{0});
    entry.insert_seq = j.value("insertSeq", std::uint64_t{0});
}

const char* to_string(EvictionReason reason) noexcept {
    switch (reason) {
        case EvictionReason::Capacity: return "capacity";
        case EvictionReason::Expired: return "expired";
        case EvictionReason::Invalidated: return "invalidated";
    }
    return "capacity";
}

} // namespace lsync::cache
