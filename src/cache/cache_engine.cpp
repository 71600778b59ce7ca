#include "lsync/cache/cache_engine.hpp"

#include "lsync/core/hash.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>

namespace lsync::cache {
namespace {

std::string make_payload_ref(std::uint64_t seq) {
    char buffer[24];
    std::snprintf(buffer, sizeof(buffer), "p%016llu", static_cast<unsigned long long>(seq));
    return buffer;
}

bool eviction_order(const CacheEntry& a, const CacheEntry& b) {
    if (a.priority != b.priority) {
        return a.priority < b.priority;
    }
    if (a.last_accessed_at != b.last_accessed_at) {
        return a.last_accessed_at < b.last_accessed_at;
    }
    return a.insert_seq < b.insert_seq;
}

} // namespace

CacheEngine::CacheEngine(store::LocalStore& store, events::EventBus& bus, const Clock& clock, CacheConfig config)
    : store_(store), bus_(bus), clock_(clock), config_(config) {
    std::lock_guard lock(mutex_);
    refresh_index_locked();
    spdlog::debug("[Cache] loaded entries={} bytes={} capacity={}", index_.size(), total_size_, config_.capacity_bytes);
}

Result<std::string> CacheEngine::fetch_or_compute(const std::string& key,
                                                  std::int32_t priority,
                                                  const CacheLoader& loader,
                                                  std::optional<std::chrono::milliseconds> ttl) {
    if (key.empty()) {
        return Err<std::string>(ErrorCode::InvalidArgument, "cache key must not be empty");
    }

    std::vector<Victim> dropped;
    {
        std::lock_guard lock(mutex_);
        refresh_index_locked();

        const Timestamp now = clock_.now();
        auto it = index_.find(key);
        if (it != index_.end()) {
            if (!it->second.expired(now)) {
                auto payload = load_payload_locked(it->second);
                if (payload.is_ok()) {
                    CacheEntry touched = it->second;
                    touched.last_accessed_at = now;
                    auto saved = store_.put_as(store::kCacheEntriesCollection, key, touched);
                    if (saved.is_error()) {
                        spdlog::warn("[Cache] could not persist access time for {}: {}", key, saved.error().message);
                    } else {
                        it->second = touched;
                        known_revision_ = store_.revision();
                    }
                    ++hits_;
                    return payload;
                }
                spdlog::warn("[Cache] dropping unreadable entry {}: {}", key, payload.error().message);
                dropped.push_back(Victim{it->second, EvictionReason::Invalidated});
            } else {
                dropped.push_back(Victim{it->second, EvictionReason::Expired});
            }
            auto removed = remove_entries_locked(dropped);
            if (removed.is_error()) {
                spdlog::error("[Cache] failed to drop {}: {}", key, removed.error().message);
                dropped.clear();
            } else if (dropped.front().reason == EvictionReason::Expired) {
                ++evictions_;
            }
        }
        ++misses_;
    }
    emit_evictions(dropped);

    auto loaded = loader();
    if (loaded.is_error()) {
        spdlog::debug("[Cache] loader for {} failed: {}", key, loaded.error().message);
        return loaded;
    }
    const std::string& payload = loaded.value();
    const auto size = static_cast<std::uint64_t>(payload.size());

    if (size > config_.capacity_bytes) {
        spdlog::warn("[Cache] payload for {} ({} bytes) exceeds capacity {}; not cached",
                     key, size, config_.capacity_bytes);
        return loaded;
    }

    std::vector<Victim> victims;
    {
        std::lock_guard lock(mutex_);
        refresh_index_locked();

        const Timestamp now = clock_.now();
        const auto effective_ttl = ttl.value_or(config_.default_ttl);

        CacheEntry fresh;
        fresh.key = key;
        fresh.insert_seq = next_seq_++;
        fresh.payload_ref = make_payload_ref(fresh.insert_seq);
        fresh.size_bytes = size;
        fresh.priority = priority;
        fresh.created_at = now;
        fresh.last_accessed_at = now;
        fresh.expires_at = effective_ttl.count() > 0 ? now + effective_ttl.count() : 0;

        std::vector<store::StoreOp> ops;
        const auto existing = index_.find(key);
        if (existing != index_.end()) {
            // A concurrent loader for the same key got here first
            ops.push_back(store::StoreOp::remove(store::kCachePayloadsCollection, existing->second.payload_ref));
        }

        select_victims_locked(key, size, now, victims);
        for (const auto& victim : victims) {
            ops.push_back(store::StoreOp::remove(store::kCacheEntriesCollection, victim.entry.key));
            ops.push_back(store::StoreOp::remove(store::kCachePayloadsCollection, victim.entry.payload_ref));
        }
        ops.push_back(store::StoreOp::put(store::kCachePayloadsCollection, fresh.payload_ref,
                                          nlohmann::json{{"hex", hex_encode(payload)}}));
        ops.push_back(store::StoreOp::put(store::kCacheEntriesCollection, key, nlohmann::json(fresh)));

        auto committed = store_.transact(ops);
        if (committed.is_error()) {
            spdlog::error("[Cache] failed to store {}: {}", key, committed.error().message);
            return loaded;
        }

        if (existing != index_.end()) {
            total_size_ -= existing->second.size_bytes;
            index_.erase(existing);
        }
        for (const auto& victim : victims) {
            total_size_ -= victim.entry.size_bytes;
            index_.erase(victim.entry.key);
            ++evictions_;
        }
        total_size_ += size;
        index_[key] = fresh;
        known_revision_ = store_.revision();
    }
    emit_evictions(victims);

    return loaded;
}

std::size_t CacheEngine::invalidate(const std::string& key_prefix) {
    std::vector<Victim> victims;
    {
        std::lock_guard lock(mutex_);
        refresh_index_locked();
        for (const auto& [key, entry] : index_) {
            if (key.compare(0, key_prefix.size(), key_prefix) == 0) {
                victims.push_back(Victim{entry, EvictionReason::Invalidated});
            }
        }
        if (victims.empty()) {
            return 0;
        }
        auto removed = remove_entries_locked(victims);
        if (removed.is_error()) {
            spdlog::error("[Cache] invalidate({}) failed: {}", key_prefix, removed.error().message);
            return 0;
        }
    }
    spdlog::debug("[Cache] invalidated prefix={} entries={}", key_prefix, victims.size());
    emit_evictions(victims);
    return victims.size();
}

Result<void> CacheEngine::remove(const std::string& key) {
    std::vector<Victim> victims;
    {
        std::lock_guard lock(mutex_);
        refresh_index_locked();
        auto it = index_.find(key);
        if (it == index_.end()) {
            return Err<void>(ErrorCode::NotFound, "No cache entry for " + key);
        }
        victims.push_back(Victim{it->second, EvictionReason::Invalidated});
        auto removed = remove_entries_locked(victims);
        if (removed.is_error()) {
            return removed;
        }
    }
    emit_evictions(victims);
    return Ok();
}

std::size_t CacheEngine::sweep_expired() {
    std::vector<Victim> victims;
    {
        std::lock_guard lock(mutex_);
        refresh_index_locked();
        const Timestamp now = clock_.now();
        for (const auto& [key, entry] : index_) {
            if (entry.expired(now)) {
                victims.push_back(Victim{entry, EvictionReason::Expired});
            }
        }
        if (victims.empty()) {
            return 0;
        }
        auto removed = remove_entries_locked(victims);
        if (removed.is_error()) {
            spdlog::error("[Cache] TTL sweep failed: {}", removed.error().message);
            return 0;
        }
        evictions_ += victims.size();
    }
    spdlog::debug("[Cache] TTL sweep removed {} entries", victims.size());
    emit_evictions(victims);
    return victims.size();
}

Result<void> CacheEngine::clear() {
    std::lock_guard lock(mutex_);
    auto entries = store_.clear_collection(store::kCacheEntriesCollection);
    if (entries.is_error()) {
        return entries;
    }
    auto payloads = store_.clear_collection(store::kCachePayloadsCollection);
    if (payloads.is_error()) {
        return payloads;
    }
    index_.clear();
    total_size_ = 0;
    known_revision_ = store_.revision();
    return Ok();
}

CacheStats CacheEngine::stats() const {
    std::lock_guard lock(mutex_);
    refresh_index_locked();
    CacheStats stats;
    stats.total_size = total_size_;
    stats.entry_count = index_.size();
    stats.capacity = config_.capacity_bytes;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.evictions = evictions_;
    return stats;
}

std::optional<CacheEntry> CacheEngine::entry(const std::string& key) const {
    std::lock_guard lock(mutex_);
    refresh_index_locked();
    auto it = index_.find(key);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void CacheEngine::refresh_index_locked() const {
    const auto revision = store_.revision();
    if (known_revision_ && *known_revision_ == revision) {
        return;
    }

    index_.clear();
    total_size_ = 0;
    std::uint64_t max_seq = 0;

    auto cursor = store_.scan(store::kCacheEntriesCollection);
    while (auto record = cursor.next()) {
        try {
            auto entry = record->body.get<CacheEntry>();
            total_size_ += entry.size_bytes;
            max_seq = std::max(max_seq, entry.insert_seq);
            index_[entry.key] = std::move(entry);
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("[Cache] ignoring undecodable entry {}: {}", record->id, e.what());
        }
    }
    next_seq_ = std::max(next_seq_, max_seq + 1);
    known_revision_ = revision;
}

Result<std::string> CacheEngine::load_payload_locked(const CacheEntry& entry) const {
    auto body = store_.get(store::kCachePayloadsCollection, entry.payload_ref);
    if (body.is_error()) {
        return Err<std::string>(body.error());
    }
    const auto hex = body.value().value("hex", std::string{});
    std::string payload;
    if (!hex_decode(hex, payload) || payload.size() != entry.size_bytes) {
        return Err<std::string>(ErrorCode::CorruptLocalState, "Cache payload damaged: " + entry.payload_ref);
    }
    return Ok(std::move(payload));
}

void CacheEngine::select_victims_locked(const std::string& incoming_key,
                                        std::uint64_t incoming_size,
                                        Timestamp now,
                                        std::vector<Victim>& victims) const {
    std::uint64_t total = total_size_;
    const auto existing = index_.find(incoming_key);
    if (existing != index_.end()) {
        total -= existing->second.size_bytes;
    }
    if (total + incoming_size <= config_.capacity_bytes) {
        return;
    }

    std::vector<CacheEntry> candidates;
    for (const auto& [key, entry] : index_) {
        if (key == incoming_key) {
            continue;
        }
        if (entry.expired(now)) {
            victims.push_back(Victim{entry, EvictionReason::Expired});
            total -= entry.size_bytes;
        } else {
            candidates.push_back(entry);
        }
    }
    if (total + incoming_size <= config_.capacity_bytes) {
        return;
    }

    const auto target = static_cast<std::uint64_t>(
        static_cast<double>(config_.capacity_bytes) * config_.eviction_target_ratio);
    std::sort(candidates.begin(), candidates.end(), eviction_order);
    for (const auto& candidate : candidates) {
        if (total + incoming_size <= target) {
            break;
        }
        victims.push_back(Victim{candidate, EvictionReason::Capacity});
        total -= candidate.size_bytes;
    }
}

Result<void> CacheEngine::remove_entries_locked(const std::vector<Victim>& victims) {
    std::vector<store::StoreOp> ops;
    ops.reserve(victims.size() * 2);
    for (const auto& victim : victims) {
        ops.push_back(store::StoreOp::remove(store::kCacheEntriesCollection, victim.entry.key));
        ops.push_back(store::StoreOp::remove(store::kCachePayloadsCollection, victim.entry.payload_ref));
    }
    auto committed = store_.transact(ops);
    if (committed.is_error()) {
        return committed;
    }
    for (const auto& victim : victims) {
        total_size_ -= victim.entry.size_bytes;
        index_.erase(victim.entry.key);
    }
    known_revision_ = store_.revision();
    return Ok();
}

void CacheEngine::emit_evictions(const std::vector<Victim>& victims) {
    for (const auto& victim : victims) {
        bus_.emit(events::CacheEvictedEvent{victim.entry.key, victim.entry.size_bytes, victim.reason});
    }
}

} // namespace lsync::cache
