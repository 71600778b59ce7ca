#include "lsync/sync/memory_remote_store.hpp"

#include "lsync/store/types.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace lsync::sync {

MemoryRemoteStore::MemoryRemoteStore(const Clock& clock, std::size_t page_size)
    : clock_(clock), page_size_(page_size == 0 ? 1 : page_size) {}

Result<PullBatch> MemoryRemoteStore::pull(const std::string& collection, std::int64_t since_cursor) {
    std::lock_guard lock(mutex_);
    if (!online_) {
        return Err<PullBatch>(ErrorCode::TransientNetwork, "remote unreachable");
    }
    if (pull_failures_ > 0) {
        --pull_failures_;
        return Err<PullBatch>(pull_failure_code_, "injected pull failure");
    }

    std::vector<const Stored*> changed;
    for (const auto& [key, stored] : records_) {
        if (key.first == collection && stored.seq > since_cursor) {
            changed.push_back(&stored);
        }
    }
    std::sort(changed.begin(), changed.end(), [](const Stored* a, const Stored* b) { return a->seq < b->seq; });

    PullBatch batch;
    batch.new_cursor = since_cursor;
    for (const auto* stored : changed) {
        if (batch.records.size() == page_size_) {
            batch.has_more = true;
            break;
        }
        batch.records.push_back(stored->record);
        batch.new_cursor = stored->seq;
    }
    return Ok(std::move(batch));
}

Result<void> MemoryRemoteStore::push(const queue::OfflineAction& action) {
    std::lock_guard lock(mutex_);
    if (!online_) {
        return Err<void>(ErrorCode::TransientNetwork, "remote unreachable");
    }
    if (push_failures_ > 0) {
        --push_failures_;
        return Err<void>(push_failure_code_, "injected push failure");
    }
    if (applied_action_ids_.count(action.id) > 0) {
        return Ok();
    }

    auto key = store::split_entity_key(action.target_key);
    if (!key) {
        return Err<void>(ErrorCode::InvalidArgument, "Malformed target key: " + action.target_key);
    }

    RemoteRecord record;
    record.collection = key->first;
    record.id = key->second;
    const auto existing = records_.find(*key);
    if (existing != records_.end() && !existing->second.record.deleted) {
        record.data = existing->second.record.data;
    }

    if (action.kind == queue::kind::kPut) {
        record.data = action.payload;
    } else if (action.kind == queue::kind::kMerge) {
        if (!action.payload.is_object()) {
            return Err<void>(ErrorCode::InvalidArgument, "merge payload must be an object");
        }
        for (const auto& [field, value] : action.payload.items()) {
            record.data[field] = value;
        }
    } else if (action.kind == queue::kind::kDelete) {
        record.data = nlohmann::json::object();
        record.deleted = true;
    } else {
        return Err<void>(ErrorCode::InvalidArgument, "Unknown action kind: " + action.kind);
    }

    write_locked(std::move(record));
    applied_action_ids_.insert(action.id);
    pushed_.push_back(action);
    return Ok();
}

void MemoryRemoteStore::set_online(bool online) {
    std::lock_guard lock(mutex_);
    online_ = online;
}

bool MemoryRemoteStore::online() const {
    std::lock_guard lock(mutex_);
    return online_;
}

void MemoryRemoteStore::fail_next_pushes(std::size_t count, ErrorCode code) {
    std::lock_guard lock(mutex_);
    push_failures_ = count;
    push_failure_code_ = code;
}

void MemoryRemoteStore::fail_next_pulls(std::size_t count, ErrorCode code) {
    std::lock_guard lock(mutex_);
    pull_failures_ = count;
    pull_failure_code_ = code;
}

void MemoryRemoteStore::upsert(const std::string& collection, const std::string& id, nlohmann::json data) {
    std::lock_guard lock(mutex_);
    RemoteRecord record;
    record.collection = collection;
    record.id = id;
    record.data = std::move(data);
    write_locked(std::move(record));
}

void MemoryRemoteStore::remove(const std::string& collection, const std::string& id) {
    std::lock_guard lock(mutex_);
    RemoteRecord record;
    record.collection = collection;
    record.id = id;
    record.deleted = true;
    write_locked(std::move(record));
}

std::optional<RemoteRecord> MemoryRemoteStore::get(const std::string& collection, const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto it = records_.find({collection, id});
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second.record;
}

std::vector<queue::OfflineAction> MemoryRemoteStore::pushed() const {
    std::lock_guard lock(mutex_);
    return pushed_;
}

std::int64_t MemoryRemoteStore::head() const {
    std::lock_guard lock(mutex_);
    return next_seq_ - 1;
}

void MemoryRemoteStore::write_locked(RemoteRecord record) {
    record.updated_at = clock_.now();
    auto key = std::make_pair(record.collection, record.id);
    auto& stored = records_[key];
    stored.seq = next_seq_++;
    stored.record = std::move(record);
    spdlog::debug("[Remote] {}/{} seq={} deleted={}", stored.record.collection, stored.record.id, stored.seq,
                  stored.record.deleted);
}

} // namespace lsync::sync
