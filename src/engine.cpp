#include "lsync/engine.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace lsync {

namespace {

EngineConfig validated(EngineConfig config) {
    auto checked = ConfigLoader::validate(config);
    if (checked.is_error()) {
        throw std::invalid_argument("Invalid engine configuration: " + checked.error().message);
    }
    return config;
}

} // namespace

SyncEngine::SyncEngine(EngineConfig config,
                       sync::RemoteStore& remote,
                       download::AssetSource& assets,
                       const Clock& clock)
    : config_(validated(std::move(config))),
      clock_(clock),
      logger_(bus_),
      metrics_(bus_),
      store_(config_.store.path, config_.store.scan_page_size),
      cache_(store_, bus_, clock_, config_.cache),
      queue_(store_, bus_, clock_, config_.queue),
      downloads_(store_, bus_, assets, clock_, config_.download,
                 [this]() { return orchestrator_.lock_entities(); }),
      orchestrator_(store_, queue_, cache_, downloads_, remote, bus_, clock_, config_.sync) {
    configure_logging(config_.logging);
    spdlog::info("[Engine] opened store={} collections={} pending_actions={}",
                 config_.store.path, config_.sync.collections.size(), queue_.pending_count());
}

SyncEngine::~SyncEngine() {
    stop();
    // Workers call back into the orchestrator's entity lock, which is destroyed first
    downloads_.shutdown();
}

void SyncEngine::start() {
    orchestrator_.start();
}

void SyncEngine::stop() {
    orchestrator_.stop();
}

// ─────────────────────────────────────────────────────────────
// Entities
// ─────────────────────────────────────────────────────────────

Result<EntityView> SyncEngine::read(const std::string& collection, const std::string& id) {
    if (!store::is_entity_collection(collection)) {
        return Err<EntityView>(ErrorCode::InvalidArgument, "Not an entity collection: " + collection);
    }

    auto record = store_.get_as<store::EntityRecord>(collection, id);
    if (record.is_error()) {
        if (record.error().code == ErrorCode::CorruptLocalState) {
            auto reported = orchestrator_.report_corruption(collection, id, record.error().message);
            if (reported.is_error()) {
                spdlog::error("[Engine] could not quarantine {}/{}: {}", collection, id,
                              reported.error().message);
            }
        }
        return Err<EntityView>(record.error());
    }

    EntityView view;
    view.record = std::move(record.value());
    view.dirty = view.record.dirty;
    view.stale = view.record.last_synced_at == 0 ||
                 clock_.now() - view.record.last_synced_at > config_.sync.stale_after.count();
    return Ok(std::move(view));
}

std::size_t SyncEngine::watch(const std::string& collection, const std::string& id,
                              std::function<void(const events::EntityChangedEvent&)> callback) {
    return bus_.subscribe<events::EntityChangedEvent>(
        [collection, id, callback = std::move(callback)](const events::EntityChangedEvent& event) {
            if (event.collection == collection && event.id == id) {
                callback(event);
            }
        });
}

void SyncEngine::unwatch(std::size_t subscription) {
    bus_.unsubscribe<events::EntityChangedEvent>(subscription);
}

Result<std::string> SyncEngine::enqueue_action(const std::string& collection,
                                               const std::string& id,
                                               const std::string& kind,
                                               nlohmann::json payload,
                                               std::int32_t priority) {
    if (!store::is_entity_collection(collection) || id.empty()) {
        return Err<std::string>(ErrorCode::InvalidArgument, "Invalid entity key: " + collection + "/" + id);
    }

    queue::OfflineAction action;
    action.kind = kind;
    action.target_key = store::make_entity_key(collection, id);
    action.payload = std::move(payload);
    action.priority = priority;

    Result<std::string> enqueued = Err<std::string>(ErrorCode::InvalidState, "not enqueued");
    bool deleted = false;
    bool changed = false;
    {
        // Pulled pages must not interleave with the read-modify-write below
        auto lock = orchestrator_.lock_entities();
        auto ops = optimistic_ops(collection, id, kind, action.payload, deleted);
        if (ops.is_error()) {
            return Err<std::string>(ops.error());
        }
        changed = !ops.value().empty();
        enqueued = queue_.enqueue(std::move(action), std::move(ops.value()));
    }
    if (enqueued.is_error()) {
        return enqueued;
    }

    if (changed) {
        const auto key = store::make_entity_key(collection, id);
        auto dropped = allow_not_found(cache_.remove(key));
        if (dropped.is_error()) {
            spdlog::warn("[Engine] could not invalidate cache entry {}: {}", key, dropped.error().message);
        }
        cache_.invalidate(key + "/");
        bus_.emit(events::EntityChangedEvent{collection, id, "local", deleted});
    }
    return enqueued;
}

Result<std::vector<store::StoreOp>> SyncEngine::optimistic_ops(const std::string& collection,
                                                               const std::string& id,
                                                               const std::string& kind,
                                                               const nlohmann::json& payload,
                                                               bool& deleted) {
    using Ops = std::vector<store::StoreOp>;

    const bool is_put = kind == queue::kind::kPut;
    const bool is_merge = kind == queue::kind::kMerge;
    const bool is_delete = kind == queue::kind::kDelete;
    if (!is_put && !is_merge && !is_delete) {
        spdlog::debug("[Engine] action kind {} recorded without a local apply", kind);
        return Ok(Ops{});
    }
    if ((is_put || is_merge) && !payload.is_object()) {
        return Err<Ops>(ErrorCode::InvalidArgument, kind + " payload must be a JSON object");
    }

    Ops ops;
    const Timestamp now = clock_.now();

    store::EntityRecord record;
    record.collection = collection;
    record.id = id;
    bool exists = false;

    auto existing = store_.get_as<store::EntityRecord>(collection, id);
    if (existing.is_ok()) {
        record = std::move(existing.value());
        exists = true;
    } else if (existing.error().code == ErrorCode::CorruptLocalState) {
        auto raw = store_.get_raw(collection, id);
        ops.push_back(store::LocalStore::quarantine_op(collection, id, raw.is_ok() ? raw.value() : "",
                                                       existing.error().message, now));
        exists = true;
    } else if (existing.error().code != ErrorCode::NotFound) {
        return Err<Ops>(existing.error());
    }

    if (is_delete) {
        if (exists) {
            ops.push_back(store::StoreOp::remove(collection, id));
            deleted = true;
        }
        return Ok(std::move(ops));
    }

    if (is_put) {
        record.data = payload;
        record.field_times.clear();
    }
    for (const auto& [field, value] : payload.items()) {
        if (is_merge) {
            record.data[field] = value;
        }
        record.field_times[field] = now;
    }
    record.dirty = true;

    ops.push_back(store::StoreOp::put(collection, id, nlohmann::json(record)));
    return Ok(std::move(ops));
}

// ─────────────────────────────────────────────────────────────
// Cache and downloads
// ─────────────────────────────────────────────────────────────

Result<std::string> SyncEngine::fetch_cached(const std::string& key,
                                             std::int32_t priority,
                                             const cache::CacheLoader& loader,
                                             std::optional<std::chrono::milliseconds> ttl) {
    return cache_.fetch_or_compute(key, priority, loader, ttl);
}

Result<std::string> SyncEngine::start_download(const std::string& resource_key,
                                               const std::string& source_url,
                                               const std::string& destination,
                                               const std::string& quality,
                                               const std::string& expected_checksum) {
    return downloads_.start(resource_key, source_url, destination, quality, expected_checksum);
}

Result<void> SyncEngine::pause_download(const std::string& task_id) {
    return downloads_.pause(task_id);
}

Result<void> SyncEngine::resume_download(const std::string& task_id) {
    return downloads_.resume(task_id);
}

Result<void> SyncEngine::cancel_download(const std::string& task_id) {
    return downloads_.cancel(task_id);
}

Result<download::ProgressStream> SyncEngine::download_progress(const std::string& task_id) {
    return downloads_.progress_of(task_id);
}

// ─────────────────────────────────────────────────────────────
// Sync
// ─────────────────────────────────────────────────────────────

std::shared_future<sync::SyncReport> SyncEngine::request_sync() {
    return orchestrator_.sync_now(sync::SyncTrigger::Manual);
}

sync::SyncStatus SyncEngine::sync_status() const {
    return orchestrator_.status();
}

std::size_t SyncEngine::watch_sync_status(std::function<void(const events::SyncStatusChangedEvent&)> callback) {
    return orchestrator_.watch_status(std::move(callback));
}

void SyncEngine::unwatch_sync_status(std::size_t subscription) {
    orchestrator_.unwatch_status(subscription);
}

void SyncEngine::set_online(bool online) {
    orchestrator_.set_online(online);
}

StorageInfo SyncEngine::storage_info() const {
    StorageInfo info;
    const auto cache_stats = cache_.stats();
    info.cache_bytes = cache_stats.total_size;
    info.cache_capacity = cache_stats.capacity;
    info.cache_entries = cache_stats.entry_count;
    info.downloads = downloads_.storage_info();
    info.pending_actions = queue_.pending_count();
    info.abandoned_actions = queue_.abandoned().size();
    info.quarantined_records = store_.count(store::kQuarantineCollection);
    return info;
}

} // namespace lsync
