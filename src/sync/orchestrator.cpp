#include "lsync/sync/orchestrator.hpp"

#include <boost/asio/post.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <set>

namespace lsync::sync {

namespace asio = boost::asio;

namespace {

struct FieldMerge {
    nlohmann::json data = nlohmann::json::object();
    std::vector<std::string> local_wins;
    std::vector<std::string> remote_wins;
};

// Field-group last-writer-wins between a dirty local record and the remote
// version. A local group survives only if it was modified after the remote
// record's updated_at.
FieldMerge merge_fields(store::EntityRecord& local, const RemoteRecord& remote) {
    FieldMerge merge;
    if (!remote.data.is_object() || !local.data.is_object()) {
        merge.data = remote.data;
        merge.remote_wins.push_back("*");
        local.field_times.clear();
        return merge;
    }

    for (const auto& [field, value] : remote.data.items()) {
        const auto stamp = local.field_times.find(field);
        const bool touched = stamp != local.field_times.end();
        const bool local_newer = touched && stamp->second > remote.updated_at;
        const bool differs = local.data.contains(field) && local.data.at(field) != value;

        if (local_newer && local.data.contains(field)) {
            merge.data[field] = local.data.at(field);
            if (differs) {
                merge.local_wins.push_back(field);
            }
            continue;
        }
        merge.data[field] = value;
        if (touched) {
            if (differs) {
                merge.remote_wins.push_back(field);
            }
            local.field_times.erase(stamp);
        }
    }

    // Groups only the local side has: keep them while their edit is newer
    for (const auto& [field, value] : local.data.items()) {
        if (remote.data.contains(field)) {
            continue;
        }
        const auto stamp = local.field_times.find(field);
        if (stamp != local.field_times.end() && stamp->second > remote.updated_at) {
            merge.data[field] = value;
        } else if (stamp != local.field_times.end()) {
            local.field_times.erase(stamp);
        }
    }
    return merge;
}

} // namespace

SyncOrchestrator::SyncOrchestrator(store::LocalStore& store,
                                   queue::ActionQueue& queue,
                                   cache::CacheEngine& cache,
                                   download::DownloadManager& downloads,
                                   RemoteStore& remote,
                                   events::EventBus& bus,
                                   const Clock& clock,
                                   SyncConfig config)
    : store_(store),
      queue_(queue),
      cache_(cache),
      downloads_(downloads),
      remote_(remote),
      bus_(bus),
      clock_(clock),
      config_(std::move(config)),
      online_(config_.start_online),
      desired_online_(config_.start_online),
      debounce_timer_(io_),
      periodic_timer_(io_) {}

SyncOrchestrator::~SyncOrchestrator() {
    stop();
    sync_pool_.join();
}

// ─────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────

void SyncOrchestrator::start() {
    if (timers_running_.exchange(true)) {
        return;
    }
    io_.restart();
    work_guard_.emplace(asio::make_work_guard(io_));
    io_thread_ = std::thread([this]() { io_.run(); });

    if (config_.sync_interval.count() > 0) {
        asio::post(io_, [this]() { schedule_periodic(); });
    }
    spdlog::info("[Sync] started online={} interval={}ms debounce={}ms",
                 online_.load(), config_.sync_interval.count(), config_.connectivity_debounce.count());
}

void SyncOrchestrator::stop() {
    if (timers_running_.exchange(false)) {
        work_guard_.reset();
        io_.stop();
        if (io_thread_.joinable()) {
            io_thread_.join();
        }
        spdlog::info("[Sync] stopped");
    }

    std::optional<std::shared_future<SyncReport>> running;
    {
        std::lock_guard lock(state_mutex_);
        running = in_flight_;
    }
    if (running) {
        running->wait();
    }
}

// ─────────────────────────────────────────────────────────────
// Triggers
// ─────────────────────────────────────────────────────────────

std::shared_future<SyncReport> SyncOrchestrator::sync_now(SyncTrigger trigger) {
    std::lock_guard lock(state_mutex_);
    if (in_flight_) {
        spdlog::debug("[Sync] {} request joined the running sync", to_string(trigger));
        return *in_flight_;
    }

    cancel_requested_ = false;
    auto promise = std::make_shared<std::promise<SyncReport>>();
    std::shared_future<SyncReport> future = promise->get_future().share();
    in_flight_ = future;

    asio::post(sync_pool_, [this, promise, trigger]() {
        SyncReport report;
        try {
            report = execute(trigger);
        } catch (const std::exception& e) {
            spdlog::error("[Sync] run aborted: {}", e.what());
            report.trigger = trigger;
            report.pull_error = Error{ErrorCode::Storage, e.what()};
            {
                std::lock_guard state_lock(state_mutex_);
                last_error_ = report.pull_error;
                last_report_ = report;
            }
            set_status(SyncStatus::Error, e.what());
            bus_.emit(events::SyncFailedEvent{e.what(), report});
        }
        {
            std::lock_guard state_lock(state_mutex_);
            in_flight_.reset();
        }
        promise->set_value(std::move(report));
    });
    return future;
}

SyncReport SyncOrchestrator::run_sync(SyncTrigger trigger) {
    return sync_now(trigger).get();
}

void SyncOrchestrator::cancel_sync() {
    std::lock_guard lock(state_mutex_);
    if (in_flight_) {
        spdlog::info("[Sync] cancellation requested");
        cancel_requested_ = true;
    }
}

void SyncOrchestrator::set_online(bool online) {
    desired_online_ = online;
    if (config_.connectivity_debounce.count() <= 0 || !timers_running_) {
        apply_connectivity(online);
        return;
    }

    // Each signal restarts the window; only a value that held still applies
    asio::post(io_, [this]() {
        debounce_timer_.expires_after(config_.connectivity_debounce);
        debounce_timer_.async_wait([this](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            apply_connectivity(desired_online_.load());
        });
    });
}

void SyncOrchestrator::apply_connectivity(bool online) {
    if (online_.exchange(online) == online) {
        return;
    }
    spdlog::info("[Sync] connectivity {}", online ? "online" : "offline");
    bus_.emit(events::ConnectivityChangedEvent{online});

    if (online) {
        const auto resumed = downloads_.resume_interrupted();
        if (resumed > 0) {
            spdlog::info("[Sync] resumed {} interrupted downloads", resumed);
        }
        sync_now(SyncTrigger::Reconnect);
    }
}

void SyncOrchestrator::schedule_periodic() {
    periodic_timer_.expires_after(config_.sync_interval);
    periodic_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        if (online_) {
            sync_now(SyncTrigger::Periodic);
        }
        schedule_periodic();
    });
}

// ─────────────────────────────────────────────────────────────
// One run
// ─────────────────────────────────────────────────────────────

SyncReport SyncOrchestrator::execute(SyncTrigger trigger) {
    const auto started = std::chrono::steady_clock::now();

    SyncReport report;
    report.trigger = trigger;
    report.online = online_;

    set_status(SyncStatus::Syncing);
    bus_.emit(events::SyncStartedEvent{trigger, queue_.pending_count()});
    spdlog::info("[Sync] run started trigger={} online={}", to_string(trigger), report.online);

    if (report.online) {
        push_phase(report);
        if (cancel_requested_) {
            report.cancelled = true;
        } else {
            pull_phase(report);
        }
    } else {
        spdlog::info("[Sync] offline; only maintenance runs");
    }
    maintenance_phase(report);

    report.duration =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    {
        std::lock_guard lock(state_mutex_);
        last_report_ = report;
        if (report.pull_error) {
            last_error_ = report.pull_error;
        } else if (report.push_error) {
            last_error_ = report.push_error;
        } else {
            last_error_.reset();
        }
    }

    if (report.pull_error) {
        set_status(SyncStatus::Error, report.pull_error->message);
        bus_.emit(events::SyncFailedEvent{report.pull_error->message, report});
        spdlog::warn("[Sync] run failed after {}ms: {}", report.duration.count(), report.pull_error->to_string());
    } else {
        set_status(SyncStatus::Idle);
        bus_.emit(events::SyncCompletedEvent{report});
        spdlog::info("[Sync] run finished in {}ms pushed={} pulled={} deleted={} conflicts={} cancelled={}",
                     report.duration.count(), report.actions_succeeded, report.records_pulled,
                     report.records_deleted, report.conflicts, report.cancelled);
    }
    return report;
}

void SyncOrchestrator::push_phase(SyncReport& report) {
    auto drained = queue_.drain([this](const queue::OfflineAction& action) { return remote_.push(action); },
                                &cancel_requested_);

    report.actions_succeeded = drained.succeeded;
    report.actions_retried = drained.retried;
    report.actions_abandoned = drained.abandoned.size();
    report.conflicts += drained.conflicts;
    if (drained.last_error) {
        report.push_error = drained.last_error;
    }

    mark_clean(drained.applied_keys);

    // A rejected push leaves the optimistic local copy behind; re-pull the
    // collection so the remote version replaces it
    std::set<std::string> reset;
    for (const auto& key : drained.conflict_keys) {
        auto parts = store::split_entity_key(key);
        if (parts && reset.insert(parts->first).second) {
            auto cleared = reset_cursor(parts->first);
            if (cleared.is_error()) {
                spdlog::error("[Sync] could not reset cursor of {}: {}", parts->first, cleared.error().message);
            }
        }
    }
}

void SyncOrchestrator::mark_clean(const std::vector<std::string>& keys) {
    if (keys.empty()) {
        return;
    }

    // Taken before reading the queue: an edit enqueued after this point waits for us
    auto lock = lock_entities();
    std::set<std::string> still_pending;
    for (const auto& action : queue_.pending()) {
        still_pending.insert(action.target_key);
    }

    for (const auto& key : keys) {
        if (still_pending.count(key) > 0) {
            continue;
        }
        auto parts = store::split_entity_key(key);
        if (!parts) {
            continue;
        }
        auto record = store_.get_as<store::EntityRecord>(parts->first, parts->second);
        if (record.is_error() || !record.value().dirty) {
            continue;
        }
        auto& value = record.value();
        value.dirty = false;
        value.field_times.clear();
        auto saved = store_.put_as(parts->first, parts->second, value);
        if (saved.is_error()) {
            spdlog::error("[Sync] could not mark {} clean: {}", key, saved.error().message);
        }
    }
}

void SyncOrchestrator::pull_phase(SyncReport& report) {
    for (const auto& collection : config_.collections) {
        SyncCursor position = cursor(collection);

        while (true) {
            if (cancel_requested_) {
                report.cancelled = true;
                spdlog::info("[Sync] pull cancelled at {} cursor={}", collection, position.cursor);
                return;
            }

            auto batch = remote_.pull(collection, position.cursor);
            if (batch.is_error()) {
                spdlog::warn("[Sync] pull of {} failed: {}", collection, batch.error().to_string());
                report.pull_error = batch.error();
                break;
            }

            auto applied = apply_page(collection, batch.value(), position, report);
            if (applied.is_error()) {
                spdlog::error("[Sync] page of {} not committed: {}", collection, applied.error().to_string());
                report.pull_error = applied.error();
                break;
            }

            if (!batch.value().has_more || batch.value().records.empty()) {
                break;
            }
        }
    }
}

Result<void> SyncOrchestrator::apply_page(const std::string& collection, const PullBatch& batch,
                                          SyncCursor& position, SyncReport& report) {
    std::vector<store::StoreOp> ops;
    std::vector<events::EntityChangedEvent> changed;
    std::vector<events::ConflictResolvedEvent> conflicts;
    std::vector<events::EntityQuarantinedEvent> quarantined;
    std::size_t pulled = 0;
    std::size_t deleted = 0;

    auto lock = lock_entities();
    const Timestamp now = clock_.now();

    for (const auto& remote : batch.records) {
        const std::string& target = remote.collection.empty() ? collection : remote.collection;
        if (!store::is_entity_collection(target) || remote.id.empty()) {
            spdlog::warn("[Sync] skipping remote record with invalid key {}/{}", target, remote.id);
            continue;
        }

        std::optional<store::EntityRecord> local;
        bool corrupt = false;
        auto existing = store_.get_as<store::EntityRecord>(target, remote.id);
        if (existing.is_ok()) {
            local = std::move(existing.value());
        } else if (existing.error().code == ErrorCode::CorruptLocalState) {
            auto raw = store_.get_raw(target, remote.id);
            ops.push_back(store::LocalStore::quarantine_op(target, remote.id, raw.is_ok() ? raw.value() : "",
                                                           existing.error().message, now));
            quarantined.push_back({target, remote.id, existing.error().message});
            corrupt = true;
        } else if (existing.error().code != ErrorCode::NotFound) {
            return Err<void>(existing.error());
        }

        if (remote.deleted) {
            if (local || corrupt) {
                ops.push_back(store::StoreOp::remove(target, remote.id));
                changed.push_back({target, remote.id, "pull", true});
                ++deleted;
            }
            continue;
        }

        store::EntityRecord merged;
        if (local && local->dirty) {
            merged = *local;
            auto merge = merge_fields(merged, remote);
            merged.data = std::move(merge.data);
            const auto key = merged.key();
            if (!merge.local_wins.empty()) {
                conflicts.push_back({key, events::ConflictResolutionStrategy::LastWriteWins, "local",
                                     merge.local_wins});
            }
            if (!merge.remote_wins.empty()) {
                conflicts.push_back({key, events::ConflictResolutionStrategy::LastWriteWins, "remote",
                                     merge.remote_wins});
            }
        } else {
            merged.collection = target;
            merged.id = remote.id;
            merged.data = remote.data;
            if (local) {
                merged.local_path = local->local_path;
                merged.available_offline = local->available_offline;
            }
        }
        merged.last_synced_at = now;
        merged.remote_updated_at = remote.updated_at;

        ops.push_back(store::StoreOp::put(target, remote.id, nlohmann::json(merged)));
        changed.push_back({target, remote.id, "pull", false});
        ++pulled;
    }

    SyncCursor advanced = position;
    advanced.collection = collection;
    advanced.cursor = std::max(position.cursor, batch.new_cursor);
    advanced.last_pull_at = now;
    ops.push_back(store::StoreOp::put(store::kCursorsCollection, collection, nlohmann::json(advanced)));

    auto committed = store_.transact(ops);
    if (committed.is_error()) {
        return committed;
    }
    lock.unlock();

    position = advanced;
    report.records_pulled += pulled;
    report.records_deleted += deleted;
    report.records_quarantined += quarantined.size();
    report.conflicts += conflicts.size();
    report.pages_committed++;
    spdlog::debug("[Sync] committed page of {} records={} cursor={}", collection, batch.records.size(),
                  advanced.cursor);

    for (const auto& event : quarantined) {
        corrupt_records_ = true;
        bus_.emit(event);
    }
    for (const auto& event : changed) {
        const auto key = store::make_entity_key(event.collection, event.id);
        auto dropped = allow_not_found(cache_.remove(key));
        if (dropped.is_error()) {
            spdlog::warn("[Sync] could not invalidate cache entry {}: {}", key, dropped.error().message);
        }
        cache_.invalidate(key + "/");
        bus_.emit(event);
    }
    for (const auto& event : conflicts) {
        spdlog::info("[Sync] conflict on {} resolved for {} ({} fields)", event.target_key, event.winner,
                     event.fields.size());
        bus_.emit(event);
    }
    return Ok();
}

void SyncOrchestrator::maintenance_phase(SyncReport& report) {
    report.cache_entries_expired = cache_.sweep_expired();
    if (config_.download_cleanup_age.count() > 0) {
        report.downloads_cleaned = downloads_.cleanup_older_than(config_.download_cleanup_age);
    }
}

// ─────────────────────────────────────────────────────────────
// State and cursors
// ─────────────────────────────────────────────────────────────

void SyncOrchestrator::set_status(SyncStatus to, const std::string& error) {
    SyncStatus from;
    {
        std::lock_guard lock(state_mutex_);
        from = status_;
        status_ = to;
    }
    if (from != to) {
        bus_.emit(events::SyncStatusChangedEvent{from, to, error});
    }
}

SyncStatus SyncOrchestrator::status() const {
    std::lock_guard lock(state_mutex_);
    return status_;
}

std::size_t SyncOrchestrator::watch_status(std::function<void(const events::SyncStatusChangedEvent&)> callback) {
    return bus_.subscribe<events::SyncStatusChangedEvent>(std::move(callback));
}

void SyncOrchestrator::unwatch_status(std::size_t subscription) {
    bus_.unsubscribe<events::SyncStatusChangedEvent>(subscription);
}

std::optional<SyncReport> SyncOrchestrator::last_report() const {
    std::lock_guard lock(state_mutex_);
    return last_report_;
}

std::optional<Error> SyncOrchestrator::last_error() const {
    std::lock_guard lock(state_mutex_);
    return last_error_;
}

SyncCursor SyncOrchestrator::cursor(const std::string& collection) const {
    auto stored = store_.get_as<SyncCursor>(store::kCursorsCollection, collection);
    if (stored.is_ok()) {
        return stored.value();
    }
    if (stored.error().code != ErrorCode::NotFound) {
        // An unreadable cursor is treated as absent: the collection is re-pulled
        spdlog::warn("[Sync] cursor of {} unreadable, starting over: {}", collection, stored.error().message);
    }
    SyncCursor fresh;
    fresh.collection = collection;
    return fresh;
}

Result<void> SyncOrchestrator::reset_cursor(const std::string& collection) {
    auto removed = allow_not_found(store_.remove(store::kCursorsCollection, collection));
    if (removed.is_error()) {
        return removed;
    }
    spdlog::info("[Sync] cursor of {} reset", collection);
    return Ok();
}

Result<void> SyncOrchestrator::resync_from_scratch() {
    auto cleared = store_.clear_collection(store::kCursorsCollection);
    if (cleared.is_error()) {
        return cleared;
    }
    spdlog::info("[Sync] all cursors cleared; next sync pulls everything");
    return Ok();
}

Result<void> SyncOrchestrator::report_corruption(const std::string& collection, const std::string& id,
                                                 const std::string& reason) {
    auto moved = allow_not_found(store_.quarantine(collection, id, reason, clock_.now()));
    if (moved.is_error()) {
        return moved;
    }

    corrupt_records_ = true;
    {
        std::lock_guard lock(state_mutex_);
        last_error_ = Error{ErrorCode::CorruptLocalState, collection + "/" + id + ": " + reason};
    }
    bus_.emit(events::EntityQuarantinedEvent{collection, id, reason});
    return reset_cursor(collection);
}

} // namespace lsync::sync
