#pragma once

/**
 * @file engine.hpp
 * @brief Composition root and feature-facing API
 *
 * WHY THIS FILE EXISTS:
 * Feature code should not have to wire a store, a queue, a cache, a
 * download manager and an orchestrator together. SyncEngine owns one of
 * each, built from an EngineConfig, and exposes what the UI layer needs:
 * reading entities, recording mutations, downloads and sync status.
 *
 * WRITE PATH:
 * enqueue_action() applies the mutation to the local entity right away
 * (marking it dirty) and records the action, both in one transaction.
 * The orchestrator pushes it later.
 *
 * EXAMPLE:
 * ```cpp
 * lsync::sync::MemoryRemoteStore remote(lsync::system_clock());
 * lsync::download::FileAssetSource assets;
 * lsync::SyncEngine engine(config, remote, assets);
 * engine.start();
 *
 * engine.enqueue_action("progress", "lesson1", "merge", {{"percent", 40}});
 * auto view = engine.read("progress", "lesson1");   // dirty == true
 * engine.set_online(true);                          // debounced, then syncs
 * ```
 */

#include "lsync/cache/cache_engine.hpp"
#include "lsync/core/clock.hpp"
#include "lsync/core/config.hpp"
#include "lsync/core/result.hpp"
#include "lsync/download/asset_source.hpp"
#include "lsync/download/download_manager.hpp"
#include "lsync/events/components.hpp"
#include "lsync/events/event_bus.hpp"
#include "lsync/queue/action_queue.hpp"
#include "lsync/store/local_store.hpp"
#include "lsync/sync/orchestrator.hpp"
#include "lsync/sync/remote_store.hpp"

#include <cstdint>
#include <functional>
#include <future>
#include <string>

namespace lsync {

/// Local state of one entity plus the indicators the UI shows.
struct EntityView {
    store::EntityRecord record;
    bool dirty = false;   ///< Local changes not yet confirmed by the remote
    bool stale = false;   ///< Never synced, or last synced longer ago than stale_after
};

struct StorageInfo {
    std::uint64_t cache_bytes = 0;
    std::uint64_t cache_capacity = 0;
    std::size_t cache_entries = 0;
    download::DownloadStorageInfo downloads;
    std::size_t pending_actions = 0;
    std::size_t abandoned_actions = 0;
    std::size_t quarantined_records = 0;
};

class SyncEngine {
public:
    /// Opens the store at config.store.path; throws std::runtime_error if it cannot.
    SyncEngine(EngineConfig config,
               sync::RemoteStore& remote,
               download::AssetSource& assets,
               const Clock& clock = system_clock());

    ~SyncEngine();

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    /// Starts connectivity debouncing and the periodic sync timer.
    void start();
    void stop();

    /**
     * Read an entity from the local store.
     *
     * A record that no longer decodes is quarantined, its collection is
     * scheduled for a full re-pull and CorruptLocalState is returned.
     */
    Result<EntityView> read(const std::string& collection, const std::string& id);

    /// Called after every local, pulled or download-driven change of the entity.
    std::size_t watch(const std::string& collection, const std::string& id,
                      std::function<void(const events::EntityChangedEvent&)> callback);
    void unwatch(std::size_t subscription);

    /**
     * Record a mutation and apply it optimistically.
     *
     * kind "put" replaces the entity document, "merge" overwrites the
     * listed field groups, "delete" removes the entity. Other kinds are
     * only recorded.
     *
     * @return the action id
     */
    Result<std::string> enqueue_action(const std::string& collection,
                                       const std::string& id,
                                       const std::string& kind,
                                       nlohmann::json payload = nlohmann::json::object(),
                                       std::int32_t priority = 0);

    Result<std::string> fetch_cached(const std::string& key,
                                     std::int32_t priority,
                                     const cache::CacheLoader& loader,
                                     std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    Result<std::string> start_download(const std::string& resource_key,
                                       const std::string& source_url,
                                       const std::string& destination,
                                       const std::string& quality = {},
                                       const std::string& expected_checksum = {});
    Result<void> pause_download(const std::string& task_id);
    Result<void> resume_download(const std::string& task_id);
    Result<void> cancel_download(const std::string& task_id);
    Result<download::ProgressStream> download_progress(const std::string& task_id);

    std::shared_future<sync::SyncReport> request_sync();

    sync::SyncStatus sync_status() const;
    std::size_t watch_sync_status(std::function<void(const events::SyncStatusChangedEvent&)> callback);
    void unwatch_sync_status(std::size_t subscription);

    /// Connectivity signal from the platform; debounced by the orchestrator.
    void set_online(bool online);

    StorageInfo storage_info() const;

    store::LocalStore& store() { return store_; }
    events::EventBus& bus() { return bus_; }
    cache::CacheEngine& cache() { return cache_; }
    queue::ActionQueue& actions() { return queue_; }
    download::DownloadManager& downloads() { return downloads_; }
    sync::SyncOrchestrator& orchestrator() { return orchestrator_; }
    const events::MetricsComponent& metrics() const { return metrics_; }

private:
    Result<std::vector<store::StoreOp>> optimistic_ops(const std::string& collection,
                                                       const std::string& id,
                                                       const std::string& kind,
                                                       const nlohmann::json& payload,
                                                       bool& deleted);

    EngineConfig config_;
    const Clock& clock_;

    events::EventBus bus_;
    events::LoggerComponent logger_;
    events::MetricsComponent metrics_;

    store::LocalStore store_;
    cache::CacheEngine cache_;
    queue::ActionQueue queue_;
    download::DownloadManager downloads_;
    sync::SyncOrchestrator orchestrator_;
};

} // namespace lsync
