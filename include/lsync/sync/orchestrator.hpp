#pragma once

/**
 * @file orchestrator.hpp
 * @brief Top-level coordinator of push, pull and maintenance
 *
 * WHY THIS FILE EXISTS:
 * Something has to decide when the offline log is replayed, when remote
 * changes are pulled, and how the two are reconciled. That is the only
 * job of this class; storage, queueing, caching and transfers stay in
 * their own components.
 *
 * SYNC SEQUENCE (one run):
 * 1. Drain the action queue against the remote (failures stay queued)
 * 2. Pull each configured collection page by page from its cursor
 * 3. Write each page and its advanced cursor in one store transaction
 * 4. Invalidate cached data derived from the changed entities
 * 5. Maintenance: TTL sweep, optional cleanup of old downloads
 *
 * STATE MACHINE:
 * idle -> syncing -> idle, or -> error when a pull or its transaction
 * failed. Runs are single-flight: sync_now() during a run returns the
 * running run's future.
 *
 * TRIGGERS:
 * - Offline -> online transition (debounced on an Asio timer)
 * - Periodic timer while online
 * - Explicit sync_now() / run_sync()
 */

#include "lsync/cache/cache_engine.hpp"
#include "lsync/core/clock.hpp"
#include "lsync/core/config.hpp"
#include "lsync/core/result.hpp"
#include "lsync/download/download_manager.hpp"
#include "lsync/events/event_bus.hpp"
#include "lsync/events/events.hpp"
#include "lsync/queue/action_queue.hpp"
#include "lsync/store/local_store.hpp"
#include "lsync/sync/remote_store.hpp"
#include "lsync/sync/types.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lsync::sync {

class SyncOrchestrator {
public:
    SyncOrchestrator(store::LocalStore& store,
                     queue::ActionQueue& queue,
                     cache::CacheEngine& cache,
                     download::DownloadManager& downloads,
                     RemoteStore& remote,
                     events::EventBus& bus,
                     const Clock& clock,
                     SyncConfig config);

    ~SyncOrchestrator();

    SyncOrchestrator(const SyncOrchestrator&) = delete;
    SyncOrchestrator& operator=(const SyncOrchestrator&) = delete;

    /// Starts the timer thread (connectivity debounce and periodic sync).
    void start();

    /// Stops the timers and waits for a running sync to finish.
    void stop();

    /**
     * Request a sync.
     *
     * If a run is already in progress the request is coalesced into it
     * and its future is returned.
     */
    std::shared_future<SyncReport> sync_now(SyncTrigger trigger = SyncTrigger::Manual);

    /// Blocking form of sync_now().
    SyncReport run_sync(SyncTrigger trigger = SyncTrigger::Manual);

    /**
     * Ask the running sync to stop at the next page boundary.
     *
     * Committed pages stay committed; no cursor moves past them.
     */
    void cancel_sync();

    /**
     * Feed the connectivity signal.
     *
     * The value must stay unchanged for connectivity_debounce before it
     * takes effect. Going online resumes interrupted downloads and starts
     * a sync.
     */
    void set_online(bool online);

    bool online() const { return online_.load(); }

    SyncStatus status() const;

    std::size_t watch_status(std::function<void(const events::SyncStatusChangedEvent&)> callback);
    void unwatch_status(std::size_t subscription);

    std::optional<SyncReport> last_report() const;
    std::optional<Error> last_error() const;

    /// Set once any local record had to be quarantined.
    bool corrupt_records() const { return corrupt_records_.load(); }

    /// Clears every cursor so the next sync pulls all collections from the start.
    Result<void> resync_from_scratch();

    Result<void> reset_cursor(const std::string& collection);

    SyncCursor cursor(const std::string& collection) const;

    /**
     * Quarantine a record that could not be decoded and reset its
     * collection cursor so the next sync re-pulls it.
     */
    Result<void> report_corruption(const std::string& collection, const std::string& id, const std::string& reason);

    /**
     * Serializes local entity writes against pulled-page application.
     *
     * Callers that read-modify-write an entity record hold this for the
     * duration of the write.
     */
    std::unique_lock<std::mutex> lock_entities() { return std::unique_lock<std::mutex>(entity_mutex_); }

private:
    SyncReport execute(SyncTrigger trigger);

    void push_phase(SyncReport& report);
    void pull_phase(SyncReport& report);
    Result<void> apply_page(const std::string& collection, const PullBatch& batch, SyncCursor& cursor,
                            SyncReport& report);
    void maintenance_phase(SyncReport& report);

    void mark_clean(const std::vector<std::string>& keys);

    void set_status(SyncStatus to, const std::string& error = {});
    void apply_connectivity(bool online);
    void schedule_periodic();

    store::LocalStore& store_;
    queue::ActionQueue& queue_;
    cache::CacheEngine& cache_;
    download::DownloadManager& downloads_;
    RemoteStore& remote_;
    events::EventBus& bus_;
    const Clock& clock_;
    SyncConfig config_;

    mutable std::mutex state_mutex_;
    SyncStatus status_ = SyncStatus::Idle;
    std::optional<SyncReport> last_report_;
    std::optional<Error> last_error_;
    std::optional<std::shared_future<SyncReport>> in_flight_;

    std::mutex entity_mutex_;
    std::atomic<bool> online_{false};
    std::atomic<bool> desired_online_{false};
    std::atomic<bool> cancel_requested_{false};
    std::atomic<bool> corrupt_records_{false};

    boost::asio::io_context io_;
    boost::asio::steady_timer debounce_timer_;
    boost::asio::steady_timer periodic_timer_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    std::thread io_thread_;
    std::atomic<bool> timers_running_{false};

    boost::asio::thread_pool sync_pool_{1};
};

} // namespace lsync::sync
