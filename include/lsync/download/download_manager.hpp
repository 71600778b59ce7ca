#pragma once

/**
 * @file download_manager.hpp
 * @brief Resumable transfers of large assets into local storage
 *
 * WHY THIS FILE EXISTS:
 * Lessons reference videos and PDFs that must be playable offline. The
 * manager streams them to disk with pause/resume/cancel and writes the
 * local path back into the owning entity once the file is complete.
 *
 * FILE LIFECYCLE:
 * 1. Bytes are appended to "<destination>.part"
 * 2. On completion the size (and checksum, when known) is verified
 * 3. The staging file is renamed onto the destination
 * The destination therefore only ever holds a complete file. Cancellation
 * and unrecoverable failures delete the staging file; a transient failure
 * on a range-capable source keeps it so resume() can continue.
 *
 * CONCURRENCY:
 * Transfers run on a Boost.Asio thread pool sized by max_concurrent.
 * Pause and cancel are cooperative and honoured at chunk boundaries.
 *
 * One task exists per resource key: start() on a key whose task is
 * queued, running or paused returns that task instead of a new one.
 *
 * A task leaves the worker (running = false) in the same critical section
 * that records its final status, so a resume() issued from a state-change
 * handler always starts a fresh run.
 *
 * ENTITY WRITE-BACK:
 * Updating local_path on the owning entity is a read-modify-write. The
 * optional EntityLock serializes it with every other writer of entity
 * records (the sync orchestrator and the engine's optimistic writes).
 */

#include "lsync/core/clock.hpp"
#include "lsync/core/config.hpp"
#include "lsync/core/result.hpp"
#include "lsync/download/asset_source.hpp"
#include "lsync/download/progress_stream.hpp"
#include "lsync/download/types.hpp"
#include "lsync/events/event_bus.hpp"
#include "lsync/store/local_store.hpp"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lsync::download {

/// Acquires the lock that guards entity records for a read-modify-write.
using EntityLock = std::function<std::unique_lock<std::mutex>()>;

class DownloadManager {
public:
    DownloadManager(store::LocalStore& store, events::EventBus& bus, AssetSource& source,
                    const Clock& clock, DownloadConfig config, EntityLock entity_lock = {});

    /// Same as shutdown().
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    /**
     * Pause running transfers (keeping their staging files), wait for the
     * workers and end every open progress stream. Tasks started afterwards
     * stay queued until the next process reloads them.
     */
    void shutdown();

    /**
     * Start (or attach to) the download of resource_key.
     *
     * Fails fast with QuotaExceeded when the probed size does not fit the
     * configured quota or the free space on the destination volume. Bytes
     * already reserved by queued, running and paused tasks count as used.
     *
     * @param expected_checksum optional FNV-1a hex of the whole asset
     * @return the task id
     */
    Result<std::string> start(const std::string& resource_key,
                              const std::string& source_url,
                              const std::string& destination,
                              const std::string& quality = {},
                              const std::string& expected_checksum = {});

    Result<void> pause(const std::string& task_id);

    /**
     * Continue a paused or failed task.
     *
     * A failed task continues from its staging file when the source
     * supports ranges; otherwise it starts over.
     */
    Result<void> resume(const std::string& task_id);

    Result<void> cancel(const std::string& task_id);

    /// failed | cancelled -> queued, starting from byte 0.
    Result<void> retry(const std::string& task_id);

    /// Resumes transiently failed tasks and tasks interrupted by a restart.
    std::size_t resume_interrupted();

    Result<ProgressStream> progress_of(const std::string& task_id);

    Result<DownloadTask> task(const std::string& task_id) const;

    std::vector<DownloadTask> tasks() const;

    /**
     * Delete completed files older than age.
     *
     * The owning entities lose their local path and available-offline
     * flag; the task records are removed.
     */
    std::size_t cleanup_older_than(std::chrono::milliseconds age);

    DownloadStorageInfo storage_info() const;

    /// Blocks until no transfer is queued or running and every final event was delivered.
    void wait_idle();

    static std::string make_task_id(const std::string& resource_key);

private:
    struct TaskState {
        DownloadTask task;
        bool running = false;       ///< Posted to the pool and not yet finished
        bool interrupted = false;   ///< Reloaded as paused after a restart
        std::atomic<bool> pause_requested{false};
        std::atomic<bool> cancel_requested{false};
        Timestamp last_progress_at = 0;
        double last_progress_percent = -1.0;
        std::vector<std::weak_ptr<ProgressQueue>> subscribers;
    };

    using StatePtr = std::shared_ptr<TaskState>;

    struct Transition {
        DownloadTask task;
        DownloadStatus from;
    };

    /// What a worker announces after leaving a task; built under mutex_.
    struct Settled {
        std::optional<Transition> transition;
        ProgressSnapshot snapshot;
        std::vector<std::weak_ptr<ProgressQueue>> subscribers;
        bool close_streams = false;
    };

    void load_registry();

    void run(const StatePtr& state);
    Result<void> transfer(const StatePtr& state);
    bool interrupt_requested(const TaskState& state) const;
    void wait_backoff(const TaskState& state, std::chrono::milliseconds delay) const;
    void release(const StatePtr& state);

    void finish_completed(const StatePtr& state);
    void finish_paused(const StatePtr& state);
    void finish_cancelled(const StatePtr& state);
    void finish_failed(const StatePtr& state, const Error& error, bool keep_staging);
    void announce(const Settled& settled, const std::string& error = {});

    // Caller holds mutex_
    Result<Transition> transition_locked(TaskState& state, DownloadStatus to);
    Settled settle_locked(TaskState& state, DownloadStatus to);
    Settled cancel_locked(TaskState& state);
    void persist_locked(const TaskState& state);
    void schedule_locked(const StatePtr& state);
    StatePtr find_locked(const std::string& task_id) const;
    Result<void> check_quota_locked(const std::string& task_id, const std::string& destination,
                                    std::uint64_t incoming_bytes) const;

    void publish_transition(const Transition& transition, const std::string& error = {});
    void publish_progress(const StatePtr& state, bool force);

    Result<void> write_back_entity(const DownloadTask& task, bool available);

    std::chrono::milliseconds backoff_for(std::uint32_t attempt) const;

    store::LocalStore& store_;
    events::EventBus& bus_;
    AssetSource& source_;
    const Clock& clock_;
    DownloadConfig config_;
    EntityLock entity_lock_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::size_t announcing_ = 0;   ///< Settled tasks whose events are still being delivered
    std::unordered_map<std::string, StatePtr> tasks_;
    std::unordered_map<std::string, std::string> by_resource_;
    std::atomic<bool> shutting_down_{false};

    boost::asio::thread_pool pool_;
};

} // namespace lsync::download
