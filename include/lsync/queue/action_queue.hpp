#pragma once

/**
 * @file action_queue.hpp
 * @brief Durable log of mutations waiting to reach the remote store
 *
 * WHY THIS FILE EXISTS:
 * Every user-driven mutation is recorded here first, online or not. The
 * sync orchestrator replays the log against the remote with drain().
 *
 * ORDERING:
 * Actions on the same target_key are applied strictly in enqueue order.
 * Once one of them fails, the rest of that key waits for the next drain,
 * so a later mutation can never overtake an earlier one. Independent keys
 * drain concurrently, bounded by QueueConfig::concurrency.
 *
 * FAILURE HANDLING:
 * - Failure: retry_count++, last_error recorded, next attempt gated by
 *   exponential backoff (base * 2^(retries-1), capped)
 * - retry_count > max_retries, or older than max_action_age: the action
 *   becomes Abandoned and stays visible through abandoned()
 * - ErrorCode::Conflict: the remote version wins; the action is removed
 *   and a ConflictResolvedEvent is emitted
 */

#include "lsync/core/clock.hpp"
#include "lsync/core/config.hpp"
#include "lsync/core/result.hpp"
#include "lsync/events/event_bus.hpp"
#include "lsync/queue/action.hpp"
#include "lsync/store/local_store.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace lsync::queue {

using ApplyFn = std::function<Result<void>(const OfflineAction&)>;

class ActionQueue {
public:
    ActionQueue(store::LocalStore& store, events::EventBus& bus, const Clock& clock, QueueConfig config);

    ActionQueue(const ActionQueue&) = delete;
    ActionQueue& operator=(const ActionQueue&) = delete;

    /**
     * Record an action.
     *
     * id, seq, created_at and the retry bookkeeping are assigned here; the
     * caller supplies kind, target_key, payload and priority. extra_ops are
     * committed in the same transaction (used for the optimistic local
     * apply of the mutation).
     *
     * @return the new action id
     */
    Result<std::string> enqueue(OfflineAction action, std::vector<store::StoreOp> extra_ops = {});

    /**
     * Replay pending actions through apply.
     *
     * Only one drain runs at a time; a concurrent call waits for it.
     * Draining an empty queue is a no-op.
     *
     * @param cancel checked before each action; remaining actions are
     *               left pending and counted as skipped
     */
    DrainReport drain(const ApplyFn& apply, const std::atomic<bool>* cancel = nullptr);

    std::size_t pending_count() const;

    /// Pending actions in FIFO order.
    std::vector<OfflineAction> pending() const;

    std::vector<OfflineAction> pending_for(const std::string& target_key) const;

    std::vector<OfflineAction> abandoned() const;

    /// Abandoned -> pending with the retry count reset.
    Result<void> requeue(const std::string& action_id);

    /// Explicitly removes an abandoned action.
    Result<void> discard(const std::string& action_id);

    Result<OfflineAction> get(const std::string& action_id) const;

private:
    std::vector<OfflineAction> load(ActionState state) const;

    std::chrono::milliseconds backoff_for(std::uint32_t retry_count) const;

    void drain_key(const std::vector<OfflineAction>& group,
                   const ApplyFn& apply,
                   const std::atomic<bool>* cancel,
                   Timestamp now,
                   DrainReport& report,
                   std::mutex& report_mutex);

    Result<void> abandon(OfflineAction& action, const std::string& reason, DrainReport& report,
                         std::mutex& report_mutex);

    store::LocalStore& store_;
    events::EventBus& bus_;
    const Clock& clock_;
    QueueConfig config_;

    std::mutex enqueue_mutex_;
    std::uint64_t next_seq_ = 1;
    std::mutex drain_mutex_;
};

} // namespace lsync::queue
