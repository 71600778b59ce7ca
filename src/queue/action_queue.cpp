#include "lsync/queue/action_queue.hpp"

#include "lsync/events/events.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>

namespace lsync::queue {

namespace asio = boost::asio;

namespace {

constexpr const char* kNextSeqId = "next_seq";

void add_applied_key(DrainReport& report, const std::string& key) {
    if (std::find(report.applied_keys.begin(), report.applied_keys.end(), key) == report.applied_keys.end()) {
        report.applied_keys.push_back(key);
    }
}

} // namespace

ActionQueue::ActionQueue(store::LocalStore& store, events::EventBus& bus, const Clock& clock, QueueConfig config)
    : store_(store), bus_(bus), clock_(clock), config_(config) {
    std::uint64_t max_seq = 0;
    for (const auto& action : load(ActionState::Pending)) {
        max_seq = std::max(max_seq, action.seq);
    }
    for (const auto& action : load(ActionState::Abandoned)) {
        max_seq = std::max(max_seq, action.seq);
    }
    next_seq_ = max_seq + 1;

    // Ids must not repeat after the log drains empty; the remote dedupes by id
    auto stored = store_.get(store::kQueueStateCollection, kNextSeqId);
    if (stored.is_ok() && stored.value().contains("nextSeq") && stored.value().at("nextSeq").is_number_unsigned()) {
        next_seq_ = std::max(next_seq_, stored.value().at("nextSeq").get<std::uint64_t>());
    }
    spdlog::debug("[Queue] opened with next_seq={}", next_seq_);
}

Result<std::string> ActionQueue::enqueue(OfflineAction action, std::vector<store::StoreOp> extra_ops) {
    if (action.kind.empty()) {
        return Err<std::string>(ErrorCode::InvalidArgument, "action kind must not be empty");
    }
    if (action.target_key.empty()) {
        return Err<std::string>(ErrorCode::InvalidArgument, "action target key must not be empty");
    }

    {
        std::lock_guard lock(enqueue_mutex_);
        action.seq = next_seq_;
        action.id = make_action_id(action.seq);
        action.created_at = clock_.now();
        action.last_attempt_at = 0;
        action.next_attempt_at = 0;
        action.retry_count = 0;
        action.last_error.clear();
        action.last_error_code.reset();
        action.state = ActionState::Pending;

        extra_ops.push_back(store::StoreOp::put(store::kActionsCollection, action.id, nlohmann::json(action)));
        extra_ops.push_back(store::StoreOp::put(store::kQueueStateCollection, kNextSeqId,
                                                nlohmann::json{{"nextSeq", next_seq_ + 1}}));
        auto committed = store_.transact(extra_ops);
        if (committed.is_error()) {
            return Err<std::string>(committed.error());
        }
        ++next_seq_;
    }

    bus_.emit(events::ActionEnqueuedEvent{action.id, action.kind, action.target_key});
    return Ok(action.id);
}

DrainReport ActionQueue::drain(const ApplyFn& apply, const std::atomic<bool>* cancel) {
    std::lock_guard drain_lock(drain_mutex_);

    DrainReport report;
    std::mutex report_mutex;
    const Timestamp now = clock_.now();

    auto actions = load(ActionState::Pending);
    if (actions.empty()) {
        return report;
    }

    // Group per key, keeping FIFO order inside each group
    std::map<std::string, std::vector<OfflineAction>> by_key;
    for (auto& action : actions) {
        if (config_.max_action_age.count() > 0 && now - action.created_at > config_.max_action_age.count()) {
            auto abandoned = abandon(action, "action exceeded maximum queue age", report, report_mutex);
            if (abandoned.is_error()) {
                spdlog::error("[Queue] could not abandon {}: {}", action.id, abandoned.error().message);
            }
            continue;
        }
        by_key[action.target_key].push_back(std::move(action));
    }

    std::vector<std::vector<OfflineAction>> groups;
    groups.reserve(by_key.size());
    for (auto& [key, group] : by_key) {
        groups.push_back(std::move(group));
    }
    std::sort(groups.begin(), groups.end(), [](const auto& a, const auto& b) {
        if (a.front().priority != b.front().priority) {
            return a.front().priority > b.front().priority;
        }
        return a.front().seq < b.front().seq;
    });

    spdlog::debug("[Queue] draining actions={} keys={}", actions.size(), groups.size());

    asio::thread_pool pool(std::max<std::size_t>(1, std::min(config_.concurrency, groups.size())));
    for (const auto& group : groups) {
        asio::post(pool, [this, &group, &apply, cancel, now, &report, &report_mutex]() {
            drain_key(group, apply, cancel, now, report, report_mutex);
        });
    }
    pool.join();

    spdlog::info("[Queue] drain finished succeeded={} retried={} conflicts={} skipped={} abandoned={}",
                 report.succeeded, report.retried, report.conflicts, report.skipped, report.abandoned.size());
    return report;
}

void ActionQueue::drain_key(const std::vector<OfflineAction>& group,
                            const ApplyFn& apply,
                            const std::atomic<bool>* cancel,
                            Timestamp now,
                            DrainReport& report,
                            std::mutex& report_mutex) {
    for (std::size_t i = 0; i < group.size(); ++i) {
        const std::size_t remaining = group.size() - i;
        OfflineAction action = group[i];

        if ((cancel && cancel->load()) || action.next_attempt_at > now) {
            std::lock_guard lock(report_mutex);
            report.skipped += remaining;
            return;
        }

        auto applied = apply(action);
        if (applied.is_ok() || applied.error().code == ErrorCode::Conflict) {
            auto removed = store_.remove(store::kActionsCollection, action.id);
            if (removed.is_error()) {
                // The action may be replayed next drain; the remote contract is idempotent
                spdlog::error("[Queue] applied {} but could not remove it: {}", action.id, removed.error().message);
                std::lock_guard lock(report_mutex);
                report.last_error = removed.error();
                report.skipped += remaining - 1;
                return;
            }

            if (applied.is_ok()) {
                {
                    std::lock_guard lock(report_mutex);
                    report.succeeded++;
                    add_applied_key(report, action.target_key);
                }
                bus_.emit(events::ActionAppliedEvent{action.id, action.target_key});
            } else {
                spdlog::info("[Queue] conflict on {} for {}; remote version kept: {}",
                             action.target_key, action.id, applied.error().message);
                {
                    std::lock_guard lock(report_mutex);
                    report.conflicts++;
                    add_applied_key(report, action.target_key);
                    if (std::find(report.conflict_keys.begin(), report.conflict_keys.end(), action.target_key) ==
                        report.conflict_keys.end()) {
                        report.conflict_keys.push_back(action.target_key);
                    }
                }
                events::ConflictResolvedEvent resolved;
                resolved.target_key = action.target_key;
                resolved.strategy = events::ConflictResolutionStrategy::LastWriteWins;
                resolved.winner = "remote";
                bus_.emit(resolved);
            }
            continue;
        }

        const Error& error = applied.error();
        action.retry_count++;
        action.last_attempt_at = now;
        action.last_error = error.message;
        action.last_error_code = error.code;

        if (action.retry_count > config_.max_retries) {
            auto abandoned = abandon(action, error.message, report, report_mutex);
            if (abandoned.is_error()) {
                spdlog::error("[Queue] could not abandon {}: {}", action.id, abandoned.error().message);
            }
        } else {
            action.next_attempt_at = now + backoff_for(action.retry_count).count();
            auto saved = store_.put_as(store::kActionsCollection, action.id, action);
            if (saved.is_error()) {
                spdlog::error("[Queue] could not record failure of {}: {}", action.id, saved.error().message);
            }
            spdlog::warn("[Queue] {} on {} failed (attempt {}): {}",
                         action.id, action.target_key, action.retry_count, error.message);
            std::lock_guard lock(report_mutex);
            report.retried++;
        }

        std::lock_guard lock(report_mutex);
        report.last_error = error;
        report.skipped += remaining - 1;
        return;
    }
}

Result<void> ActionQueue::abandon(OfflineAction& action, const std::string& reason, DrainReport& report,
                                  std::mutex& report_mutex) {
    action.state = ActionState::Abandoned;
    if (action.last_error.empty()) {
        action.last_error = reason;
        action.last_error_code = ErrorCode::Abandoned;
    }
    auto saved = store_.put_as(store::kActionsCollection, action.id, action);
    if (saved.is_error()) {
        return saved;
    }

    spdlog::warn("[Queue] abandoned {} on {} after {} retries: {}",
                 action.id, action.target_key, action.retry_count, reason);
    {
        std::lock_guard lock(report_mutex);
        report.abandoned.push_back(action);
    }
    bus_.emit(events::ActionAbandonedEvent{action.id, action.target_key, action.retry_count, action.last_error});
    return Ok();
}

std::chrono::milliseconds ActionQueue::backoff_for(std::uint32_t retry_count) const {
    if (retry_count == 0 || config_.backoff_base.count() <= 0) {
        return std::chrono::milliseconds{0};
    }
    const auto cap = config_.backoff_max.count();
    auto delay = config_.backoff_base.count();
    for (std::uint32_t i = 1; i < retry_count && delay < cap; ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds{std::min(delay, cap)};
}

std::size_t ActionQueue::pending_count() const {
    return load(ActionState::Pending).size();
}

std::vector<OfflineAction> ActionQueue::pending() const {
    return load(ActionState::Pending);
}

std::vector<OfflineAction> ActionQueue::pending_for(const std::string& target_key) const {
    auto actions = load(ActionState::Pending);
    actions.erase(std::remove_if(actions.begin(), actions.end(),
                                 [&](const OfflineAction& a) { return a.target_key != target_key; }),
                  actions.end());
    return actions;
}

std::vector<OfflineAction> ActionQueue::abandoned() const {
    return load(ActionState::Abandoned);
}

Result<OfflineAction> ActionQueue::get(const std::string& action_id) const {
    return store_.get_as<OfflineAction>(store::kActionsCollection, action_id);
}

Result<void> ActionQueue::requeue(const std::string& action_id) {
    auto action = get(action_id);
    if (action.is_error()) {
        return Err<void>(action.error());
    }
    auto& value = action.value();
    if (value.state != ActionState::Abandoned) {
        return Err<void>(ErrorCode::InvalidState, "Action is not abandoned: " + action_id);
    }
    value.state = ActionState::Pending;
    value.retry_count = 0;
    value.next_attempt_at = 0;
    spdlog::info("[Queue] requeued {} on {}", value.id, value.target_key);
    return store_.put_as(store::kActionsCollection, value.id, value);
}

Result<void> ActionQueue::discard(const std::string& action_id) {
    auto action = get(action_id);
    if (action.is_error()) {
        return Err<void>(action.error());
    }
    if (action.value().state != ActionState::Abandoned) {
        return Err<void>(ErrorCode::InvalidState, "Only abandoned actions can be discarded: " + action_id);
    }
    spdlog::info("[Queue] discarded {} on {}", action_id, action.value().target_key);
    return store_.remove(store::kActionsCollection, action_id);
}

std::vector<OfflineAction> ActionQueue::load(ActionState state) const {
    std::vector<OfflineAction> actions;
    std::vector<std::string> damaged;

    auto cursor = store_.scan(store::kActionsCollection);
    while (auto record = cursor.next()) {
        try {
            auto action = record->body.get<OfflineAction>();
            if (action.state == state) {
                actions.push_back(std::move(action));
            }
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("[Queue] undecodable action {}: {}", record->id, e.what());
            damaged.push_back(record->id);
        }
    }
    for (const auto& id : cursor.corrupt_ids()) {
        damaged.push_back(id);
    }
    for (const auto& id : damaged) {
        auto moved = store_.quarantine(store::kActionsCollection, id, "undecodable action", clock_.now());
        if (moved.is_error()) {
            spdlog::error("[Queue] could not quarantine action {}: {}", id, moved.error().message);
        }
    }

    std::sort(actions.begin(), actions.end(),
              [](const OfflineAction& a, const OfflineAction& b) { return a.seq < b.seq; });
    return actions;
}

} // namespace lsync::queue
