#include "lsync/queue/action_queue.hpp"
#include "lsync/events/events.hpp"
#include "lsync/sync/memory_remote_store.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

using lsync::ErrorCode;
using lsync::ManualClock;
using lsync::QueueConfig;
using lsync::Result;
using lsync::events::ActionAbandonedEvent;
using lsync::events::ConflictResolvedEvent;
using lsync::events::EventBus;
using lsync::queue::ActionQueue;
using lsync::queue::ActionState;
using lsync::queue::OfflineAction;
using lsync::store::LocalStore;
using lsync::sync::MemoryRemoteStore;

namespace {

OfflineAction make_action(const std::string& key, nlohmann::json payload, const std::string& kind = "put",
                          std::int32_t priority = 0) {
    OfflineAction action;
    action.kind = kind;
    action.target_key = key;
    action.payload = std::move(payload);
    action.priority = priority;
    return action;
}

class ActionQueueTest : public ::testing::Test {
protected:
    ActionQueueTest() : store_(":memory:") {
        config_.max_retries = 2;
        config_.concurrency = 4;
        config_.backoff_base = std::chrono::milliseconds(0);
    }

    LocalStore store_;
    EventBus bus_;
    ManualClock clock_;
    QueueConfig config_;
};

} // namespace

TEST_F(ActionQueueTest, EnqueueAssignsIdsAndPersists) {
    ActionQueue queue(store_, bus_, clock_, config_);

    auto first = queue.enqueue(make_action("progress/lesson1", {{"percent", 10}}));
    auto second = queue.enqueue(make_action("progress/lesson1", {{"percent", 20}}));
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_LT(first.value(), second.value());

    auto stored = queue.get(first.value());
    ASSERT_TRUE(stored.is_ok());
    EXPECT_EQ(stored.value().created_at, clock_.now());
    EXPECT_EQ(stored.value().state, ActionState::Pending);
    EXPECT_EQ(queue.pending_count(), 2u);
}

TEST_F(ActionQueueTest, EnqueueRejectsMissingFields) {
    ActionQueue queue(store_, bus_, clock_, config_);

    auto no_kind = queue.enqueue(make_action("progress/lesson1", {}, ""));
    ASSERT_TRUE(no_kind.is_error());
    EXPECT_EQ(no_kind.error().code, ErrorCode::InvalidArgument);

    auto no_key = queue.enqueue(make_action("", {}));
    ASSERT_TRUE(no_key.is_error());
    EXPECT_EQ(queue.pending_count(), 0u);
}

TEST_F(ActionQueueTest, ExtraOpsCommitWithTheAction) {
    ActionQueue queue(store_, bus_, clock_, config_);

    auto id = queue.enqueue(make_action("courses/c1", {{"title", "x"}}),
                            {lsync::store::StoreOp::put("courses", "c1", {{"title", "x"}})});
    ASSERT_TRUE(id.is_ok());
    EXPECT_TRUE(store_.exists("courses", "c1"));

    auto rejected = queue.enqueue(make_action("courses/c2", {{"title", "y"}}),
                                  {lsync::store::StoreOp::put("courses", "", {{"title", "y"}})});
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(queue.pending_count(), 1u);
}

TEST_F(ActionQueueTest, DrainAppliesFifoPerKey) {
    ActionQueue queue(store_, bus_, clock_, config_);

    for (int i = 0; i < 20; ++i) {
        const std::string key = "progress/lesson" + std::to_string(i % 4);
        ASSERT_TRUE(queue.enqueue(make_action(key, {{"n", i}})).is_ok());
    }

    std::mutex mutex;
    std::map<std::string, std::vector<int>> applied;
    auto report = queue.drain([&](const OfflineAction& action) -> Result<void> {
        std::lock_guard lock(mutex);
        applied[action.target_key].push_back(action.payload.at("n").get<int>());
        return lsync::Ok();
    });

    EXPECT_EQ(report.succeeded, 20u);
    EXPECT_EQ(queue.pending_count(), 0u);
    ASSERT_EQ(applied.size(), 4u);
    for (const auto& [key, values] : applied) {
        ASSERT_EQ(values.size(), 5u) << key;
        for (std::size_t i = 1; i < values.size(); ++i) {
            EXPECT_LT(values[i - 1], values[i]) << key;
        }
    }
}

TEST_F(ActionQueueTest, DrainOnEmptyQueueIsNoOp) {
    ActionQueue queue(store_, bus_, clock_, config_);

    int calls = 0;
    auto apply = [&](const OfflineAction&) -> Result<void> {
        ++calls;
        return lsync::Ok();
    };

    const auto revision = store_.revision();
    auto first = queue.drain(apply);
    auto second = queue.drain(apply);

    EXPECT_TRUE(first.empty());
    EXPECT_TRUE(second.empty());
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(store_.revision(), revision);
}

TEST_F(ActionQueueTest, FailureBlocksLaterActionsOfSameKeyOnly) {
    ActionQueue queue(store_, bus_, clock_, config_);

    ASSERT_TRUE(queue.enqueue(make_action("progress/a", {{"n", 1}})).is_ok());
    ASSERT_TRUE(queue.enqueue(make_action("progress/a", {{"n", 2}})).is_ok());
    ASSERT_TRUE(queue.enqueue(make_action("progress/b", {{"n", 3}})).is_ok());

    std::mutex mutex;
    std::vector<int> attempted;
    auto report = queue.drain([&](const OfflineAction& action) -> Result<void> {
        std::lock_guard lock(mutex);
        attempted.push_back(action.payload.at("n").get<int>());
        if (action.target_key == "progress/a") {
            return lsync::Err<void>(ErrorCode::TransientNetwork, "timeout");
        }
        return lsync::Ok();
    });

    EXPECT_EQ(report.succeeded, 1u);
    EXPECT_EQ(report.retried, 1u);
    EXPECT_EQ(report.skipped, 1u);
    ASSERT_TRUE(report.last_error.has_value());
    EXPECT_EQ(std::count(attempted.begin(), attempted.end(), 2), 0);

    auto pending = queue.pending_for("progress/a");
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0].retry_count, 1u);
    EXPECT_EQ(pending[0].last_error, "timeout");
    EXPECT_EQ(pending[0].last_error_code, ErrorCode::TransientNetwork);
    EXPECT_EQ(pending[1].retry_count, 0u);
}

TEST_F(ActionQueueTest, AbandonsAfterMaxRetries) {
    ActionQueue queue(store_, bus_, clock_, config_);
    std::vector<ActionAbandonedEvent> abandoned_events;
    bus_.subscribe<ActionAbandonedEvent>([&](const ActionAbandonedEvent& e) { abandoned_events.push_back(e); });

    auto id = queue.enqueue(make_action("progress/a", {{"n", 1}}));
    ASSERT_TRUE(id.is_ok());

    auto failing = [](const OfflineAction&) -> Result<void> {
        return lsync::Err<void>(ErrorCode::TransientNetwork, "still down");
    };

    // max_retries = 2: attempts 1 and 2 are retried, attempt 3 abandons
    EXPECT_EQ(queue.drain(failing).retried, 1u);
    EXPECT_EQ(queue.drain(failing).retried, 1u);
    auto last = queue.drain(failing);
    ASSERT_EQ(last.abandoned.size(), 1u);
    EXPECT_EQ(last.abandoned[0].id, id.value());

    EXPECT_EQ(queue.pending_count(), 0u);
    auto abandoned = queue.abandoned();
    ASSERT_EQ(abandoned.size(), 1u);
    EXPECT_EQ(abandoned[0].state, ActionState::Abandoned);
    EXPECT_EQ(abandoned[0].retry_count, 3u);
    EXPECT_EQ(abandoned[0].last_error, "still down");
    ASSERT_EQ(abandoned_events.size(), 1u);
    EXPECT_EQ(abandoned_events[0].target_key, "progress/a");

    // Abandoned actions are not drained again
    EXPECT_TRUE(queue.drain(failing).empty());
}

TEST_F(ActionQueueTest, RequeueAndDiscardAbandoned) {
    config_.max_retries = 0;
    ActionQueue queue(store_, bus_, clock_, config_);

    auto first = queue.enqueue(make_action("progress/a", {{"n", 1}}));
    auto second = queue.enqueue(make_action("progress/b", {{"n", 2}}));
    queue.drain([](const OfflineAction&) -> Result<void> {
        return lsync::Err<void>(ErrorCode::InvalidArgument, "rejected");
    });
    ASSERT_EQ(queue.abandoned().size(), 2u);

    auto not_abandoned = queue.requeue("act-missing");
    EXPECT_TRUE(not_abandoned.is_error());

    ASSERT_TRUE(queue.requeue(first.value()).is_ok());
    EXPECT_EQ(queue.pending_count(), 1u);
    EXPECT_EQ(queue.get(first.value()).value().retry_count, 0u);

    auto pending_discard = queue.discard(first.value());
    ASSERT_TRUE(pending_discard.is_error());
    EXPECT_EQ(pending_discard.error().code, ErrorCode::InvalidState);

    ASSERT_TRUE(queue.discard(second.value()).is_ok());
    EXPECT_TRUE(queue.abandoned().empty());
}

TEST_F(ActionQueueTest, BackoffGatesTheNextAttempt) {
    config_.backoff_base = std::chrono::milliseconds(1000);
    config_.backoff_max = std::chrono::milliseconds(1500);
    config_.max_retries = 5;
    ActionQueue queue(store_, bus_, clock_, config_);

    auto id = queue.enqueue(make_action("progress/a", {{"n", 1}}));
    int calls = 0;
    auto failing = [&](const OfflineAction&) -> Result<void> {
        ++calls;
        return lsync::Err<void>(ErrorCode::TransientNetwork, "down");
    };

    queue.drain(failing);
    EXPECT_EQ(queue.get(id.value()).value().next_attempt_at, clock_.now() + 1000);

    auto gated = queue.drain(failing);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(gated.skipped, 1u);

    clock_.advance(std::chrono::milliseconds(1000));
    queue.drain(failing);
    EXPECT_EQ(calls, 2);
    // Second retry doubles to 2000 but is capped
    EXPECT_EQ(queue.get(id.value()).value().next_attempt_at, clock_.now() + 1500);
}

TEST_F(ActionQueueTest, OldActionsAgeOut) {
    config_.max_action_age = std::chrono::hours(1);
    ActionQueue queue(store_, bus_, clock_, config_);

    ASSERT_TRUE(queue.enqueue(make_action("progress/a", {{"n", 1}})).is_ok());
    clock_.advance(std::chrono::hours(2));

    int calls = 0;
    auto report = queue.drain([&](const OfflineAction&) -> Result<void> {
        ++calls;
        return lsync::Ok();
    });
    EXPECT_EQ(calls, 0);
    ASSERT_EQ(report.abandoned.size(), 1u);
    EXPECT_EQ(report.abandoned[0].last_error_code, ErrorCode::Abandoned);
}

TEST_F(ActionQueueTest, ConflictRemovesActionAndReportsRemoteWinner) {
    ActionQueue queue(store_, bus_, clock_, config_);
    std::vector<ConflictResolvedEvent> conflicts;
    bus_.subscribe<ConflictResolvedEvent>([&](const ConflictResolvedEvent& e) { conflicts.push_back(e); });

    ASSERT_TRUE(queue.enqueue(make_action("courses/c1", {{"title", "mine"}})).is_ok());
    auto report = queue.drain([](const OfflineAction&) -> Result<void> {
        return lsync::Err<void>(ErrorCode::Conflict, "remote is newer");
    });

    EXPECT_EQ(report.conflicts, 1u);
    ASSERT_EQ(report.conflict_keys.size(), 1u);
    EXPECT_EQ(report.conflict_keys[0], "courses/c1");
    EXPECT_EQ(queue.pending_count(), 0u);
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].winner, "remote");
}

TEST_F(ActionQueueTest, CancellationLeavesActionsPending) {
    ActionQueue queue(store_, bus_, clock_, config_);
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(queue.enqueue(make_action("progress/a", {{"n", i}})).is_ok());
    }

    std::atomic<bool> cancel{false};
    int calls = 0;
    auto report = queue.drain(
        [&](const OfflineAction&) -> Result<void> {
            ++calls;
            cancel = true;
            return lsync::Ok();
        },
        &cancel);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(report.succeeded, 1u);
    EXPECT_EQ(report.skipped, 2u);
    EXPECT_EQ(queue.pending_count(), 2u);
}

TEST_F(ActionQueueTest, SurvivesRestartWithoutReusingIds) {
    std::string first_id;
    {
        ActionQueue queue(store_, bus_, clock_, config_);
        first_id = queue.enqueue(make_action("progress/a", {{"n", 1}})).value();
        queue.drain([](const OfflineAction&) -> Result<void> { return lsync::Ok(); });
        ASSERT_TRUE(queue.enqueue(make_action("progress/a", {{"n", 2}})).is_ok());
    }

    ActionQueue reopened(store_, bus_, clock_, config_);
    ASSERT_EQ(reopened.pending_count(), 1u);
    EXPECT_EQ(reopened.pending()[0].payload.at("n"), 2);

    reopened.drain([](const OfflineAction&) -> Result<void> { return lsync::Ok(); });
    ActionQueue again(store_, bus_, clock_, config_);
    auto next = again.enqueue(make_action("progress/a", {{"n", 3}}));
    ASSERT_TRUE(next.is_ok());
    EXPECT_GT(next.value(), first_id);
    EXPECT_NE(next.value(), lsync::queue::make_action_id(2));
}

TEST_F(ActionQueueTest, HigherPriorityKeysDrainFirst) {
    config_.concurrency = 1;
    ActionQueue queue(store_, bus_, clock_, config_);

    ASSERT_TRUE(queue.enqueue(make_action("progress/low", {{"n", 1}}, "put", 0)).is_ok());
    ASSERT_TRUE(queue.enqueue(make_action("progress/high", {{"n", 2}}, "put", 5)).is_ok());

    std::vector<std::string> order;
    queue.drain([&](const OfflineAction& action) -> Result<void> {
        order.push_back(action.target_key);
        return lsync::Ok();
    });
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], "progress/high");
}

TEST_F(ActionQueueTest, ConflictingOfflineEditsLeaveRemoteWithLastPayload) {
    ActionQueue queue(store_, bus_, clock_, config_);
    MemoryRemoteStore remote(clock_);
    remote.set_online(false);

    for (int percent : {30, 60, 90}) {
        ASSERT_TRUE(queue.enqueue(make_action("progress/lesson1", {{"percent", percent}})).is_ok());
        clock_.advance(std::chrono::milliseconds(5));
    }

    auto push = [&](const OfflineAction& action) { return remote.push(action); };

    auto offline = queue.drain(push);
    EXPECT_EQ(offline.retried, 1u);
    EXPECT_EQ(queue.pending_count(), 3u);

    remote.set_online(true);
    auto online = queue.drain(push);

    EXPECT_EQ(online.succeeded, 3u);
    EXPECT_EQ(queue.pending_count(), 0u);
    auto stored = remote.get("progress", "lesson1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->data, (nlohmann::json{{"percent", 90}}));
}
