#include "lsync/sync/memory_remote_store.hpp"

#include <gtest/gtest.h>

using lsync::ErrorCode;
using lsync::ManualClock;
using lsync::queue::OfflineAction;
using lsync::sync::MemoryRemoteStore;

namespace {

OfflineAction action(const std::string& id, const std::string& kind, const std::string& key,
                     nlohmann::json payload = nlohmann::json::object()) {
    OfflineAction a;
    a.id = id;
    a.kind = kind;
    a.target_key = key;
    a.payload = std::move(payload);
    return a;
}

} // namespace

TEST(MemoryRemoteStoreTest, PullPagesInChangeOrder) {
    ManualClock clock;
    MemoryRemoteStore remote(clock, 2);

    remote.upsert("courses", "c1", {{"title", "Algebra"}});
    remote.upsert("lessons", "l1", {{"title", "Intro"}});
    remote.upsert("courses", "c2", {{"title", "Geometry"}});
    remote.upsert("courses", "c3", {{"title", "Calculus"}});

    auto first = remote.pull("courses", 0);
    ASSERT_TRUE(first.is_ok());
    ASSERT_EQ(first.value().records.size(), 2u);
    EXPECT_EQ(first.value().records[0].id, "c1");
    EXPECT_EQ(first.value().records[1].id, "c2");
    EXPECT_TRUE(first.value().has_more);

    auto second = remote.pull("courses", first.value().new_cursor);
    ASSERT_TRUE(second.is_ok());
    ASSERT_EQ(second.value().records.size(), 1u);
    EXPECT_EQ(second.value().records[0].id, "c3");
    EXPECT_FALSE(second.value().has_more);
    EXPECT_EQ(second.value().new_cursor, remote.head());

    auto empty = remote.pull("courses", second.value().new_cursor);
    ASSERT_TRUE(empty.is_ok());
    EXPECT_TRUE(empty.value().records.empty());
    EXPECT_EQ(empty.value().new_cursor, second.value().new_cursor);
}

TEST(MemoryRemoteStoreTest, RewriteMovesRecordToEndOfLog) {
    ManualClock clock;
    MemoryRemoteStore remote(clock);

    remote.upsert("courses", "c1", {{"title", "Algebra"}});
    remote.upsert("courses", "c2", {{"title", "Geometry"}});
    const auto cursor = remote.head();

    clock.advance(std::chrono::seconds(5));
    remote.upsert("courses", "c1", {{"title", "Algebra II"}});

    auto changed = remote.pull("courses", cursor);
    ASSERT_TRUE(changed.is_ok());
    ASSERT_EQ(changed.value().records.size(), 1u);
    EXPECT_EQ(changed.value().records[0].data.at("title"), "Algebra II");
    EXPECT_EQ(changed.value().records[0].updated_at, clock.now());
}

TEST(MemoryRemoteStoreTest, PushAppliesPutMergeAndDelete) {
    ManualClock clock;
    MemoryRemoteStore remote(clock);

    ASSERT_TRUE(remote.push(action("act-1", "put", "progress/l1", {{"percent", 10}, {"lesson", "l1"}})).is_ok());
    ASSERT_TRUE(remote.push(action("act-2", "merge", "progress/l1", {{"percent", 40}})).is_ok());

    auto merged = remote.get("progress", "l1");
    ASSERT_TRUE(merged.has_value());
    EXPECT_EQ(merged->data.at("percent"), 40);
    EXPECT_EQ(merged->data.at("lesson"), "l1");

    ASSERT_TRUE(remote.push(action("act-3", "delete", "progress/l1")).is_ok());
    auto removed = remote.get("progress", "l1");
    ASSERT_TRUE(removed.has_value());
    EXPECT_TRUE(removed->deleted);
    EXPECT_EQ(remote.pushed().size(), 3u);
}

TEST(MemoryRemoteStoreTest, RepeatedActionIdIsAppliedOnce) {
    ManualClock clock;
    MemoryRemoteStore remote(clock);

    ASSERT_TRUE(remote.push(action("act-1", "merge", "progress/l1", {{"percent", 10}})).is_ok());
    const auto head = remote.head();
    ASSERT_TRUE(remote.push(action("act-1", "merge", "progress/l1", {{"percent", 99}})).is_ok());

    EXPECT_EQ(remote.head(), head);
    EXPECT_EQ(remote.get("progress", "l1")->data.at("percent"), 10);
    EXPECT_EQ(remote.pushed().size(), 1u);
}

TEST(MemoryRemoteStoreTest, RejectsUnknownKindsAndBadKeys) {
    ManualClock clock;
    MemoryRemoteStore remote(clock);

    EXPECT_EQ(remote.push(action("act-1", "archive", "progress/l1")).error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(remote.push(action("act-2", "put", "no-slash")).error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(remote.push(action("act-3", "merge", "progress/l1", 5)).error().code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(remote.pushed().empty());
}

TEST(MemoryRemoteStoreTest, OfflineAndInjectedFailures) {
    ManualClock clock;
    MemoryRemoteStore remote(clock);

    remote.set_online(false);
    EXPECT_EQ(remote.pull("courses", 0).error().code, ErrorCode::TransientNetwork);
    EXPECT_EQ(remote.push(action("act-1", "put", "progress/l1")).error().code, ErrorCode::TransientNetwork);

    remote.set_online(true);
    remote.fail_next_pushes(1, ErrorCode::Conflict);
    EXPECT_EQ(remote.push(action("act-1", "put", "progress/l1")).error().code, ErrorCode::Conflict);
    EXPECT_TRUE(remote.push(action("act-1", "put", "progress/l1")).is_ok());

    remote.fail_next_pulls(2);
    EXPECT_TRUE(remote.pull("courses", 0).is_error());
    EXPECT_TRUE(remote.pull("courses", 0).is_error());
    EXPECT_TRUE(remote.pull("courses", 0).is_ok());
}
