#include "lsync/sync/orchestrator.hpp"
#include "lsync/download/asset_source.hpp"
#include "lsync/store/sqlite_db.hpp"
#include "lsync/sync/memory_remote_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

using lsync::CacheConfig;
using lsync::DownloadConfig;
using lsync::ErrorCode;
using lsync::ManualClock;
using lsync::QueueConfig;
using lsync::Result;
using lsync::SyncConfig;
using lsync::Timestamp;
using lsync::cache::CacheEngine;
using lsync::download::DownloadManager;
using lsync::download::FileAssetSource;
using lsync::events::ConflictResolvedEvent;
using lsync::events::ConnectivityChangedEvent;
using lsync::events::EntityChangedEvent;
using lsync::events::EventBus;
using lsync::events::SyncCompletedEvent;
using lsync::events::SyncStartedEvent;
using lsync::events::SyncStatusChangedEvent;
using lsync::queue::ActionQueue;
using lsync::queue::OfflineAction;
using lsync::store::EntityRecord;
using lsync::store::LocalStore;
using lsync::store::SqliteDb;
using lsync::sync::MemoryRemoteStore;
using lsync::sync::PullBatch;
using lsync::sync::RemoteStore;
using lsync::sync::SyncOrchestrator;
using lsync::sync::SyncStatus;
using lsync::sync::SyncTrigger;

namespace fs = std::filesystem;

namespace {

class TempDbPath {
public:
    explicit TempDbPath(const std::string& name) : path_(fs::temp_directory_path() / name) { remove_files(); }
    ~TempDbPath() { remove_files(); }

    std::string str() const { return path_.string(); }

private:
    void remove_files() {
        std::error_code ec;
        for (const char* suffix : {"", "-wal", "-shm"}) {
            fs::remove(path_.string() + suffix, ec);
        }
    }

    fs::path path_;
};

/// Holds the first pull until open() so a run can be observed mid-flight.
class GatedRemote final : public RemoteStore {
public:
    explicit GatedRemote(RemoteStore& inner) : inner_(inner) {}

    Result<PullBatch> pull(const std::string& collection, std::int64_t since_cursor) override {
        {
            std::unique_lock lock(mutex_);
            held_ = true;
            cv_.notify_all();
            cv_.wait(lock, [this]() { return open_; });
        }
        return inner_.pull(collection, since_cursor);
    }

    Result<void> push(const OfflineAction& action) override { return inner_.push(action); }

    bool wait_until_held() {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, std::chrono::seconds(5), [this]() { return held_; });
    }

    void open() {
        std::lock_guard lock(mutex_);
        open_ = true;
        cv_.notify_all();
    }

private:
    RemoteStore& inner_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool held_ = false;
    bool open_ = false;
};

std::string current_test_name() {
    return ::testing::UnitTest::GetInstance()->current_test_info()->name();
}

class OrchestratorTest : public ::testing::Test {
protected:
    OrchestratorTest()
        : db_("lsync-orchestrator-" + current_test_name() + ".db"),
          store_(db_.str()),
          remote_(clock_, 2),
          assets_(1024),
          cache_(store_, bus_, clock_, CacheConfig{}),
          queue_(store_, bus_, clock_, queue_config()),
          downloads_(store_, bus_, assets_, clock_, DownloadConfig{}) {}

    static QueueConfig queue_config() {
        QueueConfig config;
        config.backoff_base = std::chrono::milliseconds(0);
        return config;
    }

    static SyncConfig sync_config(bool online = true) {
        SyncConfig config;
        config.collections = {"courses", "progress"};
        config.connectivity_debounce = std::chrono::milliseconds(0);
        config.start_online = online;
        return config;
    }

    std::unique_ptr<SyncOrchestrator> make(SyncConfig config, RemoteStore* remote = nullptr) {
        return std::make_unique<SyncOrchestrator>(store_, queue_, cache_, downloads_,
                                                  remote ? *remote : remote_, bus_, clock_, std::move(config));
    }

    void edit_locally(const std::string& collection, const std::string& id, const std::string& field,
                      nlohmann::json value) {
        EntityRecord record;
        auto existing = store_.get_as<EntityRecord>(collection, id);
        if (existing.is_ok()) {
            record = existing.value();
        } else {
            record.collection = collection;
            record.id = id;
        }
        record.data[field] = value;
        record.field_times[field] = clock_.now();
        record.dirty = true;
        ASSERT_TRUE(store_.put_as(collection, id, record).is_ok());
    }

    TempDbPath db_;
    ManualClock clock_;
    EventBus bus_;
    LocalStore store_;
    MemoryRemoteStore remote_;
    FileAssetSource assets_;
    CacheEngine cache_;
    ActionQueue queue_;
    DownloadManager downloads_;
};

} // namespace

// ─────────────────────────────────────────────────────────────
// Pull
// ─────────────────────────────────────────────────────────────

TEST_F(OrchestratorTest, PullsEveryPageAndAdvancesCursor) {
    for (int i = 1; i <= 5; ++i) {
        remote_.upsert("courses", "c" + std::to_string(i), {{"title", "Course " + std::to_string(i)}});
    }
    auto orchestrator = make(sync_config());

    auto report = orchestrator->run_sync();
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.records_pulled, 5u);
    // courses: 2 + 2 + 1, progress: one empty page
    EXPECT_EQ(report.pages_committed, 4u);
    EXPECT_EQ(orchestrator->cursor("courses").cursor, remote_.head());
    EXPECT_EQ(store_.count("courses"), 5u);

    auto c3 = store_.get_as<EntityRecord>("courses", "c3");
    ASSERT_TRUE(c3.is_ok());
    EXPECT_EQ(c3.value().data.at("title"), "Course 3");
    EXPECT_EQ(c3.value().last_synced_at, clock_.now());
    EXPECT_FALSE(c3.value().dirty);
    EXPECT_EQ(orchestrator->status(), SyncStatus::Idle);

    // Nothing new: the second run pulls nothing
    auto again = orchestrator->run_sync();
    EXPECT_EQ(again.records_pulled, 0u);
}

TEST_F(OrchestratorTest, FailedPullKeepsCursorAndRetriesSameWindow) {
    remote_.upsert("courses", "c1", {{"title", "Algebra"}});
    auto orchestrator = make(sync_config());
    ASSERT_TRUE(orchestrator->run_sync().ok());
    const auto before = orchestrator->cursor("courses").cursor;

    remote_.upsert("courses", "c2", {{"title", "Geometry"}});
    remote_.fail_next_pulls(1);

    auto failed = orchestrator->run_sync();
    ASSERT_TRUE(failed.pull_error.has_value());
    EXPECT_EQ(failed.pull_error->code, ErrorCode::TransientNetwork);
    EXPECT_EQ(orchestrator->status(), SyncStatus::Error);
    EXPECT_EQ(orchestrator->cursor("courses").cursor, before);
    EXPECT_FALSE(store_.exists("courses", "c2"));
    ASSERT_TRUE(orchestrator->last_error().has_value());

    auto recovered = orchestrator->run_sync();
    EXPECT_TRUE(recovered.ok());
    EXPECT_TRUE(store_.exists("courses", "c2"));
    EXPECT_EQ(orchestrator->status(), SyncStatus::Idle);
    EXPECT_FALSE(orchestrator->last_error().has_value());
}

TEST_F(OrchestratorTest, TombstoneDeletesLocalRecord) {
    remote_.upsert("courses", "c1", {{"title", "Algebra"}});
    auto orchestrator = make(sync_config());
    ASSERT_TRUE(orchestrator->run_sync().ok());
    ASSERT_TRUE(store_.exists("courses", "c1"));

    std::vector<EntityChangedEvent> changes;
    bus_.subscribe<EntityChangedEvent>([&changes](const EntityChangedEvent& e) { changes.push_back(e); });

    remote_.remove("courses", "c1");
    auto report = orchestrator->run_sync();
    EXPECT_EQ(report.records_deleted, 1u);
    EXPECT_FALSE(store_.exists("courses", "c1"));
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_TRUE(changes[0].deleted);
    EXPECT_EQ(changes[0].source, "pull");
}

TEST_F(OrchestratorTest, PulledChangeInvalidatesDerivedCacheEntries) {
    remote_.upsert("courses", "c1", {{"title", "Algebra"}});
    auto orchestrator = make(sync_config());
    ASSERT_TRUE(orchestrator->run_sync().ok());

    auto loader = []() -> Result<std::string> { return lsync::Ok(std::string("rendered")); };
    ASSERT_TRUE(cache_.fetch_or_compute("courses/c1", 0, loader).is_ok());
    ASSERT_TRUE(cache_.fetch_or_compute("courses/c1/outline", 0, loader).is_ok());
    ASSERT_TRUE(cache_.fetch_or_compute("courses/c10", 0, loader).is_ok());

    remote_.upsert("courses", "c1", {{"title", "Algebra II"}});
    ASSERT_TRUE(orchestrator->run_sync().ok());

    EXPECT_FALSE(cache_.entry("courses/c1").has_value());
    EXPECT_FALSE(cache_.entry("courses/c1/outline").has_value());
    EXPECT_TRUE(cache_.entry("courses/c10").has_value());
}

// ─────────────────────────────────────────────────────────────
// Push and merge
// ─────────────────────────────────────────────────────────────

TEST_F(OrchestratorTest, PushesQueuedActionsBeforePulling) {
    edit_locally("progress", "l1", "percent", 40);
    OfflineAction action;
    action.kind = "merge";
    action.target_key = "progress/l1";
    action.payload = {{"percent", 40}};
    ASSERT_TRUE(queue_.enqueue(action).is_ok());

    auto orchestrator = make(sync_config());
    auto report = orchestrator->run_sync();

    EXPECT_EQ(report.actions_succeeded, 1u);
    EXPECT_EQ(queue_.pending_count(), 0u);
    ASSERT_TRUE(remote_.get("progress", "l1").has_value());
    EXPECT_EQ(remote_.get("progress", "l1")->data.at("percent"), 40);

    // The pushed change comes back in the pull and the record is clean again
    auto local = store_.get_as<EntityRecord>("progress", "l1").value();
    EXPECT_FALSE(local.dirty);
    EXPECT_TRUE(local.field_times.empty());
    EXPECT_EQ(local.data.at("percent"), 40);
    EXPECT_EQ(local.remote_updated_at, clock_.now());
}

TEST_F(OrchestratorTest, EditQueuedDuringPushStaysDirty) {
    edit_locally("progress", "l1", "percent", 40);
    OfflineAction first;
    first.kind = "merge";
    first.target_key = "progress/l1";
    first.payload = {{"percent", 40}};
    ASSERT_TRUE(queue_.enqueue(first).is_ok());

    auto orchestrator = make(sync_config());

    // Writers of entity records hold this lock, as the engine does for an edit
    auto editing = orchestrator->lock_entities();
    auto running = orchestrator->sync_now(SyncTrigger::Manual);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!remote_.get("progress", "l1") && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_TRUE(remote_.get("progress", "l1").has_value());
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    clock_.advance(std::chrono::seconds(5));
    edit_locally("progress", "l1", "percent", 55);
    OfflineAction second = first;
    second.payload = {{"percent", 55}};
    ASSERT_TRUE(queue_.enqueue(second).is_ok());
    editing.unlock();

    auto report = running.get();
    EXPECT_EQ(report.actions_succeeded, 1u);
    EXPECT_EQ(queue_.pending_count(), 1u);

    auto local = store_.get_as<EntityRecord>("progress", "l1").value();
    EXPECT_TRUE(local.dirty);
    EXPECT_EQ(local.data.at("percent"), 55);
    EXPECT_EQ(local.field_times.count("percent"), 1u);
}

TEST_F(OrchestratorTest, FailedPushDoesNotBlockPull) {
    remote_.upsert("courses", "c1", {{"title", "Algebra"}});
    OfflineAction action;
    action.kind = "merge";
    action.target_key = "progress/l1";
    action.payload = {{"percent", 40}};
    ASSERT_TRUE(queue_.enqueue(action).is_ok());
    remote_.fail_next_pushes(1);

    auto orchestrator = make(sync_config());
    auto report = orchestrator->run_sync();

    EXPECT_EQ(report.actions_retried, 1u);
    ASSERT_TRUE(report.push_error.has_value());
    EXPECT_FALSE(report.pull_error.has_value());
    EXPECT_EQ(queue_.pending_count(), 1u);
    EXPECT_TRUE(store_.exists("courses", "c1"));
    EXPECT_EQ(orchestrator->status(), SyncStatus::Idle);
}

TEST_F(OrchestratorTest, NewerLocalFieldSurvivesOlderRemoteUpdate) {
    remote_.upsert("progress", "l1", {{"percent", 10}, {"notes", "a"}});
    auto orchestrator = make(sync_config());
    ASSERT_TRUE(orchestrator->run_sync().ok());

    clock_.advance(std::chrono::seconds(5));
    remote_.upsert("progress", "l1", {{"percent", 10}, {"notes", "b"}});
    clock_.advance(std::chrono::seconds(5));
    edit_locally("progress", "l1", "percent", 50);

    std::vector<ConflictResolvedEvent> conflicts;
    bus_.subscribe<ConflictResolvedEvent>([&conflicts](const ConflictResolvedEvent& e) { conflicts.push_back(e); });

    auto report = orchestrator->run_sync();
    EXPECT_EQ(report.conflicts, 1u);

    auto local = store_.get_as<EntityRecord>("progress", "l1").value();
    EXPECT_EQ(local.data.at("percent"), 50);
    EXPECT_EQ(local.data.at("notes"), "b");
    EXPECT_TRUE(local.dirty);
    EXPECT_EQ(local.field_times.count("percent"), 1u);

    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].winner, "local");
    EXPECT_EQ(conflicts[0].fields, std::vector<std::string>{"percent"});
}

TEST_F(OrchestratorTest, NewerRemoteUpdateReplacesLocalField) {
    remote_.upsert("progress", "l1", {{"percent", 10}});
    auto orchestrator = make(sync_config());
    ASSERT_TRUE(orchestrator->run_sync().ok());

    clock_.advance(std::chrono::seconds(5));
    edit_locally("progress", "l1", "percent", 50);
    edit_locally("progress", "l1", "bookmark", "12:30");
    clock_.advance(std::chrono::seconds(5));
    remote_.upsert("progress", "l1", {{"percent", 70}});

    std::vector<ConflictResolvedEvent> conflicts;
    bus_.subscribe<ConflictResolvedEvent>([&conflicts](const ConflictResolvedEvent& e) { conflicts.push_back(e); });

    ASSERT_TRUE(orchestrator->run_sync().ok());

    auto local = store_.get_as<EntityRecord>("progress", "l1").value();
    EXPECT_EQ(local.data.at("percent"), 70);
    EXPECT_EQ(local.field_times.count("percent"), 0u);
    // A field only the local side has is dropped once the remote is newer
    EXPECT_FALSE(local.data.contains("bookmark"));

    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].winner, "remote");
}

TEST_F(OrchestratorTest, RejectedPushIsReplacedByRemoteVersion) {
    remote_.upsert("progress", "l1", {{"percent", 90}});
    auto orchestrator = make(sync_config());
    ASSERT_TRUE(orchestrator->run_sync().ok());

    clock_.advance(std::chrono::seconds(5));
    edit_locally("progress", "l1", "percent", 20);
    OfflineAction action;
    action.kind = "merge";
    action.target_key = "progress/l1";
    action.payload = {{"percent", 20}};
    ASSERT_TRUE(queue_.enqueue(action).is_ok());
    remote_.fail_next_pushes(1, ErrorCode::Conflict);

    auto report = orchestrator->run_sync();
    EXPECT_EQ(report.conflicts, 1u);
    EXPECT_EQ(queue_.pending_count(), 0u);

    auto local = store_.get_as<EntityRecord>("progress", "l1").value();
    EXPECT_EQ(local.data.at("percent"), 90);
    EXPECT_FALSE(local.dirty);
}

// ─────────────────────────────────────────────────────────────
// Corruption
// ─────────────────────────────────────────────────────────────

TEST_F(OrchestratorTest, CorruptLocalRecordIsQuarantinedAndRepulled) {
    remote_.upsert("courses", "c1", {{"title", "Algebra"}});
    ASSERT_TRUE(store_.put("courses", "c1", {{"collection", "courses"}, {"id", "c1"}}).is_ok());
    {
        SqliteDb raw(db_.str());
        ASSERT_TRUE(raw.exec("UPDATE records SET body = '{broken' WHERE collection = 'courses' AND id = 'c1';")
                        .is_ok());
    }
    auto orchestrator = make(sync_config());

    auto report = orchestrator->run_sync();
    EXPECT_EQ(report.records_quarantined, 1u);
    EXPECT_TRUE(orchestrator->corrupt_records());
    EXPECT_EQ(store_.count(lsync::store::kQuarantineCollection), 1u);

    auto repaired = store_.get_as<EntityRecord>("courses", "c1");
    ASSERT_TRUE(repaired.is_ok());
    EXPECT_EQ(repaired.value().data.at("title"), "Algebra");
}

TEST_F(OrchestratorTest, ReportedCorruptionResetsCursor) {
    remote_.upsert("courses", "c1", {{"title", "Algebra"}});
    auto orchestrator = make(sync_config());
    ASSERT_TRUE(orchestrator->run_sync().ok());
    ASSERT_GT(orchestrator->cursor("courses").cursor, 0);

    ASSERT_TRUE(orchestrator->report_corruption("courses", "c1", "decode failed").is_ok());
    EXPECT_EQ(orchestrator->cursor("courses").cursor, 0);
    EXPECT_FALSE(store_.exists("courses", "c1"));
    ASSERT_TRUE(orchestrator->last_error().has_value());
    EXPECT_EQ(orchestrator->last_error()->code, ErrorCode::CorruptLocalState);

    ASSERT_TRUE(orchestrator->run_sync().ok());
    EXPECT_TRUE(store_.exists("courses", "c1"));
}

TEST_F(OrchestratorTest, ResyncFromScratchPullsEverythingAgain) {
    remote_.upsert("courses", "c1", {{"title", "Algebra"}});
    remote_.upsert("progress", "l1", {{"percent", 5}});
    auto orchestrator = make(sync_config());
    ASSERT_TRUE(orchestrator->run_sync().ok());

    ASSERT_TRUE(orchestrator->resync_from_scratch().is_ok());
    auto report = orchestrator->run_sync();
    EXPECT_EQ(report.records_pulled, 2u);
}

// ─────────────────────────────────────────────────────────────
// Run control
// ─────────────────────────────────────────────────────────────

TEST_F(OrchestratorTest, ConcurrentRequestsShareOneRun) {
    GatedRemote gated(remote_);
    auto orchestrator = make(sync_config(), &gated);

    std::atomic<int> started{0};
    bus_.subscribe<SyncStartedEvent>([&started](const SyncStartedEvent&) { ++started; });

    auto first = orchestrator->sync_now(SyncTrigger::Manual);
    ASSERT_TRUE(gated.wait_until_held());
    EXPECT_EQ(orchestrator->status(), SyncStatus::Syncing);

    auto second = orchestrator->sync_now(SyncTrigger::Periodic);
    gated.open();

    EXPECT_EQ(first.get().trigger, SyncTrigger::Manual);
    EXPECT_EQ(second.get().trigger, SyncTrigger::Manual);
    EXPECT_EQ(started.load(), 1);
}

TEST_F(OrchestratorTest, CancelStopsAtPageBoundary) {
    for (int i = 1; i <= 5; ++i) {
        remote_.upsert("courses", "c" + std::to_string(i), {{"title", "Course"}});
    }
    GatedRemote gated(remote_);
    auto orchestrator = make(sync_config(), &gated);

    auto run = orchestrator->sync_now();
    ASSERT_TRUE(gated.wait_until_held());
    orchestrator->cancel_sync();
    gated.open();

    auto report = run.get();
    EXPECT_TRUE(report.cancelled);
    EXPECT_FALSE(report.ok());
    EXPECT_EQ(report.pages_committed, 1u);
    EXPECT_EQ(store_.count("courses"), 2u);
    EXPECT_EQ(orchestrator->cursor("courses").cursor, 2);

    // The next run picks up after the committed page
    auto resumed = orchestrator->run_sync();
    EXPECT_FALSE(resumed.cancelled);
    EXPECT_EQ(resumed.records_pulled, 3u);
}

TEST_F(OrchestratorTest, OfflineRunOnlyDoesMaintenance) {
    OfflineAction action;
    action.kind = "merge";
    action.target_key = "progress/l1";
    action.payload = {{"percent", 40}};
    ASSERT_TRUE(queue_.enqueue(action).is_ok());
    ASSERT_TRUE(cache_.fetch_or_compute("catalog/p1", 0, []() -> Result<std::string> {
        return lsync::Ok(std::string("page"));
    }, std::chrono::milliseconds(1000)).is_ok());
    clock_.advance(std::chrono::seconds(2));

    auto orchestrator = make(sync_config(false));
    auto report = orchestrator->run_sync();

    EXPECT_FALSE(report.online);
    EXPECT_EQ(report.cache_entries_expired, 1u);
    EXPECT_EQ(report.actions_succeeded, 0u);
    EXPECT_EQ(queue_.pending_count(), 1u);
    EXPECT_TRUE(remote_.pushed().empty());
    EXPECT_EQ(orchestrator->status(), SyncStatus::Idle);
}

TEST_F(OrchestratorTest, StatusChangesAreObservable) {
    auto orchestrator = make(sync_config());

    std::mutex mutex;
    std::vector<std::pair<SyncStatus, SyncStatus>> seen;
    auto subscription = orchestrator->watch_status([&](const SyncStatusChangedEvent& e) {
        std::lock_guard lock(mutex);
        seen.emplace_back(e.from, e.to);
    });

    ASSERT_TRUE(orchestrator->run_sync().ok());
    remote_.fail_next_pulls(1);
    orchestrator->run_sync();
    orchestrator->unwatch_status(subscription);
    orchestrator->run_sync();

    std::lock_guard lock(mutex);
    ASSERT_EQ(seen.size(), 4u);
    EXPECT_EQ(seen[0], std::make_pair(SyncStatus::Idle, SyncStatus::Syncing));
    EXPECT_EQ(seen[1], std::make_pair(SyncStatus::Syncing, SyncStatus::Idle));
    EXPECT_EQ(seen[2], std::make_pair(SyncStatus::Idle, SyncStatus::Syncing));
    EXPECT_EQ(seen[3], std::make_pair(SyncStatus::Syncing, SyncStatus::Error));
}

// ─────────────────────────────────────────────────────────────
// Connectivity
// ─────────────────────────────────────────────────────────────

TEST_F(OrchestratorTest, GoingOnlineTriggersReconnectSync) {
    remote_.upsert("courses", "c1", {{"title", "Algebra"}});
    auto orchestrator = make(sync_config(false));

    std::mutex mutex;
    std::vector<SyncTrigger> triggers;
    bus_.subscribe<SyncStartedEvent>([&](const SyncStartedEvent& e) {
        std::lock_guard lock(mutex);
        triggers.push_back(e.trigger);
    });
    std::atomic<int> transitions{0};
    bus_.subscribe<ConnectivityChangedEvent>([&transitions](const ConnectivityChangedEvent&) { ++transitions; });

    orchestrator->set_online(false);
    EXPECT_EQ(transitions.load(), 0);

    orchestrator->set_online(true);
    EXPECT_TRUE(orchestrator->online());
    orchestrator->sync_now().wait();

    EXPECT_EQ(transitions.load(), 1);
    EXPECT_TRUE(store_.exists("courses", "c1"));
    std::lock_guard lock(mutex);
    ASSERT_FALSE(triggers.empty());
    EXPECT_EQ(triggers.front(), SyncTrigger::Reconnect);
}

TEST_F(OrchestratorTest, FlappingSignalIsDebounced) {
    auto config = sync_config(false);
    config.connectivity_debounce = std::chrono::milliseconds(100);
    auto orchestrator = make(config);
    orchestrator->start();

    std::atomic<int> transitions{0};
    bus_.subscribe<ConnectivityChangedEvent>([&transitions](const ConnectivityChangedEvent&) { ++transitions; });

    auto reconnected = std::make_shared<std::promise<void>>();
    std::atomic<bool> fired{false};
    bus_.subscribe<SyncCompletedEvent>([reconnected, &fired](const SyncCompletedEvent& e) {
        if (e.report.trigger == SyncTrigger::Reconnect && !fired.exchange(true)) {
            reconnected->set_value();
        }
    });

    orchestrator->set_online(true);
    orchestrator->set_online(false);
    orchestrator->set_online(true);
    EXPECT_FALSE(orchestrator->online());

    ASSERT_EQ(reconnected->get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);
    std::this_thread::sleep_for(std::chrono::milliseconds(250));

    EXPECT_TRUE(orchestrator->online());
    EXPECT_EQ(transitions.load(), 1);
    orchestrator->stop();
}
