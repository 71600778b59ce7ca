/**
 * @file components.hpp
 * @brief Event-driven observability components
 *
 * Neither component is referenced by the code that emits events; they are
 * attached to a bus and react to whatever passes through it.
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * ... run the engine ...
 * metrics.print_stats();
 */

#pragma once

#include "lsync/events/event_bus.hpp"
#include "lsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace lsync::events {

/**
 * @brief Logs every engine event with spdlog
 *
 * Progress ticks and entity writes go to debug; state changes go to info;
 * anything an operator has to act on goes to warn.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        subscriptions_.push_back(bus_.subscribe<EntityChangedEvent>([](const EntityChangedEvent& e) {
            spdlog::debug("[EntityChanged] key={}/{} source={} deleted={}", e.collection, e.id, e.source, e.deleted);
        }));

        subscriptions_.push_back(bus_.subscribe<EntityQuarantinedEvent>([](const EntityQuarantinedEvent& e) {
            spdlog::warn("[EntityQuarantined] key={}/{} reason={}", e.collection, e.id, e.reason);
        }));

        subscriptions_.push_back(bus_.subscribe<ActionEnqueuedEvent>([](const ActionEnqueuedEvent& e) {
            spdlog::info("[ActionEnqueued] id={} kind={} target={}", e.action_id, e.kind, e.target_key);
        }));

        subscriptions_.push_back(bus_.subscribe<ActionAppliedEvent>([](const ActionAppliedEvent& e) {
            spdlog::info("[ActionApplied] id={} target={}", e.action_id, e.target_key);
        }));

        subscriptions_.push_back(bus_.subscribe<ActionAbandonedEvent>([](const ActionAbandonedEvent& e) {
            spdlog::warn("[ActionAbandoned] id={} target={} retries={} error={}",
                         e.action_id, e.target_key, e.retry_count, e.last_error);
        }));

        subscriptions_.push_back(bus_.subscribe<ConflictResolvedEvent>([](const ConflictResolvedEvent& e) {
            spdlog::info("[ConflictResolved] target={} strategy=last-write-wins winner={} fields={}",
                         e.target_key, e.winner, e.fields.size());
        }));

        subscriptions_.push_back(bus_.subscribe<DownloadProgressEvent>([](const DownloadProgressEvent& e) {
            spdlog::debug("[DownloadProgress] task={} resource={} bytes={}/{}",
                          e.task_id, e.resource_key, e.transferred_bytes, e.total_bytes);
        }));

        subscriptions_.push_back(bus_.subscribe<DownloadStateChangedEvent>([](const DownloadStateChangedEvent& e) {
            if (e.to == download::DownloadStatus::Failed) {
                spdlog::warn("[DownloadFailed] task={} resource={} error={}", e.task_id, e.resource_key, e.error);
                return;
            }
            spdlog::info("[DownloadState] task={} resource={} {} -> {} bytes={}",
                         e.task_id, e.resource_key, download::to_string(e.from), download::to_string(e.to),
                         e.transferred_bytes);
        }));

        subscriptions_.push_back(bus_.subscribe<CacheEvictedEvent>([](const CacheEvictedEvent& e) {
            spdlog::debug("[CacheEvicted] key={} size={} reason={}", e.key, e.size_bytes, cache::to_string(e.reason));
        }));

        subscriptions_.push_back(bus_.subscribe<ConnectivityChangedEvent>([](const ConnectivityChangedEvent& e) {
            spdlog::info("[Connectivity] {}", e.online ? "online" : "offline");
        }));

        subscriptions_.push_back(bus_.subscribe<SyncStatusChangedEvent>([](const SyncStatusChangedEvent& e) {
            spdlog::info("[SyncStatus] {} -> {}", sync::to_string(e.from), sync::to_string(e.to));
        }));

        subscriptions_.push_back(bus_.subscribe<SyncStartedEvent>([](const SyncStartedEvent& e) {
            spdlog::info("[SyncStarted] trigger={} pending_actions={}", sync::to_string(e.trigger), e.pending_actions);
        }));

        subscriptions_.push_back(bus_.subscribe<SyncCompletedEvent>([](const SyncCompletedEvent& e) {
            const auto& r = e.report;
            spdlog::info("[SyncCompleted] pushed={} retried={} abandoned={} pulled={} deleted={} duration={}ms",
                         r.actions_succeeded, r.actions_retried, r.actions_abandoned,
                         r.records_pulled, r.records_deleted, r.duration.count());
        }));

        subscriptions_.push_back(bus_.subscribe<SyncFailedEvent>([](const SyncFailedEvent& e) {
            spdlog::error("[SyncFailed] error={}", e.error_message);
        }));
    }

    ~LoggerComponent() {
        for (auto id : subscriptions_) {
            bus_.unsubscribe(id);
        }
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    EventBus& bus_;
    std::vector<std::size_t> subscriptions_;
};

/**
 * @brief Counts engine activity for monitoring
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * const auto& stats = metrics.get_stats();
 * spdlog::info("applied={}", stats.actions_applied.load());
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> actions_enqueued{0};
        std::atomic<std::uint64_t> actions_applied{0};
        std::atomic<std::uint64_t> actions_abandoned{0};
        std::atomic<std::uint64_t> conflicts_resolved{0};
        std::atomic<std::uint64_t> downloads_completed{0};
        std::atomic<std::uint64_t> downloads_failed{0};
        std::atomic<std::uint64_t> downloads_cancelled{0};
        std::atomic<std::uint64_t> bytes_downloaded{0};
        std::atomic<std::uint64_t> cache_evictions{0};
        std::atomic<std::uint64_t> bytes_evicted{0};
        std::atomic<std::uint64_t> syncs_completed{0};
        std::atomic<std::uint64_t> syncs_failed{0};
        std::atomic<std::uint64_t> records_pulled{0};
        std::atomic<std::uint64_t> records_quarantined{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        subscriptions_.push_back(bus_.subscribe<ActionEnqueuedEvent>([this](const ActionEnqueuedEvent&) {
            stats_.actions_enqueued++;
        }));

        subscriptions_.push_back(bus_.subscribe<ActionAppliedEvent>([this](const ActionAppliedEvent&) {
            stats_.actions_applied++;
        }));

        subscriptions_.push_back(bus_.subscribe<ActionAbandonedEvent>([this](const ActionAbandonedEvent&) {
            stats_.actions_abandoned++;
        }));

        subscriptions_.push_back(bus_.subscribe<ConflictResolvedEvent>([this](const ConflictResolvedEvent&) {
            stats_.conflicts_resolved++;
        }));

        subscriptions_.push_back(bus_.subscribe<DownloadStateChangedEvent>([this](const DownloadStateChangedEvent& e) {
            on_download_state(e);
        }));

        subscriptions_.push_back(bus_.subscribe<CacheEvictedEvent>([this](const CacheEvictedEvent& e) {
            stats_.cache_evictions++;
            stats_.bytes_evicted += e.size_bytes;
        }));

        subscriptions_.push_back(bus_.subscribe<EntityQuarantinedEvent>([this](const EntityQuarantinedEvent&) {
            stats_.records_quarantined++;
        }));

        subscriptions_.push_back(bus_.subscribe<SyncCompletedEvent>([this](const SyncCompletedEvent& e) {
            stats_.syncs_completed++;
            stats_.records_pulled += e.report.records_pulled;
        }));

        subscriptions_.push_back(bus_.subscribe<SyncFailedEvent>([this](const SyncFailedEvent&) {
            stats_.syncs_failed++;
        }));
    }

    ~MetricsComponent() {
        for (auto id : subscriptions_) {
            bus_.unsubscribe(id);
        }
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Engine Statistics:");
        spdlog::info("  Actions enqueued:    {}", stats_.actions_enqueued.load());
        spdlog::info("  Actions applied:     {}", stats_.actions_applied.load());
        spdlog::info("  Actions abandoned:   {}", stats_.actions_abandoned.load());
        spdlog::info("  Conflicts resolved:  {}", stats_.conflicts_resolved.load());
        spdlog::info("  Downloads completed: {}", stats_.downloads_completed.load());
        spdlog::info("  Downloads failed:    {}", stats_.downloads_failed.load());
        spdlog::info("  Downloads cancelled: {}", stats_.downloads_cancelled.load());
        spdlog::info("  Bytes downloaded:    {}", stats_.bytes_downloaded.load());
        spdlog::info("  Cache evictions:     {}", stats_.cache_evictions.load());
        spdlog::info("  Bytes evicted:       {}", stats_.bytes_evicted.load());
        spdlog::info("  Syncs completed:     {}", stats_.syncs_completed.load());
        spdlog::info("  Syncs failed:        {}", stats_.syncs_failed.load());
        spdlog::info("  Records pulled:      {}", stats_.records_pulled.load());
        spdlog::info("  Records quarantined: {}", stats_.records_quarantined.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_download_state(const DownloadStateChangedEvent& e) {
        switch (e.to) {
            case download::DownloadStatus::Completed:
                stats_.downloads_completed++;
                stats_.bytes_downloaded += e.transferred_bytes;
                break;
            case download::DownloadStatus::Failed:
                stats_.downloads_failed++;
                break;
            case download::DownloadStatus::Cancelled:
                stats_.downloads_cancelled++;
                break;
            default:
                break;
        }
    }

    EventBus& bus_;
    Stats stats_;
    std::vector<std::size_t> subscriptions_;
};

} // namespace lsync::events
