/**
 * @file events.hpp
 * @brief Event types published on the engine's EventBus
 *
 * NAMING CONVENTION:
 * Events are past-tense facts: EntityChangedEvent, ActionAbandonedEvent.
 *
 * All events are plain aggregates; the timestamp defaults to the moment
 * the event object was built.
 */

#pragma once

#include "lsync/cache/cache_entry.hpp"
#include "lsync/download/types.hpp"
#include "lsync/sync/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace lsync::events {

// ════════════════════════════════════════════════════════
// Entity Events
// ════════════════════════════════════════════════════════

/**
 * @brief A local entity record was written or deleted
 *
 * WHO EMITS:
 * - Engine facade (optimistic apply of an enqueued action)
 * - Sync orchestrator (pulled record committed)
 * - Download manager (local path written back)
 *
 * WHO SUBSCRIBES:
 * - Engine facade (per-entity watch callbacks)
 * - Logger
 */
struct EntityChangedEvent {
    std::string collection;
    std::string id;
    std::string source;  // "local", "pull", "download"
    bool deleted = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct EntityQuarantinedEvent {
    std::string collection;
    std::string id;
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Action Queue Events
// ════════════════════════════════════════════════════════

struct ActionEnqueuedEvent {
    std::string action_id;
    std::string kind;
    std::string target_key;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ActionAppliedEvent {
    std::string action_id;
    std::string target_key;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief An action exhausted its retries or aged out
 *
 * The action stays in the log in the abandoned state until an operator
 * requeues or discards it.
 */
struct ActionAbandonedEvent {
    std::string action_id;
    std::string target_key;
    std::uint32_t retry_count = 0;
    std::string last_error;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

enum class ConflictResolutionStrategy {
    LastWriteWins
};

/**
 * @brief A local/remote divergence was settled
 *
 * winner is "remote" or "local"; fields lists the field groups involved
 * (empty when a whole action was dropped in favour of the remote).
 */
struct ConflictResolvedEvent {
    std::string target_key;
    ConflictResolutionStrategy strategy = ConflictResolutionStrategy::LastWriteWins;
    std::string winner;
    std::vector<std::string> fields;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Download Events
// ════════════════════════════════════════════════════════

struct DownloadProgressEvent {
    std::string task_id;
    std::string resource_key;
    std::uint64_t transferred_bytes = 0;
    std::uint64_t total_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct DownloadStateChangedEvent {
    std::string task_id;
    std::string resource_key;
    download::DownloadStatus from = download::DownloadStatus::Queued;
    download::DownloadStatus to = download::DownloadStatus::Queued;
    std::uint64_t transferred_bytes = 0;
    std::string error;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Cache Events
// ════════════════════════════════════════════════════════

struct CacheEvictedEvent {
    std::string key;
    std::uint64_t size_bytes = 0;
    cache::EvictionReason reason = cache::EvictionReason::Capacity;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Sync Events
// ════════════════════════════════════════════════════════

struct ConnectivityChangedEvent {
    bool online = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SyncStatusChangedEvent {
    sync::SyncStatus from = sync::SyncStatus::Idle;
    sync::SyncStatus to = sync::SyncStatus::Idle;
    std::string error;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SyncStartedEvent {
    sync::SyncTrigger trigger = sync::SyncTrigger::Manual;
    std::size_t pending_actions = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SyncCompletedEvent {
    sync::SyncReport report;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SyncFailedEvent {
    std::string error_message;
    sync::SyncReport report;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace lsync::events
