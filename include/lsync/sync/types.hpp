#pragma once

#include "lsync/core/clock.hpp"
#include "lsync/core/error.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lsync::sync {

/**
 * @brief Observable state of the orchestrator
 *
 * idle -> syncing -> idle | error; error -> syncing on the next run.
 */
enum class SyncStatus {
    Idle,
    Syncing,
    Error
};

const char* to_string(SyncStatus status) noexcept;

enum class SyncTrigger {
    Manual,
    Reconnect,
    Periodic
};

const char* to_string(SyncTrigger trigger) noexcept;

/**
 * @brief One record as the remote store reports it
 *
 * updated_at is the remote's modification time in milliseconds; deleted
 * marks a tombstone.
 */
struct RemoteRecord {
    std::string collection;
    std::string id;
    nlohmann::json data = nlohmann::json::object();
    Timestamp updated_at = 0;
    bool deleted = false;
};

struct PullBatch {
    std::vector<RemoteRecord> records;
    std::int64_t new_cursor = 0;
    bool has_more = false;
};

/// Per-collection watermark of the last committed pull.
struct SyncCursor {
    std::string collection;
    std::int64_t cursor = 0;
    Timestamp last_pull_at = 0;
};

void to_json(nlohmann::json& j, const SyncCursor& cursor);
void from_json(const nlohmann::json& j, SyncCursor& cursor);

struct SyncReport {
    SyncTrigger trigger = SyncTrigger::Manual;
    bool online = false;
    bool cancelled = false;
    std::size_t actions_succeeded = 0;
    std::size_t actions_retried = 0;
    std::size_t actions_abandoned = 0;
    std::size_t conflicts = 0;
    std::size_t records_pulled = 0;
    std::size_t records_deleted = 0;
    std::size_t records_quarantined = 0;
    std::size_t pages_committed = 0;
    std::size_t cache_entries_expired = 0;
    std::size_t downloads_cleaned = 0;
    std::optional<Error> push_error;
    std::optional<Error> pull_error;
    std::chrono::milliseconds duration{0};

    [[nodiscard]] bool ok() const { return !pull_error.has_value() && !cancelled; }
};

} // namespace lsync::sync
