#pragma once

#include "lsync/core/clock.hpp"
#include "lsync/core/error.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace lsync::download {

/**
 * @brief Lifecycle of a download task
 *
 * TRANSITIONS:
 * queued      -> downloading | cancelled | failed
 * downloading -> completed | failed | cancelled | paused
 * paused      -> downloading | cancelled
 * failed      -> queued       (explicit retry)
 * cancelled   -> queued       (explicit retry)
 *
 * completed is terminal.
 */
enum class DownloadStatus {
    Queued,
    Downloading,
    Paused,
    Completed,
    Failed,
    Cancelled
};

const char* to_string(DownloadStatus status) noexcept;

/// Unknown names map to Failed so a damaged registry row is never resumed blindly.
DownloadStatus download_status_from_string(const std::string& name) noexcept;

bool can_transition(DownloadStatus from, DownloadStatus to) noexcept;

/// Completed, Failed and Cancelled end a progress stream.
bool is_terminal(DownloadStatus status) noexcept;

struct DownloadTask {
    std::string id;
    std::string resource_key;       ///< Owning entity, "collection/id"
    std::string source_url;
    std::string local_path;         ///< Final destination; only ever holds a verified file
    std::string quality;
    std::uint64_t total_bytes = 0;  ///< 0 while unknown
    std::uint64_t transferred_bytes = 0;
    DownloadStatus status = DownloadStatus::Queued;
    Timestamp created_at = 0;
    Timestamp completed_at = 0;
    std::uint32_t retry_count = 0;
    std::string last_error;
    std::optional<ErrorCode> last_error_code;
    bool range_supported = false;
    std::string expected_checksum;  ///< FNV-1a hex, empty = not verified

    [[nodiscard]] std::string staging_path() const { return local_path + ".part"; }
};

void to_json(nlohmann::json& j, const DownloadTask& task);
void from_json(const nlohmann::json& j, DownloadTask& task);

struct ProgressSnapshot {
    std::string task_id;
    std::string resource_key;
    std::uint64_t transferred_bytes = 0;
    std::uint64_t total_bytes = 0;
    DownloadStatus status = DownloadStatus::Queued;

    [[nodiscard]] double percent() const {
        return total_bytes == 0 ? 0.0 : 100.0 * static_cast<double>(transferred_bytes) / static_cast<double>(total_bytes);
    }
};

struct DownloadStorageInfo {
    std::uint64_t bytes_on_disk = 0;     ///< Completed files
    std::uint64_t bytes_staged = 0;      ///< Partial .part files kept for resume
    std::map<DownloadStatus, std::size_t> tasks_by_status;
};

} // namespace lsync::download
