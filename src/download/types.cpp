#include "lsync/download/types.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace lsync::download {

const char* to_string(DownloadStatus status) noexcept {
    switch (status) {
        case DownloadStatus::Queued: return "queued";
        case DownloadStatus::Downloading: return "downloading";
        case DownloadStatus::Paused: return "paused";
        case DownloadStatus::Completed: return "completed";
        case DownloadStatus::Failed: return "failed";
        case DownloadStatus::Cancelled: return "cancelled";
    }
    return "failed";
}

DownloadStatus download_status_from_string(const std::string& name) noexcept {
    static const std::unordered_map<std::string, DownloadStatus> names {
        {"queued", DownloadStatus::Queued},
        {"downloading", DownloadStatus::Downloading},
        {"paused", DownloadStatus::Paused},
        {"completed", DownloadStatus::Completed},
        {"failed", DownloadStatus::Failed},
        {"cancelled", DownloadStatus::Cancelled},
    };
    const auto it = names.find(name);
    return it == names.end() ? DownloadStatus::Failed : it->second;
}

bool can_transition(DownloadStatus from, DownloadStatus to) noexcept {
    static const std::unordered_map<DownloadStatus, std::vector<DownloadStatus>> transitions {
        {DownloadStatus::Queued, {DownloadStatus::Downloading, DownloadStatus::Cancelled, DownloadStatus::Failed}},
        {DownloadStatus::Downloading, {DownloadStatus::Completed, DownloadStatus::Failed,
                                       DownloadStatus::Cancelled, DownloadStatus::Paused}},
        {DownloadStatus::Paused, {DownloadStatus::Downloading, DownloadStatus::Cancelled}},
        {DownloadStatus::Failed, {DownloadStatus::Queued}},
        {DownloadStatus::Cancelled, {DownloadStatus::Queued}},
    };

    const auto it = transitions.find(from);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), to) != allowed.end();
}

bool is_terminal(DownloadStatus status) noexcept {
    return status == DownloadStatus::Completed || status == DownloadStatus::Failed ||
           status == DownloadStatus::Cancelled;
}

void to_json(nlohmann::json& j, const DownloadTask& task) {
    j = nlohmann::json{
        {"id", task.id},
        {"resourceKey", task.resource_key},
        {"sourceUrl", task.source_url},
        {"localPath", task.local_path},
        {"quality", task.quality},
        {"totalBytes", task.total_bytes},
        {"transferredBytes", task.transferred_bytes},
        {"status", to_string(task.status)},
        {"createdAt", task.created_at},
        {"completedAt", task.completed_at},
        {"retryCount", task.retry_count},
        {"lastError", task.last_error},
        {"rangeSupported", task.range_supported},
        {"expectedChecksum", task.expected_checksum},
    };
    if (task.last_error_code) {
        j["lastErrorCode"] = to_string(*task.last_error_code);
    }
}

void from_json(const nlohmann::json& j, DownloadTask& task) {
    j.at("id").get_to(task.id);
    j.at("resourceKey").get_to(task.resource_key);
    j.at("sourceUrl").get_to(task.source_url);
    j.at("localPath").get_to(task.local_path);
    task.quality = j.value("quality", std::string{});
    task.total_bytes = j.value("totalBytes", std::uint64_t{0});
    task.transferred_bytes = j.value("transferredBytes", std::uint64_t{0});
    task.status = download_status_from_string(j.value("status", std::string{"failed"}));
    task.created_at = j.value("createdAt", Timestamp{0});
    task.completed_at = j.value("completedAt", Timestamp{0});
    task.retry_count = j.value("retryCount", std::uint32_t{0});
    task.last_error = j.value("lastError", std::string{});
    task.range_supported = j.value("rangeSupported", false);
    task.expected_checksum = j.value("expectedChecksum", std::string{});
    if (j.contains("lastErrorCode")) {
        task.last_error_code = error_code_from_string(j.at("lastErrorCode").get<std::string>());
    } else {
        task.last_error_code.reset();
    }
}

} // namespace lsync::download
