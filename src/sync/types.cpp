#include "lsync/sync/types.hpp"

namespace lsync::sync {

const char* to_string(SyncStatus status) noexcept {
    switch (status) {
        case SyncStatus::Idle: return "idle";
        case SyncStatus::Syncing: return "syncing";
        case SyncStatus::Error: return "error";
    }
    return "error";
}

const char* to_string(SyncTrigger trigger) noexcept {
    switch (trigger) {
        case SyncTrigger::Manual: return "manual";
        case SyncTrigger::Reconnect: return "reconnect";
        case SyncTrigger::Periodic: return "periodic";
    }
    return "manual";
}

void to_json(nlohmann::json& j, const SyncCursor& cursor) {
    j = nlohmann::json{
        {"collection", cursor.collection},
        {"cursor", cursor.cursor},
        {"lastPullAt", cursor.last_pull_at},
    };
}

void from_json(const nlohmann::json& j, SyncCursor& cursor) {
    j.at("collection").get_to(cursor.collection);
    j.at("cursor").get_to(cursor.cursor);
    cursor.last_pull_at = j.value("lastPullAt", Timestamp{0});
}

} // namespace lsync::sync
