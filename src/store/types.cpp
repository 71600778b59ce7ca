#include "lsync/store/types.hpp"

namespace lsync::store {

void to_json(nlohmann::json& j, const EntityRecord& record) {
    j = nlohmann::json{
        {"collection", record.collection},
        {"id", record.id},
        {"data", record.data},
        {"fieldTimes", record.field_times},
        {"lastSyncedAt", record.last_synced_at},
        {"remoteUpdatedAt", record.remote_updated_at},
        {"dirty", record.dirty},
        {"availableOffline", record.available_offline},
        {"localPath", record.local_path},
    };
}

void from_json(const nlohmann::json& j, EntityRecord& record) {
    j.at("collection").get_to(record.collection);
    j.at("id").get_to(record.id);
    record.data = j.at("data");
    record.field_times = j.value("fieldTimes", std::map<std::string, Timestamp>{});
    record.last_synced_at = j.value("lastSyncedAt", Timestamp{0});
    record.remote_updated_at = j.value("remoteUpdatedAt", Timestamp{0});
    record.dirty = j.value("dirty", false);
    record.available_offline = j.value("availableOffline", false);
    record.local_path = j.value("localPath", std::string{});
}

std::string make_entity_key(const std::string& collection, const std::string& id) {
    return collection + "/" + id;
}

std::optional<std::pair<std::string, std::string>> split_entity_key(const std::string& key) {
    const auto slash = key.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 == key.size()) {
        return std::nullopt;
    }
    return std::make_pair(key.substr(0, slash), key.substr(slash + 1));
}

bool is_entity_collection(const std::string& collection) noexcept {
    return !collection.empty() && collection.front() != '_';
}

} // namespace lsync::store
