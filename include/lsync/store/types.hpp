#pragma once

#include "lsync/core/clock.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <utility>

namespace lsync::store {

/// Reserved collection names; entity collections must not start with '_'.
inline constexpr const char* kActionsCollection = "_actions";
inline constexpr const char* kQueueStateCollection = "_queue";
inline constexpr const char* kDownloadsCollection = "_downloads";
inline constexpr const char* kCacheEntriesCollection = "_cache_entries";
inline constexpr const char* kCachePayloadsCollection = "_cache_payloads";
inline constexpr const char* kCursorsCollection = "_cursors";
inline constexpr const char* kQuarantineCollection = "_quarantine";

/**
 * @brief One row of the store as seen by scans
 */
struct StoredRecord {
    std::string collection;
    std::string id;
    nlohmann::json body;
};

/**
 * @brief Single mutation inside an atomic transact() batch
 */
struct StoreOp {
    enum class Kind {
        Put,
        Delete
    };

    Kind kind = Kind::Put;
    std::string collection;
    std::string id;
    nlohmann::json body;

    static StoreOp put(std::string collection, std::string id, nlohmann::json body) {
        return StoreOp{Kind::Put, std::move(collection), std::move(id), std::move(body)};
    }

    static StoreOp remove(std::string collection, std::string id) {
        return StoreOp{Kind::Delete, std::move(collection), std::move(id), nullptr};
    }
};

/**
 * @brief Locally cached domain entity (course, lesson, progress mark, ...)
 *
 * data holds the entity document; each top-level member is a field group
 * for last-writer-wins, with its local modification time in field_times.
 */
struct EntityRecord {
    std::string collection;
    std::string id;
    nlohmann::json data = nlohmann::json::object();
    std::map<std::string, Timestamp> field_times;
    Timestamp last_synced_at = 0;
    Timestamp remote_updated_at = 0;
    bool dirty = false;
    bool available_offline = false;
    std::string local_path;

    [[nodiscard]] std::string key() const { return collection + "/" + id; }
};

void to_json(nlohmann::json& j, const EntityRecord& record);
void from_json(const nlohmann::json& j, EntityRecord& record);

std::string make_entity_key(const std::string& collection, const std::string& id);

/// Splits "collection/id" at the first '/'; nullopt when either side is empty.
std::optional<std::pair<std::string, std::string>> split_entity_key(const std::string& key);

/// True for names usable as entity collections (non-empty, no leading '_').
bool is_entity_collection(const std::string& collection) noexcept;

} // namespace lsync::store
