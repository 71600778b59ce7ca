#pragma once

/**
 * @file local_store.hpp
 * @brief Durable, typed key-value persistence for entities and engine state
 *
 * WHY THIS FILE EXISTS:
 * Everything the engine knows while offline lives here: entity records,
 * the offline action log, the download registry, cache entries and sync
 * cursors. It is the only shared mutable state between the engine's
 * asynchronous tasks.
 *
 * WHAT PROBLEM IT SOLVES:
 * - Survives process restarts (SQLite file, WAL journal)
 * - All-or-nothing multi-record writes through transact(), so a pulled
 *   batch or an eviction round is either fully visible or not at all
 * - A monotonic revision counter that readers can compare instead of
 *   re-reading payloads
 *
 * DATA LAYOUT:
 * One physical table keyed by (collection, id) holding JSON text. A
 * "collection" is the logical table: entity collections ("courses",
 * "lessons", ...) plus the reserved "_actions", "_downloads",
 * "_cache_entries", "_cache_payloads", "_cursors" and "_quarantine".
 *
 * THREAD SAFETY:
 * One connection, serialized by a mutex. Lazy scans page through the
 * collection and never keep a statement open between pages, so an
 * abandoned cursor cannot block writers.
 *
 * EXAMPLE USAGE:
 * LocalStore store(":memory:");
 * store.put("courses", "c1", {{"title", "Algebra"}});
 * auto course = store.get("courses", "c1");
 *
 * auto cursor = store.scan("courses", [](const StoredRecord& r) {
 *     return r.body.value("published", false);
 * });
 * while (auto record = cursor.next()) { ... }
 */

#include "lsync/core/result.hpp"
#include "lsync/store/sqlite_db.hpp"
#include "lsync/store/types.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lsync::store {

using RecordPredicate = std::function<bool(const StoredRecord&)>;

class LocalStore;

/**
 * @brief Lazy, forward-only sequence of records from one collection
 *
 * Records come back in id order. A row whose JSON cannot be decoded is
 * skipped, logged and reported through corrupt_ids(); it is never handed
 * to the predicate.
 */
class RecordCursor {
public:
    RecordCursor(const LocalStore& store, std::string collection, RecordPredicate predicate,
                 std::size_t page_size);

    std::optional<StoredRecord> next();

    /// Drains the remainder of the sequence.
    std::vector<StoredRecord> collect();

    const std::vector<std::string>& corrupt_ids() const noexcept { return corrupt_ids_; }

    /// Set when a page could not be read; the sequence ends early.
    const std::optional<Error>& error() const noexcept { return error_; }

private:
    bool fetch_page();

    const LocalStore* store_;
    std::string collection_;
    RecordPredicate predicate_;
    std::size_t page_size_;
    std::string last_id_;
    bool started_ = false;
    bool exhausted_ = false;
    std::deque<StoredRecord> buffer_;
    std::vector<std::string> corrupt_ids_;
    std::optional<Error> error_;
};

class LocalStore {
public:
    /**
     * Opens (creating if needed) the store at path; ":memory:" for an
     * in-memory database. Throws std::runtime_error if the file cannot be
     * opened or the schema cannot be created.
     */
    explicit LocalStore(const std::string& path, std::size_t scan_page_size = 256);

    LocalStore(const LocalStore&) = delete;
    LocalStore& operator=(const LocalStore&) = delete;

    /**
     * Insert or replace a record.
     *
     * Advances the revision counter by one.
     */
    Result<void> put(const std::string& collection, const std::string& id, const nlohmann::json& record);

    /**
     * Read a record.
     *
     * @return the record, NotFound, or CorruptLocalState when the stored
     *         text is not valid JSON
     */
    Result<nlohmann::json> get(const std::string& collection, const std::string& id) const;

    /// Raw stored text, used to quarantine undecodable records.
    Result<std::string> get_raw(const std::string& collection, const std::string& id) const;

    /**
     * Delete a record; NotFound if it does not exist.
     *
     * Advances the revision counter by one.
     */
    Result<void> remove(const std::string& collection, const std::string& id);

    bool exists(const std::string& collection, const std::string& id) const;

    /**
     * Lazily enumerate a collection.
     *
     * @param predicate optional filter; an empty predicate accepts everything
     */
    RecordCursor scan(const std::string& collection, RecordPredicate predicate = {}) const;

    /**
     * Apply a batch of puts and deletes atomically.
     *
     * Either every op is applied (and the revision advances by ops.size())
     * or none is. Deleting a missing record inside a batch is not an error.
     */
    Result<void> transact(const std::vector<StoreOp>& ops);

    /**
     * Move a record into the quarantine collection.
     *
     * The raw text is preserved under "_quarantine/<collection>/<id>" with
     * the reason and time, and the original row is deleted, in one
     * transaction.
     */
    Result<void> quarantine(const std::string& collection, const std::string& id,
                            const std::string& reason, Timestamp at);

    /// The _quarantine put that quarantine() commits, for callers batching it into transact().
    static StoreOp quarantine_op(const std::string& collection, const std::string& id,
                                 const std::string& raw, const std::string& reason, Timestamp at);

    /// Deletes every record of a collection in one transaction.
    Result<void> clear_collection(const std::string& collection);

    std::uint64_t revision() const noexcept { return revision_.load(); }

    std::size_t count(const std::string& collection) const;

    std::vector<std::string> collections() const;

    template<typename T>
    Result<T> get_as(const std::string& collection, const std::string& id) const {
        auto raw = get(collection, id);
        if (raw.is_error()) {
            return Err<T>(raw.error());
        }
        try {
            return Ok(raw.value().template get<T>());
        } catch (const nlohmann::json::exception& e) {
            return Err<T>(ErrorCode::CorruptLocalState,
                          "Cannot decode " + collection + "/" + id + ": " + e.what());
        }
    }

    template<typename T>
    Result<void> put_as(const std::string& collection, const std::string& id, const T& value) {
        return put(collection, id, nlohmann::json(value));
    }

private:
    friend class RecordCursor;

    struct RawRow {
        std::string id;
        std::string body;
    };

    void create_schema();

    Result<std::vector<RawRow>> fetch_page(const std::string& collection, const std::string& after_id,
                                           bool first_page, std::size_t limit) const;

    // Callers hold mutex_ and an open transaction
    Result<void> apply_locked(const StoreOp& op);
    Result<void> write_revision_locked(std::uint64_t revision);
    Result<void> run_in_transaction_locked(const std::function<Result<void>()>& body,
                                           std::uint64_t revision_delta);

    static Result<void> validate_key(const std::string& collection, const std::string& id);

    std::unique_ptr<SqliteDb> db_;
    std::size_t scan_page_size_;
    mutable std::mutex mutex_;
    std::atomic<std::uint64_t> revision_{0};
};

} // namespace lsync::store
