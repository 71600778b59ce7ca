#include "lsync/store/local_store.hpp"

#include "lsync/core/hash.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace lsync::store {
namespace {

constexpr const char* kSchema =
    "CREATE TABLE IF NOT EXISTS records("
    "  collection TEXT NOT NULL,"
    "  id TEXT NOT NULL,"
    "  body TEXT NOT NULL,"
    "  PRIMARY KEY(collection, id)) WITHOUT ROWID;"
    "CREATE TABLE IF NOT EXISTS meta("
    "  key TEXT PRIMARY KEY,"
    "  value INTEGER NOT NULL);"
    "INSERT OR IGNORE INTO meta(key, value) VALUES('revision', 0);";

Result<std::string> serialize(const nlohmann::json& body) {
    try {
        return Ok(body.dump());
    } catch (const nlohmann::json::exception& e) {
        return Err<std::string>(ErrorCode::InvalidArgument, std::string("Record is not serializable: ") + e.what());
    }
}

} // namespace

// ──────────────────────────────────────────────────────────
// RecordCursor
// ──────────────────────────────────────────────────────────

RecordCursor::RecordCursor(const LocalStore& store, std::string collection, RecordPredicate predicate,
                           std::size_t page_size)
    : store_(&store),
      collection_(std::move(collection)),
      predicate_(std::move(predicate)),
      page_size_(page_size == 0 ? 1 : page_size) {}

std::optional<StoredRecord> RecordCursor::next() {
    while (true) {
        if (buffer_.empty()) {
            if (exhausted_ || !fetch_page()) {
                return std::nullopt;
            }
            continue;
        }
        StoredRecord record = std::move(buffer_.front());
        buffer_.pop_front();
        if (!predicate_ || predicate_(record)) {
            return record;
        }
    }
}

std::vector<StoredRecord> RecordCursor::collect() {
    std::vector<StoredRecord> out;
    while (auto record = next()) {
        out.push_back(std::move(*record));
    }
    return out;
}

bool RecordCursor::fetch_page() {
    auto page = store_->fetch_page(collection_, last_id_, !started_, page_size_);
    started_ = true;
    if (page.is_error()) {
        spdlog::error("[Store] scan of {} stopped: {}", collection_, page.error().message);
        error_ = page.error();
        exhausted_ = true;
        return false;
    }

    auto& rows = page.value();
    if (rows.size() < page_size_) {
        exhausted_ = true;
    }
    if (rows.empty()) {
        return false;
    }
    last_id_ = rows.back().id;

    for (auto& row : rows) {
        auto body = nlohmann::json::parse(row.body, nullptr, false);
        if (body.is_discarded()) {
            spdlog::warn("[Store] skipping undecodable record {}/{}", collection_, row.id);
            corrupt_ids_.push_back(row.id);
            continue;
        }
        buffer_.push_back(StoredRecord{collection_, std::move(row.id), std::move(body)});
    }
    return true;
}

// ──────────────────────────────────────────────────────────
// LocalStore
// ──────────────────────────────────────────────────────────

LocalStore::LocalStore(const std::string& path, std::size_t scan_page_size)
    : db_(std::make_unique<SqliteDb>(path)),
      scan_page_size_(scan_page_size == 0 ? 1 : scan_page_size) {
    create_schema();
    spdlog::debug("[Store] opened {} at revision {}", path, revision_.load());
}

void LocalStore::create_schema() {
    auto result = db_->exec(kSchema);
    if (result.is_error()) {
        throw std::runtime_error("Cannot create store schema: " + result.error().message);
    }

    auto stmt = db_->prepare("SELECT value FROM meta WHERE key = 'revision';");
    if (stmt.is_error()) {
        throw std::runtime_error(stmt.error().message);
    }
    if (stmt.value().step() == SQLITE_ROW) {
        revision_ = static_cast<std::uint64_t>(stmt.value().column_int64(0));
    }
}

Result<void> LocalStore::validate_key(const std::string& collection, const std::string& id) {
    if (collection.empty()) {
        return Err<void>(ErrorCode::InvalidArgument, "collection must not be empty");
    }
    if (id.empty()) {
        return Err<void>(ErrorCode::InvalidArgument, "id must not be empty in " + collection);
    }
    return Ok();
}

Result<void> LocalStore::put(const std::string& collection, const std::string& id, const nlohmann::json& record) {
    return transact({StoreOp::put(collection, id, record)});
}

Result<nlohmann::json> LocalStore::get(const std::string& collection, const std::string& id) const {
    auto raw = get_raw(collection, id);
    if (raw.is_error()) {
        return Err<nlohmann::json>(raw.error());
    }
    auto body = nlohmann::json::parse(raw.value(), nullptr, false);
    if (body.is_discarded()) {
        return Err<nlohmann::json>(ErrorCode::CorruptLocalState,
                                   "Undecodable record " + collection + "/" + id);
    }
    return Ok(std::move(body));
}

Result<std::string> LocalStore::get_raw(const std::string& collection, const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto stmt = db_->prepare("SELECT body FROM records WHERE collection = ?1 AND id = ?2;");
    if (stmt.is_error()) {
        return Err<std::string>(stmt.error());
    }
    auto& st = stmt.value();
    st.bind_text(1, collection);
    st.bind_text(2, id);
    const int rc = st.step();
    if (rc == SQLITE_ROW) {
        return Ok(st.column_text(0));
    }
    if (rc == SQLITE_DONE) {
        return Err<std::string>(ErrorCode::NotFound, "Record not found: " + collection + "/" + id);
    }
    return Err<std::string>(translate_sqlite_error(rc), st.last_error());
}

Result<void> LocalStore::remove(const std::string& collection, const std::string& id) {
    if (!exists(collection, id)) {
        return Err<void>(ErrorCode::NotFound, "Record not found: " + collection + "/" + id);
    }
    return transact({StoreOp::remove(collection, id)});
}

bool LocalStore::exists(const std::string& collection, const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto stmt = db_->prepare("SELECT 1 FROM records WHERE collection = ?1 AND id = ?2;");
    if (stmt.is_error()) {
        spdlog::error("[Store] exists({}/{}) failed: {}", collection, id, stmt.error().message);
        return false;
    }
    stmt.value().bind_text(1, collection);
    stmt.value().bind_text(2, id);
    return stmt.value().step() == SQLITE_ROW;
}

RecordCursor LocalStore::scan(const std::string& collection, RecordPredicate predicate) const {
    return RecordCursor(*this, collection, std::move(predicate), scan_page_size_);
}

Result<std::vector<LocalStore::RawRow>> LocalStore::fetch_page(const std::string& collection,
                                                               const std::string& after_id,
                                                               bool first_page,
                                                               std::size_t limit) const {
    std::lock_guard lock(mutex_);
    auto stmt = db_->prepare(first_page
        ? "SELECT id, body FROM records WHERE collection = ?1 ORDER BY id LIMIT ?3;"
        : "SELECT id, body FROM records WHERE collection = ?1 AND id > ?2 ORDER BY id LIMIT ?3;");
    if (stmt.is_error()) {
        return Err<std::vector<RawRow>>(stmt.error());
    }
    auto& st = stmt.value();
    st.bind_text(1, collection);
    if (!first_page) {
        st.bind_text(2, after_id);
    }
    st.bind_int64(3, static_cast<std::int64_t>(limit));

    std::vector<RawRow> rows;
    int rc = SQLITE_OK;
    while ((rc = st.step()) == SQLITE_ROW) {
        rows.push_back(RawRow{st.column_text(0), st.column_text(1)});
    }
    if (rc != SQLITE_DONE) {
        return Err<std::vector<RawRow>>(translate_sqlite_error(rc), st.last_error());
    }
    return Ok(std::move(rows));
}

Result<void> LocalStore::transact(const std::vector<StoreOp>& ops) {
    for (const auto& op : ops) {
        auto valid = validate_key(op.collection, op.id);
        if (valid.is_error()) {
            return valid;
        }
    }
    if (ops.empty()) {
        return Ok();
    }

    std::lock_guard lock(mutex_);
    return run_in_transaction_locked([&]() -> Result<void> {
        for (const auto& op : ops) {
            auto applied = apply_locked(op);
            if (applied.is_error()) {
                return applied;
            }
        }
        return Ok();
    }, ops.size());
}

Result<void> LocalStore::quarantine(const std::string& collection, const std::string& id,
                                    const std::string& reason, Timestamp at) {
    auto raw = get_raw(collection, id);
    if (raw.is_error()) {
        return Err<void>(raw.error());
    }

    spdlog::warn("[Store] quarantining {}/{}: {}", collection, id, reason);
    return transact({
        quarantine_op(collection, id, raw.value(), reason, at),
        StoreOp::remove(collection, id),
    });
}

StoreOp LocalStore::quarantine_op(const std::string& collection, const std::string& id,
                                  const std::string& raw, const std::string& reason, Timestamp at) {
    nlohmann::json entry{
        {"collection", collection},
        {"id", id},
        {"rawHex", hex_encode(raw)},
        {"reason", reason},
        {"quarantinedAt", at},
    };
    return StoreOp::put(kQuarantineCollection, collection + "/" + id, std::move(entry));
}

Result<void> LocalStore::clear_collection(const std::string& collection) {
    if (collection.empty()) {
        return Err<void>(ErrorCode::InvalidArgument, "collection must not be empty");
    }
    const auto removed = count(collection);

    std::lock_guard lock(mutex_);
    return run_in_transaction_locked([&]() -> Result<void> {
        auto stmt = db_->prepare("DELETE FROM records WHERE collection = ?1;");
        if (stmt.is_error()) {
            return Err<void>(stmt.error());
        }
        stmt.value().bind_text(1, collection);
        const int rc = stmt.value().step();
        if (rc != SQLITE_DONE) {
            return Err<void>(translate_sqlite_error(rc), stmt.value().last_error());
        }
        return Ok();
    }, removed);
}

std::size_t LocalStore::count(const std::string& collection) const {
    std::lock_guard lock(mutex_);
    auto stmt = db_->prepare("SELECT COUNT(*) FROM records WHERE collection = ?1;");
    if (stmt.is_error()) {
        spdlog::error("[Store] count({}) failed: {}", collection, stmt.error().message);
        return 0;
    }
    stmt.value().bind_text(1, collection);
    if (stmt.value().step() != SQLITE_ROW) {
        return 0;
    }
    return static_cast<std::size_t>(stmt.value().column_int64(0));
}

std::vector<std::string> LocalStore::collections() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> names;
    auto stmt = db_->prepare("SELECT DISTINCT collection FROM records ORDER BY collection;");
    if (stmt.is_error()) {
        spdlog::error("[Store] listing collections failed: {}", stmt.error().message);
        return names;
    }
    while (stmt.value().step() == SQLITE_ROW) {
        names.push_back(stmt.value().column_text(0));
    }
    return names;
}

Result<void> LocalStore::apply_locked(const StoreOp& op) {
    if (op.kind == StoreOp::Kind::Delete) {
        auto stmt = db_->prepare("DELETE FROM records WHERE collection = ?1 AND id = ?2;");
        if (stmt.is_error()) {
            return Err<void>(stmt.error());
        }
        stmt.value().bind_text(1, op.collection);
        stmt.value().bind_text(2, op.id);
        const int rc = stmt.value().step();
        if (rc != SQLITE_DONE) {
            return Err<void>(translate_sqlite_error(rc), stmt.value().last_error());
        }
        return Ok();
    }

    auto text = serialize(op.body);
    if (text.is_error()) {
        return Err<void>(text.error());
    }
    auto stmt = db_->prepare("INSERT OR REPLACE INTO records(collection, id, body) VALUES(?1, ?2, ?3);");
    if (stmt.is_error()) {
        return Err<void>(stmt.error());
    }
    stmt.value().bind_text(1, op.collection);
    stmt.value().bind_text(2, op.id);
    stmt.value().bind_text(3, text.value());
    const int rc = stmt.value().step();
    if (rc != SQLITE_DONE) {
        return Err<void>(translate_sqlite_error(rc), stmt.value().last_error());
    }
    return Ok();
}

Result<void> LocalStore::write_revision_locked(std::uint64_t revision) {
    auto stmt = db_->prepare("UPDATE meta SET value = ?1 WHERE key = 'revision';");
    if (stmt.is_error()) {
        return Err<void>(stmt.error());
    }
    stmt.value().bind_int64(1, static_cast<std::int64_t>(revision));
    const int rc = stmt.value().step();
    if (rc != SQLITE_DONE) {
        return Err<void>(translate_sqlite_error(rc), stmt.value().last_error());
    }
    return Ok();
}

Result<void> LocalStore::run_in_transaction_locked(const std::function<Result<void>()>& body,
                                                   std::uint64_t revision_delta) {
    // IMMEDIATE takes the write lock up front
    auto begin = db_->exec("BEGIN IMMEDIATE;");
    if (begin.is_error()) {
        return begin;
    }

    const std::uint64_t next_revision = revision_.load() + revision_delta;
    auto result = body();
    if (result.is_ok()) {
        result = write_revision_locked(next_revision);
    }
    if (result.is_ok()) {
        result = db_->exec("COMMIT;");
    }
    if (result.is_error()) {
        auto rollback = db_->exec("ROLLBACK;");
        if (rollback.is_error()) {
            spdlog::error("[Store] rollback failed: {}", rollback.error().message);
        }
        return result;
    }

    revision_ = next_revision;
    return Ok();
}

} // namespace lsync::store
