#include "lsync/store/sqlite_db.hpp"

#include <stdexcept>
#include <utility>

namespace lsync::store {

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        db_ = other.db_;
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

void Statement::bind_text(int index, const std::string& value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void Statement::bind_int64(int index, std::int64_t value) {
    sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
}

int Statement::step() {
    return sqlite3_step(stmt_);
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

std::string Statement::column_text(int column) const {
    const unsigned char* text = sqlite3_column_text(stmt_, column);
    if (!text) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::int64_t Statement::column_int64(int column) const {
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, column));
}

SqliteDb::SqliteDb(std::string path) : path_(std::move(path)) {
    int rc = sqlite3_open_v2(path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
        if (db_) {
            sqlite3_close(db_);
        }
        db_ = nullptr;
        throw std::runtime_error("Cannot open store " + path_ + ": " + msg);
    }

    configure();
}

SqliteDb::~SqliteDb() {
    if (db_) {
        sqlite3_close(db_);
    }
}

Result<void> SqliteDb::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        return Err<void>(translate_sqlite_error(rc), msg);
    }
    return Ok();
}

Result<Statement> SqliteDb::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Err<Statement>(translate_sqlite_error(rc),
                              std::string("sqlite prepare: ") + sqlite3_errmsg(db_));
    }
    return Ok(Statement(db_, stmt));
}

void SqliteDb::configure() {
    const char* pragmas[] = {
        "PRAGMA journal_mode=WAL;",
        "PRAGMA synchronous=NORMAL;",
        "PRAGMA temp_store=MEMORY;",
    };
    for (const char* pragma : pragmas) {
        auto result = exec(pragma);
        if (result.is_error()) {
            throw std::runtime_error("Cannot configure store " + path_ + ": " + result.error().message);
        }
    }
    if (sqlite3_busy_timeout(db_, 5000) != SQLITE_OK) {
        throw std::runtime_error(std::string("busy_timeout: ") + sqlite3_errmsg(db_));
    }
}

ErrorCode translate_sqlite_error(int rc) noexcept {
    switch (rc & 0xff) {
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return ErrorCode::CorruptLocalState;
        case SQLITE_FULL:
            return ErrorCode::QuotaExceeded;
        case SQLITE_IOERR:
        case SQLITE_CANTOPEN:
            return ErrorCode::Io;
        default:
            return ErrorCode::Storage;
    }
}

} // namespace lsync::store
