#pragma once

#include "lsync/core/result.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <string>

namespace lsync::store {

/**
 * @brief Owning handle for one prepared statement
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind_text(int index, const std::string& value);
    void bind_int64(int index, std::int64_t value);

    /// Returns SQLITE_ROW, SQLITE_DONE or an error code.
    int step();
    void reset();

    std::string column_text(int column) const;
    std::int64_t column_int64(int column) const;

    const char* last_error() const { return sqlite3_errmsg(db_); }

private:
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief Thin RAII wrapper around a sqlite3 connection
 *
 * The constructor throws std::runtime_error when the database cannot be
 * opened or configured; everything after that reports through Result.
 */
class SqliteDb {
public:
    explicit SqliteDb(std::string path);
    ~SqliteDb();

    SqliteDb(const SqliteDb&) = delete;
    SqliteDb& operator=(const SqliteDb&) = delete;

    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }

    Result<void> exec(const std::string& sql);

    Result<Statement> prepare(const std::string& sql);

private:
    // WAL, synchronous=NORMAL and a busy timeout
    void configure();

    sqlite3* db_ = nullptr;
    std::string path_;
};

/// Maps a sqlite result code onto the engine's error taxonomy.
ErrorCode translate_sqlite_error(int rc) noexcept;

} // namespace lsync::store
