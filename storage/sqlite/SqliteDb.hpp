#pragma once

#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <string>

namespace datalogger::storage {

/// Finalizes a prepared statement when it goes out of scope
struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/**
 * Thin RAII owner of a sqlite3 connection. Every failure throws StorageError
 * carrying SQLite's message.
 */
class SqliteDb {
public:
    explicit SqliteDb(std::string path);
    ~SqliteDb();

    SqliteDb(const SqliteDb&) = delete;
    SqliteDb& operator=(const SqliteDb&) = delete;

    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }

    /// Run one or more statements without results (schema, pragmas, BEGIN/COMMIT)
    void exec(const std::string& sql);

    Statement prepare(const std::string& sql);

    /// sqlite3_step expecting SQLITE_DONE
    void stepDone(sqlite3_stmt* stmt, const char* what);

    /// sqlite3_step returning true for SQLITE_ROW, false for SQLITE_DONE
    bool stepRow(sqlite3_stmt* stmt, const char* what);

    std::int64_t changes() const;

private:
    sqlite3* db_ = nullptr;
    std::string path_;

    void configure();
};

/// Commits on commit(), rolls back if destroyed first
class Transaction {
public:
    explicit Transaction(SqliteDb& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    SqliteDb& db_;
    bool done_ = false;
};

} // namespace datalogger::storage
