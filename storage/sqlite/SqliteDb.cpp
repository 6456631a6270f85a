#include "SqliteDb.hpp"
#include "../../core/Errors.hpp"
#include <iostream>

namespace datalogger::storage {

namespace {

void throwIf(int rc, sqlite3* db, const char* what) {
    if (rc != SQLITE_OK) {
        throw StorageError(std::string(what) + ": " + sqlite3_errmsg(db));
    }
}

} // namespace

SqliteDb::SqliteDb(std::string path) : path_(std::move(path)) {
    int rc = sqlite3_open_v2(path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("cannot open " + path_ + ": " + msg);
    }

    try {
        configure();
    } catch (const StorageError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteDb::~SqliteDb() {
    if (db_) sqlite3_close(db_);
}

void SqliteDb::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        throw StorageError(msg);
    }
}

Statement SqliteDb::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    throwIf(rc, db_, "sqlite prepare");
    return Statement(stmt);
}

void SqliteDb::stepDone(sqlite3_stmt* stmt, const char* what) {
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        throw StorageError(std::string(what) + ": " + sqlite3_errmsg(db_));
    }
}

bool SqliteDb::stepRow(sqlite3_stmt* stmt, const char* what) {
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw StorageError(std::string(what) + ": " + sqlite3_errmsg(db_));
}

std::int64_t SqliteDb::changes() const {
    return sqlite3_changes(db_);
}

void SqliteDb::configure() {
    // WAL lets inspection reads run while a forward worker writes
    exec("PRAGMA journal_mode=WAL;");

    // A record is only acknowledged after it is on disk
    exec("PRAGMA synchronous=FULL;");

    throwIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

    exec("PRAGMA temp_store=MEMORY;");
}

Transaction::Transaction(SqliteDb& db) : db_(db) {
    db_.exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
    if (!done_) {
        char* err = nullptr;
        if (sqlite3_exec(db_.handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
            std::cerr << "[Queue] Rollback failed: " << (err ? err : "unknown") << std::endl;
        }
        sqlite3_free(err);
    }
}

void Transaction::commit() {
    db_.exec("COMMIT;");
    done_ = true;
}

} // namespace datalogger::storage
