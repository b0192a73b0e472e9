// modules/store/sqlite_db.cpp
#include "modules/store/sqlite_db.h"
#include <stdexcept>

namespace researchflow {

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
    int rc = sqlite3_open_v2(path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot open run store '" + path_ + "': " + msg);
    }
    configure();
}

SqliteDB::~SqliteDB() {
    if (db_) sqlite3_close(db_);
}

void SqliteDB::check(int rc, const char* what) const {
    if (rc != SQLITE_OK && rc != SQLITE_DONE && rc != SQLITE_ROW) {
        throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db_));
    }
}

void SqliteDB::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        throw std::runtime_error(msg);
    }
}

StatementPtr SqliteDB::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    check(sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr), "sqlite prepare");
    return StatementPtr(stmt, sqlite3_finalize);
}

void SqliteDB::configure() {
    // WAL：写入时仍可并发读取
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=NORMAL;");
    check(sqlite3_busy_timeout(db_, 5000), "busy_timeout");
}

} // namespace researchflow
