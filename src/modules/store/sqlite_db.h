// modules/store/sqlite_db.h
#ifndef RESEARCHFLOW_MODULES_STORE_SQLITE_DB_H
#define RESEARCHFLOW_MODULES_STORE_SQLITE_DB_H

#include <sqlite3.h>
#include <memory>
#include <string>

namespace researchflow {

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

// sqlite3* 的 RAII 封装
class SqliteDB {
public:
    explicit SqliteDB(std::string path);
    ~SqliteDB();

    SqliteDB(const SqliteDB&) = delete;
    SqliteDB& operator=(const SqliteDB&) = delete;

    sqlite3* handle() const { return db_; }

    void exec(const std::string& sql);
    StatementPtr prepare(const std::string& sql);

    // 失败时抛出 std::runtime_error
    void check(int rc, const char* what) const;

private:
    sqlite3* db_ = nullptr;
    std::string path_;

    void configure();
};

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_STORE_SQLITE_DB_H
