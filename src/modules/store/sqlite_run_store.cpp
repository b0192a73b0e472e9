// modules/store/sqlite_run_store.cpp
#include "modules/store/sqlite_run_store.h"
#include "core/types/context.h"

namespace researchflow {

namespace {

void bind_text(SqliteDB& db, sqlite3_stmt* stmt, int index, const std::string& value) {
    db.check(sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT),
             "sqlite bind");
}

std::string column_text(sqlite3_stmt* stmt, int index) {
    const unsigned char* text = sqlite3_column_text(stmt, index);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(sqlite3_column_bytes(stmt, index)));
}

} // namespace

SqliteRunStore::SqliteRunStore(const std::string& path) : db_(path) {
    migrate();
}

void SqliteRunStore::migrate() {
    db_.exec(
        "CREATE TABLE IF NOT EXISTS runs ("
        "  run_id TEXT PRIMARY KEY,"
        "  state TEXT NOT NULL,"
        "  document TEXT NOT NULL,"
        "  updated_at INTEGER NOT NULL"
        ");");
    db_.exec("CREATE INDEX IF NOT EXISTS runs_state_idx ON runs(state);");
}

void SqliteRunStore::save(const PipelineRun& run) {
    std::string document = serialize_run(run);

    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare(
        "INSERT INTO runs(run_id, state, document, updated_at) VALUES(?, ?, ?, ?) "
        "ON CONFLICT(run_id) DO UPDATE SET state = excluded.state, "
        "document = excluded.document, updated_at = excluded.updated_at;");
    bind_text(db_, stmt.get(), 1, run.run_id);
    bind_text(db_, stmt.get(), 2, to_string(run.state));
    bind_text(db_, stmt.get(), 3, document);
    db_.check(sqlite3_bind_int64(stmt.get(), 4, run.updated_at), "sqlite bind");
    db_.check(sqlite3_step(stmt.get()), "save run");
}

std::optional<PipelineRun> SqliteRunStore::load(const std::string& run_id) const {
    std::string document;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmt = db_.prepare("SELECT document FROM runs WHERE run_id = ?;");
        bind_text(db_, stmt.get(), 1, run_id);
        int rc = sqlite3_step(stmt.get());
        db_.check(rc, "load run");
        if (rc != SQLITE_ROW) {
            return std::nullopt;
        }
        document = column_text(stmt.get(), 0);
    }
    return Value::parse(document).get<PipelineRun>();
}

std::vector<std::string> SqliteRunStore::list_runs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare("SELECT run_id FROM runs ORDER BY updated_at;");
    std::vector<std::string> ids;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        ids.push_back(column_text(stmt.get(), 0));
    }
    db_.check(rc, "list runs");
    return ids;
}

std::vector<std::string> SqliteRunStore::list_incomplete() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare(
        "SELECT run_id FROM runs WHERE state NOT IN ('completed', 'failed') ORDER BY updated_at;");
    std::vector<std::string> ids;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        ids.push_back(column_text(stmt.get(), 0));
    }
    db_.check(rc, "list incomplete runs");
    return ids;
}

} // namespace researchflow
