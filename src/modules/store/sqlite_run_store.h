// modules/store/sqlite_run_store.h
#ifndef RESEARCHFLOW_MODULES_STORE_SQLITE_RUN_STORE_H
#define RESEARCHFLOW_MODULES_STORE_SQLITE_RUN_STORE_H

#include "modules/store/run_store.h"
#include "modules/store/sqlite_db.h"
#include <mutex>
#include <string>

namespace researchflow {

// 表 runs(run_id 主键, state, document JSON, updated_at)
class SqliteRunStore : public RunStore {
public:
    explicit SqliteRunStore(const std::string& path);

    void save(const PipelineRun& run) override;
    std::optional<PipelineRun> load(const std::string& run_id) const override;
    std::vector<std::string> list_runs() const override;
    std::vector<std::string> list_incomplete() const override;

private:
    mutable std::mutex mutex_;
    mutable SqliteDB db_;

    void migrate();
};

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_STORE_SQLITE_RUN_STORE_H
