// modules/store/memory_run_store.h
#ifndef RESEARCHFLOW_MODULES_STORE_MEMORY_RUN_STORE_H
#define RESEARCHFLOW_MODULES_STORE_MEMORY_RUN_STORE_H

#include "modules/store/run_store.h"
#include "core/types/context.h"
#include <map>
#include <mutex>

namespace researchflow {

// 内存存储；仍以序列化后的 JSON 保存，与持久化存储行为一致
class MemoryRunStore : public RunStore {
public:
    void save(const PipelineRun& run) override;
    std::optional<PipelineRun> load(const std::string& run_id) const override;
    std::vector<std::string> list_runs() const override;
    std::vector<std::string> list_incomplete() const override;

    int save_count() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> documents_;
    int save_count_ = 0;
};

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_STORE_MEMORY_RUN_STORE_H
