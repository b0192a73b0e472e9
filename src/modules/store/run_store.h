// modules/store/run_store.h
#ifndef RESEARCHFLOW_MODULES_STORE_RUN_STORE_H
#define RESEARCHFLOW_MODULES_STORE_RUN_STORE_H

#include "core/types/research.h"
#include <optional>
#include <string>
#include <vector>

namespace researchflow {

// PipelineRun 的持久化；每个 run_id 一条记录，save 为覆盖写。实现必须线程安全。
// 持久化文档。模型输出可能在多字节字符中间截断，非法 UTF-8 以 U+FFFD 替换
inline std::string serialize_run(const PipelineRun& run) {
    return Value(run).dump(-1, ' ', false, Value::error_handler_t::replace);
}

class RunStore {
public:
    virtual ~RunStore() = default;

    virtual void save(const PipelineRun& run) = 0;
    virtual std::optional<PipelineRun> load(const std::string& run_id) const = 0;
    virtual std::vector<std::string> list_runs() const = 0;
    // 非终态（既非 COMPLETED 也非 FAILED）的运行
    virtual std::vector<std::string> list_incomplete() const = 0;
};

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_STORE_RUN_STORE_H
