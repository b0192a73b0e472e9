// modules/trace/trace_exporter.h
#ifndef RESEARCHFLOW_MODULES_TRACE_TRACE_EXPORTER_H
#define RESEARCHFLOW_MODULES_TRACE_TRACE_EXPORTER_H

#include "core/types/context.h"
#include "core/types/step.h"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace researchflow {

struct TraceRecord {
    std::string trace_id;           // run_id 或 run_id#section
    StepPath step_path;
    std::string kind;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::string status;             // "running", "success", "failed"
    std::optional<std::string> error_code;
    Value state_delta;              // 本步骤新增的字段
    Value budget_snapshot;
    Value metadata;
};

Value trace_to_json(const TraceRecord& record);

// 并发的子流水线共享同一个导出器
class TraceExporter {
public:
    void on_step_start(const std::string& trace_id, const Step& step, const Value& budget_snapshot);

    void on_step_end(
        const std::string& trace_id,
        const StepPath& path,
        const std::string& status,
        const std::optional<std::string>& error_code,
        const Value& state_delta,
        const Value& budget_snapshot
    );

    std::vector<TraceRecord> get_traces() const;
    // trace_id 等于 prefix 或以 "prefix#" 开头
    std::vector<TraceRecord> get_traces(const std::string& trace_prefix) const;
    Value export_json(const std::string& trace_prefix) const;
    void clear_traces();
    // 删除一个运行（含其章节子流水线）的记录，返回删除条数
    size_t clear_traces(const std::string& trace_prefix);

private:
    mutable std::mutex mutex_;
    std::vector<TraceRecord> traces_;
};

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_TRACE_TRACE_EXPORTER_H
