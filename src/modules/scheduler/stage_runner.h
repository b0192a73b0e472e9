// modules/scheduler/stage_runner.h
#ifndef RESEARCHFLOW_MODULES_SCHEDULER_STAGE_RUNNER_H
#define RESEARCHFLOW_MODULES_SCHEDULER_STAGE_RUNNER_H

#include "core/types/context.h"
#include "core/types/step.h"
#include "modules/executor/step_executor.h"
#include "modules/executor/transform_registry.h"
#include "modules/gateway/call_gateway.h"
#include "modules/trace/trace_exporter.h"
#include <optional>
#include <stop_token>
#include <string>

namespace researchflow {

// 严格顺序地执行一个阶段图。
// 每一步的写入先校验（只能新增声明过的字段），通过后才提交；
// 跳转只允许指向声明过的、位置更靠后的步骤，因此一定会终止。
class StageRunner {
public:
    StageRunner(const CallGateway& gateway, const TransformRegistry& transforms,
                TraceExporter* trace_exporter = nullptr);

    StageResult run(const StageGraph& graph,
                    StageState initial_state,
                    const std::string& trace_id,
                    std::stop_token stop = {},
                    std::optional<BudgetLimits> budget_override = std::nullopt) const;

private:
    StepExecutor executor_;
    TraceExporter* trace_exporter_;
};

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_SCHEDULER_STAGE_RUNNER_H
