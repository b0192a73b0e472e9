// modules/executor/step_executor.h
#ifndef RESEARCHFLOW_MODULES_EXECUTOR_STEP_EXECUTOR_H
#define RESEARCHFLOW_MODULES_EXECUTOR_STEP_EXECUTOR_H

#include "core/types/context.h"
#include "core/types/step.h"
#include "modules/budget/budget_controller.h"
#include "modules/executor/transform_registry.h"
#include "modules/gateway/call_gateway.h"
#include <stop_token>

namespace researchflow {

// 按步骤类型分发执行。步骤不修改传入的 state，只返回新增字段与下一步选择。
// 外部调用只经由 CallGateway，步骤内部不做重试。失败时抛出 ClassifiedError。
class StepExecutor {
public:
    StepExecutor(const CallGateway& gateway, const TransformRegistry& transforms);

    StepOutput execute_step(const Step& step, const StageState& state,
                            BudgetController& budget, std::stop_token stop) const;

private:
    const CallGateway& gateway_;
    const TransformRegistry& transforms_;

    StepOutput execute_generate_text(const Step& step, const StageState& state,
                                     BudgetController& budget, std::stop_token stop) const;
    StepOutput execute_web_search(const Step& step, const StageState& state,
                                  BudgetController& budget, std::stop_token stop) const;
    StepOutput execute_transform(const Step& step, const StageState& state) const;
    StepOutput execute_route(const Step& step, const StageState& state) const;

    Value call_external(CallKind kind, const Value& payload, const Step& step,
                        BudgetController& budget, std::stop_token stop) const;
};

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_EXECUTOR_STEP_EXECUTOR_H
