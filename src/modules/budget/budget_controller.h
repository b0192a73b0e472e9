// modules/budget/budget_controller.h
#ifndef RESEARCHFLOW_MODULES_BUDGET_BUDGET_CONTROLLER_H
#define RESEARCHFLOW_MODULES_BUDGET_BUDGET_CONTROLLER_H

#include "core/types/budget.h"
#include "core/types/context.h"
#include <optional>

namespace researchflow {

// 单次阶段执行的预算管理；没有预算时一切放行
class BudgetController {
public:
    explicit BudgetController(std::optional<BudgetLimits> limits = std::nullopt);

    bool try_consume_step();
    bool try_consume_external_call();

    bool duration_exceeded() const;
    bool exceeded() const;

    const std::optional<ExecutionBudget>& get_budget() const;

    // 供 Trace 使用的预算快照
    Value snapshot() const;

private:
    std::optional<ExecutionBudget> budget_opt_;
};

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_BUDGET_BUDGET_CONTROLLER_H
