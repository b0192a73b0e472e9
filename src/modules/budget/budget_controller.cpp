// modules/budget/budget_controller.cpp
#include "modules/budget/budget_controller.h"
#include <chrono>

namespace researchflow {

BudgetController::BudgetController(std::optional<BudgetLimits> limits) {
    if (limits.has_value()) {
        budget_opt_.emplace(*limits);
    }
}

bool BudgetController::try_consume_step() {
    if (!budget_opt_.has_value()) {
        return true;
    }
    return budget_opt_->try_consume_step();
}

bool BudgetController::try_consume_external_call() {
    if (!budget_opt_.has_value()) {
        return true;
    }
    return budget_opt_->try_consume_external_call();
}

bool BudgetController::duration_exceeded() const {
    return budget_opt_.has_value() && budget_opt_->duration_exceeded();
}

bool BudgetController::exceeded() const {
    return budget_opt_.has_value() && budget_opt_->exceeded();
}

const std::optional<ExecutionBudget>& BudgetController::get_budget() const {
    return budget_opt_;
}

Value BudgetController::snapshot() const {
    if (!budget_opt_.has_value()) {
        return Value::object();
    }
    const auto& b = *budget_opt_;
    Value obj;
    obj["max_steps"] = b.max_steps;
    obj["max_external_calls"] = b.max_external_calls;
    obj["max_duration_sec"] = b.max_duration_sec;
    obj["steps_used"] = b.steps_used.load();
    obj["external_calls_used"] = b.external_calls_used.load();
    obj["elapsed_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - b.start_time).count();
    return obj;
}

} // namespace researchflow
