#ifndef RESEARCHFLOW_TYPES_BUDGET_H
#define RESEARCHFLOW_TYPES_BUDGET_H

#include <atomic>
#include <chrono>

namespace researchflow {

// 阶段预算上限（可拷贝，随 StageGraph 一起保存）
struct BudgetLimits {
    int max_steps = -1;           // -1 表示无限制
    int max_external_calls = -1;
    int max_duration_sec = -1;
};

// 单次阶段执行的预算计数
struct ExecutionBudget {
    int max_steps = -1;
    int max_external_calls = -1;
    int max_duration_sec = -1;

    mutable std::atomic<int> steps_used{0};
    mutable std::atomic<int> external_calls_used{0};
    std::chrono::steady_clock::time_point start_time;

    ExecutionBudget() : start_time(std::chrono::steady_clock::now()) {}

    explicit ExecutionBudget(const BudgetLimits& limits)
        : max_steps(limits.max_steps),
          max_external_calls(limits.max_external_calls),
          max_duration_sec(limits.max_duration_sec),
          start_time(std::chrono::steady_clock::now()) {}

    // 移动时重置计数器
    ExecutionBudget(ExecutionBudget&& other) noexcept
        : max_steps(other.max_steps),
          max_external_calls(other.max_external_calls),
          max_duration_sec(other.max_duration_sec),
          steps_used(0),
          external_calls_used(0),
          start_time(std::chrono::steady_clock::now())
    {}

    ExecutionBudget& operator=(ExecutionBudget&& other) noexcept {
        if (this != &other) {
            max_steps = other.max_steps;
            max_external_calls = other.max_external_calls;
            max_duration_sec = other.max_duration_sec;
            steps_used = 0;
            external_calls_used = 0;
            start_time = std::chrono::steady_clock::now();
        }
        return *this;
    }

    ExecutionBudget(const ExecutionBudget&) = delete;
    ExecutionBudget& operator=(const ExecutionBudget&) = delete;

    bool duration_exceeded() const {
        if (max_duration_sec < 0) return false;
        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - start_time).count();
        return elapsed >= max_duration_sec;
    }

    bool exceeded() const {
        if (max_steps >= 0 && steps_used.load() > max_steps) return true;
        if (max_external_calls >= 0 && external_calls_used.load() > max_external_calls) return true;
        return duration_exceeded();
    }

    bool try_consume_step() {
        int expected = steps_used.load();
        do {
            if (max_steps >= 0 && expected >= max_steps) return false;
        } while (!steps_used.compare_exchange_weak(expected, expected + 1));
        return true;
    }

    bool try_consume_external_call() {
        int expected = external_calls_used.load();
        do {
            if (max_external_calls >= 0 && expected >= max_external_calls) return false;
        } while (!external_calls_used.compare_exchange_weak(expected, expected + 1));
        return true;
    }
};

} // namespace researchflow

#endif // RESEARCHFLOW_TYPES_BUDGET_H
