#ifndef RESEARCHFLOW_TYPES_STEP_H
#define RESEARCHFLOW_TYPES_STEP_H

#include "context.h"
#include "budget.h"
#include "error.h"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace researchflow {

// 步骤路径，例如 "/research/generate_queries"
using StepPath = std::string;

inline const StepPath END_OF_STAGE = "/end";

enum class StepKind : uint8_t {
    GENERATE_TEXT,
    WEB_SEARCH,
    TRANSFORM,
    ROUTE
};

std::string to_string(StepKind kind);
std::optional<StepKind> parse_step_kind(const std::string& text);

// 下一步选择器
struct Continue {};
struct JumpTo {
    StepPath target;
};
struct Finish {};
using NextStep = std::variant<Continue, JumpTo, Finish>;

struct StepOutput {
    Value writes = Value::object(); // 只允许新增字段
    NextStep next = Continue{};
};

struct Step {
    StepPath path;
    StepKind kind = StepKind::TRANSFORM;
    std::vector<std::string> output_keys;
    std::optional<StepPath> next;       // 默认后继；缺省为列表中的下一步
    std::vector<StepPath> branches;     // route 可选目标
    std::string prompt_template;        // generate_text
    std::string queries_key;            // web_search
    std::string max_results;            // web_search，可为模板
    std::string transform;              // transform
    std::string route;                  // route
    Value metadata = Value::object();
};

struct StageGraph {
    StepPath path;                      // 例如 "/research"
    std::vector<Step> steps;
    std::optional<BudgetLimits> budget;

    std::optional<size_t> index_of(const StepPath& step_path) const {
        for (size_t i = 0; i < steps.size(); ++i) {
            if (steps[i].path == step_path) return i;
        }
        return std::nullopt;
    }
};

struct StageResult {
    bool success = false;
    std::string message;
    StageState final_state;
    std::optional<ErrorKind> error;
    std::optional<StepPath> failed_at;
    int steps_executed = 0;
};

} // namespace researchflow

#endif // RESEARCHFLOW_TYPES_STEP_H
