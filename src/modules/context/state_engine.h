// modules/context/state_engine.h
#ifndef RESEARCHFLOW_MODULES_CONTEXT_STATE_ENGINE_H
#define RESEARCHFLOW_MODULES_CONTEXT_STATE_ENGINE_H

#include "core/types/context.h"
#include "core/types/step.h"
#include <optional>
#include <string>

namespace researchflow {

// StageState 只增不删：每个步骤只能新增自己声明的字段
class StateEngine {
public:
    // 返回违规描述；合法时返回 std::nullopt
    static std::optional<std::string> validate_writes(const Step& step, const StageState& state, const Value& writes);

    // 新增字段合并；已有字段视为冲突并抛出 std::runtime_error
    static void merge_additive(StageState& target, const Value& writes);
};

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_CONTEXT_STATE_ENGINE_H
