// modules/stages/stage_library.h
#ifndef RESEARCHFLOW_MODULES_STAGES_STAGE_LIBRARY_H
#define RESEARCHFLOW_MODULES_STAGES_STAGE_LIBRARY_H

#include "core/types/step.h"
#include "modules/executor/transform_registry.h"
#include <map>
#include <string>
#include <vector>

namespace researchflow {

inline const StepPath PLANNING_STAGE = "/planning";
inline const StepPath RESEARCH_STAGE = "/research";
inline const StepPath REPORT_STAGE = "/report";

// 内置的三个阶段图定义（Markdown）
const std::string& builtin_stage_markdown();

// 已解析、已校验的阶段图集合
class StageLibrary {
public:
    static StageLibrary from_markdown(const std::string& markdown);
    static StageLibrary from_file(const std::string& file_path);
    static StageLibrary builtin();

    bool has(const StepPath& stage) const;
    // 不存在时抛出 std::runtime_error
    const StageGraph& get(const StepPath& stage) const;
    std::vector<StepPath> stages() const;

    // 三个阶段齐全，且引用的变换与路由都已注册
    void validate_against(const TransformRegistry& registry) const;

private:
    std::map<StepPath, StageGraph> graphs_;
};

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_STAGES_STAGE_LIBRARY_H
