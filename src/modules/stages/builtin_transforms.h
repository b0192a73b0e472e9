// modules/stages/builtin_transforms.h
#ifndef RESEARCHFLOW_MODULES_STAGES_BUILTIN_TRANSFORMS_H
#define RESEARCHFLOW_MODULES_STAGES_BUILTIN_TRANSFORMS_H

#include "core/types/context.h"
#include "modules/executor/transform_registry.h"
#include <string>
#include <vector>

namespace researchflow {

// 注册 planning.* / research.* / report.* 变换与路由
void register_builtin_transforms(TransformRegistry& registry);

// 去掉列表符号、编号与引号后的非空行
std::vector<std::string> clean_lines(const std::string& text);

// 取文本中第一个 '{' 到最后一个 '}' 之间的内容；没有时返回空串
std::string extract_json_object(const std::string& text);

// planning
StepPath select_plan_parser(const StageState& state);
Value parse_json_plan(const StageState& state);
Value parse_line_plan(const StageState& state);

// research
Value split_queries(const StageState& state);
StepPath select_synthesis(const StageState& state);
Value extract_sources(const StageState& state);

// report
Value compile_body(const StageState& state);
Value compile_sources(const StageState& state);
Value finalize_report(const StageState& state);

int count_words(const std::string& text);

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_STAGES_BUILTIN_TRANSFORMS_H
