#ifndef RESEARCHFLOW_COMMON_UTILS_PARSER_UTILS_H
#define RESEARCHFLOW_COMMON_UTILS_PARSER_UTILS_H

#include "core/types/step.h"
#include <string>
#include <utility>
#include <vector>

namespace researchflow {

// 从 Markdown 中按出现顺序提取带路径的 ResearchFlow 块
std::vector<std::pair<StepPath, std::string>> extract_pathed_blocks(const std::string& markdown_content);

bool is_valid_step_path(const std::string& path);

// "/research/generate_queries" -> "/research"
StepPath stage_of(const StepPath& path);

} // namespace researchflow

#endif // RESEARCHFLOW_COMMON_UTILS_PARSER_UTILS_H
