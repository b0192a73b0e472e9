// modules/parser/markdown_parser.h
#ifndef RESEARCHFLOW_MODULES_PARSER_MARKDOWN_PARSER_H
#define RESEARCHFLOW_MODULES_PARSER_MARKDOWN_PARSER_H

#include "core/types/step.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace researchflow {

// 解析 Markdown 中的阶段图定义：
//   ### ResearchFlow `/<stage>/<step>`   -> 一个步骤（按出现顺序）
//   ### ResearchFlow `/<stage>/__meta__` -> 阶段预算
class MarkdownParser {
public:
    std::vector<StageGraph> parse_from_string(const std::string& markdown_content);
    std::vector<StageGraph> parse_from_file(const std::string& file_path);

    Step create_step_from_json(const StepPath& path, const nlohmann::json& step_json);

    // 路径唯一、跳转目标存在且严格向前、字段齐全；违规抛出 std::runtime_error
    static void validate_graph(const StageGraph& graph);
};

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_PARSER_MARKDOWN_PARSER_H
