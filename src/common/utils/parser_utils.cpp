// common/utils/parser_utils.cpp
#include "common/utils/parser_utils.h"
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace researchflow {

std::vector<std::pair<StepPath, std::string>> extract_pathed_blocks(const std::string& markdown_content) {
    std::vector<std::pair<StepPath, std::string>> blocks;

    // 捕获组 1: 路径；捕获组 2: BEGIN/END 之间的 YAML
    static const std::regex block_pattern(
        R"(#\s+ResearchFlow\s+`([^`]+)`\s*\n)"
        R"(```(?:yaml)?\s*\n)"
        R"(# --- BEGIN ResearchFlow ---\s*\n)"
        R"(([\s\S]*?))"
        R"(\n# --- END ResearchFlow ---\s*\n)"
        R"(```)",
        std::regex::ECMAScript
    );

    std::sregex_iterator begin(markdown_content.begin(), markdown_content.end(), block_pattern);
    std::sregex_iterator end;

    for (std::sregex_iterator it = begin; it != end; ++it) {
        blocks.emplace_back((*it)[1].str(), (*it)[2].str());
    }
    return blocks;
}

bool is_valid_step_path(const std::string& path) {
    static const std::regex valid(R"(^/[\w\-]+(/[\w\-]+)*$)");
    return std::regex_match(path, valid);
}

StepPath stage_of(const StepPath& path) {
    auto pos = path.find('/', 1);
    if (pos == std::string::npos) return path;
    return path.substr(0, pos);
}

} // namespace researchflow
