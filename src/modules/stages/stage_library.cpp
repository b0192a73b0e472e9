// modules/stages/stage_library.cpp
#include "modules/stages/stage_library.h"
#include "modules/parser/markdown_parser.h"
#include <stdexcept>

namespace researchflow {

StageLibrary StageLibrary::from_markdown(const std::string& markdown) {
    MarkdownParser parser;
    StageLibrary library;
    for (auto& graph : parser.parse_from_string(markdown)) {
        auto path = graph.path;
        library.graphs_.emplace(std::move(path), std::move(graph));
    }
    return library;
}

StageLibrary StageLibrary::from_file(const std::string& file_path) {
    MarkdownParser parser;
    StageLibrary library;
    for (auto& graph : parser.parse_from_file(file_path)) {
        auto path = graph.path;
        library.graphs_.emplace(std::move(path), std::move(graph));
    }
    return library;
}

StageLibrary StageLibrary::builtin() {
    return from_markdown(builtin_stage_markdown());
}

bool StageLibrary::has(const StepPath& stage) const {
    return graphs_.count(stage) > 0;
}

const StageGraph& StageLibrary::get(const StepPath& stage) const {
    auto it = graphs_.find(stage);
    if (it == graphs_.end()) {
        throw std::runtime_error("Stage graph not defined: " + stage);
    }
    return it->second;
}

std::vector<StepPath> StageLibrary::stages() const {
    std::vector<StepPath> out;
    for (const auto& [path, _] : graphs_) {
        out.push_back(path);
    }
    return out;
}

void StageLibrary::validate_against(const TransformRegistry& registry) const {
    for (const auto& stage : {PLANNING_STAGE, RESEARCH_STAGE, REPORT_STAGE}) {
        if (!has(stage)) {
            throw std::runtime_error("Stage graph not defined: " + stage);
        }
    }
    for (const auto& [path, graph] : graphs_) {
        for (const auto& step : graph.steps) {
            if (step.kind == StepKind::TRANSFORM && !registry.has_transform(step.transform)) {
                throw std::runtime_error("Step " + step.path + " uses unknown transform '" + step.transform + "'");
            }
            if (step.kind == StepKind::ROUTE && !registry.has_route(step.route)) {
                throw std::runtime_error("Step " + step.path + " uses unknown route '" + step.route + "'");
            }
        }
    }
}

} // namespace researchflow
