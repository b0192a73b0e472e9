// modules/parser/markdown_parser.cpp
#include "modules/parser/markdown_parser.h"
#include "common/utils/parser_utils.h"
#include "common/utils/yaml_json.h"
#include "common/utils/logging.h"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace researchflow {

// output_keys 可以是字符串或数组
inline std::vector<std::string> parse_output_keys(const nlohmann::json& step_json, const StepPath& path) {
    if (!step_json.contains("output_keys")) {
        return {};
    }
    const auto& ok = step_json["output_keys"];
    if (ok.is_string()) {
        return {ok.get<std::string>()};
    } else if (ok.is_array()) {
        std::vector<std::string> keys;
        for (const auto& k : ok) {
            keys.push_back(k.get<std::string>());
        }
        return keys;
    }
    throw std::runtime_error("'output_keys' must be string or array in step: " + path);
}

inline BudgetLimits parse_budget(const nlohmann::json& bj) {
    BudgetLimits limits;
    if (bj.contains("max_steps") && bj["max_steps"].is_number_integer()) {
        limits.max_steps = bj["max_steps"].get<int>();
    }
    if (bj.contains("max_external_calls") && bj["max_external_calls"].is_number_integer()) {
        limits.max_external_calls = bj["max_external_calls"].get<int>();
    }
    if (bj.contains("max_duration_sec") && bj["max_duration_sec"].is_number_integer()) {
        limits.max_duration_sec = bj["max_duration_sec"].get<int>();
    }
    return limits;
}

std::vector<StageGraph> MarkdownParser::parse_from_string(const std::string& markdown_content) {
    std::vector<StageGraph> graphs;
    auto pathed_blocks = extract_pathed_blocks(markdown_content);

    auto graph_for = [&graphs](const StepPath& stage) -> StageGraph& {
        for (auto& g : graphs) {
            if (g.path == stage) return g;
        }
        StageGraph graph;
        graph.path = stage;
        graphs.push_back(std::move(graph));
        return graphs.back();
    };

    for (auto& [path, yaml_content] : pathed_blocks) {
        if (!is_valid_step_path(path) || stage_of(path) == path) {
            throw std::runtime_error("Invalid step path format: " + path);
        }

        try {
            nlohmann::json json_doc = parse_yaml_text(yaml_content, "block '" + path + "'");
            StageGraph& graph = graph_for(stage_of(path));

            if (path == graph.path + "/__meta__") {
                if (json_doc.contains("budget") && json_doc["budget"].is_object()) {
                    graph.budget = parse_budget(json_doc["budget"]);
                }
                continue;
            }
            graph.steps.push_back(create_step_from_json(path, json_doc));
        } catch (const std::exception& e) {
            throw std::runtime_error("Error parsing block '" + path + "': " + std::string(e.what()));
        }
    }

    for (const auto& graph : graphs) {
        validate_graph(graph);
    }
    return graphs;
}

std::vector<StageGraph> MarkdownParser::parse_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_from_string(buffer.str());
}

Step MarkdownParser::create_step_from_json(const StepPath& path, const nlohmann::json& step_json) {
    log_debug("parser", "Parsing step at " + path);

    std::string type_str = step_json.at("type").get<std::string>();
    auto kind = parse_step_kind(type_str);
    if (!kind) {
        throw std::runtime_error("Unknown step type '" + type_str + "'");
    }

    Step step;
    step.path = path;
    step.kind = *kind;
    step.output_keys = parse_output_keys(step_json, path);
    step.metadata = step_json.value("metadata", nlohmann::json::object());
    if (step_json.contains("next") && step_json["next"].is_string()) {
        step.next = step_json["next"].get<std::string>();
    }

    switch (step.kind) {
        case StepKind::GENERATE_TEXT:
            step.prompt_template = step_json.at("prompt_template").get<std::string>();
            break;
        case StepKind::WEB_SEARCH: {
            step.queries_key = step_json.at("queries_key").get<std::string>();
            const auto& mr = step_json.at("max_results");
            step.max_results = mr.is_string() ? mr.get<std::string>() : mr.dump();
            break;
        }
        case StepKind::TRANSFORM:
            step.transform = step_json.at("transform").get<std::string>();
            break;
        case StepKind::ROUTE: {
            step.route = step_json.at("route").get<std::string>();
            const auto& branches = step_json.at("branches");
            if (branches.is_string()) {
                step.branches.push_back(branches.get<std::string>());
            } else {
                for (const auto& b : branches) {
                    step.branches.push_back(b.get<std::string>());
                }
            }
            break;
        }
    }
    return step;
}

void MarkdownParser::validate_graph(const StageGraph& graph) {
    if (graph.steps.empty()) {
        throw std::runtime_error("Stage graph '" + graph.path + "' has no steps");
    }

    std::unordered_set<StepPath> seen;
    for (const auto& step : graph.steps) {
        if (!seen.insert(step.path).second) {
            throw std::runtime_error("Duplicate step path: " + step.path);
        }
    }

    auto check_forward = [&graph](size_t from, const StepPath& target, const std::string& what) {
        if (target == END_OF_STAGE) return;
        auto idx = graph.index_of(target);
        if (!idx) {
            throw std::runtime_error(what + " target '" + target + "' of " + graph.steps[from].path + " does not exist");
        }
        if (*idx <= from) {
            throw std::runtime_error(what + " target '" + target + "' of " + graph.steps[from].path + " is not a later step");
        }
    };

    for (size_t i = 0; i < graph.steps.size(); ++i) {
        const auto& step = graph.steps[i];
        if (step.kind == StepKind::ROUTE) {
            if (step.branches.empty()) {
                throw std::runtime_error("Route step " + step.path + " declares no branches");
            }
            if (!step.output_keys.empty()) {
                throw std::runtime_error("Route step " + step.path + " must not declare output_keys");
            }
            for (const auto& b : step.branches) {
                check_forward(i, b, "Branch");
            }
        } else if (step.output_keys.empty()) {
            throw std::runtime_error("Step " + step.path + " declares no output_keys");
        }
        if ((step.kind == StepKind::GENERATE_TEXT || step.kind == StepKind::WEB_SEARCH) &&
            step.output_keys.size() != 1) {
            throw std::runtime_error("Step " + step.path + " must declare exactly one output key");
        }
        if (step.next) {
            check_forward(i, *step.next, "Next");
        }
    }
}

} // namespace researchflow
