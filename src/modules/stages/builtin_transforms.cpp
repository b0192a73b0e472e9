// modules/stages/builtin_transforms.cpp
#include "modules/stages/builtin_transforms.h"
#include "core/types/error.h"
#include "core/types/research.h"
#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

namespace researchflow {

namespace {

const StepPath kParseJsonPlan = "/planning/parse_json_plan";
const StepPath kParseLinePlan = "/planning/parse_line_plan";
const StepPath kSynthesizeContent = "/research/synthesize_content";
const StepPath kSynthesizeWithoutSources = "/research/synthesize_without_sources";
const std::string kErrorSource = "Error in research process";

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string strip_list_marker(std::string line) {
    line = trim(line);
    while (!line.empty() && (line[0] == '#' || line[0] == '-' || line[0] == '>' ||
                              (line[0] == '*' && !line.starts_with("**")))) {
        line = trim(line.substr(1));
    }
    size_t digits = 0;
    while (digits < line.size() && std::isdigit(static_cast<unsigned char>(line[digits]))) ++digits;
    if (digits > 0 && digits < line.size() && (line[digits] == '.' || line[digits] == ')')) {
        line = trim(line.substr(digits + 1));
    }
    if (line.size() >= 2 && line.front() == '"' && line.back() == '"') {
        line = line.substr(1, line.size() - 2);
    }
    while (line.size() >= 4 && line.starts_with("**") && line.ends_with("**")) {
        line = trim(line.substr(2, line.size() - 4));
    }
    return trim(line);
}

bool starts_with_ci(const std::string& text, const std::string& prefix) {
    if (text.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[i])) != std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

// 截断到 section_count；不足时 Planning 失败
Value build_plan(const StageState& state, std::vector<SectionSpec> specs, std::string methodology) {
    int wanted = state.at("section_count").get<int>();
    specs.erase(std::remove_if(specs.begin(), specs.end(),
                               [](const SectionSpec& s) { return s.title.empty(); }),
                specs.end());
    if (static_cast<int>(specs.size()) < wanted) {
        throw ClassifiedError(ErrorKind::INVALID_INPUT,
            "plan has " + std::to_string(specs.size()) + " sections, expected " + std::to_string(wanted));
    }
    specs.resize(static_cast<size_t>(wanted));
    for (size_t i = 0; i < specs.size(); ++i) {
        specs[i].id = static_cast<int>(i) + 1;
    }

    ResearchPlan plan;
    plan.topic = state.at("topic").get<std::string>();
    plan.methodology = methodology.empty() ? "Web research synthesized section by section." : std::move(methodology);
    plan.sections = std::move(specs);
    return Value{{"plan", plan}};
}

std::vector<std::string> string_list(const Value& v) {
    std::vector<std::string> out;
    if (v.is_string()) {
        out.push_back(v.get<std::string>());
    } else if (v.is_array()) {
        for (const auto& item : v) {
            if (item.is_string()) out.push_back(item.get<std::string>());
        }
    }
    return out;
}

} // namespace

std::vector<std::string> clean_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        auto cleaned = strip_list_marker(line);
        if (!cleaned.empty() && !cleaned.starts_with("```")) {
            lines.push_back(std::move(cleaned));
        }
    }
    return lines;
}

std::string extract_json_object(const std::string& text) {
    auto first = text.find('{');
    auto last = text.rfind('}');
    if (first == std::string::npos || last == std::string::npos || last < first) {
        return "";
    }
    return text.substr(first, last - first + 1);
}

StepPath select_plan_parser(const StageState& state) {
    auto candidate = extract_json_object(state.at("plan_text").get<std::string>());
    if (candidate.empty()) return kParseLinePlan;
    auto doc = Value::parse(candidate, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("sections") || !doc["sections"].is_array()) {
        return kParseLinePlan;
    }
    return kParseJsonPlan;
}

Value parse_json_plan(const StageState& state) {
    auto doc = Value::parse(extract_json_object(state.at("plan_text").get<std::string>()), nullptr, false);
    if (doc.is_discarded() || !doc.contains("sections")) {
        throw ClassifiedError(ErrorKind::INVALID_INPUT, "plan text is not a JSON plan");
    }

    std::vector<SectionSpec> specs;
    for (const auto& item : doc["sections"]) {
        SectionSpec spec;
        if (item.is_string()) {
            spec.title = trim(item.get<std::string>());
        } else if (item.is_object()) {
            spec.title = trim(item.value("title", std::string{}));
            spec.guiding_questions = string_list(item.contains("questions") ? item["questions"]
                                                  : item.value("guiding_questions", Value::array()));
        }
        specs.push_back(std::move(spec));
    }

    std::string methodology;
    if (doc.contains("methodology") && doc["methodology"].is_string()) {
        methodology = trim(doc["methodology"].get<std::string>());
    }
    return build_plan(state, std::move(specs), std::move(methodology));
}

Value parse_line_plan(const StageState& state) {
    std::vector<SectionSpec> specs;
    std::string methodology;
    for (const auto& line : clean_lines(state.at("plan_text").get<std::string>())) {
        if (starts_with_ci(line, "methodology:")) {
            methodology = trim(line.substr(12));
        } else if (line.back() == '?' && !specs.empty()) {
            specs.back().guiding_questions.push_back(line);
        } else if (line.back() != ':') {
            SectionSpec spec;
            spec.title = line;
            specs.push_back(std::move(spec));
        }
    }
    return build_plan(state, std::move(specs), std::move(methodology));
}

Value split_queries(const StageState& state) {
    int limit = state.at("search_depth").get<int>();
    Value queries = Value::array();
    for (auto& line : clean_lines(state.at("query_text").get<std::string>())) {
        if (static_cast<int>(queries.size()) >= limit) break;
        queries.push_back(line);
    }
    if (queries.empty()) {
        queries.push_back(state.at("section_title").get<std::string>());
    }
    return Value{{"queries", queries}};
}

StepPath select_synthesis(const StageState& state) {
    const auto& results = state.at("search_results");
    return results.empty() ? kSynthesizeWithoutSources : kSynthesizeContent;
}

Value extract_sources(const StageState& state) {
    Value sources = Value::array();
    std::set<std::string> seen;
    for (const auto& hit : state.at("search_results")) {
        auto url = trim(hit.value("url", std::string{}));
        if (!url.empty() && seen.insert(url).second) {
            sources.push_back(url);
        }
    }
    return Value{{"sources", sources}};
}

Value compile_body(const StageState& state) {
    const auto& sections = state.at("sections");
    std::ostringstream out;

    out << "## Table of Contents\n\n";
    int i = 1;
    for (const auto& s : sections) {
        out << i++ << ". " << s.at("title").get<std::string>() << "\n";
    }
    out << "\n## Methodology\n\n" << state.value("methodology", std::string{}) << "\n\n---\n";

    i = 1;
    for (const auto& s : sections) {
        out << "\n## " << i++ << ". " << s.at("title").get<std::string>() << "\n\n"
            << s.at("content").get<std::string>() << "\n";
    }
    return Value{{"body", out.str()}};
}

Value compile_sources(const StageState& state) {
    const auto& sections = state.at("sections");
    std::set<std::string> web_sources;
    std::set<std::string> other_sources;
    int total_queries = 0;
    for (const auto& s : sections) {
        for (const auto& src : s.value("sources", Value::array())) {
            auto text = trim(src.get<std::string>());
            if (text.empty() || text == kErrorSource) continue;
            if (text.starts_with("http")) {
                web_sources.insert(text);
            } else {
                other_sources.insert(text);
            }
        }
        total_queries += static_cast<int>(s.value("queries_used", Value::array()).size());
    }

    std::ostringstream out;
    out << "## Sources\n\n";
    if (!web_sources.empty()) {
        out << "### Web Sources\n";
        int i = 1;
        for (const auto& src : web_sources) {
            out << i++ << ". " << src << "\n";
        }
    }
    if (!other_sources.empty()) {
        out << "\n### Research Sources\n";
        for (const auto& src : other_sources) {
            out << "- " << src << "\n";
        }
    }
    size_t total_sources = web_sources.size() + other_sources.size();
    out << "\n\n---\n"
        << "*Sections researched: " << sections.size() << "*\n"
        << "*Total sources: " << total_sources << "*\n"
        << "*Total queries executed: " << total_queries << "*";

    Value sources = Value::array();
    for (const auto& src : web_sources) sources.push_back(src);
    for (const auto& src : other_sources) sources.push_back(src);
    return Value{{"sources", sources}, {"sources_section", out.str()}, {"total_queries", total_queries}};
}

Value finalize_report(const StageState& state) {
    std::ostringstream out;
    out << "# " << state.at("topic").get<std::string>() << " - Comprehensive Research Report\n\n"
        << "## Executive Summary\n\n" << state.at("executive_summary").get<std::string>() << "\n\n"
        << state.at("body").get<std::string>() << "\n"
        << "## Conclusion\n\n" << state.at("conclusion").get<std::string>() << "\n\n"
        << state.at("sources_section").get<std::string>() << "\n";
    std::string report = out.str();

    ReportMetadata metadata;
    metadata.sections_count = static_cast<int>(state.at("sections").size());
    metadata.total_sources = static_cast<int>(state.at("sources").size());
    metadata.total_queries = state.at("total_queries").get<int>();
    metadata.word_count = count_words(report);
    metadata.omitted_sections = state.value("omitted_sections", std::vector<std::string>{});
    return Value{{"final_report", report}, {"report_metadata", metadata}};
}

int count_words(const std::string& text) {
    std::istringstream iss(text);
    std::string word;
    int count = 0;
    while (iss >> word) ++count;
    return count;
}

void register_builtin_transforms(TransformRegistry& registry) {
    registry.register_route("planning.select_parser", select_plan_parser);
    registry.register_transform("planning.parse_json_plan", parse_json_plan);
    registry.register_transform("planning.parse_line_plan", parse_line_plan);

    registry.register_transform("research.split_queries", split_queries);
    registry.register_route("research.select_synthesis", select_synthesis);
    registry.register_transform("research.extract_sources", extract_sources);

    registry.register_transform("report.compile_body", compile_body);
    registry.register_transform("report.compile_sources", compile_sources);
    registry.register_transform("report.finalize", finalize_report);
}

} // namespace researchflow
