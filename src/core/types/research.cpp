// core/types/research.cpp
#include "core/types/research.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace researchflow {

std::string to_string(RunState state) {
    switch (state) {
        case RunState::ACCEPTED: return "accepted";
        case RunState::PLANNING: return "planning";
        case RunState::RESEARCH: return "research";
        case RunState::REPORT: return "report";
        case RunState::COMPLETED: return "completed";
        case RunState::FAILED: return "failed";
    }
    return "failed";
}

std::optional<RunState> parse_run_state(std::string_view text) {
    if (text == "accepted") return RunState::ACCEPTED;
    if (text == "planning") return RunState::PLANNING;
    if (text == "research") return RunState::RESEARCH;
    if (text == "report") return RunState::REPORT;
    if (text == "completed") return RunState::COMPLETED;
    if (text == "failed") return RunState::FAILED;
    return std::nullopt;
}

std::string generate_run_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << "run-" << std::hex << std::setw(16) << std::setfill('0') << rng();
    return oss.str();
}

int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string now_iso8601() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

namespace {

ErrorKind error_kind_from_json(const Value& j) {
    auto kind = parse_error_kind(j.get<std::string>());
    if (!kind) {
        throw std::runtime_error("Unknown error kind: " + j.dump());
    }
    return *kind;
}

RunState run_state_from_json(const Value& j) {
    auto state = parse_run_state(j.get<std::string>());
    if (!state) {
        throw std::runtime_error("Unknown run state: " + j.dump());
    }
    return *state;
}

} // namespace

void to_json(Value& j, const ResearchRequest& r) {
    j = Value{{"topic", r.topic}, {"section_count", r.section_count}, {"search_depth", r.search_depth}};
}

void from_json(const Value& j, ResearchRequest& r) {
    r.topic = j.at("topic").get<std::string>();
    r.section_count = j.value("section_count", 5);
    r.search_depth = j.value("search_depth", 3);
}

void to_json(Value& j, const SectionSpec& s) {
    j = Value{{"id", s.id}, {"title", s.title}, {"guiding_questions", s.guiding_questions}};
}

void from_json(const Value& j, SectionSpec& s) {
    s.id = j.at("id").get<int>();
    s.title = j.at("title").get<std::string>();
    s.guiding_questions = j.value("guiding_questions", std::vector<std::string>{});
}

void to_json(Value& j, const ResearchPlan& p) {
    j = Value{{"topic", p.topic}, {"methodology", p.methodology}, {"sections", p.sections}};
}

void from_json(const Value& j, ResearchPlan& p) {
    p.topic = j.at("topic").get<std::string>();
    p.methodology = j.value("methodology", std::string{});
    p.sections = j.at("sections").get<std::vector<SectionSpec>>();
}

void to_json(Value& j, const SectionResult& r) {
    j = Value{
        {"section_id", r.section_id},
        {"title", r.title},
        {"content", r.content},
        {"sources", r.sources},
        {"queries_used", r.queries_used}
    };
}

void from_json(const Value& j, SectionResult& r) {
    r.section_id = j.at("section_id").get<int>();
    r.title = j.at("title").get<std::string>();
    r.content = j.at("content").get<std::string>();
    r.sources = j.value("sources", std::vector<std::string>{});
    r.queries_used = j.value("queries_used", std::vector<std::string>{});
}

void to_json(Value& j, const SectionOutcome& o) {
    j = Value{{"section_id", o.section_id}};
    if (o.result) {
        j["status"] = "completed";
        j["result"] = *o.result;
    } else {
        j["status"] = "failed";
        j["error"] = to_string(o.error.value_or(ErrorKind::INTERNAL));
        j["message"] = o.message;
    }
}

void from_json(const Value& j, SectionOutcome& o) {
    o.section_id = j.at("section_id").get<int>();
    if (j.value("status", std::string{}) == "completed") {
        o.result = j.at("result").get<SectionResult>();
        o.error.reset();
    } else {
        o.result.reset();
        o.error = error_kind_from_json(j.at("error"));
        o.message = j.value("message", std::string{});
    }
}

void to_json(Value& j, const ReportMetadata& m) {
    j = Value{
        {"sections_count", m.sections_count},
        {"total_sources", m.total_sources},
        {"total_queries", m.total_queries},
        {"word_count", m.word_count},
        {"generated_at", m.generated_at},
        {"omitted_sections", m.omitted_sections}
    };
}

void from_json(const Value& j, ReportMetadata& m) {
    m.sections_count = j.value("sections_count", 0);
    m.total_sources = j.value("total_sources", 0);
    m.total_queries = j.value("total_queries", 0);
    m.word_count = j.value("word_count", 0);
    m.generated_at = j.value("generated_at", std::string{});
    m.omitted_sections = j.value("omitted_sections", std::vector<std::string>{});
}

void to_json(Value& j, const FinalReport& r) {
    j = Value{
        {"executive_summary", r.executive_summary},
        {"body", r.body},
        {"conclusion", r.conclusion},
        {"sources", r.sources},
        {"markdown", r.markdown},
        {"metadata", r.metadata}
    };
}

void from_json(const Value& j, FinalReport& r) {
    r.executive_summary = j.at("executive_summary").get<std::string>();
    r.body = j.at("body").get<std::string>();
    r.conclusion = j.at("conclusion").get<std::string>();
    r.sources = j.value("sources", std::vector<std::string>{});
    r.markdown = j.value("markdown", std::string{});
    if (j.contains("metadata")) {
        r.metadata = j["metadata"].get<ReportMetadata>();
    }
}

void to_json(Value& j, const PipelineRun& run) {
    j = Value{
        {"run_id", run.run_id},
        {"request", run.request},
        {"state", to_string(run.state)},
        {"plan", nullptr},
        {"sections", Value::object()},
        {"report", nullptr},
        {"failure", nullptr},
        {"created_at", run.created_at},
        {"updated_at", run.updated_at},
        {"resume_count", run.resume_count}
    };
    if (run.plan) j["plan"] = *run.plan;
    for (const auto& [id, outcome] : run.sections) {
        j["sections"][std::to_string(id)] = outcome;
    }
    if (run.report) j["report"] = *run.report;
    if (run.failure) {
        j["failure"] = Value{
            {"stage", to_string(run.failure->stage)},
            {"kind", to_string(run.failure->kind)},
            {"message", run.failure->message}
        };
    }
}

void from_json(const Value& j, PipelineRun& run) {
    run.run_id = j.at("run_id").get<std::string>();
    run.request = j.at("request").get<ResearchRequest>();
    run.state = run_state_from_json(j.at("state"));
    run.plan.reset();
    if (j.contains("plan") && !j["plan"].is_null()) {
        run.plan = j["plan"].get<ResearchPlan>();
    }
    run.sections.clear();
    if (j.contains("sections")) {
        for (const auto& [key, value] : j["sections"].items()) {
            run.sections[std::stoi(key)] = value.get<SectionOutcome>();
        }
    }
    run.report.reset();
    if (j.contains("report") && !j["report"].is_null()) {
        run.report = j["report"].get<FinalReport>();
    }
    run.failure.reset();
    if (j.contains("failure") && !j["failure"].is_null()) {
        const auto& f = j["failure"];
        run.failure = RunFailure{
            run_state_from_json(f.at("stage")),
            error_kind_from_json(f.at("kind")),
            f.value("message", std::string{})
        };
    }
    run.created_at = j.value("created_at", int64_t{0});
    run.updated_at = j.value("updated_at", int64_t{0});
    run.resume_count = j.value("resume_count", 0);
}

} // namespace researchflow
