#ifndef RESEARCHFLOW_TYPES_RESEARCH_H
#define RESEARCHFLOW_TYPES_RESEARCH_H

#include "context.h"
#include "error.h"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace researchflow {

struct ResearchRequest {
    std::string topic;
    int section_count = 5;
    int search_depth = 3;
};

// id 为章节在计划中的位置（从 1 开始），并行结果以此合并
struct SectionSpec {
    int id = 0;
    std::string title;
    std::vector<std::string> guiding_questions;
};

struct ResearchPlan {
    std::string topic;
    std::string methodology;
    std::vector<SectionSpec> sections;
};

struct SectionResult {
    int section_id = 0;
    std::string title;
    std::string content;
    std::vector<std::string> sources;
    std::vector<std::string> queries_used;
};

// 单个子流水线的结果：成功时有 result，失败时有 error
struct SectionOutcome {
    int section_id = 0;
    std::optional<SectionResult> result;
    std::optional<ErrorKind> error;
    std::string message;

    bool succeeded() const { return result.has_value(); }
};

struct ReportMetadata {
    int sections_count = 0;
    int total_sources = 0;
    int total_queries = 0;
    int word_count = 0;
    std::string generated_at;
    std::vector<std::string> omitted_sections;
};

struct FinalReport {
    std::string executive_summary;
    std::string body;
    std::string conclusion;
    std::vector<std::string> sources;
    std::string markdown;
    ReportMetadata metadata;
};

enum class RunState : uint8_t {
    ACCEPTED,
    PLANNING,
    RESEARCH,
    REPORT,
    COMPLETED,
    FAILED
};

std::string to_string(RunState state);
std::optional<RunState> parse_run_state(std::string_view text);

struct RunFailure {
    RunState stage = RunState::ACCEPTED;
    ErrorKind kind = ErrorKind::INTERNAL;
    std::string message;
};

struct PipelineRun {
    std::string run_id;
    ResearchRequest request;
    RunState state = RunState::ACCEPTED;
    std::optional<ResearchPlan> plan;
    std::map<int, SectionOutcome> sections;
    std::optional<FinalReport> report;
    std::optional<RunFailure> failure;
    int64_t created_at = 0;
    int64_t updated_at = 0;
    int resume_count = 0;
};

std::string generate_run_id();
int64_t now_epoch_ms();
std::string now_iso8601();

void to_json(Value& j, const ResearchRequest& r);
void from_json(const Value& j, ResearchRequest& r);
void to_json(Value& j, const SectionSpec& s);
void from_json(const Value& j, SectionSpec& s);
void to_json(Value& j, const ResearchPlan& p);
void from_json(const Value& j, ResearchPlan& p);
void to_json(Value& j, const SectionResult& r);
void from_json(const Value& j, SectionResult& r);
void to_json(Value& j, const SectionOutcome& o);
void from_json(const Value& j, SectionOutcome& o);
void to_json(Value& j, const ReportMetadata& m);
void from_json(const Value& j, ReportMetadata& m);
void to_json(Value& j, const FinalReport& r);
void from_json(const Value& j, FinalReport& r);
void to_json(Value& j, const PipelineRun& run);
void from_json(const Value& j, PipelineRun& run);

} // namespace researchflow

#endif // RESEARCHFLOW_TYPES_RESEARCH_H
