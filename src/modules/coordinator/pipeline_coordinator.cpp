// modules/coordinator/pipeline_coordinator.cpp
#include "modules/coordinator/pipeline_coordinator.h"
#include "common/utils/logging.h"
#include "modules/coordinator/run_state_machine.h"
#include "modules/dispatcher/section_dispatcher.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <stdexcept>

namespace researchflow {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// timeout_sec > 0 时覆盖阶段图预算中的时长上限
std::optional<BudgetLimits> stage_deadline(const StageGraph& graph, int timeout_sec) {
    if (timeout_sec <= 0) return std::nullopt;
    BudgetLimits limits = graph.budget.value_or(BudgetLimits{});
    limits.max_duration_sec = timeout_sec;
    return limits;
}

} // namespace

PipelineCoordinator::PipelineCoordinator(const StageLibrary& stages, const StageRunner& runner,
                                         RunStore& store, CoordinatorConfig config)
    : stages_(stages), runner_(runner), store_(store), config_(config) {
    if (config_.concurrency_limit <= 0) {
        throw std::runtime_error("concurrency_limit must be positive");
    }
    if (!(config_.min_success_ratio > 0.0 && config_.min_success_ratio <= 1.0)) {
        throw std::runtime_error("min_success_ratio must be in (0, 1]");
    }
}

PipelineCoordinator::~PipelineCoordinator() {
    // 中断的运行保持非终态，可由 resume 继续
    shutdown_.request_stop();
    std::map<std::string, std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
        finished_workers_.clear();
    }
    for (auto& [run_id, t] : workers) {
        if (t.joinable()) t.join();
    }
}

std::optional<std::string> PipelineCoordinator::validate(const ResearchRequest& request) const {
    const auto& limits = config_.limits;
    if (trim(request.topic).empty()) {
        return "topic must not be empty";
    }
    if (request.section_count < limits.min_section_count || request.section_count > limits.max_section_count) {
        return "section_count must be between " + std::to_string(limits.min_section_count) +
               " and " + std::to_string(limits.max_section_count);
    }
    if (request.search_depth < limits.min_search_depth || request.search_depth > limits.max_search_depth) {
        return "search_depth must be between " + std::to_string(limits.min_search_depth) +
               " and " + std::to_string(limits.max_search_depth);
    }
    return std::nullopt;
}

int PipelineCoordinator::required_successes(int section_count) const {
    if (section_count <= 0) return 0;
    double needed = std::ceil(config_.min_success_ratio * section_count - 1e-9);
    return std::clamp(static_cast<int>(needed), 1, section_count);
}

PipelineRun PipelineCoordinator::accept(const ResearchRequest& request) {
    PipelineRun run;
    run.run_id = generate_run_id();
    run.request = request;
    run.request.topic = trim(request.topic);
    run.state = RunState::ACCEPTED;
    run.created_at = now_epoch_ms();

    if (auto problem = validate(request)) {
        fail(run, RunState::ACCEPTED, ErrorKind::INVALID_REQUEST, *problem);
    } else {
        persist(run);
        log_info("coordinator", run.run_id + " accepted: " + run.request.topic);
    }
    return run;
}

SubmitResult PipelineCoordinator::submit(const ResearchRequest& request) {
    PipelineRun run = accept(request);

    SubmitResult submitted;
    submitted.run_id = run.run_id;
    if (run.state == RunState::FAILED) {
        submitted.error = run.failure->kind;
        submitted.message = run.failure->message;
        return submitted;
    }
    submitted.accepted = true;
    submitted.message = "accepted";

    std::lock_guard<std::mutex> lock(workers_mutex_);
    reap_finished_workers();
    active_runs_.insert(run.run_id);
    std::stop_token stop = shutdown_.get_token();
    std::string run_id = run.run_id;
    workers_.emplace(run_id, std::thread([this, run = std::move(run), stop]() mutable {
        std::string run_id = run.run_id;
        try {
            drive(std::move(run), stop);
        } catch (const std::exception& e) {
            log_error("coordinator", run_id + " aborted: " + e.what());
        }
        finish_worker(run_id);
    }));
    return submitted;
}

PipelineRun PipelineCoordinator::run(const ResearchRequest& request) {
    PipelineRun run = accept(request);
    if (run.state == RunState::FAILED) {
        return run;
    }
    return drive(std::move(run), shutdown_.get_token());
}

void PipelineCoordinator::finish_worker(const std::string& run_id) {
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        active_runs_.erase(run_id);
        finished_workers_.push_back(run_id);
    }
    workers_cv_.notify_all();
}

// 调用方持有 workers_mutex_。已登记结束的线程不再取锁，join 只等待其返回
void PipelineCoordinator::reap_finished_workers() {
    for (const auto& run_id : finished_workers_) {
        auto it = workers_.find(run_id);
        if (it == workers_.end()) continue;
        if (it->second.joinable()) it->second.join();
        workers_.erase(it);
    }
    finished_workers_.clear();
}

size_t PipelineCoordinator::worker_count() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return workers_.size() - finished_workers_.size();
}

std::optional<PipelineRun> PipelineCoordinator::query(const std::string& run_id) const {
    return store_.load(run_id);
}

std::optional<PipelineRun> PipelineCoordinator::wait(const std::string& run_id) {
    {
        std::unique_lock<std::mutex> lock(workers_mutex_);
        workers_cv_.wait(lock, [&] { return active_runs_.count(run_id) == 0; });
    }
    return store_.load(run_id);
}

PipelineRun PipelineCoordinator::resume(const std::string& run_id) {
    auto loaded = store_.load(run_id);
    if (!loaded) {
        throw std::runtime_error("unknown run '" + run_id + "'");
    }
    PipelineRun run = std::move(*loaded);
    if (is_terminal(run.state)) {
        return run;
    }
    ++run.resume_count;
    log_info("coordinator", run_id + " resuming at " + to_string(run.state) +
             " (resume #" + std::to_string(run.resume_count) + ")");
    persist(run);
    return drive(std::move(run), shutdown_.get_token());
}

std::vector<PipelineRun> PipelineCoordinator::resume_incomplete() {
    std::vector<PipelineRun> resumed;
    for (const auto& run_id : store_.list_incomplete()) {
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            if (active_runs_.count(run_id)) continue;
        }
        resumed.push_back(resume(run_id));
    }
    return resumed;
}

PipelineRun PipelineCoordinator::drive(PipelineRun run, std::stop_token stop) {
    try {
        if (run.state == RunState::ACCEPTED) {
            if (auto problem = validate(run.request)) {
                fail(run, RunState::ACCEPTED, ErrorKind::INVALID_REQUEST, *problem);
                return run;
            }
            advance(run, RunState::PLANNING);
        }
        if (run.state == RunState::PLANNING && !run_planning(run, stop)) {
            return run;
        }
        if (run.state == RunState::RESEARCH && !run_research(run, stop)) {
            return run;
        }
        if (run.state == RunState::REPORT) {
            run_report(run, stop);
        }
    } catch (const ClassifiedError& e) {
        fail(run, run.state, e.kind(), e.what());
    } catch (const nlohmann::json::exception& e) {
        fail(run, run.state, ErrorKind::INTERNAL, std::string("malformed stage output: ") + e.what());
    } catch (const std::exception& e) {
        // 存储写入失败等
        fail(run, run.state, ErrorKind::INTERNAL, e.what());
    }
    return run;
}

bool PipelineCoordinator::run_planning(PipelineRun& run, std::stop_token stop) {
    const StageGraph& graph = stages_.get(PLANNING_STAGE);
    StageState input{
        {"topic", run.request.topic},
        {"section_count", run.request.section_count},
        {"search_depth", run.request.search_depth}
    };

    auto result = runner_.run(graph, std::move(input), run.run_id, stop,
                              stage_deadline(graph, config_.planning_timeout_sec));
    if (!result.success) {
        if (stop.stop_requested()) {
            log_warning("coordinator", run.run_id + " interrupted during planning");
            return false;
        }
        fail(run, RunState::PLANNING, result.error.value_or(ErrorKind::INTERNAL), result.message);
        return false;
    }

    ResearchPlan plan = result.final_state.at("plan").get<ResearchPlan>();
    if (static_cast<int>(plan.sections.size()) != run.request.section_count) {
        fail(run, RunState::PLANNING, ErrorKind::INVALID_INPUT,
             "plan has " + std::to_string(plan.sections.size()) + " sections, expected " +
             std::to_string(run.request.section_count));
        return false;
    }
    run.plan = std::move(plan);
    advance(run, RunState::RESEARCH);
    return true;
}

SectionOutcome PipelineCoordinator::run_section(const std::string& run_id, const ResearchRequest& request,
                                                const SectionSpec& spec, std::stop_token stop) const {
    StageState input{
        {"topic", request.topic},
        {"section_id", spec.id},
        {"section_title", spec.title},
        {"guiding_questions", spec.guiding_questions},
        {"search_depth", request.search_depth}
    };

    SectionOutcome outcome;
    outcome.section_id = spec.id;
    auto result = runner_.run(stages_.get(RESEARCH_STAGE), std::move(input),
                              run_id + "#section-" + std::to_string(spec.id), stop);
    if (!result.success) {
        outcome.error = result.error.value_or(ErrorKind::INTERNAL);
        outcome.message = result.message;
        return outcome;
    }

    const auto& state = result.final_state;
    SectionResult section;
    section.section_id = spec.id;
    section.title = spec.title;
    section.content = state.at("section_content").get<std::string>();
    section.sources = state.value("sources", std::vector<std::string>{});
    section.queries_used = state.value("queries", std::vector<std::string>{});
    outcome.result = std::move(section);
    outcome.message = "completed";
    return outcome;
}

bool PipelineCoordinator::run_research(PipelineRun& run, std::stop_token stop) {
    if (!run.plan) {
        fail(run, RunState::RESEARCH, ErrorKind::INTERNAL, "research stage entered without a plan");
        return false;
    }

    // 已有记录（成功或失败）的章节不再重跑
    std::vector<SectionSpec> pending;
    for (const auto& spec : run.plan->sections) {
        if (!run.sections.count(spec.id)) {
            pending.push_back(spec);
        }
    }

    if (!pending.empty()) {
        log_info("coordinator", run.run_id + " dispatching " + std::to_string(pending.size()) + " of " +
                 std::to_string(run.plan->sections.size()) + " sections");

        const std::string run_id = run.run_id;
        const ResearchRequest request = run.request;
        SectionRunner section_runner = [this, &run_id, &request, stop](const SectionSpec& spec,
                                                                       std::stop_token deadline) {
            std::stop_source combined;
            std::stop_callback on_deadline(deadline, [&combined] { combined.request_stop(); });
            std::stop_callback on_shutdown(stop, [&combined] { combined.request_stop(); });
            return run_section(run_id, request, spec, combined.get_token());
        };

        DispatchOptions options;
        options.concurrency_limit = config_.concurrency_limit;
        options.stage_timeout = std::chrono::seconds(config_.research_timeout_sec);
        SectionDispatcher dispatcher(std::move(section_runner), options);

        std::mutex run_mutex;
        dispatcher.dispatch(pending, [&](const SectionOutcome& outcome) {
            // 关闭时被取消的章节不记录，恢复后重新执行
            if (!outcome.succeeded() && stop.stop_requested()) return;
            std::lock_guard<std::mutex> lock(run_mutex);
            run.sections[outcome.section_id] = outcome;
            persist(run);
            if (outcome.succeeded()) {
                log_info("coordinator", run_id + " section " + std::to_string(outcome.section_id) + " completed");
            } else {
                log_warning("coordinator", run_id + " section " + std::to_string(outcome.section_id) +
                            " failed (" + to_string(*outcome.error) + "): " + outcome.message);
            }
        });

        if (stop.stop_requested()) {
            log_warning("coordinator", run.run_id + " interrupted during research");
            return false;
        }
    }

    int total = static_cast<int>(run.plan->sections.size());
    int succeeded = static_cast<int>(std::count_if(run.sections.begin(), run.sections.end(),
        [](const auto& entry) { return entry.second.succeeded(); }));
    int required = required_successes(total);
    if (succeeded < required) {
        fail(run, RunState::RESEARCH, ErrorKind::INSUFFICIENT_SECTIONS,
             std::to_string(succeeded) + " of " + std::to_string(total) + " sections succeeded, " +
             std::to_string(required) + " required");
        return false;
    }
    advance(run, RunState::REPORT);
    return true;
}

bool PipelineCoordinator::run_report(PipelineRun& run, std::stop_token stop) {
    const StageGraph& graph = stages_.get(REPORT_STAGE);

    // 按计划顺序装配，与章节完成顺序无关
    Value sections = Value::array();
    std::vector<std::string> omitted;
    for (const auto& spec : run.plan->sections) {
        auto it = run.sections.find(spec.id);
        if (it != run.sections.end() && it->second.succeeded()) {
            sections.push_back(*it->second.result);
        } else {
            omitted.push_back(spec.title);
        }
    }

    StageState input{
        {"topic", run.request.topic},
        {"methodology", run.plan->methodology},
        {"sections", sections},
        {"omitted_sections", omitted}
    };

    auto result = runner_.run(graph, std::move(input), run.run_id, stop,
                              stage_deadline(graph, config_.report_timeout_sec));
    if (!result.success) {
        if (stop.stop_requested()) {
            log_warning("coordinator", run.run_id + " interrupted during report");
            return false;
        }
        fail(run, RunState::REPORT, result.error.value_or(ErrorKind::INTERNAL), result.message);
        return false;
    }

    const auto& state = result.final_state;
    FinalReport report;
    report.executive_summary = state.at("executive_summary").get<std::string>();
    report.body = state.at("body").get<std::string>();
    report.conclusion = state.at("conclusion").get<std::string>();
    report.sources = state.at("sources").get<std::vector<std::string>>();
    report.markdown = state.at("final_report").get<std::string>();
    report.metadata = state.at("report_metadata").get<ReportMetadata>();
    report.metadata.generated_at = now_iso8601();

    run.report = std::move(report);
    advance(run, RunState::COMPLETED);
    return true;
}

void PipelineCoordinator::advance(PipelineRun& run, RunState next) {
    if (!can_transition(run.state, next)) {
        throw ClassifiedError(ErrorKind::INTERNAL,
            "illegal transition " + to_string(run.state) + " -> " + to_string(next));
    }
    log_debug("coordinator", run.run_id + " " + to_string(run.state) + " -> " + to_string(next));
    run.state = next;
    persist(run);
}

void PipelineCoordinator::fail(PipelineRun& run, RunState stage, ErrorKind kind, const std::string& message) {
    log_error("coordinator", run.run_id + " failed in " + to_string(stage) + " (" + to_string(kind) + "): " + message);
    run.state = RunState::FAILED;
    run.failure = RunFailure{stage, kind, message};
    run.report.reset();
    try {
        persist(run);
    } catch (const std::exception& e) {
        // 存储不可用时失败状态只留在返回值里
        log_error("coordinator", run.run_id + " could not record failure: " + e.what());
    }
}

void PipelineCoordinator::persist(PipelineRun& run) {
    run.updated_at = now_epoch_ms();
    store_.save(run);
}

} // namespace researchflow
