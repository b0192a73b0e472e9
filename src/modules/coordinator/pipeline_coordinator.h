// modules/coordinator/pipeline_coordinator.h
#ifndef RESEARCHFLOW_MODULES_COORDINATOR_PIPELINE_COORDINATOR_H
#define RESEARCHFLOW_MODULES_COORDINATOR_PIPELINE_COORDINATOR_H

#include "core/types/research.h"
#include "modules/scheduler/stage_runner.h"
#include "modules/stages/stage_library.h"
#include "modules/store/run_store.h"
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace researchflow {

struct RequestLimits {
    int min_section_count = 1;
    int max_section_count = 10;
    int min_search_depth = 1;
    int max_search_depth = 10;
};

struct CoordinatorConfig {
    RequestLimits limits;
    int concurrency_limit = 4;
    int planning_timeout_sec = 0;     // 0：沿用阶段图自身的预算
    int research_timeout_sec = 1800;  // 整个 Research 阶段；0 表示不限
    int report_timeout_sec = 0;
    double min_success_ratio = 1.0;   // (0, 1]
};

struct SubmitResult {
    std::string run_id;
    bool accepted = false;
    std::optional<ErrorKind> error;
    std::string message;
};

// 顶层状态机：Planning → Research → Report。
// 每次状态迁移与每个章节结果都立即持久化；从存储恢复的运行从其记录的阶段继续，
// 已完成的阶段与已收集的章节结果不会重做。
class PipelineCoordinator {
public:
    PipelineCoordinator(const StageLibrary& stages, const StageRunner& runner,
                        RunStore& store, CoordinatorConfig config);
    ~PipelineCoordinator();

    PipelineCoordinator(const PipelineCoordinator&) = delete;
    PipelineCoordinator& operator=(const PipelineCoordinator&) = delete;

    // 校验并持久化；合法请求在后台线程执行。非法请求立即记录为 FAILED(INVALID_REQUEST)。
    SubmitResult submit(const ResearchRequest& request);

    // 同步执行完整流水线
    PipelineRun run(const ResearchRequest& request);

    std::optional<PipelineRun> query(const std::string& run_id) const;
    // 阻塞直到该运行的后台执行结束
    std::optional<PipelineRun> wait(const std::string& run_id);

    // 从记录的阶段继续一个非终态运行
    PipelineRun resume(const std::string& run_id);
    // 继续存储中所有非终态运行，返回其最终状态
    std::vector<PipelineRun> resume_incomplete();

    std::optional<std::string> validate(const ResearchRequest& request) const;
    int required_successes(int section_count) const;

    // 仍在执行的后台运行数；已结束的线程在下一次 submit 时回收
    size_t worker_count() const;

    const CoordinatorConfig& config() const { return config_; }

private:
    const StageLibrary& stages_;
    const StageRunner& runner_;
    RunStore& store_;
    CoordinatorConfig config_;

    std::stop_source shutdown_;
    mutable std::mutex workers_mutex_;
    std::condition_variable workers_cv_;
    std::map<std::string, std::thread> workers_;
    std::vector<std::string> finished_workers_;
    std::set<std::string> active_runs_;

    PipelineRun accept(const ResearchRequest& request);
    PipelineRun drive(PipelineRun run, std::stop_token stop);

    bool run_planning(PipelineRun& run, std::stop_token stop);
    bool run_research(PipelineRun& run, std::stop_token stop);
    bool run_report(PipelineRun& run, std::stop_token stop);
    SectionOutcome run_section(const std::string& run_id, const ResearchRequest& request,
                               const SectionSpec& spec, std::stop_token stop) const;

    void advance(PipelineRun& run, RunState next);
    void fail(PipelineRun& run, RunState stage, ErrorKind kind, const std::string& message);
    void persist(PipelineRun& run);
    void finish_worker(const std::string& run_id);
    void reap_finished_workers();
};

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_COORDINATOR_PIPELINE_COORDINATOR_H
