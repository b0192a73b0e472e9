// researchflow/core/engine.h
#ifndef RESEARCHFLOW_CORE_ENGINE_H
#define RESEARCHFLOW_CORE_ENGINE_H

#include "common/llm/text_generator.h"
#include "common/search/search_client.h"
#include "modules/config/pipeline_config.h"
#include "modules/coordinator/pipeline_coordinator.h"
#include "modules/executor/transform_registry.h"
#include "modules/gateway/call_gateway.h"
#include "modules/scheduler/stage_runner.h"
#include "modules/stages/stage_library.h"
#include "modules/store/run_store.h"
#include "modules/trace/trace_exporter.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace researchflow {

// 按 store 配置创建 SqliteRunStore 或 MemoryRunStore
std::shared_ptr<RunStore> make_run_store(const StoreSettings& settings);

// 组装网关、阶段图、追踪与协调器。协作者与存储由调用方提供。
class ResearchEngine {
public:
    using RegisterTransforms = std::function<void(TransformRegistry&)>;

    ResearchEngine(PipelineConfig config,
                   std::shared_ptr<TextGenerator> text_generator,
                   std::shared_ptr<SearchClient> search_client,
                   std::shared_ptr<RunStore> store,
                   const RegisterTransforms& register_extra = nullptr);
    ~ResearchEngine();

    ResearchEngine(const ResearchEngine&) = delete;
    ResearchEngine& operator=(const ResearchEngine&) = delete;

    SubmitResult submit(const ResearchRequest& request);
    PipelineRun run(const ResearchRequest& request);
    std::optional<PipelineRun> query(const std::string& run_id) const;
    std::optional<PipelineRun> wait(const std::string& run_id);
    PipelineRun resume(const std::string& run_id);
    std::vector<PipelineRun> resume_incomplete();

    // 含该运行的各章节子流水线
    std::vector<TraceRecord> get_traces(const std::string& run_id) const;
    Value export_traces(const std::string& run_id) const;
    // 导出后释放该运行的轨迹，返回删除的条数
    size_t clear_traces(const std::string& run_id);

    // 使用配置中的默认值补全请求
    ResearchRequest make_request(const std::string& topic,
                                 std::optional<int> section_count = std::nullopt,
                                 std::optional<int> search_depth = std::nullopt) const;

    const PipelineConfig& config() const { return config_; }
    const CallGateway& gateway() const { return *gateway_; }
    const StageLibrary& stages() const { return stages_; }
    size_t active_workers() const;

private:
    PipelineConfig config_;
    std::shared_ptr<RunStore> store_;
    TransformRegistry transforms_;
    StageLibrary stages_;
    std::unique_ptr<CallGateway> gateway_;
    TraceExporter trace_exporter_;
    std::unique_ptr<StageRunner> runner_;
    std::unique_ptr<PipelineCoordinator> coordinator_; // 最后构造，最先析构
};

} // namespace researchflow

#endif // RESEARCHFLOW_CORE_ENGINE_H
