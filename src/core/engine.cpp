// src/core/engine.cpp
#include "researchflow/core/engine.h"
#include "common/utils/logging.h"
#include "modules/stages/builtin_transforms.h"
#include "modules/store/memory_run_store.h"
#include "modules/store/sqlite_run_store.h"
#include <stdexcept>

namespace researchflow {

std::shared_ptr<RunStore> make_run_store(const StoreSettings& settings) {
    if (settings.backend == "memory") {
        return std::make_shared<MemoryRunStore>();
    }
    if (settings.backend == "sqlite") {
        return std::make_shared<SqliteRunStore>(settings.path);
    }
    throw std::runtime_error("Unknown store backend: " + settings.backend);
}

ResearchEngine::ResearchEngine(PipelineConfig config,
                               std::shared_ptr<TextGenerator> text_generator,
                               std::shared_ptr<SearchClient> search_client,
                               std::shared_ptr<RunStore> store,
                               const RegisterTransforms& register_extra)
    : config_(std::move(config)), store_(std::move(store)) {
    if (!store_) {
        throw std::runtime_error("ResearchEngine requires a run store");
    }
    validate_pipeline_config(config_);

    register_builtin_transforms(transforms_);
    if (register_extra) {
        register_extra(transforms_);
    }

    stages_ = config_.graphs_file.empty() ? StageLibrary::builtin()
                                          : StageLibrary::from_file(config_.graphs_file);
    stages_.validate_against(transforms_);

    gateway_ = std::make_unique<CallGateway>(std::move(text_generator), std::move(search_client), config_.gateway);
    runner_ = std::make_unique<StageRunner>(*gateway_, transforms_, &trace_exporter_);
    coordinator_ = std::make_unique<PipelineCoordinator>(stages_, *runner_, *store_, config_.coordinator);

    log_debug("engine", "stages loaded: " + std::to_string(stages_.stages().size()) +
              (config_.graphs_file.empty() ? " (builtin)" : " from " + config_.graphs_file));
}

ResearchEngine::~ResearchEngine() {
    coordinator_.reset();
}

SubmitResult ResearchEngine::submit(const ResearchRequest& request) {
    return coordinator_->submit(request);
}

PipelineRun ResearchEngine::run(const ResearchRequest& request) {
    return coordinator_->run(request);
}

std::optional<PipelineRun> ResearchEngine::query(const std::string& run_id) const {
    return coordinator_->query(run_id);
}

std::optional<PipelineRun> ResearchEngine::wait(const std::string& run_id) {
    return coordinator_->wait(run_id);
}

PipelineRun ResearchEngine::resume(const std::string& run_id) {
    return coordinator_->resume(run_id);
}

std::vector<PipelineRun> ResearchEngine::resume_incomplete() {
    return coordinator_->resume_incomplete();
}

std::vector<TraceRecord> ResearchEngine::get_traces(const std::string& run_id) const {
    return trace_exporter_.get_traces(run_id);
}

Value ResearchEngine::export_traces(const std::string& run_id) const {
    return trace_exporter_.export_json(run_id);
}

size_t ResearchEngine::clear_traces(const std::string& run_id) {
    return trace_exporter_.clear_traces(run_id);
}

size_t ResearchEngine::active_workers() const {
    return coordinator_->worker_count();
}

ResearchRequest ResearchEngine::make_request(const std::string& topic,
                                             std::optional<int> section_count,
                                             std::optional<int> search_depth) const {
    ResearchRequest request;
    request.topic = topic;
    request.section_count = section_count.value_or(config_.defaults.section_count);
    request.search_depth = search_depth.value_or(config_.defaults.search_depth);
    return request;
}

} // namespace researchflow
