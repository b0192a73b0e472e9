// modules/config/pipeline_config.h
#ifndef RESEARCHFLOW_MODULES_CONFIG_PIPELINE_CONFIG_H
#define RESEARCHFLOW_MODULES_CONFIG_PIPELINE_CONFIG_H

#include "common/utils/logging.h"
#include "core/types/research.h"
#include "modules/coordinator/pipeline_coordinator.h"
#include "modules/gateway/call_gateway.h"
#include <optional>
#include <string>

namespace researchflow {

struct ModelSettings {
    std::string provider = "llama";           // llama | ollama
    std::string model_path = "models/qwen-0.6b.gguf";
    int n_ctx = 4096;
    int n_threads = 4;
    int n_gpu_layers = 99;
    float min_p = 0.05f;
    // ollama
    std::string host = "localhost";
    int port = 11434;
    int timeout_sec = 600;
};

struct SearchSettings {
    std::string host = "localhost";
    int port = 8888;
    std::string path = "/search";
    int timeout_sec = 30;
    int max_snippet_length = 2000;
};

struct StoreSettings {
    std::string backend = "sqlite";           // sqlite | memory
    std::string path = "researchflow.db";
};

// 全部运行参数；显式传给引擎，不存在进程级单例
struct PipelineConfig {
    ModelSettings model;
    SearchSettings search;
    GatewayConfig gateway;
    CoordinatorConfig coordinator;
    ResearchRequest defaults;
    StoreSettings store;
    std::string graphs_file;                  // 为空时使用内置阶段图
    std::optional<LogLevel> log_level;
};

// 字段非法时抛出 std::runtime_error，消息中带字段名
PipelineConfig parse_pipeline_config(const std::string& yaml_text);
// 相对路径（model_path、graphs.file）按配置文件所在目录解析
PipelineConfig load_pipeline_config(const std::string& file_path);
void validate_pipeline_config(const PipelineConfig& config);

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_CONFIG_PIPELINE_CONFIG_H
