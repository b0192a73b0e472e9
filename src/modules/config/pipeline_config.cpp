// modules/config/pipeline_config.cpp
#include "modules/config/pipeline_config.h"
#include "common/utils/yaml_json.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace researchflow {

namespace {

[[noreturn]] void bad_field(const std::string& field, const std::string& problem) {
    throw std::runtime_error("config field '" + field + "' " + problem);
}

const Value* section(const Value& root, const std::string& name) {
    if (!root.contains(name) || root[name].is_null()) return nullptr;
    if (!root[name].is_object()) bad_field(name, "must be a mapping");
    return &root[name];
}

void read_int(const Value* obj, const std::string& prefix, const char* key, int& out) {
    if (!obj || !obj->contains(key) || (*obj)[key].is_null()) return;
    const auto& v = (*obj)[key];
    if (!v.is_number_integer()) bad_field(prefix + "." + key, "must be an integer");
    out = v.get<int>();
}

template <typename T>
void read_number(const Value* obj, const std::string& prefix, const char* key, T& out) {
    if (!obj || !obj->contains(key) || (*obj)[key].is_null()) return;
    const auto& v = (*obj)[key];
    if (!v.is_number()) bad_field(prefix + "." + key, "must be a number");
    out = static_cast<T>(v.get<double>());
}

void read_string(const Value* obj, const std::string& prefix, const char* key, std::string& out) {
    if (!obj || !obj->contains(key) || (*obj)[key].is_null()) return;
    const auto& v = (*obj)[key];
    if (!v.is_string()) bad_field(prefix + "." + key, "must be a string");
    out = v.get<std::string>();
}

void read_retry_policy(const Value* gateway, const char* kind, RetryPolicy& policy) {
    if (!gateway || !gateway->contains(kind)) return;
    const std::string prefix = std::string("gateway.") + kind;
    const auto& node = (*gateway)[kind];
    if (!node.is_object()) bad_field(prefix, "must be a mapping");
    const Value* p = &node;
    read_int(p, prefix, "max_attempts", policy.max_attempts);
    read_int(p, prefix, "attempt_timeout_ms", policy.attempt_timeout_ms);
    read_int(p, prefix, "initial_backoff_ms", policy.initial_backoff_ms);
    read_number(p, prefix, "backoff_multiplier", policy.backoff_multiplier);
    read_int(p, prefix, "max_backoff_ms", policy.max_backoff_ms);
    read_number(p, prefix, "rate_limit_backoff_factor", policy.rate_limit_backoff_factor);
    read_int(p, prefix, "unavailable_max_attempts", policy.unavailable_max_attempts);
    read_int(p, prefix, "max_abandoned_attempts", policy.max_abandoned_attempts);
}

void require_positive(int value, const std::string& field) {
    if (value <= 0) bad_field(field, "must be positive");
}

void require_non_negative(int value, const std::string& field) {
    if (value < 0) bad_field(field, "must not be negative");
}

void validate_retry_policy(const RetryPolicy& policy, const std::string& prefix) {
    require_positive(policy.max_attempts, prefix + ".max_attempts");
    require_positive(policy.attempt_timeout_ms, prefix + ".attempt_timeout_ms");
    require_non_negative(policy.initial_backoff_ms, prefix + ".initial_backoff_ms");
    require_non_negative(policy.max_backoff_ms, prefix + ".max_backoff_ms");
    require_positive(policy.unavailable_max_attempts, prefix + ".unavailable_max_attempts");
    require_non_negative(policy.max_abandoned_attempts, prefix + ".max_abandoned_attempts");
    if (policy.backoff_multiplier < 1.0) bad_field(prefix + ".backoff_multiplier", "must be at least 1.0");
    if (policy.rate_limit_backoff_factor < 1.0) bad_field(prefix + ".rate_limit_backoff_factor", "must be at least 1.0");
}

std::string resolve_relative(const std::filesystem::path& base, const std::string& path) {
    if (path.empty()) return path;
    std::filesystem::path p(path);
    if (p.is_absolute()) return path;
    return std::filesystem::absolute(base / p).string();
}

} // namespace

void validate_pipeline_config(const PipelineConfig& config) {
    if (config.model.provider != "llama" && config.model.provider != "ollama") {
        bad_field("model.provider", "must be 'llama' or 'ollama'");
    }
    require_positive(config.model.n_ctx, "model.n_ctx");
    require_positive(config.model.n_threads, "model.n_threads");
    require_positive(config.gateway.model.max_tokens, "model.max_tokens");
    if (config.gateway.model.temperature < 0.0f) bad_field("model.temperature", "must not be negative");

    require_positive(config.search.port, "search.port");
    require_positive(config.search.timeout_sec, "search.timeout_sec");
    require_positive(config.search.max_snippet_length, "search.max_snippet_length");

    validate_retry_policy(config.gateway.generate_text, "gateway.generate_text");
    validate_retry_policy(config.gateway.web_search, "gateway.web_search");

    const auto& limits = config.coordinator.limits;
    require_positive(limits.min_section_count, "request_limits.min_section_count");
    require_positive(limits.min_search_depth, "request_limits.min_search_depth");
    if (limits.max_section_count < limits.min_section_count) {
        bad_field("request_limits.max_section_count", "must not be below min_section_count");
    }
    if (limits.max_search_depth < limits.min_search_depth) {
        bad_field("request_limits.max_search_depth", "must not be below min_search_depth");
    }
    if (config.defaults.section_count < limits.min_section_count ||
        config.defaults.section_count > limits.max_section_count) {
        bad_field("defaults.section_count", "is outside request_limits");
    }
    if (config.defaults.search_depth < limits.min_search_depth ||
        config.defaults.search_depth > limits.max_search_depth) {
        bad_field("defaults.search_depth", "is outside request_limits");
    }

    require_non_negative(config.coordinator.planning_timeout_sec, "planning.timeout_sec");
    require_positive(config.coordinator.concurrency_limit, "research.concurrency_limit");
    require_non_negative(config.coordinator.research_timeout_sec, "research.timeout_sec");
    require_non_negative(config.coordinator.report_timeout_sec, "report.timeout_sec");
    double ratio = config.coordinator.min_success_ratio;
    if (!(ratio > 0.0 && ratio <= 1.0)) {
        bad_field("research.min_success_ratio", "must be in (0, 1]");
    }

    if (config.store.backend != "sqlite" && config.store.backend != "memory") {
        bad_field("store.backend", "must be 'sqlite' or 'memory'");
    }
    if (config.store.backend == "sqlite" && config.store.path.empty()) {
        bad_field("store.path", "must not be empty");
    }
}

PipelineConfig parse_pipeline_config(const std::string& yaml_text) {
    Value root = parse_yaml_text(yaml_text, "configuration");

    PipelineConfig config;
    if (root.is_null()) {
        validate_pipeline_config(config);
        return config;
    }
    if (!root.is_object()) {
        throw std::runtime_error("configuration must be a YAML mapping");
    }

    if (const Value* model = section(root, "model")) {
        read_string(model, "model", "provider", config.model.provider);
        read_string(model, "model", "model_path", config.model.model_path);
        read_string(model, "model", "name", config.gateway.model.model);
        read_int(model, "model", "n_ctx", config.model.n_ctx);
        read_int(model, "model", "n_threads", config.model.n_threads);
        read_int(model, "model", "n_gpu_layers", config.model.n_gpu_layers);
        read_number(model, "model", "min_p", config.model.min_p);
        read_number(model, "model", "temperature", config.gateway.model.temperature);
        read_int(model, "model", "max_tokens", config.gateway.model.max_tokens);
        read_string(model, "model", "host", config.model.host);
        read_int(model, "model", "port", config.model.port);
        read_int(model, "model", "timeout_sec", config.model.timeout_sec);
    }
    if (config.gateway.model.model.empty()) {
        config.gateway.model.model = std::filesystem::path(config.model.model_path).stem().string();
    }

    if (const Value* search = section(root, "search")) {
        read_string(search, "search", "host", config.search.host);
        read_int(search, "search", "port", config.search.port);
        read_string(search, "search", "path", config.search.path);
        read_int(search, "search", "timeout_sec", config.search.timeout_sec);
        read_int(search, "search", "max_snippet_length", config.search.max_snippet_length);
    }

    if (const Value* gateway = section(root, "gateway")) {
        read_retry_policy(gateway, "generate_text", config.gateway.generate_text);
        read_retry_policy(gateway, "web_search", config.gateway.web_search);
    }

    if (const Value* limits = section(root, "request_limits")) {
        auto& l = config.coordinator.limits;
        read_int(limits, "request_limits", "min_section_count", l.min_section_count);
        read_int(limits, "request_limits", "max_section_count", l.max_section_count);
        read_int(limits, "request_limits", "min_search_depth", l.min_search_depth);
        read_int(limits, "request_limits", "max_search_depth", l.max_search_depth);
    }

    if (const Value* defaults = section(root, "defaults")) {
        read_int(defaults, "defaults", "section_count", config.defaults.section_count);
        read_int(defaults, "defaults", "search_depth", config.defaults.search_depth);
    }

    if (const Value* planning = section(root, "planning")) {
        read_int(planning, "planning", "timeout_sec", config.coordinator.planning_timeout_sec);
    }
    if (const Value* research = section(root, "research")) {
        read_int(research, "research", "concurrency_limit", config.coordinator.concurrency_limit);
        read_int(research, "research", "timeout_sec", config.coordinator.research_timeout_sec);
        read_number(research, "research", "min_success_ratio", config.coordinator.min_success_ratio);
    }
    if (const Value* report = section(root, "report")) {
        read_int(report, "report", "timeout_sec", config.coordinator.report_timeout_sec);
    }

    if (const Value* store = section(root, "store")) {
        read_string(store, "store", "backend", config.store.backend);
        read_string(store, "store", "path", config.store.path);
    }
    if (const Value* graphs = section(root, "graphs")) {
        read_string(graphs, "graphs", "file", config.graphs_file);
    }

    if (root.contains("log_level") && !root["log_level"].is_null()) {
        if (!root["log_level"].is_string()) bad_field("log_level", "must be a string");
        auto level = parse_log_level(root["log_level"].get<std::string>());
        if (!level) bad_field("log_level", "must be one of debug, info, warning, error");
        config.log_level = level;
    }

    validate_pipeline_config(config);
    return config;
}

PipelineConfig load_pipeline_config(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    PipelineConfig config = parse_pipeline_config(buffer.str());

    std::filesystem::path base = std::filesystem::path(file_path).parent_path();
    if (base.empty()) base = ".";
    config.model.model_path = resolve_relative(base, config.model.model_path);
    config.graphs_file = resolve_relative(base, config.graphs_file);
    return config;
}

} // namespace researchflow
