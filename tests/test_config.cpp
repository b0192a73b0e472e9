// tests/test_config.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/config/pipeline_config.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace researchflow;

namespace {

bool throws_naming(const std::string& yaml, const std::string& field) {
    try {
        parse_pipeline_config(yaml);
    } catch (const std::runtime_error& e) {
        return std::string(e.what()).find(field) != std::string::npos;
    }
    return false;
}

} // namespace

TEST_CASE("Empty configuration uses defaults", "[config]") {
    auto config = parse_pipeline_config("");
    REQUIRE(config.defaults.section_count == 5);
    REQUIRE(config.defaults.search_depth == 3);
    REQUIRE(config.coordinator.concurrency_limit == 4);
    REQUIRE(config.coordinator.min_success_ratio == 1.0);
    REQUIRE(config.gateway.generate_text.max_attempts == 3);
    REQUIRE(config.store.backend == "sqlite");
    REQUIRE(config.graphs_file.empty());
    REQUIRE_FALSE(config.log_level.has_value());
}

TEST_CASE("Configuration sections are read field by field", "[config]") {
    auto config = parse_pipeline_config(R"(
log_level: debug
model:
  provider: ollama
  name: llama3.1
  temperature: 0.3
  max_tokens: 2048
  port: 11500
search:
  host: searx.local
  port: 8080
  max_snippet_length: 500
gateway:
  generate_text:
    max_attempts: 5
    attempt_timeout_ms: 90000
  web_search:
    rate_limit_backoff_factor: 8
    unavailable_max_attempts: 1
    max_abandoned_attempts: 0
request_limits:
  max_section_count: 12
defaults:
  section_count: 7
research:
  concurrency_limit: 2
  timeout_sec: 600
  min_success_ratio: 0.5
report:
  timeout_sec: 120
store:
  backend: memory
)");
    REQUIRE(config.log_level == LogLevel::DEBUG);
    REQUIRE(config.model.provider == "ollama");
    REQUIRE(config.model.port == 11500);
    REQUIRE(config.gateway.model.model == "llama3.1");
    REQUIRE(config.gateway.model.temperature == 0.3f);
    REQUIRE(config.gateway.model.max_tokens == 2048);
    REQUIRE(config.search.host == "searx.local");
    REQUIRE(config.search.max_snippet_length == 500);
    REQUIRE(config.gateway.generate_text.max_attempts == 5);
    REQUIRE(config.gateway.generate_text.attempt_timeout_ms == 90000);
    REQUIRE(config.gateway.web_search.rate_limit_backoff_factor == 8.0);
    REQUIRE(config.gateway.web_search.unavailable_max_attempts == 1);
    REQUIRE(config.gateway.web_search.max_abandoned_attempts == 0);
    REQUIRE(config.gateway.generate_text.max_abandoned_attempts == 4);
    REQUIRE(config.coordinator.limits.max_section_count == 12);
    REQUIRE(config.defaults.section_count == 7);
    REQUIRE(config.coordinator.concurrency_limit == 2);
    REQUIRE(config.coordinator.research_timeout_sec == 600);
    REQUIRE(config.coordinator.min_success_ratio == 0.5);
    REQUIRE(config.coordinator.report_timeout_sec == 120);
    REQUIRE(config.store.backend == "memory");
}

TEST_CASE("Invalid values name the offending field", "[config][validation]") {
    REQUIRE(throws_naming("research:\n  concurrency_limit: 0\n", "research.concurrency_limit"));
    REQUIRE(throws_naming("research:\n  min_success_ratio: 1.5\n", "research.min_success_ratio"));
    REQUIRE(throws_naming("research:\n  min_success_ratio: 0\n", "research.min_success_ratio"));
    REQUIRE(throws_naming("gateway:\n  web_search:\n    max_attempts: -1\n", "gateway.web_search.max_attempts"));
    REQUIRE(throws_naming("gateway:\n  generate_text:\n    max_abandoned_attempts: -2\n",
                          "gateway.generate_text.max_abandoned_attempts"));
    REQUIRE(throws_naming("search:\n  port: eighty\n", "search.port"));
    REQUIRE(throws_naming("defaults:\n  section_count: 20\n", "defaults.section_count"));
    REQUIRE(throws_naming("store:\n  backend: postgres\n", "store.backend"));
    REQUIRE(throws_naming("log_level: loud\n", "log_level"));
    REQUIRE(throws_naming("model: [1, 2]\n", "model"));
    REQUIRE_THROWS_AS(parse_pipeline_config("model: {provider: llama"), std::runtime_error);
}

TEST_CASE("Malformed YAML reports its position", "[config][validation]") {
    std::string message;
    try {
        parse_pipeline_config("model:\n  provider: llama\n  n_ctx: [1, 2\n");
    } catch (const std::runtime_error& e) {
        message = e.what();
    }
    REQUIRE(message.find("configuration") != std::string::npos);
    REQUIRE(message.find("line ") != std::string::npos);
}

TEST_CASE("Quoted numeric scalars stay strings", "[config]") {
    PipelineConfig config = parse_pipeline_config(
        "model:\n  name: \"42\"\nstore:\n  backend: memory\n");
    REQUIRE(config.gateway.model.model == "42");
}

TEST_CASE("Relative paths resolve against the config file", "[config]") {
    auto dir = std::filesystem::temp_directory_path() / "researchflow_config_test";
    std::filesystem::create_directories(dir);
    auto file = dir / "researchflow.yaml";
    {
        std::ofstream out(file);
        out << "model:\n  model_path: models/tiny.gguf\ngraphs:\n  file: stages.md\n";
    }

    auto config = load_pipeline_config(file.string());
    REQUIRE(std::filesystem::path(config.model.model_path) == std::filesystem::absolute(dir / "models/tiny.gguf"));
    REQUIRE(std::filesystem::path(config.graphs_file) == std::filesystem::absolute(dir / "stages.md"));
    REQUIRE(config.gateway.model.model == "tiny");

    std::filesystem::remove_all(dir);
    REQUIRE_THROWS_AS(load_pipeline_config((dir / "missing.yaml").string()), std::runtime_error);
}
