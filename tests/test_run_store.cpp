// tests/test_run_store.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/store/memory_run_store.h"
#include "modules/store/sqlite_run_store.h"
#include <filesystem>
#include <memory>

using namespace researchflow;

namespace {

PipelineRun make_run(const std::string& id, RunState state) {
    PipelineRun run;
    run.run_id = id;
    run.request = ResearchRequest{"Storage", 1, 1};
    run.state = state;
    run.created_at = 10;
    run.updated_at = 20;
    return run;
}

std::filesystem::path temp_db(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove(path);
    std::filesystem::remove(path.string() + "-wal");
    std::filesystem::remove(path.string() + "-shm");
    return path;
}

void exercise_store(RunStore& store) {
    REQUIRE_FALSE(store.load("run-missing").has_value());

    store.save(make_run("run-a", RunState::RESEARCH));
    store.save(make_run("run-b", RunState::COMPLETED));
    store.save(make_run("run-c", RunState::FAILED));

    // 覆盖写
    auto updated = make_run("run-a", RunState::REPORT);
    updated.plan = ResearchPlan{"Storage", "Review", {SectionSpec{1, "Only", {}}}};
    SectionOutcome outcome;
    outcome.section_id = 1;
    outcome.result = SectionResult{1, "Only", "Text", {"https://s.example"}, {"q"}};
    updated.sections[1] = outcome;
    store.save(updated);

    auto loaded = store.load("run-a");
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->state == RunState::REPORT);
    REQUIRE(loaded->sections.at(1).result->content == "Text");
    REQUIRE(loaded->plan->methodology == "Review");

    REQUIRE(store.list_runs().size() == 3);
    REQUIRE(store.list_incomplete() == std::vector<std::string>{"run-a"});
}

} // namespace

TEST_CASE("Memory store keeps one document per run", "[store]") {
    MemoryRunStore store;
    exercise_store(store);
    REQUIRE(store.save_count() == 4);
}

TEST_CASE("Sqlite store keeps one row per run", "[store][sqlite]") {
    auto path = temp_db("researchflow_test_store.db");
    {
        SqliteRunStore store(path.string());
        exercise_store(store);
    }

    // 重新打开后数据仍在
    SqliteRunStore reopened(path.string());
    auto loaded = reopened.load("run-a");
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->state == RunState::REPORT);
    REQUIRE(reopened.list_incomplete() == std::vector<std::string>{"run-a"});

    std::filesystem::remove(path);
}

TEST_CASE("Sqlite store reports unusable paths", "[store][sqlite]") {
    REQUIRE_THROWS_AS(SqliteRunStore("/nonexistent-dir/for/sure/runs.db"), std::runtime_error);
}
