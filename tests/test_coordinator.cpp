// tests/test_coordinator.cpp
#include <catch2/catch_test_macros.hpp>
#include "fakes.h"
#include "researchflow/core/engine.h"
#include "modules/store/memory_run_store.h"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace researchflow;
using namespace researchflow::testing;

namespace {

PipelineConfig test_config() {
    PipelineConfig config;
    config.gateway = fast_gateway_config();
    config.store.backend = "memory";
    config.coordinator.concurrency_limit = 4;
    config.coordinator.research_timeout_sec = 30;
    return config;
}

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

// 第一次记录章节结果时写入失败，之后恢复
class FlakyRunStore : public MemoryRunStore {
public:
    void save(const PipelineRun& run) override {
        if (!run.sections.empty() && !failed_.exchange(true)) {
            throw std::runtime_error("database is locked");
        }
        MemoryRunStore::save(run);
    }

private:
    std::atomic<bool> failed_{false};
};

// 指定章节的搜索一直超时
std::shared_ptr<FakeSearchClient> search_hanging_on(const std::string& title, int sleep_ms) {
    return std::make_shared<FakeSearchClient>([title, sleep_ms](const std::string& q, int n, int) {
        if (contains(q, title)) {
            pause_for(sleep_ms);
        }
        return default_hits(q, n);
    });
}

} // namespace

// Test 1: 三个章节全部成功，报告按计划顺序
TEST_CASE("Three section run completes in plan order", "[coordinator][scenario]") {
    auto llm = std::make_shared<FakeTextGenerator>();
    // 第一章节最慢，完成顺序与计划顺序不同
    auto search = std::make_shared<FakeSearchClient>([](const std::string& q, int n, int) {
        if (contains(q, "Section One")) {
            pause_for(80);
        }
        return default_hits(q, n);
    });
    auto store = std::make_shared<MemoryRunStore>();
    ResearchEngine engine(test_config(), llm, search, store);

    auto run = engine.run(ResearchRequest{"X", 3, 1});
    REQUIRE(run.state == RunState::COMPLETED);
    REQUIRE_FALSE(run.failure.has_value());
    REQUIRE(run.plan->sections.size() == 3);
    REQUIRE(run.sections.size() == 3);
    for (const auto& [id, outcome] : run.sections) {
        REQUIRE(outcome.succeeded());
        REQUIRE(outcome.result->queries_used.size() == 1);
        REQUIRE(outcome.result->sources.size() == 1);
    }

    REQUIRE(run.report.has_value());
    const auto& report = *run.report;
    REQUIRE_FALSE(report.executive_summary.empty());
    REQUIRE_FALSE(report.conclusion.empty());
    auto first = report.body.find("## 1. Section One");
    auto second = report.body.find("## 2. Section Two");
    auto third = report.body.find("## 3. Section Three");
    REQUIRE(first != std::string::npos);
    REQUIRE(second != std::string::npos);
    REQUIRE(third != std::string::npos);
    REQUIRE(first < second);
    REQUIRE(second < third);
    REQUIRE(contains(report.body, "Content for Section Two."));
    REQUIRE_FALSE(contains(report.body, "Section Four"));
    REQUIRE(contains(report.markdown, "# X - Comprehensive Research Report"));
    REQUIRE(report.metadata.sections_count == 3);
    REQUIRE(report.metadata.total_sources == 3);
    REQUIRE(report.metadata.total_queries == 3);
    REQUIRE_FALSE(report.metadata.generated_at.empty());
    REQUIRE(report.metadata.omitted_sections.empty());

    auto stored = engine.query(run.run_id);
    REQUIRE(stored.has_value());
    REQUIRE(stored->state == RunState::COMPLETED);
    REQUIRE(stored->report->markdown == report.markdown);
    // accepted, planning, research, 3 个章节, report, completed
    REQUIRE(store->save_count() >= 8);
}

// Test 2: 第二章节搜索三次都超时，要求全部章节时运行失败
TEST_CASE("Section search timeout fails the run when all sections are required", "[coordinator][scenario]") {
    auto llm = std::make_shared<FakeTextGenerator>();
    auto search = search_hanging_on("Section Two", 400);
    PipelineConfig config = test_config();
    config.gateway.web_search.attempt_timeout_ms = 50;
    ResearchEngine engine(config, llm, search, std::make_shared<MemoryRunStore>());

    auto run = engine.run(ResearchRequest{"X", 3, 1});
    REQUIRE(run.state == RunState::FAILED);
    REQUIRE(run.failure.has_value());
    REQUIRE(run.failure->kind == ErrorKind::INSUFFICIENT_SECTIONS);
    REQUIRE(run.failure->stage == RunState::RESEARCH);
    REQUIRE_FALSE(run.report.has_value());

    REQUIRE(run.sections.at(1).succeeded());
    REQUIRE(run.sections.at(3).succeeded());
    REQUIRE(run.sections.at(2).error == ErrorKind::TIMEOUT);

    int section_two_calls = 0;
    for (const auto& q : search->queries()) {
        if (contains(q, "Section Two")) ++section_two_calls;
    }
    REQUIRE(section_two_calls == 3);
    REQUIRE(llm->calls_matching("executive summary") == 0);
}

TEST_CASE("Research stage deadline cancels slow sections", "[coordinator][timeout]") {
    auto search = search_hanging_on("Section Two", 3000);
    PipelineConfig config = test_config();
    config.gateway.web_search.attempt_timeout_ms = 10000;
    config.coordinator.research_timeout_sec = 1;
    ResearchEngine engine(config, std::make_shared<FakeTextGenerator>(), search, std::make_shared<MemoryRunStore>());

    auto started = std::chrono::steady_clock::now();
    auto run = engine.run(ResearchRequest{"X", 3, 1});
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(run.state == RunState::FAILED);
    REQUIRE(run.failure->kind == ErrorKind::INSUFFICIENT_SECTIONS);
    REQUIRE(run.sections.at(2).error == ErrorKind::TIMEOUT);
    REQUIRE(run.sections.at(1).succeeded());
    REQUIRE(elapsed < std::chrono::milliseconds(2500));
}

TEST_CASE("Relaxed quorum reports the successful sections", "[coordinator][quorum]") {
    auto llm = std::make_shared<FakeTextGenerator>();
    auto search = std::make_shared<FakeSearchClient>([](const std::string& q, int n, int) {
        if (contains(q, "Section Two")) throw ClassifiedError(ErrorKind::INVALID_INPUT, "rejected query");
        return default_hits(q, n);
    });
    PipelineConfig config = test_config();
    config.coordinator.min_success_ratio = 0.6;
    ResearchEngine engine(config, llm, search, std::make_shared<MemoryRunStore>());

    auto run = engine.run(ResearchRequest{"X", 3, 1});
    REQUIRE(run.state == RunState::COMPLETED);
    REQUIRE(run.sections.at(2).error == ErrorKind::INVALID_INPUT);
    const auto& report = *run.report;
    REQUIRE(report.metadata.sections_count == 2);
    REQUIRE(report.metadata.omitted_sections == std::vector<std::string>{"Section Two"});
    REQUIRE(contains(report.body, "## 1. Section One"));
    REQUIRE(contains(report.body, "## 2. Section Three"));
    REQUIRE_FALSE(contains(report.body, "Content for Section Two"));

    // ceil(0.7 * 3) = 3
    PipelineConfig strict_config = config;
    strict_config.coordinator.min_success_ratio = 0.7;
    ResearchEngine strict(strict_config, llm, search, std::make_shared<MemoryRunStore>());
    auto failed = strict.run(ResearchRequest{"X", 3, 1});
    REQUIRE(failed.state == RunState::FAILED);
    REQUIRE(failed.failure->kind == ErrorKind::INSUFFICIENT_SECTIONS);
    REQUIRE_FALSE(failed.report.has_value());

    auto one_of_three = std::make_shared<FakeSearchClient>([](const std::string& q, int n, int) {
        if (!contains(q, "Section One")) throw ClassifiedError(ErrorKind::INVALID_INPUT, "rejected query");
        return default_hits(q, n);
    });
    ResearchEngine sparse(config, llm, one_of_three, std::make_shared<MemoryRunStore>());
    auto insufficient = sparse.run(ResearchRequest{"X", 3, 1});
    REQUIRE(insufficient.state == RunState::FAILED);
    REQUIRE(insufficient.failure->kind == ErrorKind::INSUFFICIENT_SECTIONS);
}

// Test 3: 非法请求立即失败，不调用任何协作者
TEST_CASE("Invalid requests fail fast", "[coordinator][validation]") {
    auto llm = std::make_shared<FakeTextGenerator>();
    auto search = std::make_shared<FakeSearchClient>();
    auto store = std::make_shared<MemoryRunStore>();
    ResearchEngine engine(test_config(), llm, search, store);

    for (const auto& request : {ResearchRequest{"X", 0, 1}, ResearchRequest{"X", 11, 1},
                                ResearchRequest{"X", 3, 0}, ResearchRequest{"   ", 3, 1}}) {
        auto submitted = engine.submit(request);
        REQUIRE_FALSE(submitted.accepted);
        REQUIRE(submitted.error == ErrorKind::INVALID_REQUEST);

        auto stored = engine.query(submitted.run_id);
        REQUIRE(stored.has_value());
        REQUIRE(stored->state == RunState::FAILED);
        REQUIRE(stored->failure->stage == RunState::ACCEPTED);
        REQUIRE(stored->failure->kind == ErrorKind::INVALID_REQUEST);
    }
    REQUIRE(llm->calls() == 0);
    REQUIRE(search->calls() == 0);
    REQUIRE(store->list_incomplete().empty());
}

TEST_CASE("Planning that yields too few sections fails in planning", "[coordinator][planning]") {
    auto llm = std::make_shared<FakeTextGenerator>([](const std::string& prompt, int) -> std::string {
        if (contains(prompt, "Create a detailed research plan")) return "1. Only one idea";
        return research_response(prompt);
    });
    auto search = std::make_shared<FakeSearchClient>();
    ResearchEngine engine(test_config(), llm, search, std::make_shared<MemoryRunStore>());

    auto run = engine.run(ResearchRequest{"X", 3, 1});
    REQUIRE(run.state == RunState::FAILED);
    REQUIRE(run.failure->stage == RunState::PLANNING);
    REQUIRE(run.failure->kind == ErrorKind::INVALID_INPUT);
    REQUIRE_FALSE(run.plan.has_value());
    REQUIRE(search->calls() == 0);
}

TEST_CASE("Collaborator outage during report fails in report", "[coordinator][report]") {
    auto llm = std::make_shared<FakeTextGenerator>([](const std::string& prompt, int) -> std::string {
        if (contains(prompt, "executive summary")) throw ClassifiedError(ErrorKind::UNAVAILABLE, "model gone");
        return research_response(prompt);
    });
    ResearchEngine engine(test_config(), llm, std::make_shared<FakeSearchClient>(), std::make_shared<MemoryRunStore>());

    auto run = engine.run(ResearchRequest{"X", 2, 1});
    REQUIRE(run.state == RunState::FAILED);
    REQUIRE(run.failure->stage == RunState::REPORT);
    REQUIRE(run.failure->kind == ErrorKind::UNAVAILABLE);
    REQUIRE_FALSE(run.report.has_value());
    REQUIRE(run.sections.size() == 2);
}

TEST_CASE("Section content with a torn UTF-8 tail is persisted", "[coordinator][persistence][utf8]") {
    // 生成在 max_tokens 处截断，停在多字节字符中间
    auto llm = std::make_shared<FakeTextGenerator>([](const std::string& prompt, int) {
        std::string text = research_response(prompt);
        if (contains(prompt, "well-researched section")) text += " \xE4\xB8";
        return text;
    });
    auto store = std::make_shared<MemoryRunStore>();
    ResearchEngine engine(test_config(), llm, std::make_shared<FakeSearchClient>(), store);

    auto submitted = engine.submit(ResearchRequest{"X", 2, 1});
    REQUIRE(submitted.accepted);
    auto run = engine.wait(submitted.run_id);
    REQUIRE(run.has_value());
    REQUIRE(run->state == RunState::COMPLETED);
    REQUIRE(run->sections.size() == 2);
    // 非法字节以 U+FFFD 保存
    REQUIRE(contains(run->sections.at(1).result->content, "\xEF\xBF\xBD"));
    REQUIRE(contains(run->sections.at(1).result->content, "Content for Section One."));
}

TEST_CASE("Store failure while recording a section fails the run", "[coordinator][persistence]") {
    auto store = std::make_shared<FlakyRunStore>();
    ResearchEngine engine(test_config(), std::make_shared<FakeTextGenerator>(),
                          std::make_shared<FakeSearchClient>(), store);

    auto submitted = engine.submit(ResearchRequest{"X", 2, 1});
    REQUIRE(submitted.accepted);
    auto run = engine.wait(submitted.run_id);
    REQUIRE(run.has_value());
    REQUIRE(run->state == RunState::FAILED);
    REQUIRE(run->failure->stage == RunState::RESEARCH);
    REQUIRE(run->failure->kind == ErrorKind::INTERNAL);
    REQUIRE(contains(run->failure->message, "database is locked"));
    REQUIRE_FALSE(run->report.has_value());

    // 其他运行不受影响
    auto next = engine.run(ResearchRequest{"Y", 1, 1});
    REQUIRE(next.state == RunState::COMPLETED);
}

// Test 4: Research 中途中断后恢复，不重跑 Planning，也不丢已完成的章节
TEST_CASE("Resume after interruption re-enters research", "[coordinator][resume]") {
    auto store = std::make_shared<MemoryRunStore>();
    std::string run_id;

    {
        auto llm = std::make_shared<FakeTextGenerator>();
        auto search = search_hanging_on("Section Three", 3000);
        PipelineConfig config = test_config();
        config.gateway.web_search.attempt_timeout_ms = 10000;
        auto engine = std::make_unique<ResearchEngine>(config, llm, search, store);

        auto submitted = engine->submit(ResearchRequest{"X", 3, 1});
        REQUIRE(submitted.accepted);
        run_id = submitted.run_id;

        // 等到前两个章节已持久化
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        bool two_recorded = false;
        while (std::chrono::steady_clock::now() < deadline) {
            auto snapshot = store->load(run_id);
            if (snapshot && snapshot->sections.size() == 2) {
                two_recorded = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        REQUIRE(two_recorded);
        // 模拟进程退出
        engine.reset();
    }

    auto interrupted = store->load(run_id);
    REQUIRE(interrupted.has_value());
    REQUIRE(interrupted->state == RunState::RESEARCH);
    REQUIRE(interrupted->sections.size() == 2);
    REQUIRE(store->list_incomplete() == std::vector<std::string>{run_id});
    std::string kept_content = interrupted->sections.at(1).result->content;

    auto llm = std::make_shared<FakeTextGenerator>();
    auto search = std::make_shared<FakeSearchClient>();
    ResearchEngine engine(test_config(), llm, search, store);
    auto resumed = engine.resume_incomplete();

    REQUIRE(resumed.size() == 1);
    const auto& run = resumed.front();
    REQUIRE(run.run_id == run_id);
    REQUIRE(run.state == RunState::COMPLETED);
    REQUIRE(run.resume_count == 1);
    REQUIRE(run.sections.at(1).result->content == kept_content);
    REQUIRE(llm->calls_matching("Create a detailed research plan") == 0);
    REQUIRE(llm->calls_matching("Analyze this research topic") == 0);
    for (const auto& q : search->queries()) {
        REQUIRE(contains(q, "Section Three"));
    }
    REQUIRE(contains(run.report->body, "## 3. Section Three"));
    REQUIRE(store->list_incomplete().empty());
}

TEST_CASE("Resume continues a run persisted before planning", "[coordinator][resume]") {
    auto store = std::make_shared<MemoryRunStore>();
    PipelineRun accepted;
    accepted.run_id = "run-0000000000000001";
    accepted.request = ResearchRequest{"Y", 2, 1};
    accepted.state = RunState::PLANNING;
    store->save(accepted);

    ResearchEngine engine(test_config(), std::make_shared<FakeTextGenerator>(),
                          std::make_shared<FakeSearchClient>(), store);
    auto run = engine.resume("run-0000000000000001");
    REQUIRE(run.state == RunState::COMPLETED);
    REQUIRE(run.sections.size() == 2);

    // 终态运行原样返回
    auto again = engine.resume("run-0000000000000001");
    REQUIRE(again.resume_count == run.resume_count);
    REQUIRE_THROWS_AS(engine.resume("run-unknown"), std::runtime_error);
}

// Test 5: 异步提交
TEST_CASE("Submitted runs execute in the background", "[coordinator][async]") {
    ResearchEngine engine(test_config(), std::make_shared<FakeTextGenerator>(),
                          std::make_shared<FakeSearchClient>(), std::make_shared<MemoryRunStore>());

    auto a = engine.submit(engine.make_request("Topic A", 2, 1));
    auto b = engine.submit(engine.make_request("Topic B", 1, 2));
    REQUIRE(a.accepted);
    REQUIRE(b.accepted);
    REQUIRE(a.run_id != b.run_id);

    auto done_a = engine.wait(a.run_id);
    auto done_b = engine.wait(b.run_id);
    REQUIRE(done_a->state == RunState::COMPLETED);
    REQUIRE(done_b->state == RunState::COMPLETED);
    REQUIRE(done_b->sections.at(1).result->queries_used.size() == 2);

    auto traces = engine.get_traces(a.run_id);
    REQUIRE_FALSE(traces.empty());
    bool saw_section = false;
    for (const auto& t : traces) {
        REQUIRE(t.trace_id.starts_with(a.run_id));
        if (t.trace_id == a.run_id + "#section-2") saw_section = true;
    }
    REQUIRE(saw_section);
    REQUIRE(engine.export_traces(a.run_id).size() == traces.size());
}

TEST_CASE("Long-lived engine releases finished runs", "[coordinator][lifecycle]") {
    ResearchEngine engine(test_config(), std::make_shared<FakeTextGenerator>(),
                          std::make_shared<FakeSearchClient>(), std::make_shared<MemoryRunStore>());

    std::vector<std::string> run_ids;
    for (int i = 0; i < 6; ++i) {
        auto submitted = engine.submit(ResearchRequest{"Topic " + std::to_string(i), 1, 1});
        REQUIRE(submitted.accepted);
        auto done = engine.wait(submitted.run_id);
        REQUIRE(done->state == RunState::COMPLETED);
        REQUIRE(engine.active_workers() == 0);
        run_ids.push_back(submitted.run_id);
    }

    // 按运行清理轨迹，不影响其他运行
    size_t before = engine.get_traces(run_ids.at(1)).size();
    REQUIRE(before > 0);
    REQUIRE(engine.clear_traces(run_ids.at(0)) > 0);
    REQUIRE(engine.get_traces(run_ids.at(0)).empty());
    REQUIRE(engine.get_traces(run_ids.at(1)).size() == before);
    REQUIRE(engine.clear_traces(run_ids.at(0)) == 0);
}

TEST_CASE("Request defaults come from configuration", "[coordinator][config]") {
    PipelineConfig config = test_config();
    config.defaults.section_count = 4;
    config.defaults.search_depth = 2;
    ResearchEngine engine(config, std::make_shared<FakeTextGenerator>(),
                          std::make_shared<FakeSearchClient>(), std::make_shared<MemoryRunStore>());
    auto request = engine.make_request("Z");
    REQUIRE(request.section_count == 4);
    REQUIRE(request.search_depth == 2);
    REQUIRE(engine.make_request("Z", 1).section_count == 1);
}
