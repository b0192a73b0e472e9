// tests/test_stage_runner.cpp
#include <catch2/catch_test_macros.hpp>
#include "fakes.h"
#include "modules/parser/markdown_parser.h"
#include "modules/scheduler/stage_runner.h"
#include <memory>
#include <stop_token>

using namespace researchflow;
using namespace researchflow::testing;

namespace {

std::string block(const std::string& path, const std::string& yaml) {
    return "### ResearchFlow `" + path + "`\n```yaml\n# --- BEGIN ResearchFlow ---\n" + yaml +
           "# --- END ResearchFlow ---\n```\n\n";
}

StageGraph parse_single(const std::string& markdown) {
    MarkdownParser parser;
    auto graphs = parser.parse_from_string(markdown);
    REQUIRE(graphs.size() == 1);
    return graphs.front();
}

struct Harness {
    std::shared_ptr<FakeTextGenerator> llm = std::make_shared<FakeTextGenerator>();
    std::shared_ptr<FakeSearchClient> search = std::make_shared<FakeSearchClient>();
    TransformRegistry transforms;
    TraceExporter traces;
    std::unique_ptr<CallGateway> gateway;

    Harness() { reset_gateway(); }

    void reset_gateway() {
        gateway = std::make_unique<CallGateway>(llm, search, fast_gateway_config());
    }

    StageResult run(const StageGraph& graph, StageState input, std::stop_token stop = {},
                    std::optional<BudgetLimits> budget = std::nullopt) {
        StageRunner runner(*gateway, transforms, &traces);
        return runner.run(graph, std::move(input), "trace-1", stop, budget);
    }
};

} // namespace

// Test 1: 顺序执行，状态只增不减
TEST_CASE("Linear stage accumulates state", "[stage_runner]") {
    Harness h;
    h.transforms.register_transform("double", [](const StageState& s) {
        return Value{{"doubled", s.at("n").get<int>() * 2}};
    });
    h.transforms.register_transform("describe", [](const StageState& s) {
        return Value{{"text", "n=" + std::to_string(s.at("n").get<int>()) +
                              " doubled=" + std::to_string(s.at("doubled").get<int>())}};
    });

    auto graph = parse_single(
        block("/calc/double", "type: transform\ntransform: double\noutput_keys: doubled\n") +
        block("/calc/describe", "type: transform\ntransform: describe\noutput_keys: text\n"));

    auto result = h.run(graph, Value{{"n", 21}});
    REQUIRE(result.success);
    REQUIRE(result.steps_executed == 2);
    REQUIRE(result.final_state["n"] == 21);
    REQUIRE(result.final_state["doubled"] == 42);
    REQUIRE(result.final_state["text"] == "n=21 doubled=42");
}

// Test 2: route 选中的分支之前的步骤被跳过
TEST_CASE("Route selects a declared later branch", "[stage_runner][branch]") {
    Harness h;
    h.transforms.register_route("pick", [](const StageState& s) -> StepPath {
        return s.at("big").get<bool>() ? "/pick/large" : "/pick/small";
    });
    h.transforms.register_transform("small", [](const StageState&) { return Value{{"size", "small"}}; });
    h.transforms.register_transform("large", [](const StageState&) { return Value{{"size", "large"}}; });

    auto graph = parse_single(
        block("/pick/choose", "type: route\nroute: pick\nbranches: [/pick/small, /pick/large]\n") +
        block("/pick/small", "type: transform\ntransform: small\noutput_keys: size\nnext: /end\n") +
        block("/pick/large", "type: transform\ntransform: large\noutput_keys: size\n"));

    auto small = h.run(graph, Value{{"big", false}});
    REQUIRE(small.success);
    REQUIRE(small.final_state["size"] == "small");
    REQUIRE(small.steps_executed == 2);

    auto large = h.run(graph, Value{{"big", true}});
    REQUIRE(large.success);
    REQUIRE(large.final_state["size"] == "large");
}

TEST_CASE("Route may not select an undeclared branch", "[stage_runner][branch]") {
    Harness h;
    h.transforms.register_route("rogue", [](const StageState&) -> StepPath { return "/r/c"; });
    h.transforms.register_transform("t", [](const StageState&) { return Value{{"x", 1}}; });

    auto graph = parse_single(
        block("/r/choose", "type: route\nroute: rogue\nbranches: [/r/b]\n") +
        block("/r/b", "type: transform\ntransform: t\noutput_keys: x\n") +
        block("/r/c", "type: transform\ntransform: t\noutput_keys: y\n"));

    auto result = h.run(graph, Value::object());
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error == ErrorKind::INTERNAL);
    REQUIRE(result.failed_at == "/r/choose");
}

// Test 3: 写入未声明字段或覆盖已有字段时整步不提交
TEST_CASE("Writes are validated before commit", "[stage_runner][state]") {
    Harness h;
    h.transforms.register_transform("first", [](const StageState&) { return Value{{"a", 1}}; });
    h.transforms.register_transform("sneaky", [](const StageState&) {
        return Value{{"b", 2}, {"undeclared", true}};
    });
    h.transforms.register_transform("overwrite", [](const StageState&) { return Value{{"a", 99}}; });

    SECTION("undeclared key") {
        auto graph = parse_single(
            block("/w/first", "type: transform\ntransform: first\noutput_keys: a\n") +
            block("/w/second", "type: transform\ntransform: sneaky\noutput_keys: b\n"));
        auto result = h.run(graph, Value::object());
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error == ErrorKind::INTERNAL);
        REQUIRE(result.failed_at == "/w/second");
        REQUIRE(result.final_state["a"] == 1);
        REQUIRE_FALSE(result.final_state.contains("b"));
        REQUIRE_FALSE(result.final_state.contains("undeclared"));
    }

    SECTION("existing key") {
        auto graph = parse_single(
            block("/w/first", "type: transform\ntransform: first\noutput_keys: a\n") +
            block("/w/again", "type: transform\ntransform: overwrite\noutput_keys: a\n"));
        auto result = h.run(graph, Value::object());
        REQUIRE_FALSE(result.success);
        REQUIRE(result.final_state["a"] == 1);
    }

    SECTION("missing declared key") {
        auto graph = parse_single(
            block("/w/first", "type: transform\ntransform: first\noutput_keys: [a, c]\n"));
        auto result = h.run(graph, Value::object());
        REQUIRE_FALSE(result.success);
        REQUIRE_FALSE(result.final_state.contains("a"));
    }
}

// Test 4: 步骤失败按分类上报，之前的写入保留
TEST_CASE("Step failure surfaces its classification", "[stage_runner][errors]") {
    Harness h;
    h.transforms.register_transform("ok", [](const StageState&) { return Value{{"ok", true}}; });
    h.transforms.register_transform("bad", [](const StageState&) -> Value {
        throw ClassifiedError(ErrorKind::INVALID_INPUT, "cannot parse");
    });

    auto graph = parse_single(
        block("/e/ok", "type: transform\ntransform: ok\noutput_keys: ok\n") +
        block("/e/bad", "type: transform\ntransform: bad\noutput_keys: parsed\n") +
        block("/e/never", "type: transform\ntransform: ok\noutput_keys: never\n"));

    auto result = h.run(graph, Value::object());
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error == ErrorKind::INVALID_INPUT);
    REQUIRE(result.failed_at == "/e/bad");
    REQUIRE(result.steps_executed == 1);
    REQUIRE(result.final_state["ok"] == true);
    REQUIRE_FALSE(result.final_state.contains("parsed"));
}

// Test 5: generate_text 渲染提示词并只经网关调用一次
TEST_CASE("Generate text step renders prompt through the gateway", "[stage_runner][generate_text]") {
    Harness h;
    h.llm = std::make_shared<FakeTextGenerator>([](const std::string& prompt, int) {
        return "echo: " + prompt;
    });
    h.reset_gateway();

    auto graph = parse_single(
        block("/g/ask", "type: generate_text\noutput_keys: answer\n"
                        "prompt_template: \"Tell me about {{ topic }} in {{ truncate(style, 5) }}\"\n"
                        "metadata:\n  temperature: 0.2\n  max_tokens: 64\n"));

    auto result = h.run(graph, Value{{"topic", "tides"}, {"style", "haiku form"}});
    REQUIRE(result.success);
    REQUIRE(result.final_state["answer"] == "echo: Tell me about tides in haiku...");
    REQUIRE(h.llm->calls() == 1);
    auto configs = h.llm->configs();
    REQUIRE(configs.size() == 1);
    REQUIRE(configs[0].max_tokens == 64);
    REQUIRE(configs[0].temperature == 0.2f);
}

TEST_CASE("Prompt truncation never splits a multibyte character", "[stage_runner][generate_text][utf8]") {
    Harness h;
    h.llm = std::make_shared<FakeTextGenerator>([](const std::string& prompt, int) {
        return "echo: " + prompt;
    });
    h.reset_gateway();

    auto graph = parse_single(
        block("/g/ask", "type: generate_text\noutput_keys: answer\n"
                        "prompt_template: \"{{ truncate(snippet, 3) }}\"\n"));

    // "潮汐表单"，每字三字节
    auto result = h.run(graph, Value{{"snippet", "\xE6\xBD\xAE\xE6\xB1\x90\xE8\xA1\xA8\xE5\x8D\x95"}});
    REQUIRE(result.success);
    REQUIRE(result.final_state["answer"] == "echo: \xE6\xBD\xAE\xE6\xB1\x90\xE8\xA1\xA8...");
    REQUIRE_NOTHROW(result.final_state.dump());
}

TEST_CASE("Web search step issues one call per query", "[stage_runner][web_search]") {
    Harness h;
    auto graph = parse_single(
        block("/s/search", "type: web_search\nqueries_key: queries\nmax_results: \"{{ depth }}\"\n"
                           "output_keys: hits\n"));

    auto result = h.run(graph, Value{{"queries", {"alpha", "beta"}}, {"depth", 2}});
    REQUIRE(result.success);
    REQUIRE(h.search->calls() == 2);
    const auto& hits = result.final_state["hits"];
    REQUIRE(hits.size() == 4);
    REQUIRE(hits[0]["query"] == "alpha");
    REQUIRE(hits[3]["query"] == "beta");
    REQUIRE(hits[0]["url"] == "https://example.com/alpha/1");
}

// Test 6: 阶段预算
TEST_CASE("Stage budget limits steps and external calls", "[stage_runner][budget]") {
    Harness h;
    h.transforms.register_transform("a", [](const StageState&) { return Value{{"a", 1}}; });
    h.transforms.register_transform("b", [](const StageState&) { return Value{{"b", 1}}; });

    auto graph = parse_single(
        block("/b/__meta__", "budget:\n  max_steps: 1\n") +
        block("/b/a", "type: transform\ntransform: a\noutput_keys: a\n") +
        block("/b/b", "type: transform\ntransform: b\noutput_keys: b\n"));

    auto limited = h.run(graph, Value::object());
    REQUIRE_FALSE(limited.success);
    REQUIRE(limited.error == ErrorKind::BUDGET_EXCEEDED);
    REQUIRE(limited.failed_at == "/b/b");

    BudgetLimits relaxed;
    relaxed.max_steps = 5;
    auto overridden = h.run(graph, Value::object(), {}, relaxed);
    REQUIRE(overridden.success);

    auto search_graph = parse_single(
        block("/c/__meta__", "budget:\n  max_external_calls: 1\n") +
        block("/c/search", "type: web_search\nqueries_key: q\nmax_results: 1\noutput_keys: hits\n"));
    auto calls = h.run(search_graph, Value{{"q", {"one", "two"}}});
    REQUIRE_FALSE(calls.success);
    REQUIRE(calls.error == ErrorKind::BUDGET_EXCEEDED);
    REQUIRE(h.search->calls() == 1);
}

TEST_CASE("Stop request cancels before the next step", "[stage_runner][cancel]") {
    Harness h;
    h.transforms.register_transform("a", [](const StageState&) { return Value{{"a", 1}}; });
    auto graph = parse_single(block("/x/a", "type: transform\ntransform: a\noutput_keys: a\n"));

    std::stop_source source;
    source.request_stop();
    auto result = h.run(graph, Value::object(), source.get_token());
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error == ErrorKind::TIMEOUT);
    REQUIRE(result.steps_executed == 0);
}

// Test 7: 每一步都留下追踪记录
TEST_CASE("Each executed step is traced", "[stage_runner][trace]") {
    Harness h;
    h.transforms.register_transform("a", [](const StageState&) { return Value{{"a", 1}}; });
    h.transforms.register_transform("bad", [](const StageState&) -> Value {
        throw ClassifiedError(ErrorKind::INVALID_INPUT, "no");
    });
    auto graph = parse_single(
        block("/t/a", "type: transform\ntransform: a\noutput_keys: a\n") +
        block("/t/bad", "type: transform\ntransform: bad\noutput_keys: b\n"));

    h.run(graph, Value::object());
    auto records = h.traces.get_traces("trace-1");
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].step_path == "/t/a");
    REQUIRE(records[0].status == "success");
    REQUIRE(records[0].state_delta["a"] == 1);
    REQUIRE(records[1].status == "failed");
    REQUIRE(records[1].error_code == "invalid_input");

    auto exported = h.traces.export_json("trace-1");
    REQUIRE(exported.is_array());
    REQUIRE(exported.size() == 2);
}
