// modules/executor/step_executor.cpp
#include "modules/executor/step_executor.h"
#include "common/utils/template_renderer.h"
#include "core/types/error.h"
#include <stdexcept>
#include <string>

namespace researchflow {

StepExecutor::StepExecutor(const CallGateway& gateway, const TransformRegistry& transforms)
    : gateway_(gateway), transforms_(transforms) {}

StepOutput StepExecutor::execute_step(const Step& step, const StageState& state,
                                      BudgetController& budget, std::stop_token stop) const {
    switch (step.kind) {
        case StepKind::GENERATE_TEXT:
            return execute_generate_text(step, state, budget, stop);
        case StepKind::WEB_SEARCH:
            return execute_web_search(step, state, budget, stop);
        case StepKind::TRANSFORM:
            return execute_transform(step, state);
        case StepKind::ROUTE:
            return execute_route(step, state);
    }
    throw ClassifiedError(ErrorKind::INTERNAL, "Unknown step kind at " + step.path);
}

Value StepExecutor::call_external(CallKind kind, const Value& payload, const Step& step,
                                  BudgetController& budget, std::stop_token stop) const {
    if (!budget.try_consume_external_call()) {
        throw ClassifiedError(ErrorKind::BUDGET_EXCEEDED, "External call limit reached at " + step.path);
    }
    CallResult result = gateway_.invoke(kind, payload, stop);
    if (!result.success) {
        throw ClassifiedError(result.error.value_or(ErrorKind::INTERNAL),
            step.path + ": " + result.message + " (" + std::to_string(result.attempts) + " attempt(s))");
    }
    return result.value;
}

StepOutput StepExecutor::execute_generate_text(const Step& step, const StageState& state,
                                               BudgetController& budget, std::stop_token stop) const {
    Value payload;
    payload["prompt"] = InjaTemplateRenderer::render(step.prompt_template, state);
    if (step.metadata.contains("temperature")) {
        payload["temperature"] = step.metadata["temperature"];
    }
    if (step.metadata.contains("max_tokens")) {
        payload["max_tokens"] = step.metadata["max_tokens"];
    }

    Value response = call_external(CallKind::GENERATE_TEXT, payload, step, budget, stop);

    StepOutput out;
    out.writes[step.output_keys.at(0)] = response.at("text");
    return out;
}

StepOutput StepExecutor::execute_web_search(const Step& step, const StageState& state,
                                            BudgetController& budget, std::stop_token stop) const {
    if (!state.contains(step.queries_key) || !state[step.queries_key].is_array()) {
        throw ClassifiedError(ErrorKind::INTERNAL,
            step.path + ": state field '" + step.queries_key + "' is not a query list");
    }

    int max_results = 0;
    std::string rendered = InjaTemplateRenderer::render(step.max_results, state);
    try {
        max_results = std::stoi(rendered);
    } catch (const std::exception&) {
        throw ClassifiedError(ErrorKind::INVALID_INPUT,
            step.path + ": max_results '" + rendered + "' is not an integer");
    }

    Value hits = Value::array();
    for (const auto& query : state[step.queries_key]) {
        Value payload{{"query", query}, {"max_results", max_results}};
        Value response = call_external(CallKind::WEB_SEARCH, payload, step, budget, stop);
        for (auto hit : response.at("hits")) {
            hit["query"] = query;
            hits.push_back(std::move(hit));
        }
    }

    StepOutput out;
    out.writes[step.output_keys.at(0)] = std::move(hits);
    return out;
}

StepOutput StepExecutor::execute_transform(const Step& step, const StageState& state) const {
    StepOutput out;
    try {
        out.writes = transforms_.call_transform(step.transform, state);
    } catch (const ClassifiedError&) {
        throw;
    } catch (const Value::exception& e) {
        throw ClassifiedError(ErrorKind::INVALID_INPUT, step.path + ": " + e.what());
    }
    return out;
}

StepOutput StepExecutor::execute_route(const Step& step, const StageState& state) const {
    StepOutput out;
    StepPath target = transforms_.call_route(step.route, state);
    if (target == END_OF_STAGE) {
        out.next = Finish{};
    } else {
        out.next = JumpTo{std::move(target)};
    }
    return out;
}

} // namespace researchflow
