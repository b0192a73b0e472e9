// modules/scheduler/stage_runner.cpp
#include "modules/scheduler/stage_runner.h"
#include "common/utils/logging.h"
#include "core/types/error.h"
#include "modules/budget/budget_controller.h"
#include "modules/context/state_engine.h"
#include <algorithm>
#include <variant>

namespace researchflow {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

StageRunner::StageRunner(const CallGateway& gateway, const TransformRegistry& transforms,
                         TraceExporter* trace_exporter)
    : executor_(gateway, transforms), trace_exporter_(trace_exporter) {}

StageResult StageRunner::run(const StageGraph& graph,
                             StageState initial_state,
                             const std::string& trace_id,
                             std::stop_token stop,
                             std::optional<BudgetLimits> budget_override) const {
    StageResult result;
    result.final_state = initial_state.is_null() ? StageState::object() : std::move(initial_state);

    auto fail = [&result, &graph](ErrorKind kind, const std::string& message, const StepPath& at) {
        result.success = false;
        result.error = kind;
        result.message = message;
        result.failed_at = at;
        log_warning("stage", graph.path + " failed at " + at + " (" + to_string(kind) + "): " + message);
        return result;
    };

    if (!result.final_state.is_object()) {
        return fail(ErrorKind::INTERNAL, "initial state must be an object", graph.path);
    }

    BudgetController budget(budget_override ? budget_override : graph.budget);
    size_t index = 0;

    while (index < graph.steps.size()) {
        const Step& step = graph.steps[index];

        if (stop.stop_requested()) {
            return fail(ErrorKind::TIMEOUT, "stage cancelled", step.path);
        }
        if (budget.duration_exceeded()) {
            return fail(ErrorKind::TIMEOUT, "stage duration budget exhausted", step.path);
        }
        if (!budget.try_consume_step()) {
            return fail(ErrorKind::BUDGET_EXCEEDED, "step limit reached", step.path);
        }

        if (trace_exporter_) {
            trace_exporter_->on_step_start(trace_id, step, budget.snapshot());
        }
        auto end_trace = [&](const std::string& status, const std::optional<std::string>& code, const Value& delta) {
            if (trace_exporter_) {
                trace_exporter_->on_step_end(trace_id, step.path, status, code, delta, budget.snapshot());
            }
        };

        StepOutput out;
        try {
            out = executor_.execute_step(step, result.final_state, budget, stop);
        } catch (const ClassifiedError& e) {
            end_trace("failed", to_string(e.kind()), Value::object());
            return fail(e.kind(), e.what(), step.path);
        } catch (const std::exception& e) {
            end_trace("failed", to_string(ErrorKind::INTERNAL), Value::object());
            return fail(ErrorKind::INTERNAL, e.what(), step.path);
        }

        if (auto problem = StateEngine::validate_writes(step, result.final_state, out.writes)) {
            end_trace("failed", to_string(ErrorKind::INTERNAL), Value::object());
            return fail(ErrorKind::INTERNAL, *problem, step.path);
        }
        StateEngine::merge_additive(result.final_state, out.writes);
        end_trace("success", std::nullopt, out.writes);
        ++result.steps_executed;
        log_debug("stage", trace_id + " " + step.path + " done");

        std::optional<size_t> next_index;
        bool finished = false;
        std::optional<std::string> selector_error;

        std::visit(overloaded{
            [&](const Continue&) {
                if (!step.next) {
                    next_index = index + 1;
                } else if (*step.next == END_OF_STAGE) {
                    finished = true;
                } else {
                    next_index = graph.index_of(*step.next);
                }
            },
            [&](const JumpTo& jump) {
                if (std::find(step.branches.begin(), step.branches.end(), jump.target) == step.branches.end()) {
                    selector_error = "selected undeclared branch '" + jump.target + "'";
                    return;
                }
                next_index = graph.index_of(jump.target);
            },
            [&](const Finish&) {
                if (step.kind == StepKind::ROUTE &&
                    std::find(step.branches.begin(), step.branches.end(), END_OF_STAGE) == step.branches.end()) {
                    selector_error = "selected undeclared branch '" + END_OF_STAGE + "'";
                    return;
                }
                finished = true;
            }
        }, out.next);

        if (selector_error) {
            return fail(ErrorKind::INTERNAL, *selector_error, step.path);
        }
        if (finished) {
            break;
        }
        if (!next_index || *next_index <= index) {
            return fail(ErrorKind::INTERNAL, "invalid successor", step.path);
        }
        index = *next_index;
    }

    result.success = true;
    result.message = "stage completed";
    return result;
}

} // namespace researchflow
