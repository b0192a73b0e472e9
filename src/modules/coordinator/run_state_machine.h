// modules/coordinator/run_state_machine.h
#ifndef RESEARCHFLOW_MODULES_COORDINATOR_RUN_STATE_MACHINE_H
#define RESEARCHFLOW_MODULES_COORDINATOR_RUN_STATE_MACHINE_H

#include "core/types/research.h"

namespace researchflow {

// ACCEPTED → PLANNING → RESEARCH → REPORT → COMPLETED；任一非终态都可进入 FAILED
constexpr bool is_terminal(RunState state) {
    return state == RunState::COMPLETED || state == RunState::FAILED;
}

constexpr bool can_transition(RunState from, RunState to) {
    if (is_terminal(from)) return false;
    if (to == RunState::FAILED) return true;
    switch (from) {
        case RunState::ACCEPTED: return to == RunState::PLANNING;
        case RunState::PLANNING: return to == RunState::RESEARCH;
        case RunState::RESEARCH: return to == RunState::REPORT;
        case RunState::REPORT:   return to == RunState::COMPLETED;
        default:                 return false;
    }
}

static_assert(can_transition(RunState::ACCEPTED, RunState::PLANNING));
static_assert(!can_transition(RunState::ACCEPTED, RunState::RESEARCH));
static_assert(can_transition(RunState::RESEARCH, RunState::FAILED));
static_assert(!can_transition(RunState::FAILED, RunState::FAILED));
static_assert(!can_transition(RunState::COMPLETED, RunState::REPORT));

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_COORDINATOR_RUN_STATE_MACHINE_H
