// modules/context/state_engine.cpp
#include "modules/context/state_engine.h"
#include <algorithm>
#include <stdexcept>

namespace researchflow {

std::optional<std::string> StateEngine::validate_writes(const Step& step, const StageState& state, const Value& writes) {
    if (!writes.is_object()) {
        return "step " + step.path + " produced non-object writes";
    }
    for (auto it = writes.begin(); it != writes.end(); ++it) {
        const auto& key = it.key();
        if (std::find(step.output_keys.begin(), step.output_keys.end(), key) == step.output_keys.end()) {
            return "step " + step.path + " wrote undeclared field '" + key + "'";
        }
        if (state.contains(key)) {
            return "step " + step.path + " attempted to overwrite field '" + key + "'";
        }
    }
    for (const auto& key : step.output_keys) {
        if (!writes.contains(key)) {
            return "step " + step.path + " did not write declared field '" + key + "'";
        }
    }
    return std::nullopt;
}

void StateEngine::merge_additive(StageState& target, const Value& writes) {
    if (!target.is_object() || !writes.is_object()) {
        throw std::runtime_error("State merge requires objects");
    }
    for (auto it = writes.begin(); it != writes.end(); ++it) {
        if (target.contains(it.key())) {
            throw std::runtime_error("State merge conflict for field: " + it.key());
        }
    }
    for (auto it = writes.begin(); it != writes.end(); ++it) {
        target[it.key()] = it.value();
    }
}

} // namespace researchflow
