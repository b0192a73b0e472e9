#ifndef RESEARCHFLOW_TYPES_CONTEXT_H
#define RESEARCHFLOW_TYPES_CONTEXT_H

#include <nlohmann/json.hpp>

namespace researchflow {

// 所有记录在阶段之间只以 JSON 形式传递
using Value = nlohmann::json;
using StageState = nlohmann::json;

} // namespace researchflow

#endif // RESEARCHFLOW_TYPES_CONTEXT_H
