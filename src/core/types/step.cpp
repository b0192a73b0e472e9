// core/types/step.cpp
#include "core/types/step.h"

namespace researchflow {

std::string to_string(StepKind kind) {
    switch (kind) {
        case StepKind::GENERATE_TEXT: return "generate_text";
        case StepKind::WEB_SEARCH: return "web_search";
        case StepKind::TRANSFORM: return "transform";
        case StepKind::ROUTE: return "route";
    }
    return "transform";
}

std::optional<StepKind> parse_step_kind(const std::string& text) {
    if (text == "generate_text") return StepKind::GENERATE_TEXT;
    if (text == "web_search") return StepKind::WEB_SEARCH;
    if (text == "transform") return StepKind::TRANSFORM;
    if (text == "route") return StepKind::ROUTE;
    return std::nullopt;
}

} // namespace researchflow
