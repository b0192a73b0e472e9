// modules/executor/transform_registry.cpp
#include "modules/executor/transform_registry.h"
#include "core/types/error.h"
#include <algorithm>

namespace researchflow {

bool TransformRegistry::has_transform(const std::string& name) const {
    return transforms_.count(name) > 0;
}

bool TransformRegistry::has_route(const std::string& name) const {
    return routes_.count(name) > 0;
}

Value TransformRegistry::call_transform(const std::string& name, const StageState& state) const {
    auto it = transforms_.find(name);
    if (it == transforms_.end()) {
        throw ClassifiedError(ErrorKind::INTERNAL, "Transform not found: " + name);
    }
    return it->second(state);
}

StepPath TransformRegistry::call_route(const std::string& name, const StageState& state) const {
    auto it = routes_.find(name);
    if (it == routes_.end()) {
        throw ClassifiedError(ErrorKind::INTERNAL, "Route not found: " + name);
    }
    return it->second(state);
}

std::vector<std::string> TransformRegistry::list_transforms() const {
    std::vector<std::string> names;
    names.reserve(transforms_.size());
    for (const auto& [name, _] : transforms_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> TransformRegistry::list_routes() const {
    std::vector<std::string> names;
    names.reserve(routes_.size());
    for (const auto& [name, _] : routes_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace researchflow
