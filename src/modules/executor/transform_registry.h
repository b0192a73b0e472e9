// modules/executor/transform_registry.h
#ifndef RESEARCHFLOW_MODULES_EXECUTOR_TRANSFORM_REGISTRY_H
#define RESEARCHFLOW_MODULES_EXECUTOR_TRANSFORM_REGISTRY_H

#include "core/types/context.h"
#include "core/types/step.h"
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace researchflow {

// 纯函数：读取 StageState，返回要新增的字段
using TransformFunction = std::function<Value(const StageState&)>;
// 纯函数：读取 StageState，返回下一步路径
using RouteFunction = std::function<StepPath(const StageState&)>;

class TransformRegistry {
public:
    template<typename Func>
    void register_transform(std::string name, Func&& func) {
        transforms_[std::move(name)] = std::forward<Func>(func);
    }

    template<typename Func>
    void register_route(std::string name, Func&& func) {
        routes_[std::move(name)] = std::forward<Func>(func);
    }

    bool has_transform(const std::string& name) const;
    bool has_route(const std::string& name) const;

    // 未注册时抛出 ClassifiedError(INTERNAL)；函数自身的异常原样传出
    Value call_transform(const std::string& name, const StageState& state) const;
    StepPath call_route(const std::string& name, const StageState& state) const;

    std::vector<std::string> list_transforms() const;
    std::vector<std::string> list_routes() const;

private:
    std::unordered_map<std::string, TransformFunction> transforms_;
    std::unordered_map<std::string, RouteFunction> routes_;
};

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_EXECUTOR_TRANSFORM_REGISTRY_H
