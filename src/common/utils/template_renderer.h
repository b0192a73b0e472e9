#ifndef RESEARCHFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
#define RESEARCHFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H

#include "core/types/context.h"
#include <inja/inja.hpp>
#include <string>
#include <string_view>
#include <filesystem> // Required by Inja for set_include_callback

namespace researchflow {

class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    // 每个线程一个环境；并发的章节子流水线同时渲染提示词
    static std::string render(std::string_view template_str, const StageState& state);

    std::string render_with_env(std::string_view template_str, const StageState& state);

private:
    inja::Environment env_;
    void configure_security();
    void register_callbacks();
};

} // namespace researchflow

#endif // RESEARCHFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
