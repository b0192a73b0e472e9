// common/utils/template_renderer.cpp
#include "common/utils/template_renderer.h"
#include "core/types/error.h"
#include "common/utils/text_utils.h"
#include <inja/inja.hpp>
#include <string>

namespace researchflow {

InjaTemplateRenderer::InjaTemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_line_statement("##");
    env_.set_trim_blocks(true);
    env_.set_lstrip_blocks(true);

    configure_security();
    register_callbacks();
}

void InjaTemplateRenderer::configure_security() {
    // 禁用 include
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled for security.", inja::SourceLocation{});
    });
}

void InjaTemplateRenderer::register_callbacks() {
    // truncate(text, n): 前 n 个字符，截断时追加 "..."
    env_.add_callback("truncate", 2, [](inja::Arguments& args) {
        auto text = args.at(0)->get<std::string>();
        auto limit = args.at(1)->get<int>();
        if (limit < 0 || utf8_length(text) <= static_cast<size_t>(limit)) {
            return text;
        }
        return utf8_truncate(text, static_cast<size_t>(limit)) + "...";
    });
    // join(list, separator)
    env_.add_callback("join", 2, [](inja::Arguments& args) {
        const auto& items = *args.at(0);
        auto separator = args.at(1)->get<std::string>();
        std::string out;
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0) out += separator;
            out += items[i].is_string() ? items[i].get<std::string>() : items[i].dump();
        }
        return out;
    });
}

std::string InjaTemplateRenderer::render(std::string_view template_str, const StageState& state) {
    thread_local InjaTemplateRenderer renderer;
    return renderer.render_with_env(template_str, state);
}

std::string InjaTemplateRenderer::render_with_env(std::string_view template_str, const StageState& state) {
    try {
        return env_.render(template_str, state);
    } catch (const inja::InjaError& e) {
        throw ClassifiedError(ErrorKind::INVALID_INPUT, "Template render error: " + std::string(e.message));
    }
}

} // namespace researchflow
