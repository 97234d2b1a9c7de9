// common/utils/template_renderer.cpp
#include "common/utils/template_renderer.h"
#include <filesystem>
#include <mutex>

namespace hostprov {

InjaTemplateRenderer::InjaTemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_line_statement("##");

    configure_security();
}

void InjaTemplateRenderer::configure_security() {
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled", inja::SourceLocation{});
    });
}

bool InjaTemplateRenderer::has_placeholders(std::string_view text) {
    return text.find("{{") != std::string_view::npos || text.find("{%") != std::string_view::npos;
}

std::string InjaTemplateRenderer::render(std::string_view template_str, const Context& context) {
    if (!has_placeholders(template_str)) {
        return std::string(template_str);
    }
    static InjaTemplateRenderer renderer;
    // inja::Environment caches parsed templates and is not thread-safe
    static std::mutex render_mutex;
    std::lock_guard<std::mutex> lock(render_mutex);
    return renderer.render_with_env(template_str, context);
}

std::string InjaTemplateRenderer::render_with_env(std::string_view template_str, const Context& context) {
    try {
        return env_.render(template_str, context);
    } catch (const inja::InjaError& e) {
        throw ConfigurationError("Template render error in '" + std::string(template_str) + "': " + e.message);
    }
}

} // namespace hostprov
