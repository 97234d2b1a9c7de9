// common/utils/template_renderer.h
#ifndef HOSTPROV_COMMON_UTILS_TEMPLATE_RENDERER_H
#define HOSTPROV_COMMON_UTILS_TEMPLATE_RENDERER_H

#include "hostprov/core/types.h"
#include <inja/inja.hpp>
#include <string>
#include <string_view>

namespace hostprov {

// Value substitution for manifest strings ("{{ package }}"). Includes are disabled.
class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    // Shared default environment. Throws ConfigurationError on a bad template or missing variable.
    static std::string render(std::string_view template_str, const Context& context);

    std::string render_with_env(std::string_view template_str, const Context& context);

    // Quick check that lets plain strings skip the template engine
    static bool has_placeholders(std::string_view text);

private:
    inja::Environment env_;
    void configure_security();
};

} // namespace hostprov

#endif // HOSTPROV_COMMON_UTILS_TEMPLATE_RENDERER_H
