// common/utils/template_renderer.cpp
#include "common/utils/template_renderer.h"
#include <filesystem>
#include <stdexcept>
#include <string>

namespace agentgraph {

InjaTemplateRenderer::InjaTemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_line_statement("##");
    env_.set_trim_blocks(false);

    configure_security();
}

void InjaTemplateRenderer::configure_security() {
    env_.set_search_included_templates_in_files(false);
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled for security.", inja::SourceLocation{});
    });
}

std::string InjaTemplateRenderer::render(std::string_view template_str, const Value& data) {
    InjaTemplateRenderer renderer;
    return renderer.render_with_env(template_str, data);
}

bool InjaTemplateRenderer::evaluate_condition(std::string_view expression, const Value& data) {
    std::string wrapped = "{% if " + std::string(expression) + " %}true{% else %}false{% endif %}";
    return render(wrapped, data) == "true";
}

std::string InjaTemplateRenderer::render_with_env(std::string_view template_str, const Value& data) {
    try {
        return env_.render(template_str, data);
    } catch (const inja::InjaError& e) {
        throw std::runtime_error("Template render error: " + std::string(e.message));
    }
}

} // namespace agentgraph
