#ifndef AGENTGRAPH_COMMON_UTILS_TEMPLATE_RENDERER_H
#define AGENTGRAPH_COMMON_UTILS_TEMPLATE_RENDERER_H

#include "core/types/snapshot.h"
#include <inja/inja.hpp>
#include <string>
#include <string_view>

namespace agentgraph {

// Renders inja templates against state values. Includes are disabled.
class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    // Thread-safe: each call parses with its own environment.
    static std::string render(std::string_view template_str, const Value& data);

    // Evaluates an inja expression (e.g. "length(messages) > 2") as a boolean.
    static bool evaluate_condition(std::string_view expression, const Value& data);

    std::string render_with_env(std::string_view template_str, const Value& data);

private:
    inja::Environment env_;
    void configure_security(); // 配置 Inja 环境以禁用不安全操作
};

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_UTILS_TEMPLATE_RENDERER_H
