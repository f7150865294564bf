// modules/capabilities/routers.cpp
#include "modules/capabilities/routers.h"
#include "common/utils/template_renderer.h"
#include <stdexcept>
#include <utility>

namespace agentgraph {

ExpressionRouter::ExpressionRouter(std::vector<RoutingRule> rules, std::optional<std::string> default_label)
    : rules_(std::move(rules)), default_label_(std::move(default_label)) {}

std::string ExpressionRouter::decide(const Snapshot& state) {
    for (const auto& rule : rules_) {
        if (InjaTemplateRenderer::evaluate_condition(rule.when, state.values())) {
            return rule.label;
        }
    }
    if (!default_label_) {
        throw std::runtime_error("No routing rule matched and no default label is set");
    }
    return *default_label_;
}

LlmRouter::LlmRouter(std::shared_ptr<TextGenerator> generator,
                     std::string prompt_template,
                     std::vector<std::string> options)
    : generator_(std::move(generator)),
      prompt_template_(std::move(prompt_template)),
      options_(std::move(options)) {
    if (!generator_) {
        throw std::invalid_argument("LlmRouter requires a text generator");
    }
}

std::optional<std::string> LlmRouter::pick_option(const std::string& response,
                                                  const std::vector<std::string>& options) {
    std::optional<std::string> best;
    std::size_t best_pos = std::string::npos;
    for (const auto& option : options) {
        std::size_t pos = response.find(option);
        if (pos == std::string::npos) {
            continue;
        }
        // Earliest mention wins; at the same position the longer label wins ("Coder" over "Code")
        if (!best || pos < best_pos || (pos == best_pos && option.size() > best->size())) {
            best = option;
            best_pos = pos;
        }
    }
    return best;
}

std::string LlmRouter::decide(const Snapshot& state) {
    Value data = state.values();
    data["options"] = options_;
    std::string prompt = InjaTemplateRenderer::render(prompt_template_, data);

    std::string response = generator_->generate(prompt);
    auto label = pick_option(response, options_);
    if (!label) {
        throw std::runtime_error("LLM response names none of the declared options: " + response);
    }
    return *label;
}

} // namespace agentgraph
