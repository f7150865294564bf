// modules/capabilities/routers.h
#ifndef AGENTGRAPH_MODULES_CAPABILITIES_ROUTERS_H
#define AGENTGRAPH_MODULES_CAPABILITIES_ROUTERS_H

#include "common/llm/llama_adapter.h"
#include "core/types/node.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentgraph {

struct RoutingRule {
    std::string when;  // inja boolean expression over the state
    std::string label;
};

// Rule-based decision: first rule whose condition holds wins.
class ExpressionRouter : public Decision {
public:
    ExpressionRouter(std::vector<RoutingRule> rules, std::optional<std::string> default_label);

    [[nodiscard]] std::string decide(const Snapshot& state) override;

private:
    std::vector<RoutingRule> rules_;
    std::optional<std::string> default_label_;
};

// Model-backed decision. The prompt is rendered with the state fields plus
// `options` (the declared labels); the label mentioned earliest in the
// response is chosen.
class LlmRouter : public Decision {
public:
    LlmRouter(std::shared_ptr<TextGenerator> generator,
              std::string prompt_template,
              std::vector<std::string> options);

    [[nodiscard]] std::string decide(const Snapshot& state) override;

    // Exposed for tests. Empty result when no option is mentioned.
    static std::optional<std::string> pick_option(const std::string& response,
                                                  const std::vector<std::string>& options);

private:
    std::shared_ptr<TextGenerator> generator_;
    std::string prompt_template_;
    std::vector<std::string> options_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_CAPABILITIES_ROUTERS_H
