// modules/capabilities/workers.h
#ifndef AGENTGRAPH_MODULES_CAPABILITIES_WORKERS_H
#define AGENTGRAPH_MODULES_CAPABILITIES_WORKERS_H

#include "common/tools/registry.h"
#include "core/types/node.h"
#include "modules/state/state_engine.h"
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace agentgraph {

// Calls a registered tool. String arguments are inja templates rendered
// against the snapshot; other argument values are passed through.
class ToolWorker : public Worker {
public:
    ToolWorker(std::shared_ptr<const ToolRegistry> tools,
               std::string tool_name,
               nlohmann::json arguments,
               std::string output_field,
               Reducer output_reducer);

    [[nodiscard]] Value invoke(const Snapshot& state) override;

private:
    std::shared_ptr<const ToolRegistry> tools_;
    std::string tool_name_;
    nlohmann::json arguments_;
    std::string output_field_;
    Reducer output_reducer_;
};

// Renders a template into a field, as plain text or as a {role, content} message.
class TemplateWorker : public Worker {
public:
    TemplateWorker(std::string template_str,
                   std::string output_field,
                   Reducer output_reducer,
                   std::optional<std::string> role = std::nullopt);

    [[nodiscard]] Value invoke(const Snapshot& state) override;

private:
    std::string template_;
    std::string output_field_;
    Reducer output_reducer_;
    std::optional<std::string> role_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_CAPABILITIES_WORKERS_H
