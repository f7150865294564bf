// modules/capabilities/capability_registry.h
#ifndef AGENTGRAPH_MODULES_CAPABILITIES_CAPABILITY_REGISTRY_H
#define AGENTGRAPH_MODULES_CAPABILITIES_CAPABILITY_REGISTRY_H

#include "common/llm/llama_adapter.h"
#include "common/tools/registry.h"
#include "core/types/node.h"
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace agentgraph {

// Named capabilities that a YAML graph document can bind nodes to.
class CapabilityRegistry {
public:
    CapabilityRegistry() : tools_(std::make_shared<ToolRegistry>()) {}

    void add_worker(std::string name, std::shared_ptr<Worker> worker);
    void add_decision(std::string name, std::shared_ptr<Decision> decision);

    template <typename Func>
    void add_tool(std::string name, Func&& func) {
        tools_->register_tool(std::move(name), std::forward<Func>(func));
    }

    void set_text_generator(std::shared_ptr<TextGenerator> generator) { generator_ = std::move(generator); }

    // nullptr when absent
    std::shared_ptr<Worker> worker(const std::string& name) const;
    std::shared_ptr<Decision> decision(const std::string& name) const;

    std::shared_ptr<const ToolRegistry> tools() const { return tools_; }
    std::shared_ptr<TextGenerator> text_generator() const { return generator_; }

    std::vector<std::string> worker_names() const;
    std::vector<std::string> decision_names() const;

private:
    std::unordered_map<std::string, std::shared_ptr<Worker>> workers_;
    std::unordered_map<std::string, std::shared_ptr<Decision>> decisions_;
    std::shared_ptr<ToolRegistry> tools_;
    std::shared_ptr<TextGenerator> generator_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_CAPABILITIES_CAPABILITY_REGISTRY_H
