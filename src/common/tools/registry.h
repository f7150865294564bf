// common/tools/registry.h
#ifndef AGENTGRAPH_COMMON_TOOLS_REGISTRY_H
#define AGENTGRAPH_COMMON_TOOLS_REGISTRY_H

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentgraph {

// 工具函数类型
using ToolFunction = std::function<nlohmann::json(const nlohmann::json& args)>;

// Named external tools used by tool workers (search, code execution, ...).
class ToolRegistry {
public:
    template <typename Func>
    void register_tool(std::string name, Func&& func) {
        tools_[std::move(name)] = ToolFunction(std::forward<Func>(func));
    }

    bool has_tool(const std::string& name) const;

    // Throws std::runtime_error for an unknown tool or when the tool throws.
    nlohmann::json call_tool(const std::string& name, const nlohmann::json& args) const;

    // Sorted by name.
    std::vector<std::string> list_tools() const;

private:
    std::unordered_map<std::string, ToolFunction> tools_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_TOOLS_REGISTRY_H
