// common/tools/registry.cpp
#include "common/tools/registry.h"
#include <algorithm>
#include <stdexcept>

namespace agentgraph {

bool ToolRegistry::has_tool(const std::string& name) const {
    return tools_.count(name) > 0;
}

nlohmann::json ToolRegistry::call_tool(const std::string& name, const nlohmann::json& args) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        throw std::runtime_error("Tool not found: " + name);
    }

    try {
        return it->second(args);
    } catch (const std::exception& e) {
        throw std::runtime_error("Tool '" + name + "' execution failed: " + e.what());
    }
}

std::vector<std::string> ToolRegistry::list_tools() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace agentgraph
