// modules/capabilities/capability_registry.cpp
#include "modules/capabilities/capability_registry.h"
#include "core/types/errors.h"
#include <algorithm>

namespace agentgraph {

namespace {

template <typename Map>
std::vector<std::string> sorted_keys(const Map& map) {
    std::vector<std::string> names;
    names.reserve(map.size());
    for (const auto& [name, _] : map) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace

void CapabilityRegistry::add_worker(std::string name, std::shared_ptr<Worker> worker) {
    if (!worker) {
        throw ConfigurationError("Worker capability '" + name + "' is null");
    }
    workers_[std::move(name)] = std::move(worker);
}

void CapabilityRegistry::add_decision(std::string name, std::shared_ptr<Decision> decision) {
    if (!decision) {
        throw ConfigurationError("Decision capability '" + name + "' is null");
    }
    decisions_[std::move(name)] = std::move(decision);
}

std::shared_ptr<Worker> CapabilityRegistry::worker(const std::string& name) const {
    auto it = workers_.find(name);
    return it != workers_.end() ? it->second : nullptr;
}

std::shared_ptr<Decision> CapabilityRegistry::decision(const std::string& name) const {
    auto it = decisions_.find(name);
    return it != decisions_.end() ? it->second : nullptr;
}

std::vector<std::string> CapabilityRegistry::worker_names() const {
    return sorted_keys(workers_);
}

std::vector<std::string> CapabilityRegistry::decision_names() const {
    return sorted_keys(decisions_);
}

} // namespace agentgraph
