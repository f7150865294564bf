// modules/capabilities/workers.cpp
#include "modules/capabilities/workers.h"
#include "common/utils/template_renderer.h"
#include <stdexcept>
#include <utility>

namespace agentgraph {

namespace {

Value make_update(const std::string& field, Reducer reducer, Value value) {
    Value update = Value::object();
    if (reducer == Reducer::APPEND) {
        update[field] = Value::array({std::move(value)});
    } else {
        update[field] = std::move(value);
    }
    return update;
}

} // namespace

ToolWorker::ToolWorker(std::shared_ptr<const ToolRegistry> tools,
                       std::string tool_name,
                       nlohmann::json arguments,
                       std::string output_field,
                       Reducer output_reducer)
    : tools_(std::move(tools)),
      tool_name_(std::move(tool_name)),
      arguments_(std::move(arguments)),
      output_field_(std::move(output_field)),
      output_reducer_(output_reducer) {
    if (!tools_) {
        throw std::invalid_argument("ToolWorker requires a tool registry");
    }
    if (arguments_.is_null()) {
        arguments_ = nlohmann::json::object();
    }
}

Value ToolWorker::invoke(const Snapshot& state) {
    nlohmann::json args = nlohmann::json::object();
    for (auto it = arguments_.begin(); it != arguments_.end(); ++it) {
        if (it.value().is_string()) {
            args[it.key()] = InjaTemplateRenderer::render(it.value().get<std::string>(), state.values());
        } else {
            args[it.key()] = it.value();
        }
    }
    return make_update(output_field_, output_reducer_, tools_->call_tool(tool_name_, args));
}

TemplateWorker::TemplateWorker(std::string template_str,
                               std::string output_field,
                               Reducer output_reducer,
                               std::optional<std::string> role)
    : template_(std::move(template_str)),
      output_field_(std::move(output_field)),
      output_reducer_(output_reducer),
      role_(std::move(role)) {}

Value TemplateWorker::invoke(const Snapshot& state) {
    std::string text = InjaTemplateRenderer::render(template_, state.values());
    if (role_) {
        return make_update(output_field_, output_reducer_, Value{{"role", *role_}, {"content", text}});
    }
    return make_update(output_field_, output_reducer_, Value(text));
}

} // namespace agentgraph
