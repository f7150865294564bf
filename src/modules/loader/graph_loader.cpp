// modules/loader/graph_loader.cpp
#include "modules/loader/graph_loader.h"
#include "common/utils/yaml_json.h"
#include "core/types/errors.h"
#include "modules/capabilities/routers.h"
#include "modules/capabilities/workers.h"
#include <fstream>
#include <limits>
#include <map>
#include <sstream>
#include <utility>

namespace agentgraph {

namespace {

// "(registered: a, b)" or "(none registered)"
std::string registered_list(const std::vector<std::string>& names) {
    if (names.empty()) return "(none registered)";
    std::string out = "(registered: ";
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out + ")";
}

std::string require_string(const nlohmann::json& obj, const std::string& key, const std::string& where) {
    if (!obj.is_object() || !obj.contains(key)) {
        throw ConfigurationError("Missing '" + key + "' in " + where);
    }
    const auto& v = obj[key];
    if (!v.is_string() || v.get<std::string>().empty()) {
        throw ConfigurationError("'" + key + "' must be a non-empty string in " + where);
    }
    return v.get<std::string>();
}

std::vector<std::string> parse_string_list(const nlohmann::json& value, const std::string& where) {
    if (!value.is_array()) {
        throw ConfigurationError("Expected a list of strings in " + where);
    }
    std::vector<std::string> out;
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw ConfigurationError("Expected a list of strings in " + where + ", got: " + item.dump());
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

// "name" is shorthand for {kind: capability, name: name}
nlohmann::json normalize_capability_spec(const nlohmann::json& spec, const std::string& where) {
    if (spec.is_string()) {
        return {{"kind", "capability"}, {"name", spec}};
    }
    if (!spec.is_object()) {
        throw ConfigurationError("Capability of " + where + " must be a name or an object");
    }
    return spec;
}

const FieldSpec& require_field(const StateSchema& schema, const std::string& field, const std::string& where) {
    const FieldSpec* spec = schema.find(field);
    if (!spec) {
        throw ConfigurationError(where + " writes undeclared state field '" + field + "'");
    }
    return *spec;
}

} // namespace

GraphLoader::GraphLoader(CapabilityRegistry capabilities) : capabilities_(std::move(capabilities)) {}

LoadedGraph GraphLoader::load_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigurationError("Cannot open file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

LoadedGraph GraphLoader::load_from_string(const std::string& yaml_content) {
    return load_from_json(parse_yaml(yaml_content));
}

LoadedGraph GraphLoader::load_from_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw ConfigurationError("Graph document must be a mapping");
    }

    try {
        StateSchema schema = parse_schema(doc.value("state", nlohmann::json::object()));
        GraphBuilder builder(schema);

        if (!doc.contains("nodes") || !doc["nodes"].is_array() || doc["nodes"].empty()) {
            throw ConfigurationError("Graph document must declare a non-empty 'nodes' list");
        }
        for (const auto& node_json : doc["nodes"]) {
            builder.register_node(create_node_from_json(node_json, schema));
        }

        add_edges(builder, doc.value("edges", nlohmann::json::array()));
        builder.set_entry_point(require_string(doc, "entry", "graph document"));

        LoadedGraph loaded;
        loaded.graph = builder.compile();
        loaded.options = parse_run_options(doc.value("run", nlohmann::json::object()));
        return loaded;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("Invalid graph document: ") + e.what());
    }
}

StateSchema GraphLoader::parse_schema(const nlohmann::json& state_json) {
    if (!state_json.is_object()) {
        throw ConfigurationError("'state' must be a mapping of field name to reducer");
    }

    StateSchema schema;
    for (auto it = state_json.begin(); it != state_json.end(); ++it) {
        const auto& field = it.value();
        if (field.is_string()) {
            schema.add_field(it.key(), parse_reducer(field.get<std::string>()));
            continue;
        }
        if (!field.is_object()) {
            throw ConfigurationError("State field '" + it.key() + "' must be a reducer name or a mapping");
        }
        Reducer reducer = parse_reducer(field.value("reducer", std::string("overwrite")));
        std::optional<Value> default_value;
        if (field.contains("default")) {
            default_value = field["default"];
        }
        schema.add_field(it.key(), reducer, std::move(default_value));
    }
    return schema;
}

RunOptions GraphLoader::parse_run_options(const nlohmann::json& run_json) {
    if (!run_json.is_object()) {
        throw ConfigurationError("'run' must be a mapping");
    }
    RunOptions options;
    if (run_json.contains("max_steps")) {
        const auto& max_steps = run_json["max_steps"];
        if (!max_steps.is_number_integer() || max_steps.get<long long>() < 1 ||
            max_steps.get<long long>() > std::numeric_limits<int>::max()) {
            throw ConfigurationError("run.max_steps must be an integer in [1, " +
                                     std::to_string(std::numeric_limits<int>::max()) + "], got: " +
                                     max_steps.dump());
        }
        options.max_steps = static_cast<int>(max_steps.get<long long>());
    }
    if (run_json.contains("node_timeout_ms")) {
        if (!run_json["node_timeout_ms"].is_number_integer() || run_json["node_timeout_ms"].get<long long>() < 0) {
            throw ConfigurationError("run.node_timeout_ms must be a non-negative integer");
        }
        options.node_timeout = std::chrono::milliseconds(run_json["node_timeout_ms"].get<long long>());
    }
    if (run_json.contains("debug")) {
        if (!run_json["debug"].is_boolean()) {
            throw ConfigurationError("run.debug must be true or false");
        }
        options.debug = run_json["debug"].get<bool>();
    }
    return options;
}

NodeSpec GraphLoader::create_node_from_json(const nlohmann::json& node_json, const StateSchema& schema) {
    if (!node_json.is_object()) {
        throw ConfigurationError("Each node must be a mapping, got: " + node_json.dump());
    }
    NodeSpec spec;
    spec.id = require_string(node_json, "id", "node");
    const std::string where = "node '" + spec.id + "'";
    spec.metadata = node_json.value("metadata", nlohmann::json::object());
    if (!spec.metadata.is_object()) {
        throw ConfigurationError("'metadata' must be a mapping in " + where);
    }
    const std::string type = require_string(node_json, "type", where);

    if (type == "worker") {
        if (!node_json.contains("worker")) {
            throw ConfigurationError("Missing 'worker' in " + where);
        }
        spec.kind = NodeKind::WORKER;
        spec.worker = create_worker(spec.id, node_json["worker"], schema);
        return spec;
    }

    if (type == "router") {
        if (!node_json.contains("options")) {
            throw ConfigurationError("Missing 'options' in " + where);
        }
        if (!node_json.contains("decision")) {
            throw ConfigurationError("Missing 'decision' in " + where);
        }
        spec.kind = NodeKind::ROUTER;
        spec.options = parse_string_list(node_json["options"], where + " options");
        if (node_json.contains("output_field")) {
            spec.output_field = require_string(node_json, "output_field", where);
        }
        spec.decision = create_decision(spec.id, node_json["decision"], spec.options);
        return spec;
    }

    throw ConfigurationError("Unknown node type '" + type + "' in " + where);
}

std::shared_ptr<Worker> GraphLoader::create_worker(const NodeId& id, const nlohmann::json& raw,
                                                   const StateSchema& schema) {
    const std::string where = "worker of node '" + id + "'";
    nlohmann::json spec = normalize_capability_spec(raw, where);
    const std::string kind = require_string(spec, "kind", where);

    if (kind == "capability") {
        const std::string name = require_string(spec, "name", where);
        auto worker = capabilities_.worker(name);
        if (!worker) {
            throw ConfigurationError("Unknown worker capability '" + name + "' for node '" + id + "' " +
                                     registered_list(capabilities_.worker_names()));
        }
        return worker;
    }

    if (kind == "template") {
        const std::string output = require_string(spec, "output", where);
        const FieldSpec& field = require_field(schema, output, "Node '" + id + "'");
        std::optional<std::string> role;
        if (spec.contains("role")) {
            role = require_string(spec, "role", where);
        }
        return std::make_shared<TemplateWorker>(require_string(spec, "template", where), output, field.reducer,
                                                std::move(role));
    }

    if (kind == "tool") {
        const std::string tool = require_string(spec, "tool", where);
        if (!capabilities_.tools()->has_tool(tool)) {
            throw ConfigurationError("Unknown tool '" + tool + "' for node '" + id + "'");
        }
        const std::string output = require_string(spec, "output", where);
        const FieldSpec& field = require_field(schema, output, "Node '" + id + "'");
        nlohmann::json arguments = spec.value("arguments", nlohmann::json::object());
        if (!arguments.is_object()) {
            throw ConfigurationError("'arguments' must be a mapping in " + where);
        }
        return std::make_shared<ToolWorker>(capabilities_.tools(), tool, std::move(arguments), output,
                                            field.reducer);
    }

    throw ConfigurationError("Unknown worker kind '" + kind + "' for node '" + id + "'");
}

std::shared_ptr<Decision> GraphLoader::create_decision(const NodeId& id, const nlohmann::json& raw,
                                                       const std::vector<std::string>& options) {
    const std::string where = "decision of router '" + id + "'";
    nlohmann::json spec = normalize_capability_spec(raw, where);
    const std::string kind = require_string(spec, "kind", where);

    auto check_label = [&](const std::string& label) {
        for (const auto& opt : options) {
            if (opt == label) return;
        }
        throw ConfigurationError("Label '" + label + "' in " + where + " is not a declared option");
    };

    if (kind == "capability") {
        const std::string name = require_string(spec, "name", where);
        auto decision = capabilities_.decision(name);
        if (!decision) {
            throw ConfigurationError("Unknown decision capability '" + name + "' for router '" + id + "' " +
                                     registered_list(capabilities_.decision_names()));
        }
        return decision;
    }

    if (kind == "expression") {
        std::vector<RoutingRule> rules;
        for (const auto& rule_json : spec.value("rules", nlohmann::json::array())) {
            RoutingRule rule{require_string(rule_json, "when", where), require_string(rule_json, "label", where)};
            check_label(rule.label);
            rules.push_back(std::move(rule));
        }
        std::optional<std::string> default_label;
        if (spec.contains("default")) {
            default_label = require_string(spec, "default", where);
            check_label(*default_label);
        }
        if (rules.empty() && !default_label) {
            throw ConfigurationError(where + " has neither rules nor a default label");
        }
        return std::make_shared<ExpressionRouter>(std::move(rules), std::move(default_label));
    }

    if (kind == "llm") {
        return std::make_shared<LlmRouter>(resolve_generator(spec), require_string(spec, "prompt", where), options);
    }

    throw ConfigurationError("Unknown decision kind '" + kind + "' for router '" + id + "'");
}

std::shared_ptr<TextGenerator> GraphLoader::resolve_generator(const nlohmann::json& spec) {
    if (auto generator = capabilities_.text_generator()) {
        return generator;
    }
    if (!default_generator_) {
        std::string config_path = spec.value("llm_config", std::string("llm_config.json"));
        try {
            default_generator_ = std::make_shared<LlamaAdapter>(load_llm_config(config_path));
        } catch (const std::runtime_error& e) {
            throw ConfigurationError(std::string("Cannot create LLM for router: ") + e.what());
        }
    }
    return default_generator_;
}

void GraphLoader::add_edges(GraphBuilder& builder, const nlohmann::json& edges_json) {
    if (!edges_json.is_array()) {
        throw ConfigurationError("'edges' must be a list");
    }
    for (const auto& edge : edges_json) {
        const std::string from = require_string(edge, "from", "edge");
        const std::string where = "edge from '" + from + "'";

        if (edge.contains("dispatch")) {
            if (!edge["dispatch"].is_object()) {
                throw ConfigurationError("'dispatch' must be a mapping in " + where);
            }
            std::map<std::string, NodeId> dispatch;
            for (auto it = edge["dispatch"].begin(); it != edge["dispatch"].end(); ++it) {
                if (!it.value().is_string()) {
                    throw ConfigurationError("Dispatch target for '" + it.key() + "' must be a node id in " + where);
                }
                dispatch[it.key()] = it.value().get<std::string>();
            }

            std::vector<std::string> options;
            if (edge.contains("options")) {
                options = parse_string_list(edge["options"], where + " options");
            } else if (const NodeSpec* router = builder.registry().find(from)) {
                options = router->options;
            }
            builder.add_conditional_edge(from, std::move(options), std::move(dispatch));
            continue;
        }

        builder.add_edge(from, require_string(edge, "to", where));
    }
}

} // namespace agentgraph
