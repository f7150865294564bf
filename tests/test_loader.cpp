// tests/test_loader.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "agentgraph/core/engine.h"
#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>

using namespace agentgraph;
using Catch::Matchers::ContainsSubstring;

namespace {

const std::string kSupervisorYaml = R"(
state:
  messages: append
  next:
    reducer: overwrite
  topic:
    reducer: overwrite
    default: "graphs"

entry: supervisor

nodes:
  - id: supervisor
    type: router
    options: [Researcher, FINISH]
    output_field: next
    decision:
      kind: expression
      rules:
        - when: "length(messages) == 0"
          label: Researcher
      default: FINISH

  - id: Researcher
    type: worker
    worker:
      kind: template
      template: "Notes on {{ topic }}"
      output: messages
      role: assistant

edges:
  - from: supervisor
    dispatch:
      Researcher: Researcher
      FINISH: __end__
  - from: Researcher
    to: supervisor

run:
  max_steps: 10
)";

} // namespace

TEST_CASE("YAML supervisor graph loads and runs", "[loader][yaml]") {
    GraphLoader loader;
    LoadedGraph loaded = loader.load_from_string(kSupervisorYaml);

    REQUIRE(loaded.options.max_steps == 10);
    REQUIRE(loaded.graph->entry_point().id == "supervisor");

    RunResult result = loaded.graph->run(Value::object(), loaded.options);
    REQUIRE(result.success);
    REQUIRE(result.steps.size() == 3);
    REQUIRE(result.final_state.at("next") == "FINISH");
    REQUIRE(result.final_state.at("messages") ==
            Value::array({Value{{"role", "assistant"}, {"content", "Notes on graphs"}}}));
}

TEST_CASE("Capabilities and tools are bound by name", "[loader][capabilities]") {
    CapabilityRegistry caps;
    caps.add_tool("search", [](const nlohmann::json& args) {
        return nlohmann::json("results for " + args.at("query").get<std::string>());
    });
    caps.add_decision("pick", make_decision([](const Snapshot& s) {
        return s.at("results").empty() ? std::string("search") : std::string("done");
    }));

    const std::string yaml = R"(
state:
  query: overwrite
  results: append
entry: router
nodes:
  - id: router
    type: router
    options: [search, done]
    decision: pick
  - id: search
    type: worker
    worker:
      kind: tool
      tool: search
      arguments:
        query: "{{ query }}"
      output: results
edges:
  - from: router
    dispatch: {search: search, done: __end__}
  - from: search
    to: router
)";

    auto engine = GraphEngine::from_yaml(yaml, caps);
    RunResult result = engine->run({{"query", "c++ graphs"}});

    REQUIRE(result.success);
    REQUIRE(result.final_state.at("results") == Value({"results for c++ graphs"}));
    REQUIRE(engine->get_last_traces().size() == 3);
}

TEST_CASE("Structural problems are configuration errors", "[loader][errors]") {
    GraphLoader loader;

    SECTION("syntax error") {
        REQUIRE_THROWS_AS(loader.load_from_string("nodes: [unclosed"), ConfigurationError);
    }
    SECTION("unknown reducer") {
        REQUIRE_THROWS_WITH(loader.load_from_string(R"(
state: {x: sum}
entry: a
nodes: [{id: a, type: worker, worker: w}]
)"),
                            ContainsSubstring("Unknown reducer 'sum'"));
    }
    SECTION("unknown worker capability") {
        REQUIRE_THROWS_WITH(loader.load_from_string(R"(
entry: a
nodes: [{id: a, type: worker, worker: missing}]
edges: [{from: a, to: __end__}]
)"),
                            ContainsSubstring("Unknown worker capability 'missing'"));
    }
    SECTION("unknown capability names the registered ones") {
        CapabilityRegistry caps;
        caps.add_worker("summarize", make_worker([](const Snapshot&) { return Value::object(); }));
        caps.add_decision("route", make_decision([](const Snapshot&) { return std::string("A"); }));
        GraphLoader bound(caps);

        REQUIRE_THROWS_WITH(bound.load_from_string(R"(
entry: a
nodes: [{id: a, type: worker, worker: summarise}]
edges: [{from: a, to: __end__}]
)"),
                            ContainsSubstring("(registered: summarize)"));
        REQUIRE_THROWS_WITH(bound.load_from_string(R"(
entry: r
nodes: [{id: r, type: router, options: [A], decision: pick}]
edges: [{from: r, dispatch: {A: __end__}}]
)"),
                            ContainsSubstring("(registered: route)"));
        REQUIRE_THROWS_WITH(loader.load_from_string(R"(
entry: r
nodes: [{id: r, type: router, options: [A], decision: pick}]
edges: [{from: r, dispatch: {A: __end__}}]
)"),
                            ContainsSubstring("(none registered)"));
    }
    SECTION("missing dispatch label") {
        REQUIRE_THROWS_WITH(loader.load_from_string(R"(
state: {out: overwrite}
entry: r
nodes:
  - {id: r, type: router, options: [A, B], decision: {kind: expression, default: A}}
  - {id: A, type: worker, worker: {kind: template, template: "x", output: out}}
edges:
  - {from: r, dispatch: {A: A}}
  - {from: A, to: __end__}
)"),
                            ContainsSubstring("missing: 'B'"));
    }
    SECTION("rule label outside the option set") {
        REQUIRE_THROWS_WITH(loader.load_from_string(R"(
entry: r
nodes:
  - {id: r, type: router, options: [A], decision: {kind: expression, default: Z}}
edges:
  - {from: r, dispatch: {A: __end__}}
)"),
                            ContainsSubstring("Label 'Z'"));
    }
    SECTION("worker output to an undeclared field") {
        REQUIRE_THROWS_WITH(loader.load_from_string(R"(
entry: a
nodes: [{id: a, type: worker, worker: {kind: template, template: "x", output: nowhere}}]
edges: [{from: a, to: __end__}]
)"),
                            ContainsSubstring("undeclared state field 'nowhere'"));
    }
    SECTION("invalid run options") {
        REQUIRE_THROWS_AS(loader.load_from_string(R"(
state: {out: overwrite}
entry: a
nodes: [{id: a, type: worker, worker: {kind: template, template: "x", output: out}}]
edges: [{from: a, to: __end__}]
run: {max_steps: 0}
)"),
                          ConfigurationError);
    }
    SECTION("max_steps beyond the int range") {
        REQUIRE_THROWS_WITH(loader.load_from_string(R"(
state: {out: overwrite}
entry: a
nodes: [{id: a, type: worker, worker: {kind: template, template: "x", output: out}}]
edges: [{from: a, to: __end__}]
run: {max_steps: 4294967297}
)"),
                            ContainsSubstring("run.max_steps must be an integer in [1, 2147483647]"));
    }
    SECTION("negative node timeout") {
        REQUIRE_THROWS_AS(loader.load_from_string(R"(
state: {out: overwrite}
entry: a
nodes: [{id: a, type: worker, worker: {kind: template, template: "x", output: out}}]
edges: [{from: a, to: __end__}]
run: {node_timeout_ms: -5}
)"),
                          ConfigurationError);
    }
    SECTION("debug flag that is not a boolean") {
        REQUIRE_THROWS_WITH(loader.load_from_string(R"(
state: {out: overwrite}
entry: a
nodes: [{id: a, type: worker, worker: {kind: template, template: "x", output: out}}]
edges: [{from: a, to: __end__}]
run: {debug: "loud"}
)"),
                            ContainsSubstring("run.debug"));
    }
    SECTION("metadata that is not a mapping") {
        REQUIRE_THROWS_WITH(loader.load_from_string(R"(
state: {out: overwrite}
entry: a
nodes: [{id: a, type: worker, metadata: [1, 2], worker: {kind: template, template: "x", output: out}}]
edges: [{from: a, to: __end__}]
)"),
                            ContainsSubstring("'metadata' must be a mapping"));
    }
    SECTION("missing file") {
        REQUIRE_THROWS_WITH(loader.load_from_file("/nonexistent/graph.yaml"),
                            ContainsSubstring("Cannot open file"));
    }
}

TEST_CASE("Run section sets limits, timeout and debug", "[loader][run]") {
    GraphLoader loader;
    LoadedGraph loaded = loader.load_from_string(R"(
state: {out: overwrite}
entry: a
nodes: [{id: a, type: worker, worker: {kind: template, template: "x", output: out}}]
edges: [{from: a, to: __end__}]
run:
  max_steps: 2147483647
  node_timeout_ms: 250
  debug: true
)");

    REQUIRE(loaded.options.max_steps == 2147483647);
    REQUIRE(loaded.options.node_timeout == std::chrono::milliseconds(250));
    REQUIRE(loaded.options.debug);

    RunResult result = loaded.graph->run(Value::object(), loaded.options);
    REQUIRE(result.success);
    REQUIRE(result.final_state.at("out") == "x");

    LoadedGraph defaults = loader.load_from_string(kSupervisorYaml);
    REQUIRE(defaults.options.node_timeout == std::chrono::milliseconds(0));
    REQUIRE_FALSE(defaults.options.debug);
}

TEST_CASE("Node metadata is reported by describe()", "[loader][metadata]") {
    GraphLoader loader;
    LoadedGraph loaded = loader.load_from_string(R"(
state:
  topic: overwrite
  answer: overwrite
entry: a
nodes:
  - id: a
    type: worker
    metadata: {owner: research, retries: 2}
    worker: {kind: template, template: "x", output: answer}
  - id: b
    type: worker
    worker: {kind: template, template: "y", output: topic}
edges:
  - {from: a, to: b}
  - {from: b, to: __end__}
)");

    nlohmann::json desc = loaded.graph->describe();
    REQUIRE(desc["nodes"][0]["metadata"] == nlohmann::json{{"owner", "research"}, {"retries", 2}});
    REQUIRE_FALSE(desc["nodes"][1].contains("metadata"));

    // state mapping keys come back sorted, whatever the document order
    const auto& fields = loaded.graph->state_engine().schema().fields();
    REQUIRE(fields.size() == 2);
    REQUIRE(fields[0].name == "answer");
    REQUIRE(fields[1].name == "topic");
}

TEST_CASE("Graph engine loads from a file", "[loader][file]") {
    const std::string path = "test_loader_graph.yaml";
    {
        std::ofstream out(path);
        out << kSupervisorYaml;
    }

    auto engine = GraphEngine::from_file(path);
    REQUIRE(engine->default_options().max_steps == 10);

    auto stream = engine->stream();
    std::size_t count = 0;
    for (const Step& step : stream) {
        (void)step;
        ++count;
    }
    REQUIRE(count == 3);
    REQUIRE(stream.result().success);

    std::remove(path.c_str());
}
