// tests/test_trace.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "modules/builder/graph_builder.h"
#include "modules/trace/trace_exporter.h"
#include <stdexcept>
#include <string>

using namespace agentgraph;
using Catch::Matchers::StartsWith;

namespace {

std::shared_ptr<const Graph> two_step_graph(bool fail_second) {
    StateSchema schema;
    schema.add_field("log", Reducer::APPEND).add_field("route", Reducer::OVERWRITE);

    GraphBuilder b(schema);
    b.register_router("pick", {"work"}, make_decision([](const Snapshot&) { return std::string("work"); }), "route")
     .register_worker("work", make_worker([fail_second](const Snapshot&) -> Value {
         if (fail_second) throw std::runtime_error("boom");
         return Value{{"log", {"worked"}}};
     }))
     .add_conditional_edge("pick", {"work"}, {{"work", "work"}})
     .set_finish_point("work")
     .set_entry_point("pick");
    return b.compile();
}

} // namespace

TEST_CASE("One trace record per step", "[trace][records]") {
    RunOptions options;
    options.run_id = "run-42";
    RunResult result = two_step_graph(false)->run(Value::object(), options);

    REQUIRE(result.run_id == "run-42");
    REQUIRE(result.traces.size() == 2);

    const TraceRecord& router = result.traces[0];
    REQUIRE(router.run_id == "run-42");
    REQUIRE(router.step_index == 1);
    REQUIRE(router.node_id == "pick");
    REQUIRE(router.kind == "router");
    REQUIRE(router.status == "success");
    REQUIRE(router.route == "work");
    REQUIRE(router.state_delta == Value{{"route", "work"}});

    const TraceRecord& worker = result.traces[1];
    REQUIRE(worker.kind == "worker");
    REQUIRE(worker.state_delta == Value{{"log", {"worked"}}});
    REQUIRE(worker.end_time >= worker.start_time);
}

TEST_CASE("Failed step is traced with its error", "[trace][records]") {
    RunResult result = two_step_graph(true)->invoke();

    REQUIRE(result.traces.size() == 2);
    REQUIRE(result.traces[1].status == "failed");
    REQUIRE(result.traces[1].error_message.has_value());
    REQUIRE(result.traces[1].state_delta.empty());
}

TEST_CASE("Trace JSON export", "[trace][json]") {
    RunResult result = two_step_graph(false)->run();
    nlohmann::json out = TraceExporter::to_json(result.traces);

    REQUIRE(out.is_array());
    REQUIRE(out.size() == 2);
    REQUIRE(out[0]["node"] == "pick");
    REQUIRE(out[0]["route"] == "work");
    REQUIRE(out[1]["route"].is_null());
    REQUIRE(out[1]["error"].is_null());
    REQUIRE(out[1]["duration_us"].get<long long>() >= 0);
}

TEST_CASE("Generated run ids are unique", "[trace][run_id]") {
    std::string a = generate_run_id();
    std::string b = generate_run_id();

    REQUIRE_THAT(a, StartsWith("t-"));
    REQUIRE(a != b);
}
