// tests/test_capabilities.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "common/llm/llama_adapter.h"
#include "common/utils/template_renderer.h"
#include "core/types/errors.h"
#include "modules/builder/graph_builder.h"
#include "modules/capabilities/capability_registry.h"
#include "modules/capabilities/routers.h"
#include "modules/capabilities/workers.h"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace agentgraph;
using Catch::Matchers::ContainsSubstring;

namespace {

// Canned responses in place of a model.
class ScriptedGenerator : public TextGenerator {
public:
    explicit ScriptedGenerator(std::vector<std::string> responses) : responses_(std::move(responses)) {}

    std::string generate(const std::string& prompt) override {
        prompts.push_back(prompt);
        return responses_.at(next_++ % responses_.size());
    }

    std::vector<std::string> prompts;

private:
    std::vector<std::string> responses_;
    std::size_t next_ = 0;
};

// Custom llama sampler that only counts reset() calls.
int* reset_counter(llama_sampler* smpl) {
    return static_cast<int*>(smpl->ctx);
}

void decode_then_fail(llama_sampler* sampler) {
    SamplerResetGuard reset_sampler(sampler);
    throw std::runtime_error("Token decode failed after 3 tokens");
}

} // namespace

TEST_CASE("Template renderer", "[capabilities][template]") {
    Value data = {{"name", "Coder"}, {"messages", {"a", "b", "c"}}};

    REQUIRE(InjaTemplateRenderer::render("Hello {{ name }}", data) == "Hello Coder");
    REQUIRE(InjaTemplateRenderer::evaluate_condition("length(messages) > 2", data));
    REQUIRE_FALSE(InjaTemplateRenderer::evaluate_condition("name == \"Researcher\"", data));
    REQUIRE_THROWS_AS(InjaTemplateRenderer::render("{% include \"secret.txt\" %}", data), std::runtime_error);
}

TEST_CASE("Template worker respects the field reducer", "[capabilities][workers]") {
    Snapshot state(Value{{"topic", "routing"}});

    TemplateWorker text("About {{ topic }}", "summary", Reducer::OVERWRITE);
    REQUIRE(text.invoke(state) == Value{{"summary", "About routing"}});

    TemplateWorker message("About {{ topic }}", "messages", Reducer::APPEND, "assistant");
    Value update = message.invoke(state);
    REQUIRE(update.at("messages").size() == 1);
    REQUIRE(update.at("messages")[0] == Value{{"role", "assistant"}, {"content", "About routing"}});
}

TEST_CASE("Tool worker renders arguments and calls the tool", "[capabilities][workers]") {
    auto tools = std::make_shared<ToolRegistry>();
    tools->register_tool("add", [](const nlohmann::json& args) {
        return args.at("a").get<int>() + args.at("b").get<int>();
    });
    tools->register_tool("echo", [](const nlohmann::json& args) { return args.at("text"); });
    tools->register_tool("broken", [](const nlohmann::json&) -> nlohmann::json {
        throw std::runtime_error("disk full");
    });

    Snapshot state(Value{{"who", "world"}});

    ToolWorker add(tools, "add", {{"a", 2}, {"b", 3}}, "sum", Reducer::OVERWRITE);
    REQUIRE(add.invoke(state) == Value{{"sum", 5}});

    ToolWorker echo(tools, "echo", {{"text", "hi {{ who }}"}}, "log", Reducer::APPEND);
    REQUIRE(echo.invoke(state) == Value{{"log", {"hi world"}}});

    ToolWorker broken(tools, "broken", Value::object(), "log", Reducer::APPEND);
    REQUIRE_THROWS_WITH(broken.invoke(state), ContainsSubstring("disk full"));

    ToolWorker missing(tools, "nope", Value::object(), "log", Reducer::APPEND);
    REQUIRE_THROWS_AS(missing.invoke(state), std::runtime_error);

    REQUIRE(tools->list_tools() == std::vector<std::string>{"add", "broken", "echo"});
}

TEST_CASE("Expression router picks the first matching rule", "[capabilities][routers]") {
    ExpressionRouter router({{"length(messages) == 0", "Researcher"}, {"length(messages) < 3", "Coder"}},
                            std::string("FINISH"));

    REQUIRE(router.decide(Snapshot(Value{{"messages", Value::array()}})) == "Researcher");
    REQUIRE(router.decide(Snapshot(Value{{"messages", {1, 2}}})) == "Coder");
    REQUIRE(router.decide(Snapshot(Value{{"messages", {1, 2, 3}}})) == "FINISH");

    ExpressionRouter strict({{"length(messages) == 0", "Researcher"}}, std::nullopt);
    REQUIRE_THROWS_AS(strict.decide(Snapshot(Value{{"messages", {1}}})), std::runtime_error);
}

TEST_CASE("LLM response label extraction", "[capabilities][routers]") {
    const std::vector<std::string> options = {"Researcher", "Coder", "FINISH"};

    REQUIRE(LlmRouter::pick_option("Next: Coder", options) == "Coder");
    REQUIRE(LlmRouter::pick_option("Coder first, then Researcher", options) == "Coder");
    REQUIRE(LlmRouter::pick_option("We are done. FINISH", options) == "FINISH");
    REQUIRE_FALSE(LlmRouter::pick_option("no idea", options).has_value());

    REQUIRE(LlmRouter::pick_option("Coders", {"Code", "Coder"}) == "Coder");
}

TEST_CASE("LLM router inside a supervisor graph", "[capabilities][routers]") {
    auto generator = std::make_shared<ScriptedGenerator>(std::vector<std::string>{"Researcher", "I choose FINISH"});
    const std::vector<std::string> options = {"Researcher", "FINISH"};

    StateSchema schema;
    schema.add_field("messages", Reducer::APPEND).add_field("next", Reducer::OVERWRITE);

    auto router = std::make_shared<LlmRouter>(
        generator, "Pick one of {{ first(options) }} or {{ last(options) }}", options);

    GraphBuilder b(schema);
    b.register_router("supervisor", options, router, "next")
     .register_worker("Researcher", std::make_shared<TemplateWorker>("found it", "messages", Reducer::APPEND))
     .add_conditional_edge("supervisor", options, {{"Researcher", "Researcher"}, {"FINISH", END}})
     .add_edge("Researcher", "supervisor")
     .set_entry_point("supervisor");

    RunResult result = b.compile()->run();

    REQUIRE(result.success);
    REQUIRE(result.final_state.at("messages") == Value({"found it"}));
    REQUIRE(result.final_state.at("next") == "FINISH");
    REQUIRE(generator->prompts.size() == 2);
    REQUIRE(generator->prompts[0] == "Pick one of Researcher or FINISH");
}

TEST_CASE("LLM router with an unusable response fails the step", "[capabilities][routers]") {
    auto generator = std::make_shared<ScriptedGenerator>(std::vector<std::string>{"I am not sure"});
    const std::vector<std::string> options = {"A"};

    StateSchema schema;
    GraphBuilder b(schema);
    b.register_router("r", options, std::make_shared<LlmRouter>(generator, "choose", options))
     .add_conditional_edge("r", options, {{"A", END}})
     .set_entry_point("r");

    REQUIRE_THROWS_AS(b.compile()->run(), NodeInvocationError);
}

TEST_CASE("Capability registry", "[capabilities][registry]") {
    CapabilityRegistry caps;
    caps.add_worker("w", make_worker([](const Snapshot&) { return Value::object(); }));
    caps.add_decision("d", make_decision([](const Snapshot&) { return std::string("x"); }));

    REQUIRE(caps.worker("w") != nullptr);
    REQUIRE(caps.worker("nope") == nullptr);
    REQUIRE(caps.decision("d") != nullptr);
    REQUIRE(caps.worker_names() == std::vector<std::string>{"w"});
    REQUIRE_THROWS_AS(caps.add_worker("null", nullptr), ConfigurationError);
    REQUIRE(caps.text_generator() == nullptr);
}

TEST_CASE("Sampler is reset when generation ends early", "[capabilities][llm]") {
    int resets = 0;
    llama_sampler_i iface{};
    iface.reset = [](llama_sampler* smpl) { ++*reset_counter(smpl); };
    std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)> sampler(llama_sampler_init(&iface, &resets),
                                                                          llama_sampler_free);

    REQUIRE_THROWS_WITH(decode_then_fail(sampler.get()), ContainsSubstring("decode failed"));
    REQUIRE(resets == 1);

    {
        SamplerResetGuard reset_sampler(sampler.get());
    }
    REQUIRE(resets == 2);
}
