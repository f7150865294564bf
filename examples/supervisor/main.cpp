#include "agentgraph/core/engine.h"
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    std::string path = argc > 1 ? argv[1] : "examples/supervisor/supervisor.yaml";

    // 1. 注册能力：工具与自定义 worker
    agentgraph::CapabilityRegistry caps;
    caps.add_tool("web_search", [](const nlohmann::json& args) {
        return nlohmann::json{{"role", "researcher"},
                              {"content", "Found 3 notes for: " + args.at("query").get<std::string>()}};
    });
    caps.add_worker("write_code", agentgraph::make_worker([](const agentgraph::Snapshot& state) {
        std::string last = state.at("messages").back().value("content", "");
        agentgraph::Value message = {{"role", "coder"}, {"content", "print(\"" + last + "\")"}};
        return agentgraph::Value{{"messages", agentgraph::Value::array({message})}};
    }));

    try {
        auto engine = agentgraph::GraphEngine::from_file(path, caps);

        // 2. 逐步观察执行过程
        auto stream = engine->stream();
        for (const auto& step : stream) {
            std::cout << "step " << step.index << " " << step.node;
            if (step.route) {
                std::cout << " -> " << *step.route;
            }
            std::cout << "\n";
        }

        auto result = stream.result();
        std::cout << "status: " << agentgraph::to_string(result.status) << " (" << result.message << ")\n";
        std::cout << "final state:\n" << result.final_state.dump(2) << std::endl;
        return result.success ? 0 : 1;
    } catch (const agentgraph::GraphError& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }
}
