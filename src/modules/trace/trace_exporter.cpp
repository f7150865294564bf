// modules/trace/trace_exporter.cpp
#include "modules/trace/trace_exporter.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <utility>

namespace agentgraph {

namespace {

long long to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

std::string generate_run_id() {
    static std::atomic<unsigned long long> sequence{0};
    auto now = to_epoch_ms(std::chrono::system_clock::now());
    return "t-" + std::to_string(now) + "-" + std::to_string(sequence.fetch_add(1));
}

TraceExporter::TraceExporter(std::string run_id) : run_id_(std::move(run_id)) {}

void TraceExporter::on_step_start(std::size_t step_index, const NodeSpec& node) {
    TraceRecord record;
    record.run_id = run_id_;
    record.step_index = step_index;
    record.node_id = node.id;
    record.kind = to_string(node.kind);
    record.start_time = std::chrono::system_clock::now();
    record.status = "running"; // Placeholder, will be updated in on_step_end
    traces_.push_back(std::move(record));
}

void TraceExporter::on_step_end(
    std::size_t step_index,
    const std::string& status,
    const std::optional<std::string>& error_message,
    const nlohmann::json& state_delta,
    const std::optional<std::string>& route) {

    auto it = std::find_if(traces_.rbegin(), traces_.rend(), [step_index](const TraceRecord& r) {
        return r.step_index == step_index && r.status == "running";
    });
    if (it == traces_.rend()) {
        return;
    }

    it->end_time = std::chrono::system_clock::now();
    it->status = status;
    it->error_message = error_message;
    it->state_delta = state_delta;
    it->route = route;
}

nlohmann::json TraceExporter::to_json(const TraceRecord& record) {
    nlohmann::json obj;
    obj["run_id"] = record.run_id;
    obj["step"] = record.step_index;
    obj["node"] = record.node_id;
    obj["kind"] = record.kind;
    obj["status"] = record.status;
    obj["start_ms"] = to_epoch_ms(record.start_time);
    obj["end_ms"] = to_epoch_ms(record.end_time);
    obj["duration_us"] = std::chrono::duration_cast<std::chrono::microseconds>(
        record.end_time - record.start_time).count();
    obj["state_delta"] = record.state_delta;
    obj["error"] = record.error_message ? nlohmann::json(*record.error_message) : nlohmann::json(nullptr);
    obj["route"] = record.route ? nlohmann::json(*record.route) : nlohmann::json(nullptr);
    return obj;
}

nlohmann::json TraceExporter::to_json(const std::vector<TraceRecord>& records) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : records) {
        arr.push_back(to_json(r));
    }
    return arr;
}

} // namespace agentgraph
