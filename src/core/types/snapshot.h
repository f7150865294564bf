#ifndef AGENTGRAPH_CORE_TYPES_SNAPSHOT_H
#define AGENTGRAPH_CORE_TYPES_SNAPSHOT_H

#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <utility>

namespace agentgraph {

// 使用 nlohmann::json 作为统一的数据类型
using Value = nlohmann::json;

// Immutable point-in-time value of the shared state.
// Copies share the underlying object; nothing can write through a Snapshot.
class Snapshot {
public:
    Snapshot() : data_(std::make_shared<const Value>(Value::object())) {}
    explicit Snapshot(Value values)
        : data_(std::make_shared<const Value>(std::move(values))) {}

    const Value& values() const { return *data_; }

    bool contains(const std::string& field) const { return data_->contains(field); }

    // Throws nlohmann::json::out_of_range for an absent field.
    const Value& at(const std::string& field) const { return data_->at(field); }

    Value get(const std::string& field, Value fallback = nullptr) const {
        auto it = data_->find(field);
        return it != data_->end() ? *it : std::move(fallback);
    }

    std::string dump(int indent = -1) const { return data_->dump(indent); }

    bool shares_storage_with(const Snapshot& other) const { return data_ == other.data_; }

    friend bool operator==(const Snapshot& lhs, const Snapshot& rhs) {
        return lhs.data_ == rhs.data_ || *lhs.data_ == *rhs.data_;
    }

private:
    std::shared_ptr<const Value> data_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_CORE_TYPES_SNAPSHOT_H
