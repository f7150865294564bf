// modules/state/state_engine.h
#ifndef AGENTGRAPH_MODULES_STATE_STATE_ENGINE_H
#define AGENTGRAPH_MODULES_STATE_STATE_ENGINE_H

#include "core/types/snapshot.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentgraph {

// 合并策略
enum class Reducer : uint8_t {
    OVERWRITE, // new value replaces old
    APPEND     // new sequence concatenated after the existing one
};

const char* to_string(Reducer reducer);

// Parses "overwrite" / "append"; throws ConfigurationError otherwise.
Reducer parse_reducer(const std::string& name);

struct FieldSpec {
    std::string name;
    Reducer reducer = Reducer::OVERWRITE;
    Value default_value; // [] for APPEND, null for OVERWRITE unless declared
};

// Declared state fields and their reducers, in add_field() call order.
// A YAML 'state:' mapping reaches add_field() with its keys sorted by name.
class StateSchema {
public:
    StateSchema& add_field(std::string name, Reducer reducer,
                           std::optional<Value> default_value = std::nullopt);

    bool has_field(const std::string& name) const;
    const FieldSpec* find(const std::string& name) const;
    const std::vector<FieldSpec>& fields() const { return fields_; }
    std::size_t size() const { return fields_.size(); }

private:
    std::vector<FieldSpec> fields_;
    std::unordered_map<std::string, std::size_t> index_;
};

class StateEngine {
public:
    explicit StateEngine(StateSchema schema);

    // Defaults for every declared field, overlaid with `initial` (object or null).
    Snapshot initialize(const Value& initial) const;

    // Pure merge: never touches `snapshot`, always returns a new Snapshot.
    // Throws InvalidUpdateError for undeclared fields or ill-shaped values.
    Snapshot apply(const Snapshot& snapshot, const Value& update) const;

    void validate_update(const Value& update) const;

    // Fields whose values differ between two snapshots, with their new values.
    static Value diff(const Snapshot& before, const Snapshot& after);

    const StateSchema& schema() const { return schema_; }

private:
    StateSchema schema_;

    static void merge_array(Value& target, const Value& source);
    static void merge_scalar(Value& target, const Value& source);
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_STATE_STATE_ENGINE_H
