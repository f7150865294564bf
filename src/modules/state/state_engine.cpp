// modules/state/state_engine.cpp
#include "modules/state/state_engine.h"
#include "core/types/errors.h"
#include <utility>

namespace agentgraph {

const char* to_string(Reducer reducer) {
    return reducer == Reducer::APPEND ? "append" : "overwrite";
}

Reducer parse_reducer(const std::string& name) {
    if (name == "overwrite") return Reducer::OVERWRITE;
    if (name == "append") return Reducer::APPEND;
    throw ConfigurationError("Unknown reducer '" + name + "' (expected 'overwrite' or 'append')");
}

// --- StateSchema ---

StateSchema& StateSchema::add_field(std::string name, Reducer reducer, std::optional<Value> default_value) {
    if (name.empty()) {
        throw ConfigurationError("State field name must not be empty");
    }
    if (index_.count(name) > 0) {
        throw ConfigurationError("Duplicate state field: " + name);
    }

    FieldSpec spec;
    spec.name = name;
    spec.reducer = reducer;
    if (default_value.has_value()) {
        spec.default_value = std::move(*default_value);
    } else {
        spec.default_value = reducer == Reducer::APPEND ? Value::array() : Value(nullptr);
    }
    if (reducer == Reducer::APPEND && !spec.default_value.is_array()) {
        throw ConfigurationError("Default value of append field '" + name + "' must be an array");
    }

    index_[name] = fields_.size();
    fields_.push_back(std::move(spec));
    return *this;
}

bool StateSchema::has_field(const std::string& name) const {
    return index_.count(name) > 0;
}

const FieldSpec* StateSchema::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &fields_[it->second];
}

// --- StateEngine ---

StateEngine::StateEngine(StateSchema schema) : schema_(std::move(schema)) {}

Snapshot StateEngine::initialize(const Value& initial) const {
    Value values = Value::object();
    for (const auto& field : schema_.fields()) {
        values[field.name] = field.default_value;
    }

    if (initial.is_null()) {
        return Snapshot(std::move(values));
    }
    if (!initial.is_object()) {
        throw InvalidUpdateError("Initial state must be an object, got: " + initial.dump());
    }

    // 初始状态按字段覆盖，不经过 reducer
    for (auto it = initial.begin(); it != initial.end(); ++it) {
        const FieldSpec* spec = schema_.find(it.key());
        if (!spec) {
            throw InvalidUpdateError("Initial state references undeclared field: " + it.key());
        }
        if (spec->reducer == Reducer::APPEND && !it.value().is_array()) {
            throw InvalidUpdateError("Initial value of append field '" + it.key() + "' must be an array");
        }
        values[it.key()] = it.value();
    }
    return Snapshot(std::move(values));
}

void StateEngine::validate_update(const Value& update) const {
    if (update.is_null()) {
        return;
    }
    if (!update.is_object()) {
        throw InvalidUpdateError("Update must be an object, got: " + update.dump());
    }
    for (auto it = update.begin(); it != update.end(); ++it) {
        const FieldSpec* spec = schema_.find(it.key());
        if (!spec) {
            throw InvalidUpdateError("Update references undeclared field: " + it.key());
        }
        if (spec->reducer == Reducer::APPEND && !it.value().is_array()) {
            throw InvalidUpdateError("Update to append field '" + it.key() + "' must be an array, got: " +
                                     it.value().dump());
        }
    }
}

Snapshot StateEngine::apply(const Snapshot& snapshot, const Value& update) const {
    validate_update(update);
    if (update.is_null() || update.empty()) {
        return snapshot;
    }

    Value values = snapshot.values(); // deep copy; the input snapshot stays untouched
    for (auto it = update.begin(); it != update.end(); ++it) {
        const FieldSpec* spec = schema_.find(it.key());
        Value& target = values[it.key()];
        if (spec->reducer == Reducer::APPEND) {
            merge_array(target, it.value());
        } else {
            merge_scalar(target, it.value());
        }
    }
    return Snapshot(std::move(values));
}

void StateEngine::merge_array(Value& target, const Value& source) {
    if (!target.is_array()) target = Value::array();
    for (const auto& item : source) {
        target.push_back(item);
    }
}

void StateEngine::merge_scalar(Value& target, const Value& source) {
    target = source;
}

Value StateEngine::diff(const Snapshot& before, const Snapshot& after) {
    Value delta = Value::object();
    const Value& initial = before.values();
    const Value& final = after.values();
    for (auto it = final.begin(); it != final.end(); ++it) {
        auto prev = initial.find(it.key());
        if (prev == initial.end() || *prev != it.value()) {
            delta[it.key()] = it.value();
        }
    }
    return delta;
}

} // namespace agentgraph
