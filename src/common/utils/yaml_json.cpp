// common/utils/yaml_json.cpp
#include "common/utils/yaml_json.h"
#include "core/types/errors.h"
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace agentgraph {

namespace {

bool is_integer(const std::string& s) {
    if (s.empty()) return false;
    size_t start = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (start >= s.size()) return false;
    for (size_t i = start; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

bool is_numeric(const std::string& s) {
    if (s.empty()) return false;
    std::istringstream iss(s);
    double d;
    iss >> d;
    return !iss.fail() && iss.eof();
}

nlohmann::json plain_scalar_to_json(const std::string& s) {
    if (s == "true" || s == "True" || s == "TRUE") return true;
    if (s == "false" || s == "False" || s == "FALSE") return false;
    if (s == "~" || s == "null" || s == "Null" || s == "NULL" || s.empty()) return nullptr;

    if (is_numeric(s)) {
        try {
            if (is_integer(s)) {
                return std::stoll(s);
            }
            return std::stod(s);
        } catch (const std::out_of_range&) {
            // 超出范围时按字符串处理
        }
    }
    return s;
}

} // namespace

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
        case YAML::NodeType::Scalar:
            // yaml-cpp tags quoted scalars with "!"
            if (node.Tag() == "!") {
                return node.Scalar();
            }
            return plain_scalar_to_json(node.Scalar());
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
    }
    return nullptr;
}

nlohmann::json parse_yaml(const std::string& content) {
    try {
        return yaml_to_json(YAML::Load(content));
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("YAML parse error: ") + e.what());
    }
}

} // namespace agentgraph
