// common/utils/yaml_json.cpp
#include "common/utils/yaml_json.h"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace researchflow {

namespace {

bool is_integer_literal(const std::string& s) {
    size_t i = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (i >= s.size()) return false;
    for (; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// YAML 1.1 风格的布尔写法，配置文件里常见
bool bool_literal(const std::string& s, bool& out) {
    if (s == "true" || s == "True" || s == "TRUE" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "false" || s == "False" || s == "FALSE" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

nlohmann::json scalar_to_json(const YAML::Node& node) {
    const std::string& s = node.Scalar();
    if (node.Tag() == "!") return s;
    if (s.empty() || s == "~" || s == "null" || s == "Null") return nullptr;

    bool b = false;
    if (bool_literal(s, b)) return b;

    const char* begin = s.c_str();
    char* end = nullptr;
    errno = 0;
    if (is_integer_literal(s)) {
        long long v = std::strtoll(begin, &end, 10);
        if (errno == 0 && *end == '\0') return v;
        return s; // 溢出
    }
    if (std::isdigit(static_cast<unsigned char>(s[0])) || s[0] == '-' || s[0] == '+' || s[0] == '.') {
        double d = std::strtod(begin, &end);
        if (errno == 0 && end != begin && *end == '\0') return d;
    }
    return s;
}

} // namespace

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return scalar_to_json(node);
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) arr.push_back(yaml_to_json(item));
            return arr;
        }
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            break;
    }
    return nullptr;
}

nlohmann::json parse_yaml_text(const std::string& text, const std::string& where) {
    try {
        return yaml_to_json(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        std::string msg = "YAML error in " + where;
        if (!e.mark.is_null()) {
            msg += " at line " + std::to_string(e.mark.line + 1) +
                   ", column " + std::to_string(e.mark.column + 1);
        }
        throw std::runtime_error(msg + ": " + e.msg);
    }
}

} // namespace researchflow
