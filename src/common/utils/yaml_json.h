// common/utils/yaml_json.h
#ifndef RESEARCHFLOW_COMMON_UTILS_YAML_JSON_H
#define RESEARCHFLOW_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <string>

namespace researchflow {

// YAML 节点 -> JSON；带引号的标量保持字符串
nlohmann::json yaml_to_json(const YAML::Node& node);

// 解析一段 YAML 文本；语法错误抛 std::runtime_error，消息包含 where 与行列号
nlohmann::json parse_yaml_text(const std::string& text, const std::string& where);

} // namespace researchflow

#endif // RESEARCHFLOW_COMMON_UTILS_YAML_JSON_H
