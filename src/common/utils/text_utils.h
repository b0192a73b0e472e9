// common/utils/text_utils.h
#ifndef RESEARCHFLOW_COMMON_UTILS_TEXT_UTILS_H
#define RESEARCHFLOW_COMMON_UTILS_TEXT_UTILS_H

#include <cstddef>
#include <string>

namespace researchflow {

// UTF-8 字符数（续字节不计）
size_t utf8_length(const std::string& text);

// 保留前 max_chars 个字符；切点总落在字符边界上
std::string utf8_truncate(const std::string& text, size_t max_chars);

} // namespace researchflow

#endif // RESEARCHFLOW_COMMON_UTILS_TEXT_UTILS_H
