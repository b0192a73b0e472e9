// common/utils/text_utils.cpp
#include "common/utils/text_utils.h"

namespace researchflow {

namespace {

inline bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

size_t utf8_length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if (!is_continuation(c)) ++count;
    }
    return count;
}

std::string utf8_truncate(const std::string& text, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (is_continuation(static_cast<unsigned char>(text[i]))) continue;
        if (chars == max_chars) {
            return text.substr(0, i);
        }
        ++chars;
    }
    return text;
}

} // namespace researchflow
