// core/types/error.cpp
#include "core/types/error.h"

namespace researchflow {

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_REQUEST: return "invalid_request";
        case ErrorKind::TRANSIENT: return "transient";
        case ErrorKind::RATE_LIMITED: return "rate_limited";
        case ErrorKind::INVALID_INPUT: return "invalid_input";
        case ErrorKind::UNAVAILABLE: return "unavailable";
        case ErrorKind::INSUFFICIENT_SECTIONS: return "insufficient_sections";
        case ErrorKind::TIMEOUT: return "timeout";
        case ErrorKind::BUDGET_EXCEEDED: return "budget_exceeded";
        case ErrorKind::INTERNAL: return "internal";
    }
    return "internal";
}

std::optional<ErrorKind> parse_error_kind(std::string_view text) {
    if (text == "invalid_request") return ErrorKind::INVALID_REQUEST;
    if (text == "transient") return ErrorKind::TRANSIENT;
    if (text == "rate_limited") return ErrorKind::RATE_LIMITED;
    if (text == "invalid_input") return ErrorKind::INVALID_INPUT;
    if (text == "unavailable") return ErrorKind::UNAVAILABLE;
    if (text == "insufficient_sections") return ErrorKind::INSUFFICIENT_SECTIONS;
    if (text == "timeout") return ErrorKind::TIMEOUT;
    if (text == "budget_exceeded") return ErrorKind::BUDGET_EXCEEDED;
    if (text == "internal") return ErrorKind::INTERNAL;
    return std::nullopt;
}

} // namespace researchflow
