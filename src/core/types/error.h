#ifndef RESEARCHFLOW_TYPES_ERROR_H
#define RESEARCHFLOW_TYPES_ERROR_H

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace researchflow {

// 错误分类
enum class ErrorKind : uint8_t {
    INVALID_REQUEST,
    TRANSIENT,
    RATE_LIMITED,
    INVALID_INPUT,
    UNAVAILABLE,
    INSUFFICIENT_SECTIONS,
    TIMEOUT,
    BUDGET_EXCEEDED,
    INTERNAL
};

std::string to_string(ErrorKind kind);
std::optional<ErrorKind> parse_error_kind(std::string_view text);

// Collaborators throw this so the gateway can decide whether to retry.
class ClassifiedError : public std::runtime_error {
public:
    ClassifiedError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace researchflow

#endif // RESEARCHFLOW_TYPES_ERROR_H
