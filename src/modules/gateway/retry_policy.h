// modules/gateway/retry_policy.h
#ifndef RESEARCHFLOW_MODULES_GATEWAY_RETRY_POLICY_H
#define RESEARCHFLOW_MODULES_GATEWAY_RETRY_POLICY_H

#include "core/types/error.h"
#include <algorithm>
#include <chrono>
#include <cmath>

namespace researchflow {

struct RetryPolicy {
    int max_attempts = 3;
    int attempt_timeout_ms = 45000;
    int initial_backoff_ms = 500;
    double backoff_multiplier = 2.0;
    int max_backoff_ms = 30000;
    double rate_limit_backoff_factor = 4.0; // RATE_LIMITED 使用更长的退避
    int unavailable_max_attempts = 2;       // UNAVAILABLE 只做短暂重试
    int max_abandoned_attempts = 4;         // 已放弃但仍在运行的尝试上限，达到后新尝试记为 UNAVAILABLE；0 不限

    int attempt_ceiling(ErrorKind kind) const {
        if (kind == ErrorKind::UNAVAILABLE) {
            return std::min(max_attempts, unavailable_max_attempts);
        }
        return max_attempts;
    }

    // attempt 从 1 开始：第 attempt 次失败后的等待时间
    std::chrono::milliseconds backoff_for(int attempt, ErrorKind kind) const {
        double delay = initial_backoff_ms * std::pow(backoff_multiplier, std::max(0, attempt - 1));
        if (kind == ErrorKind::RATE_LIMITED) {
            delay *= rate_limit_backoff_factor;
        }
        delay = std::min(delay, static_cast<double>(max_backoff_ms));
        return std::chrono::milliseconds(static_cast<long long>(delay));
    }
};

inline bool is_retryable(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TRANSIENT:
        case ErrorKind::TIMEOUT:
        case ErrorKind::RATE_LIMITED:
        case ErrorKind::UNAVAILABLE:
            return true;
        default:
            return false;
    }
}

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_GATEWAY_RETRY_POLICY_H
