// modules/gateway/call_gateway.h
#ifndef RESEARCHFLOW_MODULES_GATEWAY_CALL_GATEWAY_H
#define RESEARCHFLOW_MODULES_GATEWAY_CALL_GATEWAY_H

#include "core/types/context.h"
#include "core/types/error.h"
#include "common/llm/text_generator.h"
#include "common/search/search_client.h"
#include "modules/gateway/retry_policy.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

namespace researchflow {

enum class CallKind : uint8_t {
    GENERATE_TEXT,
    WEB_SEARCH
};

std::string to_string(CallKind kind);

struct GatewayConfig {
    RetryPolicy generate_text;
    RetryPolicy web_search;
    ModelConfig model;
};

struct CallResult {
    bool success = false;
    Value value;                    // generate_text: {"text"}; web_search: {"hits"}
    std::optional<ErrorKind> error;
    std::string message;
    int attempts = 0;               // 实际发起的底层调用次数
};

// 所有外部调用的唯一入口：超时、指数退避重试、错误分类。
// 可被多个章节子流水线并发调用；重试与退避只作用于当前调用。
class CallGateway {
public:
    CallGateway(std::shared_ptr<TextGenerator> text_generator,
                std::shared_ptr<SearchClient> search_client,
                GatewayConfig config);

    // payload:
    //   generate_text: {"prompt": string, 可选 "temperature", "max_tokens"}
    //   web_search:    {"query": string, "max_results": int}
    CallResult invoke(CallKind kind, const Value& payload, std::stop_token stop = {}) const;
    CallResult invoke(CallKind kind, const Value& payload, const RetryPolicy& policy, std::stop_token stop = {}) const;

    const RetryPolicy& policy_for(CallKind kind) const;
    const GatewayConfig& config() const { return config_; }

    // 自创建以来的尝试总数
    int total_attempts() const { return total_attempts_.load(); }

    // 已超时或被取消、但协作者尚未返回的尝试数
    int abandoned_attempts(CallKind kind) const { return abandoned_for(kind)->load(); }

private:
    struct AttemptOutcome {
        bool success = false;
        bool cancelled = false;
        Value value;
        ErrorKind kind = ErrorKind::INTERNAL;
        std::string message;
    };

    std::shared_ptr<TextGenerator> text_generator_;
    std::shared_ptr<SearchClient> search_client_;
    GatewayConfig config_;
    mutable std::atomic<int> total_attempts_{0};
    // 与尝试线程共享；网关析构后仍可能被递减
    std::shared_ptr<std::atomic<int>> abandoned_text_ = std::make_shared<std::atomic<int>>(0);
    std::shared_ptr<std::atomic<int>> abandoned_search_ = std::make_shared<std::atomic<int>>(0);

    const std::shared_ptr<std::atomic<int>>& abandoned_for(CallKind kind) const {
        return kind == CallKind::WEB_SEARCH ? abandoned_search_ : abandoned_text_;
    }

    std::optional<std::string> validate_payload(CallKind kind, const Value& payload) const;
    AttemptOutcome run_attempt(CallKind kind, const Value& payload, const RetryPolicy& policy, std::stop_token stop) const;
};

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_GATEWAY_CALL_GATEWAY_H
