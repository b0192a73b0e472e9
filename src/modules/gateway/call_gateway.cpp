// modules/gateway/call_gateway.cpp
#include "modules/gateway/call_gateway.h"
#include "common/utils/logging.h"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <thread>

namespace researchflow {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(10);

// 返回 false 表示等待期间收到取消请求
bool interruptible_sleep(std::chrono::milliseconds delay, std::stop_token stop) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(m);
    return !cv.wait_for(lock, stop, delay, [&stop] { return stop.stop_requested(); });
}

// 一次尝试的生命周期：网关放弃等待后仍在运行的尝试计入 abandoned
class AttemptSlot {
public:
    explicit AttemptSlot(std::shared_ptr<std::atomic<int>> abandoned) : abandoned_(std::move(abandoned)) {}

    void abandon() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!finished_ && !counted_) {
            counted_ = true;
            abandoned_->fetch_add(1);
        }
    }

    void finish() {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
        if (counted_) {
            counted_ = false;
            abandoned_->fetch_sub(1);
        }
    }

    struct FinishGuard {
        std::shared_ptr<AttemptSlot> slot;
        ~FinishGuard() { slot->finish(); }
    };

private:
    std::shared_ptr<std::atomic<int>> abandoned_;
    std::mutex mutex_;
    bool finished_ = false;
    bool counted_ = false;
};

} // namespace

std::string to_string(CallKind kind) {
    switch (kind) {
        case CallKind::GENERATE_TEXT: return "generate_text";
        case CallKind::WEB_SEARCH: return "web_search";
    }
    return "generate_text";
}

CallGateway::CallGateway(std::shared_ptr<TextGenerator> text_generator,
                         std::shared_ptr<SearchClient> search_client,
                         GatewayConfig config)
    : text_generator_(std::move(text_generator)),
      search_client_(std::move(search_client)),
      config_(std::move(config)) {}

const RetryPolicy& CallGateway::policy_for(CallKind kind) const {
    return kind == CallKind::WEB_SEARCH ? config_.web_search : config_.generate_text;
}

CallResult CallGateway::invoke(CallKind kind, const Value& payload, std::stop_token stop) const {
    return invoke(kind, payload, policy_for(kind), std::move(stop));
}

std::optional<std::string> CallGateway::validate_payload(CallKind kind, const Value& payload) const {
    if (!payload.is_object()) {
        return "payload must be an object";
    }
    if (kind == CallKind::GENERATE_TEXT) {
        if (!text_generator_) return "no text generator configured";
        if (!payload.contains("prompt") || !payload["prompt"].is_string() ||
            payload["prompt"].get<std::string>().empty()) {
            return "generate_text requires a non-empty 'prompt'";
        }
    } else {
        if (!search_client_) return "no search client configured";
        if (!payload.contains("query") || !payload["query"].is_string() ||
            payload["query"].get<std::string>().empty()) {
            return "web_search requires a non-empty 'query'";
        }
        if (!payload.contains("max_results") || !payload["max_results"].is_number_integer() ||
            payload["max_results"].get<int>() <= 0) {
            return "web_search requires a positive 'max_results'";
        }
    }
    return std::nullopt;
}

CallGateway::AttemptOutcome CallGateway::run_attempt(CallKind kind, const Value& payload,
                                                     const RetryPolicy& policy, std::stop_token stop) const {
    AttemptOutcome outcome;
    const auto& abandoned = abandoned_for(kind);
    if (policy.max_abandoned_attempts > 0 && abandoned->load() >= policy.max_abandoned_attempts) {
        outcome.kind = ErrorKind::UNAVAILABLE;
        outcome.message = std::to_string(abandoned->load()) + " abandoned " + to_string(kind) +
                          " attempt(s) still running";
        return outcome;
    }

    std::function<Value(std::stop_token)> call;
    if (kind == CallKind::GENERATE_TEXT) {
        ModelConfig model = config_.model;
        if (payload.contains("temperature") && payload["temperature"].is_number()) {
            model.temperature = payload["temperature"].get<float>();
        }
        if (payload.contains("max_tokens") && payload["max_tokens"].is_number_integer()) {
            model.max_tokens = payload["max_tokens"].get<int>();
        }
        call = [generator = text_generator_, prompt = payload["prompt"].get<std::string>(), model](std::stop_token token) {
            return Value{{"text", generator->generate(prompt, model, token)}};
        };
    } else {
        call = [client = search_client_, query = payload["query"].get<std::string>(),
                max_results = payload["max_results"].get<int>()](std::stop_token token) {
            return Value{{"hits", client->search(query, max_results, token)}};
        };
    }

    // 任务只持有协作者与计数器的 shared_ptr；被放弃的任务可以比网关活得更久
    auto slot = std::make_shared<AttemptSlot>(abandoned);
    std::stop_source attempt_stop;
    std::packaged_task<Value()> task([call = std::move(call), slot, token = attempt_stop.get_token()] {
        AttemptSlot::FinishGuard guard{slot};
        return call(token);
    });

    auto future = task.get_future();
    std::thread(std::move(task)).detach();

    auto give_up = [&](bool cancelled, std::string message) {
        attempt_stop.request_stop();
        slot->abandon();
        outcome.cancelled = cancelled;
        outcome.kind = ErrorKind::TIMEOUT;
        outcome.message = std::move(message);
        return outcome;
    };

    const auto timeout = std::chrono::milliseconds(policy.attempt_timeout_ms);
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (stop.stop_requested()) {
            return give_up(true, "call cancelled");
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return give_up(false, "attempt timed out after " + std::to_string(policy.attempt_timeout_ms) + " ms");
        }
        auto slice = std::min<std::chrono::steady_clock::duration>(kPollInterval, deadline - now);
        if (future.wait_for(slice) == std::future_status::ready) break;
    }

    try {
        outcome.value = future.get();
        outcome.success = true;
    } catch (const ClassifiedError& e) {
        outcome.kind = e.kind();
        outcome.message = e.what();
    } catch (const std::exception& e) {
        // 未分类的协作者异常按瞬时错误处理
        outcome.kind = ErrorKind::TRANSIENT;
        outcome.message = e.what();
    }
    return outcome;
}

CallResult CallGateway::invoke(CallKind kind, const Value& payload, const RetryPolicy& policy,
                               std::stop_token stop) const {
    CallResult result;
    if (auto problem = validate_payload(kind, payload)) {
        result.error = ErrorKind::INVALID_INPUT;
        result.message = *problem;
        return result;
    }

    while (true) {
        ++result.attempts;
        total_attempts_.fetch_add(1);

        AttemptOutcome outcome = run_attempt(kind, payload, policy, stop);
        if (outcome.success) {
            result.success = true;
            result.value = std::move(outcome.value);
            result.error.reset();
            result.message.clear();
            return result;
        }

        result.error = outcome.kind;
        result.message = outcome.message;
        if (outcome.cancelled || !is_retryable(outcome.kind) ||
            result.attempts >= policy.attempt_ceiling(outcome.kind)) {
            break;
        }

        auto delay = policy.backoff_for(result.attempts, outcome.kind);
        log_warning("gateway", to_string(kind) + " attempt " + std::to_string(result.attempts) +
                    " failed (" + to_string(outcome.kind) + ": " + outcome.message +
                    "), retrying in " + std::to_string(delay.count()) + " ms");
        if (!interruptible_sleep(delay, stop)) {
            result.error = ErrorKind::TIMEOUT;
            result.message = "call cancelled during backoff";
            break;
        }
    }

    log_warning("gateway", to_string(kind) + " failed after " + std::to_string(result.attempts) +
                " attempt(s): " + to_string(*result.error) + ": " + result.message);
    return result;
}

} // namespace researchflow
