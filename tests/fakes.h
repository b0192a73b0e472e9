// tests/fakes.h
#ifndef RESEARCHFLOW_TESTS_FAKES_H
#define RESEARCHFLOW_TESTS_FAKES_H

#include "common/llm/text_generator.h"
#include "common/search/search_client.h"
#include "core/types/error.h"
#include "modules/gateway/call_gateway.h"
#include <atomic>
#include <chrono>
#include <cctype>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace researchflow::testing {

// prompt 中 "<label>" 之后到行尾的文本
inline std::string line_after(const std::string& prompt, const std::string& label) {
    auto pos = prompt.find(label);
    if (pos == std::string::npos) return "";
    pos += label.size();
    auto end = prompt.find('\n', pos);
    return prompt.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
}

inline const std::vector<std::string>& section_titles() {
    static const std::vector<std::string> titles = {
        "Section One", "Section Two", "Section Three", "Section Four", "Section Five",
        "Section Six", "Section Seven", "Section Eight", "Section Nine", "Section Ten"
    };
    return titles;
}

// 按提示词内容回答内置阶段图的每一种 generate_text 步骤
inline std::string research_response(const std::string& prompt) {
    if (prompt.find("Analyze this research topic") != std::string::npos) {
        return "The topic spans history, current practice and open problems.";
    }
    if (prompt.find("Create a detailed research plan") != std::string::npos) {
        std::string json = R"({"methodology": "Literature and web review", "sections": [)";
        const auto& titles = section_titles();
        for (size_t i = 0; i < titles.size(); ++i) {
            if (i > 0) json += ", ";
            json += R"({"title": ")" + titles[i] + R"(", "questions": ["What matters in )" + titles[i] + R"(?"]})";
        }
        return "Here is the plan:\n" + json + "]}";
    }
    if (prompt.find("search queries") != std::string::npos) {
        auto title = line_after(prompt, "Section: ");
        return "1. " + title + " overview\n2. " + title + " details\n3. " + title + " trends";
    }
    if (prompt.find("well-researched section") != std::string::npos) {
        return "Content for " + line_after(prompt, "Section Title: ") + ".";
    }
    if (prompt.find("no results") != std::string::npos) {
        return "Overview for " + line_after(prompt, "Section Title: ") + " without sources.";
    }
    if (prompt.find("executive summary") != std::string::npos) {
        return "Executive summary of the findings.";
    }
    if (prompt.find("conclusion") != std::string::npos) {
        return "Conclusion drawn from all sections.";
    }
    return "generic response";
}

// 当前尝试的取消信号；fake 协作者在调用 handler 前设置（每次尝试各有一个线程）
inline std::stop_token& current_stop() {
    thread_local std::stop_token token;
    return token;
}

// 模拟耗时的外部调用；与真实协作者一样，收到取消后立即以 TIMEOUT 返回
inline void pause_for(int ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (current_stop().stop_requested()) {
            throw ClassifiedError(ErrorKind::TIMEOUT, "cancelled");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

class FakeTextGenerator : public TextGenerator {
public:
    using Handler = std::function<std::string(const std::string& prompt, int call_index)>;

    FakeTextGenerator()
        : handler_([](const std::string& prompt, int) { return research_response(prompt); }) {}
    explicit FakeTextGenerator(Handler handler) : handler_(std::move(handler)) {}

    std::string generate(const std::string& prompt, const ModelConfig& config, std::stop_token stop) override {
        current_stop() = stop;
        int index = calls_.fetch_add(1);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            prompts_.push_back(prompt);
            configs_.push_back(config);
        }
        return handler_(prompt, index);
    }

    int calls() const { return calls_.load(); }

    std::vector<std::string> prompts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return prompts_;
    }

    std::vector<ModelConfig> configs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return configs_;
    }

    int calls_matching(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        int n = 0;
        for (const auto& p : prompts_) {
            if (p.find(needle) != std::string::npos) ++n;
        }
        return n;
    }

private:
    Handler handler_;
    std::atomic<int> calls_{0};
    mutable std::mutex mutex_;
    std::vector<std::string> prompts_;
    std::vector<ModelConfig> configs_;
};

inline std::string slug(const std::string& text) {
    std::string out;
    for (char c : text) {
        out += (c == ' ') ? '-' : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

inline std::vector<SearchHit> default_hits(const std::string& query, int max_results) {
    std::vector<SearchHit> hits;
    for (int i = 1; i <= max_results; ++i) {
        hits.push_back(SearchHit{query + " result " + std::to_string(i),
                                 "https://example.com/" + slug(query) + "/" + std::to_string(i),
                                 "Snippet about " + query});
    }
    return hits;
}

class FakeSearchClient : public SearchClient {
public:
    using Handler = std::function<std::vector<SearchHit>(const std::string& query, int max_results, int call_index)>;

    FakeSearchClient()
        : handler_([](const std::string& q, int n, int) { return default_hits(q, n); }) {}
    explicit FakeSearchClient(Handler handler) : handler_(std::move(handler)) {}

    std::vector<SearchHit> search(const std::string& query, int max_results, std::stop_token stop) override {
        current_stop() = stop;
        int index = calls_.fetch_add(1);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queries_.push_back(query);
        }
        return handler_(query, max_results, index);
    }

    int calls() const { return calls_.load(); }

    std::vector<std::string> queries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queries_;
    }

private:
    Handler handler_;
    std::atomic<int> calls_{0};
    mutable std::mutex mutex_;
    std::vector<std::string> queries_;
};

// 短超时、几乎无退避，测试不必等待
inline RetryPolicy fast_policy(int attempt_timeout_ms = 2000) {
    RetryPolicy policy;
    policy.max_attempts = 3;
    policy.attempt_timeout_ms = attempt_timeout_ms;
    policy.initial_backoff_ms = 1;
    policy.backoff_multiplier = 2.0;
    policy.max_backoff_ms = 10;
    policy.rate_limit_backoff_factor = 4.0;
    policy.unavailable_max_attempts = 2;
    return policy;
}

inline GatewayConfig fast_gateway_config(int attempt_timeout_ms = 2000) {
    GatewayConfig config;
    config.generate_text = fast_policy(attempt_timeout_ms);
    config.web_search = fast_policy(attempt_timeout_ms);
    config.model.model = "fake";
    return config;
}

} // namespace researchflow::testing

#endif // RESEARCHFLOW_TESTS_FAKES_H
