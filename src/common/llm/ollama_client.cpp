// common/llm/ollama_client.cpp
#include "common/llm/ollama_client.h"
#include "core/types/error.h"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <stop_token>

namespace researchflow {

OllamaClient::OllamaClient(Config config) : config_(std::move(config)) {}

std::string OllamaClient::generate(const std::string& prompt, const ModelConfig& config, std::stop_token stop) {
    httplib::Client cli(config_.host, config_.port);
    cli.set_read_timeout(config_.timeout_sec, 0);
    // 放弃的尝试关闭连接，Ollama 随之停止生成
    std::stop_callback abort_request(stop, [&cli] { cli.stop(); });
    if (stop.stop_requested()) {
        throw ClassifiedError(ErrorKind::TIMEOUT, "Ollama request cancelled");
    }

    nlohmann::json request = {
        {"model", config.model},
        {"prompt", prompt},
        {"stream", false},
        {"options", {
            {"temperature", config.temperature},
            {"num_predict", config.max_tokens}
        }}
    };

    auto res = cli.Post("/api/generate", request.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
    if (!res) {
        if (stop.stop_requested()) {
            throw ClassifiedError(ErrorKind::TIMEOUT, "Ollama request cancelled");
        }
        throw ClassifiedError(ErrorKind::UNAVAILABLE,
            "Ollama connection failed: " + httplib::to_string(res.error()));
    }
    if (res->status == 429) {
        throw ClassifiedError(ErrorKind::RATE_LIMITED, "Ollama rate limited");
    }
    if (res->status == 503) {
        throw ClassifiedError(ErrorKind::UNAVAILABLE, "Ollama unavailable");
    }
    if (res->status >= 500) {
        throw ClassifiedError(ErrorKind::TRANSIENT, "Ollama HTTP error " + std::to_string(res->status) + ": " + res->body);
    }
    if (res->status != 200) {
        throw ClassifiedError(ErrorKind::INVALID_INPUT, "Ollama rejected request (HTTP " + std::to_string(res->status) + "): " + res->body);
    }

    try {
        auto body = nlohmann::json::parse(res->body);
        return body.at("response").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw ClassifiedError(ErrorKind::TRANSIENT, std::string("Malformed Ollama response: ") + e.what());
    }
}

} // namespace researchflow
