#ifndef RESEARCHFLOW_COMMON_LLM_OLLAMA_CLIENT_H
#define RESEARCHFLOW_COMMON_LLM_OLLAMA_CLIENT_H

#include "common/llm/text_generator.h"
#include <string>

namespace researchflow {

// 通过 Ollama HTTP 接口（/api/generate）生成文本
class OllamaClient : public TextGenerator {
public:
    struct Config {
        std::string host = "localhost";
        int port = 11434;
        int timeout_sec = 600;
    };

    explicit OllamaClient(Config config);

    std::string generate(const std::string& prompt, const ModelConfig& config, std::stop_token stop) override;

private:
    Config config_;
};

} // namespace researchflow

#endif // RESEARCHFLOW_COMMON_LLM_OLLAMA_CLIENT_H
