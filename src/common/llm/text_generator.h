#ifndef RESEARCHFLOW_COMMON_LLM_TEXT_GENERATOR_H
#define RESEARCHFLOW_COMMON_LLM_TEXT_GENERATOR_H

#include <stop_token>
#include <string>

namespace researchflow {

struct ModelConfig {
    std::string model;          // 模型标识，仅用于日志与追踪
    float temperature = 0.7f;
    int max_tokens = 512;
};

// 文本生成协作者。失败时抛出 ClassifiedError。
// stop 在网关放弃本次尝试（超时或取消）时触发，实现应尽快返回。
class TextGenerator {
public:
    virtual ~TextGenerator() = default;
    virtual std::string generate(const std::string& prompt, const ModelConfig& config, std::stop_token stop) = 0;
};

} // namespace researchflow

#endif // RESEARCHFLOW_COMMON_LLM_TEXT_GENERATOR_H
