#ifndef RESEARCHFLOW_COMMON_LLM_LLAMA_ADAPTER_H
#define RESEARCHFLOW_COMMON_LLM_LLAMA_ADAPTER_H

#include "common/llm/text_generator.h"
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <vector>
#include <llama.h>

namespace researchflow {

class LlamaAdapter : public TextGenerator {
public:
    struct Config {
        std::string model_path;
        int n_ctx = 4096;
        int n_threads = 4;
        int n_gpu_layers = 99;
        float min_p = 0.05f;
    };

    explicit LlamaAdapter(const Config& config);
    ~LlamaAdapter() override;

    std::string generate(const std::string& prompt, const ModelConfig& config, std::stop_token stop) override;
    bool is_loaded() const;

private:
    Config config_;
    std::unique_ptr<llama_model, decltype(&llama_model_free)> model_;
    std::unique_ptr<llama_context, decltype(&llama_free)> ctx_;
    std::timed_mutex mutex_; // 单个上下文，调用串行化

    std::vector<llama_token> tokenize(const std::string& text, bool add_bos);
    std::string detokenize(llama_token token);
};

} // namespace researchflow

#endif // RESEARCHFLOW_COMMON_LLM_LLAMA_ADAPTER_H
