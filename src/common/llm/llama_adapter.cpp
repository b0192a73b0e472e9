// common/llm/llama_adapter.cpp
#include "common/llm/llama_adapter.h"
#include "core/types/error.h"
#include <chrono>
#include <stdexcept>
#include <vector>

namespace researchflow {

namespace {

// 解码期间由 ggml 轮询；返回 true 时 llama_decode 中止
bool abort_requested(void* data) {
    return static_cast<const std::stop_token*>(data)->stop_requested();
}

// 离开 generate 时解除回调，避免悬空指针
struct AbortCallbackGuard {
    llama_context* ctx;
    ~AbortCallbackGuard() { llama_set_abort_callback(ctx, nullptr, nullptr); }
};

} // namespace

LlamaAdapter::LlamaAdapter(const Config& config)
    : config_(config),
      model_(nullptr, llama_model_free),
      ctx_(nullptr, llama_free) {

    llama_backend_init();

    llama_model_params model_params = llama_model_default_params();
    model_params.n_gpu_layers = config_.n_gpu_layers;

    llama_model* raw_model = llama_model_load_from_file(config_.model_path.c_str(), model_params);
    if (!raw_model) {
        throw std::runtime_error("Failed to load model: " + config_.model_path);
    }
    model_.reset(raw_model);

    llama_context_params ctx_params = llama_context_default_params();
    ctx_params.n_ctx = config_.n_ctx;
    ctx_params.n_batch = config_.n_ctx;
    ctx_params.n_threads = config_.n_threads;
    ctx_params.n_threads_batch = config_.n_threads;

    llama_context* raw_ctx = llama_init_from_model(model_.get(), ctx_params);
    if (!raw_ctx) {
        throw std::runtime_error("Failed to create llama context");
    }
    ctx_.reset(raw_ctx);
}

LlamaAdapter::~LlamaAdapter() = default;

std::vector<llama_token> LlamaAdapter::tokenize(const std::string& text, bool add_bos) {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    // 返回负数表示需要的 token 数
    int32_t n_tokens = -llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                                       nullptr, 0, add_bos, true);
    if (n_tokens <= 0) return {};

    std::vector<llama_token> tokens(n_tokens);
    if (llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                       tokens.data(), n_tokens, add_bos, true) < 0) {
        return {};
    }
    return tokens;
}

std::string LlamaAdapter::detokenize(llama_token token) {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    char buf[256] = {0};
    int n = llama_token_to_piece(vocab, token, buf, sizeof(buf) - 1, 0, true);
    if (n < 0) return "";
    return std::string(buf, n);
}

std::string LlamaAdapter::generate(const std::string& prompt, const ModelConfig& config, std::stop_token stop) {
    // 被放弃的调用不再排队等待模型
    std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
    while (!lock.try_lock_for(std::chrono::milliseconds(10))) {
        if (stop.stop_requested()) {
            throw ClassifiedError(ErrorKind::TIMEOUT, "Generation cancelled while waiting for the model");
        }
    }
    if (!is_loaded()) {
        throw ClassifiedError(ErrorKind::UNAVAILABLE, "Model not loaded");
    }
    llama_set_abort_callback(ctx_.get(), abort_requested, &stop);
    AbortCallbackGuard abort_guard{ctx_.get()};

    // 每个提示词相互独立
    llama_memory_clear(llama_get_memory(ctx_.get()), true);

    auto tokens = tokenize(prompt, true);
    if (tokens.empty()) {
        throw ClassifiedError(ErrorKind::INVALID_INPUT, "Tokenization failed");
    }
    if (static_cast<int>(tokens.size()) + config.max_tokens > config_.n_ctx) {
        throw ClassifiedError(ErrorKind::INVALID_INPUT,
            "Prompt of " + std::to_string(tokens.size()) + " tokens does not fit context of " +
            std::to_string(config_.n_ctx));
    }

    std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)> sampler(
        llama_sampler_chain_init(llama_sampler_chain_default_params()), llama_sampler_free);
    llama_sampler_chain_add(sampler.get(), llama_sampler_init_min_p(config_.min_p, 1));
    llama_sampler_chain_add(sampler.get(), llama_sampler_init_temp(config.temperature));
    llama_sampler_chain_add(sampler.get(), llama_sampler_init_dist(LLAMA_DEFAULT_SEED));

    llama_batch batch = llama_batch_get_one(tokens.data(), static_cast<int32_t>(tokens.size()));
    if (llama_decode(ctx_.get(), batch)) {
        if (stop.stop_requested()) {
            throw ClassifiedError(ErrorKind::TIMEOUT, "Generation cancelled during prompt evaluation");
        }
        throw ClassifiedError(ErrorKind::TRANSIENT, "Prompt evaluation failed");
    }

    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    std::string response;
    for (int i = 0; i < config.max_tokens; ++i) {
        if (stop.stop_requested()) {
            throw ClassifiedError(ErrorKind::TIMEOUT, "Generation cancelled after " + std::to_string(i) + " tokens");
        }
        llama_token new_token = llama_sampler_sample(sampler.get(), ctx_.get(), -1);
        if (llama_vocab_is_eog(vocab, new_token)) {
            break;
        }
        response += detokenize(new_token);

        batch = llama_batch_get_one(&new_token, 1);
        if (llama_decode(ctx_.get(), batch)) {
            if (stop.stop_requested()) {
                throw ClassifiedError(ErrorKind::TIMEOUT, "Generation cancelled after " + std::to_string(i) + " tokens");
            }
            throw ClassifiedError(ErrorKind::TRANSIENT, "Token decode failed after " + std::to_string(i) + " tokens");
        }
    }
    return response;
}

bool LlamaAdapter::is_loaded() const {
    return model_ != nullptr && ctx_ != nullptr;
}

} // namespace researchflow
