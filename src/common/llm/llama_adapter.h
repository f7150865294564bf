#ifndef AGENTGRAPH_COMMON_LLM_LLAMA_ADAPTER_H
#define AGENTGRAPH_COMMON_LLM_LLAMA_ADAPTER_H

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <llama.h>

namespace agentgraph {

// Text completion source for model-backed routers.
class TextGenerator {
public:
    virtual ~TextGenerator() = default;
    virtual std::string generate(const std::string& prompt) = 0;
};

// Resets a sampler chain when the scope ends, including on a throw.
class SamplerResetGuard {
public:
    explicit SamplerResetGuard(llama_sampler* sampler) : sampler_(sampler) {}
    ~SamplerResetGuard() { llama_sampler_reset(sampler_); }

    SamplerResetGuard(const SamplerResetGuard&) = delete;
    SamplerResetGuard& operator=(const SamplerResetGuard&) = delete;

private:
    llama_sampler* sampler_;
};

class LlamaAdapter : public TextGenerator {
public:
    struct Config {
        std::string model_path;
        int n_ctx = 2048;
        int n_threads = 4;
        float temperature = 0.7f;
        float min_p = 0.05f;
        int n_predict = 512;
    };

    // Throws std::runtime_error when the model or context cannot be created.
    explicit LlamaAdapter(const Config& config);
    ~LlamaAdapter() override;

    // Each call starts from an empty KV cache. Serialized: one generation at a time.
    std::string generate(const std::string& prompt) override;
    bool is_loaded() const;

private:
    Config config_;
    std::unique_ptr<llama_model, decltype(&llama_model_free)> model_;
    std::unique_ptr<llama_context, decltype(&llama_free)> ctx_;
    std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)> sampler_;
    std::mutex mutex_;

    std::vector<llama_token> tokenize(const std::string& text, bool add_bos);
    std::string detokenize(llama_token token);
};

// Reads llm_config.json; missing file or keys keep the defaults.
// model_path is resolved relative to the config file's directory.
LlamaAdapter::Config load_llm_config(const std::string& config_path = "llm_config.json");

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_LLM_LLAMA_ADAPTER_H
