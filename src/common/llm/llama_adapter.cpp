// common/llm/llama_adapter.cpp
#include "common/llm/llama_adapter.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <nlohmann/json.hpp>

namespace agentgraph {

LlamaAdapter::Config load_llm_config(const std::string& config_path) {
    namespace fs = std::filesystem;

    LlamaAdapter::Config config;
    config.model_path = "models/qwen-0.6b.gguf"; // default
    unsigned hw = std::thread::hardware_concurrency();
    config.n_threads = hw > 0 ? static_cast<int>(hw) : 4;

    std::ifstream file(config_path);
    if (!file.is_open()) {
        return config;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[WARNING] Ignoring unreadable LLM config '" << config_path << "': " << e.what() << std::endl;
        return config;
    }

    if (j.contains("model_path") && j["model_path"].is_string()) {
        fs::path config_dir = fs::path(config_path).parent_path();
        if (config_dir.empty()) config_dir = ".";
        config.model_path = fs::absolute(config_dir / j["model_path"].get<std::string>()).string();
    }
    if (j.contains("n_ctx") && j["n_ctx"].is_number_integer()) {
        config.n_ctx = j["n_ctx"].get<int>();
    }
    if (j.contains("n_threads") && j["n_threads"].is_number_integer()) {
        int threads = j["n_threads"].get<int>();
        if (threads > 0) config.n_threads = threads;
    }
    if (j.contains("temperature") && j["temperature"].is_number()) {
        config.temperature = j["temperature"].get<float>();
    }
    if (j.contains("min_p") && j["min_p"].is_number()) {
        config.min_p = j["min_p"].get<float>();
    }
    if (j.contains("n_predict") && j["n_predict"].is_number_integer()) {
        config.n_predict = j["n_predict"].get<int>();
    }
    return config;
}

LlamaAdapter::LlamaAdapter(const Config& config)
    : config_(config),
      model_(nullptr, llama_model_free),
      ctx_(nullptr, llama_free),
      sampler_(nullptr, llama_sampler_free) {

    llama_model_params model_params = llama_model_default_params();
    model_params.n_gpu_layers = 99; // Use all GPU layers if available

    llama_model* raw_model = llama_model_load_from_file(config_.model_path.c_str(), model_params);
    if (!raw_model) {
        throw std::runtime_error("Failed to load model: " + config_.model_path);
    }
    model_.reset(raw_model);

    llama_context_params ctx_params = llama_context_default_params();
    ctx_params.n_ctx = config_.n_ctx;
    ctx_params.n_threads = config_.n_threads;
    ctx_params.n_threads_batch = config_.n_threads;

    llama_context* raw_ctx = llama_init_from_model(model_.get(), ctx_params);
    if (!raw_ctx) {
        throw std::runtime_error("Failed to create context for model: " + config_.model_path);
    }
    ctx_.reset(raw_ctx);

    auto smpl_params = llama_sampler_chain_default_params();
    llama_sampler* raw_sampler = llama_sampler_chain_init(smpl_params);
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_min_p(config_.min_p, 1));
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_temp(config_.temperature));
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_dist(LLAMA_DEFAULT_SEED));
    sampler_.reset(raw_sampler);
}

LlamaAdapter::~LlamaAdapter() = default;

std::vector<llama_token> LlamaAdapter::tokenize(const std::string& text, bool add_bos) {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    // First call reports the required size as a negative count
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

std::string LlamaAdapter::generate(const std::string& prompt) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_loaded()) {
        throw std::runtime_error("Model not loaded");
    }

    // Decisions are independent: drop whatever the previous call left in the cache
    llama_memory_clear(llama_get_memory(ctx_.get()), true);
    SamplerResetGuard reset_sampler(sampler_.get());

    auto tokens = tokenize(prompt, true);
    if (tokens.empty()) {
        throw std::runtime_error("Tokenization failed");
    }

    llama_batch batch = llama_batch_get_one(tokens.data(), static_cast<int32_t>(tokens.size()));
    if (llama_decode(ctx_.get(), batch)) {
        throw std::runtime_error("Prompt evaluation failed");
    }

    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    std::string response;
    for (int i = 0; i < config_.n_predict; ++i) {
        llama_token new_token = llama_sampler_sample(sampler_.get(), ctx_.get(), -1);
        if (llama_vocab_is_eog(vocab, new_token)) {
            break;
        }
        response += detokenize(new_token);

        batch = llama_batch_get_one(&new_token, 1);
        if (llama_decode(ctx_.get(), batch)) {
            throw std::runtime_error("Token decode failed after " + std::to_string(i + 1) + " tokens");
        }
    }
    return response;
}

bool LlamaAdapter::is_loaded() const {
    return model_ != nullptr && ctx_ != nullptr && sampler_ != nullptr;
}

} // namespace agentgraph
