/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hatch/runner.hpp"
#include "hatch/logger.hpp"
#include "hatch/util.hpp"
#include "llama.h"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <regex>
#include <stdexcept>
#include <vector>

namespace hatch {

namespace {
float envFloat(const char* name, float defv) {
    if (const char* v = std::getenv(name)) return static_cast<float>(std::atof(v));
    return defv;
}

// Strip <think>...</think> blocks from reasoning models
std::string stripThinkBlocks(const std::string& text) {
    static const std::regex thinkRegex("<think>[\\s\\S]*?</think>\\s*");
    std::string result = std::regex_replace(text, thinkRegex, "");
    size_t start = result.find_first_not_of(" \t\n\r");
    return (start == std::string::npos) ? "" : result.substr(start);
}

void filteredLlamaLog(enum ggml_log_level level, const char* text, void* /*user_data*/) {
    if (!text || text[0] == '.' || text[0] == '\n' || text[0] == '\0') {
        return;
    }

    static int filter_level = -1;
    if (filter_level == -1) {
        const char* env = std::getenv("LLAMA_LOG_LEVEL");
        filter_level = env ?
            (std::string(env) == "info" ? GGML_LOG_LEVEL_INFO :
             std::string(env) == "warn" ? GGML_LOG_LEVEL_WARN :
             std::string(env) == "debug" ? GGML_LOG_LEVEL_DEBUG :
             GGML_LOG_LEVEL_ERROR) : GGML_LOG_LEVEL_ERROR;
    }

    if (level >= filter_level) {
        fprintf(stderr, "%s", text);
    }
}
}

Runner::Runner(const std::string& modelPath) : modelPath_(modelPath) {
    llama_log_set(filteredLlamaLog, nullptr);
    ggml_backend_load_all();

    LOG_INFO("Loading model: " + modelPath);
    llama_model_params model_params = llama_model_default_params();
#if defined(__APPLE__)
    model_params.n_gpu_layers = envInt("HATCH_GPU_LAYERS", 99);
#else
    model_params.n_gpu_layers = envInt("HATCH_GPU_LAYERS", 0);
#endif

    llama_model* model = llama_model_load_from_file(modelPath.c_str(), model_params);
    if (!model) {
        LOG_ERROR("Failed to load model: " + modelPath);
        throw std::runtime_error("Failed to load model: " + modelPath);
    }
    model_ = std::shared_ptr<llama_model>(model, llama_model_free);
    LOG_INFO("Model loaded successfully");
}

Runner::~Runner() = default;

Runner::SamplingConfig Runner::buildSamplingConfig() const {
    SamplingConfig config;
    const int n_ctx_train = llama_model_n_ctx_train(model_.get());

    config.temp = envFloat("HATCH_TEMP", 0.8f);
    config.top_k = envInt("HATCH_TOP_K", 40);
    config.top_p = envFloat("HATCH_TOP_P", 0.9f);
    config.min_p = envFloat("HATCH_MIN_P", 0.05f);
    config.repeat_penalty = envFloat("HATCH_REPEAT_PENALTY", 1.1f);
    config.repeat_last_n = envInt("HATCH_REPEAT_LAST_N", 64);
    config.seed = static_cast<uint32_t>(envInt("HATCH_SEED", 0));

    config.max_ctx = std::min(n_ctx_train, envInt("HATCH_MAX_CTX", 8192));
    config.n_predict = envInt("HATCH_PREDICT", 2048);

    LOG_DEBUG("Model context: " + std::to_string(n_ctx_train) +
              ", using max_ctx=" + std::to_string(config.max_ctx) +
              ", n_predict=" + std::to_string(config.n_predict));
    return config;
}

void Runner::buildContextParams(int n_prompt, const SamplingConfig& config, llama_context_params& params) const {
    params = llama_context_default_params();
    params.n_ctx = std::min(n_prompt + config.n_predict + 64, config.max_ctx);
    params.n_batch = envInt("HATCH_BATCH", 2048);
    params.no_perf = true;
}

llama_sampler* Runner::buildSampler(const SamplingConfig& config) const {
    auto sparams = llama_sampler_chain_default_params();
    sparams.no_perf = true;
    llama_sampler* smpl = llama_sampler_chain_init(sparams);

    llama_sampler_chain_add(smpl, llama_sampler_init_penalties(config.repeat_last_n, config.repeat_penalty, 0.0f, 0.0f));
    llama_sampler_chain_add(smpl, llama_sampler_init_top_k(config.top_k));
    llama_sampler_chain_add(smpl, llama_sampler_init_top_p(config.top_p, 1));
    llama_sampler_chain_add(smpl, llama_sampler_init_min_p(config.min_p, 1));
    llama_sampler_chain_add(smpl, llama_sampler_init_temp(config.temp));
    llama_sampler_chain_add(smpl, llama_sampler_init_dist(config.seed));
    return smpl;
}

RunResult Runner::complete(const std::string& prompt) {
    std::lock_guard<std::mutex> lock(mutex_);
    llama_context* context = nullptr;
    llama_sampler* smpl = nullptr;

    try {
        SamplingConfig config = buildSamplingConfig();
        std::string formatted = formatPrompt(prompt);
        const llama_vocab* vocab = llama_model_get_vocab(model_.get());
        const int n_prompt = -llama_tokenize(vocab, formatted.c_str(), formatted.size(), nullptr, 0, true, true);
        if (n_prompt <= 0) {
            return {false, "", "Failed to tokenize input"};
        }

        int max_predict = std::max(0, config.max_ctx - n_prompt - 64);
        if (max_predict == 0) {
            return {false, "", "Prompt exceeds model context"};
        }
        config.n_predict = std::min(config.n_predict, max_predict);

        std::vector<llama_token> prompt_tokens(n_prompt);
        if (llama_tokenize(vocab, formatted.c_str(), formatted.size(), prompt_tokens.data(), prompt_tokens.size(), true, true) < 0) {
            return {false, "", "Failed to tokenize the prompt"};
        }

        llama_context_params ctx_params;
        buildContextParams(n_prompt, config, ctx_params);
        context = llama_init_from_model(model_.get(), ctx_params);
        if (!context) {
            return {false, "", "Failed to create context"};
        }

        smpl = buildSampler(config);
        llama_batch batch = llama_batch_get_one(prompt_tokens.data(), prompt_tokens.size());

        std::string output;
        llama_token new_token_id;
        int n_pos = 0;
        while (n_pos + batch.n_tokens < n_prompt + config.n_predict) {
            if (llama_decode(context, batch)) {
                LOG_ERROR("Failed to decode");
                break;
            }
            n_pos += batch.n_tokens;

            new_token_id = llama_sampler_sample(smpl, context, -1);
            llama_sampler_accept(smpl, new_token_id);
            if (llama_vocab_is_eog(vocab, new_token_id)) {
                break;
            }

            char buf[128];
            int n = llama_token_to_piece(vocab, new_token_id, buf, sizeof(buf), 0, true);
            if (n < 0) {
                LOG_ERROR("Failed to convert token to piece");
                break;
            }
            output.append(buf, n);
            batch = llama_batch_get_one(&new_token_id, 1);
        }

        llama_sampler_free(smpl);
        llama_free(context);

        LOG_DEBUG("Generated " + std::to_string(output.size()) + " bytes");
        return {true, stripThinkBlocks(output), ""};
    } catch (const std::exception& e) {
        if (smpl) llama_sampler_free(smpl);
        if (context) llama_free(context);
        LOG_ERROR("Inference error: " + std::string(e.what()));
        return {false, "", "Inference error: " + std::string(e.what())};
    }
}

std::string Runner::formatPrompt(const std::string& content) const {
    // Instruct models carry a chat template; base models take the raw text.
    const char* tmpl = llama_model_chat_template(model_.get(), nullptr);
    if (!tmpl) {
        return content;
    }

    llama_chat_message msg = {"user", content.c_str()};
    int len = llama_chat_apply_template(tmpl, &msg, 1, true, nullptr, 0);
    if (len < 0) {
        return content;
    }

    std::vector<char> buf(len + 1);
    int res = llama_chat_apply_template(tmpl, &msg, 1, true, buf.data(), buf.size());
    return (res > 0) ? std::string(buf.data(), res) : content;
}

}
