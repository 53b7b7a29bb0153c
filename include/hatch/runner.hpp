/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

struct llama_model;
struct llama_context_params;
struct llama_sampler;

namespace hatch {

struct RunResult {
    bool ok = false;
    std::string output;
    std::string error;
};

// Hosts one gguf model for the generic workers' completion endpoint.
// Completions are serialized; each gets a fresh context.
class Runner final {
public:
    explicit Runner(const std::string& modelPath);
    ~Runner();

    Runner(const Runner&) = delete;
    Runner& operator=(const Runner&) = delete;
    Runner(Runner&&) = delete;
    Runner& operator=(Runner&&) = delete;

    [[nodiscard]] RunResult complete(const std::string& prompt);
    [[nodiscard]] const std::string& modelPath() const noexcept { return modelPath_; }

private:
    struct SamplingConfig {
        int n_predict = 0;
        int max_ctx = 0;
        float temp = 0.8f;
        int top_k = 40;
        float top_p = 0.9f;
        float min_p = 0.05f;
        float repeat_penalty = 1.1f;
        int repeat_last_n = 64;
        uint32_t seed = 0;
    };

    std::string formatPrompt(const std::string& content) const;
    SamplingConfig buildSamplingConfig() const;
    void buildContextParams(int n_prompt, const SamplingConfig& config, llama_context_params& params) const;
    llama_sampler* buildSampler(const SamplingConfig& config) const;

    std::string modelPath_;
    std::shared_ptr<llama_model> model_;
    std::mutex mutex_;
};

}
