/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "hatch/job.hpp"
#include "hatch/process.hpp"
#include "hatch/worker_client.hpp"

namespace hatch {

// First fenced code block of a model reply (```sh ... ```), trimmed.
[[nodiscard]] std::optional<std::string> extractCommand(const std::string& reply);

// True when the reply's last non-blank text ends with DONE.
[[nodiscard]] bool isDone(const std::string& reply);

struct AgentOptions {
    int maxIterations = 10;
    std::filesystem::path workdir;
    std::size_t maxOutput = 16 * 1024;
    std::chrono::seconds commandTimeout{120};
    std::size_t historySteps = 8;
};

struct AgentStep {
    std::string reply;
    std::optional<std::string> command;
    CommandResult result;
};

// Generic worker loop: ask the model, run the proposed command, report.
class AgentLoop {
public:
    AgentLoop(WorkerChannel& channel, AgentOptions options);

    // Emits message, tool_use and tool_result events, then exactly one result.
    JobOutcome run(const std::string& task);

    [[nodiscard]] const std::vector<AgentStep>& steps() const noexcept { return steps_; }

private:
    [[nodiscard]] std::string buildPrompt(const std::string& task) const;
    [[nodiscard]] CommandResult execute(const std::string& command) const;
    JobOutcome finish(bool success, const std::string& message);

    WorkerChannel& channel_;
    AgentOptions options_;
    std::vector<AgentStep> steps_;
};

}
