/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hatch/agent.hpp"
#include "hatch/logger.hpp"
#include "hatch/util.hpp"

namespace hatch {

using nlohmann::json;

namespace {
constexpr const char* kFence = "```";

const char* kInstructions =
    "You are an autonomous agent working inside a sandboxed Linux shell. "
    "The current directory is the project workspace.\n"
    "To run a command, reply with exactly one shell command in a ```sh fenced block.\n"
    "When the task is complete, summarize what you did and end your reply with DONE.\n";

std::string clip(const std::string& text, std::size_t max) {
    if (text.size() <= max) return text;
    return text.substr(0, max) + "\n[... truncated]";
}
}

std::optional<std::string> extractCommand(const std::string& reply) {
    auto open = reply.find(kFence);
    if (open == std::string::npos) return std::nullopt;
    // Skip the info string (sh, bash, shell or nothing).
    auto bodyStart = reply.find('\n', open + 3);
    if (bodyStart == std::string::npos) return std::nullopt;
    auto close = reply.find(kFence, bodyStart + 1);
    if (close == std::string::npos) return std::nullopt;

    std::string command = trim(reply.substr(bodyStart + 1, close - bodyStart - 1));
    if (command.empty()) return std::nullopt;
    return command;
}

bool isDone(const std::string& reply) {
    std::string text = trim(reply);
    while (!text.empty() && (text.back() == '.' || text.back() == '!' || text.back() == '*')) {
        text.pop_back();
    }
    return text.size() >= 4 && text.compare(text.size() - 4, 4, "DONE") == 0;
}

AgentLoop::AgentLoop(WorkerChannel& channel, AgentOptions options)
    : channel_(channel), options_(std::move(options)) {}

std::string AgentLoop::buildPrompt(const std::string& task) const {
    std::string prompt = kInstructions;
    prompt += "\nTask:\n" + task + "\n";

    std::size_t first = steps_.size() > options_.historySteps ? steps_.size() - options_.historySteps : 0;
    for (std::size_t i = first; i < steps_.size(); ++i) {
        const AgentStep& step = steps_[i];
        prompt += "\n--- step " + std::to_string(i + 1) + " ---\nYou replied:\n" + step.reply + "\n";
        if (step.command) {
            prompt += "Exit code: " + std::to_string(step.result.exitCode) + "\nOutput:\n" +
                      clip(step.result.output, 4096) + "\n";
        } else {
            prompt += "(no command found in the reply)\n";
        }
    }
    prompt += "\nNext step:";
    return prompt;
}

CommandResult AgentLoop::execute(const std::string& command) const {
    CommandOptions options;
    options.cwd = options_.workdir;
    options.maxOutput = options_.maxOutput;
    options.timeout = options_.commandTimeout;
    return runCommand({"/bin/sh", "-c", command}, options);
}

JobOutcome AgentLoop::finish(bool success, const std::string& message) {
    if (!channel_.emit(EventType::Result, json{{"success", success}, {"message", message}})) {
        LOG_WARN("Result event was not accepted");
    }
    return {success, message, std::nullopt};
}

JobOutcome AgentLoop::run(const std::string& task) {
    for (int iteration = 1; iteration <= options_.maxIterations; ++iteration) {
        RunResult reply = channel_.complete(buildPrompt(task));
        if (!reply.ok) {
            return finish(false, "model unavailable: " + reply.error);
        }

        AgentStep step;
        step.reply = reply.output;
        step.command = extractCommand(reply.output);

        if (!channel_.emit(EventType::Message, json{{"role", "assistant"}, {"content", reply.output},
                                                    {"iteration", iteration}})) {
            return finish(false, "orchestrator stopped accepting events");
        }

        if (step.command) {
            if (!channel_.emit(EventType::ToolUse, json{{"tool", "shell"}, {"input", {{"command", *step.command}}}})) {
                return finish(false, "orchestrator stopped accepting events");
            }
            step.result = execute(*step.command);
            json payload{
                {"tool", "shell"},
                {"exit_code", step.result.exitCode},
                {"output", step.result.output},
                {"truncated", step.result.truncated},
                {"timed_out", step.result.timedOut},
            };
            if (!step.result.error.empty()) payload["error"] = step.result.error;
            if (!channel_.emit(EventType::ToolResult, payload)) {
                return finish(false, "orchestrator stopped accepting events");
            }
        }

        bool done = isDone(reply.output);
        steps_.push_back(std::move(step));
        if (done) {
            std::string summary = trim(reply.output);
            summary = trim(summary.substr(0, summary.rfind("DONE")));
            return finish(true, summary.empty() ? "Task completed" : clip(summary, 2000));
        }
    }
    return finish(false, "iteration limit reached (" + std::to_string(options_.maxIterations) + ")");
}

}
