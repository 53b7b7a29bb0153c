/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "hatch/job.hpp"
#include "hatch/worker_client.hpp"

namespace hatch {

struct TranslatedEvent {
    EventType type = EventType::Message;
    nlohmann::json payload = nlohmann::json::object();
};

// Maps the coding-agent CLI's stream-json lines onto job events:
// assistant text -> message, tool_use blocks -> tool_use,
// user tool_result blocks -> tool_result. The CLI's own result line is
// remembered (session id, outcome) and surfaced as a status event.
class StreamTranslator {
public:
    [[nodiscard]] std::vector<TranslatedEvent> translate(const std::string& line);

    [[nodiscard]] const std::optional<std::string>& sessionId() const noexcept { return sessionId_; }
    [[nodiscard]] bool sawResult() const noexcept { return sawResult_; }
    [[nodiscard]] bool succeeded() const noexcept { return succeeded_; }
    [[nodiscard]] const std::string& resultText() const noexcept { return resultText_; }

    // Forgets the previous turn's outcome; the session id survives.
    void resetTurn() noexcept;

private:
    std::optional<std::string> sessionId_;
    bool sawResult_ = false;
    bool succeeded_ = false;
    std::string resultText_;
};

struct BridgeOptions {
    std::string cli = "claude";
    int maxTurns = 20;
    std::string model;
    std::filesystem::path workdir;
    std::chrono::seconds idleWindow{300};
    std::chrono::milliseconds pollInterval{2000};
};

// Drives the coding-agent CLI for one job: first turn from the task, then
// follow-up prompts resumed on the same session.
class BridgeRunner {
public:
    BridgeRunner(WorkerChannel& channel, BridgeOptions options);

    // Emits translated events, then exactly one result.
    JobOutcome run(const std::string& task);

    [[nodiscard]] std::vector<std::string> commandFor(const std::string& prompt) const;
    [[nodiscard]] int turns() const noexcept { return turns_; }

private:
    // False when the CLI could not run or the orchestrator stopped accepting events.
    [[nodiscard]] bool runTurn(const std::string& prompt, std::string& error);
    [[nodiscard]] std::optional<FollowUpPrompt> waitForPrompt();

    WorkerChannel& channel_;
    BridgeOptions options_;
    StreamTranslator translator_;
    int turns_ = 0;
};

}
