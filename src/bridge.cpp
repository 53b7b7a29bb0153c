/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hatch/bridge.hpp"
#include "hatch/logger.hpp"
#include "hatch/process.hpp"
#include "hatch/util.hpp"
#include <thread>

namespace hatch {

using nlohmann::json;

namespace {
// tool_result content is either a string or a list of {type: text, text}.
std::string flattenContent(const json& content) {
    if (content.is_string()) return content.get<std::string>();
    if (!content.is_array()) return content.is_null() ? "" : content.dump();
    std::string out;
    for (const auto& block : content) {
        if (block.is_object() && block.value("type", std::string{}) == "text") {
            if (!out.empty()) out += "\n";
            out += block.value("text", std::string{});
        }
    }
    return out;
}

const json& blocksOf(const json& j) {
    static const json empty = json::array();
    if (!j.contains("message") || !j["message"].is_object()) return empty;
    const json& content = j["message"].contains("content") ? j["message"]["content"] : empty;
    return content.is_array() ? content : empty;
}
}

void StreamTranslator::resetTurn() noexcept {
    sawResult_ = false;
    succeeded_ = false;
    resultText_.clear();
}

std::vector<TranslatedEvent> StreamTranslator::translate(const std::string& line) {
    std::vector<TranslatedEvent> out;
    if (trim(line).empty()) return out;

    json j;
    try {
        j = json::parse(line);
    } catch (const json::parse_error&) {
        LOG_DEBUG("Ignoring non-JSON bridge output: " + line.substr(0, 200));
        return out;
    }
    if (!j.is_object()) return out;

    const std::string type = j.value("type", std::string{});
    if (j.contains("session_id") && j["session_id"].is_string()) {
        sessionId_ = j["session_id"].get<std::string>();
    }

    if (type == "system") {
        if (j.value("subtype", std::string{}) == "init") {
            json payload{{"status", "session_started"}};
            if (sessionId_) payload["session_id"] = *sessionId_;
            if (j.contains("model")) payload["model"] = j["model"];
            out.push_back({EventType::Status, payload});
        }
    } else if (type == "assistant") {
        for (const auto& block : blocksOf(j)) {
            const std::string kind = block.value("type", std::string{});
            if (kind == "text") {
                std::string text = block.value("text", std::string{});
                if (!trim(text).empty()) {
                    out.push_back({EventType::Message, json{{"role", "assistant"}, {"content", text}}});
                }
            } else if (kind == "tool_use") {
                out.push_back({EventType::ToolUse, json{
                    {"tool", block.value("name", std::string{})},
                    {"tool_use_id", block.value("id", std::string{})},
                    {"input", block.contains("input") ? block["input"] : json::object()},
                }});
            }
        }
    } else if (type == "user") {
        for (const auto& block : blocksOf(j)) {
            if (block.value("type", std::string{}) != "tool_result") continue;
            out.push_back({EventType::ToolResult, json{
                {"tool_use_id", block.value("tool_use_id", std::string{})},
                {"output", flattenContent(block.contains("content") ? block["content"] : json())},
                {"is_error", block.value("is_error", false)},
            }});
        }
    } else if (type == "result") {
        sawResult_ = true;
        succeeded_ = !j.value("is_error", false) && j.value("subtype", std::string{"success"}) == "success";
        resultText_ = j.contains("result") && j["result"].is_string() ? j["result"].get<std::string>()
                                                                       : j.value("subtype", std::string{});
        json payload{{"status", "turn_complete"}, {"success", succeeded_}};
        if (sessionId_) payload["session_id"] = *sessionId_;
        if (j.contains("num_turns")) payload["num_turns"] = j["num_turns"];
        if (j.contains("total_cost_usd")) payload["cost_usd"] = j["total_cost_usd"];
        out.push_back({EventType::Status, payload});
    }
    return out;
}

BridgeRunner::BridgeRunner(WorkerChannel& channel, BridgeOptions options)
    : channel_(channel), options_(std::move(options)) {}

std::vector<std::string> BridgeRunner::commandFor(const std::string& prompt) const {
    std::vector<std::string> argv{
        options_.cli, "-p", prompt,
        "--output-format", "stream-json",
        "--verbose",
        "--max-turns", std::to_string(options_.maxTurns),
    };
    if (!options_.model.empty()) {
        argv.push_back("--model");
        argv.push_back(options_.model);
    }
    if (translator_.sessionId()) {
        argv.push_back("--resume");
        argv.push_back(*translator_.sessionId());
    }
    return argv;
}

bool BridgeRunner::runTurn(const std::string& prompt, std::string& error) {
    translator_.resetTurn();
    ++turns_;

    ChildProcess child;
    if (!child.start(commandFor(prompt), options_.workdir)) {
        error = "failed to start coding agent: " + options_.cli;
        return false;
    }

    std::string line;
    while (child.readLine(line)) {
        for (const auto& event : translator_.translate(line)) {
            if (!channel_.emit(event.type, event.payload)) {
                child.terminate();
                child.wait();
                error = "orchestrator stopped accepting events";
                return false;
            }
        }
    }

    int code = child.wait();
    if (!translator_.sawResult()) {
        error = "coding agent exited with code " + std::to_string(code) + " without a result";
        return false;
    }
    LOG_DEBUG("Bridge turn " + std::to_string(turns_) + " finished, exit " + std::to_string(code));
    return true;
}

std::optional<FollowUpPrompt> BridgeRunner::waitForPrompt() {
    auto deadline = std::chrono::steady_clock::now() + options_.idleWindow;
    while (std::chrono::steady_clock::now() < deadline) {
        if (auto prompt = channel_.pollPrompt()) {
            return prompt;
        }
        std::this_thread::sleep_for(options_.pollInterval);
    }
    return std::nullopt;
}

JobOutcome BridgeRunner::run(const std::string& task) {
    std::string error;
    bool ok = runTurn(task, error);

    while (ok) {
        auto prompt = waitForPrompt();
        if (!prompt) {
            LOG_DEBUG("No follow-up prompt within the idle window");
            break;
        }
        if (!trim(prompt->content).empty()) {
            if (!channel_.emit(EventType::Status, json{{"status", "follow_up"}, {"content", prompt->content}})) {
                error = "orchestrator stopped accepting events";
                ok = false;
                break;
            }
            ok = runTurn(prompt->content, error);
        }
        if (prompt->done) break;
    }

    JobOutcome outcome;
    outcome.sessionId = translator_.sessionId();
    if (!ok) {
        outcome.success = false;
        outcome.message = error;
    } else {
        outcome.success = translator_.succeeded();
        outcome.message = translator_.resultText().empty()
            ? (outcome.success ? "Session completed" : "Session ended with an error")
            : translator_.resultText();
    }

    json payload{{"success", outcome.success}, {"message", outcome.message}, {"turns", turns_}};
    if (outcome.sessionId) payload["session_id"] = *outcome.sessionId;
    if (!channel_.emit(EventType::Result, payload)) {
        LOG_WARN("Result event was not accepted");
    }
    return outcome;
}

}
