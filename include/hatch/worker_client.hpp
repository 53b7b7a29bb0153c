/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "hatch/orchestrator.hpp"
#include "hatch/runner.hpp"
#include "hatch/types.hpp"

namespace httplib {
class Client;
}

namespace hatch {

// A worker's view of the orchestrator's internal API.
class WorkerChannel {
public:
    virtual ~WorkerChannel() = default;

    [[nodiscard]] virtual std::optional<nlohmann::json> fetchSpec() = 0;
    // False when the event was not accepted (closed stream, lost orchestrator).
    [[nodiscard]] virtual bool emit(EventType type, const nlohmann::json& payload) = 0;
    [[nodiscard]] virtual bool heartbeat() = 0;
    [[nodiscard]] virtual std::optional<FollowUpPrompt> pollPrompt() = 0;
    [[nodiscard]] virtual RunResult complete(const std::string& prompt) = 0;
};

// Worker identity resolved from flags, falling back to the sandbox environment.
struct WorkerIdentity {
    std::string jobId;
    std::string orchestratorUrl;
    std::string token;

    [[nodiscard]] bool complete() const noexcept {
        return !jobId.empty() && !orchestratorUrl.empty() && !token.empty();
    }
};

[[nodiscard]] WorkerIdentity identityFromEnv(const std::string& jobIdFlag, const std::string& urlFlag);

class WorkerClient final : public WorkerChannel {
public:
    explicit WorkerClient(WorkerIdentity identity);

    std::optional<nlohmann::json> fetchSpec() override;
    bool emit(EventType type, const nlohmann::json& payload) override;
    bool heartbeat() override;
    std::optional<FollowUpPrompt> pollPrompt() override;
    RunResult complete(const std::string& prompt) override;

    [[nodiscard]] const std::string& lastError() const noexcept { return lastError_; }

private:
    // One client per call so the heartbeat thread never shares a socket.
    [[nodiscard]] std::unique_ptr<httplib::Client> makeClient(std::chrono::seconds readTimeout) const;
    [[nodiscard]] std::string path(const std::string& suffix) const;

    WorkerIdentity identity_;
    std::string lastError_;
};

// Sends heartbeats on its own thread until destroyed.
class HeartbeatLoop {
public:
    HeartbeatLoop(WorkerChannel& channel, std::chrono::seconds interval);
    ~HeartbeatLoop();

    HeartbeatLoop(const HeartbeatLoop&) = delete;
    HeartbeatLoop& operator=(const HeartbeatLoop&) = delete;

private:
    void loop();

    WorkerChannel& channel_;
    std::chrono::seconds interval_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
    std::thread thread_;
};

}
