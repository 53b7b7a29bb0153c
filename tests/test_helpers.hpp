/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "hatch/logger.hpp"
#include "hatch/proxy.hpp"
#include "hatch/sandbox.hpp"
#include "hatch/util.hpp"
#include "hatch/worker_client.hpp"

namespace hatch::test {

// Unique scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        path_ = std::filesystem::temp_directory_path() / ("hatch-test-" + generateId());
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

// Backend that records every call and never starts a process.
class FakeBackend final : public SandboxBackend {
public:
    const char* name() const noexcept override { return "fake"; }

    LaunchResult launch(const SandboxSpec& spec) override {
        std::lock_guard<std::mutex> lock(mutex_);
        launches.push_back(spec);
        if (failLaunch) {
            return {false, {}, "backend refused"};
        }
        SandboxHandle handle{"fake-" + spec.jobId, -1};
        alive[handle.ref] = true;
        return {true, handle, ""};
    }

    bool isAlive(const SandboxHandle& handle) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = alive.find(handle.ref);
        return it != alive.end() && it->second;
    }

    void terminate(const SandboxHandle& handle) noexcept override {
        std::lock_guard<std::mutex> lock(mutex_);
        terminated.insert(handle.ref);
        if (exitOnTerminate) alive[handle.ref] = false;
    }

    void kill(const SandboxHandle& handle) noexcept override {
        std::lock_guard<std::mutex> lock(mutex_);
        killed.insert(handle.ref);
        alive[handle.ref] = false;
    }

    void exitSandbox(const JobId& jobId) {
        std::lock_guard<std::mutex> lock(mutex_);
        alive["fake-" + jobId] = false;
    }

    std::size_t launchCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        return launches.size();
    }

    std::optional<SandboxSpec> launchFor(const JobId& jobId) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& spec : launches) {
            if (spec.jobId == jobId) return spec;
        }
        return std::nullopt;
    }

    bool wasTerminated(const JobId& jobId) {
        std::lock_guard<std::mutex> lock(mutex_);
        return terminated.count("fake-" + jobId) > 0 || killed.count("fake-" + jobId) > 0;
    }

    std::mutex mutex_;
    std::vector<SandboxSpec> launches;
    std::map<std::string, bool> alive;
    std::set<std::string> terminated;
    std::set<std::string> killed;
    bool failLaunch = false;
    bool exitOnTerminate = true;
};

// Upstream that answers 200 and remembers what it was asked.
class RecordingUpstream final : public Upstream {
public:
    std::optional<ProxyResponse> forward(const UpstreamRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests.push_back(request);
        if (unreachable) return std::nullopt;
        ProxyResponse r;
        r.status = 200;
        r.body = "upstream-body";
        r.headers.emplace("Content-Type", "text/plain");
        r.headers.emplace("Connection", "keep-alive");
        return r;
    }

    std::mutex mutex_;
    std::vector<UpstreamRequest> requests;
    bool unreachable = false;
};

// Scripted model replies plus a record of every emitted event.
class FakeChannel final : public WorkerChannel {
public:
    std::optional<nlohmann::json> fetchSpec() override { return spec; }

    bool emit(EventType type, const nlohmann::json& payload) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events.push_back({type, payload});
        return acceptEvents;
    }

    bool heartbeat() override {
        ++heartbeats;
        return true;
    }

    std::optional<FollowUpPrompt> pollPrompt() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (prompts.empty()) return std::nullopt;
        auto next = prompts.front();
        prompts.pop_front();
        return next;
    }

    RunResult complete(const std::string& prompt) override {
        std::lock_guard<std::mutex> lock(mutex_);
        seenPrompts.push_back(prompt);
        if (replies.empty()) return {false, "", "no model"};
        auto next = replies.front();
        replies.pop_front();
        return {true, next, ""};
    }

    std::vector<EventType> types() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<EventType> out;
        for (const auto& [type, payload] : events) out.push_back(type);
        return out;
    }

    std::mutex mutex_;
    std::optional<nlohmann::json> spec;
    std::vector<std::pair<EventType, nlohmann::json>> events;
    std::deque<std::string> replies;
    std::deque<FollowUpPrompt> prompts;
    std::vector<std::string> seenPrompts;
    std::atomic<int> heartbeats{0};
    bool acceptEvents = true;
};

// Polls `pred` until it holds or `timeout` passes.
template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

inline void quietLogs() {
    Logger::setLevel(LogLevel::ERROR);
}

}
