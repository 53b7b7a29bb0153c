/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>

#include "hatch/auth.hpp"
#include "hatch/job.hpp"
#include "hatch/proxy.hpp"
#include "hatch/registry.hpp"
#include "hatch/store.hpp"

namespace hatch {

struct SandboxSpec {
    JobId jobId;
    JobMode mode = JobMode::Worker;
    std::filesystem::path projectDir;
    std::map<std::string, std::string> env;
    std::vector<std::string> command;
};

struct SandboxHandle {
    std::string ref;
    pid_t pid = -1;
};

struct LaunchResult {
    bool ok = false;
    SandboxHandle handle;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

// Isolation mechanism. Implementations own nothing about jobs; the
// supervisor decides when to launch, poll and destroy.
class SandboxBackend {
public:
    virtual ~SandboxBackend() = default;
    [[nodiscard]] virtual const char* name() const noexcept = 0;
    [[nodiscard]] virtual LaunchResult launch(const SandboxSpec& spec) = 0;
    [[nodiscard]] virtual bool isAlive(const SandboxHandle& handle) = 0;
    // Polite stop (SIGTERM or equivalent).
    virtual void terminate(const SandboxHandle& handle) noexcept = 0;
    // Forced, final removal.
    virtual void kill(const SandboxHandle& handle) noexcept = 0;
    // Where the project directory appears inside the sandbox.
    [[nodiscard]] virtual std::string workdir(const SandboxSpec& spec) const {
        return spec.projectDir.string();
    }
    // False when the worker shares the host network and filesystem.
    [[nodiscard]] virtual bool isolates() const noexcept { return false; }
};

// fork/exec in a fresh session with a scrubbed environment. Development
// backend: no network or filesystem isolation, egress is confined only by
// workers honouring HTTP(S)_PROXY.
class ProcessBackend final : public SandboxBackend {
public:
    [[nodiscard]] const char* name() const noexcept override { return "process"; }
    [[nodiscard]] LaunchResult launch(const SandboxSpec& spec) override;
    [[nodiscard]] bool isAlive(const SandboxHandle& handle) override;
    void terminate(const SandboxHandle& handle) noexcept override;
    void kill(const SandboxHandle& handle) noexcept override;

private:
    std::mutex mutex_;
    std::map<pid_t, int> exited_;
};

// Drives docker/podman. Containers are named hatch-<job id>.
class ContainerBackend final : public SandboxBackend {
public:
    ContainerBackend(std::string tool, std::string image, std::string network) noexcept;

    [[nodiscard]] const char* name() const noexcept override { return "container"; }
    [[nodiscard]] LaunchResult launch(const SandboxSpec& spec) override;
    [[nodiscard]] bool isAlive(const SandboxHandle& handle) override;
    void terminate(const SandboxHandle& handle) noexcept override;
    void kill(const SandboxHandle& handle) noexcept override;
    [[nodiscard]] std::string workdir(const SandboxSpec&) const override { return "/workspace"; }
    [[nodiscard]] bool isolates() const noexcept override { return true; }

    [[nodiscard]] std::vector<std::string> runArgs(const SandboxSpec& spec) const;

private:
    std::string tool_;
    std::string image_;
    std::string network_;
};

struct SupervisorOptions {
    std::string orchestratorUrl;
    std::string proxyHost = "127.0.0.1";
    int proxyPort = 8601;
    std::string workerBin = "hatch-worker";
    std::string bridgeBin = "hatch-bridge";
    std::chrono::seconds heartbeatTimeout{300};
    std::chrono::seconds jobTimeout{3600};
    std::chrono::seconds grace{10};
};

// Allow rules for a job: declared domains, tool domains and credential grants.
[[nodiscard]] std::vector<DomainRule> buildRules(const JobId& jobId, const JobSpec& spec, const ToolTable& tools);

class SandboxSupervisor {
public:
    SandboxSupervisor(JobRegistry& registry, Store& store, EgressProxy& proxy, TokenStore& tokens,
                      const ToolTable& tools, SandboxBackend& backend, SupervisorOptions options);
    ~SandboxSupervisor();

    SandboxSupervisor(const SandboxSupervisor&) = delete;
    SandboxSupervisor& operator=(const SandboxSupervisor&) = delete;

    // Runs on a provisioning thread. Moves the job pending -> in_progress
    // before the worker starts, or to failed when isolation cannot be set up.
    OpResult provision(const JobId& jobId);

    // Unconditional and idempotent. Access is revoked before this returns.
    void teardown(const JobId& jobId, TimePoint now = Clock::now());

    // Liveness, heartbeat and timeout checks, plus forced kills past grace.
    void tick(TimePoint now = Clock::now());

    // Waits up to `grace` for torn-down sandboxes to exit, then kills the rest.
    void drain(std::chrono::seconds grace);

    [[nodiscard]] bool start();
    void stop() noexcept;

    [[nodiscard]] bool isBound(const JobId& jobId) const;
    [[nodiscard]] std::size_t boundCount() const;
    [[nodiscard]] std::filesystem::path projectDir(const JobId& jobId) const { return store_.projectDir(jobId); }
    [[nodiscard]] const SupervisorOptions& options() const noexcept { return options_; }

private:
    struct Entry {
        SandboxHandle handle;
        bool launched = false;
        bool tornDown = false;
        TimePoint killDeadline;
    };

    OpResult failProvision(const JobId& jobId, const std::string& why);
    [[nodiscard]] SandboxSpec buildSandboxSpec(const Job& job, const std::string& token) const;
    void monitorLoop();

    JobRegistry& registry_;
    Store& store_;
    EgressProxy& proxy_;
    TokenStore& tokens_;
    const ToolTable& tools_;
    SandboxBackend& backend_;
    SupervisorOptions options_;

    mutable std::mutex mutex_;
    std::map<JobId, Entry> entries_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::thread monitorThread_;
};

}
