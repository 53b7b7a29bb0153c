/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "hatch/auth.hpp"
#include "hatch/config.hpp"
#include "hatch/events.hpp"
#include "hatch/job.hpp"
#include "hatch/pool.hpp"
#include "hatch/proxy.hpp"
#include "hatch/registry.hpp"
#include "hatch/sandbox.hpp"
#include "hatch/store.hpp"

namespace hatch {

// Launch seam used by the routine scheduler.
class JobLauncher {
public:
    virtual ~JobLauncher() = default;
    [[nodiscard]] virtual CreateResult launch(const JobSpec& spec) = 0;
};

struct FollowUpPrompt {
    std::string content;
    bool done = false;
};

constexpr std::size_t kMaxDescriptionBytes = 1024 * 1024;
constexpr int kMaxIterationsLimit = 200;
constexpr int kMaxTurnsLimit = 500;

// Owns the job lifecycle: registry, event pipeline, egress policy and the
// sandbox supervisor, plus the provisioning pool feeding it.
class Orchestrator final : public JobLauncher {
public:
    Orchestrator(Config config, std::unique_ptr<SandboxBackend> backend,
                 std::unique_ptr<Upstream> upstream = nullptr);
    ~Orchestrator() override;

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;
    Orchestrator(Orchestrator&&) = delete;
    Orchestrator& operator=(Orchestrator&&) = delete;

    // Loads credentials and tools, recovers jobs left in flight by a previous
    // process and starts provisioning. `monitor` starts the supervisor thread.
    [[nodiscard]] bool start(bool monitor = true);
    void shutdown() noexcept;

    [[nodiscard]] CreateResult create(const JobSpec& spec);
    [[nodiscard]] CreateResult launch(const JobSpec& spec) override { return create(spec); }
    [[nodiscard]] OpResult validate(const JobSpec& spec) const;

    [[nodiscard]] OpResult transition(const JobId& id, JobState to, const std::string& reason);
    [[nodiscard]] OpResult cancel(const JobId& id);
    [[nodiscard]] CreateResult restart(const JobId& id);

    [[nodiscard]] std::optional<Job> get(const JobId& id) const { return registry_.get(id); }
    [[nodiscard]] std::vector<Job> list(const JobFilter& filter) const { return registry_.list(filter); }
    [[nodiscard]] JobSummary summary() const { return registry_.summary(); }
    [[nodiscard]] bool isStuck(const Job& job) const { return registry_.isStuck(job, Clock::now()); }

    // Follow-up prompts for bridge jobs. Returns once queued.
    [[nodiscard]] OpResult prompt(const JobId& id, const std::string& content, bool done);
    [[nodiscard]] std::optional<FollowUpPrompt> takePrompt(const JobId& id);

    // Worker side. A result event moves the job to its terminal state first,
    // then closes the stream.
    [[nodiscard]] IngestResult ingest(const JobId& id, const std::string& eventType, const nlohmann::json& payload);
    [[nodiscard]] OpResult heartbeat(const JobId& id);
    [[nodiscard]] bool authorize(const JobId& id, const std::string& token) const { return tokens_.verify(id, token); }

    // Null when no project directory exists for the job.
    [[nodiscard]] std::optional<std::string> browseUrl(const JobId& id) const;
    [[nodiscard]] std::filesystem::path projectDir(const JobId& id) const { return store_.projectDir(id); }

    void addTerminalListener(TerminalListener listener) { registry_.addTerminalListener(std::move(listener)); }

    [[nodiscard]] JobRegistry& registry() noexcept { return registry_; }
    [[nodiscard]] EventPipeline& events() noexcept { return events_; }
    [[nodiscard]] EgressProxy& proxy() noexcept { return proxy_; }
    [[nodiscard]] SandboxSupervisor& supervisor() noexcept { return supervisor_; }
    [[nodiscard]] CredentialStore& credentials() noexcept { return credentials_; }
    [[nodiscard]] ToolTable& tools() noexcept { return tools_; }
    [[nodiscard]] Store& store() noexcept { return store_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t provisioningBacklog() const noexcept { return provisioners_.backlog(); }
    [[nodiscard]] bool sandboxesIsolated() const noexcept { return backend_->isolates(); }

private:
    [[nodiscard]] CreateResult createJob(const JobSpec& spec, const std::optional<JobId>& restartedFrom);
    void onTerminal(const Job& job);
    void appendResultEvent(const Job& job);
    [[nodiscard]] static SupervisorOptions supervisorOptions(const Config& config);

    Config config_;
    std::unique_ptr<SandboxBackend> backend_;
    std::unique_ptr<Upstream> upstream_;

    Store store_;
    JobRegistry registry_;
    EventPipeline events_;
    TokenStore tokens_;
    CredentialStore credentials_;
    ToolTable tools_;
    EgressProxy proxy_;
    SandboxSupervisor supervisor_;
    ProvisionPool provisioners_;

    std::atomic<bool> running_{false};

    std::mutex promptMutex_;
    std::map<JobId, std::deque<FollowUpPrompt>> prompts_;

    // Jobs whose worker reported its own result; no synthesized result for them.
    std::mutex reportedMutex_;
    std::set<JobId> reported_;
};

}
