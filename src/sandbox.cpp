/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hatch/sandbox.hpp"
#include "hatch/logger.hpp"
#include "hatch/process.hpp"
#include "hatch/util.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <set>
#include <sys/wait.h>
#include <unistd.h>

namespace hatch {

namespace {
std::vector<char*> cstrings(std::vector<std::string>& values) {
    std::vector<char*> out;
    out.reserve(values.size() + 1);
    for (auto& v : values) out.push_back(v.data());
    out.push_back(nullptr);
    return out;
}

std::string hostOf(const std::string& url) {
    auto start = url.find("://");
    start = start == std::string::npos ? 0 : start + 3;
    auto end = url.find_first_of(":/", start);
    return url.substr(start, end == std::string::npos ? std::string::npos : end - start);
}
}

LaunchResult ProcessBackend::launch(const SandboxSpec& spec) {
    LaunchResult result;
    if (spec.command.empty()) {
        result.error = "no entrypoint";
        return result;
    }
    auto exe = findExecutable(spec.command[0]);
    if (!exe) {
        result.error = "entrypoint not found: " + spec.command[0];
        return result;
    }

    // Reports an exec failure from the child; closes on successful exec.
    int status[2];
    if (::pipe2(status, O_CLOEXEC) != 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    std::vector<std::string> args = spec.command;
    std::vector<std::string> env;
    for (const auto& [k, v] : spec.env) env.push_back(k + "=" + v);
    std::string dir = spec.projectDir.string();
    // The child only calls async-signal-safe functions.
    auto argv = cstrings(args);
    auto envp = cstrings(env);

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(status[0]);
        ::close(status[1]);
        result.error = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        ::setsid();
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        int err = 0;
        if (::chdir(dir.c_str()) != 0) {
            err = errno;
        } else {
            ::execve(exe->c_str(), argv.data(), envp.data());
            err = errno;
        }
        ssize_t ignored = ::write(status[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    ::close(status[1]);
    int childErr = 0;
    ssize_t n;
    do {
        n = ::read(status[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    ::close(status[0]);

    if (n > 0) {
        int st = 0;
        ::waitpid(pid, &st, 0);
        result.error = "exec " + *exe + " failed: " + std::strerror(childErr);
        return result;
    }

    result.ok = true;
    result.handle.pid = pid;
    result.handle.ref = "pid:" + std::to_string(pid);
    return result;
}

bool ProcessBackend::isAlive(const SandboxHandle& handle) {
    if (handle.pid <= 0) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    if (exited_.count(handle.pid) > 0) return false;
    int status = 0;
    pid_t r = ::waitpid(handle.pid, &status, WNOHANG);
    if (r == 0) return true;
    exited_[handle.pid] = r == handle.pid ? decodeWaitStatus(status) : -1;
    return false;
}

void ProcessBackend::terminate(const SandboxHandle& handle) noexcept {
    if (handle.pid > 0) {
        ::kill(-handle.pid, SIGTERM);
    }
}

void ProcessBackend::kill(const SandboxHandle& handle) noexcept {
    if (handle.pid <= 0) return;
    ::kill(-handle.pid, SIGKILL);
    std::lock_guard<std::mutex> lock(mutex_);
    if (exited_.count(handle.pid) == 0) {
        int status = 0;
        ::waitpid(handle.pid, &status, 0);
    }
    exited_.erase(handle.pid);
}

ContainerBackend::ContainerBackend(std::string tool, std::string image, std::string network) noexcept
    : tool_(std::move(tool)), image_(std::move(image)), network_(std::move(network)) {}

std::vector<std::string> ContainerBackend::runArgs(const SandboxSpec& spec) const {
    std::vector<std::string> args = {
        tool_, "run", "-d", "--rm",
        "--name", "hatch-" + spec.jobId,
        "--network", network_,
        "-v", spec.projectDir.string() + ":/workspace",
        "-w", "/workspace",
    };
    for (const auto& [k, v] : spec.env) {
        args.push_back("-e");
        args.push_back(k + "=" + v);
    }
    args.push_back(image_);
    args.insert(args.end(), spec.command.begin(), spec.command.end());
    return args;
}

LaunchResult ContainerBackend::launch(const SandboxSpec& spec) {
    LaunchResult result;
    CommandOptions options;
    options.timeout = std::chrono::seconds(120);
    auto run = runCommand(runArgs(spec), options);
    if (!run.ok()) {
        result.error = !run.error.empty() ? run.error : tool_ + " run failed: " + trim(run.output);
        return result;
    }
    result.ok = true;
    result.handle.ref = "hatch-" + spec.jobId;
    return result;
}

bool ContainerBackend::isAlive(const SandboxHandle& handle) {
    CommandOptions options;
    options.timeout = std::chrono::seconds(15);
    auto r = runCommand({tool_, "inspect", "-f", "{{.State.Running}}", handle.ref}, options);
    return r.ok() && trim(r.output) == "true";
}

void ContainerBackend::terminate(const SandboxHandle& handle) noexcept {
    try {
        CommandOptions options;
        options.timeout = std::chrono::seconds(15);
        auto r = runCommand({tool_, "kill", "--signal", "TERM", handle.ref}, options);
        if (!r.ok()) {
            LOG_DEBUG("Container " + handle.ref + " TERM: " + trim(r.output));
        }
    } catch (const std::exception& e) {
        LOG_WARN("Container terminate failed for " + handle.ref + ": " + e.what());
    }
}

void ContainerBackend::kill(const SandboxHandle& handle) noexcept {
    try {
        CommandOptions options;
        options.timeout = std::chrono::seconds(30);
        auto r = runCommand({tool_, "rm", "-f", handle.ref}, options);
        if (!r.ok()) {
            LOG_WARN("Container rm failed for " + handle.ref + ": " + trim(r.output));
        }
    } catch (const std::exception& e) {
        LOG_WARN("Container kill failed for " + handle.ref + ": " + e.what());
    }
}

std::vector<DomainRule> buildRules(const JobId& jobId, const JobSpec& spec, const ToolTable& tools) {
    std::vector<DomainRule> rules;
    std::set<std::string> seen;
    auto add = [&](const std::string& domain, const std::string& ref) {
        std::string d = toLowerCopy(domain);
        if (!ref.empty()) {
            rules.push_back({d, jobId, ref});
            seen.insert(d);
            return;
        }
        if (seen.insert(d).second) {
            rules.push_back({d, jobId, ""});
        }
    };
    for (const auto& grant : spec.credentials) add(grant.domain, grant.credentialRef);
    for (const auto& d : spec.allowedDomains) add(d, "");
    for (const auto& tool : spec.tools) {
        for (const auto& d : tools.domainsFor(tool)) add(d, "");
    }
    return rules;
}

SandboxSupervisor::SandboxSupervisor(JobRegistry& registry, Store& store, EgressProxy& proxy, TokenStore& tokens,
                                     const ToolTable& tools, SandboxBackend& backend, SupervisorOptions options)
    : registry_(registry), store_(store), proxy_(proxy), tokens_(tokens), tools_(tools),
      backend_(backend), options_(std::move(options)) {}

SandboxSupervisor::~SandboxSupervisor() {
    stop();
}

SandboxSpec SandboxSupervisor::buildSandboxSpec(const Job& job, const std::string& token) const {
    SandboxSpec spec;
    spec.jobId = job.id;
    spec.mode = job.spec.mode;
    spec.projectDir = store_.projectDir(job.id);

    std::string proxyUrl = "http://" + job.id + ":" + token + "@" + options_.proxyHost + ":" +
                           std::to_string(options_.proxyPort);
    std::string noProxy = hostOf(options_.orchestratorUrl);
    spec.env = {
        {"HATCH_JOB_ID", job.id},
        {"HATCH_ORCHESTRATOR_URL", options_.orchestratorUrl},
        {"HATCH_JOB_TOKEN", token},
        {"HTTP_PROXY", proxyUrl},
        {"HTTPS_PROXY", proxyUrl},
        {"http_proxy", proxyUrl},
        {"https_proxy", proxyUrl},
        {"NO_PROXY", noProxy},
        {"no_proxy", noProxy},
        {"PATH", "/usr/local/bin:/usr/bin:/bin"},
        {"HOME", backend_.workdir(spec)},
    };

    if (job.spec.mode == JobMode::Bridge) {
        spec.command = {options_.bridgeBin, "--job-id", job.id,
                        "--orchestrator-url", options_.orchestratorUrl,
                        "--max-turns", std::to_string(job.spec.maxTurns)};
        if (!job.spec.model.empty()) {
            spec.command.push_back("--model");
            spec.command.push_back(job.spec.model);
        }
    } else {
        spec.command = {options_.workerBin, "--job-id", job.id,
                        "--orchestrator-url", options_.orchestratorUrl,
                        "--max-iterations", std::to_string(job.spec.maxIterations)};
    }
    return spec;
}

OpResult SandboxSupervisor::failProvision(const JobId& jobId, const std::string& why) {
    LOG_JOB(ERROR, jobId, "provision failed: " + why);
    proxy_.revokeRules(jobId);
    tokens_.revoke(jobId);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.erase(jobId);
    }
    std::string reason = "provision failed: " + why;
    auto job = registry_.get(jobId);
    if (job && !isTerminal(job->state)) {
        auto r = registry_.transition(jobId, JobState::Failed, reason, JobOutcome{false, reason, std::nullopt});
        if (!r) {
            LOG_JOB(WARN, jobId, "could not record provision failure: " + r.message);
        }
    }
    return OpResult::failure(ErrorCode::ProvisionFailure, reason);
}

OpResult SandboxSupervisor::provision(const JobId& jobId) {
    auto job = registry_.get(jobId);
    if (!job) {
        return OpResult::failure(ErrorCode::NotFound, "job not found: " + jobId);
    }
    if (job->state != JobState::Pending) {
        LOG_JOB(DEBUG, jobId, std::string("skipping provision, job is ") + toString(job->state));
        return OpResult::failure(ErrorCode::Conflict, "job is not pending");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (entries_.count(jobId) > 0) {
            return OpResult::failure(ErrorCode::Conflict, "sandbox already bound");
        }
        entries_[jobId] = Entry{};
    }

    auto token = tokens_.issue(jobId);
    if (!token) {
        return failProvision(jobId, "could not issue job token");
    }

    proxy_.installRules(jobId, buildRules(jobId, job->spec, tools_));

    try {
        std::filesystem::create_directories(store_.projectDir(jobId));
    } catch (const std::exception& e) {
        return failProvision(jobId, std::string("project directory: ") + e.what());
    }

    auto moved = registry_.transition(jobId, JobState::InProgress, "sandbox provisioned");
    if (!moved) {
        // Cancelled while queued; the terminal listener already tore down.
        LOG_JOB(INFO, jobId, "not launching: " + moved.message);
        proxy_.revokeRules(jobId);
        tokens_.revoke(jobId);
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.erase(jobId);
        return moved;
    }

    auto spec = buildSandboxSpec(*job, *token);
    auto launched = backend_.launch(spec);
    if (!launched) {
        return failProvision(jobId, launched.error);
    }

    bool lateTeardown = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(jobId);
        if (it == entries_.end() || it->second.tornDown) {
            lateTeardown = true;
            entries_.erase(jobId);
        } else {
            it->second.handle = launched.handle;
            it->second.launched = true;
        }
    }
    if (lateTeardown) {
        LOG_JOB(INFO, jobId, "job ended during launch, destroying sandbox");
        backend_.kill(launched.handle);
        return OpResult::failure(ErrorCode::Conflict, "job ended during launch");
    }

    LOG_JOB(INFO, jobId, std::string("sandbox started (") + backend_.name() + " " + launched.handle.ref + ")");
    return OpResult::success(launched.handle.ref);
}

void SandboxSupervisor::teardown(const JobId& jobId, TimePoint now) {
    proxy_.revokeRules(jobId);
    tokens_.revoke(jobId);

    SandboxHandle handle;
    bool terminateNow = false;
    bool killNow = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(jobId);
        if (it == entries_.end() || it->second.tornDown) {
            return;
        }
        it->second.tornDown = true;
        it->second.killDeadline = now + options_.grace;
        if (it->second.launched) {
            handle = it->second.handle;
            if (options_.grace.count() <= 0) {
                killNow = true;
                entries_.erase(it);
            } else {
                terminateNow = true;
            }
        }
    }

    if (killNow) {
        backend_.kill(handle);
    } else if (terminateNow) {
        backend_.terminate(handle);
    }
    LOG_JOB(DEBUG, jobId, "sandbox teardown started");
}

void SandboxSupervisor::tick(TimePoint now) {
    std::vector<std::pair<JobId, Entry>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : entries_) {
            if (entry.launched) snapshot.emplace_back(id, entry);
        }
    }

    for (const auto& [id, entry] : snapshot) {
        if (entry.tornDown) {
            bool alive = backend_.isAlive(entry.handle);
            if (alive && now < entry.killDeadline) continue;
            if (alive) {
                LOG_JOB(WARN, id, "sandbox ignored stop request, killing");
            }
            backend_.kill(entry.handle);
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.erase(id);
            continue;
        }

        auto job = registry_.get(id);
        if (!job || isTerminal(job->state)) {
            teardown(id, now);
            continue;
        }
        if (job->state != JobState::InProgress) continue;

        OpResult result = OpResult::success();
        if (!backend_.isAlive(entry.handle)) {
            result = registry_.transition(id, JobState::Interrupted, "sandbox exited without result",
                                          std::nullopt, now);
        } else if (options_.jobTimeout.count() > 0 && job->startedAt &&
                   now - *job->startedAt > options_.jobTimeout) {
            result = registry_.transition(id, JobState::Failed, "job timed out", std::nullopt, now);
        } else if (options_.heartbeatTimeout.count() > 0) {
            auto last = registry_.lastActivity(id);
            if (last && now - *last > options_.heartbeatTimeout) {
                result = registry_.transition(id, JobState::Interrupted, "heartbeat timeout", std::nullopt, now);
            }
        }
        if (!result && result.error != ErrorCode::Conflict) {
            LOG_JOB(WARN, id, "liveness transition failed: " + result.message);
        }
    }
}

void SandboxSupervisor::drain(std::chrono::seconds grace) {
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (boundCount() > 0 && std::chrono::steady_clock::now() < deadline) {
        tick(Clock::now());
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::vector<std::pair<JobId, Entry>> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : entries_) remaining.emplace_back(id, entry);
        entries_.clear();
    }
    for (const auto& [id, entry] : remaining) {
        proxy_.revokeRules(id);
        tokens_.revoke(id);
        if (entry.launched) {
            LOG_JOB(WARN, id, "forcing sandbox down");
            backend_.kill(entry.handle);
        }
    }
}

bool SandboxSupervisor::start() {
    if (running_.load()) {
        LOG_WARN("Supervisor already running");
        return false;
    }
    shutdown_.store(false);
    running_.store(true);
    try {
        monitorThread_ = std::thread(&SandboxSupervisor::monitorLoop, this);
    } catch (const std::exception& e) {
        running_.store(false);
        LOG_ERROR("Failed to start supervisor: " + std::string(e.what()));
        return false;
    }
    LOG_INFO(std::string("Sandbox supervisor started (") + backend_.name() + " backend)");
    return true;
}

void SandboxSupervisor::stop() noexcept {
    if (!running_.load()) {
        return;
    }
    shutdown_.store(true);
    running_.store(false);
    if (monitorThread_.joinable()) {
        monitorThread_.join();
    }
    LOG_DEBUG("Sandbox supervisor stopped");
}

bool SandboxSupervisor::isBound(const JobId& jobId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(jobId);
    return it != entries_.end() && !it->second.tornDown;
}

std::size_t SandboxSupervisor::boundCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void SandboxSupervisor::monitorLoop() {
    setThreadName("Supervisor");
    const auto interval = std::chrono::seconds(1);

    while (!shutdown_.load()) {
        try {
            tick(Clock::now());
        } catch (const std::exception& e) {
            LOG_ERROR("Supervisor tick error: " + std::string(e.what()));
        }

        auto sleepEnd = std::chrono::steady_clock::now() + interval;
        while (std::chrono::steady_clock::now() < sleepEnd && !shutdown_.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }
}

}
