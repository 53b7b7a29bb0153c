/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hatch/orchestrator.hpp"
#include "hatch/logger.hpp"
#include "hatch/util.hpp"

namespace hatch {

namespace {
std::string deriveTitle(const std::string& description) {
    std::string first = trim(description.substr(0, description.find('\n')));
    if (first.size() > 80) {
        first = first.substr(0, 77) + "...";
    }
    return first;
}
}

Orchestrator::Orchestrator(Config config, std::unique_ptr<SandboxBackend> backend,
                           std::unique_ptr<Upstream> upstream)
    : config_(std::move(config)),
      backend_(std::move(backend)),
      upstream_(upstream ? std::move(upstream) : std::make_unique<HttpUpstream>()),
      store_(config_.workspace),
      registry_(store_, config_.stuckAfter),
      events_(store_, config_.eventBuffer),
      proxy_(tokens_, credentials_, *upstream_),
      supervisor_(registry_, store_, proxy_, tokens_, tools_, *backend_, supervisorOptions(config_)),
      provisioners_(config_.provisioners, "Provision") {
    LOG_DEBUG("Orchestrator created - workspace: " + config_.workspace.string() +
              ", backend: " + backend_->name());
}

Orchestrator::~Orchestrator() {
    shutdown();
}

SupervisorOptions Orchestrator::supervisorOptions(const Config& config) {
    SupervisorOptions options;
    options.orchestratorUrl = config.orchestratorUrl();
    options.proxyHost = config.sandboxProxyHost();
    options.proxyPort = config.proxyPort;
    options.workerBin = config.workerBin;
    options.bridgeBin = config.bridgeBin;
    options.heartbeatTimeout = config.heartbeatTimeout;
    options.jobTimeout = config.jobTimeout;
    options.grace = config.grace;
    return options;
}

bool Orchestrator::start(bool monitor) {
    if (running_.load()) {
        LOG_WARN("Orchestrator already running");
        return false;
    }

    LOG_INFO("Starting orchestrator...");

    if (!store_.initialize()) {
        LOG_ERROR("Failed to create workspace");
        return false;
    }
    if (!config_.credentialsFile.empty() && !credentials_.loadFile(config_.credentialsFile)) {
        return false;
    }
    if (!config_.toolsFile.empty() && !tools_.loadFile(config_.toolsFile)) {
        return false;
    }

    registry_.load();
    registry_.addTerminalListener([this](const Job& job) { onTerminal(job); });
    events_.addListener([this](const Event& event) { registry_.touch(event.jobId, event.at); });

    // Whatever was in flight belonged to a sandbox this process never owned.
    registry_.interruptLive("orchestrator restarted");

    if (!provisioners_.start([this](const JobId& jobId) {
            auto result = supervisor_.provision(jobId);
            if (!result && result.error != ErrorCode::Conflict) {
                LOG_JOB(WARN, jobId, "provisioning ended: " + result.message);
            }
        })) {
        LOG_ERROR("Failed to start provisioning pool");
        return false;
    }

    if (monitor && !supervisor_.start()) {
        provisioners_.stop();
        return false;
    }

    if (!backend_->isolates()) {
        LOG_WARN(std::string("Sandbox backend '") + backend_->name() +
                 "' does not isolate workers; use the container backend outside development");
    }

    running_.store(true);
    LOG_INFO("Orchestrator ready (workspace " + config_.workspace.string() + ")");
    return true;
}

void Orchestrator::shutdown() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Shutting down orchestrator...");
    supervisor_.stop();
    for (const auto& id : provisioners_.stop()) {
        LOG_JOB(INFO, id, "never provisioned");
    }
    registry_.interruptLive("orchestrator shutdown");
    supervisor_.drain(config_.grace);
    events_.shutdown();
    LOG_INFO("Orchestrator shutdown complete");
}

OpResult Orchestrator::validate(const JobSpec& spec) const {
    if (trim(spec.description).empty()) {
        return OpResult::failure(ErrorCode::Validation, "description is required");
    }
    if (spec.description.size() > kMaxDescriptionBytes) {
        return OpResult::failure(ErrorCode::Validation,
            "description exceeds " + std::to_string(kMaxDescriptionBytes) + " bytes");
    }
    if (spec.maxIterations < 1 || spec.maxIterations > kMaxIterationsLimit) {
        return OpResult::failure(ErrorCode::Validation,
            "max_iterations must be between 1 and " + std::to_string(kMaxIterationsLimit));
    }
    if (spec.maxTurns < 1 || spec.maxTurns > kMaxTurnsLimit) {
        return OpResult::failure(ErrorCode::Validation,
            "max_turns must be between 1 and " + std::to_string(kMaxTurnsLimit));
    }
    for (const auto& domain : spec.allowedDomains) {
        if (!isValidDomainPattern(domain)) {
            return OpResult::failure(ErrorCode::Validation, "invalid domain: " + domain);
        }
    }
    for (const auto& tool : spec.tools) {
        if (!tools_.contains(tool)) {
            return OpResult::failure(ErrorCode::Validation, "unknown tool: " + tool);
        }
    }
    for (const auto& grant : spec.credentials) {
        if (!isValidDomainPattern(grant.domain)) {
            return OpResult::failure(ErrorCode::Validation, "invalid credential domain: " + grant.domain);
        }
        if (!credentials_.contains(grant.credentialRef)) {
            return OpResult::failure(ErrorCode::Validation, "unknown credential reference: " + grant.credentialRef);
        }
    }
    return OpResult::success();
}

CreateResult Orchestrator::create(const JobSpec& spec) {
    return createJob(spec, std::nullopt);
}

CreateResult Orchestrator::createJob(const JobSpec& spec, const std::optional<JobId>& restartedFrom) {
    if (!running_.load()) {
        return {false, "", ErrorCode::Unavailable, "orchestrator is not accepting jobs"};
    }
    auto valid = validate(spec);
    if (!valid) {
        LOG_DEBUG("Rejected job spec: " + valid.message);
        return {false, "", valid.error, valid.message};
    }

    JobSpec normalized = spec;
    if (trim(normalized.title).empty()) {
        normalized.title = deriveTitle(normalized.description);
    }

    auto created = registry_.insert(normalized, restartedFrom);
    if (!created) {
        return created;
    }
    if (!provisioners_.submit(created.id)) {
        auto failed = registry_.transition(created.id, JobState::Failed,
                                           "provision failed: provisioning queue unavailable");
        if (!failed) {
            LOG_JOB(ERROR, created.id, "could not fail unqueued job: " + failed.message);
        }
        return {false, created.id, ErrorCode::ProvisionFailure, "provisioning queue unavailable"};
    }
    return created;
}

OpResult Orchestrator::transition(const JobId& id, JobState to, const std::string& reason) {
    return registry_.transition(id, to, reason);
}

OpResult Orchestrator::cancel(const JobId& id) {
    auto job = registry_.get(id);
    if (!job) {
        return OpResult::failure(ErrorCode::NotFound, "job not found: " + id);
    }
    if (isTerminal(job->state)) {
        return OpResult::success(std::string("already ") + toString(job->state));
    }

    supervisor_.teardown(id);
    auto result = registry_.transition(id, JobState::Cancelled, "cancelled by operator",
                                       JobOutcome{false, "Cancelled by operator", std::nullopt});
    if (!result && result.error == ErrorCode::Conflict) {
        // Lost a race with another terminal transition; still a no-op success.
        return OpResult::success("already terminal");
    }
    return result;
}

CreateResult Orchestrator::restart(const JobId& id) {
    auto job = registry_.get(id);
    if (!job) {
        return {false, "", ErrorCode::NotFound, "job not found: " + id};
    }
    if (job->state != JobState::Failed && job->state != JobState::Interrupted) {
        return {false, "", ErrorCode::Conflict,
                std::string("only failed or interrupted jobs can be restarted (job is ") + toString(job->state) + ")"};
    }
    auto created = createJob(job->spec, id);
    if (created) {
        LOG_JOB(INFO, id, "restarted as " + created.id);
    }
    return created;
}

OpResult Orchestrator::prompt(const JobId& id, const std::string& content, bool done) {
    auto job = registry_.get(id);
    if (!job) {
        return OpResult::failure(ErrorCode::NotFound, "job not found: " + id);
    }
    if (isTerminal(job->state)) {
        return OpResult::failure(ErrorCode::Conflict, std::string("job is ") + toString(job->state));
    }
    if (job->spec.mode != JobMode::Bridge) {
        return OpResult::failure(ErrorCode::Validation, "follow-up prompts are only accepted by bridge jobs");
    }
    if (trim(content).empty() && !done) {
        return OpResult::failure(ErrorCode::Validation, "prompt content is required");
    }
    std::lock_guard<std::mutex> lock(promptMutex_);
    prompts_[id].push_back({content, done});
    return OpResult::success("queued");
}

std::optional<FollowUpPrompt> Orchestrator::takePrompt(const JobId& id) {
    std::lock_guard<std::mutex> lock(promptMutex_);
    auto it = prompts_.find(id);
    if (it == prompts_.end() || it->second.empty()) {
        return std::nullopt;
    }
    auto next = it->second.front();
    it->second.pop_front();
    return next;
}

IngestResult Orchestrator::ingest(const JobId& id, const std::string& eventType, const nlohmann::json& payload) {
    IngestResult rejected;
    auto type = parseEventType(eventType);
    if (!type) {
        rejected.error = ErrorCode::Validation;
        rejected.message = "unknown event_type: " + eventType;
        return rejected;
    }
    if (!payload.is_object()) {
        rejected.error = ErrorCode::Validation;
        rejected.message = "payload must be a JSON object";
        return rejected;
    }
    auto job = registry_.get(id);
    if (!job) {
        rejected.error = ErrorCode::NotFound;
        rejected.message = "job not found: " + id;
        return rejected;
    }
    if (job->state != JobState::InProgress) {
        rejected.error = ErrorCode::Conflict;
        rejected.message = std::string("job is ") + toString(job->state);
        return rejected;
    }

    if (*type != EventType::Result) {
        return events_.ingest(id, *type, payload);
    }

    JobOutcome outcome;
    outcome.success = payload.value("success", false);
    outcome.message = payload.value("message", std::string{});
    if (outcome.message.empty()) {
        outcome.message = outcome.success ? "Completed" : "Worker reported failure";
    }
    if (payload.contains("session_id") && payload.at("session_id").is_string()) {
        outcome.sessionId = payload.at("session_id").get<std::string>();
    }

    {
        std::lock_guard<std::mutex> lock(reportedMutex_);
        reported_.insert(id);
    }
    auto moved = registry_.transition(id, outcome.success ? JobState::Completed : JobState::Failed,
                                      outcome.success ? "worker completed" : "worker failed", outcome);
    {
        std::lock_guard<std::mutex> lock(reportedMutex_);
        reported_.erase(id);
    }

    if (!moved) {
        // Another terminal transition won; make sure its result event exists.
        auto current = registry_.get(id);
        if (current && isTerminal(current->state) && !events_.isClosed(id)) {
            appendResultEvent(*current);
        }
        rejected.error = moved.error;
        rejected.message = moved.message;
        return rejected;
    }
    return events_.ingest(id, EventType::Result, payload);
}

OpResult Orchestrator::heartbeat(const JobId& id) {
    auto job = registry_.get(id);
    if (!job) {
        return OpResult::failure(ErrorCode::NotFound, "job not found: " + id);
    }
    if (job->state != JobState::InProgress) {
        return OpResult::failure(ErrorCode::Conflict, std::string("job is ") + toString(job->state));
    }
    registry_.touch(id);
    return OpResult::success();
}

std::optional<std::string> Orchestrator::browseUrl(const JobId& id) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(store_.projectDir(id), ec)) {
        return std::nullopt;
    }
    return "/api/jobs/" + id + "/files/list";
}

void Orchestrator::onTerminal(const Job& job) {
    supervisor_.teardown(job.id);
    {
        std::lock_guard<std::mutex> lock(promptMutex_);
        prompts_.erase(job.id);
    }
    {
        std::lock_guard<std::mutex> lock(reportedMutex_);
        if (reported_.count(job.id) > 0) {
            return;
        }
    }
    appendResultEvent(job);
}

void Orchestrator::appendResultEvent(const Job& job) {
    nlohmann::json payload = {
        {"success", job.result ? job.result->success : false},
        {"message", job.result ? job.result->message : std::string(toString(job.state))},
        {"state", toString(job.state)},
        {"synthesized", true},
    };
    auto appended = events_.ingest(job.id, EventType::Result, payload);
    if (!appended && appended.error != ErrorCode::Conflict) {
        LOG_JOB(ERROR, job.id, "failed to record result event: " + appended.message);
    }
}

}
