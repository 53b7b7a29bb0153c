/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hatch/job.hpp"
#include <stdexcept>

namespace hatch {

namespace {
JobState stateFromJson(const nlohmann::json& j) {
    auto parsed = parseJobState(j.get<std::string>());
    if (!parsed) {
        throw std::invalid_argument("unknown job state: " + j.get<std::string>());
    }
    return *parsed;
}

TimePoint timeFromJson(const nlohmann::json& j) {
    auto parsed = parseTime(j.get<std::string>());
    if (!parsed) {
        throw std::invalid_argument("bad timestamp: " + j.get<std::string>());
    }
    return *parsed;
}

std::optional<TimePoint> optionalTime(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return timeFromJson(j.at(key));
}
}

void to_json(nlohmann::json& j, const CredentialGrant& g) {
    j = nlohmann::json{{"domain", g.domain}, {"credential_ref", g.credentialRef}};
}

void from_json(const nlohmann::json& j, CredentialGrant& g) {
    g.domain = j.value("domain", std::string{});
    g.credentialRef = j.value("credential_ref", std::string{});
}

void to_json(nlohmann::json& j, const JobSpec& spec) {
    j = nlohmann::json{
        {"title", spec.title},
        {"description", spec.description},
        {"mode", toString(spec.mode)},
        {"allowed_domains", spec.allowedDomains},
        {"tools", spec.tools},
        {"credentials", spec.credentials},
        {"max_iterations", spec.maxIterations},
        {"max_turns", spec.maxTurns},
    };
    if (!spec.model.empty()) j["model"] = spec.model;
    if (!spec.routineId.empty()) j["routine_id"] = spec.routineId;
}

// Lenient on purpose: this parses operator input too. Validation happens in
// Orchestrator::create so errors reach the caller as ValidationError.
void from_json(const nlohmann::json& j, JobSpec& spec) {
    spec.title = j.value("title", std::string{});
    spec.description = j.value("description", std::string{});
    auto mode = parseJobMode(j.value("mode", std::string{"worker"}));
    if (!mode) {
        throw std::invalid_argument("unknown job mode: " + j.value("mode", std::string{}));
    }
    spec.mode = *mode;
    spec.allowedDomains = j.value("allowed_domains", std::vector<std::string>{});
    spec.tools = j.value("tools", std::vector<std::string>{});
    spec.credentials = j.value("credentials", std::vector<CredentialGrant>{});
    spec.maxIterations = j.value("max_iterations", 10);
    spec.maxTurns = j.value("max_turns", 20);
    spec.model = j.value("model", std::string{});
    spec.routineId = j.value("routine_id", std::string{});
}

bool hasValidHistory(const Job& job) noexcept {
    if (job.transitions.empty() || !job.transitions.front().isCreation()) {
        return false;
    }
    for (std::size_t i = 1; i < job.transitions.size(); ++i) {
        const auto& t = job.transitions[i];
        if (t.from != job.transitions[i - 1].to || !isLegalTransition(t.from, t.to)) {
            return false;
        }
    }
    return job.transitions.back().to == job.state;
}

void to_json(nlohmann::json& j, const Transition& t) {
    j = nlohmann::json{
        {"from", toString(t.from)},
        {"to", toString(t.to)},
        {"timestamp", formatTime(t.at)},
        {"reason", t.reason},
    };
}

void from_json(const nlohmann::json& j, Transition& t) {
    t.from = stateFromJson(j.at("from"));
    t.to = stateFromJson(j.at("to"));
    t.at = timeFromJson(j.at("timestamp"));
    t.reason = j.value("reason", std::string{});
}

void to_json(nlohmann::json& j, const JobOutcome& r) {
    j = nlohmann::json{{"success", r.success}, {"message", r.message}};
    if (r.sessionId) j["session_id"] = *r.sessionId;
}

void from_json(const nlohmann::json& j, JobOutcome& r) {
    r.success = j.value("success", false);
    r.message = j.value("message", std::string{});
    if (j.contains("session_id") && j.at("session_id").is_string()) {
        r.sessionId = j.at("session_id").get<std::string>();
    } else {
        r.sessionId.reset();
    }
}

void to_json(nlohmann::json& j, const Job& job) {
    j = nlohmann::json{
        {"id", job.id},
        {"title", job.spec.title},
        {"description", job.spec.description},
        {"mode", toString(job.spec.mode)},
        {"state", toString(job.state)},
        {"created_at", formatTime(job.createdAt)},
        {"started_at", job.startedAt ? nlohmann::json(formatTime(*job.startedAt)) : nlohmann::json()},
        {"completed_at", job.completedAt ? nlohmann::json(formatTime(*job.completedAt)) : nlohmann::json()},
        {"transitions", job.transitions},
        {"result", job.result ? nlohmann::json(*job.result) : nlohmann::json()},
        {"spec", job.spec},
    };
    if (job.restartedFrom) j["restarted_from"] = *job.restartedFrom;
    if (!job.spec.routineId.empty()) j["routine_id"] = job.spec.routineId;
}

void from_json(const nlohmann::json& j, Job& job) {
    job.id = j.at("id").get<std::string>();
    job.spec = j.at("spec").get<JobSpec>();
    job.state = stateFromJson(j.at("state"));
    job.createdAt = timeFromJson(j.at("created_at"));
    job.startedAt = optionalTime(j, "started_at");
    job.completedAt = optionalTime(j, "completed_at");
    job.transitions = j.at("transitions").get<std::vector<Transition>>();
    if (j.contains("result") && !j.at("result").is_null()) {
        job.result = j.at("result").get<JobOutcome>();
    } else {
        job.result.reset();
    }
    if (j.contains("restarted_from") && j.at("restarted_from").is_string()) {
        job.restartedFrom = j.at("restarted_from").get<std::string>();
    } else {
        job.restartedFrom.reset();
    }
}

void to_json(nlohmann::json& j, const JobSummary& s) {
    j = nlohmann::json{
        {"total", s.total},
        {"pending", s.pending},
        {"in_progress", s.inProgress},
        {"completed", s.completed},
        {"failed", s.failed},
        {"interrupted", s.interrupted},
        {"cancelled", s.cancelled},
        {"stuck", s.stuck},
    };
}

void to_json(nlohmann::json& j, const Event& e) {
    j = nlohmann::json{
        {"job_id", e.jobId},
        {"sequence", e.sequence},
        {"event_type", toString(e.type)},
        {"payload", e.payload},
        {"timestamp", formatTime(e.at)},
    };
}

void from_json(const nlohmann::json& j, Event& e) {
    e.jobId = j.at("job_id").get<std::string>();
    e.sequence = j.at("sequence").get<std::uint64_t>();
    auto type = parseEventType(j.at("event_type").get<std::string>());
    if (!type) {
        throw std::invalid_argument("unknown event type: " + j.at("event_type").get<std::string>());
    }
    e.type = *type;
    e.payload = j.value("payload", nlohmann::json::object());
    e.at = timeFromJson(j.at("timestamp"));
}

}
