/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "hatch/types.hpp"
#include "hatch/util.hpp"

namespace hatch {

// Grants the job's sandbox an upstream credential for one domain. Only the
// reference travels; the Egress Proxy resolves it at request time.
struct CredentialGrant {
    std::string domain;
    std::string credentialRef;
};

struct JobSpec {
    std::string title;
    std::string description;
    JobMode mode = JobMode::Worker;
    std::vector<std::string> allowedDomains;
    std::vector<std::string> tools;
    std::vector<CredentialGrant> credentials;
    int maxIterations = 10;
    int maxTurns = 20;
    std::string model;
    std::string routineId;
};

// The first entry of every history is the creation record (pending to
// pending); it marks where the history starts and is not a lifecycle edge.
struct Transition {
    JobState from = JobState::Pending;
    JobState to = JobState::Pending;
    TimePoint at;
    std::string reason;

    [[nodiscard]] static Transition creation(TimePoint at) {
        return {JobState::Pending, JobState::Pending, at, "created"};
    }
    [[nodiscard]] bool isCreation() const noexcept {
        return from == JobState::Pending && to == JobState::Pending;
    }
};

struct JobOutcome {
    bool success = false;
    std::string message;
    std::optional<std::string> sessionId;
};

struct Job {
    JobId id;
    JobSpec spec;
    JobState state = JobState::Pending;
    TimePoint createdAt;
    std::optional<TimePoint> startedAt;
    std::optional<TimePoint> completedAt;
    std::vector<Transition> transitions;
    std::optional<JobOutcome> result;
    std::optional<JobId> restartedFrom;
};

// One entry of a job's append-only progress stream.
struct Event {
    JobId jobId;
    std::uint64_t sequence = 0;
    EventType type = EventType::Message;
    nlohmann::json payload = nlohmann::json::object();
    TimePoint at;
};

struct JobFilter {
    std::optional<JobState> state;
    bool stuckOnly = false;
    std::optional<JobMode> mode;
    std::string routineId;
    std::string query;
    std::size_t limit = 100;
};

struct JobSummary {
    std::size_t total = 0;
    std::size_t pending = 0;
    std::size_t inProgress = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t interrupted = 0;
    std::size_t cancelled = 0;
    std::size_t stuck = 0;
};

struct CreateResult {
    bool ok = false;
    JobId id;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// One creation record, then legal edges each starting where the previous
// one ended, finishing in the job's current state.
[[nodiscard]] bool hasValidHistory(const Job& job) noexcept;

void to_json(nlohmann::json& j, const CredentialGrant& g);
void from_json(const nlohmann::json& j, CredentialGrant& g);
void to_json(nlohmann::json& j, const JobSpec& spec);
void from_json(const nlohmann::json& j, JobSpec& spec);
void to_json(nlohmann::json& j, const Transition& t);
void from_json(const nlohmann::json& j, Transition& t);
void to_json(nlohmann::json& j, const JobOutcome& r);
void from_json(const nlohmann::json& j, JobOutcome& r);
void to_json(nlohmann::json& j, const Job& job);
void from_json(const nlohmann::json& j, Job& job);
void to_json(nlohmann::json& j, const JobSummary& s);
void to_json(nlohmann::json& j, const Event& e);
void from_json(const nlohmann::json& j, Event& e);

}
