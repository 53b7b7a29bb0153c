/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hatch/registry.hpp"
#include "hatch/logger.hpp"
#include <algorithm>

namespace hatch {

namespace {
bool containsInsensitive(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return true;
    return toLowerCopy(haystack).find(toLowerCopy(needle)) != std::string::npos;
}
}

JobRegistry::JobRegistry(Store& store, std::chrono::seconds stuckAfter) noexcept
    : store_(store), stuckAfter_(stuckAfter) {}

std::size_t JobRegistry::load() noexcept {
    auto jobs = store_.loadJobs();
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& job : jobs) {
        if (!hasValidHistory(job)) {
            LOG_JOB(WARN, job.id, "recorded transitions do not follow the lifecycle");
        }
        JobId id = job.id;
        jobs_[id] = std::move(job);
    }
    LOG_INFO("Loaded " + std::to_string(jobs_.size()) + " jobs from workspace");
    return jobs_.size();
}

CreateResult JobRegistry::insert(const JobSpec& spec, const std::optional<JobId>& restartedFrom,
                                 TimePoint now) noexcept {
    try {
        Job job;
        job.id = generateId();
        job.spec = spec;
        job.state = JobState::Pending;
        job.createdAt = now;
        job.restartedFrom = restartedFrom;
        job.transitions.push_back(Transition::creation(now));

        if (!store_.saveJob(job)) {
            return {false, "", ErrorCode::Internal, "Failed to persist job"};
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            activity_[job.id] = now;
            jobs_[job.id] = job;
        }
        LOG_JOB(INFO, job.id, "created (" + std::string(toString(spec.mode)) + ")");
        return {true, job.id, ErrorCode::None, ""};
    } catch (const std::exception& e) {
        LOG_ERROR("Job insert failed: " + std::string(e.what()));
        return {false, "", ErrorCode::Internal, e.what()};
    }
}

OpResult JobRegistry::transition(const JobId& id, JobState to, const std::string& reason,
                                 std::optional<JobOutcome> outcome, TimePoint now) noexcept {
    Job snapshot;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            return OpResult::failure(ErrorCode::NotFound, "job not found: " + id);
        }

        Job updated = it->second;
        if (!isLegalTransition(updated.state, to)) {
            return OpResult::failure(ErrorCode::Conflict,
                std::string("illegal transition ") + toString(updated.state) + " -> " + toString(to));
        }

        updated.transitions.push_back({updated.state, to, now, reason});
        updated.state = to;
        if (to == JobState::InProgress) {
            updated.startedAt = now;
            activity_[id] = now;
        }
        if (isTerminal(to)) {
            updated.completedAt = now;
            if (!outcome) {
                outcome = JobOutcome{to == JobState::Completed, reason, std::nullopt};
            }
            updated.result = std::move(outcome);
        }

        if (!store_.saveJob(updated)) {
            return OpResult::failure(ErrorCode::Internal, "failed to persist transition");
        }
        it->second = updated;
        snapshot = std::move(updated);
    } catch (const std::exception& e) {
        LOG_ERROR("Transition failed for " + id + ": " + e.what());
        return OpResult::failure(ErrorCode::Internal, e.what());
    }

    LOG_JOB(INFO, id, std::string(toString(snapshot.transitions.back().from)) + " -> " +
                      toString(to) + " (" + reason + ")");

    if (isTerminal(to)) {
        notifyTerminal(snapshot);
    }
    return OpResult::success();
}

std::optional<Job> JobRegistry::get(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool JobRegistry::matches(const Job& job, const JobFilter& filter, TimePoint now) const {
    if (filter.stuckOnly && !isStuckLocked(job, now)) return false;
    if (filter.state && job.state != *filter.state) return false;
    if (filter.mode && job.spec.mode != *filter.mode) return false;
    if (!filter.routineId.empty() && job.spec.routineId != filter.routineId) return false;
    if (!filter.query.empty() &&
        !containsInsensitive(job.spec.title, filter.query) &&
        !containsInsensitive(job.spec.description, filter.query)) {
        return false;
    }
    return true;
}

std::vector<Job> JobRegistry::list(const JobFilter& filter, TimePoint now) const {
    std::vector<Job> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, job] : jobs_) {
            if (matches(job, filter, now)) {
                result.push_back(job);
            }
        }
    }

    // Newest first; ids embed creation micros so they break ties.
    std::sort(result.begin(), result.end(), [](const Job& a, const Job& b) {
        if (a.createdAt != b.createdAt) return a.createdAt > b.createdAt;
        return a.id > b.id;
    });
    if (filter.limit > 0 && result.size() > filter.limit) {
        result.resize(filter.limit);
    }
    return result;
}

JobSummary JobRegistry::summary(TimePoint now) const {
    JobSummary s;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, job] : jobs_) {
        ++s.total;
        switch (job.state) {
            case JobState::Pending: ++s.pending; break;
            case JobState::InProgress: ++s.inProgress; break;
            case JobState::Completed: ++s.completed; break;
            case JobState::Failed: ++s.failed; break;
            case JobState::Interrupted: ++s.interrupted; break;
            case JobState::Cancelled: ++s.cancelled; break;
        }
        if (isStuckLocked(job, now)) {
            ++s.stuck;
        }
    }
    return s;
}

std::vector<JobId> JobRegistry::liveJobs() const {
    std::vector<JobId> ids;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, job] : jobs_) {
        if (!isTerminal(job.state)) {
            ids.push_back(id);
        }
    }
    return ids;
}

void JobRegistry::touch(const JobId& id, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (jobs_.count(id) == 0) return;
    auto& last = activity_[id];
    if (now > last) {
        last = now;
    }
}

std::optional<TimePoint> JobRegistry::lastActivity(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = activity_.find(id);
    if (it != activity_.end()) {
        return it->second;
    }
    auto job = jobs_.find(id);
    if (job != jobs_.end() && job->second.startedAt) {
        return job->second.startedAt;
    }
    return std::nullopt;
}

bool JobRegistry::isStuck(const Job& job, TimePoint now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return isStuckLocked(job, now);
}

bool JobRegistry::isStuckLocked(const Job& job, TimePoint now) const {
    if (job.state != JobState::InProgress) {
        return false;
    }
    TimePoint last = job.startedAt.value_or(job.createdAt);
    auto it = activity_.find(job.id);
    if (it != activity_.end() && it->second > last) {
        last = it->second;
    }
    return now - last > stuckAfter_;
}

std::size_t JobRegistry::interruptLive(const std::string& reason, TimePoint now) noexcept {
    std::size_t moved = 0;
    for (const auto& id : liveJobs()) {
        auto job = get(id);
        if (!job) continue;
        // Pending has no interrupted edge; a job that never started fails instead.
        JobState to = job->state == JobState::Pending ? JobState::Failed : JobState::Interrupted;
        auto result = transition(id, to, reason, JobOutcome{false, reason, std::nullopt}, now);
        if (result) {
            ++moved;
        } else {
            LOG_WARN("Could not interrupt " + id + ": " + result.message);
        }
    }
    if (moved > 0) {
        LOG_INFO("Moved " + std::to_string(moved) + " live jobs out of flight (" + reason + ")");
    }
    return moved;
}

void JobRegistry::addTerminalListener(TerminalListener listener) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listeners_.push_back(std::move(listener));
}

void JobRegistry::notifyTerminal(const Job& job) noexcept {
    std::vector<TerminalListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        try {
            listener(job);
        } catch (const std::exception& e) {
            LOG_ERROR("Terminal listener failed for " + job.id + ": " + e.what());
        }
    }
}

}
