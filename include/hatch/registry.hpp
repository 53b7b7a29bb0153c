/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "hatch/job.hpp"
#include "hatch/store.hpp"

namespace hatch {

// Called once per job, after the transition into a terminal state is durable.
using TerminalListener = std::function<void(const Job&)>;

// Single writer of job state. Every mutation goes through transition(), which
// accepts only the legal edges of the lifecycle and persists before returning.
class JobRegistry {
public:
    JobRegistry(Store& store, std::chrono::seconds stuckAfter) noexcept;

    JobRegistry(const JobRegistry&) = delete;
    JobRegistry& operator=(const JobRegistry&) = delete;

    // Loads persisted jobs into memory. Returns the number loaded.
    std::size_t load() noexcept;

    [[nodiscard]] CreateResult insert(const JobSpec& spec, const std::optional<JobId>& restartedFrom,
                                      TimePoint now = Clock::now()) noexcept;

    // Appends {from, to, now, reason} iff the edge is legal. Terminal
    // transitions record `outcome` (or one derived from the reason).
    [[nodiscard]] OpResult transition(const JobId& id, JobState to, const std::string& reason,
                                      std::optional<JobOutcome> outcome = std::nullopt,
                                      TimePoint now = Clock::now()) noexcept;

    [[nodiscard]] std::optional<Job> get(const JobId& id) const;
    [[nodiscard]] std::vector<Job> list(const JobFilter& filter, TimePoint now = Clock::now()) const;
    [[nodiscard]] JobSummary summary(TimePoint now = Clock::now()) const;
    [[nodiscard]] std::vector<JobId> liveJobs() const;

    // Activity drives both the stuck label and the supervisor's heartbeat check.
    void touch(const JobId& id, TimePoint now = Clock::now());
    [[nodiscard]] std::optional<TimePoint> lastActivity(const JobId& id) const;
    [[nodiscard]] bool isStuck(const Job& job, TimePoint now) const;

    // Moves every pending/in_progress job to interrupted. Returns how many moved.
    std::size_t interruptLive(const std::string& reason, TimePoint now = Clock::now()) noexcept;

    void addTerminalListener(TerminalListener listener);

    [[nodiscard]] std::chrono::seconds stuckAfter() const noexcept { return stuckAfter_; }

private:
    [[nodiscard]] bool isStuckLocked(const Job& job, TimePoint now) const;
    [[nodiscard]] bool matches(const Job& job, const JobFilter& filter, TimePoint now) const;
    void notifyTerminal(const Job& job) noexcept;

    Store& store_;
    std::chrono::seconds stuckAfter_;

    mutable std::mutex mutex_;
    std::map<JobId, Job> jobs_;
    std::map<JobId, TimePoint> activity_;

    std::mutex listenerMutex_;
    std::vector<TerminalListener> listeners_;
};

}
