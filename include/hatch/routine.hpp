/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "hatch/cron.hpp"
#include "hatch/job.hpp"
#include "hatch/orchestrator.hpp"
#include "hatch/store.hpp"

namespace hatch {

enum class TriggerType : std::uint8_t { Cron, Event, Webhook, Manual };
enum class ActionType : std::uint8_t { Lightweight, FullJob };
enum class RunStatus : std::uint8_t { Pending, Ok, Failed };
enum class RoutineStatus : std::uint8_t { Active, Disabled, Failing };

struct Trigger {
    TriggerType type = TriggerType::Manual;
    std::string schedule;  // cron
    std::string pattern;   // event (regex)
    std::string channel;   // event, optional scope
    std::string path;      // webhook
    std::string secret;    // webhook, optional
};

struct Action {
    ActionType type = ActionType::Lightweight;
    std::string prompt;  // lightweight
    JobSpec job;         // full_job
};

struct RoutineRun {
    std::string id;
    TriggerType trigger = TriggerType::Manual;
    TimePoint startedAt;
    std::optional<TimePoint> completedAt;
    RunStatus status = RunStatus::Pending;
    std::optional<JobId> jobId;
    std::string summary;
};

struct Routine {
    RoutineId id;
    std::string name;
    std::string description;
    bool enabled = true;
    Trigger trigger;
    Action action;
    int cooldownSecs = 0;
    int maxConcurrent = 0;  // 0 = unlimited
    std::uint64_t runCount = 0;
    int consecutiveFailures = 0;
    std::optional<TimePoint> lastRunAt;
    std::optional<TimePoint> nextFireAt;
    TimePoint createdAt;
    std::deque<RoutineRun> recentRuns;
};

struct RoutineSummary {
    std::size_t total = 0;
    std::size_t enabled = 0;
    std::size_t disabled = 0;
    std::size_t failing = 0;
    std::size_t runsToday = 0;
};

struct RoutineResult {
    bool ok = false;
    ErrorCode error = ErrorCode::None;
    std::string message;
    Routine routine;
    explicit operator bool() const noexcept { return ok; }
};

struct FireResult {
    bool fired = false;
    ErrorCode error = ErrorCode::None;
    std::string message;
    RoutineId routineId;
    std::string runId;
    std::optional<JobId> jobId;
    explicit operator bool() const noexcept { return fired; }
};

constexpr std::size_t kMaxRecentRuns = 50;

[[nodiscard]] const char* toString(TriggerType type) noexcept;
[[nodiscard]] const char* toString(ActionType type) noexcept;
[[nodiscard]] const char* toString(RunStatus status) noexcept;
[[nodiscard]] const char* toString(RoutineStatus status) noexcept;
[[nodiscard]] RoutineStatus statusOf(const Routine& routine) noexcept;

void to_json(nlohmann::json& j, const Trigger& t);
void from_json(const nlohmann::json& j, Trigger& t);
void to_json(nlohmann::json& j, const Action& a);
void from_json(const nlohmann::json& j, Action& a);
void to_json(nlohmann::json& j, const RoutineRun& r);
void from_json(const nlohmann::json& j, RoutineRun& r);
void to_json(nlohmann::json& j, const Routine& r);
void from_json(const nlohmann::json& j, Routine& r);
void to_json(nlohmann::json& j, const RoutineSummary& s);

// Turns triggers into jobs. A fire is skipped (not recorded) unless the routine
// is enabled, past its cooldown and under its concurrency cap.
class RoutineScheduler {
public:
    // `store` may be null for an in-memory scheduler.
    RoutineScheduler(JobLauncher& launcher, Store* store) noexcept;
    ~RoutineScheduler();

    RoutineScheduler(const RoutineScheduler&) = delete;
    RoutineScheduler& operator=(const RoutineScheduler&) = delete;

    std::size_t load(TimePoint now = Clock::now());

    [[nodiscard]] RoutineResult create(Routine draft, TimePoint now = Clock::now());
    [[nodiscard]] std::vector<Routine> list() const;
    [[nodiscard]] std::optional<Routine> get(const RoutineId& id) const;
    [[nodiscard]] RoutineResult toggle(const RoutineId& id, std::optional<bool> enabled, TimePoint now = Clock::now());
    [[nodiscard]] OpResult remove(const RoutineId& id);
    [[nodiscard]] std::optional<std::vector<RoutineRun>> runs(const RoutineId& id) const;
    [[nodiscard]] RoutineSummary summary(TimePoint now = Clock::now()) const;

    std::vector<FireResult> tick(TimePoint now = Clock::now());
    std::vector<FireResult> onEvent(const std::string& channel, const std::string& text, TimePoint now = Clock::now());
    [[nodiscard]] FireResult fireWebhook(const std::string& path, const std::string& secret, const std::string& body,
                                         TimePoint now = Clock::now());
    [[nodiscard]] FireResult trigger(const RoutineId& id, TimePoint now = Clock::now());

    // Resolves the run linked to a job that reached a terminal state.
    void onJobFinished(const Job& job, TimePoint now = Clock::now());
    // Finished jobs held for a launch call that has not returned yet.
    [[nodiscard]] std::size_t parkedOutcomes() const;

    [[nodiscard]] bool start(std::chrono::seconds interval = std::chrono::seconds(10));
    void stop() noexcept;

private:
    [[nodiscard]] OpResult validateDraft(const Routine& draft) const;
    [[nodiscard]] bool guardAllows(const Routine& routine, TimePoint now, std::string& why) const;
    [[nodiscard]] JobSpec jobSpecFor(const Routine& routine, const std::string& context) const;
    struct Reservation {
        RoutineId routineId;
        std::string runId;
        JobSpec spec;
    };

    // Records a pending run and stamps last_run_at; the launch happens unlocked.
    Reservation reserveLocked(Routine& routine, TriggerType via, const std::string& context, TimePoint now);
    FireResult complete(const Reservation& reservation, TimePoint now);
    std::optional<Job> takeEarlyOutcomeLocked(const RoutineId& routineId, const JobId& jobId);
    void resolveLocked(Routine& routine, RoutineRun& run, const Job& job, TimePoint now);
    void persistLocked(const Routine& routine);
    void loop(std::chrono::seconds interval);

    JobLauncher& launcher_;
    Store* store_;

    mutable std::mutex mutex_;
    std::map<RoutineId, Routine> routines_;
    std::map<RoutineId, CronExpr> crons_;
    std::map<RoutineId, std::regex> patterns_;
    std::map<JobId, std::pair<RoutineId, std::string>> pendingRuns_;
    // Jobs that finished before their launch call returned.
    std::map<JobId, Job> earlyOutcomes_;
    std::map<RoutineId, int> launching_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::thread thread_;
};

}
