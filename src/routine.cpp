/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hatch/routine.hpp"
#include "hatch/auth.hpp"
#include "hatch/logger.hpp"
#include "hatch/util.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace hatch {

namespace {
std::optional<TriggerType> parseTriggerType(const std::string& value) {
    if (value == "cron" || value == "schedule") return TriggerType::Cron;
    if (value == "event") return TriggerType::Event;
    if (value == "webhook") return TriggerType::Webhook;
    if (value == "manual") return TriggerType::Manual;
    return std::nullopt;
}

std::optional<RunStatus> parseRunStatus(const std::string& value) {
    if (value == "pending") return RunStatus::Pending;
    if (value == "ok") return RunStatus::Ok;
    if (value == "failed") return RunStatus::Failed;
    return std::nullopt;
}

nlohmann::json optionalTime(const std::optional<TimePoint>& tp) {
    return tp ? nlohmann::json(formatTime(*tp)) : nlohmann::json();
}

std::optional<TimePoint> readTime(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_string()) return std::nullopt;
    return parseTime(j.at(key).get<std::string>());
}

std::string normalizePath(const std::string& path) {
    std::string p = trim(path);
    while (!p.empty() && p.front() == '/') p.erase(p.begin());
    while (!p.empty() && p.back() == '/') p.pop_back();
    return p;
}

bool validWebhookPath(const std::string& path) {
    return !path.empty() && std::all_of(path.begin(), path.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_' || c == '/' || c == '.';
    });
}

bool sameUtcDay(TimePoint a, TimePoint b) {
    return toUnixSeconds(a) / 86400 == toUnixSeconds(b) / 86400;
}

std::size_t pendingCount(const Routine& routine) {
    return static_cast<std::size_t>(std::count_if(routine.recentRuns.begin(), routine.recentRuns.end(),
        [](const RoutineRun& run) { return run.status == RunStatus::Pending; }));
}
}

const char* toString(TriggerType type) noexcept {
    switch (type) {
        case TriggerType::Cron: return "cron";
        case TriggerType::Event: return "event";
        case TriggerType::Webhook: return "webhook";
        case TriggerType::Manual: return "manual";
        default: return "unknown";
    }
}

const char* toString(ActionType type) noexcept {
    switch (type) {
        case ActionType::Lightweight: return "lightweight";
        case ActionType::FullJob: return "full_job";
        default: return "unknown";
    }
}

const char* toString(RunStatus status) noexcept {
    switch (status) {
        case RunStatus::Pending: return "pending";
        case RunStatus::Ok: return "ok";
        case RunStatus::Failed: return "failed";
        default: return "unknown";
    }
}

const char* toString(RoutineStatus status) noexcept {
    switch (status) {
        case RoutineStatus::Active: return "active";
        case RoutineStatus::Disabled: return "disabled";
        case RoutineStatus::Failing: return "failing";
        default: return "unknown";
    }
}

RoutineStatus statusOf(const Routine& routine) noexcept {
    if (!routine.enabled) return RoutineStatus::Disabled;
    if (routine.consecutiveFailures > 0) return RoutineStatus::Failing;
    return RoutineStatus::Active;
}

void to_json(nlohmann::json& j, const Trigger& t) {
    j = nlohmann::json{{"type", toString(t.type)}};
    switch (t.type) {
        case TriggerType::Cron:
            j["schedule"] = t.schedule;
            break;
        case TriggerType::Event:
            j["pattern"] = t.pattern;
            if (!t.channel.empty()) j["channel"] = t.channel;
            break;
        case TriggerType::Webhook:
            j["path"] = t.path;
            if (!t.secret.empty()) j["secret"] = t.secret;
            break;
        case TriggerType::Manual:
            break;
    }
}

void from_json(const nlohmann::json& j, Trigger& t) {
    auto type = parseTriggerType(j.value("type", std::string{}));
    if (!type) {
        throw std::invalid_argument("unknown trigger type: " + j.value("type", std::string{}));
    }
    t.type = *type;
    t.schedule = j.value("schedule", std::string{});
    t.pattern = j.value("pattern", std::string{});
    t.channel = j.value("channel", std::string{});
    t.path = j.value("path", std::string{});
    t.secret = j.value("secret", std::string{});
}

void to_json(nlohmann::json& j, const Action& a) {
    if (a.type == ActionType::Lightweight) {
        j = nlohmann::json{{"type", toString(a.type)}, {"prompt", a.prompt}};
        return;
    }
    j = nlohmann::json{
        {"type", toString(a.type)},
        {"title", a.job.title},
        {"description", a.job.description},
        {"mode", toString(a.job.mode)},
        {"allowed_domains", a.job.allowedDomains},
        {"tools", a.job.tools},
        {"credentials", a.job.credentials},
        {"max_iterations", a.job.maxIterations},
        {"max_turns", a.job.maxTurns},
    };
    if (!a.job.model.empty()) j["model"] = a.job.model;
}

void from_json(const nlohmann::json& j, Action& a) {
    std::string type = j.value("type", std::string{"lightweight"});
    if (type == "lightweight") {
        a.type = ActionType::Lightweight;
        a.prompt = j.value("prompt", std::string{});
    } else if (type == "full_job") {
        a.type = ActionType::FullJob;
        a.job = j.get<JobSpec>();
        a.job.routineId.clear();
    } else {
        throw std::invalid_argument("unknown action type: " + type);
    }
}

void to_json(nlohmann::json& j, const RoutineRun& r) {
    j = nlohmann::json{
        {"id", r.id},
        {"trigger_type", toString(r.trigger)},
        {"started_at", formatTime(r.startedAt)},
        {"completed_at", optionalTime(r.completedAt)},
        {"status", toString(r.status)},
        {"job_id", r.jobId ? nlohmann::json(*r.jobId) : nlohmann::json()},
        {"summary", r.summary},
    };
}

void from_json(const nlohmann::json& j, RoutineRun& r) {
    r.id = j.at("id").get<std::string>();
    r.trigger = parseTriggerType(j.value("trigger_type", std::string{"manual"})).value_or(TriggerType::Manual);
    r.startedAt = readTime(j, "started_at").value_or(TimePoint{});
    r.completedAt = readTime(j, "completed_at");
    r.status = parseRunStatus(j.value("status", std::string{"pending"})).value_or(RunStatus::Pending);
    if (j.contains("job_id") && j.at("job_id").is_string()) {
        r.jobId = j.at("job_id").get<std::string>();
    }
    r.summary = j.value("summary", std::string{});
}

void to_json(nlohmann::json& j, const Routine& r) {
    j = nlohmann::json{
        {"id", r.id},
        {"name", r.name},
        {"description", r.description},
        {"enabled", r.enabled},
        {"status", toString(statusOf(r))},
        {"trigger", r.trigger},
        {"action", r.action},
        {"cooldown_secs", r.cooldownSecs},
        {"max_concurrent", r.maxConcurrent},
        {"run_count", r.runCount},
        {"consecutive_failures", r.consecutiveFailures},
        {"last_run_at", optionalTime(r.lastRunAt)},
        {"next_fire_at", optionalTime(r.nextFireAt)},
        {"created_at", formatTime(r.createdAt)},
        {"recent_runs", r.recentRuns},
    };
}

void from_json(const nlohmann::json& j, Routine& r) {
    r.id = j.value("id", std::string{});
    r.name = j.value("name", std::string{});
    r.description = j.value("description", std::string{});
    r.enabled = j.value("enabled", true);
    r.trigger = j.at("trigger").get<Trigger>();
    r.action = j.at("action").get<Action>();
    r.cooldownSecs = j.value("cooldown_secs", 0);
    r.maxConcurrent = j.value("max_concurrent", 0);
    r.runCount = j.value("run_count", std::uint64_t{0});
    r.consecutiveFailures = j.value("consecutive_failures", 0);
    r.lastRunAt = readTime(j, "last_run_at");
    r.nextFireAt = readTime(j, "next_fire_at");
    r.createdAt = readTime(j, "created_at").value_or(Clock::now());
    r.recentRuns.clear();
    if (j.contains("recent_runs") && j.at("recent_runs").is_array()) {
        for (const auto& run : j.at("recent_runs")) {
            r.recentRuns.push_back(run.get<RoutineRun>());
        }
    }
}

void to_json(nlohmann::json& j, const RoutineSummary& s) {
    j = nlohmann::json{
        {"total", s.total},
        {"enabled", s.enabled},
        {"disabled", s.disabled},
        {"failing", s.failing},
        {"runs_today", s.runsToday},
    };
}

RoutineScheduler::RoutineScheduler(JobLauncher& launcher, Store* store) noexcept
    : launcher_(launcher), store_(store) {}

RoutineScheduler::~RoutineScheduler() {
    stop();
}

std::size_t RoutineScheduler::load(TimePoint now) {
    if (!store_) return 0;
    std::size_t loaded = 0;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& j : store_->loadRoutines()) {
        Routine routine;
        try {
            routine = j.get<Routine>();
        } catch (const std::exception& e) {
            LOG_WARN("Skipping unreadable routine: " + std::string(e.what()));
            continue;
        }
        if (routine.id.empty()) continue;

        if (routine.trigger.type == TriggerType::Cron) {
            auto cron = CronExpr::parse(routine.trigger.schedule);
            if (!cron) {
                LOG_WARN("Routine " + routine.id + " has a bad schedule, skipping");
                continue;
            }
            if (!routine.nextFireAt) routine.nextFireAt = cron->next(now);
            crons_.emplace(routine.id, *cron);
        } else if (routine.trigger.type == TriggerType::Event) {
            try {
                patterns_.emplace(routine.id, std::regex(routine.trigger.pattern));
            } catch (const std::regex_error&) {
                LOG_WARN("Routine " + routine.id + " has a bad pattern, skipping");
                continue;
            }
        }

        // Runs left pending by a previous process will never resolve.
        bool changed = false;
        for (auto& run : routine.recentRuns) {
            if (run.status != RunStatus::Pending) continue;
            run.status = RunStatus::Failed;
            run.completedAt = now;
            run.summary = "orchestrator restarted before the job resolved";
            ++routine.consecutiveFailures;
            changed = true;
        }
        routines_[routine.id] = routine;
        if (changed) persistLocked(routine);
        ++loaded;
    }
    LOG_INFO("Loaded " + std::to_string(loaded) + " routines");
    return loaded;
}

OpResult RoutineScheduler::validateDraft(const Routine& draft) const {
    if (trim(draft.name).empty()) {
        return OpResult::failure(ErrorCode::Validation, "name is required");
    }
    if (draft.cooldownSecs < 0) {
        return OpResult::failure(ErrorCode::Validation, "cooldown_secs must be >= 0");
    }
    if (draft.maxConcurrent < 0) {
        return OpResult::failure(ErrorCode::Validation, "max_concurrent must be >= 0");
    }

    switch (draft.trigger.type) {
        case TriggerType::Cron: {
            std::string error;
            if (!CronExpr::parse(draft.trigger.schedule, &error)) {
                return OpResult::failure(ErrorCode::Validation, "invalid cron schedule: " + error);
            }
            break;
        }
        case TriggerType::Event:
            if (draft.trigger.pattern.empty()) {
                return OpResult::failure(ErrorCode::Validation, "event trigger needs a pattern");
            }
            try {
                std::regex check(draft.trigger.pattern);
            } catch (const std::regex_error& e) {
                return OpResult::failure(ErrorCode::Validation, std::string("invalid pattern: ") + e.what());
            }
            break;
        case TriggerType::Webhook: {
            std::string path = normalizePath(draft.trigger.path);
            if (!validWebhookPath(path)) {
                return OpResult::failure(ErrorCode::Validation, "webhook trigger needs a path of [A-Za-z0-9._/-]");
            }
            for (const auto& [id, r] : routines_) {
                if (r.trigger.type == TriggerType::Webhook && normalizePath(r.trigger.path) == path) {
                    return OpResult::failure(ErrorCode::Conflict, "webhook path already in use: " + path);
                }
            }
            break;
        }
        case TriggerType::Manual:
            break;
    }

    if (draft.action.type == ActionType::Lightweight) {
        if (trim(draft.action.prompt).empty()) {
            return OpResult::failure(ErrorCode::Validation, "lightweight action needs a prompt");
        }
    } else if (trim(draft.action.job.description).empty()) {
        return OpResult::failure(ErrorCode::Validation, "full_job action needs a description");
    }
    return OpResult::success();
}

RoutineResult RoutineScheduler::create(Routine draft, TimePoint now) {
    RoutineResult result;
    std::lock_guard<std::mutex> lock(mutex_);
    auto valid = validateDraft(draft);
    if (!valid) {
        result.error = valid.error;
        result.message = valid.message;
        return result;
    }

    draft.id = generateId();
    draft.createdAt = now;
    draft.runCount = 0;
    draft.consecutiveFailures = 0;
    draft.lastRunAt.reset();
    draft.nextFireAt.reset();
    draft.recentRuns.clear();
    if (draft.trigger.type == TriggerType::Webhook) {
        draft.trigger.path = normalizePath(draft.trigger.path);
    }

    if (draft.trigger.type == TriggerType::Cron) {
        auto cron = CronExpr::parse(draft.trigger.schedule);
        draft.nextFireAt = cron->next(now);
        crons_.emplace(draft.id, *cron);
    } else if (draft.trigger.type == TriggerType::Event) {
        patterns_.emplace(draft.id, std::regex(draft.trigger.pattern));
    }

    routines_[draft.id] = draft;
    persistLocked(draft);
    LOG_INFO("Routine created: " + draft.name + " (" + draft.id + ", " + toString(draft.trigger.type) + ")");

    result.ok = true;
    result.routine = draft;
    return result;
}

std::vector<Routine> RoutineScheduler::list() const {
    std::vector<Routine> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, routine] : routines_) out.push_back(routine);
    std::sort(out.begin(), out.end(), [](const Routine& a, const Routine& b) {
        return a.createdAt > b.createdAt;
    });
    return out;
}

std::optional<Routine> RoutineScheduler::get(const RoutineId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = routines_.find(id);
    if (it == routines_.end()) return std::nullopt;
    return it->second;
}

RoutineResult RoutineScheduler::toggle(const RoutineId& id, std::optional<bool> enabled, TimePoint now) {
    RoutineResult result;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = routines_.find(id);
    if (it == routines_.end()) {
        result.error = ErrorCode::NotFound;
        result.message = "routine not found: " + id;
        return result;
    }
    Routine& routine = it->second;
    routine.enabled = enabled.value_or(!routine.enabled);
    if (routine.enabled && routine.trigger.type == TriggerType::Cron) {
        auto cron = crons_.find(id);
        if (cron != crons_.end()) routine.nextFireAt = cron->second.next(now);
    }
    persistLocked(routine);
    LOG_INFO("Routine " + routine.name + (routine.enabled ? " enabled" : " disabled"));
    result.ok = true;
    result.routine = routine;
    return result;
}

OpResult RoutineScheduler::remove(const RoutineId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (routines_.erase(id) == 0) {
        return OpResult::failure(ErrorCode::NotFound, "routine not found: " + id);
    }
    crons_.erase(id);
    patterns_.erase(id);
    for (auto it = pendingRuns_.begin(); it != pendingRuns_.end();) {
        it = it->second.first == id ? pendingRuns_.erase(it) : std::next(it);
    }
    if (store_ && !store_->deleteRoutine(id)) {
        return OpResult::failure(ErrorCode::Internal, "failed to delete routine file");
    }
    LOG_INFO("Routine deleted: " + id);
    return OpResult::success();
}

std::optional<std::vector<RoutineRun>> RoutineScheduler::runs(const RoutineId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = routines_.find(id);
    if (it == routines_.end()) return std::nullopt;
    return std::vector<RoutineRun>(it->second.recentRuns.begin(), it->second.recentRuns.end());
}

RoutineSummary RoutineScheduler::summary(TimePoint now) const {
    RoutineSummary s;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, routine] : routines_) {
        ++s.total;
        switch (statusOf(routine)) {
            case RoutineStatus::Disabled: ++s.disabled; break;
            case RoutineStatus::Failing: ++s.failing; ++s.enabled; break;
            case RoutineStatus::Active: ++s.enabled; break;
        }
        for (const auto& run : routine.recentRuns) {
            if (sameUtcDay(run.startedAt, now)) ++s.runsToday;
        }
    }
    return s;
}

bool RoutineScheduler::guardAllows(const Routine& routine, TimePoint now, std::string& why) const {
    if (!routine.enabled) {
        why = "routine is disabled";
        return false;
    }
    if (routine.lastRunAt && now < *routine.lastRunAt + std::chrono::seconds(routine.cooldownSecs)) {
        why = "cooldown active";
        return false;
    }
    if (routine.maxConcurrent > 0 && pendingCount(routine) >= static_cast<std::size_t>(routine.maxConcurrent)) {
        why = "max_concurrent reached";
        return false;
    }
    return true;
}

JobSpec RoutineScheduler::jobSpecFor(const Routine& routine, const std::string& context) const {
    JobSpec spec;
    if (routine.action.type == ActionType::Lightweight) {
        spec.title = "Routine: " + routine.name;
        spec.description = routine.action.prompt;
        spec.mode = JobMode::Worker;
        spec.maxIterations = 3;
    } else {
        spec = routine.action.job;
        if (trim(spec.title).empty()) spec.title = "Routine: " + routine.name;
    }
    if (!context.empty()) {
        spec.description += "\n\nTrigger context:\n" + context;
    }
    spec.routineId = routine.id;
    return spec;
}

RoutineScheduler::Reservation RoutineScheduler::reserveLocked(Routine& routine, TriggerType via,
                                                              const std::string& context, TimePoint now) {
    RoutineRun run;
    run.id = generateId();
    run.trigger = via;
    run.startedAt = now;
    run.status = RunStatus::Pending;

    routine.recentRuns.push_front(run);
    while (routine.recentRuns.size() > kMaxRecentRuns) {
        routine.recentRuns.pop_back();
    }
    routine.lastRunAt = now;
    ++routine.runCount;
    ++launching_[routine.id];

    LOG_DEBUG("Routine " + routine.name + " fired via " + toString(via));
    return {routine.id, run.id, jobSpecFor(routine, context)};
}

FireResult RoutineScheduler::complete(const Reservation& reservation, TimePoint now) {
    CreateResult launched = launcher_.launch(reservation.spec);

    FireResult result;
    result.routineId = reservation.routineId;
    result.runId = reservation.runId;

    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<Job> early = takeEarlyOutcomeLocked(reservation.routineId, launched.id);
    auto it = routines_.find(reservation.routineId);
    if (it == routines_.end()) {
        result.error = ErrorCode::NotFound;
        result.message = "routine deleted during launch";
        return result;
    }
    Routine& routine = it->second;
    auto run = std::find_if(routine.recentRuns.begin(), routine.recentRuns.end(),
                            [&](const RoutineRun& r) { return r.id == reservation.runId; });

    if (!launched) {
        ++routine.consecutiveFailures;
        if (run != routine.recentRuns.end()) {
            run->status = RunStatus::Failed;
            run->completedAt = now;
            run->jobId = launched.id.empty() ? std::nullopt : std::optional<JobId>(launched.id);
            run->summary = "launch failed: " + launched.message;
        }
        persistLocked(routine);
        LOG_WARN("Routine " + routine.name + " launch failed: " + launched.message);
        result.error = launched.error;
        result.message = launched.message;
        return result;
    }

    result.fired = true;
    result.jobId = launched.id;
    if (run != routine.recentRuns.end()) {
        run->jobId = launched.id;
        if (early) {
            resolveLocked(routine, *run, *early, now);
        } else {
            pendingRuns_[launched.id] = {routine.id, run->id};
        }
    }
    persistLocked(routine);
    LOG_INFO("Routine " + routine.name + " launched job " + launched.id);
    return result;
}

std::optional<Job> RoutineScheduler::takeEarlyOutcomeLocked(const RoutineId& routineId, const JobId& jobId) {
    std::optional<Job> early;
    auto found = earlyOutcomes_.find(jobId);
    if (found != earlyOutcomes_.end()) {
        early = std::move(found->second);
        earlyOutcomes_.erase(found);
    }

    auto inFlight = launching_.find(routineId);
    if (inFlight != launching_.end() && --inFlight->second <= 0) {
        launching_.erase(inFlight);
        // No launch of this routine can claim what is left.
        for (auto it = earlyOutcomes_.begin(); it != earlyOutcomes_.end();) {
            if (it->second.spec.routineId == routineId) {
                it = earlyOutcomes_.erase(it);
            } else {
                ++it;
            }
        }
    }
    return early;
}

void RoutineScheduler::resolveLocked(Routine& routine, RoutineRun& run, const Job& job, TimePoint now) {
    bool success = job.state == JobState::Completed;
    run.status = success ? RunStatus::Ok : RunStatus::Failed;
    run.completedAt = job.completedAt.value_or(now);
    run.summary = job.result ? job.result->message : std::string(toString(job.state));
    if (success) {
        routine.consecutiveFailures = 0;
    } else {
        ++routine.consecutiveFailures;
    }
}

std::vector<FireResult> RoutineScheduler::tick(TimePoint now) {
    std::vector<Reservation> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, routine] : routines_) {
            if (routine.trigger.type != TriggerType::Cron || !routine.enabled) continue;
            if (!routine.nextFireAt || now < *routine.nextFireAt) continue;

            auto cron = crons_.find(id);
            routine.nextFireAt = cron != crons_.end() ? cron->second.next(now) : std::nullopt;

            std::string why;
            if (guardAllows(routine, now, why)) {
                due.push_back(reserveLocked(routine, TriggerType::Cron, "", now));
            } else {
                LOG_DEBUG("Routine " + routine.name + " skipped: " + why);
            }
            persistLocked(routine);
        }
    }

    std::vector<FireResult> fired;
    for (const auto& reservation : due) {
        fired.push_back(complete(reservation, now));
    }
    return fired;
}

std::vector<FireResult> RoutineScheduler::onEvent(const std::string& channel, const std::string& text, TimePoint now) {
    std::vector<Reservation> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, routine] : routines_) {
            if (routine.trigger.type != TriggerType::Event || !routine.enabled) continue;
            if (!routine.trigger.channel.empty() && routine.trigger.channel != channel) continue;
            auto pattern = patterns_.find(id);
            if (pattern == patterns_.end() || !std::regex_search(text, pattern->second)) continue;

            std::string why;
            if (!guardAllows(routine, now, why)) {
                LOG_DEBUG("Routine " + routine.name + " skipped: " + why);
                continue;
            }
            std::string context = channel.empty() ? text : "[" + channel + "] " + text;
            due.push_back(reserveLocked(routine, TriggerType::Event, context, now));
        }
    }

    std::vector<FireResult> fired;
    for (const auto& reservation : due) {
        fired.push_back(complete(reservation, now));
    }
    return fired;
}

FireResult RoutineScheduler::fireWebhook(const std::string& path, const std::string& secret,
                                         const std::string& body, TimePoint now) {
    FireResult result;
    Reservation reservation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string wanted = normalizePath(path);
        auto it = std::find_if(routines_.begin(), routines_.end(), [&](const auto& entry) {
            return entry.second.trigger.type == TriggerType::Webhook && entry.second.trigger.path == wanted;
        });
        if (it == routines_.end()) {
            result.error = ErrorCode::NotFound;
            result.message = "no webhook routine at /" + wanted;
            return result;
        }
        Routine& routine = it->second;
        result.routineId = routine.id;
        if (!routine.trigger.secret.empty() && !secureEquals(routine.trigger.secret, secret)) {
            result.error = ErrorCode::Unauthorized;
            result.message = "webhook secret mismatch";
            return result;
        }
        std::string why;
        if (!guardAllows(routine, now, why)) {
            result.error = ErrorCode::Conflict;
            result.message = why;
            return result;
        }
        reservation = reserveLocked(routine, TriggerType::Webhook, body, now);
        persistLocked(routine);
    }
    return complete(reservation, now);
}

FireResult RoutineScheduler::trigger(const RoutineId& id, TimePoint now) {
    FireResult result;
    result.routineId = id;
    Reservation reservation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = routines_.find(id);
        if (it == routines_.end()) {
            result.error = ErrorCode::NotFound;
            result.message = "routine not found: " + id;
            return result;
        }
        std::string why;
        if (!guardAllows(it->second, now, why)) {
            result.error = ErrorCode::Conflict;
            result.message = why;
            return result;
        }
        reservation = reserveLocked(it->second, TriggerType::Manual, "", now);
        persistLocked(it->second);
    }
    return complete(reservation, now);
}

void RoutineScheduler::onJobFinished(const Job& job, TimePoint now) {
    if (job.spec.routineId.empty()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    auto pending = pendingRuns_.find(job.id);
    if (pending == pendingRuns_.end()) {
        // Only a launch call still in flight can claim this job later.
        if (launching_.count(job.spec.routineId) > 0) {
            earlyOutcomes_[job.id] = job;
        }
        return;
    }
    auto [routineId, runId] = pending->second;
    pendingRuns_.erase(pending);

    auto it = routines_.find(routineId);
    if (it == routines_.end()) return;
    Routine& routine = it->second;
    auto run = std::find_if(routine.recentRuns.begin(), routine.recentRuns.end(),
                            [&](const RoutineRun& r) { return r.id == runId; });
    if (run == routine.recentRuns.end()) return;

    resolveLocked(routine, *run, job, now);
    persistLocked(routine);
    LOG_INFO("Routine " + routine.name + " run " + toString(run->status) + " (job " + job.id + ")");
}

std::size_t RoutineScheduler::parkedOutcomes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return earlyOutcomes_.size();
}

void RoutineScheduler::persistLocked(const Routine& routine) {
    if (store_ && !store_->saveRoutine(routine.id, nlohmann::json(routine))) {
        LOG_ERROR("Failed to persist routine " + routine.id);
    }
}

bool RoutineScheduler::start(std::chrono::seconds interval) {
    if (running_.load()) {
        LOG_WARN("Scheduler already running");
        return false;
    }
    shutdown_.store(false);
    running_.store(true);
    try {
        thread_ = std::thread(&RoutineScheduler::loop, this, interval);
    } catch (const std::exception& e) {
        running_.store(false);
        LOG_ERROR("Failed to start scheduler: " + std::string(e.what()));
        return false;
    }
    return true;
}

void RoutineScheduler::stop() noexcept {
    if (!running_.load()) return;
    shutdown_.store(true);
    running_.store(false);
    if (thread_.joinable()) thread_.join();
    LOG_DEBUG("Scheduler stopped");
}

void RoutineScheduler::loop(std::chrono::seconds interval) {
    setThreadName("Scheduler");
    LOG_DEBUG("Scheduler loop started");

    while (!shutdown_.load()) {
        try {
            tick(Clock::now());
        } catch (const std::exception& e) {
            LOG_ERROR("Scheduler tick error: " + std::string(e.what()));
        }

        auto sleepEnd = std::chrono::steady_clock::now() + interval;
        while (std::chrono::steady_clock::now() < sleepEnd && !shutdown_.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }
}

}
