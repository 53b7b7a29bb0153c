/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "hatch/job.hpp"

namespace hatch {

// Filesystem workspace:
//   <root>/jobs/<id>/job.json        current job record (atomically replaced)
//   <root>/jobs/<id>/events.jsonl    durable event log, one JSON object per line
//   <root>/routines/<id>.json        routine definitions and run history
//   <root>/sandboxes/<id>/           per-job project directories
class Store {
public:
    explicit Store(std::filesystem::path root);

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    [[nodiscard]] bool initialize() noexcept;

    [[nodiscard]] bool saveJob(const Job& job) noexcept;
    [[nodiscard]] std::optional<Job> loadJob(const JobId& id) const noexcept;
    [[nodiscard]] std::vector<Job> loadJobs() const noexcept;

    [[nodiscard]] bool appendEvent(const Event& event) noexcept;
    // Events with sequence > since, at most `limit` of them (0 = no limit).
    [[nodiscard]] std::vector<Event> readEvents(const JobId& id, std::uint64_t since,
                                                std::size_t limit = 0) const noexcept;
    [[nodiscard]] std::optional<Event> lastEvent(const JobId& id) const noexcept;

    [[nodiscard]] bool saveRoutine(const std::string& id, const nlohmann::json& routine) noexcept;
    [[nodiscard]] std::vector<nlohmann::json> loadRoutines() const noexcept;
    [[nodiscard]] bool deleteRoutine(const std::string& id) noexcept;

    [[nodiscard]] std::filesystem::path projectDir(const JobId& id) const;
    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    [[nodiscard]] std::filesystem::path jobDir(const JobId& id) const;
    [[nodiscard]] std::filesystem::path eventsPath(const JobId& id) const;

    std::filesystem::path root_;
    // Serializes appends across jobs; per-job ordering is owned by the pipeline.
    mutable std::mutex appendMutex_;
};

}
