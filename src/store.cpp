/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hatch/store.hpp"
#include "hatch/logger.hpp"
#include "hatch/util.hpp"
#include <fstream>
#include <stdexcept>

namespace hatch {

namespace fs = std::filesystem;

namespace {

// Cuts an unterminated trailing line left by an interrupted append.
void trimTornTail(const fs::path& path, const JobId& id) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec || size == 0) return;

    std::uintmax_t keep = size;
    {
        std::ifstream in(path, std::ios::binary);
        char c = 0;
        while (keep > 0) {
            in.seekg(static_cast<std::streamoff>(keep - 1));
            if (!in.get(c)) {
                throw std::runtime_error("cannot read event log tail");
            }
            if (c == '\n') break;
            --keep;
        }
    }
    if (keep == size) return;
    LOG_WARN("Dropping " + std::to_string(size - keep) + " torn bytes from event log of " + id);
    fs::resize_file(path, keep);
}

}

Store::Store(fs::path root) : root_(std::move(root)) {}

bool Store::initialize() noexcept {
    try {
        fs::create_directories(root_ / "jobs");
        fs::create_directories(root_ / "routines");
        fs::create_directories(root_ / "sandboxes");
        LOG_DEBUG("Workspace ready: " + root_.string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create workspace " + root_.string() + ": " + e.what());
        return false;
    }
}

fs::path Store::jobDir(const JobId& id) const {
    return root_ / "jobs" / id;
}

fs::path Store::eventsPath(const JobId& id) const {
    return jobDir(id) / "events.jsonl";
}

fs::path Store::projectDir(const JobId& id) const {
    return root_ / "sandboxes" / id;
}

bool Store::saveJob(const Job& job) noexcept {
    try {
        fs::create_directories(jobDir(job.id));
        nlohmann::json j = job;
        return atomicWrite(jobDir(job.id) / "job.json", j.dump(2));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save job " + job.id + ": " + e.what());
        return false;
    }
}

std::optional<Job> Store::loadJob(const JobId& id) const noexcept {
    auto content = readFile(jobDir(id) / "job.json");
    if (!content) {
        return std::nullopt;
    }
    try {
        return nlohmann::json::parse(*content).get<Job>();
    } catch (const std::exception& e) {
        LOG_WARN("Corrupt job record " + id + ": " + e.what());
        return std::nullopt;
    }
}

std::vector<Job> Store::loadJobs() const noexcept {
    std::vector<Job> jobs;
    try {
        if (!fs::exists(root_ / "jobs")) {
            return jobs;
        }
        for (const auto& entry : fs::directory_iterator(root_ / "jobs")) {
            if (!entry.is_directory()) continue;
            auto job = loadJob(entry.path().filename().string());
            if (job) {
                jobs.push_back(std::move(*job));
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to scan jobs: " + std::string(e.what()));
    }
    return jobs;
}

bool Store::appendEvent(const Event& event) noexcept {
    try {
        std::lock_guard<std::mutex> lock(appendMutex_);
        fs::create_directories(jobDir(event.jobId));
        trimTornTail(eventsPath(event.jobId), event.jobId);
        std::ofstream out(eventsPath(event.jobId), std::ios::app | std::ios::binary);
        if (!out) {
            LOG_ERROR("Cannot open event log for " + event.jobId);
            return false;
        }
        out << nlohmann::json(event).dump() << '\n';
        out.flush();
        return out.good();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to append event for " + event.jobId + ": " + e.what());
        return false;
    }
}

std::vector<Event> Store::readEvents(const JobId& id, std::uint64_t since, std::size_t limit) const noexcept {
    std::vector<Event> events;
    try {
        std::ifstream in(eventsPath(id), std::ios::binary);
        if (!in) {
            return events;
        }
        std::string line;
        while (std::getline(in, line)) {
            if (line.empty()) continue;
            Event event;
            try {
                event = nlohmann::json::parse(line).get<Event>();
            } catch (const std::exception& e) {
                // A torn trailing line after a crash is the only expected case.
                LOG_WARN("Skipping unreadable event line for " + id + ": " + e.what());
                continue;
            }
            if (event.sequence <= since) continue;
            events.push_back(std::move(event));
            if (limit > 0 && events.size() >= limit) break;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to read events for " + id + ": " + e.what());
    }
    return events;
}

std::optional<Event> Store::lastEvent(const JobId& id) const noexcept {
    auto events = readEvents(id, 0);
    if (events.empty()) {
        return std::nullopt;
    }
    return events.back();
}

bool Store::saveRoutine(const std::string& id, const nlohmann::json& routine) noexcept {
    try {
        fs::create_directories(root_ / "routines");
        return atomicWrite(root_ / "routines" / (id + ".json"), routine.dump(2));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save routine " + id + ": " + e.what());
        return false;
    }
}

std::vector<nlohmann::json> Store::loadRoutines() const noexcept {
    std::vector<nlohmann::json> routines;
    try {
        if (!fs::exists(root_ / "routines")) {
            return routines;
        }
        for (const auto& entry : fs::directory_iterator(root_ / "routines")) {
            if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
            auto content = readFile(entry.path());
            if (!content) continue;
            try {
                routines.push_back(nlohmann::json::parse(*content));
            } catch (const std::exception& e) {
                LOG_WARN("Corrupt routine file " + entry.path().string() + ": " + e.what());
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to scan routines: " + std::string(e.what()));
    }
    return routines;
}

bool Store::deleteRoutine(const std::string& id) noexcept {
    std::error_code ec;
    fs::remove(root_ / "routines" / (id + ".json"), ec);
    if (ec) {
        LOG_ERROR("Failed to delete routine " + id + ": " + ec.message());
        return false;
    }
    return true;
}

}
