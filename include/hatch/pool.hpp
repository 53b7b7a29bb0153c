/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "hatch/types.hpp"

namespace hatch {

using ProvisionFn = std::function<void(const JobId&)>;

// Threads that provision sandboxes off the request path. A job id is held
// at most once, whether queued or being provisioned.
class ProvisionPool {
public:
    explicit ProvisionPool(int workers, std::string name = "Provision") noexcept;
    ~ProvisionPool();

    ProvisionPool(const ProvisionPool&) = delete;
    ProvisionPool& operator=(const ProvisionPool&) = delete;

    [[nodiscard]] bool start(ProvisionFn provision);
    // Joins the threads; returns the ids that were still waiting.
    std::vector<JobId> stop() noexcept;

    // False when stopped or the job is already queued or in flight.
    [[nodiscard]] bool submit(const JobId& jobId) noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t backlog() const noexcept;
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

private:
    void workerLoop(int workerId);

    int workers_;
    std::string name_;
    ProvisionFn provision_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<JobId> queue_;
    std::set<JobId> held_;

    std::vector<std::thread> threads_;
};

}
