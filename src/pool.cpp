/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hatch/pool.hpp"
#include "hatch/logger.hpp"
#include <new>
#include <system_error>

namespace hatch {

ProvisionPool::ProvisionPool(int workers, std::string name) noexcept
    : workers_(workers > 0 ? workers : 1), name_(std::move(name)) {}

ProvisionPool::~ProvisionPool() {
    stop();
}

bool ProvisionPool::start(ProvisionFn provision) {
    if (running_.load()) {
        LOG_WARN(name_ + " pool already running");
        return false;
    }
    if (!provision) {
        LOG_ERROR("No provisioning function given to " + name_ + " pool");
        return false;
    }

    provision_ = std::move(provision);
    shutdown_.store(false);
    running_.store(true);

    try {
        threads_.reserve(static_cast<std::size_t>(workers_));
        for (int i = 0; i < workers_; ++i) {
            threads_.emplace_back(&ProvisionPool::workerLoop, this, i);
        }
    } catch (const std::system_error& e) {
        LOG_ERROR("Failed to start " + name_ + " pool: " + std::string(e.what()));
        stop();
        return false;
    }

    LOG_INFO(name_ + " pool started with " + std::to_string(workers_) + " threads");
    return true;
}

std::vector<JobId> ProvisionPool::stop() noexcept {
    std::vector<JobId> dropped;
    if (!running_.exchange(false)) {
        return dropped;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_.store(true);
    }
    available_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) thread.join();
    }
    threads_.clear();

    std::lock_guard<std::mutex> lock(mutex_);
    dropped.assign(queue_.begin(), queue_.end());
    queue_.clear();
    held_.clear();

    if (!dropped.empty()) {
        LOG_WARN(name_ + " pool stopped with " + std::to_string(dropped.size()) + " jobs still queued");
    } else {
        LOG_DEBUG(name_ + " pool stopped");
    }
    return dropped;
}

bool ProvisionPool::submit(const JobId& jobId) noexcept {
    if (jobId.empty() || !running_.load()) {
        return false;
    }
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_.load() || !held_.insert(jobId).second) {
            return false;
        }
        queue_.push_back(jobId);
    } catch (const std::bad_alloc&) {
        LOG_ERROR("Out of memory queueing " + jobId);
        return false;
    }
    available_.notify_one();
    return true;
}

std::size_t ProvisionPool::backlog() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.size();
}

void ProvisionPool::workerLoop(int workerId) {
    setThreadName(name_ + "-" + std::to_string(workerId));

    while (true) {
        JobId jobId;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            available_.wait(lock, [this] { return !queue_.empty() || shutdown_.load(); });
            if (shutdown_.load()) break;
            jobId = std::move(queue_.front());
            queue_.pop_front();
        }

        LOG_JOB(DEBUG, jobId, "Provisioning claimed by " + name_ + "-" + std::to_string(workerId));
        try {
            provision_(jobId);
        } catch (const std::exception& e) {
            LOG_JOB(ERROR, jobId, "Provisioning threw: " + std::string(e.what()));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        held_.erase(jobId);
    }
}

}
