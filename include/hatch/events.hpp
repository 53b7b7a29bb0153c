/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include <nlohmann/json.hpp>

#include "hatch/job.hpp"
#include "hatch/store.hpp"

namespace hatch {

struct IngestResult {
    bool ok = false;
    ErrorCode error = ErrorCode::None;
    std::string message;
    Event event;
    explicit operator bool() const noexcept { return ok; }
};

using EventListener = std::function<void(const Event&)>;

namespace detail {
// Per-job channel. Sequence assignment, the durable append and the ring
// append all happen under `mutex`, so per-job order is total.
struct Channel {
    std::mutex mutex;
    std::condition_variable changed;
    std::uint64_t lastSequence = 0;
    std::deque<Event> ring;
    bool closed = false;
};
}

class EventPipeline;

// Cursor over one job's stream: durable backfill first, then live ring
// entries strictly above the cursor. Never yields a gap or a duplicate.
class Subscription {
public:
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    // Next batch in sequence order. Empty when `timeout` elapsed with nothing new.
    [[nodiscard]] std::vector<Event> next(std::chrono::milliseconds timeout);

    // True once the job's result event has been delivered.
    [[nodiscard]] bool finished() const;
    [[nodiscard]] std::uint64_t cursor() const noexcept { return cursor_; }
    [[nodiscard]] std::size_t lagCount() const noexcept { return lagged_; }

    void cancel() noexcept;

private:
    friend class EventPipeline;
    Subscription(EventPipeline& pipeline, JobId jobId, std::shared_ptr<detail::Channel> channel,
                 std::uint64_t since);

    EventPipeline& pipeline_;
    JobId jobId_;
    std::shared_ptr<detail::Channel> channel_;
    std::uint64_t cursor_;
    std::vector<Event> backlog_;
    std::size_t lagged_ = 0;
    std::atomic<bool> cancelled_{false};
};

class EventPipeline {
public:
    EventPipeline(Store& store, std::size_t ringCapacity = 500);

    EventPipeline(const EventPipeline&) = delete;
    EventPipeline& operator=(const EventPipeline&) = delete;

    [[nodiscard]] IngestResult ingest(const JobId& jobId, EventType type, const nlohmann::json& payload,
                                      TimePoint now = Clock::now());

    [[nodiscard]] std::vector<Event> read(const JobId& jobId, std::uint64_t since, std::size_t limit) const;

    [[nodiscard]] std::unique_ptr<Subscription> subscribe(const JobId& jobId, std::uint64_t since);

    // Closed after the job's result event; ingest then fails with Conflict.
    [[nodiscard]] bool isClosed(const JobId& jobId);
    [[nodiscard]] std::uint64_t lastSequence(const JobId& jobId);
    [[nodiscard]] std::size_t ringSize(const JobId& jobId);
    // Channels held for jobs whose stream is still open.
    [[nodiscard]] std::size_t channelCount();

    void addListener(EventListener listener);

    // Wakes every blocked subscriber; they return empty batches from then on.
    void shutdown() noexcept;
    [[nodiscard]] bool isShutdown() const noexcept { return shutdown_.load(); }

    [[nodiscard]] std::size_t ringCapacity() const noexcept { return capacity_; }

private:
    friend class Subscription;
    std::shared_ptr<detail::Channel> channel(const JobId& jobId);
    void evict(const JobId& jobId, const std::shared_ptr<detail::Channel>& ch);

    Store& store_;
    std::size_t capacity_;
    std::atomic<bool> shutdown_{false};

    std::mutex channelsMutex_;
    std::map<JobId, std::shared_ptr<detail::Channel>> channels_;

    std::mutex listenerMutex_;
    std::vector<EventListener> listeners_;
};

}
