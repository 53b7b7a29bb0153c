/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hatch/events.hpp"
#include "hatch/logger.hpp"

namespace hatch {

EventPipeline::EventPipeline(Store& store, std::size_t ringCapacity)
    : store_(store), capacity_(ringCapacity > 0 ? ringCapacity : 1) {}

std::shared_ptr<detail::Channel> EventPipeline::channel(const JobId& jobId) {
    std::lock_guard<std::mutex> lock(channelsMutex_);
    auto it = channels_.find(jobId);
    if (it != channels_.end()) {
        return it->second;
    }

    // First touch in this process: resume numbering from the durable log.
    auto ch = std::make_shared<detail::Channel>();
    if (auto last = store_.lastEvent(jobId)) {
        ch->lastSequence = last->sequence;
        ch->closed = last->type == EventType::Result;
    }
    if (!ch->closed) {
        channels_.emplace(jobId, ch);
    }
    return ch;
}

void EventPipeline::evict(const JobId& jobId, const std::shared_ptr<detail::Channel>& ch) {
    std::lock_guard<std::mutex> lock(channelsMutex_);
    auto it = channels_.find(jobId);
    if (it != channels_.end() && it->second == ch) {
        channels_.erase(it);
    }
}

std::size_t EventPipeline::channelCount() {
    std::lock_guard<std::mutex> lock(channelsMutex_);
    return channels_.size();
}

IngestResult EventPipeline::ingest(const JobId& jobId, EventType type, const nlohmann::json& payload,
                                   TimePoint now) {
    IngestResult result;
    if (!payload.is_object()) {
        result.error = ErrorCode::Validation;
        result.message = "payload must be a JSON object";
        return result;
    }

    auto ch = channel(jobId);
    {
        std::lock_guard<std::mutex> lock(ch->mutex);
        if (ch->closed) {
            result.error = ErrorCode::Conflict;
            result.message = "event stream closed after result";
            return result;
        }

        Event event{jobId, ch->lastSequence + 1, type, payload, now};
        if (!store_.appendEvent(event)) {
            result.error = ErrorCode::Internal;
            result.message = "failed to persist event";
            return result;
        }

        ch->lastSequence = event.sequence;
        ch->ring.push_back(event);
        while (ch->ring.size() > capacity_) {
            ch->ring.pop_front();
        }
        if (type == EventType::Result) {
            ch->closed = true;
        }
        result.ok = true;
        result.event = std::move(event);
    }
    ch->changed.notify_all();
    if (type == EventType::Result) {
        // Subscribers keep their own reference; the closed state lives in the log.
        evict(jobId, ch);
    }

    LOG_TRACE("[job " + jobId + "] event #" + std::to_string(result.event.sequence) + " " + toString(type));

    std::vector<EventListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        try {
            listener(result.event);
        } catch (const std::exception& e) {
            LOG_ERROR("Event listener failed: " + std::string(e.what()));
        }
    }
    return result;
}

std::vector<Event> EventPipeline::read(const JobId& jobId, std::uint64_t since, std::size_t limit) const {
    return store_.readEvents(jobId, since, limit);
}

std::unique_ptr<Subscription> EventPipeline::subscribe(const JobId& jobId, std::uint64_t since) {
    auto ch = channel(jobId);
    return std::unique_ptr<Subscription>(new Subscription(*this, jobId, std::move(ch), since));
}

bool EventPipeline::isClosed(const JobId& jobId) {
    auto ch = channel(jobId);
    std::lock_guard<std::mutex> lock(ch->mutex);
    return ch->closed;
}

std::uint64_t EventPipeline::lastSequence(const JobId& jobId) {
    auto ch = channel(jobId);
    std::lock_guard<std::mutex> lock(ch->mutex);
    return ch->lastSequence;
}

std::size_t EventPipeline::ringSize(const JobId& jobId) {
    auto ch = channel(jobId);
    std::lock_guard<std::mutex> lock(ch->mutex);
    return ch->ring.size();
}

void EventPipeline::addListener(EventListener listener) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listeners_.push_back(std::move(listener));
}

void EventPipeline::shutdown() noexcept {
    shutdown_.store(true);
    std::lock_guard<std::mutex> lock(channelsMutex_);
    for (auto& [id, ch] : channels_) {
        {
            std::lock_guard<std::mutex> chLock(ch->mutex);
        }
        ch->changed.notify_all();
    }
}

Subscription::Subscription(EventPipeline& pipeline, JobId jobId, std::shared_ptr<detail::Channel> channel,
                           std::uint64_t since)
    : pipeline_(pipeline), jobId_(std::move(jobId)), channel_(std::move(channel)), cursor_(since) {
    backlog_ = pipeline_.store_.readEvents(jobId_, since);
}

std::vector<Event> Subscription::next(std::chrono::milliseconds timeout) {
    if (!backlog_.empty()) {
        std::vector<Event> batch;
        batch.swap(backlog_);
        cursor_ = batch.back().sequence;
        return batch;
    }

    std::vector<Event> batch;
    std::uint64_t gapEnd = 0;
    {
        std::unique_lock<std::mutex> lock(channel_->mutex);
        channel_->changed.wait_for(lock, timeout, [this] {
            return channel_->lastSequence > cursor_ || channel_->closed ||
                   cancelled_.load() || pipeline_.isShutdown();
        });
        if (cancelled_.load() || channel_->lastSequence <= cursor_) {
            return batch;
        }

        const auto& ring = channel_->ring;
        if (!ring.empty() && ring.front().sequence > cursor_ + 1) {
            // Fell behind the ring: fill the hole from the durable log below.
            gapEnd = ring.front().sequence;
            ++lagged_;
        }
        for (const auto& event : ring) {
            if (event.sequence > cursor_) {
                batch.push_back(event);
            }
        }
    }

    if (gapEnd > 0) {
        LOG_DEBUG("[job " + jobId_ + "] subscriber lagged at #" + std::to_string(cursor_) +
                  ", re-reading durable log");
        auto missed = pipeline_.store_.readEvents(jobId_, cursor_, gapEnd - cursor_ - 1);
        missed.insert(missed.end(), batch.begin(), batch.end());
        batch.swap(missed);
    }

    if (!batch.empty()) {
        cursor_ = batch.back().sequence;
    }
    return batch;
}

bool Subscription::finished() const {
    if (!backlog_.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(channel_->mutex);
    return channel_->closed && cursor_ >= channel_->lastSequence;
}

void Subscription::cancel() noexcept {
    cancelled_.store(true);
    {
        std::lock_guard<std::mutex> lock(channel_->mutex);
    }
    channel_->changed.notify_all();
}

}
