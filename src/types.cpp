/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hatch/types.hpp"
#include "hatch/util.hpp"

namespace hatch {

bool isTerminal(JobState state) noexcept {
    switch (state) {
        case JobState::Completed:
        case JobState::Failed:
        case JobState::Interrupted:
        case JobState::Cancelled:
            return true;
        default:
            return false;
    }
}

bool isLegalTransition(JobState from, JobState to) noexcept {
    switch (from) {
        case JobState::Pending:
            return to == JobState::InProgress || to == JobState::Failed || to == JobState::Cancelled;
        case JobState::InProgress:
            return to == JobState::Completed || to == JobState::Failed ||
                   to == JobState::Interrupted || to == JobState::Cancelled;
        default:
            return false;
    }
}

const char* toString(JobState state) noexcept {
    switch (state) {
        case JobState::Pending: return "pending";
        case JobState::InProgress: return "in_progress";
        case JobState::Completed: return "completed";
        case JobState::Failed: return "failed";
        case JobState::Interrupted: return "interrupted";
        case JobState::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

const char* toString(JobMode mode) noexcept {
    switch (mode) {
        case JobMode::Worker: return "worker";
        case JobMode::Bridge: return "bridge";
        default: return "unknown";
    }
}

const char* toString(EventType type) noexcept {
    switch (type) {
        case EventType::Message: return "message";
        case EventType::ToolUse: return "tool_use";
        case EventType::ToolResult: return "tool_result";
        case EventType::Status: return "status";
        case EventType::Result: return "result";
        default: return "unknown";
    }
}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::Validation: return "validation_error";
        case ErrorCode::Conflict: return "state_conflict";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::ProvisionFailure: return "provision_failure";
        case ErrorCode::EgressDenied: return "egress_denied";
        case ErrorCode::WorkerUnresponsive: return "worker_unresponsive";
        case ErrorCode::Unauthorized: return "unauthorized";
        case ErrorCode::Unavailable: return "unavailable";
        case ErrorCode::Internal: return "internal_error";
        default: return "unknown";
    }
}

std::optional<JobState> parseJobState(const std::string& value) noexcept {
    try {
        std::string v = toLowerCopy(value);
        if (v == "pending") return JobState::Pending;
        if (v == "in_progress" || v == "running") return JobState::InProgress;
        if (v == "completed") return JobState::Completed;
        if (v == "failed") return JobState::Failed;
        if (v == "interrupted") return JobState::Interrupted;
        if (v == "cancelled") return JobState::Cancelled;
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<JobMode> parseJobMode(const std::string& value) noexcept {
    try {
        std::string v = toLowerCopy(value);
        if (v.empty() || v == "worker" || v == "generic") return JobMode::Worker;
        if (v == "bridge" || v == "claude_code" || v == "coding-bridge") return JobMode::Bridge;
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<EventType> parseEventType(const std::string& value) noexcept {
    if (value == "message") return EventType::Message;
    if (value == "tool_use") return EventType::ToolUse;
    if (value == "tool_result") return EventType::ToolResult;
    if (value == "status") return EventType::Status;
    if (value == "result") return EventType::Result;
    return std::nullopt;
}

int httpStatus(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None: return 200;
        case ErrorCode::Validation: return 400;
        case ErrorCode::Unauthorized: return 401;
        case ErrorCode::EgressDenied: return 403;
        case ErrorCode::NotFound: return 404;
        case ErrorCode::Conflict: return 409;
        case ErrorCode::Unavailable:
        case ErrorCode::WorkerUnresponsive: return 503;
        default: return 500;
    }
}

}
