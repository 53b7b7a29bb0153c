/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace hatch {

// Opaque job identifier (<micros>_<pid>_<counter>).
using JobId = std::string;
using RoutineId = std::string;

// Stored job lifecycle states. "stuck" is derived at query time and never stored.
enum class JobState : std::uint8_t { Pending, InProgress, Completed, Failed, Interrupted, Cancelled };

enum class JobMode : std::uint8_t { Worker, Bridge };

enum class EventType : std::uint8_t { Message, ToolUse, ToolResult, Status, Result };

enum class ErrorCode : std::uint8_t {
    None = 0,
    Validation,
    Conflict,
    NotFound,
    ProvisionFailure,
    EgressDenied,
    WorkerUnresponsive,
    Unauthorized,
    Unavailable,
    Internal
};

struct OpResult {
    bool ok = false;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }

    static OpResult success(std::string msg = "") { return {true, ErrorCode::None, std::move(msg)}; }
    static OpResult failure(ErrorCode code, std::string msg) { return {false, code, std::move(msg)}; }
};

[[nodiscard]] bool isTerminal(JobState state) noexcept;
[[nodiscard]] bool isLegalTransition(JobState from, JobState to) noexcept;

[[nodiscard]] const char* toString(JobState state) noexcept;
[[nodiscard]] const char* toString(JobMode mode) noexcept;
[[nodiscard]] const char* toString(EventType type) noexcept;
[[nodiscard]] const char* toString(ErrorCode code) noexcept;

[[nodiscard]] std::optional<JobState> parseJobState(const std::string& value) noexcept;
[[nodiscard]] std::optional<JobMode> parseJobMode(const std::string& value) noexcept;
[[nodiscard]] std::optional<EventType> parseEventType(const std::string& value) noexcept;

// HTTP status used by the API surface for each error class.
[[nodiscard]] int httpStatus(ErrorCode code) noexcept;

} // namespace hatch
