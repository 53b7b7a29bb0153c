/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace hatch {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// UTC, millisecond precision: 2025-01-02T03:04:05.678Z
[[nodiscard]] std::string formatTime(TimePoint tp);
[[nodiscard]] std::optional<TimePoint> parseTime(const std::string& text) noexcept;

[[nodiscard]] std::int64_t toUnixSeconds(TimePoint tp) noexcept;
[[nodiscard]] TimePoint fromUnixSeconds(std::int64_t secs) noexcept;

// Unique, sortable-by-creation id: <micros>_<pid>_<counter>
[[nodiscard]] std::string generateId();

[[nodiscard]] int envInt(const char* name, int defv) noexcept;
[[nodiscard]] std::string envString(const char* name, const std::string& defv);

[[nodiscard]] std::string toLowerCopy(std::string value);
[[nodiscard]] std::string trim(const std::string& value);

// Write-to-temp then rename, so readers never observe a partial file.
[[nodiscard]] bool atomicWrite(const std::filesystem::path& path, const std::string& content) noexcept;
[[nodiscard]] std::optional<std::string> readFile(const std::filesystem::path& path) noexcept;

// Resolves `relative` under `root`, rejecting anything that escapes it.
[[nodiscard]] std::optional<std::filesystem::path> resolveUnder(const std::filesystem::path& root,
                                                                const std::string& relative) noexcept;

}
