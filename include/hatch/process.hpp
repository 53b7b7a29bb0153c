/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace hatch {

struct CommandResult {
    int exitCode = -1;
    std::string output;  // stdout and stderr interleaved
    bool truncated = false;
    bool timedOut = false;
    std::string error;   // set when the command could not be started
    [[nodiscard]] bool ok() const noexcept { return error.empty() && !timedOut && exitCode == 0; }
};

struct CommandOptions {
    std::filesystem::path cwd;
    std::size_t maxOutput = 64 * 1024;
    std::chrono::milliseconds timeout{0};  // 0 = wait forever
    // When set, replaces the environment entirely.
    std::optional<std::map<std::string, std::string>> env;
};

// Runs argv to completion (no shell), capturing bounded output.
[[nodiscard]] CommandResult runCommand(const std::vector<std::string>& argv, const CommandOptions& options = {});

// Resolves a bare program name against PATH. Paths containing '/' are returned as-is.
[[nodiscard]] std::optional<std::string> findExecutable(const std::string& name);

// Child whose stdout is read line by line; stderr is inherited.
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    [[nodiscard]] bool start(const std::vector<std::string>& argv, const std::filesystem::path& cwd = {});
    // False at end of stream.
    [[nodiscard]] bool readLine(std::string& line);
    // Exit code, or 128 + signal.
    int wait() noexcept;
    void terminate() noexcept;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

private:
    pid_t pid_ = -1;
    int fd_ = -1;
    std::string buffer_;
    bool eof_ = false;
    int status_ = -1;
};

[[nodiscard]] int decodeWaitStatus(int status) noexcept;

}
