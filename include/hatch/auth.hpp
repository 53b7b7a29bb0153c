/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "hatch/types.hpp"

namespace hatch {

// Per-job bearer tokens. A token authenticates exactly one job id and stops
// working the moment the job's sandbox is torn down.
class TokenStore {
public:
    TokenStore() = default;

    TokenStore(const TokenStore&) = delete;
    TokenStore& operator=(const TokenStore&) = delete;

    // Returns a fresh 256-bit hex token, replacing any previous one for the job.
    [[nodiscard]] std::optional<std::string> issue(const JobId& jobId);
    [[nodiscard]] bool verify(const JobId& jobId, const std::string& token) const;
    void revoke(const JobId& jobId) noexcept;
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<JobId, std::string> tokens_;
};

// Constant-time comparison for secrets; unequal lengths compare false.
[[nodiscard]] bool secureEquals(const std::string& a, const std::string& b) noexcept;

[[nodiscard]] std::string base64Encode(const std::string& data);
[[nodiscard]] std::optional<std::string> base64Decode(const std::string& data);

// Parses "Basic base64(user:pass)". Returns {user, pass}.
[[nodiscard]] std::optional<std::pair<std::string, std::string>> parseBasicAuth(const std::string& header);
// Parses "Bearer <token>".
[[nodiscard]] std::optional<std::string> parseBearer(const std::string& header);

}
