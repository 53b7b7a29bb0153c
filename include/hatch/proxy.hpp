/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <httplib.h>

#include "hatch/auth.hpp"
#include "hatch/types.hpp"

namespace hatch {

// Domain pattern is an exact host or "*.suffix" (subdomains of suffix only).
struct DomainRule {
    std::string domain;
    JobId scope;
    std::string credentialRef;
};

[[nodiscard]] bool isValidDomainPattern(const std::string& pattern);
[[nodiscard]] bool domainMatches(const std::string& pattern, const std::string& host);

struct Credential {
    std::string header = "Authorization";
    std::string value;
    std::string valueEnv;
};

// ref -> {header, value | value_env}. value_env is read from the proxy's own
// environment on every request, so rotating a secret needs no restart.
class CredentialStore {
public:
    [[nodiscard]] bool loadFile(const std::filesystem::path& path);
    void put(const std::string& ref, Credential credential);
    [[nodiscard]] bool contains(const std::string& ref) const;
    // {header, value}; nullopt for unknown refs or an unset value_env.
    [[nodiscard]] std::optional<std::pair<std::string, std::string>> resolve(const std::string& ref) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Credential> credentials_;
};

// tool name -> domains the tool needs. Loaded from {"tool": ["domain", ...]}.
class ToolTable {
public:
    [[nodiscard]] bool loadFile(const std::filesystem::path& path);
    void put(const std::string& tool, std::vector<std::string> domains);
    [[nodiscard]] bool contains(const std::string& tool) const;
    [[nodiscard]] std::vector<std::string> domainsFor(const std::string& tool) const;
    [[nodiscard]] std::vector<std::string> names() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<std::string>> tools_;
};

struct ProxyRequest {
    std::string method;
    std::string target;  // absolute-form URI, authority-form for CONNECT, or origin-form
    httplib::Headers headers;
    std::string body;
};

struct ProxyResponse {
    int status = 502;
    httplib::Headers headers;
    std::string body;
    ErrorCode error = ErrorCode::None;
};

struct UpstreamRequest {
    std::string scheme;
    std::string host;
    int port = 0;
    std::string method;
    std::string path;
    httplib::Headers headers;
    std::string body;
};

// Outbound leg of the proxy. Returns nullopt when the upstream is unreachable.
class Upstream {
public:
    virtual ~Upstream() = default;
    [[nodiscard]] virtual std::optional<ProxyResponse> forward(const UpstreamRequest& request) = 0;
};

class HttpUpstream final : public Upstream {
public:
    explicit HttpUpstream(int timeoutSecs = 60) noexcept : timeoutSecs_(timeoutSecs) {}
    [[nodiscard]] std::optional<ProxyResponse> forward(const UpstreamRequest& request) override;

private:
    int timeoutSecs_;
};

struct TunnelDecision {
    bool ok = false;
    JobId scope;
    std::string host;
    int port = 0;
    ProxyResponse denial;
    explicit operator bool() const noexcept { return ok; }
};

// Host-side egress policy. Holds every job's allow rules; a sandbox reaches the
// network only through here and only to hosts its own rules name.
class EgressProxy {
public:
    EgressProxy(TokenStore& tokens, CredentialStore& credentials, Upstream& upstream) noexcept;

    EgressProxy(const EgressProxy&) = delete;
    EgressProxy& operator=(const EgressProxy&) = delete;

    void installRules(const JobId& jobId, std::vector<DomainRule> rules);
    void revokeRules(const JobId& jobId) noexcept;
    [[nodiscard]] std::vector<DomainRule> rulesFor(const JobId& jobId) const;
    [[nodiscard]] std::optional<DomainRule> match(const JobId& jobId, const std::string& host) const;

    [[nodiscard]] ProxyResponse handle(const ProxyRequest& request);
    [[nodiscard]] TunnelDecision authorizeConnect(const ProxyRequest& request);

    [[nodiscard]] std::uint64_t allowedCount() const noexcept { return allowed_.load(); }
    [[nodiscard]] std::uint64_t deniedCount() const noexcept { return denied_.load(); }

private:
    [[nodiscard]] std::optional<JobId> authenticate(const httplib::Headers& headers) const;

    TokenStore& tokens_;
    CredentialStore& credentials_;
    Upstream& upstream_;

    mutable std::mutex mutex_;
    std::map<JobId, std::vector<DomainRule>> rules_;

    std::atomic<std::uint64_t> allowed_{0};
    std::atomic<std::uint64_t> denied_{0};
};

[[nodiscard]] ProxyResponse deniedResponse(const std::string& host, const std::string& why);

}
