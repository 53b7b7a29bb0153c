/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hatch/proxy.hpp"
#include "hatch/logger.hpp"
#include "hatch/util.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <set>

#include <nlohmann/json.hpp>

namespace hatch {

namespace {
struct Target {
    std::string scheme = "http";
    std::string host;
    int port = 80;
    bool explicitPort = false;
    std::string path = "/";
};

bool parseHostPort(const std::string& authority, int defaultPort, Target& out) {
    if (authority.empty()) return false;
    auto colon = authority.rfind(':');
    std::string host = authority;
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        host = authority.substr(0, colon);
        try {
            out.port = std::stoi(authority.substr(colon + 1));
        } catch (const std::exception&) {
            return false;
        }
        if (out.port <= 0 || out.port > 65535) return false;
        out.explicitPort = true;
    } else {
        out.port = defaultPort;
    }
    host = toLowerCopy(host);
    if (!host.empty() && host.back() == '.') host.pop_back();
    if (host.empty()) return false;
    out.host = host;
    return true;
}

std::optional<Target> parseTarget(const ProxyRequest& request) {
    Target t;
    const std::string& uri = request.target;
    auto schemeEnd = uri.find("://");
    if (schemeEnd != std::string::npos) {
        t.scheme = toLowerCopy(uri.substr(0, schemeEnd));
        if (t.scheme != "http" && t.scheme != "https") return std::nullopt;
        auto rest = uri.substr(schemeEnd + 3);
        auto slash = rest.find('/');
        std::string authority = slash == std::string::npos ? rest : rest.substr(0, slash);
        auto at = authority.rfind('@');
        if (at != std::string::npos) authority = authority.substr(at + 1);
        if (!parseHostPort(authority, t.scheme == "https" ? 443 : 80, t)) return std::nullopt;
        t.path = slash == std::string::npos ? "/" : rest.substr(slash);
        return t;
    }

    if (request.method == "CONNECT") {
        if (!parseHostPort(uri, 443, t)) return std::nullopt;
        t.scheme = "https";
        return t;
    }

    auto host = request.headers.find("Host");
    if (host == request.headers.end() || !parseHostPort(trim(host->second), 80, t)) {
        return std::nullopt;
    }
    t.path = uri.empty() ? "/" : uri;
    return t;
}

const std::set<std::string>& hopByHop() {
    static const std::set<std::string> headers = {
        "connection", "keep-alive", "proxy-authenticate", "proxy-authorization",
        "proxy-connection", "te", "trailer", "transfer-encoding", "upgrade",
        "host", "content-length",
    };
    return headers;
}

httplib::Headers stripHopByHop(const httplib::Headers& in, const std::string& alsoDrop = "") {
    std::set<std::string> drop = hopByHop();
    auto conn = in.find("Connection");
    if (conn != in.end()) {
        std::string listed = conn->second;
        std::size_t pos = 0;
        while (pos <= listed.size()) {
            auto comma = listed.find(',', pos);
            auto name = toLowerCopy(trim(listed.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos)));
            if (!name.empty()) drop.insert(name);
            if (comma == std::string::npos) break;
            pos = comma + 1;
        }
    }
    if (!alsoDrop.empty()) drop.insert(toLowerCopy(alsoDrop));

    httplib::Headers out;
    for (const auto& [name, value] : in) {
        if (drop.count(toLowerCopy(name)) == 0) {
            out.emplace(name, value);
        }
    }
    return out;
}

ProxyResponse errorResponse(int status, ErrorCode code, const std::string& message) {
    ProxyResponse r;
    r.status = status;
    r.error = code;
    r.body = nlohmann::json{{"error", toString(code)}, {"message", message}}.dump();
    r.headers.emplace("Content-Type", "application/json");
    return r;
}

ProxyResponse authRequired() {
    auto r = errorResponse(407, ErrorCode::Unauthorized, "proxy authorization required");
    r.headers.emplace("Proxy-Authenticate", "Basic realm=\"hatch\"");
    return r;
}

bool validLabel(const std::string& label) {
    if (label.empty() || label.size() > 63) return false;
    if (label.front() == '-' || label.back() == '-') return false;
    return std::all_of(label.begin(), label.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-';
    });
}
}

bool isValidDomainPattern(const std::string& pattern) {
    std::string p = toLowerCopy(pattern);
    if (p.rfind("*.", 0) == 0) {
        p = p.substr(2);
    }
    if (p.empty() || p.size() > 253) return false;
    std::size_t pos = 0;
    while (true) {
        auto dot = p.find('.', pos);
        if (!validLabel(p.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos))) {
            return false;
        }
        if (dot == std::string::npos) break;
        pos = dot + 1;
    }
    return true;
}

bool domainMatches(const std::string& pattern, const std::string& host) {
    std::string p = toLowerCopy(pattern);
    std::string h = toLowerCopy(host);
    if (!h.empty() && h.back() == '.') h.pop_back();
    if (p.rfind("*.", 0) == 0) {
        std::string suffix = p.substr(1);
        return h.size() > suffix.size() &&
               h.compare(h.size() - suffix.size(), suffix.size(), suffix) == 0;
    }
    return p == h;
}

bool CredentialStore::loadFile(const std::filesystem::path& path) {
    auto content = readFile(path);
    if (!content) {
        LOG_ERROR("Cannot read credentials file: " + path.string());
        return false;
    }
    try {
        auto j = nlohmann::json::parse(*content);
        if (!j.is_object()) {
            LOG_ERROR("Credentials file must be a JSON object: " + path.string());
            return false;
        }
        for (const auto& [ref, entry] : j.items()) {
            Credential c;
            c.header = entry.value("header", std::string{"Authorization"});
            c.value = entry.value("value", std::string{});
            c.valueEnv = entry.value("value_env", std::string{});
            if (c.value.empty() && c.valueEnv.empty()) {
                LOG_WARN("Credential " + ref + " has neither value nor value_env, skipping");
                continue;
            }
            put(ref, std::move(c));
        }
        LOG_INFO("Loaded " + std::to_string(credentials_.size()) + " credential references");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Bad credentials file " + path.string() + ": " + e.what());
        return false;
    }
}

void CredentialStore::put(const std::string& ref, Credential credential) {
    std::lock_guard<std::mutex> lock(mutex_);
    credentials_[ref] = std::move(credential);
}

bool CredentialStore::contains(const std::string& ref) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return credentials_.count(ref) > 0;
}

std::optional<std::pair<std::string, std::string>> CredentialStore::resolve(const std::string& ref) const {
    Credential c;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = credentials_.find(ref);
        if (it == credentials_.end()) {
            return std::nullopt;
        }
        c = it->second;
    }
    std::string value = c.value;
    if (!c.valueEnv.empty()) {
        const char* env = std::getenv(c.valueEnv.c_str());
        if (!env || !*env) {
            return std::nullopt;
        }
        value = env;
    }
    return std::make_pair(c.header, value);
}

bool ToolTable::loadFile(const std::filesystem::path& path) {
    auto content = readFile(path);
    if (!content) {
        LOG_ERROR("Cannot read tools file: " + path.string());
        return false;
    }
    try {
        auto j = nlohmann::json::parse(*content);
        for (const auto& [tool, domains] : j.items()) {
            put(tool, domains.get<std::vector<std::string>>());
        }
        LOG_INFO("Loaded " + std::to_string(tools_.size()) + " tool domain entries");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Bad tools file " + path.string() + ": " + e.what());
        return false;
    }
}

void ToolTable::put(const std::string& tool, std::vector<std::string> domains) {
    std::lock_guard<std::mutex> lock(mutex_);
    tools_[tool] = std::move(domains);
}

bool ToolTable::contains(const std::string& tool) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.count(tool) > 0;
}

std::vector<std::string> ToolTable::domainsFor(const std::string& tool) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tools_.find(tool);
    return it == tools_.end() ? std::vector<std::string>{} : it->second;
}

std::vector<std::string> ToolTable::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [name, domains] : tools_) out.push_back(name);
    return out;
}

std::optional<ProxyResponse> HttpUpstream::forward(const UpstreamRequest& request) {
    try {
        httplib::Client cli(request.scheme + "://" + request.host + ":" + std::to_string(request.port));
        cli.set_connection_timeout(10, 0);
        cli.set_read_timeout(timeoutSecs_, 0);
        cli.set_write_timeout(timeoutSecs_, 0);
        cli.set_follow_location(false);
        cli.set_decompress(false);

        httplib::Request req;
        req.method = request.method;
        req.path = request.path;
        req.headers = request.headers;
        req.body = request.body;

        auto res = cli.send(req);
        if (!res) {
            LOG_WARN("Upstream " + request.host + " failed: " + httplib::to_string(res.error()));
            return std::nullopt;
        }
        ProxyResponse out;
        out.status = res->status;
        out.headers = res->headers;
        out.body = res->body;
        return out;
    } catch (const std::exception& e) {
        LOG_ERROR("Upstream " + request.host + " error: " + e.what());
        return std::nullopt;
    }
}

ProxyResponse deniedResponse(const std::string& host, const std::string& why) {
    auto r = errorResponse(403, ErrorCode::EgressDenied, why + ": " + host);
    r.headers.emplace("X-Hatch-Egress", "denied");
    return r;
}

EgressProxy::EgressProxy(TokenStore& tokens, CredentialStore& credentials, Upstream& upstream) noexcept
    : tokens_(tokens), credentials_(credentials), upstream_(upstream) {}

void EgressProxy::installRules(const JobId& jobId, std::vector<DomainRule> rules) {
    for (auto& rule : rules) {
        rule.scope = jobId;
        rule.domain = toLowerCopy(rule.domain);
    }
    std::size_t count = rules.size();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rules_[jobId] = std::move(rules);
    }
    LOG_JOB(DEBUG, jobId, "installed " + std::to_string(count) + " egress rules");
}

void EgressProxy::revokeRules(const JobId& jobId) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (rules_.erase(jobId) > 0) {
        LOG_JOB(DEBUG, jobId, "egress rules revoked");
    }
}

std::vector<DomainRule> EgressProxy::rulesFor(const JobId& jobId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rules_.find(jobId);
    return it == rules_.end() ? std::vector<DomainRule>{} : it->second;
}

std::optional<DomainRule> EgressProxy::match(const JobId& jobId, const std::string& host) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rules_.find(jobId);
    if (it == rules_.end()) {
        return std::nullopt;
    }
    // Prefer a credentialed rule when several patterns cover the host.
    std::optional<DomainRule> found;
    for (const auto& rule : it->second) {
        if (!domainMatches(rule.domain, host)) continue;
        if (!found || (found->credentialRef.empty() && !rule.credentialRef.empty())) {
            found = rule;
        }
    }
    return found;
}

std::optional<JobId> EgressProxy::authenticate(const httplib::Headers& headers) const {
    auto it = headers.find("Proxy-Authorization");
    if (it == headers.end()) {
        return std::nullopt;
    }
    auto creds = parseBasicAuth(it->second);
    if (!creds || !tokens_.verify(creds->first, creds->second)) {
        return std::nullopt;
    }
    return creds->first;
}

ProxyResponse EgressProxy::handle(const ProxyRequest& request) {
    auto scope = authenticate(request.headers);
    if (!scope) {
        ++denied_;
        LOG_WARN("Egress request without valid proxy authorization: " + request.target);
        return authRequired();
    }

    auto target = parseTarget(request);
    if (!target) {
        return errorResponse(400, ErrorCode::Validation, "cannot determine target host");
    }

    auto rule = match(*scope, target->host);
    if (!rule) {
        ++denied_;
        LOG_JOB(WARN, *scope, "egress denied: " + target->host);
        return deniedResponse(target->host, "domain not allowlisted");
    }

    UpstreamRequest up;
    up.scheme = target->scheme;
    up.host = target->host;
    up.port = target->port;
    up.method = request.method;
    up.path = target->path;
    up.body = request.body;

    if (!rule->credentialRef.empty()) {
        auto credential = credentials_.resolve(rule->credentialRef);
        if (!credential) {
            LOG_JOB(ERROR, *scope, "credential " + rule->credentialRef + " unavailable for " + target->host);
            auto r = errorResponse(502, ErrorCode::Internal, "credential unavailable for " + target->host);
            r.headers.emplace("X-Hatch-Egress", "credential-unavailable");
            return r;
        }
        up.headers = stripHopByHop(request.headers, credential->first);
        up.headers.emplace(credential->first, credential->second);
        if (up.scheme == "http") {
            up.scheme = "https";
            if (!target->explicitPort || target->port == 80) {
                up.port = 443;
            }
        }
    } else {
        up.headers = stripHopByHop(request.headers);
    }

    ++allowed_;
    LOG_JOB(DEBUG, *scope, request.method + " " + up.scheme + "://" + up.host + up.path);

    auto response = upstream_.forward(up);
    if (!response) {
        return errorResponse(502, ErrorCode::Unavailable, "upstream unreachable: " + target->host);
    }
    response->headers = stripHopByHop(response->headers);
    return *response;
}

TunnelDecision EgressProxy::authorizeConnect(const ProxyRequest& request) {
    TunnelDecision decision;
    auto scope = authenticate(request.headers);
    if (!scope) {
        ++denied_;
        decision.denial = authRequired();
        return decision;
    }
    auto target = parseTarget(request);
    if (!target) {
        decision.denial = errorResponse(400, ErrorCode::Validation, "bad CONNECT authority");
        return decision;
    }
    if (!match(*scope, target->host)) {
        ++denied_;
        LOG_JOB(WARN, *scope, "egress tunnel denied: " + target->host);
        decision.denial = deniedResponse(target->host, "domain not allowlisted");
        return decision;
    }
    ++allowed_;
    decision.ok = true;
    decision.scope = *scope;
    decision.host = target->host;
    decision.port = target->port;
    return decision;
}

}
