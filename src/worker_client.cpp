/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hatch/worker_client.hpp"
#include "hatch/logger.hpp"
#include "hatch/util.hpp"
#include <httplib.h>

namespace hatch {

using nlohmann::json;

namespace {
constexpr std::chrono::seconds kShortTimeout{30};
constexpr std::chrono::seconds kCompletionTimeout{600};
}

WorkerIdentity identityFromEnv(const std::string& jobIdFlag, const std::string& urlFlag) {
    WorkerIdentity id;
    id.jobId = jobIdFlag.empty() ? envString("HATCH_JOB_ID", "") : jobIdFlag;
    id.orchestratorUrl = urlFlag.empty() ? envString("HATCH_ORCHESTRATOR_URL", "") : urlFlag;
    while (!id.orchestratorUrl.empty() && id.orchestratorUrl.back() == '/') {
        id.orchestratorUrl.pop_back();
    }
    id.token = envString("HATCH_JOB_TOKEN", "");
    return id;
}

WorkerClient::WorkerClient(WorkerIdentity identity) : identity_(std::move(identity)) {}

std::unique_ptr<httplib::Client> WorkerClient::makeClient(std::chrono::seconds readTimeout) const {
    auto client = std::make_unique<httplib::Client>(identity_.orchestratorUrl);
    client->set_bearer_token_auth(identity_.token);
    client->set_connection_timeout(std::chrono::seconds(10));
    client->set_read_timeout(readTimeout);
    client->set_write_timeout(kShortTimeout);
    return client;
}

std::string WorkerClient::path(const std::string& suffix) const {
    return "/internal/jobs/" + identity_.jobId + suffix;
}

std::optional<json> WorkerClient::fetchSpec() {
    auto res = makeClient(kShortTimeout)->Get(path("/spec"));
    if (!res) {
        lastError_ = "spec request failed: " + httplib::to_string(res.error());
        return std::nullopt;
    }
    if (res->status != 200) {
        lastError_ = "spec request returned " + std::to_string(res->status) + ": " + res->body;
        return std::nullopt;
    }
    try {
        return json::parse(res->body);
    } catch (const json::parse_error& e) {
        lastError_ = std::string("bad spec body: ") + e.what();
        return std::nullopt;
    }
}

bool WorkerClient::emit(EventType type, const json& payload) {
    json body{{"event_type", toString(type)}, {"payload", payload}};
    auto res = makeClient(kShortTimeout)->Post(path("/events"), body.dump(-1, ' ', false, json::error_handler_t::replace),
                                               "application/json");
    if (!res) {
        lastError_ = "event post failed: " + httplib::to_string(res.error());
        LOG_WARN(lastError_);
        return false;
    }
    if (res->status != 201) {
        lastError_ = "event rejected (" + std::to_string(res->status) + "): " + res->body;
        LOG_WARN(lastError_);
        return false;
    }
    return true;
}

bool WorkerClient::heartbeat() {
    auto res = makeClient(kShortTimeout)->Post(path("/heartbeat"), "", "application/json");
    return res && res->status == 200;
}

std::optional<FollowUpPrompt> WorkerClient::pollPrompt() {
    auto res = makeClient(kShortTimeout)->Get(path("/prompt"));
    if (!res || res->status != 200) return std::nullopt;
    try {
        json j = json::parse(res->body);
        return FollowUpPrompt{j.value("content", std::string{}), j.value("done", false)};
    } catch (const json::parse_error& e) {
        lastError_ = std::string("bad prompt body: ") + e.what();
        return std::nullopt;
    }
}

RunResult WorkerClient::complete(const std::string& prompt) {
    json body{{"prompt", prompt}};
    auto res = makeClient(kCompletionTimeout)->Post(path("/llm/complete"),
                                                    body.dump(-1, ' ', false, json::error_handler_t::replace),
                                                    "application/json");
    if (!res) {
        return {false, "", "completion request failed: " + httplib::to_string(res.error())};
    }
    try {
        json j = json::parse(res->body);
        if (res->status != 200) {
            return {false, "", j.value("message", "completion returned " + std::to_string(res->status))};
        }
        return {true, j.value("text", std::string{}), ""};
    } catch (const json::parse_error& e) {
        return {false, "", std::string("bad completion body: ") + e.what()};
    }
}

HeartbeatLoop::HeartbeatLoop(WorkerChannel& channel, std::chrono::seconds interval)
    : channel_(channel), interval_(interval) {
    thread_ = std::thread(&HeartbeatLoop::loop, this);
}

HeartbeatLoop::~HeartbeatLoop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void HeartbeatLoop::loop() {
    setThreadName("Heartbeat");
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_) {
        lock.unlock();
        if (!channel_.heartbeat()) {
            LOG_DEBUG("Heartbeat not acknowledged");
        }
        lock.lock();
        cv_.wait_for(lock, interval_, [this]() { return stop_; });
    }
}

}
