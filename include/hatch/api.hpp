/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "hatch/orchestrator.hpp"
#include "hatch/routine.hpp"
#include "hatch/runner.hpp"

namespace hatch {

// Model completion for generic workers; unset when no model is loaded.
using CompletionFn = std::function<RunResult(const std::string& prompt)>;

// Control, routine, webhook and internal worker routes on one listener.
class ApiServer {
public:
    // `routines` may be null; routine routes then answer 503.
    ApiServer(Orchestrator& orchestrator, RoutineScheduler* routines);
    ~ApiServer();

    ApiServer(const ApiServer&) = delete;
    ApiServer& operator=(const ApiServer&) = delete;

    void setCompletion(CompletionFn completion) { completion_ = std::move(completion); }
    void setKeepAlive(std::chrono::seconds interval) noexcept { keepAlive_ = interval; }

    // Binds (port 0 picks an ephemeral port) and serves on the "Api" thread.
    [[nodiscard]] bool start(const std::string& host, int port);
    void stop() noexcept;
    [[nodiscard]] int port() const noexcept { return port_; }

    [[nodiscard]] nlohmann::json jobJson(const Job& job) const;

private:
    void registerJobRoutes();
    void registerRoutineRoutes();
    void registerInternalRoutes();

    [[nodiscard]] bool authorizeWorker(const httplib::Request& req, httplib::Response& res, const JobId& id) const;
    [[nodiscard]] bool requireRoutines(httplib::Response& res) const;

    Orchestrator& orchestrator_;
    RoutineScheduler* routines_;
    CompletionFn completion_;
    std::chrono::seconds keepAlive_{15};

    httplib::Server server_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    int port_ = 0;
};

// Error body: {"error": "<code>", "message": "<text>"}
void sendError(httplib::Response& res, ErrorCode code, const std::string& message);
void sendJson(httplib::Response& res, const nlohmann::json& payload, int status = 200);

[[nodiscard]] nlohmann::json routineJson(const Routine& routine);
[[nodiscard]] nlohmann::json fireJson(const FireResult& fire);

}
