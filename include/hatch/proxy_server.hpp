/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "hatch/proxy.hpp"

namespace hatch {

// Forward proxy listener. Speaks just enough HTTP/1.1 for absolute-form
// requests and CONNECT tunnels; policy lives in EgressProxy.
class ProxyServer final {
public:
    explicit ProxyServer(EgressProxy& proxy) noexcept;
    ~ProxyServer();

    ProxyServer(const ProxyServer&) = delete;
    ProxyServer& operator=(const ProxyServer&) = delete;
    ProxyServer(ProxyServer&&) = delete;
    ProxyServer& operator=(ProxyServer&&) = delete;

    // port 0 picks an ephemeral port; see port() afterwards.
    [[nodiscard]] bool start(const std::string& bindAddress, int port);
    void stop() noexcept;

    [[nodiscard]] int port() const noexcept { return port_; }
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

private:
    void acceptLoop();
    void serveConnection(int fd);
    void tunnel(int clientFd, const TunnelDecision& decision);
    void release(int fd) noexcept;

    EgressProxy& proxy_;
    int listenFd_ = -1;
    int port_ = 0;
    std::atomic<bool> running_{false};
    std::thread acceptThread_;

    std::mutex connMutex_;
    std::condition_variable connDone_;
    std::set<int> activeFds_;
};

}
