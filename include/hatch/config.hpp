/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace hatch {

enum class BackendKind : uint8_t { Process, Container };

// Daemon settings. Defaults, then HATCH_* environment, then hatchd flags.
struct Config {
    std::filesystem::path workspace = "./hatch-workspace";

    std::string bindAddress = "127.0.0.1";
    int port = 8600;
    int proxyPort = 8601;
    // Orchestrator URL as seen from inside a sandbox.
    std::string publicUrl;
    // Proxy host as seen from inside a sandbox.
    std::string proxyHost;

    BackendKind backend = BackendKind::Process;
    std::string workerBin = "hatch-worker";
    std::string bridgeBin = "hatch-bridge";
    std::string containerTool = "docker";
    std::string image = "hatch-worker:latest";
    std::string network = "hatch-sandbox";

    int provisioners = 4;
    std::chrono::seconds heartbeatTimeout{300};
    std::chrono::seconds stuckAfter{120};
    std::chrono::seconds grace{10};
    std::chrono::seconds jobTimeout{3600};
    std::size_t eventBuffer = 500;

    std::filesystem::path credentialsFile;
    std::filesystem::path toolsFile;

    std::string modelPath;

    [[nodiscard]] static Config fromEnv();

    [[nodiscard]] std::string orchestratorUrl() const;
    [[nodiscard]] std::string sandboxProxyHost() const;
};

[[nodiscard]] const char* toString(BackendKind kind) noexcept;

}
