/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hatch/config.hpp"
#include "hatch/logger.hpp"
#include "hatch/util.hpp"

namespace hatch {

Config Config::fromEnv() {
    Config c;
    c.workspace = envString("HATCH_WORKSPACE", c.workspace.string());
    c.bindAddress = envString("HATCH_BIND", c.bindAddress);
    c.port = envInt("HATCH_PORT", c.port);
    c.proxyPort = envInt("HATCH_PROXY_PORT", c.proxyPort);
    c.publicUrl = envString("HATCH_PUBLIC_URL", "");
    c.proxyHost = envString("HATCH_PROXY_HOST", "");

    std::string backend = toLowerCopy(envString("HATCH_BACKEND", "process"));
    if (backend == "container" || backend == "docker" || backend == "podman") {
        c.backend = BackendKind::Container;
    } else if (backend != "process") {
        LOG_WARN("Unknown HATCH_BACKEND '" + backend + "', using process");
    }
    c.workerBin = envString("HATCH_WORKER_BIN", c.workerBin);
    c.bridgeBin = envString("HATCH_BRIDGE_BIN", c.bridgeBin);
    c.containerTool = envString("HATCH_CONTAINER_TOOL", c.containerTool);
    c.image = envString("HATCH_IMAGE", c.image);
    c.network = envString("HATCH_NETWORK", c.network);

    c.provisioners = envInt("HATCH_PROVISIONERS", c.provisioners);
    c.heartbeatTimeout = std::chrono::seconds(envInt("HATCH_HEARTBEAT_TIMEOUT", 300));
    c.stuckAfter = std::chrono::seconds(envInt("HATCH_STUCK_AFTER", 120));
    c.grace = std::chrono::seconds(envInt("HATCH_GRACE", 10));
    c.jobTimeout = std::chrono::seconds(envInt("HATCH_JOB_TIMEOUT", 3600));
    int buffer = envInt("HATCH_EVENT_BUFFER", 500);
    c.eventBuffer = buffer > 0 ? static_cast<std::size_t>(buffer) : 500;

    c.credentialsFile = envString("HATCH_CREDENTIALS", "");
    c.toolsFile = envString("HATCH_TOOLS", "");
    c.modelPath = envString("HATCH_MODEL", "");
    return c;
}

std::string Config::orchestratorUrl() const {
    if (!publicUrl.empty()) return publicUrl;
    return "http://" + bindAddress + ":" + std::to_string(port);
}

std::string Config::sandboxProxyHost() const {
    return proxyHost.empty() ? bindAddress : proxyHost;
}

const char* toString(BackendKind kind) noexcept {
    switch (kind) {
        case BackendKind::Process: return "process";
        case BackendKind::Container: return "container";
        default: return "unknown";
    }
}

}
