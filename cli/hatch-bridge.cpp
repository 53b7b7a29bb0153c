/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hatch/bridge.hpp"
#include "hatch/logger.hpp"
#include "hatch/util.hpp"
#include "hatch/worker_client.hpp"
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

using namespace hatch;

static void printUsage() {
    std::cerr << "Usage: hatch-bridge --job-id <id> --orchestrator-url <url> [--max-turns <n>] [--model <name>]\n"
              << "  The job token is read from HATCH_JOB_TOKEN; HATCH_BRIDGE_CLI overrides the agent binary.\n";
}

int main(int argc, char* argv[]) {
    Logger::setLevel(LogLevel::WARN);
    if (std::getenv("HATCH_LOG_LEVEL")) {
        Logger::initFromEnv();
    }
    setThreadName("Bridge");
    std::signal(SIGPIPE, SIG_IGN);

    std::string jobId;
    std::string url;
    int maxTurns = 0;
    std::string model;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        }
        if (i + 1 >= argc) {
            std::cerr << "Error: " << arg << " needs a value\n";
            return 2;
        }
        if (arg == "--job-id") {
            jobId = argv[++i];
        } else if (arg == "--orchestrator-url") {
            url = argv[++i];
        } else if (arg == "--max-turns") {
            try {
                maxTurns = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid turn count\n";
                return 2;
            }
        } else if (arg == "--model") {
            model = argv[++i];
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            printUsage();
            return 2;
        }
    }

    WorkerIdentity identity = identityFromEnv(jobId, url);
    if (!identity.complete()) {
        std::cerr << "Error: job id, orchestrator URL and HATCH_JOB_TOKEN are required\n";
        return 2;
    }

    WorkerClient client(identity);
    auto spec = client.fetchSpec();
    if (!spec) {
        LOG_ERROR("Could not fetch job spec: " + client.lastError());
        if (!client.emit(EventType::Result, {{"success", false}, {"message", "could not fetch job spec"}})) {
            LOG_ERROR("Result event was not accepted: " + client.lastError());
        }
        return 1;
    }

    BridgeOptions options;
    options.cli = envString("HATCH_BRIDGE_CLI", options.cli);
    options.maxTurns = maxTurns > 0 ? maxTurns : spec->value("max_turns", 20);
    options.model = model.empty() ? spec->value("model", std::string{}) : model;
    options.workdir = std::filesystem::current_path();
    options.idleWindow = std::chrono::seconds(envInt("HATCH_BRIDGE_IDLE", 300));

    HeartbeatLoop heartbeat(client, std::chrono::seconds(envInt("HATCH_HEARTBEAT_INTERVAL", 30)));
    BridgeRunner bridge(client, options);
    JobOutcome outcome = bridge.run(spec->value("description", std::string{}));

    LOG_INFO("Job " + identity.jobId + (outcome.success ? " completed: " : " failed: ") + outcome.message);
    return outcome.success ? 0 : 1;
}
