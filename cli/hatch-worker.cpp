/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hatch/agent.hpp"
#include "hatch/logger.hpp"
#include "hatch/util.hpp"
#include "hatch/worker_client.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

using namespace hatch;

static void printUsage() {
    std::cerr << "Usage: hatch-worker --job-id <id> --orchestrator-url <url> [--max-iterations <n>]\n"
              << "  The job token is read from HATCH_JOB_TOKEN.\n";
}

int main(int argc, char* argv[]) {
    Logger::setLevel(LogLevel::WARN);
    if (std::getenv("HATCH_LOG_LEVEL")) {
        Logger::initFromEnv();
    }
    setThreadName("Worker");

    std::string jobId;
    std::string url;
    int maxIterations = 0;

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
        } else if (arg == "--max-iterations") {
            try {
                maxIterations = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid iteration count\n";
                return 2;
            }
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

    AgentOptions options;
    options.maxIterations = maxIterations > 0 ? maxIterations : spec->value("max_iterations", 10);
    options.workdir = std::filesystem::current_path();
    options.commandTimeout = std::chrono::seconds(envInt("HATCH_COMMAND_TIMEOUT", 120));

    HeartbeatLoop heartbeat(client, std::chrono::seconds(envInt("HATCH_HEARTBEAT_INTERVAL", 30)));
    AgentLoop agent(client, options);
    JobOutcome outcome = agent.run(spec->value("description", std::string{}));

    LOG_INFO("Job " + identity.jobId + (outcome.success ? " completed: " : " failed: ") + outcome.message);
    return outcome.success ? 0 : 1;
}
