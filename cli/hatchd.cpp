/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hatch/api.hpp"
#include "hatch/config.hpp"
#include "hatch/logger.hpp"
#include "hatch/orchestrator.hpp"
#include "hatch/proxy_server.hpp"
#include "hatch/routine.hpp"
#include "hatch/runner.hpp"
#include "hatch/util.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>
#include <unistd.h>

using namespace hatch;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

static void printUsage() {
    std::cout << "Usage: hatchd <workspace> [options]\n\n"
              << "Options:\n"
              << "  --bind <addr>          API and proxy bind address (default 127.0.0.1)\n"
              << "  --port <n>             API port (default 8600)\n"
              << "  --proxy-port <n>       egress proxy port (default 8601)\n"
              << "  --public-url <url>     orchestrator URL as seen from sandboxes\n"
              << "  --backend <kind>       container | process (process does not isolate; development only)\n"
              << "  --image <name>         container image for the container backend\n"
              << "  --model <gguf>         model served to generic workers\n"
              << "  --credentials <file>   credential table (JSON)\n"
              << "  --tools <file>         tool-domain table (JSON)\n"
              << "  -w, --provisioners <n> provisioning threads (default 4)\n"
              << "  -h, --help             show this help\n"
              << "  -v, --version          show version\n\n"
              << "Environment: HATCH_* variables provide defaults for every option.\n";
}

static bool parseInt(const std::string& value, int& out) {
    try {
        std::size_t used = 0;
        out = std::stoi(value, &used);
        return used == value.size();
    } catch (const std::exception&) {
        return false;
    }
}

static std::unique_ptr<SandboxBackend> makeBackend(const Config& config) {
    if (config.backend == BackendKind::Container) {
        return std::make_unique<ContainerBackend>(config.containerTool, config.image, config.network);
    }
    return std::make_unique<ProcessBackend>();
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    Logger::setLevel(LogLevel::INFO);
    if (std::getenv("HATCH_LOG_LEVEL")) {
        Logger::initFromEnv();
    }
    setThreadName("Main");

    Config config = Config::fromEnv();
    int argStart = 1;
    if (argc >= 2 && argv[1][0] != '-') {
        config.workspace = argv[1];
        argStart = 2;
    }

    for (int i = argStart; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&]() -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " needs a value\n";
                std::exit(1);
            }
            return argv[++i];
        };
        if (arg == "--bind") {
            config.bindAddress = needValue();
        } else if (arg == "--port" || arg == "--proxy-port" || arg == "-w" || arg == "--provisioners") {
            int value = 0;
            if (!parseInt(needValue(), value) || value < 0) {
                std::cerr << "Error: Invalid value for " << arg << "\n";
                return 1;
            }
            if (arg == "--port") config.port = value;
            else if (arg == "--proxy-port") config.proxyPort = value;
            else config.provisioners = value;
        } else if (arg == "--public-url") {
            config.publicUrl = needValue();
        } else if (arg == "--backend") {
            std::string kind = toLowerCopy(needValue());
            if (kind == "process") {
                config.backend = BackendKind::Process;
            } else if (kind == "container") {
                config.backend = BackendKind::Container;
            } else {
                std::cerr << "Error: Unknown backend: " << kind << "\n";
                return 1;
            }
        } else if (arg == "--image") {
            config.image = needValue();
        } else if (arg == "--model") {
            config.modelPath = needValue();
        } else if (arg == "--credentials") {
            config.credentialsFile = needValue();
        } else if (arg == "--tools") {
            config.toolsFile = needValue();
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (config.proxyPort < 1) {
        std::cerr << "Error: sandboxes need a fixed proxy port\n";
        return 1;
    }
    if (config.provisioners < 1) {
        std::cerr << "Error: provisioners must be at least 1\n";
        return 1;
    }
    if (!config.modelPath.empty() && !std::filesystem::exists(config.modelPath)) {
        std::cerr << "Error: Model not found: " << config.modelPath << "\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);

    try {
        std::unique_ptr<Runner> runner;
        if (!config.modelPath.empty()) {
            runner = std::make_unique<Runner>(config.modelPath);
        }

        Orchestrator orchestrator(config, makeBackend(config));
        if (!orchestrator.start()) {
            LOG_ERROR("Failed to start orchestrator");
            return 1;
        }

        RoutineScheduler scheduler(orchestrator, &orchestrator.store());
        scheduler.load();
        orchestrator.addTerminalListener([&scheduler](const Job& job) { scheduler.onJobFinished(job); });

        ProxyServer proxyServer(orchestrator.proxy());
        if (!proxyServer.start(config.bindAddress, config.proxyPort)) {
            LOG_ERROR("Failed to start egress proxy on port " + std::to_string(config.proxyPort));
            orchestrator.shutdown();
            return 1;
        }

        ApiServer api(orchestrator, &scheduler);
        if (runner) {
            Runner* model = runner.get();
            api.setCompletion([model](const std::string& prompt) { return model->complete(prompt); });
        }
        if (!api.start(config.bindAddress, config.port)) {
            proxyServer.stop();
            orchestrator.shutdown();
            return 1;
        }

        if (!scheduler.start()) {
            LOG_WARN("Routine scheduler did not start");
        }

        std::filesystem::path pidPath = config.workspace / ".hatchd.pid";
        {
            std::ofstream pf(pidPath);
            if (pf) {
                pf << getpid();
            }
        }

        std::cout << "hatchd " << VERSION << "\n"
                  << "  Workspace  " << config.workspace.string() << "\n"
                  << "  API        http://" << config.bindAddress << ":" << api.port() << "\n"
                  << "  Proxy      " << config.bindAddress << ":" << proxyServer.port() << "\n"
                  << "  Backend    " << toString(config.backend) << "\n"
                  << "  Model      " << (runner ? config.modelPath : std::string("(none)")) << "\n"
                  << std::flush;

        while (!g_shutdown_requested && orchestrator.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        LOG_INFO("Shutdown requested, stopping daemon...");
        {
            std::error_code ec;
            std::filesystem::remove(pidPath, ec);
        }
        scheduler.stop();
        orchestrator.shutdown();
        proxyServer.stop();
        api.stop();

    } catch (const std::exception& e) {
        LOG_ERROR("Daemon error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("hatchd stopped");
    return 0;
}
