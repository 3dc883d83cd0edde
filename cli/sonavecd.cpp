/*
 * sonavec - Embedding daemon (sonavecd)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/config.hpp"
#include "sonavec/flow.hpp"
#include "sonavec/logger.hpp"
#include "sonavec/scanner.hpp"
#include "sonavec/server.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>
#include <unistd.h>

using namespace sonavec;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "sonavec Embedding Daemon v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> [--model <path>] [-w <workers>]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace         Directory for job storage\n\n";
    std::cout << "Options:\n";
    std::cout << "  --model <path>    ONNX audio encoder (overrides SONAVEC_MODEL)\n";
    std::cout << "  -w, --workers <n> Worker threads (overrides SONAVEC_WORKERS)\n";
    std::cout << "  --data <dir>      Data directory (overrides SONAVEC_DATA_DIR)\n";
    std::cout << "  --index <url>     Vector index URL (overrides SONAVEC_INDEX_URL)\n";
    std::cout << "  -h, --help        Show this help message\n";
    std::cout << "  -v, --version     Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  SONAVEC_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  SONAVEC_RESOLVER_CMD Command resolving missing preview URLs\n";
    std::cout << "  SONAVEC_COLLECTION   Index collection (default track_embeddings)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./workspace --model models/encoder.onnx\n";
    std::cout << "  SONAVEC_INDEX_URL=http://qdrant:6333 " << progName << " ./workspace -w 4\n";
}

bool parsePositive(const std::string& text, int& out) {
    try {
        std::size_t pos = 0;
        int v = std::stoi(text, &pos);
        if (pos != text.size() || v <= 0) {
            return false;
        }
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    Logger::initFromEnv();

    std::filesystem::path workspace = argv[1];
    Config config = Config::fromEnv(workspace);

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;
        if ((arg == "-w" || arg == "--workers") && hasValue) {
            if (!parsePositive(argv[++i], config.workers)) {
                std::cerr << "Error: Invalid worker count\n";
                return 1;
            }
        } else if (arg == "--model" && hasValue) {
            config.modelPath = argv[++i];
        } else if (arg == "--data" && hasValue) {
            config.dataDir = argv[++i];
        } else if (arg == "--index" && hasValue) {
            config.indexUrl = argv[++i];
        } else {
            std::cerr << "Error: Unknown argument: " << arg << "\n";
            return 1;
        }
    }

    if (config.modelPath.empty() || !std::filesystem::exists(config.modelPath)) {
        std::cerr << "Error: Model not found: " << (config.modelPath.empty() ? "(none)" : config.modelPath) << "\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::cout << "\n";
    std::cout << "  \033[1msonavec\033[0m " << VERSION << "                     \033[90mpreviews · embeddings · index\033[0m\n";
    std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n\n";
    std::cout << "  Loading " << std::filesystem::path(config.modelPath).filename().string() << "\n" << std::flush;

    try {
        Server server(config, workspace);
        if (!server.start()) {
            std::cout << "  \033[31mFailed to start\033[0m\n";
            return 1;
        }

        std::filesystem::path pidPath = workspace / ".sonavecd.pid";
        {
            std::ofstream pf(pidPath);
            if (pf) {
                pf << getpid();
            }
        }

        std::cout << "\n";
        std::cout << "  \033[1mRUNNING\033[0m\n\n";
        std::cout << "    Model      " << config.modelPath << "\n";
        std::cout << "    Workers    " << config.workers << "\n";
        std::cout << "    Workspace  " << workspace.string() << "\n";
        std::cout << "    Data       " << config.dataDir.string() << "\n";
        std::cout << "    Index      " << config.indexUrl << " (" << config.collection << ")\n";
        std::cout << "    Queued     " << Scanner(workspace).readyJobCount() << "\n\n";
        std::cout << "  Submit:  ./enq " << workspace.string() << " request.json\n";
        std::cout << "  Status:  ./poll " << workspace.string() << " <job-id>\n\n";
        std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n\n";

        while (!g_shutdown_requested && server.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (g_shutdown_requested) {
            std::cout << "\nShutdown requested, stopping server..." << std::endl;
        }
        std::error_code ec;
        std::filesystem::remove(pidPath, ec);
        server.shutdown();

    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("sonavec daemon stopped");
    return 0;
}
