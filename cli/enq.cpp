/*
 * sonavec - Job submission tool (enq)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/json_io.hpp"
#include "sonavec/logger.hpp"
#include "sonavec/work.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <unistd.h>

using namespace sonavec;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "sonavec Job Submission Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> <request.json>\n";
    std::cout << "       " << progName << " <workspace> --user <id> <tracks.json>\n";
    std::cout << "       " << progName << " <workspace> -     (read request from stdin)\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace     Directory for job storage\n";
    std::cout << "  request.json  {\"user_id\": \"...\", \"tracks\": [...]}\n";
    std::cout << "  tracks.json   Bare track array, used with --user\n\n";
    std::cout << "Prints the job token on success.\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  SONAVEC_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./workspace library.json\n";
    std::cout << "  " << progName << " ./workspace --user alice liked_tracks.json\n";
    std::cout << "  cat library.json | " << progName << " ./workspace -\n";
}

bool readInput(const std::string& source, std::string& out) {
    if (source == "-") {
        out.assign((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
        return true;
    }
    std::ifstream file(source, std::ios::binary);
    if (!file) {
        return false;
    }
    out.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return true;
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; SONAVEC_LOG_LEVEL overrides
    if (!std::getenv("SONAVEC_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

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

    std::string workspace = argv[1];
    std::string userId;
    std::string source;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--user" || arg == "-u") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --user requires an id\n";
                return 1;
            }
            userId = argv[++i];
        } else {
            source = arg;
        }
    }
    if (source.empty()) {
        if (isatty(fileno(stdin))) {
            printUsage(argv[0]);
            return 1;
        }
        source = "-";
    }

    std::string body;
    if (!readInput(source, body)) {
        std::cerr << "Error: Cannot read " << source << "\n";
        return 1;
    }

    try {
        Work work(workspace, true);

        SubmitResult result;
        if (userId.empty()) {
            result = work.submitRequest(body);
        } else {
            Json::Value tracks;
            std::string err;
            if (!parseJson(body, tracks, &err)) {
                std::cerr << "Error: Invalid JSON: " << err << "\n";
                return 1;
            }
            result = work.submit(userId, tracks);
        }

        if (!result.ok) {
            std::cerr << "Error: " << result.message << std::endl;
            return 1;
        }
        // Just the job token, clean for piping
        std::cout << result.id << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
