/*
 * sonavec - Job status tool (poll)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/flow.hpp"
#include "sonavec/json_io.hpp"
#include "sonavec/logger.hpp"
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <unistd.h>

using namespace sonavec;

void printUsage(const char* progName) {
    std::cout << "sonavec Job Status Tool\n\n";
    std::cout << "Usage: " << progName << " <workspace> [job_id] [--wait] [--release]\n";
    std::cout << "       " << progName << " <workspace> --list [n]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace     Directory for job storage\n";
    std::cout << "  job_id        Job token printed by enq (default: latest job)\n\n";
    std::cout << "Options:\n";
    std::cout << "  -w, --wait    Block until the job is COMPLETED or FAILED\n";
    std::cout << "  -r, --release Remove the job once it is finished\n";
    std::cout << "  -l, --list    Show the most recent jobs\n\n";
    std::cout << "Output is one JSON document: {job_id, state, status, progress, result}.\n";
    std::cout << "Exit status: 0 completed, 1 failed or missing, 2 still running.\n";
}

int main(int argc, char* argv[]) {
    if (!std::getenv("SONAVEC_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }
    std::string first = argv[1];
    if (first == "-h" || first == "--help") {
        printUsage(argv[0]);
        return 0;
    }

    std::string workspace = argv[1];
    std::string jobId;
    bool wait = false;
    bool release = false;
    bool list = false;
    std::size_t listMax = 10;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-w" || arg == "--wait") {
            wait = true;
        } else if (arg == "-r" || arg == "--release") {
            release = true;
        } else if (arg == "-l" || arg == "--list") {
            list = true;
            if (i + 1 < argc && std::isdigit(static_cast<unsigned char>(argv[i + 1][0]))) {
                listMax = static_cast<std::size_t>(std::strtoul(argv[++i], nullptr, 10));
            }
        } else {
            jobId = arg;
        }
    }

    // Token piped from enq
    if (jobId.empty() && !list && !isatty(fileno(stdin))) {
        std::cin >> jobId;
    }

    try {
        Flow flow(workspace);

        if (list) {
            Json::Value jobs(Json::arrayValue);
            for (const auto& job : flow.list(listMax)) {
                Json::Value entry = job.toJson();
                entry.removeMember("result");
                jobs.append(entry);
            }
            std::cout << toJsonString(jobs, true) << std::endl;
            return 0;
        }

        if (jobId.empty()) {
            auto latest = flow.latest();
            if (!latest) {
                std::cerr << "No jobs found" << std::endl;
                return 1;
            }
            jobId = latest->id;
        }

        JobStatus status = flow.status(jobId);
        while (wait && status.state != Stage::Missing && !isTerminal(status.state)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
            status = flow.status(jobId);
        }

        std::cout << toJsonString(status.toJson(), true) << std::endl;

        if (status.state == Stage::Missing) {
            return 1;
        }
        if (!isTerminal(status.state)) {
            return 2;
        }
        if (release && !flow.release(jobId)) {
            std::cerr << "Error: Could not release " << jobId << std::endl;
            return 1;
        }
        return status.state == Stage::Completed ? 0 : 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
