/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/flow.hpp"
#include "sonavec/json_io.hpp"
#include "sonavec/logger.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <utility>

namespace sonavec {

namespace {
std::chrono::system_clock::time_point modifiedAt(const std::filesystem::path& path) {
    std::error_code ec;
    auto timestamp = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return std::chrono::system_clock::now();
    }
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        timestamp - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
}

std::string readText(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    while (!content.empty() && (content.back() == '\n' || content.back() == '\r')) {
        content.pop_back();
    }
    return content;
}

// Token validation: ids are single path components produced by Work
bool isSafeId(const JobId& id) {
    return !id.empty() && id != "." && id != ".." && id.find('/') == std::string::npos;
}
}

Flow::Flow(const std::filesystem::path& workspace) noexcept
    : workspace_(workspace) {
}

std::optional<std::filesystem::path> Flow::locate(const JobId& id, Stage& phase) const noexcept {
    if (!isSafeId(id)) {
        return std::nullopt;
    }
    // Terminal phases first: a job is only ever moved forward
    const std::pair<const char*, Stage> phases[] = {
        {"output", Stage::Completed},
        {"failed", Stage::Failed},
        {"processing", Stage::Started},
        {"input/ready", Stage::Pending},
    };
    std::error_code ec;
    for (const auto& p : phases) {
        auto dir = workspace_ / p.first / id;
        if (std::filesystem::is_directory(dir, ec)) {
            phase = p.second;
            return dir;
        }
    }
    return std::nullopt;
}

JobStatus Flow::status(const JobId& id) const noexcept {
    JobStatus status;
    status.id = id;
    status.timestamp = std::chrono::system_clock::now();

    try {
        Stage phase = Stage::Missing;
        auto dir = locate(id, phase);
        if (!dir) {
            status.message = "Job not found";
            return status;
        }
        status.timestamp = modifiedAt(*dir);

        auto recorded = readStatusFile(*dir);
        switch (phase) {
            case Stage::Completed: {
                status.state = Stage::Completed;
                status.message = recorded ? recorded->message : "Task completed successfully";
                Json::Value result;
                if (readJsonFile(*dir / kResultFile, result)) {
                    status.result = result;
                    if (status.message.empty()) status.message = result.get("message", "").asString();
                }
                break;
            }
            case Stage::Failed: {
                status.state = Stage::Failed;
                auto err = error(id);
                status.message = err ? *err : (recorded ? recorded->message : "Task failed");
                Json::Value result;
                if (readJsonFile(*dir / kResultFile, result)) {
                    status.result = result;
                }
                break;
            }
            case Stage::Started:
                // Between claim and the first status write the file may still say PENDING
                if (recorded && recorded->state != Stage::Pending && recorded->state != Stage::Missing) {
                    status.state = recorded->state;
                    status.message = recorded->message;
                } else {
                    status.state = Stage::Started;
                    status.message = "Task started...";
                }
                break;
            default:
                status.state = Stage::Pending;
                status.message = "Pending...";
                break;
        }
        status.progress = stageProgress(status.state);
    } catch (const std::exception& e) {
        LOG_ERROR("Error reading status for job " + id + ": " + e.what());
        status.state = Stage::Missing;
        status.message = "Job not found";
    }
    return status;
}

std::optional<JobStatus> Flow::get(const JobId& id) const noexcept {
    JobStatus s = status(id);
    if (s.state == Stage::Missing) {
        return std::nullopt;
    }
    return s;
}

std::vector<JobStatus> Flow::list(std::size_t max) const noexcept {
    std::vector<JobStatus> jobs;
    try {
        for (const char* phase : {"output", "failed", "processing", "input/ready"}) {
            std::error_code ec;
            auto dir = workspace_ / phase;
            if (!std::filesystem::is_directory(dir, ec)) {
                continue;
            }
            for (const auto& entry : std::filesystem::directory_iterator(dir)) {
                if (entry.is_directory()) {
                    jobs.push_back(status(entry.path().filename().string()));
                }
            }
        }

        std::sort(jobs.begin(), jobs.end(), [](const JobStatus& a, const JobStatus& b) {
            return a.timestamp > b.timestamp;
        });
        if (jobs.size() > max) {
            jobs.resize(max);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error listing jobs: " + std::string(e.what()));
    }
    return jobs;
}

std::optional<JobStatus> Flow::latest() const noexcept {
    auto jobs = list(1);
    if (jobs.empty()) {
        return std::nullopt;
    }
    return jobs.front();
}

std::optional<std::string> Flow::error(const JobId& id) const {
    if (!isSafeId(id)) {
        return std::nullopt;
    }
    auto errorFile = workspace_ / "failed" / id / kErrorFile;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(errorFile, ec)) {
        return std::nullopt;
    }
    return readText(errorFile);
}

bool Flow::release(const JobId& id) noexcept {
    Stage phase = Stage::Missing;
    auto dir = locate(id, phase);
    if (!dir) {
        LOG_DEBUG("Release of unknown job: " + id);
        return false;
    }
    if (!isTerminal(phase)) {
        LOG_WARN("Refusing to release unfinished job: " + id);
        return false;
    }
    std::error_code ec;
    std::filesystem::remove_all(*dir, ec);
    if (ec) {
        LOG_ERROR("Failed to release job " + id + ": " + ec.message());
        return false;
    }
    LOG_INFO("Released job: " + id);
    return true;
}

}
