/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/scanner.hpp"
#include "sonavec/job_status.hpp"
#include "sonavec/logger.hpp"
#include <algorithm>

namespace sonavec {

Scanner::Scanner(const std::filesystem::path& workspace) noexcept
    : readyPath_(workspace / "input" / "ready") {
}

std::vector<JobId> Scanner::scan() const noexcept {
    std::vector<JobId> jobs;
    std::error_code ec;
    if (!std::filesystem::is_directory(readyPath_, ec)) {
        LOG_DEBUG("Ready directory does not exist: " + readyPath_.string());
        return jobs;
    }

    try {
        for (const auto& entry : std::filesystem::directory_iterator(readyPath_)) {
            if (isValidJobDirectory(entry.path())) {
                jobs.push_back(entry.path().filename().string());
                LOG_TRACE("Found job: " + jobs.back());
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Scanner error: " + std::string(e.what()));
    }

    // Tokens start with the submission time
    std::sort(jobs.begin(), jobs.end());
    if (!jobs.empty()) {
        LOG_DEBUG("Scanner found " + std::to_string(jobs.size()) + " ready jobs");
    }
    return jobs;
}

bool Scanner::isValidJobDirectory(const std::filesystem::path& dir) noexcept {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return false;
    }
    auto request = dir / kRequestFile;
    if (!std::filesystem::is_regular_file(request, ec) || std::filesystem::file_size(request, ec) == 0 || ec) {
        LOG_DEBUG("Invalid job directory (missing " + std::string(kRequestFile) + "): " + dir.string());
        return false;
    }
    return true;
}

}
