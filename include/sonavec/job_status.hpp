/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include <json/value.h>

#include "sonavec/types.hpp"

namespace sonavec {

inline constexpr const char* kRequestFile = "request.json";
inline constexpr const char* kStatusFile = "status.json";
inline constexpr const char* kResultFile = "result.json";
inline constexpr const char* kErrorFile = "error.txt";

struct JobStatus {
    JobId id;
    Stage state = Stage::Missing;
    std::string message;
    int progress = 0;
    Json::Value result;   // null until the job is terminal
    std::chrono::system_clock::time_point timestamp;

    // {"job_id", "state", "status", "progress", "result"?}
    [[nodiscard]] Json::Value toJson() const;
};

// {"state": "EMBEDDING", "status": "...", "progress": 80}
[[nodiscard]] Json::Value statusDocument(Stage stage, const std::string& message);

[[nodiscard]] bool writeStatusFile(const std::filesystem::path& jobDir, Stage stage,
                                   const std::string& message) noexcept;

// nullopt when status.json is absent or unreadable
[[nodiscard]] std::optional<JobStatus> readStatusFile(const std::filesystem::path& jobDir);

}
