/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include <json/value.h>

#include "sonavec/types.hpp"

namespace sonavec {

class Pipeline;

enum class ProcessResult : uint8_t {
    Success,
    Failed,
    NotFound,
    SystemError,
    TimedOut
};

// Wall-clock budget for one job. Past soft a warning is logged; past hard the job
// is marked FAILED and everything it produces afterwards is discarded.
struct JobLimits {
    std::chrono::milliseconds soft{std::chrono::seconds(1500)};
    std::chrono::milliseconds hard{std::chrono::seconds(1800)};
};

class Processor {
public:
    Processor(const std::filesystem::path& workspace, Pipeline& pipeline, JobLimits limits = {});

    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;
    Processor(Processor&&) = delete;
    Processor& operator=(Processor&&) = delete;

    // Claims the job from input/ready and runs it to a terminal directory.
    [[nodiscard]] ProcessResult process(const JobId& jobId, int workerId) noexcept;

private:
    struct ActiveJob;

    std::filesystem::path workspace_;
    Pipeline& pipeline_;
    JobLimits limits_;

    [[nodiscard]] bool moveReadyToProcessing(const JobId& jobId) noexcept;
    [[nodiscard]] bool finalizeSuccess(const JobId& jobId, const Json::Value& result) noexcept;
    [[nodiscard]] bool finalizeFailure(const JobId& jobId, const std::string& error) noexcept;
    void abandon(const JobId& jobId, ActiveJob& job) noexcept;

    [[nodiscard]] bool readRequest(const JobId& jobId, Json::Value& request) const noexcept;
    [[nodiscard]] std::filesystem::path getJobPath(const char* phase, const JobId& jobId) const;
};

}
