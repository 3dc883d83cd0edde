/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "sonavec/job_status.hpp"
#include "sonavec/types.hpp"

namespace sonavec {

// Read side of the workspace: status lookups and release of finished jobs.
class Flow {
public:
    explicit Flow(const std::filesystem::path& workspace) noexcept;

    Flow(const Flow&) = delete;
    Flow& operator=(const Flow&) = delete;
    Flow(Flow&&) noexcept = default;
    Flow& operator=(Flow&&) noexcept = default;

    // state is Stage::Missing for unknown or released tokens
    [[nodiscard]] JobStatus status(const JobId& id) const noexcept;
    [[nodiscard]] std::optional<JobStatus> get(const JobId& id) const noexcept;

    // Jobs in every phase, newest first
    [[nodiscard]] std::vector<JobStatus> list(std::size_t max = 10) const noexcept;
    [[nodiscard]] std::optional<JobStatus> latest() const noexcept;

    [[nodiscard]] std::optional<std::string> error(const JobId& id) const;

    // Removes a COMPLETED or FAILED job. Returns false for unknown or unfinished jobs.
    [[nodiscard]] bool release(const JobId& id) noexcept;

private:
    std::filesystem::path workspace_;

    [[nodiscard]] std::optional<std::filesystem::path> locate(const JobId& id, Stage& phase) const noexcept;
};

}
