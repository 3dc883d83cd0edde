/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <vector>

#include "sonavec/types.hpp"

namespace sonavec {

// Lists published jobs waiting in input/ready, oldest token first.
class Scanner {
public:
    explicit Scanner(const std::filesystem::path& workspace) noexcept;

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;
    Scanner(Scanner&&) noexcept = default;
    Scanner& operator=(Scanner&&) noexcept = default;

    [[nodiscard]] std::vector<JobId> scan() const noexcept;
    [[nodiscard]] std::size_t readyJobCount() const noexcept { return scan().size(); }

private:
    std::filesystem::path readyPath_;

    [[nodiscard]] static bool isValidJobDirectory(const std::filesystem::path& dir) noexcept;
};

}
