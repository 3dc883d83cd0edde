/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

#include <json/value.h>

#include "sonavec/types.hpp"

namespace sonavec {

enum class SubmissionError : uint8_t {
    None = 0,
    IoError,
    InvalidSize,
    InvalidContent,
    WorkspaceError
};

struct SubmitResult {
    bool ok = false;
    JobId id;
    SubmissionError error = SubmissionError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Creates the workspace directory layout. Returns false when it cannot be created.
[[nodiscard]] bool createWorkspaceLayout(const std::filesystem::path& workspace) noexcept;

class Work final {
public:
    explicit Work(const std::filesystem::path& workspace, bool createIfMissing = true);

    Work(const Work&) = delete;
    Work& operator=(const Work&) = delete;
    Work(Work&&) noexcept = default;
    Work& operator=(Work&&) noexcept = default;

    // tracks must be a JSON array; an empty array is accepted and fails later in the pipeline.
    [[nodiscard]] SubmitResult submit(const std::string& userId, const Json::Value& tracks);

    // Accepts a serialized {"user_id": ..., "tracks": [...]} request.
    [[nodiscard]] SubmitResult submitRequest(const std::string& requestJson);

    void setMaxSize(std::size_t maxBytes) noexcept { maxBytes_ = maxBytes; }
    [[nodiscard]] std::size_t maxSize() const noexcept { return maxBytes_; }
    [[nodiscard]] bool ready() const noexcept { return ready_; }

private:
    std::filesystem::path workspace_;
    std::size_t maxBytes_ = 10'000'000;
    bool ready_ = false;

    [[nodiscard]] static JobId generateId();

    [[nodiscard]] bool createJobDirectory(const JobId& jobId) const noexcept;
    [[nodiscard]] bool writeRequestFile(const JobId& jobId, const std::string& body) const noexcept;
    [[nodiscard]] bool writeInitialStatus(const JobId& jobId) const noexcept;
    [[nodiscard]] bool atomicPublish(const JobId& jobId) const noexcept;
    void cleanupFailedJob(const JobId& jobId) const noexcept;
};

}
