/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/work.hpp"
#include "sonavec/job_status.hpp"
#include "sonavec/json_io.hpp"
#include "sonavec/logger.hpp"
#include <atomic>
#include <chrono>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace sonavec {

namespace {
std::filesystem::path writingDir(const std::filesystem::path& ws, const JobId& id) {
    return ws / "input" / "writing" / id;
}
}

bool createWorkspaceLayout(const std::filesystem::path& workspace) noexcept {
    try {
        std::filesystem::create_directories(workspace / "input" / "writing");
        std::filesystem::create_directories(workspace / "input" / "ready");
        std::filesystem::create_directories(workspace / "processing");
        std::filesystem::create_directories(workspace / "output");
        std::filesystem::create_directories(workspace / "failed");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create workspace: " + std::string(e.what()));
        return false;
    }
}

Work::Work(const std::filesystem::path& workspace, bool createIfMissing)
    : workspace_(workspace) {
    std::error_code ec;
    if (!createIfMissing && !std::filesystem::exists(workspace_, ec)) {
        LOG_ERROR("Workspace does not exist: " + workspace_.string());
        return;
    }
    ready_ = createWorkspaceLayout(workspace_);
    if (!ready_) {
        LOG_ERROR("Failed to initialize workspace: " + workspace_.string());
    }
}

SubmitResult Work::submit(const std::string& userId, const Json::Value& tracks) {
    if (!ready_) {
        return {false, "", SubmissionError::WorkspaceError, "Workspace is not available: " + workspace_.string()};
    }
    if (userId.empty()) {
        LOG_DEBUG("Rejected request without user_id");
        return {false, "", SubmissionError::InvalidContent, "user_id is required"};
    }
    if (!tracks.isArray()) {
        LOG_DEBUG("Rejected request: tracks is not an array");
        return {false, "", SubmissionError::InvalidContent, "tracks must be a JSON array"};
    }

    Json::Value request(Json::objectValue);
    request["user_id"] = userId;
    request["tracks"] = tracks;
    std::string body = toJsonString(request);
    if (body.size() > maxBytes_) {
        LOG_DEBUG("Request exceeds size limit: " + std::to_string(body.size()) + " > " + std::to_string(maxBytes_));
        return {false, "", SubmissionError::InvalidSize,
                "Request exceeds maximum size limit (" + std::to_string(maxBytes_) + " bytes)"};
    }

    JobId jobId = generateId();
    LOG_DEBUG("Generated job ID: " + jobId);

    if (!createJobDirectory(jobId)) {
        LOG_ERROR("Failed to create job directory for: " + jobId);
        return {false, "", SubmissionError::IoError, "Failed to create job directory"};
    }
    if (!writeRequestFile(jobId, body) || !writeInitialStatus(jobId)) {
        LOG_ERROR("Failed to write request for: " + jobId);
        cleanupFailedJob(jobId);
        return {false, "", SubmissionError::IoError, "Failed to write request file"};
    }
    if (!atomicPublish(jobId)) {
        LOG_ERROR("Failed to publish job: " + jobId);
        cleanupFailedJob(jobId);
        return {false, "", SubmissionError::IoError, "Failed to publish job"};
    }

    LOG_INFO("Job submitted for user " + userId + ": " + jobId + " (" + std::to_string(tracks.size()) + " tracks)");
    return {true, jobId, SubmissionError::None, ""};
}

SubmitResult Work::submitRequest(const std::string& requestJson) {
    if (requestJson.size() > maxBytes_) {
        return {false, "", SubmissionError::InvalidSize,
                "Request exceeds maximum size limit (" + std::to_string(maxBytes_) + " bytes)"};
    }
    Json::Value request;
    std::string err;
    if (!parseJson(requestJson, request, &err) || !request.isObject()) {
        return {false, "", SubmissionError::InvalidContent, "Request is not a JSON object " + err};
    }
    const Json::Value& user = request["user_id"];
    if (!user.isString() && !user.isIntegral()) {
        return {false, "", SubmissionError::InvalidContent, "user_id is required"};
    }
    return submit(user.asString(), request.get("tracks", Json::Value(Json::arrayValue)));
}

JobId Work::generateId() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::stringstream ss;
    ss << now << "_" << getpid() << "_" << unique_counter;
    return ss.str();
}

bool Work::createJobDirectory(const JobId& jobId) const noexcept {
    std::error_code ec;
    auto jobPath = writingDir(workspace_, jobId);
    std::filesystem::create_directories(jobPath, ec);
    return !ec && std::filesystem::is_directory(jobPath, ec);
}

bool Work::writeRequestFile(const JobId& jobId, const std::string& body) const noexcept {
    std::ofstream file(writingDir(workspace_, jobId) / kRequestFile, std::ios::binary);
    if (!file) return false;
    file << body;
    file.flush();
    return file.good();
}

bool Work::writeInitialStatus(const JobId& jobId) const noexcept {
    return writeStatusFile(writingDir(workspace_, jobId), Stage::Pending, "Pending...");
}

bool Work::atomicPublish(const JobId& jobId) const noexcept {
    std::error_code ec;
    std::filesystem::rename(writingDir(workspace_, jobId), workspace_ / "input" / "ready" / jobId, ec);
    if (ec) {
        LOG_ERROR("Publish failed for " + jobId + ": " + ec.message());
        return false;
    }
    return true;
}

void Work::cleanupFailedJob(const JobId& jobId) const noexcept {
    std::error_code ec;
    std::filesystem::remove_all(writingDir(workspace_, jobId), ec);
}

}
