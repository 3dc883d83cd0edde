/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/job_status.hpp"
#include "sonavec/json_io.hpp"
#include "sonavec/logger.hpp"

namespace sonavec {

Json::Value JobStatus::toJson() const {
    Json::Value v(Json::objectValue);
    v["job_id"] = id;
    v["state"] = stageToString(state);
    v["status"] = message;
    v["progress"] = progress;
    if (!result.isNull()) {
        v["result"] = result;
    }
    return v;
}

Json::Value statusDocument(Stage stage, const std::string& message) {
    Json::Value v(Json::objectValue);
    v["state"] = stageToString(stage);
    v["status"] = message;
    v["progress"] = stageProgress(stage);
    return v;
}

bool writeStatusFile(const std::filesystem::path& jobDir, Stage stage, const std::string& message) noexcept {
    try {
        return writeJsonFileAtomic(jobDir / kStatusFile, statusDocument(stage, message));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to write status for " + jobDir.filename().string() + ": " + e.what());
        return false;
    }
}

std::optional<JobStatus> readStatusFile(const std::filesystem::path& jobDir) {
    Json::Value doc;
    std::string err;
    if (!readJsonFile(jobDir / kStatusFile, doc, &err) || !doc.isObject()) {
        LOG_TRACE("No readable status in " + jobDir.string() + " " + err);
        return std::nullopt;
    }
    JobStatus status;
    status.id = jobDir.filename().string();
    status.state = stageFromString(doc.get("state", "").asString());
    status.message = doc.get("status", "").asString();
    status.progress = doc.get("progress", stageProgress(status.state)).asInt();
    return status;
}

}
