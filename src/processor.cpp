/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/processor.hpp"
#include "sonavec/job_status.hpp"
#include "sonavec/json_io.hpp"
#include "sonavec/logger.hpp"
#include "sonavec/pipeline.hpp"
#include <atomic>
#include <condition_variable>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace {
std::mutex g_output_mutex;

std::string timestamp() {
    auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&time, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
    return buf;
}

void printJobLine(const std::string& jobId, const char* color, const char* label, const std::string& detail = "") {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << "    \033[90m" << timestamp() << "\033[0m  " << jobId << "  " << color << label << "\033[0m";
    if (!detail.empty()) {
        std::cout << "  " << detail;
    }
    std::cout << "\n" << std::flush;
}

std::string elapsedSince(std::chrono::steady_clock::time_point start) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1)
       << std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count() << "s";
    return ss.str();
}

// Fires onHardLimit once the hard limit passes, unless stopped first.
class Watchdog {
public:
    Watchdog(std::string jobId, sonavec::JobLimits limits, std::function<void()> onHardLimit)
        : jobId_(std::move(jobId)), limits_(limits), onHardLimit_(std::move(onHardLimit)) {
        thread_ = std::thread(&Watchdog::run, this);
    }

    ~Watchdog() { stop(); }

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    void stop() noexcept {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            finished_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    void run() {
        sonavec::setThreadName("Watchdog");
        std::unique_lock<std::mutex> lock(mutex_);
        auto done = [this] { return finished_; };
        if (cv_.wait_for(lock, limits_.soft, done)) {
            return;
        }
        LOG_WARN("Job " + jobId_ + " passed its soft time limit (" + std::to_string(limits_.soft.count()) + "ms)");
        auto remaining = limits_.hard > limits_.soft ? limits_.hard - limits_.soft : std::chrono::milliseconds(0);
        if (cv_.wait_for(lock, remaining, done)) {
            return;
        }
        lock.unlock();
        onHardLimit_();
    }

    std::string jobId_;
    sonavec::JobLimits limits_;
    std::function<void()> onHardLimit_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool finished_ = false;
    std::thread thread_;
};
}

namespace sonavec {

// Shared between the worker, the stage listener and the watchdog.
struct Processor::ActiveJob {
    std::mutex mutex;
    bool abandoned = false;
    std::atomic<bool> cancelled{false};
    std::string lastMessage;
};

Processor::Processor(const std::filesystem::path& workspace, Pipeline& pipeline, JobLimits limits)
    : workspace_(workspace), pipeline_(pipeline), limits_(limits) {
    LOG_DEBUG("Processor created for workspace: " + workspace_.string());
}

ProcessResult Processor::process(const JobId& jobId, int workerId) noexcept {
    LOG_DEBUG("Worker-" + std::to_string(workerId) + " processing job: " + jobId);

    if (!moveReadyToProcessing(jobId)) {
        LOG_DEBUG("Job not found or already claimed by another worker: " + jobId);
        return ProcessResult::NotFound;
    }

    printJobLine(jobId, "\033[33m", "running");
    auto startTime = std::chrono::steady_clock::now();
    auto processingDir = getJobPath("processing", jobId);

    ActiveJob active;
    {
        std::lock_guard<std::mutex> lock(active.mutex);
        (void)writeStatusFile(processingDir, Stage::Started, "Task started...");
    }

    Json::Value request;
    if (!readRequest(jobId, request)) {
        printJobLine(jobId, "\033[31m", "failed", "unreadable request");
        (void)finalizeFailure(jobId, "Failed to read request file");
        return ProcessResult::Failed;
    }

    JobContext context;
    context.jobId = jobId;
    context.userId = request["user_id"].asString();
    context.cancelled = &active.cancelled;
    context.onStage = [&active, processingDir](Stage stage, const std::string& message) {
        std::lock_guard<std::mutex> lock(active.mutex);
        if (active.abandoned) {
            return;
        }
        active.lastMessage = message;
        (void)writeStatusFile(processingDir, stage, message);
    };

    try {
        Watchdog watchdog(jobId, limits_, [this, &jobId, &active] { abandon(jobId, active); });
        PipelineResult result = pipeline_.run(context, request["tracks"]);
        watchdog.stop();

        std::lock_guard<std::mutex> lock(active.mutex);
        if (active.abandoned) {
            LOG_WARN("Discarding late result for timed out job: " + jobId);
            return ProcessResult::TimedOut;
        }
        if (result.ok()) {
            Json::Value payload = result.toJson();
            payload["user_id"] = context.userId;
            if (!finalizeSuccess(jobId, payload)) {
                LOG_ERROR("Failed to finalize successful job: " + jobId);
                return ProcessResult::SystemError;
            }
            printJobLine(jobId, "\033[32m", "done",
                         elapsedSince(startTime) + "  " + std::to_string(result.embeddingsGenerated) + "/" +
                         std::to_string(result.tracksProcessed) + " embedded");
            LOG_INFO("JOB COMPLETED: " + jobId + " -> " + result.embeddingsPath.string());
            return ProcessResult::Success;
        }
        printJobLine(jobId, "\033[31m", "failed", elapsedSince(startTime) + "  " + result.message);
        (void)finalizeFailure(jobId, result.message);
        return ProcessResult::Failed;
    } catch (const JobCancelled& e) {
        LOG_WARN("Job " + jobId + " stopped after its hard time limit: " + e.what());
        return ProcessResult::TimedOut;
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(active.mutex);
        if (active.abandoned) {
            return ProcessResult::TimedOut;
        }
        std::string error = active.lastMessage.empty() ? std::string("Internal processing error: ") + e.what()
                                                       : active.lastMessage;
        printJobLine(jobId, "\033[31m", "failed", elapsedSince(startTime) + "  " + error);
        (void)finalizeFailure(jobId, error);
        return ProcessResult::SystemError;
    }
}

void Processor::abandon(const JobId& jobId, ActiveJob& job) noexcept {
    std::lock_guard<std::mutex> lock(job.mutex);
    if (job.abandoned) {
        return;
    }
    job.abandoned = true;
    job.cancelled.store(true);
    const auto hardMs = limits_.hard.count();
    std::string error = "Job exceeded the hard time limit of " +
                        (hardMs % 1000 == 0 ? std::to_string(hardMs / 1000) + "s" : std::to_string(hardMs) + "ms");
    LOG_ERROR(jobId + ": " + error);
    printJobLine(jobId, "\033[31m", "failed", "time limit");
    (void)finalizeFailure(jobId, error);
}

bool Processor::moveReadyToProcessing(const JobId& jobId) noexcept {
    std::error_code ec;
    std::filesystem::rename(getJobPath("input/ready", jobId), getJobPath("processing", jobId), ec);
    if (ec) {
        // Another worker already claimed it, or the job was withdrawn
        LOG_DEBUG("Job already claimed or missing: " + jobId + " (" + ec.message() + ")");
        return false;
    }
    LOG_DEBUG("Job moved to processing: " + jobId);
    return true;
}

bool Processor::finalizeSuccess(const JobId& jobId, const Json::Value& result) noexcept {
    auto processingPath = getJobPath("processing", jobId);
    if (!writeJsonFileAtomic(processingPath / kResultFile, result)) {
        LOG_ERROR("Failed to write result for job " + jobId);
        return false;
    }
    (void)writeStatusFile(processingPath, Stage::Completed, result.get("message", "").asString());

    std::error_code ec;
    std::filesystem::rename(processingPath, getJobPath("output", jobId), ec);
    if (ec) {
        LOG_ERROR("Failed to finalize success for job " + jobId + ": " + ec.message());
        return false;
    }
    LOG_DEBUG("Job finalized successfully: " + jobId);
    return true;
}

bool Processor::finalizeFailure(const JobId& jobId, const std::string& error) noexcept {
    auto processingPath = getJobPath("processing", jobId);

    Json::Value result(Json::objectValue);
    result["status"] = stageToString(Stage::Failed);
    result["message"] = error;
    if (!writeJsonFileAtomic(processingPath / kResultFile, result)) {
        LOG_WARN("Failed to write failure result for job " + jobId);
    }
    (void)writeStatusFile(processingPath, Stage::Failed, error);
    {
        std::ofstream file(processingPath / kErrorFile, std::ios::binary);
        if (file) {
            file << error;
            file.flush();
        }
    }

    std::error_code ec;
    std::filesystem::rename(processingPath, getJobPath("failed", jobId), ec);
    if (ec) {
        LOG_ERROR("Failed to finalize failure for job " + jobId + ": " + ec.message());
        return false;
    }
    LOG_DEBUG("Job moved to failed: " + jobId);
    return true;
}

bool Processor::readRequest(const JobId& jobId, Json::Value& request) const noexcept {
    std::string err;
    auto path = getJobPath("processing", jobId) / kRequestFile;
    if (!readJsonFile(path, request, &err) || !request.isObject()) {
        LOG_ERROR("Unreadable request " + path.string() + ": " + err);
        return false;
    }
    if (!request["user_id"].isConvertibleTo(Json::stringValue)) {
        LOG_ERROR("Request without user_id: " + path.string());
        return false;
    }
    return true;
}

std::filesystem::path Processor::getJobPath(const char* phase, const JobId& jobId) const {
    return workspace_ / phase / jobId;
}

}
