/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/pool.hpp"
#include "sonavec/logger.hpp"

namespace sonavec {

Pool::Pool(int workers) noexcept : workers_(workers > 0 ? workers : 1) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(JobHandler handler) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }
    if (!handler) {
        LOG_ERROR("Invalid job handler provided");
        return false;
    }

    handler_ = std::move(handler);
    shutdown_.store(false);
    running_.store(true);

    try {
        workerThreads_.reserve(static_cast<std::size_t>(workers_));
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }
        LOG_INFO("Pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_DEBUG("Stopping pool...");
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
    }
    jobAvailable_.notify_all();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!jobQueue_.empty()) {
            LOG_INFO(std::to_string(jobQueue_.size()) + " queued job(s) left for the next start");
        }
        jobQueue_.clear();
        inFlight_.clear();
        active_ = 0;
    }
    idle_.notify_all();

    LOG_INFO("Pool stopped");
}

bool Pool::submit(const JobId& jobId) noexcept {
    if (!running_.load() || jobId.empty()) {
        LOG_DEBUG("Cannot submit job to stopped pool: " + jobId);
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (shutdown_.load() || !inFlight_.insert(jobId).second) {
            return false;
        }
        jobQueue_.push_back(jobId);
    }
    jobAvailable_.notify_one();
    LOG_DEBUG("Job queued: " + jobId);
    return true;
}

bool Pool::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queueMutex_);
    return idle_.wait_for(lock, timeout, [this] { return jobQueue_.empty() && active_ == 0; });
}

std::size_t Pool::queueSize() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return jobQueue_.size();
}

std::size_t Pool::activeCount() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return active_;
}

void Pool::workerLoop(int workerId) {
    const std::string name = "Worker-" + std::to_string(workerId);
    setThreadName(name);
    LOG_DEBUG(name + " thread started");

    while (true) {
        JobId jobId;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            jobAvailable_.wait(lock, [this] { return !jobQueue_.empty() || shutdown_.load(); });
            if (shutdown_.load()) {
                break;
            }
            jobId = std::move(jobQueue_.front());
            jobQueue_.pop_front();
            ++active_;
        }

        LOG_INFO(name + " claimed job: " + jobId);
        try {
            handler_(jobId, workerId);
        } catch (const std::exception& e) {
            LOG_ERROR(name + " job processing error: " + std::string(e.what()) + " (job: " + jobId + ")");
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            --active_;
            inFlight_.erase(jobId);
        }
        idle_.notify_all();
    }

    LOG_DEBUG(name + " stopped");
}

}
