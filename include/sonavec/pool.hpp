/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <vector>

#include "sonavec/types.hpp"

namespace sonavec {

using JobHandler = std::function<void(const JobId&, int workerId)>;

// Fixed set of worker threads fed from a FIFO of job tokens.
// A token that is queued or running is not queued a second time.
class Pool {
public:
    explicit Pool(int workers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(JobHandler handler);
    void stop() noexcept;

    // Returns false when the pool is stopped or the token is already known.
    bool submit(const JobId& jobId) noexcept;

    // Blocks until the queue is empty and no job is running, or the timeout expires.
    [[nodiscard]] bool waitIdle(std::chrono::milliseconds timeout);

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] std::size_t activeCount() const noexcept;
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

private:
    void workerLoop(int workerId);

    int workers_;
    JobHandler handler_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex queueMutex_;
    std::condition_variable jobAvailable_;
    std::condition_variable idle_;
    std::deque<JobId> jobQueue_;
    std::unordered_set<JobId> inFlight_;   // queued or running
    std::size_t active_ = 0;

    std::vector<std::thread> workerThreads_;
};

}
