/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/server.hpp"
#include "sonavec/logger.hpp"
#include "sonavec/model.hpp"
#include "sonavec/normalizer.hpp"
#include "sonavec/pipeline.hpp"
#include "sonavec/pool.hpp"
#include "sonavec/processor.hpp"
#include "sonavec/qdrant.hpp"
#include "sonavec/scanner.hpp"
#include "sonavec/work.hpp"

namespace sonavec {

// Signal handling is done by the CLI (sonavecd.cpp), not by Server

Server::Server(Config config, const std::filesystem::path& workspace)
    : Server(std::move(config), workspace, ServerParts{}) {
}

Server::Server(Config config, const std::filesystem::path& workspace, ServerParts parts)
    : config_(std::move(config)), workspace_(workspace), parts_(std::move(parts)) {
    LOG_DEBUG("Server created - workspace: " + workspace_.string() + ", workers: " + std::to_string(config_.workers));
}

Server::~Server() {
    shutdown();
}

bool Server::start() {
    if (running_.load()) {
        LOG_WARN("Server already running");
        return false;
    }

    LOG_INFO("Starting sonavec server...");
    setThreadName("Main");

    if (!createWorkspaceLayout(workspace_)) {
        LOG_ERROR("Failed to create workspace");
        return false;
    }
    if (!recoverOrphanedJobs()) {
        LOG_WARN("Some orphaned jobs could not be recovered");
    }

    LOG_DEBUG("Workspace: " + workspace_.string());
    LOG_DEBUG("Data dir: " + config_.dataDir.string());
    LOG_DEBUG("Index: " + config_.indexUrl + " (collection " + config_.collection + ")");
    LOG_DEBUG("Workers: " + std::to_string(config_.workers));

    if (!buildComponents()) {
        return false;
    }

    if (!pool_->start([this](const JobId& jobId, int workerId) {
            (void)processor_->process(jobId, workerId);
        })) {
        LOG_ERROR("Failed to start worker pool");
        return false;
    }

    shutdown_.store(false);
    running_.store(true);
    scannerThread_ = std::thread(&Server::scanLoop, this);

    LOG_DEBUG("Server started successfully");
    return true;
}

bool Server::buildComponents() {
    auto reduction = parseReduction(config_.reduce);
    if (!reduction) {
        LOG_ERROR("Unknown reduction: " + config_.reduce);
        return false;
    }

    try {
        if (!parts_.model) {
            if (config_.modelPath.empty()) {
                LOG_ERROR("No embedding model configured (SONAVEC_MODEL or --model)");
                return false;
            }
            LOG_INFO("Loading embedding model: " + config_.modelPath);
            parts_.model = std::make_unique<OnnxEmbeddingModel>(config_.modelPath, config_.ortThreads);
        }
        if (!parts_.transport) {
            parts_.transport =
                qdrantFactory(config_.indexUrl, std::chrono::duration_cast<std::chrono::milliseconds>(config_.indexTimeout));
        }
        if (!parts_.downloader) {
            parts_.downloader =
                httpDownloader(std::chrono::duration_cast<std::chrono::milliseconds>(config_.downloadTimeout));
        }
        if (!parts_.resolver && !config_.resolverCommand.empty()) {
            parts_.resolver = std::make_shared<CommandPreviewResolver>(config_.resolverCommand,
                                                                       config_.dataDir / "resolver");
        }

        PipelineSettings settings;
        settings.dataDir = config_.dataDir;
        settings.layer = config_.layer;
        settings.reduction = *reduction;

        normalizer_ = std::make_unique<AudioNormalizer>();
        pipeline_ = std::make_unique<Pipeline>(settings, parts_.resolver, parts_.downloader, *normalizer_,
                                               *parts_.model, [this] { return indexClient(); });

        JobLimits limits;
        limits.soft = config_.softLimit;
        limits.hard = config_.hardLimit;

        scanner_ = std::make_unique<Scanner>(workspace_);
        pool_ = std::make_unique<Pool>(config_.workers);
        processor_ = std::make_unique<Processor>(workspace_, *pipeline_, limits);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start server: " + std::string(e.what()));
        return false;
    }
}

std::shared_ptr<VectorIndexClient> Server::indexClient() {
    std::lock_guard<std::mutex> lock(indexMutex_);
    if (index_) {
        return index_;
    }

    IndexOptions options;
    options.collection = config_.collection;
    options.recreateCollection = config_.recreateCollection;
    options.retry.baseDelay = config_.retryBaseDelay;

    auto client = std::make_shared<VectorIndexClient>(parts_.transport, options);
    client->ensureCollection();
    LOG_INFO("Vector index ready: " + config_.indexUrl + "/collections/" + config_.collection);
    index_ = client;
    return index_;
}

void Server::shutdown() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("Shutting down server...");
    shutdown_.store(true);
    running_.store(false);

    if (scannerThread_.joinable()) {
        scannerThread_.join();
    }
    // Running jobs finish before the pool returns
    if (pool_) {
        pool_->stop();
    }

    processor_.reset();
    pool_.reset();
    scanner_.reset();
    pipeline_.reset();
    normalizer_.reset();

    LOG_INFO("Server shutdown complete");
}

bool Server::recoverOrphanedJobs() noexcept {
    auto processingDir = workspace_ / "processing";
    int recovered = 0;
    bool clean = true;

    try {
        for (const auto& entry : std::filesystem::directory_iterator(processingDir)) {
            if (!entry.is_directory()) {
                continue;
            }
            std::string jobId = entry.path().filename().string();
            LOG_WARN("Recovering orphaned job: " + jobId);

            std::error_code ec;
            std::filesystem::rename(entry.path(), workspace_ / "input" / "ready" / jobId, ec);
            if (ec) {
                LOG_ERROR("Failed to recover job " + jobId + ": " + ec.message());
                std::filesystem::rename(entry.path(), workspace_ / "failed" / jobId, ec);
                clean = false;
            } else {
                ++recovered;
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error recovering orphaned jobs: " + std::string(e.what()));
        return false;
    }

    if (recovered > 0) {
        LOG_INFO("Recovered " + std::to_string(recovered) + " orphaned job(s)");
    }
    return clean;
}

void Server::scanLoop() {
    setThreadName("Scanner");
    LOG_DEBUG("Scanner loop started");

    while (!shutdown_.load()) {
        int newCount = 0;
        for (const auto& jobId : scanner_->scan()) {
            if (shutdown_.load()) break;
            if (pool_->submit(jobId)) {
                ++newCount;
            }
        }
        if (newCount > 0) {
            LOG_DEBUG("Submitted " + std::to_string(newCount) + " new jobs to pool");
        }

        auto sleepEnd = std::chrono::steady_clock::now() + scanInterval_;
        while (std::chrono::steady_clock::now() < sleepEnd && !shutdown_.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }

    LOG_DEBUG("Scanner loop stopped");
}

}
