/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <thread>

#include "sonavec/config.hpp"
#include "sonavec/fetcher.hpp"
#include "sonavec/index_client.hpp"

namespace sonavec {

class Scanner;
class Pool;
class Processor;
class Pipeline;
class AudioNormalizer;
class EmbeddingModel;

// Collaborators the daemon would otherwise build from its Config.
struct ServerParts {
    std::unique_ptr<EmbeddingModel> model;          // default: ONNX model at Config::modelPath
    TransportFactory transport;                     // default: Qdrant at Config::indexUrl
    Downloader downloader;                          // default: HTTP with Config::downloadTimeout
    std::shared_ptr<PreviewResolver> resolver;      // default: Config::resolverCommand, if set
};

class Server final {
public:
    Server(Config config, const std::filesystem::path& workspace);
    Server(Config config, const std::filesystem::path& workspace, ServerParts parts);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    [[nodiscard]] bool start();
    void shutdown() noexcept;

    void setScanInterval(std::chrono::milliseconds interval) noexcept { scanInterval_ = interval; }

    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return workspace_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    // Process-wide index client, created and prepared on first use.
    // Throws IndexConnectionError; the next call tries again.
    [[nodiscard]] std::shared_ptr<VectorIndexClient> indexClient();

private:
    [[nodiscard]] bool buildComponents();
    [[nodiscard]] bool recoverOrphanedJobs() noexcept;
    void scanLoop();

    Config config_;
    std::filesystem::path workspace_;
    ServerParts parts_;
    std::chrono::milliseconds scanInterval_{std::chrono::seconds(2)};

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    std::unique_ptr<AudioNormalizer> normalizer_;
    std::unique_ptr<Pipeline> pipeline_;
    std::unique_ptr<Scanner> scanner_;
    std::unique_ptr<Pool> pool_;
    std::unique_ptr<Processor> processor_;

    std::mutex indexMutex_;
    std::shared_ptr<VectorIndexClient> index_;

    std::thread scannerThread_;
};

}
