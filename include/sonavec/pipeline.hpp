/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include <json/value.h>

#include "sonavec/fetcher.hpp"
#include "sonavec/reducer.hpp"
#include "sonavec/types.hpp"

namespace sonavec {

class AudioNormalizer;
class EmbeddingModel;
class VectorIndexClient;

using StageListener = std::function<void(Stage stage, const std::string& message)>;

// Returns the process-wide index client, connecting on first use.
// Throws IndexConnectionError when the index is unavailable.
using IndexProvider = std::function<std::shared_ptr<VectorIndexClient>()>;

class JobCancelled : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct PipelineSettings {
    std::filesystem::path dataDir;
    int layer = -1;
    Reduction reduction = Reduction::Mean;
};

struct PipelineResult {
    Stage state = Stage::Failed;
    std::string message;
    std::size_t tracksProcessed = 0;
    std::size_t embeddingsGenerated = 0;
    std::filesystem::path embeddingsPath;

    [[nodiscard]] bool ok() const noexcept { return state == Stage::Completed; }
    [[nodiscard]] Json::Value toJson() const;
};

struct JobContext {
    JobId jobId;
    std::string userId;
    StageListener onStage;
    const std::atomic<bool>* cancelled = nullptr;
};

class Pipeline final {
public:
    Pipeline(PipelineSettings settings, std::shared_ptr<PreviewResolver> resolver, Downloader downloader,
             const AudioNormalizer& normalizer, const EmbeddingModel& model, IndexProvider index);

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // Drives one job through every stage. Validation problems end in a FAILED result.
    // Structural errors are reported as FAILED through onStage and then rethrown.
    [[nodiscard]] PipelineResult run(const JobContext& job, const Json::Value& rawTracks);

    [[nodiscard]] std::filesystem::path previewDir(const std::string& userId) const;
    [[nodiscard]] std::filesystem::path wavDir(const std::string& userId) const;
    [[nodiscard]] std::filesystem::path artifactPath(const std::string& userId) const;

private:
    PipelineResult execute(const JobContext& job, const Json::Value& rawTracks, Stage& current);

    PipelineSettings settings_;
    std::shared_ptr<PreviewResolver> resolver_;
    Downloader downloader_;
    const AudioNormalizer& normalizer_;
    const EmbeddingModel& model_;
    IndexProvider index_;
};

}
