/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/pipeline.hpp"
#include "sonavec/index_client.hpp"
#include "sonavec/json_io.hpp"
#include "sonavec/logger.hpp"
#include "sonavec/model.hpp"
#include "sonavec/normalizer.hpp"
#include "sonavec/wav.hpp"
#include <algorithm>
#include <map>
#include <set>

namespace sonavec {

namespace {
constexpr std::size_t kMaxErrorLength = 300;

// Single line, printable, bounded: safe to hand back to callers.
std::string sanitizeError(const std::string& text) {
    std::string out;
    out.reserve(std::min(text.size(), kMaxErrorLength));
    for (char c : text) {
        if (out.size() >= kMaxErrorLength) {
            out += "...";
            break;
        }
        unsigned char uc = static_cast<unsigned char>(c);
        out.push_back(uc < 0x20 || uc == 0x7f ? ' ' : c);
    }
    return out;
}

void checkCancelled(const JobContext& job) {
    if (job.cancelled && job.cancelled->load()) {
        throw JobCancelled("job " + job.jobId + " exceeded its time limit");
    }
}

PipelineResult failed(const std::string& message, std::size_t tracksProcessed = 0) {
    PipelineResult r;
    r.state = Stage::Failed;
    r.message = message;
    r.tracksProcessed = tracksProcessed;
    return r;
}

Json::Value vectorJson(const std::vector<float>& v) {
    Json::Value arr(Json::arrayValue);
    for (float x : v) {
        arr.append(static_cast<double>(x));
    }
    return arr;
}
}

Json::Value PipelineResult::toJson() const {
    Json::Value v(Json::objectValue);
    v["status"] = stageToString(state);
    v["message"] = message;
    v["tracks_processed"] = static_cast<Json::UInt64>(tracksProcessed);
    v["embeddings_generated"] = static_cast<Json::UInt64>(embeddingsGenerated);
    if (!embeddingsPath.empty()) {
        v["embeddings_path"] = embeddingsPath.string();
    }
    return v;
}

Pipeline::Pipeline(PipelineSettings settings, std::shared_ptr<PreviewResolver> resolver, Downloader downloader,
                   const AudioNormalizer& normalizer, const EmbeddingModel& model, IndexProvider index)
    : settings_(std::move(settings)), resolver_(std::move(resolver)), downloader_(std::move(downloader)),
      normalizer_(normalizer), model_(model), index_(std::move(index)) {
    if (settings_.reduction == Reduction::None) {
        throw std::invalid_argument("pipeline needs one vector per track; reduction 'none' is not allowed");
    }
    if (!downloader_ || !index_) {
        throw std::invalid_argument("pipeline requires a downloader and an index provider");
    }
}

std::filesystem::path Pipeline::previewDir(const std::string& userId) const {
    return settings_.dataDir / "previews" / sanitizeFilename(userId);
}

std::filesystem::path Pipeline::wavDir(const std::string& userId) const {
    return settings_.dataDir / "wav" / sanitizeFilename(userId);
}

std::filesystem::path Pipeline::artifactPath(const std::string& userId) const {
    return settings_.dataDir / "embeddings" / (sanitizeFilename(userId) + "_embeddings.json");
}

PipelineResult Pipeline::run(const JobContext& job, const Json::Value& rawTracks) {
    auto notify = [&job](Stage stage, const std::string& message) {
        if (job.onStage) job.onStage(stage, message);
    };

    Stage current = Stage::Pending;
    try {
        PipelineResult result = execute(job, rawTracks, current);
        if (!result.ok()) {
            LOG_ERROR("Job " + job.jobId + " failed: " + result.message);
            notify(Stage::Failed, result.message);
        }
        return result;
    } catch (const std::exception& e) {
        std::string message = sanitizeError(std::string("Error during ") + stageToString(current) + ": " + e.what());
        LOG_ERROR("Job " + job.jobId + " (user " + job.userId + ") aborted in " + stageToString(current) +
                  ": " + e.what());
        notify(Stage::Failed, message);
        throw;
    }
}

PipelineResult Pipeline::execute(const JobContext& job, const Json::Value& rawTracks, Stage& current) {
    auto enter = [&](Stage stage, const std::string& message) {
        checkCancelled(job);
        current = stage;
        LOG_INFO("Job " + job.jobId + ": " + message);
        if (job.onStage) job.onStage(stage, message);
    };

    const std::size_t submitted = rawTracks.isArray() ? rawTracks.size() : 0;
    LOG_INFO("Starting library processing for user " + job.userId + " (" + std::to_string(submitted) + " tracks)");

    if (submitted == 0) {
        return failed("No tracks provided for processing");
    }
    if (job.userId.empty()) {
        return failed("No user id provided", submitted);
    }

    // 1. Normalize raw records
    enter(Stage::Processing, "Processing tracks...");
    std::vector<TrackDescriptor> tracks = normalizeTracks(rawTracks);
    if (tracks.empty()) {
        return failed("No valid tracks found to process", submitted);
    }
    LOG_INFO("Normalized " + std::to_string(tracks.size()) + "/" + std::to_string(submitted) + " tracks");

    // 2. Previews
    enter(Stage::Downloading, "Downloading audio previews...");
    PreviewFetcher fetcher(previewDir(job.userId), resolver_, downloader_);
    FetchSummary fetched = fetcher.fetch(tracks);
    if (!fetched.ok) {
        return failed("Failed to download previews: " + fetched.message, submitted);
    }

    // 3. Normalize audio for this job's clips only
    enter(Stage::Converting, "Converting audio files...");
    std::vector<std::filesystem::path> clips;
    std::set<std::filesystem::path> seenClips;
    for (const auto& entry : fetched.files) {
        if (seenClips.insert(entry.second).second) {
            clips.push_back(entry.second);
        }
    }
    std::map<std::filesystem::path, std::filesystem::path> wavFor;
    for (const auto& n : normalizer_.normalizeFiles(clips, wavDir(job.userId))) {
        wavFor[n.source] = n.output;
    }

    // 4. Embed, reduce, store
    enter(Stage::Embedding, "Extracting embeddings...");
    std::shared_ptr<VectorIndexClient> index = index_();
    if (!index) {
        throw IndexConnectionError("vector index is not available");
    }

    Json::Value entries(Json::arrayValue);
    std::set<std::string> done;
    std::size_t generated = 0;

    for (const auto& track : tracks) {
        checkCancelled(job);
        const std::string key = trackKey(track);
        if (!done.insert(key).second) {
            continue;
        }
        auto clip = fetched.files.find(key);
        if (clip == fetched.files.end()) {
            continue;
        }
        auto wav = wavFor.find(clip->second);
        if (wav == wavFor.end()) {
            LOG_WARN("No normalized audio for " + compositeKey(track));
            continue;
        }

        try {
            auto audio = readWav(wav->second);
            if (!audio || audio->samples.empty()) {
                throw std::runtime_error("unreadable audio " + wav->second.string());
            }
            HiddenStates states = model_.infer(audio->samples);
            std::vector<float> vector = reduce(states, settings_.layer, settings_.reduction);

            Json::Value metadata(Json::objectValue);
            metadata["name"] = track.name;
            metadata["artist"] = track.artist;
            metadata["duration_ms"] = static_cast<Json::Int64>(track.durationMs);
            metadata["user_id"] = job.userId;
            if (!index->storeEmbedding(key, vector, metadata)) {
                LOG_WARN("Embedding for " + key + " was not stored");
                continue;
            }

            Json::Value entry(Json::objectValue);
            entry["track_id"] = key;
            entry["name"] = track.name;
            entry["artist"] = track.artist;
            entry["audio_path"] = wav->second.string();
            entry["layers"] = static_cast<Json::UInt64>(states.layers);
            entry["frames"] = static_cast<Json::UInt64>(states.frames);
            entry["width"] = static_cast<Json::UInt64>(states.width);
            entry["layer"] = static_cast<Json::UInt64>(resolveLayer(states, settings_.layer));
            entry["reduce"] = reductionToString(settings_.reduction);
            entry["embedding"] = vectorJson(vector);
            entries.append(entry);
            ++generated;
        } catch (const JobCancelled&) {
            throw;
        } catch (const std::exception& e) {
            LOG_WARN("Skipping " + compositeKey(track) + ": " + e.what());
        }
    }

    // 5. Artifact
    auto artifact = artifactPath(job.userId);
    std::error_code ec;
    std::filesystem::create_directories(artifact.parent_path(), ec);
    if (ec || !writeJsonFileAtomic(artifact, entries)) {
        throw std::runtime_error("cannot write " + artifact.string());
    }

    PipelineResult result;
    result.state = Stage::Completed;
    result.message = "Library processing completed successfully";
    result.tracksProcessed = submitted;
    result.embeddingsGenerated = generated;
    result.embeddingsPath = artifact;

    checkCancelled(job);
    current = Stage::Completed;
    if (job.onStage) job.onStage(Stage::Completed, result.message);
    LOG_INFO("Job " + job.jobId + " completed: " + std::to_string(generated) + "/" +
             std::to_string(submitted) + " embeddings");
    return result;
}

}
