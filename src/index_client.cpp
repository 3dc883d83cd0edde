/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/index_client.hpp"
#include "sonavec/logger.hpp"
#include <algorithm>

namespace sonavec {

VectorIndexClient::VectorIndexClient(TransportFactory factory, IndexOptions options)
    : factory_(std::move(factory)), options_(std::move(options)) {
    if (!factory_) {
        throw std::invalid_argument("VectorIndexClient requires a transport factory");
    }
}

std::shared_ptr<IndexTransport> VectorIndexClient::handle() const {
    std::lock_guard<std::mutex> lock(handleMutex_);
    return transport_;
}

bool VectorIndexClient::isConnected() const {
    return handle() != nullptr;
}

// Only the caller that observed the stale handle swaps it; concurrent callers that
// already see a newer handle leave it alone.
void VectorIndexClient::replaceIfStale(const std::shared_ptr<IndexTransport>& stale) {
    std::lock_guard<std::mutex> lock(handleMutex_);
    if (transport_ != stale) {
        return;
    }
    LOG_INFO("Recreating index connection");
    transport_ = std::shared_ptr<IndexTransport>(factory_());
}

template <typename Fn>
auto VectorIndexClient::withRetry(const std::string& operation, Fn&& fn) {
    std::shared_ptr<IndexTransport> used;
    return runWithRetry(options_.retry, operation,
        [&]() {
            used = handle();
            if (!used) {
                throw IndexError(FailureClass::Connection, "index client is not connected");
            }
            return fn(*used);
        },
        [&]() { replaceIfStale(used); });
}

void VectorIndexClient::connect() {
    try {
        runWithRetry(options_.retry, "connect to vector index",
            [this]() {
                std::shared_ptr<IndexTransport> fresh(factory_());
                auto names = fresh->listCollections();
                LOG_DEBUG("Index reachable, " + std::to_string(names.size()) + " collection(s)");
                std::lock_guard<std::mutex> lock(handleMutex_);
                transport_ = std::move(fresh);
            },
            []() {});
        LOG_INFO("Connected to vector index");
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Failed to connect to vector index: ") + e.what());
        throw IndexConnectionError(std::string("Failed to connect to vector index: ") + e.what());
    }
}

void VectorIndexClient::ensureCollection() {
    std::lock_guard<std::mutex> setup(setupMutex_);
    if (!isConnected()) {
        connect();
    }

    const std::string& name = options_.collection;
    try {
        withRetry("initialize collection " + name, [&](IndexTransport& t) {
            auto names = t.listCollections();
            bool present = std::find(names.begin(), names.end(), name) != names.end();
            if (present && options_.recreateCollection) {
                LOG_WARN("Dropping existing collection " + name);
                t.deleteCollection(name);
                present = false;
            }
            if (!present) {
                t.createCollection(name, options_.dimension);
                LOG_INFO("Created collection " + name + " (" + std::to_string(options_.dimension) + ", cosine)");
            }
        });
    } catch (const std::exception& e) {
        throw IndexConnectionError("Failed to initialize collection " + name + ": " + e.what());
    }
    // Recreation is a one-shot request; later calls must not drop the data again
    options_.recreateCollection = false;
}

bool VectorIndexClient::storeEmbedding(const std::string& trackId, const std::vector<float>& vector,
                                       const Json::Value& metadata) {
    if (trackId.empty()) {
        LOG_ERROR("Refusing to store embedding without a track id");
        return false;
    }
    if (vector.size() != options_.dimension) {
        LOG_ERROR("Embedding size must be " + std::to_string(options_.dimension) + ", got " +
                  std::to_string(vector.size()) + " (track " + trackId + ")");
        return false;
    }

    Json::Value payload = metadata.isObject() ? metadata : Json::Value(Json::objectValue);
    payload["track_id"] = trackId;

    try {
        withRetry("store embedding for track " + trackId, [&](IndexTransport& t) {
            t.upsert(options_.collection, trackId, vector, payload);
        });
        LOG_DEBUG("Stored embedding for track " + trackId);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Error storing embedding for track " + trackId + ": " + e.what());
        return false;
    }
}

std::vector<SimilarTrack> VectorIndexClient::search(const std::vector<float>& query, std::size_t limit,
                                                    double minScore) {
    std::vector<SimilarTrack> results;
    if (limit == 0) {
        return results;
    }
    if (query.size() != options_.dimension) {
        LOG_ERROR("Query size must be " + std::to_string(options_.dimension) + ", got " +
                  std::to_string(query.size()));
        return results;
    }

    std::vector<ScoredPoint> hits;
    try {
        hits = withRetry("find similar tracks (limit=" + std::to_string(limit) + ")", [&](IndexTransport& t) {
            return t.search(options_.collection, query, limit, minScore);
        });
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Error finding similar tracks: ") + e.what());
        return results;
    }

    for (auto& hit : hits) {
        if (hit.score < minScore) {
            continue;
        }
        SimilarTrack s;
        s.trackId = hit.trackId;
        s.score = hit.score;
        s.metadata = std::move(hit.payload);
        results.push_back(std::move(s));
    }
    std::stable_sort(results.begin(), results.end(),
        [](const SimilarTrack& a, const SimilarTrack& b) { return a.score > b.score; });
    if (results.size() > limit) {
        results.resize(limit);
    }

    LOG_DEBUG("Found " + std::to_string(results.size()) + " similar tracks");
    return results;
}

std::optional<std::vector<float>> VectorIndexClient::getEmbedding(const std::string& trackId) {
    try {
        auto point = withRetry("retrieve embedding for track " + trackId, [&](IndexTransport& t) {
            return t.retrieve(options_.collection, trackId, true);
        });
        if (!point || point->vector.empty()) {
            LOG_DEBUG("No embedding found for track " + trackId);
            return std::nullopt;
        }
        return std::move(point->vector);
    } catch (const std::exception& e) {
        LOG_ERROR("Error retrieving embedding for track " + trackId + ": " + e.what());
        return std::nullopt;
    }
}

bool VectorIndexClient::hasEmbedding(const std::string& trackId) {
    try {
        auto point = withRetry("check embedding for track " + trackId, [&](IndexTransport& t) {
            return t.retrieve(options_.collection, trackId, false);
        });
        return point.has_value();
    } catch (const std::exception& e) {
        LOG_ERROR("Error checking embedding for track " + trackId + ": " + e.what());
        return false;
    }
}

bool VectorIndexClient::deleteEmbedding(const std::string& trackId) {
    try {
        withRetry("delete embedding for track " + trackId, [&](IndexTransport& t) {
            t.remove(options_.collection, trackId);
        });
        LOG_INFO("Deleted embedding for track " + trackId);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Error deleting embedding for track " + trackId + ": " + e.what());
        return false;
    }
}

}
