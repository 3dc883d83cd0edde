/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <json/value.h>

#include "sonavec/retry.hpp"
#include "sonavec/types.hpp"

namespace sonavec {

struct ScoredPoint {
    std::string trackId;
    double score = 0.0;
    Json::Value payload;
};

struct StoredPoint {
    std::string trackId;
    std::vector<float> vector;   // empty when fetched without vectors
    Json::Value payload;
};

// Wire-level access to the vector index service. Implementations report failures
// by throwing IndexError with the matching FailureClass.
class IndexTransport {
public:
    virtual ~IndexTransport() = default;

    virtual std::vector<std::string> listCollections() = 0;
    virtual void createCollection(const std::string& name, std::size_t dimension) = 0;
    virtual void deleteCollection(const std::string& name) = 0;

    virtual void upsert(const std::string& collection, const std::string& trackId,
                        const std::vector<float>& vector, const Json::Value& payload) = 0;
    virtual std::vector<ScoredPoint> search(const std::string& collection, const std::vector<float>& query,
                                            std::size_t limit, double minScore) = 0;
    virtual std::optional<StoredPoint> retrieve(const std::string& collection, const std::string& trackId,
                                                bool withVector) = 0;
    virtual void remove(const std::string& collection, const std::string& trackId) = 0;
};

using TransportFactory = std::function<std::unique_ptr<IndexTransport>()>;

struct IndexOptions {
    std::string collection = "track_embeddings";
    std::size_t dimension = kEmbeddingDim;
    bool recreateCollection = false;
    RetryPolicy retry;
};

struct SimilarTrack {
    std::string trackId;
    double score = 0.0;
    Json::Value metadata;
};

class VectorIndexClient final {
public:
    VectorIndexClient(TransportFactory factory, IndexOptions options);

    VectorIndexClient(const VectorIndexClient&) = delete;
    VectorIndexClient& operator=(const VectorIndexClient&) = delete;
    VectorIndexClient(VectorIndexClient&&) = delete;
    VectorIndexClient& operator=(VectorIndexClient&&) = delete;

    // Both throw IndexConnectionError when the index cannot be reached or prepared.
    void connect();
    // Safe to call from several threads; a requested recreation happens once.
    void ensureCollection();

    [[nodiscard]] bool storeEmbedding(const std::string& trackId, const std::vector<float>& vector,
                                      const Json::Value& metadata = Json::Value(Json::objectValue));
    [[nodiscard]] std::vector<SimilarTrack> search(const std::vector<float>& query, std::size_t limit = 10,
                                                   double minScore = 0.7);
    [[nodiscard]] std::optional<std::vector<float>> getEmbedding(const std::string& trackId);
    [[nodiscard]] bool hasEmbedding(const std::string& trackId);
    [[nodiscard]] bool deleteEmbedding(const std::string& trackId);

    [[nodiscard]] bool isConnected() const;
    [[nodiscard]] const std::string& collection() const noexcept { return options_.collection; }
    [[nodiscard]] std::size_t dimension() const noexcept { return options_.dimension; }

private:
    template <typename Fn>
    auto withRetry(const std::string& operation, Fn&& fn);

    [[nodiscard]] std::shared_ptr<IndexTransport> handle() const;
    void replaceIfStale(const std::shared_ptr<IndexTransport>& stale);

    TransportFactory factory_;
    IndexOptions options_;

    std::mutex setupMutex_;   // serializes ensureCollection and its one-shot recreate flag
    mutable std::mutex handleMutex_;
    std::shared_ptr<IndexTransport> transport_;
};

}
