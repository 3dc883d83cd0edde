/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "sonavec/http.hpp"
#include "sonavec/index_client.hpp"

namespace sonavec {

// Qdrant only accepts unsigned integers or UUIDs as point ids, so track ids are
// hashed (64-bit FNV-1a) and the original id travels in the payload.
[[nodiscard]] std::uint64_t pointIdFor(const std::string& trackId) noexcept;

// Maps an HTTP outcome onto the retry classes used by the index client.
[[nodiscard]] FailureClass classifyResponse(const HttpResponse& response) noexcept;

// Response decoding. Malformed input throws IndexError(Transient) so it is retried.
// A null vector decodes to an empty one.
[[nodiscard]] std::vector<float> vectorFromJson(const Json::Value& arr);
[[nodiscard]] std::vector<ScoredPoint> scoredPointsFromJson(const Json::Value& result);

class QdrantTransport final : public IndexTransport {
public:
    QdrantTransport(std::string baseUrl, std::chrono::milliseconds timeout);

    std::vector<std::string> listCollections() override;
    void createCollection(const std::string& name, std::size_t dimension) override;
    void deleteCollection(const std::string& name) override;

    void upsert(const std::string& collection, const std::string& trackId,
                const std::vector<float>& vector, const Json::Value& payload) override;
    std::vector<ScoredPoint> search(const std::string& collection, const std::vector<float>& query,
                                    std::size_t limit, double minScore) override;
    std::optional<StoredPoint> retrieve(const std::string& collection, const std::string& trackId,
                                        bool withVector) override;
    void remove(const std::string& collection, const std::string& trackId) override;

private:
    // Returns the "result" member of the response envelope.
    Json::Value call(const std::string& method, const std::string& path, const Json::Value* body);

    std::string baseUrl_;
    std::chrono::milliseconds timeout_;
    HttpClient http_;
};

[[nodiscard]] TransportFactory qdrantFactory(const std::string& baseUrl, std::chrono::milliseconds timeout);

}
