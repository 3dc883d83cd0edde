/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/qdrant.hpp"
#include "sonavec/json_io.hpp"
#include "sonavec/logger.hpp"

namespace sonavec {

namespace {
Json::Value vectorToJson(const std::vector<float>& vector) {
    Json::Value arr(Json::arrayValue);
    for (float v : vector) {
        arr.append(static_cast<double>(v));
    }
    return arr;
}

// Prefer the id we stored in the payload; fall back to the numeric point id.
std::string trackIdOf(const Json::Value& point) {
    const Json::Value& payload = point["payload"];
    if (payload.isObject() && payload["track_id"].isString()) {
        return payload["track_id"].asString();
    }
    const Json::Value& id = point["id"];
    if (id.isUInt64()) return std::to_string(id.asUInt64());
    if (id.isString()) return id.asString();
    return "";
}

Json::Value pointIdJson(const std::string& trackId) {
    return Json::Value(static_cast<Json::UInt64>(pointIdFor(trackId)));
}
}

std::vector<float> vectorFromJson(const Json::Value& arr) {
    std::vector<float> out;
    if (arr.isNull()) {
        return out;
    }
    if (!arr.isArray()) {
        throw IndexError(FailureClass::Transient, "malformed response: vector is not a list");
    }
    out.reserve(arr.size());
    for (const auto& v : arr) {
        if (!v.isNumeric()) {
            throw IndexError(FailureClass::Transient, "malformed response: non-numeric vector component");
        }
        out.push_back(static_cast<float>(v.asDouble()));
    }
    return out;
}

std::vector<ScoredPoint> scoredPointsFromJson(const Json::Value& result) {
    if (!result.isArray()) {
        throw IndexError(FailureClass::Transient, "search: result is not a list");
    }
    std::vector<ScoredPoint> hits;
    hits.reserve(result.size());
    for (const auto& hit : result) {
        if (!hit.isObject() || !hit["score"].isNumeric()) {
            throw IndexError(FailureClass::Transient, "search: hit without a numeric score");
        }
        ScoredPoint p;
        p.trackId = trackIdOf(hit);
        p.score = hit["score"].asDouble();
        p.payload = hit["payload"].isObject() ? hit["payload"] : Json::Value(Json::objectValue);
        hits.push_back(std::move(p));
    }
    return hits;
}

std::uint64_t pointIdFor(const std::string& trackId) noexcept {
    std::uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : trackId) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

FailureClass classifyResponse(const HttpResponse& response) noexcept {
    switch (response.transfer) {
        case TransferError::Connect:
        case TransferError::Timeout:
            return FailureClass::Connection;
        case TransferError::Other:
            return FailureClass::Transient;
        case TransferError::None:
            break;
    }
    if (response.status >= 500 || response.status == 408 || response.status == 429) {
        return FailureClass::Transient;
    }
    if (response.status >= 400) {
        return FailureClass::Permanent;
    }
    return FailureClass::Transient;
}

QdrantTransport::QdrantTransport(std::string baseUrl, std::chrono::milliseconds timeout)
    : baseUrl_(std::move(baseUrl)), timeout_(timeout) {
    while (!baseUrl_.empty() && baseUrl_.back() == '/') {
        baseUrl_.pop_back();
    }
}

Json::Value QdrantTransport::call(const std::string& method, const std::string& path, const Json::Value* body) {
    std::string payload = body ? toJsonString(*body) : std::string();
    HttpResponse res = http_.request(method, baseUrl_ + path, payload, timeout_);

    if (!res.ok()) {
        std::string detail = res.transfer != TransferError::None
            ? res.error
            : "HTTP " + std::to_string(res.status) + " " + res.body.substr(0, 200);
        throw IndexError(classifyResponse(res), method + " " + path + ": " + detail);
    }

    Json::Value root;
    std::string err;
    if (!parseJson(res.body, root, &err) || !root.isObject()) {
        throw IndexError(FailureClass::Transient, method + " " + path + ": malformed response " + err);
    }
    return root["result"];
}

std::vector<std::string> QdrantTransport::listCollections() {
    Json::Value result = call("GET", "/collections", nullptr);
    if (!result.isObject() || !result["collections"].isArray()) {
        throw IndexError(FailureClass::Transient, "GET /collections: missing collections list");
    }
    std::vector<std::string> names;
    for (const auto& c : result["collections"]) {
        if (c.isObject() && c["name"].isString()) {
            names.push_back(c["name"].asString());
        }
    }
    return names;
}

void QdrantTransport::createCollection(const std::string& name, std::size_t dimension) {
    Json::Value body(Json::objectValue);
    body["vectors"]["size"] = static_cast<Json::UInt64>(dimension);
    body["vectors"]["distance"] = "Cosine";
    (void)call("PUT", "/collections/" + name, &body);
}

void QdrantTransport::deleteCollection(const std::string& name) {
    (void)call("DELETE", "/collections/" + name, nullptr);
}

void QdrantTransport::upsert(const std::string& collection, const std::string& trackId,
                             const std::vector<float>& vector, const Json::Value& payload) {
    Json::Value point(Json::objectValue);
    point["id"] = pointIdJson(trackId);
    point["vector"] = vectorToJson(vector);
    point["payload"] = payload;

    Json::Value body(Json::objectValue);
    body["points"].append(point);
    (void)call("PUT", "/collections/" + collection + "/points?wait=true", &body);
}

std::vector<ScoredPoint> QdrantTransport::search(const std::string& collection, const std::vector<float>& query,
                                                 std::size_t limit, double minScore) {
    Json::Value body(Json::objectValue);
    body["vector"] = vectorToJson(query);
    body["limit"] = static_cast<Json::UInt64>(limit);
    body["score_threshold"] = minScore;
    body["with_payload"] = true;

    return scoredPointsFromJson(call("POST", "/collections/" + collection + "/points/search", &body));
}

std::optional<StoredPoint> QdrantTransport::retrieve(const std::string& collection, const std::string& trackId,
                                                     bool withVector) {
    Json::Value body(Json::objectValue);
    body["ids"].append(pointIdJson(trackId));
    body["with_vector"] = withVector;
    body["with_payload"] = true;

    Json::Value result = call("POST", "/collections/" + collection + "/points", &body);
    if (!result.isArray()) {
        throw IndexError(FailureClass::Transient, "retrieve: result is not a list");
    }
    if (result.empty()) {
        return std::nullopt;
    }

    const Json::Value& first = result[0u];
    if (!first.isObject()) {
        throw IndexError(FailureClass::Transient, "retrieve: point is not an object");
    }
    StoredPoint p;
    p.trackId = trackIdOf(first);
    p.payload = first["payload"];
    if (withVector) {
        p.vector = vectorFromJson(first["vector"]);
    }
    return p;
}

void QdrantTransport::remove(const std::string& collection, const std::string& trackId) {
    Json::Value body(Json::objectValue);
    body["points"].append(pointIdJson(trackId));
    (void)call("POST", "/collections/" + collection + "/points/delete?wait=true", &body);
}

TransportFactory qdrantFactory(const std::string& baseUrl, std::chrono::milliseconds timeout) {
    return [baseUrl, timeout]() -> std::unique_ptr<IndexTransport> {
        return std::make_unique<QdrantTransport>(baseUrl, timeout);
    };
}

}
