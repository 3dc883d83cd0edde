/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include "sonavec/qdrant.hpp"

using namespace sonavec;

namespace {
HttpResponse status(long code) {
    HttpResponse r;
    r.status = code;
    return r;
}

HttpResponse transfer(TransferError e) {
    HttpResponse r;
    r.transfer = e;
    return r;
}
}

TEST_CASE("Point ids are 64-bit FNV-1a hashes of the track id", "[qdrant]") {
    CHECK(pointIdFor("") == 14695981039346656037ULL);
    CHECK(pointIdFor("a") == 0xaf63dc4c8601ec8cULL);
    CHECK(pointIdFor("foobar") == 0x85944171f73967e8ULL);
    CHECK(pointIdFor("track-1") != pointIdFor("track-2"));
}

TEST_CASE("Transport failures map to connection or transient", "[qdrant]") {
    CHECK(classifyResponse(transfer(TransferError::Connect)) == FailureClass::Connection);
    CHECK(classifyResponse(transfer(TransferError::Timeout)) == FailureClass::Connection);
    CHECK(classifyResponse(transfer(TransferError::Other)) == FailureClass::Transient);
}

TEST_CASE("HTTP statuses map onto retry classes", "[qdrant]") {
    CHECK(classifyResponse(status(500)) == FailureClass::Transient);
    CHECK(classifyResponse(status(503)) == FailureClass::Transient);
    CHECK(classifyResponse(status(408)) == FailureClass::Transient);
    CHECK(classifyResponse(status(429)) == FailureClass::Transient);
    CHECK(classifyResponse(status(400)) == FailureClass::Permanent);
    CHECK(classifyResponse(status(404)) == FailureClass::Permanent);
    CHECK(classifyResponse(status(422)) == FailureClass::Permanent);
}

TEST_CASE("An unreachable server is a connection failure", "[qdrant]") {
    // Port 1 on loopback refuses connections
    QdrantTransport transport("http://127.0.0.1:1/", std::chrono::milliseconds(500));
    try {
        (void)transport.listCollections();
        FAIL("expected an IndexError");
    } catch (const IndexError& e) {
        CHECK(e.failureClass() == FailureClass::Connection);
    }
}

TEST_CASE("Malformed search hits are transient index errors", "[qdrant]") {
    Json::Value good(Json::arrayValue);
    Json::Value hit(Json::objectValue);
    hit["id"] = 7;
    hit["score"] = 0.91;
    hit["payload"]["track_id"] = "t1";
    good.append(hit);

    auto hits = scoredPointsFromJson(good);
    REQUIRE(hits.size() == 1);
    CHECK(hits[0].trackId == "t1");
    CHECK(hits[0].score == Approx(0.91));

    Json::Value bad = good;
    bad[0u]["score"] = "high";
    try {
        (void)scoredPointsFromJson(bad);
        FAIL("expected an IndexError");
    } catch (const IndexError& e) {
        CHECK(e.failureClass() == FailureClass::Transient);
    }

    Json::Value notObject(Json::arrayValue);
    notObject.append(3);
    CHECK_THROWS_AS(scoredPointsFromJson(notObject), IndexError);
    CHECK_THROWS_AS(scoredPointsFromJson(Json::Value("oops")), IndexError);
}

TEST_CASE("Malformed vectors are transient index errors", "[qdrant]") {
    Json::Value vec(Json::arrayValue);
    vec.append(0.5);
    vec.append(-1);
    CHECK(vectorFromJson(vec) == std::vector<float>{0.5f, -1.0f});
    CHECK(vectorFromJson(Json::Value()).empty());

    vec.append("x");
    try {
        (void)vectorFromJson(vec);
        FAIL("expected an IndexError");
    } catch (const IndexError& e) {
        CHECK(e.failureClass() == FailureClass::Transient);
    }
    CHECK_THROWS_AS(vectorFromJson(Json::Value(Json::objectValue)), IndexError);
}
