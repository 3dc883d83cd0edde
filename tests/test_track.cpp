/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include "sonavec/json_io.hpp"
#include "sonavec/track.hpp"

using namespace sonavec;

namespace {
Json::Value parse(const std::string& text) {
    Json::Value v;
    REQUIRE(parseJson(text, v));
    return v;
}

TrackDescriptor one(const std::string& text) {
    auto raw = parseRawTrack(parse(text));
    REQUIRE(raw.has_value());
    return normalizeTrack(*raw);
}
}

TEST_CASE("Flat records take the first artist object", "[track]") {
    auto t = one(R"({"id":"t1","name":"Song","artists":[{"name":"A"},{"name":"B"}],
                     "duration_ms":201000,"preview_url":"http://x/p.mp3"})");
    CHECK(t.id == "t1");
    CHECK(t.name == "Song");
    CHECK(t.artist == "A");
    CHECK(t.durationMs == 201000);
    CHECK(t.previewUrl == "http://x/p.mp3");
}

TEST_CASE("Artist lists may hold plain strings", "[track]") {
    CHECK(one(R"({"name":"Song","artists":["Solo"]})").artist == "Solo");
}

TEST_CASE("Nested track records fall back to the inner fields", "[track]") {
    auto t = one(R"({"track":{"id":"n1","name":"Inner","artists":[{"name":"Nested"}],
                              "preview_url":"http://x/n.mp3","duration_ms":5}})");
    CHECK(t.id == "n1");
    CHECK(t.name == "Inner");
    CHECK(t.artist == "Nested");
    CHECK(t.previewUrl == "http://x/n.mp3");
    CHECK(t.durationMs == 5);
}

TEST_CASE("Top-level name wins over the nested one", "[track]") {
    CHECK(one(R"({"name":"Outer","track":{"name":"Inner","artists":[]}})").name == "Outer");
}

TEST_CASE("Legacy single artist field is accepted", "[track]") {
    auto t = one(R"({"name":"Song","artist":"Legacy"})");
    CHECK(t.artist == "Legacy");
}

TEST_CASE("Missing information falls back to sentinels", "[track]") {
    auto t = one(R"({})");
    CHECK(t.name == kUnknownTrack);
    CHECK(t.artist == kUnknownArtist);
    CHECK(t.id.empty());

    CHECK(one(R"({"name":"X","artists":[{"title":"no name"}]})").artist == kUnknownArtist);
    CHECK(one(R"({"name":"X","artist":""})").artist == kUnknownArtist);
}

TEST_CASE("Non-object records are skipped", "[track]") {
    CHECK_FALSE(parseRawTrack(Json::Value("string")).has_value());

    auto tracks = normalizeTracks(parse(R"([{"name":"A","artist":"B"}, 42, null, "x", {"name":"C"}])"));
    REQUIRE(tracks.size() == 2);
    CHECK(tracks[0].name == "A");
    CHECK(tracks[1].name == "C");

    CHECK(normalizeTracks(parse(R"({"name":"not a list"})")).empty());
}

TEST_CASE("Track keys and file names", "[track]") {
    TrackDescriptor t;
    t.name = "Hey/You?";
    t.artist = "Floyd";
    CHECK(compositeKey(t) == "Hey/You? - Floyd");
    CHECK(trackKey(t) == "Hey/You? - Floyd");
    t.id = "id9";
    CHECK(trackKey(t) == "id9");
    CHECK(sanitizeFilename(compositeKey(t)) == "Hey_You_ - Floyd");
}

TEST_CASE("Descriptors serialize with their normalized fields", "[track]") {
    auto t = one(R"({"id":"t1","name":"Song","artist":"A"})");
    Json::Value v = toJson(t);
    CHECK(v["id"].asString() == "t1");
    CHECK(v["artist"].asString() == "A");
    CHECK_FALSE(v.isMember("preview_url"));
}
