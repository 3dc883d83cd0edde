/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include <fstream>

#include "sonavec/normalizer.hpp"
#include "sonavec/wav.hpp"
#include "test_support.hpp"

using namespace sonavec;
using namespace sonavec::testing;

TEST_CASE("WAV files survive a write and read", "[wav]") {
    TempDir dir;
    auto audio = tone(0.5, 8000, 2);
    REQUIRE(writeWav16(dir.path() / "t.wav", audio));

    auto back = readWav(dir.path() / "t.wav");
    REQUIRE(back.has_value());
    CHECK(back->sampleRate == 8000);
    CHECK(back->channels == 2);
    CHECK(back->frames() == audio.frames());
    CHECK(back->samples[1] == Approx(audio.samples[1]).margin(1.0 / 32767));
}

TEST_CASE("Non-WAV input is not read as audio", "[wav]") {
    TempDir dir;
    std::ofstream(dir.path() / "x.wav") << "definitely not RIFF";
    CHECK_FALSE(readWav(dir.path() / "x.wav").has_value());
    CHECK_FALSE(readWav(dir.path() / "absent.wav").has_value());
}

TEST_CASE("Long stereo clips become 15 seconds of mono at 24 kHz", "[normalizer]") {
    TempDir dir;
    REQUIRE(writeWav16(dir.path() / "long.wav", tone(40.0, 44100, 2)));

    AudioNormalizer normalizer;
    REQUIRE(normalizer.normalizeFile(dir.path() / "long.wav", dir.path() / "out.wav"));

    auto out = readWav(dir.path() / "out.wav");
    REQUIRE(out.has_value());
    CHECK(out->sampleRate == 24000);
    CHECK(out->channels == 1);
    CHECK(out->frames() == 15u * 24000u);
}

TEST_CASE("Short clips keep their length", "[normalizer]") {
    TempDir dir;
    REQUIRE(writeWav16(dir.path() / "short.wav", tone(2.0, 48000, 1)));

    AudioNormalizer normalizer;
    auto audio = normalizer.decode(dir.path() / "short.wav");
    CHECK(audio.sampleRate == 24000);
    CHECK(static_cast<double>(audio.frames()) == Approx(48000.0).margin(200.0));
}

TEST_CASE("Undecodable files are skipped in a batch", "[normalizer]") {
    TempDir dir;
    REQUIRE(writeWav16(dir.path() / "good.wav", tone(1.0, 22050, 1)));
    std::ofstream(dir.path() / "broken.mp3") << "garbage bytes, not an mp3 stream";
    std::ofstream(dir.path() / "notes.txt") << "ignored";

    AudioNormalizer normalizer;
    CHECK_THROWS_AS(normalizer.decode(dir.path() / "broken.mp3"), DecodeError);

    auto results = normalizer.normalizeDirectory(dir.path(), dir.path() / "wav");
    REQUIRE(results.size() == 1);
    CHECK(results[0].source.filename() == "good.wav");
    CHECK(results[0].output == dir.path() / "wav" / "good.wav");
    CHECK(results[0].seconds == Approx(1.0).margin(0.02));
}

TEST_CASE("Supported extensions", "[normalizer]") {
    CHECK(AudioNormalizer::isSupported("a.mp3"));
    CHECK(AudioNormalizer::isSupported("a.FLAC"));
    CHECK_FALSE(AudioNormalizer::isSupported("a.txt"));
}
