/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include "sonavec/reducer.hpp"

using namespace sonavec;

namespace {
// 3 layers x 2 frames x 3 columns
HiddenStates sample() {
    HiddenStates h;
    h.layers = 3;
    h.frames = 2;
    h.width = 3;
    h.data = {
        0, 0, 0,    1, 1, 1,        // layer 0
        1, 2, 3,    3, 2, 1,        // layer 1
        -1, 5, 0,   3, -5, 2,       // layer 2
    };
    return h;
}
}

TEST_CASE("Mean of the last layer by default", "[reducer]") {
    auto v = reduce(sample());
    REQUIRE(v.size() == 3);
    CHECK(v[0] == Approx(1.0));
    CHECK(v[1] == Approx(0.0));
    CHECK(v[2] == Approx(1.0));
}

TEST_CASE("Explicit layer index selects that layer", "[reducer]") {
    auto v = reduce(sample(), 1, Reduction::Mean);
    CHECK(v == std::vector<float>{2, 2, 2});
    CHECK(reduce(sample(), -3, Reduction::Mean) == std::vector<float>{0.5f, 0.5f, 0.5f});
}

TEST_CASE("Max takes the column-wise maximum over frames", "[reducer]") {
    CHECK(reduce(sample(), -1, Reduction::Max) == std::vector<float>{3, 5, 2});
}

TEST_CASE("None keeps every frame in order", "[reducer]") {
    auto v = reduce(sample(), 1, Reduction::None);
    CHECK(v == std::vector<float>{1, 2, 3, 3, 2, 1});
}

TEST_CASE("Out of range layers are rejected", "[reducer]") {
    CHECK_THROWS_AS(reduce(sample(), 3), std::out_of_range);
    CHECK_THROWS_AS(reduce(sample(), -4), std::out_of_range);
    CHECK(resolveLayer(sample(), -1) == 2);
}

TEST_CASE("Empty or inconsistent hidden states are rejected", "[reducer]") {
    CHECK_THROWS_AS(reduce(HiddenStates{}), std::invalid_argument);

    auto h = sample();
    h.data.pop_back();
    CHECK_THROWS_AS(reduce(h), std::invalid_argument);
}

TEST_CASE("Reduction names parse case-insensitively", "[reducer]") {
    CHECK(parseReduction("MEAN") == Reduction::Mean);
    CHECK(parseReduction("max") == Reduction::Max);
    CHECK(parseReduction("None") == Reduction::None);
    CHECK_FALSE(parseReduction("median").has_value());
    CHECK(std::string(reductionToString(Reduction::Max)) == "max");
}
