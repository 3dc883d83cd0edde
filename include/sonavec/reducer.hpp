/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sonavec {

enum class Reduction : uint8_t {
    Mean = 0,
    Max,
    None   // keep every time step
};

[[nodiscard]] std::optional<Reduction> parseReduction(const std::string& name) noexcept;
[[nodiscard]] const char* reductionToString(Reduction reduction) noexcept;

// Per-layer hidden states, stored row-major as [layer][frame][width].
struct HiddenStates {
    std::size_t layers = 0;
    std::size_t frames = 0;
    std::size_t width = 0;
    std::vector<float> data;

    [[nodiscard]] bool empty() const noexcept { return layers == 0 || frames == 0 || width == 0; }
    [[nodiscard]] const float* row(std::size_t layer, std::size_t frame) const noexcept {
        return data.data() + (layer * frames + frame) * width;
    }
};

// Resolves a possibly negative layer index (-1 is the last layer).
// Throws std::out_of_range when it does not name an existing layer.
[[nodiscard]] std::size_t resolveLayer(const HiddenStates& states, int layer);

// Selects one layer and collapses the time axis. Mean and Max return `width` values,
// None returns frames * width values in frame order. Throws std::invalid_argument for
// empty or inconsistent input and std::out_of_range for a bad layer.
[[nodiscard]] std::vector<float> reduce(const HiddenStates& states, int layer = -1,
                                        Reduction reduction = Reduction::Mean);

}
