/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/reducer.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace sonavec {

std::optional<Reduction> parseReduction(const std::string& name) noexcept {
    std::string s;
    for (char c : name) {
        s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (s == "mean") return Reduction::Mean;
    if (s == "max") return Reduction::Max;
    if (s == "none") return Reduction::None;
    return std::nullopt;
}

const char* reductionToString(Reduction reduction) noexcept {
    switch (reduction) {
        case Reduction::Mean: return "mean";
        case Reduction::Max: return "max";
        case Reduction::None: return "none";
        default: return "unknown";
    }
}

std::size_t resolveLayer(const HiddenStates& states, int layer) {
    const long count = static_cast<long>(states.layers);
    long index = layer < 0 ? count + layer : layer;
    if (index < 0 || index >= count) {
        throw std::out_of_range("layer " + std::to_string(layer) + " out of range for " +
                                std::to_string(states.layers) + " layers");
    }
    return static_cast<std::size_t>(index);
}

std::vector<float> reduce(const HiddenStates& states, int layer, Reduction reduction) {
    if (states.empty()) {
        throw std::invalid_argument("hidden states are empty");
    }
    if (states.data.size() != states.layers * states.frames * states.width) {
        throw std::invalid_argument("hidden state buffer does not match its shape");
    }

    const std::size_t l = resolveLayer(states, layer);
    const std::size_t width = states.width;

    switch (reduction) {
        case Reduction::None: {
            const float* begin = states.row(l, 0);
            return std::vector<float>(begin, begin + states.frames * width);
        }
        case Reduction::Max: {
            std::vector<float> out(states.row(l, 0), states.row(l, 0) + width);
            for (std::size_t t = 1; t < states.frames; ++t) {
                const float* r = states.row(l, t);
                for (std::size_t d = 0; d < width; ++d) {
                    out[d] = std::max(out[d], r[d]);
                }
            }
            return out;
        }
        case Reduction::Mean:
        default: {
            // Accumulate in double so long sequences do not drift
            std::vector<double> acc(width, 0.0);
            for (std::size_t t = 0; t < states.frames; ++t) {
                const float* r = states.row(l, t);
                for (std::size_t d = 0; d < width; ++d) {
                    acc[d] += r[d];
                }
            }
            std::vector<float> out(width);
            const double n = static_cast<double>(states.frames);
            for (std::size_t d = 0; d < width; ++d) {
                out[d] = static_cast<float>(acc[d] / n);
            }
            return out;
        }
    }
}

}
