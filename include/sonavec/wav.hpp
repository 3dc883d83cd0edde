/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>

namespace sonavec {

struct PcmAudio {
    int sampleRate = 0;
    int channels = 0;
    std::vector<float> samples;   // interleaved, nominal range [-1, 1]

    [[nodiscard]] std::size_t frames() const noexcept {
        return channels > 0 ? samples.size() / static_cast<std::size_t>(channels) : 0;
    }
    [[nodiscard]] double seconds() const noexcept {
        return sampleRate > 0 ? static_cast<double>(frames()) / sampleRate : 0.0;
    }
};

// 16-bit little-endian PCM RIFF/WAVE. Samples are clipped to [-1, 1].
[[nodiscard]] bool writeWav16(const std::filesystem::path& path, const PcmAudio& audio);

// Reads 16-bit PCM or 32-bit float WAVE files; nullopt for anything else.
[[nodiscard]] std::optional<PcmAudio> readWav(const std::filesystem::path& path);

}
