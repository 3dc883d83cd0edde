/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "sonavec/types.hpp"
#include "sonavec/wav.hpp"

namespace sonavec {

class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct NormalizedFile {
    std::filesystem::path source;
    std::filesystem::path output;
    double seconds = 0.0;
};

// Turns arbitrary clips into mono float audio at a fixed rate, cut to a fixed length.
class AudioNormalizer final {
public:
    explicit AudioNormalizer(int sampleRate = kSampleRate, int maxSeconds = kClipSeconds);

    // Throws DecodeError when the file cannot be opened or decoded.
    [[nodiscard]] PcmAudio decode(const std::filesystem::path& input) const;

    [[nodiscard]] bool normalizeFile(const std::filesystem::path& input,
                                     const std::filesystem::path& output) const noexcept;

    // One "<stem>.wav" per input under outputDir. Inputs that fail are logged and left out.
    [[nodiscard]] std::vector<NormalizedFile> normalizeFiles(const std::vector<std::filesystem::path>& inputs,
                                                             const std::filesystem::path& outputDir) const;
    [[nodiscard]] std::vector<NormalizedFile> normalizeDirectory(const std::filesystem::path& inputDir,
                                                                 const std::filesystem::path& outputDir) const;

    [[nodiscard]] static bool isSupported(const std::filesystem::path& path);

    [[nodiscard]] int sampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] std::size_t maxSamples() const noexcept;

private:
    // Seconds written, or nullopt when the input was skipped
    [[nodiscard]] std::optional<double> convert(const std::filesystem::path& input,
                                                const std::filesystem::path& output) const noexcept;

    int sampleRate_;
    int maxSeconds_;
};

}
