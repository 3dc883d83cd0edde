/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace sonavec {

// Job lifecycle stages. Failed is absorbing; Missing is only reported for unknown tokens.
enum class Stage : std::uint8_t {
    Pending,
    Started,
    Processing,
    Downloading,
    Converting,
    Embedding,
    Completed,
    Failed,
    Missing
};

// Opaque job token.
using JobId = std::string;

constexpr std::size_t kEmbeddingDim = 1024;
constexpr int kSampleRate = 24000;
constexpr int kClipSeconds = 15;
constexpr std::size_t kClipSamples = static_cast<std::size_t>(kSampleRate) * kClipSeconds;

[[nodiscard]] const char* stageToString(Stage stage) noexcept;
[[nodiscard]] Stage stageFromString(const std::string& name) noexcept;
[[nodiscard]] int stageProgress(Stage stage) noexcept;
[[nodiscard]] inline bool isTerminal(Stage stage) noexcept {
    return stage == Stage::Completed || stage == Stage::Failed;
}

} // namespace sonavec
