/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "sonavec/reducer.hpp"

namespace Ort {
struct Env;
struct Session;
}

namespace sonavec {

class ModelError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Audio encoder returning layer-wise hidden states. Implementations must allow
// concurrent infer() calls on one instance.
class EmbeddingModel {
public:
    virtual ~EmbeddingModel() = default;

    // samples: mono float audio at the model's sample rate. Throws ModelError.
    [[nodiscard]] virtual HiddenStates infer(const std::vector<float>& samples) const = 0;
};

// Zero mean, unit variance, as the encoder's feature extractor expects.
[[nodiscard]] std::vector<float> normalizeWaveform(const std::vector<float>& samples);

// ONNX export of the encoder. Accepts either one [layers, 1, T, D] output or one
// [1, T, D] output per layer in layer order.
class OnnxEmbeddingModel final : public EmbeddingModel {
public:
    explicit OnnxEmbeddingModel(const std::string& modelPath, int intraOpThreads = 0);
    ~OnnxEmbeddingModel() override;

    OnnxEmbeddingModel(const OnnxEmbeddingModel&) = delete;
    OnnxEmbeddingModel& operator=(const OnnxEmbeddingModel&) = delete;

    [[nodiscard]] HiddenStates infer(const std::vector<float>& samples) const override;

private:
    std::unique_ptr<Ort::Env> env_;
    std::unique_ptr<Ort::Session> session_;
    std::string inputName_;
    std::vector<std::string> outputNames_;
};

}
