/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/model.hpp"
#include "sonavec/logger.hpp"
#include <cmath>
#include <cstring>
#include <filesystem>
#include <onnxruntime_cxx_api.h>

namespace sonavec {

namespace {
std::string shapeToString(const std::vector<int64_t>& shape) {
    std::string s = "[";
    for (std::size_t i = 0; i < shape.size(); ++i) {
        s += std::to_string(shape[i]);
        if (i + 1 < shape.size()) s += ",";
    }
    return s + "]";
}
}

std::vector<float> normalizeWaveform(const std::vector<float>& samples) {
    if (samples.empty()) {
        return {};
    }
    double mean = 0.0;
    for (float s : samples) mean += s;
    mean /= static_cast<double>(samples.size());

    double var = 0.0;
    for (float s : samples) {
        double d = s - mean;
        var += d * d;
    }
    var /= static_cast<double>(samples.size());

    const double scale = 1.0 / std::sqrt(var + 1e-7);
    std::vector<float> out(samples.size());
    for (std::size_t i = 0; i < samples.size(); ++i) {
        out[i] = static_cast<float>((samples[i] - mean) * scale);
    }
    return out;
}

OnnxEmbeddingModel::OnnxEmbeddingModel(const std::string& modelPath, int intraOpThreads) {
    if (!std::filesystem::exists(modelPath)) {
        throw ModelError("model not found: " + modelPath);
    }

    try {
        env_ = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "sonavec");
        Ort::SessionOptions options;
        if (intraOpThreads > 0) {
            options.SetIntraOpNumThreads(intraOpThreads);
        }
        options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
        session_ = std::make_unique<Ort::Session>(*env_, modelPath.c_str(), options);

        Ort::AllocatorWithDefaultOptions allocator;
        if (session_->GetInputCount() < 1) {
            throw ModelError("model has no inputs: " + modelPath);
        }
        inputName_ = session_->GetInputNameAllocated(0, allocator).get();

        std::size_t outCount = session_->GetOutputCount();
        outputNames_.reserve(outCount);
        for (std::size_t i = 0; i < outCount; ++i) {
            outputNames_.emplace_back(session_->GetOutputNameAllocated(i, allocator).get());
        }
    } catch (const Ort::Exception& e) {
        throw ModelError("failed to load " + modelPath + ": " + e.what());
    }

    LOG_INFO("Loaded embedding model " + modelPath + " (input '" + inputName_ + "', " +
             std::to_string(outputNames_.size()) + " output(s))");
}

OnnxEmbeddingModel::~OnnxEmbeddingModel() = default;

HiddenStates OnnxEmbeddingModel::infer(const std::vector<float>& samples) const {
    if (samples.empty()) {
        throw ModelError("cannot embed empty audio");
    }

    std::vector<float> input = normalizeWaveform(samples);
    std::vector<int64_t> inputShape = {1, static_cast<int64_t>(input.size())};

    std::vector<const char*> outputNames;
    outputNames.reserve(outputNames_.size());
    for (const auto& name : outputNames_) {
        outputNames.push_back(name.c_str());
    }
    const char* inputName = inputName_.c_str();

    std::vector<Ort::Value> outputs;
    try {
        auto memory = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        Ort::Value tensor = Ort::Value::CreateTensor<float>(memory, input.data(), input.size(),
                                                            inputShape.data(), inputShape.size());
        outputs = session_->Run(Ort::RunOptions{nullptr}, &inputName, &tensor, 1,
                                outputNames.data(), outputNames.size());
    } catch (const Ort::Exception& e) {
        throw ModelError(std::string("inference failed: ") + e.what());
    }

    if (outputs.empty()) {
        throw ModelError("model returned no outputs");
    }

    HiddenStates states;
    auto firstShape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();

    if (outputs.size() == 1 && firstShape.size() == 4) {
        // [layers, batch, frames, width]
        if (firstShape[1] != 1) {
            throw ModelError("unexpected batch size in output " + shapeToString(firstShape));
        }
        states.layers = static_cast<std::size_t>(firstShape[0]);
        states.frames = static_cast<std::size_t>(firstShape[2]);
        states.width = static_cast<std::size_t>(firstShape[3]);
        const float* data = outputs[0].GetTensorData<float>();
        states.data.assign(data, data + states.layers * states.frames * states.width);
    } else {
        // One [batch, frames, width] tensor per layer
        for (std::size_t i = 0; i < outputs.size(); ++i) {
            auto shape = outputs[i].GetTensorTypeAndShapeInfo().GetShape();
            if (shape.size() != 3 || shape[0] != 1) {
                throw ModelError("output " + outputNames_[i] + " has unexpected shape " + shapeToString(shape));
            }
            auto frames = static_cast<std::size_t>(shape[1]);
            auto width = static_cast<std::size_t>(shape[2]);
            if (i == 0) {
                states.frames = frames;
                states.width = width;
            } else if (frames != states.frames || width != states.width) {
                throw ModelError("layer outputs disagree in shape: " + shapeToString(shape));
            }
            const float* data = outputs[i].GetTensorData<float>();
            states.data.insert(states.data.end(), data, data + frames * width);
            ++states.layers;
        }
    }

    LOG_TRACE("Hidden states: " + std::to_string(states.layers) + " x " + std::to_string(states.frames) +
              " x " + std::to_string(states.width));
    return states;
}

}
