/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <string>

namespace sonavec {

struct Config {
    std::filesystem::path dataDir;
    std::string modelPath;

    std::string indexUrl = "http://localhost:6333";
    std::string collection = "track_embeddings";
    bool recreateCollection = false;
    std::chrono::seconds indexTimeout{10};
    std::chrono::milliseconds retryBaseDelay{1000};

    std::chrono::seconds downloadTimeout{10};
    std::string resolverCommand;

    int layer = -1;
    std::string reduce = "mean";
    int ortThreads = 0;

    int workers = 2;
    std::chrono::seconds softLimit{1500};
    std::chrono::seconds hardLimit{1800};

    // Reads SONAVEC_* variables; unset or unparsable values keep their defaults.
    // dataDir defaults to <workspace>/data when SONAVEC_DATA_DIR is absent.
    [[nodiscard]] static Config fromEnv(const std::filesystem::path& workspace);
};

}
