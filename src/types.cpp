/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/types.hpp"

namespace sonavec {

const char* stageToString(Stage stage) noexcept {
    switch (stage) {
        case Stage::Pending: return "PENDING";
        case Stage::Started: return "STARTED";
        case Stage::Processing: return "PROCESSING";
        case Stage::Downloading: return "DOWNLOADING";
        case Stage::Converting: return "CONVERTING";
        case Stage::Embedding: return "EMBEDDING";
        case Stage::Completed: return "COMPLETED";
        case Stage::Failed: return "FAILED";
        case Stage::Missing: return "MISSING";
        default: return "UNKNOWN";
    }
}

Stage stageFromString(const std::string& name) noexcept {
    if (name == "PENDING") return Stage::Pending;
    if (name == "STARTED") return Stage::Started;
    if (name == "PROCESSING") return Stage::Processing;
    if (name == "DOWNLOADING") return Stage::Downloading;
    if (name == "CONVERTING") return Stage::Converting;
    if (name == "EMBEDDING") return Stage::Embedding;
    if (name == "COMPLETED") return Stage::Completed;
    if (name == "FAILED") return Stage::Failed;
    return Stage::Missing;
}

int stageProgress(Stage stage) noexcept {
    switch (stage) {
        case Stage::Pending: return 0;
        case Stage::Started: return 5;
        case Stage::Processing: return 20;
        case Stage::Downloading: return 40;
        case Stage::Converting: return 60;
        case Stage::Embedding: return 80;
        case Stage::Completed:
        case Stage::Failed: return 100;
        default: return 0;
    }
}

}
