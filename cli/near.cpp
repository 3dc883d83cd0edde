/*
 * sonavec - Similar track lookup (near)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/config.hpp"
#include "sonavec/index_client.hpp"
#include "sonavec/json_io.hpp"
#include "sonavec/logger.hpp"
#include "sonavec/qdrant.hpp"
#include <cstdlib>
#include <iostream>

using namespace sonavec;

void printUsage(const char* progName) {
    std::cout << "sonavec Similar Track Lookup\n\n";
    std::cout << "Usage: " << progName << " <workspace> <track_id> [-n <limit>] [--min-score <s>]\n";
    std::cout << "       " << progName << " <workspace> <track_id> --delete\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace        Workspace whose configuration is used\n";
    std::cout << "  track_id         Track stored by a completed job\n\n";
    std::cout << "Options:\n";
    std::cout << "  -n, --limit <n>  Maximum matches (default 10)\n";
    std::cout << "  --min-score <s>  Cosine similarity threshold (default 0.7)\n";
    std::cout << "  --delete         Remove the track's embedding instead\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  SONAVEC_INDEX_URL    Vector index (default http://localhost:6333)\n";
    std::cout << "  SONAVEC_COLLECTION   Collection (default track_embeddings)\n";
}

int main(int argc, char* argv[]) {
    if (!std::getenv("SONAVEC_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
    }
    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    std::string trackId = argv[2];
    std::size_t limit = 10;
    double minScore = 0.7;
    bool remove = false;

    try {
        for (int i = 3; i < argc; ++i) {
            std::string arg = argv[i];
            if ((arg == "-n" || arg == "--limit") && i + 1 < argc) {
                limit = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--min-score" && i + 1 < argc) {
                minScore = std::stod(argv[++i]);
            } else if (arg == "--delete") {
                remove = true;
            } else {
                std::cerr << "Error: Unknown argument: " << arg << "\n";
                return 1;
            }
        }

        Config config = Config::fromEnv(argv[1]);
        IndexOptions options;
        options.collection = config.collection;
        options.retry.baseDelay = config.retryBaseDelay;
        VectorIndexClient index(
            qdrantFactory(config.indexUrl, std::chrono::duration_cast<std::chrono::milliseconds>(config.indexTimeout)),
            options);
        index.connect();

        if (remove) {
            if (!index.deleteEmbedding(trackId)) {
                std::cerr << "Error: Could not delete " << trackId << std::endl;
                return 1;
            }
            std::cout << trackId << std::endl;
            return 0;
        }

        auto query = index.getEmbedding(trackId);
        if (!query) {
            std::cerr << "No embedding stored for " << trackId << std::endl;
            return 1;
        }

        // The track itself always matches; ask for one extra and drop it
        Json::Value matches(Json::arrayValue);
        for (const auto& hit : index.search(*query, limit + 1, minScore)) {
            if (hit.trackId == trackId || matches.size() >= limit) {
                continue;
            }
            Json::Value entry(Json::objectValue);
            entry["track_id"] = hit.trackId;
            entry["score"] = hit.score;
            entry["metadata"] = hit.metadata;
            matches.append(entry);
        }
        std::cout << toJsonString(matches, true) << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
