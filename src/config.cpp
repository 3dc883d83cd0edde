/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/config.hpp"
#include "sonavec/logger.hpp"
#include <cstdlib>

namespace sonavec {

namespace {
long env_long(const char* name, long defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::size_t pos = 0;
        long parsed = std::stol(val, &pos);
        if (pos != std::string(val).size()) {
            LOG_WARN(std::string("Ignoring malformed ") + name + "=" + val);
            return defv;
        }
        return parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring malformed ") + name + "=" + val);
        return defv;
    }
}

long env_positive(const char* name, long defv) {
    long v = env_long(name, defv);
    return v > 0 ? v : defv;
}

std::string env_string(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    return (val && *val) ? std::string(val) : defv;
}

bool env_flag(const char* name, bool defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    std::string s(val);
    return s == "1" || s == "true" || s == "yes" || s == "on";
}
}

Config Config::fromEnv(const std::filesystem::path& workspace) {
    Config cfg;
    cfg.dataDir = env_string("SONAVEC_DATA_DIR", (workspace / "data").string());
    cfg.modelPath = env_string("SONAVEC_MODEL", "");

    cfg.indexUrl = env_string("SONAVEC_INDEX_URL", cfg.indexUrl);
    cfg.collection = env_string("SONAVEC_COLLECTION", cfg.collection);
    cfg.recreateCollection = env_flag("SONAVEC_RECREATE_COLLECTION", false);
    cfg.indexTimeout = std::chrono::seconds(env_positive("SONAVEC_INDEX_TIMEOUT_S", 10));
    cfg.retryBaseDelay = std::chrono::milliseconds(env_long("SONAVEC_RETRY_BASE_MS", 1000));
    if (cfg.retryBaseDelay.count() < 0) {
        cfg.retryBaseDelay = std::chrono::milliseconds(1000);
    }

    cfg.downloadTimeout = std::chrono::seconds(env_positive("SONAVEC_DOWNLOAD_TIMEOUT_S", 10));
    cfg.resolverCommand = env_string("SONAVEC_RESOLVER_CMD", "");

    cfg.layer = static_cast<int>(env_long("SONAVEC_LAYER", -1));
    cfg.reduce = env_string("SONAVEC_REDUCE", "mean");
    cfg.ortThreads = static_cast<int>(env_long("SONAVEC_ORT_THREADS", 0));

    cfg.workers = static_cast<int>(env_positive("SONAVEC_WORKERS", 2));
    cfg.softLimit = std::chrono::seconds(env_positive("SONAVEC_SOFT_LIMIT_S", 1500));
    cfg.hardLimit = std::chrono::seconds(env_positive("SONAVEC_HARD_LIMIT_S", 1800));
    if (cfg.softLimit > cfg.hardLimit) {
        LOG_WARN("Soft time limit exceeds hard limit; clamping");
        cfg.softLimit = cfg.hardLimit;
    }
    return cfg;
}

}
