/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "sonavec/logger.hpp"

int main(int argc, char* argv[]) {
    // Keep test output readable; SONAVEC_LOG_LEVEL still overrides
    if (!std::getenv("SONAVEC_LOG_LEVEL")) {
        sonavec::Logger::setLevel(sonavec::LogLevel::ERROR);
    }
    Catch::Session session;
    int result = session.applyCommandLine(argc, argv);
    if (result != 0) return result;
    return session.run();
}
