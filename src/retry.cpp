/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/retry.hpp"
#include <thread>

namespace sonavec {

const char* failureClassToString(FailureClass cls) noexcept {
    switch (cls) {
        case FailureClass::Transient: return "transient";
        case FailureClass::Connection: return "connection";
        case FailureClass::Permanent: return "permanent";
        default: return "unknown";
    }
}

RetryExhausted::RetryExhausted(const std::string& operation, int attempts, const std::string& lastError)
    : std::runtime_error(operation + " failed after " + std::to_string(attempts) + " attempts: " + lastError),
      operation_(operation), attempts_(attempts) {
}

std::chrono::milliseconds RetryPolicy::delayFor(int attempt) const noexcept {
    if (attempt < 0) attempt = 0;
    if (attempt > 30) attempt = 30;
    return baseDelay * (1LL << attempt);
}

void RetryPolicy::pause(int attempt) const {
    auto wait = delayFor(attempt);
    if (sleep) {
        sleep(wait);
    } else if (wait.count() > 0) {
        std::this_thread::sleep_for(wait);
    }
}

}
