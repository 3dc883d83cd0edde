/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

#include "sonavec/logger.hpp"

namespace sonavec {

enum class FailureClass : uint8_t {
    Transient,    // 5xx, malformed response: retry with the same handle
    Connection,   // refused, reset, timed out: retry with a fresh handle
    Permanent     // 4xx, bad local input: never retried
};

[[nodiscard]] const char* failureClassToString(FailureClass cls) noexcept;

class IndexError : public std::runtime_error {
public:
    IndexError(FailureClass cls, const std::string& message)
        : std::runtime_error(message), class_(cls) {}

    [[nodiscard]] FailureClass failureClass() const noexcept { return class_; }
    [[nodiscard]] bool retryable() const noexcept { return class_ != FailureClass::Permanent; }

private:
    FailureClass class_;
};

class RetryExhausted : public std::runtime_error {
public:
    RetryExhausted(const std::string& operation, int attempts, const std::string& lastError);

    [[nodiscard]] const std::string& operation() const noexcept { return operation_; }
    [[nodiscard]] int attempts() const noexcept { return attempts_; }

private:
    std::string operation_;
    int attempts_;
};

// Raised when connect or ensure-collection cannot complete. Fatal for the pipeline.
class IndexConnectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

struct RetryPolicy {
    int maxAttempts = 3;
    std::chrono::milliseconds baseDelay{1000};
    Sleeper sleep;   // empty means std::this_thread::sleep_for

    // base * 2^attempt, attempt counted from zero
    [[nodiscard]] std::chrono::milliseconds delayFor(int attempt) const noexcept;
    void pause(int attempt) const;
};

// Runs fn until it returns, a non-retryable error escapes, or maxAttempts is reached.
// Every failed retryable attempt is followed by a backoff pause. Connection-class
// failures additionally call reconnect() before the next attempt.
template <typename Fn, typename Reconnect>
auto runWithRetry(const RetryPolicy& policy, const std::string& operation, Fn&& fn, Reconnect&& reconnect)
    -> decltype(fn()) {
    std::string lastError = "no attempt made";
    const int attempts = policy.maxAttempts > 0 ? policy.maxAttempts : 1;

    for (int attempt = 0; attempt < attempts; ++attempt) {
        try {
            return fn();
        } catch (const IndexError& e) {
            if (!e.retryable()) {
                LOG_DEBUG(operation + ": permanent failure: " + e.what());
                throw;
            }
            lastError = e.what();
            auto wait = policy.delayFor(attempt);
            LOG_WARN(operation + " failed (attempt " + std::to_string(attempt + 1) + "/" +
                     std::to_string(attempts) + ", " + failureClassToString(e.failureClass()) +
                     "), waiting " + std::to_string(wait.count()) + "ms: " + e.what());
            policy.pause(attempt);
            if (e.failureClass() == FailureClass::Connection && attempt + 1 < attempts) {
                reconnect();
            }
        }
    }

    LOG_ERROR(operation + " gave up after " + std::to_string(attempts) + " attempts");
    throw RetryExhausted(operation, attempts, lastError);
}

}
