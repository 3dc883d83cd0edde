/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace sonavec {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

class Logger {
public:
    // Pins the level; SONAVEC_LOG_LEVEL is then ignored until initFromEnv()
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;

    // One timestamped line on stderr, tagged with the thread's name
    static void log(LogLevel level, const std::string& message) noexcept;

    // Accepts error/warn/warning/info/debug/trace in any case; anything else is INFO
    [[nodiscard]] static LogLevel parseLevel(const std::string& value) noexcept;

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Label shown for the calling thread in every line it logs
void setThreadName(const std::string& name);

}

#define SONAVEC_LOG(lvl, msg) \
    do { \
        if (static_cast<uint8_t>(lvl) <= static_cast<uint8_t>(::sonavec::Logger::level())) \
            ::sonavec::Logger::log(lvl, msg); \
    } while (0)

#define LOG_ERROR(msg) SONAVEC_LOG(::sonavec::LogLevel::ERROR, msg)
#define LOG_WARN(msg)  SONAVEC_LOG(::sonavec::LogLevel::WARN, msg)
#define LOG_INFO(msg)  SONAVEC_LOG(::sonavec::LogLevel::INFO, msg)
#define LOG_DEBUG(msg) SONAVEC_LOG(::sonavec::LogLevel::DEBUG, msg)
#define LOG_TRACE(msg) SONAVEC_LOG(::sonavec::LogLevel::TRACE, msg)
