/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/logger.hpp"
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace sonavec {

namespace {
std::mutex g_write_mutex;
std::once_flag g_env_once;
std::atomic<LogLevel> g_level{LogLevel::INFO};
std::atomic<bool> g_level_pinned{false};

thread_local std::string t_thread_name;

struct LevelName {
    const char* name;
    LogLevel level;
};

constexpr LevelName kLevelNames[] = {
    {"error", LogLevel::ERROR},
    {"warn", LogLevel::WARN},
    {"warning", LogLevel::WARN},
    {"info", LogLevel::INFO},
    {"debug", LogLevel::DEBUG},
    {"trace", LogLevel::TRACE},
};

void loadEnvLevel() {
    // An explicit setLevel() before first use wins over the environment
    if (g_level_pinned.load()) {
        return;
    }
    if (const char* value = std::getenv("SONAVEC_LOG_LEVEL")) {
        g_level.store(Logger::parseLevel(value));
    }
}

std::string threadLabel() {
    if (!t_thread_name.empty()) {
        return t_thread_name;
    }
    std::ostringstream oss;
    oss << "T" << std::this_thread::get_id();
    return oss.str();
}

// [2025-01-31 12:00:00.123] [INFO ] [Worker-1] message
std::string formatLine(const char* levelTag, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    localtime_r(&secs, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);
    char ms[8];
    std::snprintf(ms, sizeof(ms), ".%03d", static_cast<int>(millis));

    std::string line;
    line.reserve(message.size() + 48);
    line.append("[").append(stamp).append(ms).append("] [").append(levelTag).append("] [");
    line.append(threadLabel()).append("] ").append(message);
    return line;
}
}

void Logger::setLevel(LogLevel level) noexcept {
    g_level_pinned.store(true);
    g_level.store(level);
}

void Logger::initFromEnv() noexcept {
    g_level_pinned.store(false);
    g_level.store(parseEnvLevel());
}

LogLevel Logger::level() noexcept {
    std::call_once(g_env_once, loadEnvLevel);
    return g_level.load();
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    if (static_cast<uint8_t>(level) > static_cast<uint8_t>(Logger::level())) {
        return;
    }
    try {
        std::string line = formatLine(levelToString(level), message);
        // stdout stays reserved for tool output (tokens, JSON)
        std::lock_guard<std::mutex> lock(g_write_mutex);
        std::cerr << line << '\n' << std::flush;
    } catch (const std::exception& e) {
        std::fputs("sonavec: log write failed: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputc('\n', stderr);
    }
}

LogLevel Logger::parseLevel(const std::string& value) noexcept {
    std::string lowered;
    for (unsigned char c : value) {
        lowered.push_back(static_cast<char>(std::tolower(c)));
    }
    for (const auto& entry : kLevelNames) {
        if (lowered == entry.name) {
            return entry.level;
        }
    }
    return LogLevel::INFO;
}

LogLevel Logger::parseEnvLevel() noexcept {
    const char* value = std::getenv("SONAVEC_LOG_LEVEL");
    return value ? parseLevel(value) : LogLevel::INFO;
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "?????";
}

void setThreadName(const std::string& name) {
    t_thread_name = name;
}

}
