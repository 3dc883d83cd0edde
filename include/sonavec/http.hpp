/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

typedef void CURL;

namespace sonavec {

enum class TransferError : uint8_t {
    None = 0,
    Connect,    // refused, unresolved, reset, empty reply
    Timeout,
    Other
};

struct HttpResponse {
    long status = 0;
    std::string body;
    TransferError transfer = TransferError::None;
    std::string error;

    [[nodiscard]] bool ok() const noexcept {
        return transfer == TransferError::None && status >= 200 && status < 300;
    }
};

struct DownloadResult {
    bool ok = false;
    long status = 0;
    std::uintmax_t bytes = 0;
    std::string error;
};

// Owns one libcurl easy handle. Requests on the same client are serialized.
class HttpClient final {
public:
    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) = delete;
    HttpClient& operator=(HttpClient&&) = delete;

    [[nodiscard]] HttpResponse request(const std::string& method, const std::string& url,
                                       const std::string& body, std::chrono::milliseconds timeout);

    // Streams the body to dest via a ".part" sibling; nothing is left behind on failure.
    [[nodiscard]] DownloadResult download(const std::string& url, const std::filesystem::path& dest,
                                          std::chrono::milliseconds timeout);

private:
    CURL* curl_ = nullptr;
    std::mutex mutex_;
};

}
