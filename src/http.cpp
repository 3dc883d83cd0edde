/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/http.hpp"
#include "sonavec/logger.hpp"
#include <curl/curl.h>
#include <fstream>
#include <stdexcept>

namespace sonavec {

namespace {
std::once_flag g_curl_init;

constexpr const char* kUserAgent = "sonavec/0.1";

size_t appendToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t appendToFile(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::ofstream*>(userdata);
    out->write(ptr, static_cast<std::streamsize>(size * nmemb));
    return out->good() ? size * nmemb : 0;
}

TransferError classify(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OK:
            return TransferError::None;
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
            return TransferError::Connect;
        case CURLE_OPERATION_TIMEDOUT:
            return TransferError::Timeout;
        default:
            return TransferError::Other;
    }
}
}

HttpClient::HttpClient() {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    curl_ = curl_easy_init();
    if (!curl_) {
        throw std::runtime_error("curl_easy_init failed");
    }
}

HttpClient::~HttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

HttpResponse HttpClient::request(const std::string& method, const std::string& url,
                                 const std::string& body, std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    HttpResponse res;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, appendToString);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &res.body);

    struct curl_slist* headers = nullptr;
    if (!body.empty()) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    CURLcode code = curl_easy_perform(curl_);
    res.transfer = classify(code);
    if (code == CURLE_OK) {
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &res.status);
    } else {
        res.error = curl_easy_strerror(code);
    }

    if (headers) {
        curl_slist_free_all(headers);
    }

    LOG_TRACE(method + " " + url + " -> " + std::to_string(res.status) +
              (res.error.empty() ? "" : " (" + res.error + ")"));
    return res;
}

DownloadResult HttpClient::download(const std::string& url, const std::filesystem::path& dest,
                                    std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    DownloadResult res;

    auto partPath = dest;
    partPath += ".part";
    std::error_code ec;

    {
        std::ofstream out(partPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            res.error = "cannot open " + partPath.string();
            return res;
        }

        curl_easy_reset(curl_);
        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl_, CURLOPT_USERAGENT, kUserAgent);
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, appendToFile);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &out);

        CURLcode code = curl_easy_perform(curl_);
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &res.status);
        out.flush();

        if (code != CURLE_OK) {
            res.error = curl_easy_strerror(code);
        } else if (res.status < 200 || res.status >= 300) {
            res.error = "HTTP " + std::to_string(res.status);
        } else if (!out.good()) {
            res.error = "write failed for " + partPath.string();
        }
    }

    if (!res.error.empty()) {
        std::filesystem::remove(partPath, ec);
        return res;
    }

    std::filesystem::rename(partPath, dest, ec);
    if (ec) {
        res.error = "rename failed: " + ec.message();
        std::filesystem::remove(partPath, ec);
        return res;
    }

    res.bytes = std::filesystem::file_size(dest, ec);
    res.ok = true;
    return res;
}

}
