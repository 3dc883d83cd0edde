/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/fetcher.hpp"
#include "sonavec/json_io.hpp"
#include "sonavec/logger.hpp"
#include <atomic>
#include <cstdio>
#include <sys/wait.h>
#include <unistd.h>

namespace sonavec {

namespace {
std::string shellQuote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

// Runs cmd through the shell, collecting stdout and stderr. Returns the exit status or -1.
int runCommand(const std::string& cmd, std::string& output) {
    FILE* pipe = popen((cmd + " 2>&1").c_str(), "r");
    if (!pipe) {
        return -1;
    }
    char buf[512];
    while (fgets(buf, sizeof(buf), pipe) != nullptr) {
        output += buf;
    }
    int status = pclose(pipe);
    if (status == -1) {
        return -1;
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

std::atomic<unsigned long> g_resolve_counter{0};

// Per-call exchange directory, removed when the call returns.
class ScratchDir {
public:
    explicit ScratchDir(const std::filesystem::path& parent)
        : path_(parent / ("resolve-" + std::to_string(::getpid()) + "-" + std::to_string(++g_resolve_counter))) {
        std::error_code ec;
        std::filesystem::create_directories(path_, ec);
        if (ec) {
            throw ResolverError("cannot create " + path_.string() + ": " + ec.message());
        }
    }

    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            LOG_WARN("Could not remove " + path_.string() + ": " + ec.message());
        }
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};
}

CommandPreviewResolver::CommandPreviewResolver(std::string command, std::filesystem::path workDir)
    : command_(std::move(command)), workDir_(std::move(workDir)) {
}

std::map<std::string, std::string> CommandPreviewResolver::resolve(const std::vector<ResolveQuery>& queries) {
    // Concurrent jobs share one resolver, so every call gets its own files
    ScratchDir scratch(workDir_);
    auto tracksFile = scratch.path() / "tracks.json";
    auto urlsFile = scratch.path() / "preview_urls.json";

    Json::Value request(Json::arrayValue);
    for (const auto& q : queries) {
        Json::Value entry(Json::objectValue);
        entry["name"] = q.name;
        entry["artist"] = q.artist;
        request.append(entry);
    }
    if (!writeJsonFileAtomic(tracksFile, request)) {
        throw ResolverError("cannot write " + tracksFile.string());
    }

    std::string cmd = command_ + " " + shellQuote(tracksFile.string()) + " " + shellQuote(urlsFile.string());
    LOG_DEBUG("Running preview resolver: " + cmd);
    std::string output;
    int exitCode = runCommand(cmd, output);
    if (!output.empty()) {
        LOG_DEBUG("Resolver output: " + output);
    }
    if (exitCode != 0) {
        throw ResolverError("resolver exited with status " + std::to_string(exitCode));
    }

    Json::Value mapping;
    std::string err;
    if (!readJsonFile(urlsFile, mapping, &err) || !mapping.isObject()) {
        throw ResolverError("resolver produced no usable " + urlsFile.filename().string() + " " + err);
    }

    std::map<std::string, std::string> urls;
    for (const auto& key : mapping.getMemberNames()) {
        const Json::Value& url = mapping[key];
        if (url.isString() && !url.asString().empty()) {
            urls[key] = url.asString();
        }
    }
    LOG_INFO("Resolver found " + std::to_string(urls.size()) + "/" + std::to_string(queries.size()) +
             " preview URLs");
    return urls;
}

Downloader httpDownloader(std::chrono::milliseconds timeout) {
    auto client = std::make_shared<HttpClient>();
    return [client, timeout](const std::string& url, const std::filesystem::path& dest) {
        return client->download(url, dest, timeout);
    };
}

PreviewFetcher::PreviewFetcher(std::filesystem::path outputDir, std::shared_ptr<PreviewResolver> resolver,
                               Downloader downloader)
    : outputDir_(std::move(outputDir)), resolver_(std::move(resolver)), downloader_(std::move(downloader)) {
    if (!downloader_) {
        throw std::invalid_argument("PreviewFetcher requires a downloader");
    }
}

std::filesystem::path PreviewFetcher::targetPath(const TrackDescriptor& track) const {
    return outputDir_ / (sanitizeFilename(compositeKey(track)) + ".mp3");
}

FetchSummary PreviewFetcher::fetch(const std::vector<TrackDescriptor>& tracks) {
    FetchSummary summary;
    summary.tracksTotal = tracks.size();

    std::error_code ec;
    std::filesystem::create_directories(outputDir_, ec);
    if (ec) {
        summary.message = "cannot create " + outputDir_.string() + ": " + ec.message();
        LOG_ERROR(summary.message);
        return summary;
    }

    std::vector<ResolveQuery> queries;
    for (const auto& t : tracks) {
        if (t.previewUrl.empty()) {
            queries.push_back({t.name, t.artist});
        }
    }

    std::map<std::string, std::string> resolved;
    if (!queries.empty()) {
        if (resolver_) {
            try {
                resolved = resolver_->resolve(queries);
            } catch (const std::exception& e) {
                summary.message = std::string("preview resolution failed: ") + e.what();
                LOG_ERROR(summary.message);
                return summary;
            }
        } else {
            LOG_WARN(std::to_string(queries.size()) + " track(s) lack a preview URL and no resolver is configured");
        }
    }

    for (const auto& track : tracks) {
        const std::string key = compositeKey(track);
        std::string url = track.previewUrl;
        if (url.empty()) {
            auto it = resolved.find(key);
            if (it != resolved.end()) {
                url = it->second;
            }
        }
        if (url.empty()) {
            LOG_WARN("No preview for " + key);
            ++summary.missing;
            continue;
        }

        auto target = targetPath(track);
        if (std::filesystem::exists(target, ec)) {
            LOG_DEBUG("Preview already present: " + target.filename().string());
            ++summary.cached;
            summary.files[trackKey(track)] = target;
            continue;
        }

        DownloadResult result;
        try {
            result = downloader_(url, target);
        } catch (const std::exception& e) {
            result.ok = false;
            result.error = e.what();
        }
        if (!result.ok) {
            LOG_WARN("Error downloading preview for " + key + ": " + result.error);
            std::filesystem::remove(target, ec);
            ++summary.failed;
            continue;
        }
        ++summary.downloaded;
        summary.files[trackKey(track)] = target;
    }

    summary.ok = true;
    summary.message = "Downloaded " + std::to_string(summary.downloaded) + " previews out of " +
                      std::to_string(summary.tracksTotal) + " tracks";
    if (summary.cached > 0) {
        summary.message += " (" + std::to_string(summary.cached) + " already present)";
    }
    LOG_INFO(summary.message);
    return summary;
}

}
