/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "sonavec/http.hpp"
#include "sonavec/track.hpp"

namespace sonavec {

class ResolverError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ResolveQuery {
    std::string name;
    std::string artist;
};

// Maps "name - artist" to a preview URL. Unresolved keys are absent or map to "".
// Throws ResolverError when the lookup as a whole cannot be performed.
class PreviewResolver {
public:
    virtual ~PreviewResolver() = default;
    virtual std::map<std::string, std::string> resolve(const std::vector<ResolveQuery>& queries) = 0;
};

// Runs `<command> <tracks.json> <preview_urls.json>`. The command reads a JSON array of
// {name, artist} and writes a JSON object keyed by "name - artist" with URL or null values.
// Each call exchanges its files in a private directory under workDir, so one instance can
// serve several workers at once.
class CommandPreviewResolver final : public PreviewResolver {
public:
    CommandPreviewResolver(std::string command, std::filesystem::path workDir);

    std::map<std::string, std::string> resolve(const std::vector<ResolveQuery>& queries) override;

private:
    std::string command_;
    std::filesystem::path workDir_;
};

using Downloader = std::function<DownloadResult(const std::string& url, const std::filesystem::path& dest)>;

[[nodiscard]] Downloader httpDownloader(std::chrono::milliseconds timeout);

struct FetchSummary {
    bool ok = false;
    std::string message;
    std::size_t tracksTotal = 0;
    std::size_t downloaded = 0;
    std::size_t cached = 0;     // already on disk, not fetched again
    std::size_t missing = 0;    // no preview URL available
    std::size_t failed = 0;     // download error
    std::map<std::string, std::filesystem::path> files;   // trackKey -> local clip
};

class PreviewFetcher final {
public:
    // resolver may be null; tracks without a preview URL are then skipped.
    PreviewFetcher(std::filesystem::path outputDir, std::shared_ptr<PreviewResolver> resolver,
                   Downloader downloader);

    // Never throws for per-track problems. A resolver failure fails the whole batch.
    [[nodiscard]] FetchSummary fetch(const std::vector<TrackDescriptor>& tracks);

    [[nodiscard]] std::filesystem::path targetPath(const TrackDescriptor& track) const;
    [[nodiscard]] const std::filesystem::path& outputDir() const noexcept { return outputDir_; }

private:
    std::filesystem::path outputDir_;
    std::shared_ptr<PreviewResolver> resolver_;
    Downloader downloader_;
};

}
