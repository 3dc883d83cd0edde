/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include <fstream>
#include <functional>
#include <thread>

#include "sonavec/fetcher.hpp"
#include "test_support.hpp"

using namespace sonavec;
using namespace sonavec::testing;

namespace {
struct RecordingDownloader {
    std::shared_ptr<std::vector<std::string>> urls = std::make_shared<std::vector<std::string>>();
    std::shared_ptr<std::vector<std::string>> failing = std::make_shared<std::vector<std::string>>();

    Downloader fn() const {
        auto seen = urls;
        auto bad = failing;
        return [seen, bad](const std::string& url, const std::filesystem::path& dest) {
            seen->push_back(url);
            DownloadResult r;
            if (std::find(bad->begin(), bad->end(), url) != bad->end()) {
                r.status = 404;
                r.error = "HTTP 404";
                return r;
            }
            std::ofstream(dest, std::ios::binary) << "audio:" << url;
            r.ok = true;
            r.status = 200;
            r.bytes = url.size() + 6;
            return r;
        };
    }
};

class MapResolver final : public PreviewResolver {
public:
    explicit MapResolver(std::map<std::string, std::string> urls) : urls_(std::move(urls)) {}

    std::map<std::string, std::string> resolve(const std::vector<ResolveQuery>& queries) override {
        lastQueries = queries;
        ++calls;
        return urls_;
    }

    std::vector<ResolveQuery> lastQueries;
    int calls = 0;

private:
    std::map<std::string, std::string> urls_;
};

class BrokenResolver final : public PreviewResolver {
public:
    std::map<std::string, std::string> resolve(const std::vector<ResolveQuery>&) override {
        throw ResolverError("catalog unreachable");
    }
};

TrackDescriptor track(const std::string& id, const std::string& name, const std::string& artist,
                      const std::string& url = "") {
    TrackDescriptor t;
    t.id = id;
    t.name = name;
    t.artist = artist;
    t.previewUrl = url;
    return t;
}
}

TEST_CASE("Tracks with a preview URL are downloaded without resolving", "[fetcher]") {
    TempDir dir;
    RecordingDownloader dl;
    auto resolver = std::make_shared<MapResolver>(std::map<std::string, std::string>{});
    PreviewFetcher fetcher(dir.path(), resolver, dl.fn());

    auto summary = fetcher.fetch({track("t1", "Song", "Band", "http://cdn/t1.mp3")});

    REQUIRE(summary.ok);
    CHECK(summary.downloaded == 1);
    CHECK(resolver->calls == 0);
    CHECK(summary.message == "Downloaded 1 previews out of 1 tracks");
    REQUIRE(summary.files.count("t1") == 1);
    CHECK(summary.files["t1"] == dir.path() / "Song - Band.mp3");
    CHECK(std::filesystem::exists(summary.files["t1"]));
}

TEST_CASE("Missing URLs are resolved by composite key", "[fetcher]") {
    TempDir dir;
    RecordingDownloader dl;
    auto resolver = std::make_shared<MapResolver>(std::map<std::string, std::string>{
        {"Found - Band", "http://cdn/found.mp3"},
        {"Lost - Band", ""},
    });
    PreviewFetcher fetcher(dir.path(), resolver, dl.fn());

    auto summary = fetcher.fetch({track("", "Found", "Band"), track("", "Lost", "Band")});

    REQUIRE(summary.ok);
    CHECK(resolver->calls == 1);
    CHECK(resolver->lastQueries.size() == 2);
    CHECK(summary.downloaded == 1);
    CHECK(summary.missing == 1);
    CHECK(summary.files.count("Found - Band") == 1);
    CHECK(*dl.urls == std::vector<std::string>{"http://cdn/found.mp3"});
}

TEST_CASE("Existing previews are not fetched again", "[fetcher]") {
    TempDir dir;
    RecordingDownloader dl;
    PreviewFetcher fetcher(dir.path(), nullptr, dl.fn());
    auto t = track("t1", "Song", "Band", "http://cdn/t1.mp3");
    std::ofstream(fetcher.targetPath(t)) << "cached";

    auto summary = fetcher.fetch({t});

    CHECK(summary.ok);
    CHECK(summary.cached == 1);
    CHECK(summary.downloaded == 0);
    CHECK(dl.urls->empty());
    CHECK(summary.files.count("t1") == 1);
}

TEST_CASE("A failed download skips only that track", "[fetcher]") {
    TempDir dir;
    RecordingDownloader dl;
    dl.failing->push_back("http://cdn/bad.mp3");
    PreviewFetcher fetcher(dir.path(), nullptr, dl.fn());

    auto bad = track("b", "Bad", "Band", "http://cdn/bad.mp3");
    auto summary = fetcher.fetch({bad, track("g", "Good", "Band", "http://cdn/good.mp3")});

    CHECK(summary.ok);
    CHECK(summary.failed == 1);
    CHECK(summary.downloaded == 1);
    CHECK_FALSE(std::filesystem::exists(fetcher.targetPath(bad)));
    CHECK(summary.files.count("b") == 0);
}

TEST_CASE("A resolver outage fails the whole batch", "[fetcher]") {
    TempDir dir;
    RecordingDownloader dl;
    PreviewFetcher fetcher(dir.path(), std::make_shared<BrokenResolver>(), dl.fn());

    auto summary = fetcher.fetch({track("t1", "Song", "Band", "http://cdn/t1.mp3"), track("", "Other", "Band")});

    CHECK_FALSE(summary.ok);
    CHECK(summary.downloaded == 0);
    CHECK(dl.urls->empty());
    CHECK(summary.message.find("catalog unreachable") != std::string::npos);
}

TEST_CASE("Without a resolver unresolved tracks are skipped", "[fetcher]") {
    TempDir dir;
    RecordingDownloader dl;
    PreviewFetcher fetcher(dir.path(), nullptr, dl.fn());

    auto summary = fetcher.fetch({track("", "Song", "Band")});
    CHECK(summary.ok);
    CHECK(summary.missing == 1);
    CHECK(summary.files.empty());
}

TEST_CASE("Command resolver exchanges JSON files with the helper", "[fetcher]") {
    TempDir dir;
    auto script = dir.path() / "resolve.sh";
    std::ofstream(script) << "#!/bin/sh\n"
                             "grep -q 'Song' \"$1\" || exit 3\n"
                             "printf '{\"Song - Band\": \"http://cdn/song.mp3\", \"Other - Band\": null}' > \"$2\"\n";
    std::filesystem::permissions(script, std::filesystem::perms::owner_all);

    CommandPreviewResolver resolver(script.string(), dir.path() / "work");
    auto urls = resolver.resolve({{"Song", "Band"}, {"Other", "Band"}});

    REQUIRE(urls.size() == 1);
    CHECK(urls["Song - Band"] == "http://cdn/song.mp3");
}

TEST_CASE("Concurrent resolves on one resolver keep their own results", "[fetcher]") {
    TempDir dir;
    auto script = dir.path() / "resolve.sh";
    std::ofstream(script) << "#!/bin/sh\n"
                             "sleep 0.3\n"
                             "if grep -q 'SongA' \"$1\"; then\n"
                             "  printf '{\"SongA - Ann\": \"http://cdn/a.mp3\"}' > \"$2\"\n"
                             "else\n"
                             "  printf '{\"SongB - Bob\": \"http://cdn/b.mp3\"}' > \"$2\"\n"
                             "fi\n";
    std::filesystem::permissions(script, std::filesystem::perms::owner_all);

    auto work = dir.path() / "work";
    CommandPreviewResolver resolver(script.string(), work);
    std::map<std::string, std::string> forA;
    std::map<std::string, std::string> forB;

    std::string errorA;
    std::string errorB;

    auto run = [&resolver](const ResolveQuery& q, std::map<std::string, std::string>& out, std::string& error) {
        try {
            out = resolver.resolve({q});
        } catch (const ResolverError& e) {
            error = e.what();
        }
    };
    std::thread jobA(run, ResolveQuery{"SongA", "Ann"}, std::ref(forA), std::ref(errorA));
    std::thread jobB(run, ResolveQuery{"SongB", "Bob"}, std::ref(forB), std::ref(errorB));
    jobA.join();
    jobB.join();

    CHECK(errorA.empty());
    CHECK(errorB.empty());
    CHECK(forA == std::map<std::string, std::string>{{"SongA - Ann", "http://cdn/a.mp3"}});
    CHECK(forB == std::map<std::string, std::string>{{"SongB - Bob", "http://cdn/b.mp3"}});
    CHECK(std::filesystem::is_empty(work));
}

TEST_CASE("A failing resolver command raises ResolverError", "[fetcher]") {
    TempDir dir;
    CommandPreviewResolver resolver("false", dir.path());
    CHECK_THROWS_AS(resolver.resolve({{"Song", "Band"}}), ResolverError);
}
