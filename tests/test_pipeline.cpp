/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include <fstream>

#include "sonavec/json_io.hpp"
#include "sonavec/normalizer.hpp"
#include "sonavec/pipeline.hpp"
#include "test_support.hpp"

using namespace sonavec;
using namespace sonavec::testing;

namespace {
// Writes a short tone for every URL, fails for URLs containing "missing".
Downloader toneDownloader(std::shared_ptr<std::atomic<int>> calls) {
    return [calls](const std::string& url, const std::filesystem::path& dest) {
        ++*calls;
        DownloadResult r;
        if (url.find("missing") != std::string::npos) {
            r.status = 404;
            r.error = "HTTP 404";
            return r;
        }
        r.ok = writeWav16(dest, tone(1.0, 16000, 1));
        r.status = 200;
        return r;
    };
}

class BrokenResolver final : public PreviewResolver {
public:
    std::map<std::string, std::string> resolve(const std::vector<ResolveQuery>&) override {
        throw ResolverError("resolver unreachable");
    }
};

struct Harness {
    TempDir dir;
    std::shared_ptr<FakeIndexState> state = std::make_shared<FakeIndexState>();
    std::shared_ptr<std::atomic<int>> downloads = std::make_shared<std::atomic<int>>(0);
    AudioNormalizer normalizer;
    FakeModel model;
    std::shared_ptr<VectorIndexClient> index;
    std::vector<std::pair<Stage, std::string>> stages;

    Harness() {
        IndexOptions options;
        options.retry.baseDelay = std::chrono::milliseconds(0);
        index = std::make_shared<VectorIndexClient>(fakeFactory(state), options);
    }

    Pipeline pipeline(std::shared_ptr<PreviewResolver> resolver = nullptr, IndexProvider provider = nullptr) {
        PipelineSettings settings;
        settings.dataDir = dir.path() / "data";
        if (!provider) {
            auto client = index;
            provider = [client] {
                client->ensureCollection();
                return client;
            };
        }
        return Pipeline(settings, std::move(resolver), toneDownloader(downloads), normalizer, model,
                        std::move(provider));
    }

    JobContext job(const std::string& user = "alice", const std::atomic<bool>* cancelled = nullptr) {
        JobContext ctx;
        ctx.jobId = "job-1";
        ctx.userId = user;
        ctx.cancelled = cancelled;
        ctx.onStage = [this](Stage s, const std::string& m) { stages.emplace_back(s, m); };
        return ctx;
    }

    std::vector<Stage> stageSequence() const {
        std::vector<Stage> out;
        for (const auto& s : stages) out.push_back(s.first);
        return out;
    }
};

Json::Value tracks(const std::string& text) {
    Json::Value v;
    REQUIRE(parseJson(text, v));
    return v;
}
}

TEST_CASE("Pipeline rejects per-frame reduction", "[pipeline]") {
    Harness h;
    PipelineSettings settings;
    settings.reduction = Reduction::None;
    CHECK_THROWS_AS(Pipeline(settings, nullptr, toneDownloader(h.downloads), h.normalizer, h.model,
                             [] { return std::shared_ptr<VectorIndexClient>(); }),
                    std::invalid_argument);
}

TEST_CASE("A library is embedded and indexed end to end", "[pipeline]") {
    Harness h;
    auto pipeline = h.pipeline();

    auto result = pipeline.run(h.job(), tracks(R"([
        {"id": "t1", "name": "One", "artists": [{"name": "Band"}], "preview_url": "http://cdn/1.mp3", "duration_ms": 1000},
        {"id": "t2", "name": "Two", "artist": "Band", "preview_url": "http://cdn/2.mp3"},
        {"id": "t3", "name": "Three", "artist": "Band", "preview_url": "http://cdn/missing.mp3"},
        "not a track"
    ])"));

    REQUIRE(result.ok());
    CHECK(result.message == "Library processing completed successfully");
    CHECK(result.tracksProcessed == 4);
    CHECK(result.embeddingsGenerated == 2);
    CHECK(h.stageSequence() == std::vector<Stage>{Stage::Processing, Stage::Downloading, Stage::Converting,
                                                  Stage::Embedding, Stage::Completed});

    REQUIRE(h.state->points.count("t1") == 1);
    const auto& point = h.state->points.at("t1");
    CHECK(point.vector.size() == kEmbeddingDim);
    CHECK(point.vector[0] == Approx(1.15));
    CHECK(point.payload["user_id"].asString() == "alice");
    CHECK(point.payload["track_id"].asString() == "t1");
    CHECK(point.payload["artist"].asString() == "Band");

    Json::Value artifact;
    REQUIRE(readJsonFile(pipeline.artifactPath("alice"), artifact));
    REQUIRE(artifact.size() == 2);
    CHECK(artifact[0u]["track_id"].asString() == "t1");
    CHECK(artifact[0u]["layer"].asInt() == 1);
    CHECK(artifact[0u]["reduce"].asString() == "mean");
    CHECK(artifact[0u]["embedding"].size() == kEmbeddingDim);

    Json::Value summary = result.toJson();
    CHECK(summary["status"].asString() == "COMPLETED");
    CHECK(summary["embeddings_generated"].asUInt() == 2);
}

TEST_CASE("Tracks that fail to store are left out of the artifact", "[pipeline]") {
    Harness h;
    h.state->failNext("upsert", FailureClass::Permanent);
    auto pipeline = h.pipeline();

    auto result = pipeline.run(h.job(), tracks(R"([
        {"id": "t1", "name": "One", "artist": "Band", "preview_url": "http://cdn/1.mp3"},
        {"id": "t2", "name": "Two", "artist": "Band", "preview_url": "http://cdn/2.mp3"}
    ])"));

    REQUIRE(result.ok());
    CHECK(result.embeddingsGenerated == 1);
}

TEST_CASE("Zero embeddings still completes", "[pipeline]") {
    Harness h;
    auto pipeline = h.pipeline();
    auto result = pipeline.run(h.job(), tracks(R"([{"name": "Gone", "artist": "Band", "preview_url": "http://cdn/missing.mp3"}])"));

    CHECK(result.ok());
    CHECK(result.embeddingsGenerated == 0);
    CHECK(h.state->upsertCalls == 0);
}

TEST_CASE("An empty track list fails before any stage", "[pipeline]") {
    Harness h;
    auto pipeline = h.pipeline();
    auto result = pipeline.run(h.job(), Json::Value(Json::arrayValue));

    CHECK(result.state == Stage::Failed);
    CHECK(result.message == "No tracks provided for processing");
    CHECK(h.stageSequence() == std::vector<Stage>{Stage::Failed});
    CHECK(h.downloads->load() == 0);
}

TEST_CASE("Only unusable records is a validation failure", "[pipeline]") {
    Harness h;
    auto pipeline = h.pipeline();
    auto result = pipeline.run(h.job(), tracks(R"([1, "two", null])"));

    CHECK(result.state == Stage::Failed);
    CHECK(result.message == "No valid tracks found to process");
    CHECK(h.stageSequence() == std::vector<Stage>{Stage::Processing, Stage::Failed});
}

TEST_CASE("A resolver outage fails the job at the download stage", "[pipeline]") {
    Harness h;
    auto pipeline = h.pipeline(std::make_shared<BrokenResolver>());
    auto result = pipeline.run(h.job(), tracks(R"([{"name": "One", "artist": "Band"}])"));

    CHECK(result.state == Stage::Failed);
    CHECK(result.message.rfind("Failed to download previews: ", 0) == 0);
    CHECK(h.stageSequence() == std::vector<Stage>{Stage::Processing, Stage::Downloading, Stage::Failed});
    CHECK(h.model.calls.load() == 0);
}

TEST_CASE("Index outages are reported as FAILED and rethrown", "[pipeline]") {
    Harness h;
    auto pipeline = h.pipeline(nullptr, []() -> std::shared_ptr<VectorIndexClient> {
        throw IndexConnectionError("index down\nsecond line");
    });

    CHECK_THROWS_AS(pipeline.run(h.job(), tracks(R"([{"id": "t1", "name": "One", "artist": "Band",
                                                      "preview_url": "http://cdn/1.mp3"}])")),
                    IndexConnectionError);

    REQUIRE_FALSE(h.stages.empty());
    CHECK(h.stages.back().first == Stage::Failed);
    CHECK(h.stages.back().second == "Error during EMBEDDING: index down second line");
}

TEST_CASE("A cancelled job stops at the next stage boundary", "[pipeline]") {
    Harness h;
    std::atomic<bool> cancelled{true};
    auto pipeline = h.pipeline();

    CHECK_THROWS_AS(pipeline.run(h.job("alice", &cancelled),
                                 tracks(R"([{"id": "t1", "name": "One", "artist": "Band", "preview_url": "http://cdn/1.mp3"}])")),
                    JobCancelled);
    CHECK(h.downloads->load() == 0);
}

TEST_CASE("Per-user directories are kept apart", "[pipeline]") {
    Harness h;
    auto pipeline = h.pipeline();
    CHECK(pipeline.previewDir("alice") != pipeline.previewDir("bob"));
    CHECK(pipeline.artifactPath("a/b").filename() == "a_b_embeddings.json");
}
