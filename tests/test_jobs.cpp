/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include <fstream>
#include <thread>

#include "sonavec/flow.hpp"
#include "sonavec/json_io.hpp"
#include "sonavec/normalizer.hpp"
#include "sonavec/pipeline.hpp"
#include "sonavec/pool.hpp"
#include "sonavec/processor.hpp"
#include "sonavec/scanner.hpp"
#include "sonavec/server.hpp"
#include "sonavec/work.hpp"
#include "test_support.hpp"

using namespace sonavec;
using namespace sonavec::testing;
using std::chrono::milliseconds;

namespace {
Downloader slowToneDownloader(milliseconds delay) {
    return [delay](const std::string&, const std::filesystem::path& dest) {
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        DownloadResult r;
        r.ok = writeWav16(dest, tone(0.5, 16000, 1));
        r.status = 200;
        return r;
    };
}

Json::Value oneTrack() {
    Json::Value tracks;
    REQUIRE(parseJson(R"([{"id": "t1", "name": "One", "artist": "Band", "preview_url": "http://cdn/1.mp3"}])",
                      tracks));
    return tracks;
}

struct JobHarness {
    TempDir dir;
    std::filesystem::path workspace = dir.path() / "ws";
    std::shared_ptr<FakeIndexState> state = std::make_shared<FakeIndexState>();
    AudioNormalizer normalizer;
    FakeModel model;
    std::shared_ptr<VectorIndexClient> index;
    std::unique_ptr<Pipeline> pipeline;

    explicit JobHarness(milliseconds downloadDelay = milliseconds(0)) {
        IndexOptions options;
        options.retry.baseDelay = milliseconds(0);
        index = std::make_shared<VectorIndexClient>(fakeFactory(state), options);

        PipelineSettings settings;
        settings.dataDir = dir.path() / "data";
        auto client = index;
        pipeline = std::make_unique<Pipeline>(settings, nullptr, slowToneDownloader(downloadDelay), normalizer,
                                              model, [client] {
                                                  client->ensureCollection();
                                                  return client;
                                              });
    }
};
}

TEST_CASE("Submissions are validated", "[jobs]") {
    TempDir dir;
    Work work(dir.path());
    REQUIRE(work.ready());

    auto noUser = work.submit("", oneTrack());
    CHECK_FALSE(noUser);
    CHECK(noUser.error == SubmissionError::InvalidContent);

    auto notArray = work.submit("alice", Json::Value("tracks"));
    CHECK(notArray.error == SubmissionError::InvalidContent);

    work.setMaxSize(16);
    auto tooBig = work.submit("alice", oneTrack());
    CHECK(tooBig.error == SubmissionError::InvalidSize);

    CHECK_FALSE(work.submitRequest("{not json"));
    CHECK(work.submitRequest(R"({"tracks": []})").message == "user_id is required");
}

TEST_CASE("A submitted job is pending until a worker claims it", "[jobs]") {
    TempDir dir;
    Work work(dir.path());
    auto submitted = work.submitRequest(R"({"user_id": "alice", "tracks": []})");
    REQUIRE(submitted);

    auto jobDir = dir.path() / "input" / "ready" / submitted.id;
    CHECK(std::filesystem::exists(jobDir / kRequestFile));
    CHECK(Scanner(dir.path()).scan() == std::vector<JobId>{submitted.id});

    Flow flow(dir.path());
    JobStatus status = flow.status(submitted.id);
    CHECK(status.state == Stage::Pending);
    CHECK(status.progress == 0);
    CHECK_FALSE(flow.release(submitted.id));

    CHECK(flow.status("no-such-job").state == Stage::Missing);
    CHECK(flow.status("../escape").state == Stage::Missing);
}

TEST_CASE("A processed job completes with its result", "[jobs]") {
    JobHarness h;
    Work work(h.workspace);
    auto submitted = work.submit("alice", oneTrack());
    REQUIRE(submitted);

    Processor processor(h.workspace, *h.pipeline);
    CHECK(processor.process(submitted.id, 0) == ProcessResult::Success);
    CHECK(processor.process(submitted.id, 1) == ProcessResult::NotFound);

    Flow flow(h.workspace);
    JobStatus status = flow.status(submitted.id);
    CHECK(status.state == Stage::Completed);
    CHECK(status.progress == 100);
    CHECK(status.message == "Library processing completed successfully");
    CHECK(status.result["embeddings_generated"].asInt() == 1);
    CHECK(status.result["user_id"].asString() == "alice");
    CHECK(status.toJson()["state"].asString() == "COMPLETED");

    REQUIRE(flow.list().size() == 1);
    CHECK(flow.latest()->id == submitted.id);

    CHECK(flow.release(submitted.id));
    CHECK(flow.status(submitted.id).state == Stage::Missing);
}

TEST_CASE("A job without tracks ends FAILED with the reason", "[jobs]") {
    JobHarness h;
    Work work(h.workspace);
    auto submitted = work.submit("alice", Json::Value(Json::arrayValue));
    REQUIRE(submitted);

    Processor processor(h.workspace, *h.pipeline);
    CHECK(processor.process(submitted.id, 0) == ProcessResult::Failed);

    Flow flow(h.workspace);
    JobStatus status = flow.status(submitted.id);
    CHECK(status.state == Stage::Failed);
    CHECK(status.progress == 100);
    CHECK(status.message == "No tracks provided for processing");
    CHECK(flow.error(submitted.id) == std::optional<std::string>("No tracks provided for processing"));
    CHECK(flow.release(submitted.id));
}

TEST_CASE("Index outages fail the job with a sanitized message", "[jobs]") {
    JobHarness h;
    h.state->failNext("list", FailureClass::Connection, 3);
    Work work(h.workspace);
    auto submitted = work.submit("alice", oneTrack());
    REQUIRE(submitted);

    Processor processor(h.workspace, *h.pipeline);
    CHECK(processor.process(submitted.id, 0) == ProcessResult::SystemError);

    JobStatus status = Flow(h.workspace).status(submitted.id);
    CHECK(status.state == Stage::Failed);
    CHECK(status.message.rfind("Error during EMBEDDING: ", 0) == 0);
}

TEST_CASE("Jobs past the hard limit are failed and their late output dropped", "[jobs]") {
    JobHarness h(milliseconds(400));
    Work work(h.workspace);
    auto submitted = work.submit("alice", oneTrack());
    REQUIRE(submitted);

    JobLimits limits;
    limits.soft = milliseconds(20);
    limits.hard = milliseconds(80);
    Processor processor(h.workspace, *h.pipeline, limits);
    CHECK(processor.process(submitted.id, 0) == ProcessResult::TimedOut);

    JobStatus status = Flow(h.workspace).status(submitted.id);
    CHECK(status.state == Stage::Failed);
    CHECK(status.message.find("hard time limit") != std::string::npos);
    CHECK_FALSE(std::filesystem::exists(h.workspace / "output" / submitted.id));
    CHECK_FALSE(std::filesystem::exists(h.workspace / "processing" / submitted.id));
    CHECK(h.state->upsertCalls == 0);
}

TEST_CASE("The pool runs each token once", "[jobs]") {
    Pool pool(2);
    std::mutex mutex;
    std::vector<JobId> seen;
    REQUIRE(pool.start([&](const JobId& id, int) {
        std::this_thread::sleep_for(milliseconds(20));
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(id);
    }));

    CHECK(pool.submit("a"));
    CHECK_FALSE(pool.submit("a"));
    CHECK(pool.submit("b"));
    CHECK_FALSE(pool.submit(""));
    REQUIRE(pool.waitIdle(milliseconds(2000)));
    pool.stop();

    std::sort(seen.begin(), seen.end());
    CHECK(seen == std::vector<JobId>{"a", "b"});
    CHECK_FALSE(pool.submit("c"));
}

TEST_CASE("The daemon picks up, runs and recovers jobs", "[jobs]") {
    TempDir dir;
    auto workspace = dir.path() / "ws";
    auto state = std::make_shared<FakeIndexState>();

    // A job left behind by a crashed daemon
    Work work(workspace);
    auto orphan = work.submit("bob", oneTrack());
    REQUIRE(orphan);
    std::filesystem::rename(workspace / "input" / "ready" / orphan.id, workspace / "processing" / orphan.id);

    Config config;
    config.dataDir = dir.path() / "data";
    config.workers = 2;
    config.retryBaseDelay = milliseconds(0);

    ServerParts parts;
    parts.model = std::make_unique<FakeModel>();
    parts.transport = fakeFactory(state);
    parts.downloader = slowToneDownloader(milliseconds(0));

    Server server(config, workspace, std::move(parts));
    server.setScanInterval(milliseconds(20));
    REQUIRE(server.start());

    auto fresh = work.submit("alice", oneTrack());
    REQUIRE(fresh);

    Flow flow(workspace);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(20);
    while (std::chrono::steady_clock::now() < deadline &&
           (!isTerminal(flow.status(orphan.id).state) || !isTerminal(flow.status(fresh.id).state))) {
        std::this_thread::sleep_for(milliseconds(20));
    }
    server.shutdown();

    CHECK(flow.status(orphan.id).state == Stage::Completed);
    CHECK(flow.status(fresh.id).state == Stage::Completed);
    CHECK(state->createCalls == 1);
    CHECK(state->points.count("t1") == 1);
}
