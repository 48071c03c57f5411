// SPDX-License-Identifier: Apache-2.0
#include <pipeline/Pipeline.hpp>

#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"

using namespace chatvox;
using namespace chatvox::test;

namespace
{

auto testConfig() -> PipelineConfig
{
    return PipelineConfig {
        .queue = QueueSettings { .defaultVoice = "Alice" },
        .scheduler = SchedulerConfig { .batchSize = 2 },
        .playback = PlaybackConfig { .delay = std::chrono::milliseconds(0) },
        .cycleInterval = std::chrono::milliseconds(10),
    };
}

struct PipelineFixture
{
    TempDir dir { "pipeline" };
    std::unique_ptr<CacheEngine> cache = CacheEngine::open(CacheConfig { .directory = dir.path() }).value();
    MockSynthesisClient client;
    MockAudioSink sink;
};

} // namespace

TEST_CASE("Pipeline speaks queued messages in arrival order", "[pipeline]")
{
    auto f = PipelineFixture {};
    f.client.voices = { "Alice", "Bob", "Carol" };
    f.client.latency["Bob"] = std::chrono::milliseconds(150);

    auto pipeline = Pipeline(*f.cache, f.client, f.sink, testConfig());
    pipeline.enqueue("a", "twitch", "[bob] slow one");
    pipeline.enqueue("b", "twitch", "[Carol] fast one");
    pipeline.enqueue("c", "twitch", "plain one");
    pipeline.start();

    REQUIRE(waitFor([&] { return f.sink.playedContents().size() == 3; }));
    CHECK(f.sink.playedContents() == std::vector<std::string> { "slow one", "fast one", "plain one" });
    REQUIRE(waitFor([&] { return pipeline.queue().counts().total == 0; }));

    for (auto const& message: pipeline.queue().history())
        CHECK(message.state == MessageState::Done);
    CHECK(pipeline.queue().history().front().voice == "Bob");
    CHECK(f.cache->stats().itemCount == 3);

    pipeline.stop();
    CHECK(!pipeline.isRunning());
}

TEST_CASE("Pipeline replays repeated messages from the cache", "[pipeline]")
{
    auto f = PipelineFixture {};
    auto pipeline = Pipeline(*f.cache, f.client, f.sink, testConfig());
    pipeline.start();

    pipeline.enqueue("a", "twitch", "hello again");
    REQUIRE(waitFor([&] { return f.sink.playedContents().size() == 1; }));
    pipeline.enqueue("b", "twitch", "hello   again");
    REQUIRE(waitFor([&] { return f.sink.playedContents().size() == 2; }));

    CHECK(f.client.callCount() == 1);
    REQUIRE(waitFor([&] { return pipeline.queue().history().size() == 2; }));
    CHECK(pipeline.queue().history().back().wasCacheHit);
}

TEST_CASE("Pipeline skipAll drops queued messages and interrupts playback", "[pipeline]")
{
    auto f = PipelineFixture {};
    f.sink.setBlocking(true);
    auto pipeline = Pipeline(*f.cache, f.client, f.sink, testConfig());
    pipeline.start();

    auto const playing = pipeline.enqueue("a", "twitch", "first").id;
    REQUIRE(waitFor([&] { return f.sink.isPlaying(); }));
    f.client.hold();
    auto const queued = pipeline.enqueue("b", "twitch", "second").id;

    pipeline.skipAll();
    f.client.release();

    REQUIRE(waitFor([&] { return pipeline.queue().counts().total == 0; }));
    CHECK(pipeline.queue().find(playing)->state == MessageState::Done);
    auto const state = pipeline.queue().find(queued)->state;
    CHECK((state == MessageState::Skipped || state == MessageState::Failed));
    CHECK(f.sink.playedContents() == std::vector<std::string> { "first" });
}

TEST_CASE("Pipeline reports state changes", "[pipeline]")
{
    auto f = PipelineFixture {};
    auto pipeline = Pipeline(*f.cache, f.client, f.sink, testConfig());

    auto mutex = std::mutex {};
    auto seen = std::vector<MessageState> {};
    pipeline.setStateChangedCallback([&](const QueuedMessage& message, MessageState) {
        auto lock = std::lock_guard(mutex);
        seen.push_back(message.state);
    });

    pipeline.start();
    pipeline.enqueue("a", "twitch", "observe me");
    REQUIRE(waitFor([&] {
        auto lock = std::lock_guard(mutex);
        return !seen.empty() && seen.back() == MessageState::Done;
    }));

    auto lock = std::lock_guard(mutex);
    CHECK(seen == std::vector<MessageState> {
                      MessageState::Synthesizing,
                      MessageState::Ready,
                      MessageState::Playing,
                      MessageState::Done,
                  });
}

TEST_CASE("Pipeline forwards settings to its components", "[pipeline]")
{
    auto f = PipelineFixture {};
    auto pipeline = Pipeline(*f.cache, f.client, f.sink, testConfig());

    pipeline.setBatchSize(9);
    CHECK(pipeline.scheduler().batchSize() == MaxBatchSize);

    pipeline.setGlobalVolume(80);
    pipeline.setVoiceVolume("Alice", 50);
    CHECK(pipeline.playback().effectiveVolume("Alice") == 0.4f);

    pipeline.setPlaybackDelay(std::chrono::milliseconds(1234));
    CHECK(pipeline.playback().delay() == std::chrono::milliseconds(1234));

    REQUIRE(f.cache->put(keyFor("x"), bytes("abc")).has_value());
    CHECK(pipeline.clearCache().count == 1);
}
