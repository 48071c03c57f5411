// SPDX-License-Identifier: Apache-2.0
#include <pipeline/Message.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace chatvox;

TEST_CASE("computeCacheKey is deterministic", "[message]")
{
    auto const params = SynthesisParams {};
    auto const a = computeCacheKey("Hello world", "Alice", params);
    auto const b = computeCacheKey("Hello world", "Alice", params);
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    CHECK(*a == *b);
    CHECK(a->size() == 64);
}

TEST_CASE("computeCacheKey ignores whitespace differences and voice case", "[message]")
{
    auto const params = SynthesisParams {};
    auto const base = computeCacheKey("Hello world", "Alice", params).value();
    CHECK(computeCacheKey("  Hello \t  world\n", "Alice", params).value() == base);
    CHECK(computeCacheKey("Hello world", "alice", params).value() == base);
    CHECK(computeCacheKey("hello world", "Alice", params).value() != base);
}

TEST_CASE("computeCacheKey changes with every synthesis parameter", "[message]")
{
    auto const base = SynthesisParams {};
    auto const baseKey = computeCacheKey("text", "voice", base).value();

    CHECK(computeCacheKey("text", "other", base).value() != baseKey);
    CHECK(computeCacheKey("text!", "voice", base).value() != baseKey);

    auto p = base;
    p.model = "0.6B";
    CHECK(computeCacheKey("text", "voice", p).value() != baseKey);

    p = base;
    p.language = "German";
    CHECK(computeCacheKey("text", "voice", p).value() != baseKey);

    p = base;
    p.speed = 1.25;
    CHECK(computeCacheKey("text", "voice", p).value() != baseKey);

    p = base;
    p.temperature = 0.8;
    CHECK(computeCacheKey("text", "voice", p).value() != baseKey);

    p = base;
    p.repetitionPenalty = 1.1;
    CHECK(computeCacheKey("text", "voice", p).value() != baseKey);

    p = base;
    p.maxTokens = 1000;
    CHECK(computeCacheKey("text", "voice", p).value() != baseKey);

    p = base;
    p.temperature = 0.70004;
    CHECK(computeCacheKey("text", "voice", p).value() != baseKey);

    p = base;
    p.speed = 1.00001;
    CHECK(computeCacheKey("text", "voice", p).value() != baseKey);
}

TEST_CASE("computeCacheKey keeps fields apart", "[message]")
{
    auto const params = SynthesisParams {};
    CHECK(computeCacheKey("b c", "a", params).value() != computeCacheKey("c", "a b", params).value());
}

TEST_CASE("transition follows the happy path", "[message]")
{
    CHECK(transition(MessageState::Queued, MessageEvent::StartSynthesis).value() == MessageState::Synthesizing);
    CHECK(transition(MessageState::Synthesizing, MessageEvent::AudioReady).value() == MessageState::Ready);
    CHECK(transition(MessageState::Ready, MessageEvent::StartPlayback).value() == MessageState::Playing);
    CHECK(transition(MessageState::Playing, MessageEvent::Finish).value() == MessageState::Done);
}

TEST_CASE("transition supports cache hits and duplicates", "[message]")
{
    CHECK(transition(MessageState::Queued, MessageEvent::AudioReady).value() == MessageState::Ready);
    CHECK(transition(MessageState::Queued, MessageEvent::AwaitDuplicate).value() == MessageState::WaitingForCache);
    CHECK(transition(MessageState::WaitingForCache, MessageEvent::AudioReady).value() == MessageState::Ready);
}

TEST_CASE("transition allows fail and skip from every non-terminal state", "[message]")
{
    for (auto const state: { MessageState::Queued,
                             MessageState::Synthesizing,
                             MessageState::WaitingForCache,
                             MessageState::Ready,
                             MessageState::Playing })
    {
        CHECK(transition(state, MessageEvent::Fail).value() == MessageState::Failed);
        CHECK(transition(state, MessageEvent::Skip).value() == MessageState::Skipped);
    }
}

TEST_CASE("transition rejects invalid pairs", "[message]")
{
    auto const rejected = [](MessageState state, MessageEvent event) {
        auto const result = transition(state, event);
        return !result && result.error().code == ErrorCode::InvalidTransition;
    };

    CHECK(rejected(MessageState::Queued, MessageEvent::StartPlayback));
    CHECK(rejected(MessageState::Queued, MessageEvent::Finish));
    CHECK(rejected(MessageState::Synthesizing, MessageEvent::StartSynthesis));
    CHECK(rejected(MessageState::Synthesizing, MessageEvent::StartPlayback));
    CHECK(rejected(MessageState::Ready, MessageEvent::AudioReady));
    CHECK(rejected(MessageState::Playing, MessageEvent::StartPlayback));

    SECTION("terminal states accept nothing")
    {
        for (auto const state: { MessageState::Done, MessageState::Failed, MessageState::Skipped })
        {
            CHECK(rejected(state, MessageEvent::Fail));
            CHECK(rejected(state, MessageEvent::Skip));
            CHECK(rejected(state, MessageEvent::AudioReady));
        }
    }
}

TEST_CASE("normalizeText trims and collapses whitespace", "[message]")
{
    CHECK(normalizeText("  hello   world  ") == "hello world");
    CHECK(normalizeText("a\t\nb") == "a b");
    CHECK(normalizeText("   ").empty());
    CHECK(normalizeText("").empty());
}

TEST_CASE("ttsLength counts digits five times", "[message]")
{
    CHECK(ttsLength("abc") == 3);
    CHECK(ttsLength("a1") == 6);
    CHECK(ttsLength("2024") == 20);
    CHECK(ttsLength("") == 0);
}

TEST_CASE("QueuedMessage::apply records timestamps", "[message]")
{
    auto message = QueuedMessage { .id = 7 };
    auto const t0 = fromUnixMillis(1000);
    auto const t1 = fromUnixMillis(2000);

    REQUIRE(message.apply(MessageEvent::StartSynthesis, t0).has_value());
    REQUIRE(message.apply(MessageEvent::AudioReady, t1).has_value());

    CHECK(message.state == MessageState::Ready);
    CHECK(message.enteredAt(MessageState::Synthesizing) == t0);
    CHECK(message.enteredAt(MessageState::Ready) == t1);
    CHECK(!message.enteredAt(MessageState::Playing).has_value());

    auto const invalid = message.apply(MessageEvent::StartSynthesis);
    REQUIRE(!invalid.has_value());
    CHECK(invalid.error().code == ErrorCode::InvalidTransition);
    CHECK(message.state == MessageState::Ready);
}

TEST_CASE("QueuedMessage::displayText shortens and flattens", "[message]")
{
    auto message = QueuedMessage { .text = "line one\nline two" };
    CHECK(message.displayText() == "line one line two");
    CHECK(message.displayText(10) == "line on...");
}
