// SPDX-License-Identifier: Apache-2.0
#include <chat/MessageFilter.hpp>
#include <pipeline/VoiceQueueManager.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace chatvox;

namespace
{

auto makeRules() -> FilterRules
{
    auto rules = FilterRules {};
    rules.bindings = {
        VoiceBinding { .username = "Streamer", .voice = "Bob" },
        VoiceBinding { .username = "mod", .voice = "Carol", .platform = "youtube" },
        VoiceBinding { .username = "ghost", .voice = "Carol", .enabled = false },
    };
    rules.blacklist = {
        BlacklistEntry { .username = "Spammer" },
        BlacklistEntry { .username = "troll", .platform = "twitch" },
    };
    rules.platforms["twitch"] = PlatformSettings {};
    rules.platforms["youtube"] = PlatformSettings { .requireVoice = true };
    rules.platforms["kick"] = PlatformSettings { .readAllMessages = false };
    rules.platforms["trovo"] = PlatformSettings { .rewardId = "tts-reward" };
    return rules;
}

} // namespace

TEST_CASE("MessageFilter drops blacklisted users", "[filter]")
{
    auto queue = VoiceQueueManager(QueueSettings { .defaultVoice = "Alice" });
    auto filter = MessageFilter(queue, makeRules());

    CHECK(!filter.onMessage("spammer", "twitch", "buy now").has_value());
    CHECK(!filter.onMessage("spammer", "youtube", "[Bob] buy now").has_value());
    CHECK(!filter.onMessage("troll", "twitch", "hi").has_value());
    CHECK(filter.onMessage("troll", "youtube", "[Bob] hi").has_value());
    CHECK(!filter.onReward("Spammer", "twitch", "hi", "any").has_value());
    CHECK(queue.counts().total == 1);
}

TEST_CASE("MessageFilter routes bound users to their voice", "[filter]")
{
    auto queue = VoiceQueueManager(QueueSettings { .defaultVoice = "Alice" });
    auto filter = MessageFilter(queue, makeRules());

    auto const bound = filter.onMessage("streamer", "kick", "hello");
    REQUIRE(bound.has_value());
    CHECK(bound->voice == "Bob");
    CHECK(bound->state == MessageState::Queued);

    auto const explicitVoice = filter.onMessage("streamer", "twitch", "[Dave] hello");
    REQUIRE(explicitVoice.has_value());
    CHECK(explicitVoice->voice == "Dave");

    SECTION("platform specific bindings")
    {
        CHECK(filter.onMessage("mod", "youtube", "hello")->voice == "Carol");
        CHECK(filter.onMessage("mod", "twitch", "hello")->voice == "Alice");
    }

    SECTION("disabled bindings are ignored")
    {
        CHECK(!filter.bindingFor("ghost", "twitch").has_value());
        CHECK(filter.onMessage("ghost", "twitch", "hello")->voice == "Alice");
    }
}

TEST_CASE("MessageFilter applies platform settings", "[filter]")
{
    auto queue = VoiceQueueManager(QueueSettings { .defaultVoice = "Alice" });
    auto filter = MessageFilter(queue, makeRules());

    SECTION("require voice")
    {
        auto const skipped = filter.onMessage("viewer", "youtube", "no voice");
        REQUIRE(skipped.has_value());
        CHECK(skipped->state == MessageState::Skipped);

        auto const named = filter.onMessage("viewer", "YouTube", "[Bob] with voice");
        REQUIRE(named.has_value());
        CHECK(named->state == MessageState::Queued);
    }

    SECTION("rewards only")
    {
        CHECK(!filter.onMessage("viewer", "kick", "hello").has_value());
        CHECK(filter.onReward("viewer", "kick", "hello", "whatever").has_value());
    }

    SECTION("specific reward id")
    {
        CHECK(!filter.onMessage("viewer", "trovo", "hello").has_value());
        CHECK(!filter.onReward("viewer", "trovo", "hello", "other-reward").has_value());
        CHECK(filter.onReward("viewer", "trovo", "hello", "tts-reward").has_value());
        CHECK(filter.onMessage("viewer", "trovo", "hello", "tts-reward").has_value());
    }

    SECTION("unknown platforms read everything")
    {
        CHECK(filter.platformSettings("discord").readAllMessages);
        CHECK(filter.onMessage("viewer", "discord", "hello").has_value());
    }
}

TEST_CASE("MessageFilter rules can be replaced", "[filter]")
{
    auto queue = VoiceQueueManager(QueueSettings { .defaultVoice = "Alice" });
    auto filter = MessageFilter(queue, FilterRules {});
    CHECK(!filter.isBlacklisted("spammer", "twitch"));

    filter.setRules(makeRules());
    CHECK(filter.isBlacklisted("SPAMMER", "twitch"));
    CHECK(filter.rules().bindings.size() == 3);
}
