// SPDX-License-Identifier: Apache-2.0
#include <chat/ConsoleChatSource.hpp>
#include <chat/MessageFilter.hpp>
#include <pipeline/VoiceQueueManager.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>

using namespace chatvox;

TEST_CASE("parseChatLine splits usernames", "[chat]")
{
    auto const named = parseChatLine("alice: hello there");
    REQUIRE(named.has_value());
    CHECK(named->username == "alice");
    CHECK(named->text == "hello there");

    auto const plain = parseChatLine("  just talking  ");
    REQUIRE(plain.has_value());
    CHECK(plain->username == ConsoleUser);
    CHECK(plain->text == "just talking");

    auto const bracket = parseChatLine("[Bob] note: this");
    REQUIRE(bracket.has_value());
    CHECK(bracket->username == ConsoleUser);
    CHECK(bracket->text == "[Bob] note: this");

    auto const sentence = parseChatLine("it is 10 past: late");
    REQUIRE(sentence.has_value());
    CHECK(sentence->username == ConsoleUser);

    CHECK(!parseChatLine("   ").has_value());
}

TEST_CASE("ConsoleChatSource feeds lines into the filter", "[chat]")
{
    auto queue = VoiceQueueManager(QueueSettings { .defaultVoice = "Alice" });
    auto filter = MessageFilter(queue, FilterRules {});
    auto commands = std::vector<std::string> {};

    auto input = std::istringstream("alice: hello\n\n/skip\n[Bob] hi there\n/volume 50\n");
    auto source = ConsoleChatSource(input, filter, [&](std::string_view command) {
        commands.emplace_back(command);
    });

    CHECK(source.run() == 2);
    CHECK(commands == std::vector<std::string> { "skip", "volume 50" });

    auto const messages = queue.snapshot();
    REQUIRE(messages.size() == 2);
    CHECK(messages[0].username == "alice");
    CHECK(messages[0].platform == ConsolePlatform);
    CHECK(messages[1].voice == "Bob");
    CHECK(messages[1].text == "hi there");
}

TEST_CASE("ConsoleChatSource stops when requested", "[chat]")
{
    auto queue = VoiceQueueManager(QueueSettings { .defaultVoice = "Alice" });
    auto filter = MessageFilter(queue, FilterRules {});
    auto input = std::istringstream("one\ntwo\n");
    auto source = ConsoleChatSource(input, filter);

    auto stopSource = std::stop_source {};
    stopSource.request_stop();
    CHECK(source.run(stopSource.get_token()) == 0);
    CHECK(queue.counts().total == 0);
}
