// SPDX-License-Identifier: Apache-2.0
#include <core/Error.hpp>
#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace chatvox;

TEST_CASE("levelFromString parses level names", "[log]")
{
    CHECK(log::levelFromString("error") == log::Level::Error);
    CHECK(log::levelFromString("warn") == log::Level::Warning);
    CHECK(log::levelFromString("trace") == log::Level::Trace);
    CHECK(!log::levelFromString("loud").has_value());
}

TEST_CASE("log routes messages above the level to the callback", "[log]")
{
    auto captured = std::vector<std::pair<log::Level, std::string>> {};
    auto const previous = log::getLevel();
    log::setCallback([&](log::Level level, std::string_view message) { captured.emplace_back(level, message); });
    log::setLevel(log::Level::Info);

    log::info("cache opened with {} entries", 3);
    log::debug("not shown");
    log::error("{}", Error { ErrorCode::CacheError, "disk full" });

    log::setCallback({});
    log::setLevel(previous);

    REQUIRE(captured.size() == 2);
    CHECK(captured[0].first == log::Level::Info);
    CHECK(captured[0].second == "cache opened with 3 entries");
    CHECK(captured[1].first == log::Level::Error);
    CHECK(captured[1].second == "[cache] disk full");
}
