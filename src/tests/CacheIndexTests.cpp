// SPDX-License-Identifier: Apache-2.0
#include <cache/CacheIndex.hpp>
#include <core/Hash.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <format>
#include <fstream>

#include "TestSupport.hpp"

using namespace chatvox;

namespace
{

auto const TestKey = sha256Hex("index-test").value();

} // namespace

TEST_CASE("sha256Hex produces lowercase hex digests", "[cache]")
{
    auto const digest = sha256Hex("abc");
    REQUIRE(digest.has_value());
    CHECK(*digest == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    CHECK(isSha256Hex(*digest));
    CHECK(!isSha256Hex("ABC"));
    CHECK(!isSha256Hex(std::string(64, 'G')));
}

TEST_CASE("parseIndex reads entries written by serializeIndex", "[cache]")
{
    auto index = CacheIndex {};
    index[TestKey] = CacheEntry {
        .key = TestKey,
        .path = blobPathFor("/cache", TestKey),
        .sizeBytes = 1234,
        .createdTime = fromUnixMillis(1'700'000'000'000),
        .lastAccessTime = fromUnixMillis(1'700'000'500'000),
        .hitCount = 3,
        .pinCount = 2,
    };

    auto const parsed = parseIndex(serializeIndex(index).dump(), "/elsewhere");
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->contains(TestKey));

    auto const& entry = parsed->at(TestKey);
    CHECK(entry.sizeBytes == 1234);
    CHECK(entry.hitCount == 3);
    CHECK(entry.pinCount == 0);
    CHECK(toUnixMillis(entry.createdTime) == 1'700'000'000'000);
    CHECK(toUnixMillis(entry.lastAccessTime) == 1'700'000'500'000);
    CHECK(entry.path == blobPathFor("/elsewhere", TestKey));
}

TEST_CASE("parseIndex reports corruption", "[cache]")
{
    auto const corrupted = [](std::string_view content) {
        auto const result = parseIndex(content, "/cache");
        return !result && result.error().code == ErrorCode::IndexCorrupted;
    };

    CHECK(corrupted("not json"));
    CHECK(corrupted("[]"));
    CHECK(corrupted(R"({"version": 99, "entries": {}})"));
    CHECK(corrupted(R"({"version": 1})"));
    CHECK(corrupted(R"({"version": 1, "entries": {"../../etc/passwd": {"size": 1}}})"));
    CHECK(corrupted(std::format(R"({{"version": 1, "entries": {{"{}": {{"size": -1}}}}}})", TestKey)));
    CHECK(corrupted(std::format(R"({{"version": 1, "entries": {{"{}": {{}}}}}})", TestKey)));

    CHECK(parseIndex(R"({"version": 1, "entries": {}})", "/cache").has_value());
}

TEST_CASE("blobPathFor names blobs after their key", "[cache]")
{
    CHECK(blobPathFor("/cache", TestKey) == std::filesystem::path("/cache") / (TestKey + ".wav"));
}

TEST_CASE("rebuildIndex stamps entries with the blob modification time", "[cache]")
{
    auto const dir = chatvox::test::TempDir("rebuild-stamp");
    {
        auto file = std::ofstream(blobPathFor(dir.path(), TestKey), std::ios::binary);
        file << "audio";
    }

    auto const before = Clock::now() - std::chrono::hours(1);
    auto const index = rebuildIndex(dir.path());
    REQUIRE(index.has_value());
    REQUIRE(index->contains(TestKey));

    auto const& entry = index->at(TestKey);
    CHECK(entry.sizeBytes == 5);
    CHECK(entry.createdTime > before);
    CHECK(entry.createdTime <= Clock::now() + std::chrono::minutes(1));
    CHECK(entry.lastAccessTime == entry.createdTime);
}
