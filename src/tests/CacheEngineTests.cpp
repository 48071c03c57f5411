// SPDX-License-Identifier: Apache-2.0
#include <audio/WavCodec.hpp>
#include <cache/CacheEngine.hpp>

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <thread>

#include "TestSupport.hpp"

using namespace chatvox;
using namespace chatvox::test;

namespace
{

auto openCache(const std::filesystem::path& dir, std::uint64_t limitBytes = 1024 * 1024)
    -> std::unique_ptr<CacheEngine>
{
    auto cache = CacheEngine::open(CacheConfig {
        .directory = dir,
        .limitBytes = limitBytes,
        .saveDebounce = std::chrono::milliseconds(0),
    });
    REQUIRE(cache.has_value());
    return std::move(*cache);
}

void writeFile(const std::filesystem::path& path, std::string_view content)
{
    auto file = std::ofstream(path, std::ios::binary);
    file << content;
}

auto readText(const std::filesystem::path& path) -> std::string
{
    auto file = std::ifstream(path);
    auto ss = std::stringstream {};
    ss << file.rdbuf();
    return ss.str();
}

} // namespace

TEST_CASE("CacheEngine stores and returns blobs", "[cache]")
{
    auto const dir = TempDir("roundtrip");
    auto cache = openCache(dir.path());

    auto const key = keyFor("hello");
    auto const stored = cache->put(key, bytes("RIFF-audio"));
    REQUIRE(stored.has_value());
    CHECK(stored->sizeBytes == 10);
    CHECK(std::filesystem::exists(cache->blobPath(key)));

    auto const blob = cache->get(key);
    REQUIRE(blob.has_value());
    CHECK(*blob == bytes("RIFF-audio"));
    CHECK(cache->entry(key)->hitCount == 1);

    CHECK(!cache->get(keyFor("missing")).has_value());

    auto const stats = cache->stats();
    CHECK(stats.itemCount == 1);
    CHECK(stats.totalBytes == 10);
}

TEST_CASE("CacheEngine replaces an existing blob", "[cache]")
{
    auto const dir = TempDir("replace");
    auto cache = openCache(dir.path());

    auto const key = keyFor("a");
    REQUIRE(cache->put(key, bytes("1234")).has_value());
    REQUIRE(cache->put(key, bytes("12")).has_value());

    CHECK(cache->stats().itemCount == 1);
    CHECK(cache->stats().totalBytes == 2);
    CHECK(cache->get(key) == bytes("12"));
}

TEST_CASE("CacheEngine rejects invalid input", "[cache]")
{
    auto const dir = TempDir("invalid");
    auto cache = openCache(dir.path());

    auto const badKey = cache->put("../escape", bytes("x"));
    REQUIRE(!badKey.has_value());
    CHECK(badKey.error().code == ErrorCode::InvalidArgument);

    auto const empty = cache->put(keyFor("a"), AudioBlob {});
    REQUIRE(!empty.has_value());
    CHECK(empty.error().code == ErrorCode::InvalidArgument);
    CHECK(cache->stats().itemCount == 0);
}

TEST_CASE("CacheEngine evicts least recently used entries down to the target", "[cache]")
{
    auto const dir = TempDir("evict");
    auto cache = openCache(dir.path(), 10);

    auto keys = std::vector<std::string> {};
    for (auto i = 1; i <= 6; ++i)
    {
        keys.push_back(keyFor(std::format("entry-{}", i)));
        REQUIRE(cache->put(keys.back(), bytes("ab")).has_value());
    }

    CHECK(!cache->contains(keys[0]));
    CHECK(!cache->contains(keys[1]));
    for (auto i = 2; i < 6; ++i)
        CHECK(cache->contains(keys[static_cast<std::size_t>(i)]));
    CHECK(cache->stats().totalBytes == 8);
    CHECK(!std::filesystem::exists(cache->blobPath(keys[0])));

    SECTION("eviction is idempotent")
    {
        CHECK(cache->evict() == 0);
        CHECK(cache->stats().totalBytes == 8);
    }
}

TEST_CASE("CacheEngine eviction honors access order", "[cache]")
{
    auto const dir = TempDir("lru");
    auto cache = openCache(dir.path(), 10);

    auto const a = keyFor("a");
    auto const b = keyFor("b");
    auto const c = keyFor("c");
    REQUIRE(cache->put(a, bytes("1234")).has_value());
    REQUIRE(cache->put(b, bytes("1234")).has_value());
    REQUIRE(cache->get(a).has_value());
    REQUIRE(cache->put(c, bytes("1234")).has_value());

    CHECK(cache->contains(a));
    CHECK(!cache->contains(b));
    CHECK(cache->contains(c));
}

TEST_CASE("CacheEngine never evicts pinned entries", "[cache]")
{
    auto const dir = TempDir("pinned");
    auto cache = openCache(dir.path(), 10);

    auto const first = keyFor("first");
    REQUIRE(cache->put(first, bytes("1234")).has_value());
    cache->pin(first);
    CHECK(cache->pinCount(first) == 1);

    REQUIRE(cache->put(keyFor("second"), bytes("1234")).has_value());
    REQUIRE(cache->put(keyFor("third"), bytes("1234")).has_value());

    CHECK(cache->contains(first));
    CHECK(!cache->contains(keyFor("second")));
    CHECK(cache->stats().pinnedCount == 1);

    SECTION("unpinned entries become evictable")
    {
        cache->unpin(first);
        REQUIRE(cache->put(keyFor("fourth"), bytes("1234")).has_value());
        CHECK(!cache->contains(first));
    }
}

TEST_CASE("CacheEngine stays above the limit when everything is pinned", "[cache]")
{
    auto const dir = TempDir("allpinned");
    auto cache = openCache(dir.path(), 10);

    auto const a = keyFor("a");
    auto const b = keyFor("b");
    cache->pin(a);
    cache->pin(b);
    REQUIRE(cache->put(a, bytes("123456")).has_value());
    REQUIRE(cache->put(b, bytes("123456")).has_value());

    CHECK(cache->evict() == 0);
    CHECK(cache->contains(a));
    CHECK(cache->contains(b));
    CHECK(cache->stats().totalBytes == 12);
}

TEST_CASE("CacheEngine unpin of an unknown key is a no-op", "[cache]")
{
    auto const dir = TempDir("unpin");
    auto cache = openCache(dir.path());

    cache->unpin(keyFor("nothing"));
    CHECK(cache->pinCount(keyFor("nothing")) == 0);

    auto const key = keyFor("once");
    cache->pin(key);
    cache->unpin(key);
    cache->unpin(key);
    CHECK(cache->pinCount(key) == 0);
}

TEST_CASE("CacheEngine persists its index across reopen", "[cache]")
{
    auto const dir = TempDir("persist");
    auto const key = keyFor("persisted");
    {
        auto cache = openCache(dir.path());
        REQUIRE(cache->put(key, bytes("audio")).has_value());
        REQUIRE(cache->get(key).has_value());
    }

    auto cache = openCache(dir.path());
    REQUIRE(cache->contains(key));
    CHECK(cache->entry(key)->hitCount == 1);
    CHECK(cache->entry(key)->sizeBytes == 5);
    CHECK(cache->get(key) == bytes("audio"));
}

TEST_CASE("CacheEngine keeps concurrent writes when flushing races the saver", "[cache]")
{
    auto const dir = TempDir("flush-race");
    auto keys = std::vector<std::string> {};
    for (auto i = 0; i < 64; ++i)
        keys.push_back(keyFor(std::format("entry-{}", i)));

    {
        auto cache = openCache(dir.path());
        auto done = std::atomic<bool> { false };
        auto flushFailed = std::atomic<bool> { false };
        auto flusher = std::jthread([&] {
            while (!done)
                if (!cache->flush())
                    flushFailed = true;
        });

        for (auto const& key: keys)
            REQUIRE(cache->put(key, bytes("audio")).has_value());
        done = true;
        flusher.join();
        CHECK(!flushFailed);
    }

    auto const index = nlohmann::json::parse(readText(dir.path() / "index.json"));
    for (auto const& key: keys)
        CHECK(index["entries"].contains(key));
}

TEST_CASE("CacheEngine writes the index in its documented format", "[cache]")
{
    auto const dir = TempDir("format");
    auto cache = openCache(dir.path());
    auto const key = keyFor("formatted");
    REQUIRE(cache->put(key, bytes("abc")).has_value());
    REQUIRE(cache->flush().has_value());

    auto const index = nlohmann::json::parse(readText(dir.path() / "index.json"));
    CHECK(index["version"] == CacheIndexVersion);
    REQUIRE(index["entries"].contains(key));
    auto const& entry = index["entries"][key];
    CHECK(entry["size"] == 3);
    CHECK(entry["hits"] == 0);
    CHECK(entry["created"].is_number_integer());
    CHECK(entry["lastAccess"].is_number_integer());
}

TEST_CASE("CacheEngine rebuilds a corrupt index from the blobs", "[cache]")
{
    auto const dir = TempDir("corrupt");
    auto const key = keyFor("survivor");
    {
        auto cache = openCache(dir.path());
        REQUIRE(cache->put(key, bytes("audio")).has_value());
    }

    writeFile(dir.path() / "index.json", "{ this is not json");
    writeFile(dir.path() / "junk.txt", "junk");
    writeFile(dir.path() / "not-a-key.wav", "junk");

    auto cache = openCache(dir.path());
    CHECK(cache->contains(key));
    CHECK(cache->stats().itemCount == 1);
    CHECK(cache->stats().totalBytes == 5);
    CHECK(!std::filesystem::exists(dir.path() / "junk.txt"));
    CHECK(!std::filesystem::exists(dir.path() / "not-a-key.wav"));

    auto const index = nlohmann::json::parse(readText(dir.path() / "index.json"));
    CHECK(index["entries"].contains(key));
}

TEST_CASE("CacheEngine deletes blobs missing from the index", "[cache]")
{
    auto const dir = TempDir("orphans");
    auto const kept = keyFor("kept");
    {
        auto cache = openCache(dir.path());
        REQUIRE(cache->put(kept, bytes("audio")).has_value());
    }

    auto const orphan = blobPathFor(dir.path(), keyFor("orphan"));
    writeFile(orphan, "orphaned");

    auto cache = openCache(dir.path());
    CHECK(cache->contains(kept));
    CHECK(!cache->contains(keyFor("orphan")));
    CHECK(!std::filesystem::exists(orphan));
}

TEST_CASE("CacheEngine drops index entries whose blob is gone", "[cache]")
{
    auto const dir = TempDir("drift");
    auto const key = keyFor("vanishing");
    auto cache = openCache(dir.path());
    REQUIRE(cache->put(key, bytes("audio")).has_value());

    std::filesystem::remove(cache->blobPath(key));

    SECTION("on read")
    {
        CHECK(!cache->get(key).has_value());
        CHECK(!cache->contains(key));
        CHECK(cache->stats().totalBytes == 0);
    }

    SECTION("on reopen")
    {
        cache.reset();
        auto reopened = openCache(dir.path());
        CHECK(!reopened->contains(key));
        CHECK(reopened->stats().itemCount == 0);
    }
}

TEST_CASE("CacheEngine compress re-encodes float audio", "[cache]")
{
    auto const dir = TempDir("compress");
    auto cache = openCache(dir.path());

    auto const samples = std::vector<float>(1000, 0.25f);
    auto const floatWav = wav::encodeFloat32(samples, 22050, 1);
    auto const pcmWav = wav::encodePcm16(std::vector<std::int16_t>(1000, 42), 22050, 1);

    auto const a = keyFor("float");
    auto const b = keyFor("pcm");
    auto const pinned = keyFor("pinned-float");
    REQUIRE(cache->put(a, floatWav).has_value());
    REQUIRE(cache->put(b, pcmWav).has_value());
    REQUIRE(cache->put(pinned, floatWav).has_value());
    cache->pin(pinned);

    auto const stats = cache->compress();
    CHECK(stats.reencoded == 1);
    CHECK(stats.bytesBefore == floatWav.size());
    CHECK(stats.bytesAfter < stats.bytesBefore);

    auto const reencoded = cache->get(a);
    REQUIRE(reencoded.has_value());
    auto const info = wav::parse(*reencoded);
    REQUIRE(info.has_value());
    CHECK(info->bitsPerSample == 16);
    CHECK(cache->entry(a)->sizeBytes == reencoded->size());

    CHECK(cache->entry(b)->sizeBytes == pcmWav.size());
    CHECK(cache->entry(pinned)->sizeBytes == floatWav.size());
    CHECK(cache->stats().totalBytes == reencoded->size() + pcmWav.size() + floatWav.size());
}

TEST_CASE("CacheEngine removes unused entries", "[cache]")
{
    auto const dir = TempDir("unused");
    auto cache = openCache(dir.path());

    auto const used = keyFor("used");
    auto const unused = keyFor("unused");
    auto const pinned = keyFor("pinned");
    REQUIRE(cache->put(used, bytes("aaaa")).has_value());
    REQUIRE(cache->put(unused, bytes("bb")).has_value());
    REQUIRE(cache->put(pinned, bytes("c")).has_value());
    REQUIRE(cache->lookup(used).has_value());
    cache->pin(pinned);

    auto const tally = cache->unusedStats();
    CHECK(tally.count == 1);
    CHECK(tally.bytes == 2);

    auto const removed = cache->removeUnused();
    CHECK(removed.count == 1);
    CHECK(!cache->contains(unused));
    CHECK(cache->contains(used));
    CHECK(cache->contains(pinned));
}

TEST_CASE("CacheEngine clear removes everything", "[cache]")
{
    auto const dir = TempDir("clear");
    auto cache = openCache(dir.path());

    REQUIRE(cache->put(keyFor("a"), bytes("aaa")).has_value());
    REQUIRE(cache->put(keyFor("b"), bytes("bb")).has_value());

    auto const tally = cache->clear();
    CHECK(tally.count == 2);
    CHECK(tally.bytes == 5);
    CHECK(cache->stats().itemCount == 0);
    CHECK(cache->stats().totalBytes == 0);
    CHECK(!std::filesystem::exists(cache->blobPath(keyFor("a"))));
}

TEST_CASE("CacheEngine reports size changes", "[cache]")
{
    auto const dir = TempDir("callback");
    auto cache = openCache(dir.path(), 10);

    auto reported = std::vector<CacheStats> {};
    cache->onSizeChanged([&](const CacheStats& stats) { reported.push_back(stats); });

    REQUIRE(cache->put(keyFor("a"), bytes("123")).has_value());
    REQUIRE(!reported.empty());
    CHECK(reported.back().totalBytes == 3);
    CHECK(reported.back().itemCount == 1);
    CHECK(reported.back().limitBytes == 10);

    cache->setLimit(2);
    CHECK(reported.back().totalBytes == 0);
    CHECK(reported.back().limitBytes == 2);
}

TEST_CASE("CacheEngine open fails when the directory cannot be created", "[cache]")
{
    auto const dir = TempDir("blocked");
    writeFile(dir.path() / "file", "not a directory");

    auto const cache = CacheEngine::open(CacheConfig { .directory = dir.path() / "file" / "cache" });
    REQUIRE(!cache.has_value());
    CHECK(cache.error().code == ErrorCode::CacheError);
}
