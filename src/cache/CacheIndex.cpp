// SPDX-License-Identifier: Apache-2.0
#include "CacheIndex.hpp"

#include <core/Hash.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <chrono>
#include <format>

namespace chatvox
{

auto blobPathFor(const std::filesystem::path& directory, std::string_view key) -> std::filesystem::path
{
    return directory / std::format("{}{}", key, BlobExtension);
}

auto serializeIndex(const CacheIndex& index) -> nlohmann::json
{
    auto entries = nlohmann::json::object();
    for (auto const& [key, entry]: index)
    {
        entries[key] = {
            { "size", entry.sizeBytes },
            { "created", toUnixMillis(entry.createdTime) },
            { "lastAccess", toUnixMillis(entry.lastAccessTime) },
            { "hits", entry.hitCount },
        };
    }

    return {
        { "version", CacheIndexVersion },
        { "entries", std::move(entries) },
    };
}

auto parseIndex(std::string_view content, const std::filesystem::path& directory) -> Result<CacheIndex>
{
    auto parsed = json::parse(content, ErrorCode::IndexCorrupted);
    if (!parsed)
        return std::unexpected(parsed.error());

    auto const& root = *parsed;
    if (!root.is_object() || json::getIntOr(root, "version", 0) != CacheIndexVersion)
        return makeError(ErrorCode::IndexCorrupted, "Cache index has an unknown version");

    if (!root.contains("entries") || !root["entries"].is_object())
        return makeError(ErrorCode::IndexCorrupted, "Cache index has no entries object");

    auto index = CacheIndex {};
    for (auto const& [key, value]: root["entries"].items())
    {
        if (!isSha256Hex(key) || !value.is_object() || !value.contains("size")
            || !value["size"].is_number_unsigned())
            return makeError(ErrorCode::IndexCorrupted, std::format("Malformed cache index entry '{}'", key));

        auto entry = CacheEntry {
            .key = key,
            .path = blobPathFor(directory, key),
            .sizeBytes = value["size"].get<std::uint64_t>(),
            .createdTime = fromUnixMillis(json::getInt64Or(value, "created", 0)),
            .lastAccessTime = fromUnixMillis(json::getInt64Or(value, "lastAccess", 0)),
            .hitCount = static_cast<std::uint32_t>(json::getIntOr(value, "hits", 0)),
            .pinCount = 0,
        };
        index.emplace(key, std::move(entry));
    }
    return index;
}

auto rebuildIndex(const std::filesystem::path& directory) -> Result<CacheIndex>
{
    auto index = CacheIndex {};
    auto ec = std::error_code {};

    auto it = std::filesystem::directory_iterator(directory, ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Cannot scan cache directory '{}': {}", directory.string(), ec.message()));

    for (auto const& file: it)
    {
        if (!file.is_regular_file(ec) || file.path().extension() != BlobExtension)
            continue;

        auto const key = file.path().stem().string();
        if (!isSha256Hex(key))
            continue;

        auto const size = file.file_size(ec);
        if (ec)
        {
            log::warning("Cache rebuild: cannot stat {}: {}", file.path().string(), ec.message());
            continue;
        }

        // file_clock -> system_clock; both are anchored to the Unix epoch on the platforms we target.
        auto stamp = Clock::now();
        if (auto const written = file.last_write_time(ec); !ec)
            stamp = std::chrono::time_point_cast<Clock::duration>(std::chrono::clock_cast<Clock>(written));

        index.emplace(key,
                      CacheEntry {
                          .key = key,
                          .path = file.path(),
                          .sizeBytes = size,
                          .createdTime = stamp,
                          .lastAccessTime = stamp,
                          .hitCount = 0,
                          .pinCount = 0,
                      });
    }

    log::info("Cache index rebuilt from {} blob file(s) in {}", index.size(), directory.string());
    return index;
}

} // namespace chatvox
