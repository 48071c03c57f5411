// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace chatvox
{

/// @brief One cached audio artifact.
struct CacheEntry
{
    std::string key;
    std::filesystem::path path;
    std::uint64_t sizeBytes = 0;
    TimePoint createdTime;
    TimePoint lastAccessTime;
    std::uint32_t hitCount = 0;
    int pinCount = 0;
};

/// @brief Durable mapping of cache key to entry metadata.
using CacheIndex = std::map<std::string, CacheEntry, std::less<>>;

/// @brief Version written into index.json.
constexpr auto CacheIndexVersion = 1;

/// @brief File extension of stored blobs.
constexpr auto BlobExtension = std::string_view { ".wav" };

/// @brief Serializes the index as written to disk (pin counts are runtime-only and omitted).
[[nodiscard]] auto serializeIndex(const CacheIndex& index) -> nlohmann::json;

/// @brief Parses index.json content. Entry paths are resolved against @p directory.
///
/// Anything structurally wrong (not JSON, wrong version, malformed entry, invalid
/// key) fails as ErrorCode::IndexCorrupted so the caller can rebuild.
[[nodiscard]] auto parseIndex(std::string_view content, const std::filesystem::path& directory)
    -> Result<CacheIndex>;

/// @brief Reconstructs an index from the blob files found in @p directory.
///
/// Sizes come from the files, timestamps from their modification time. Files in
/// the directory that are not valid blobs are not adopted.
[[nodiscard]] auto rebuildIndex(const std::filesystem::path& directory) -> Result<CacheIndex>;

/// @brief Path of the blob for @p key inside @p directory.
[[nodiscard]] auto blobPathFor(const std::filesystem::path& directory, std::string_view key)
    -> std::filesystem::path;

} // namespace chatvox
