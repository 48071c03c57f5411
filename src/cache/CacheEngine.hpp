// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cache/CacheIndex.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace chatvox
{

/// @brief Eviction brings the cache down to this fraction of the limit.
constexpr auto EvictionTargetRatio = 0.85;

struct CacheConfig
{
    /// @brief Directory holding the blobs and index.json. Created on open.
    std::filesystem::path directory;

    /// @brief Total blob size above which eviction starts.
    std::uint64_t limitBytes = 150ull * 1024 * 1024;

    /// @brief Quiet period after the first unsaved mutation before the index is written.
    std::chrono::milliseconds saveDebounce { 2000 };
};

struct CacheStats
{
    std::uint64_t totalBytes = 0;
    std::uint64_t limitBytes = 0;
    std::size_t itemCount = 0;
    std::size_t pinnedCount = 0;
};

/// @brief Count and size of a set of entries (unused entries, removed entries).
struct EntryTally
{
    std::size_t count = 0;
    std::uint64_t bytes = 0;
};

struct CompressStats
{
    std::size_t reencoded = 0;
    std::uint64_t bytesBefore = 0;
    std::uint64_t bytesAfter = 0;
};

/// @brief Content-addressed, size-bounded store for synthesized audio.
///
/// Every blob lives in its own file named after its cache key. The index is the
/// durable record of what the cache holds; it is written with debounced, coalesced
/// saves and always flushed on destruction. Eviction removes least recently used
/// entries and never touches a pinned entry.
///
/// All public members are thread-safe. Readers share the index, mutations
/// (including access-time refreshes and pins) are serialized.
class CacheEngine
{
  public:
    using SizeChangedCallback = std::function<void(const CacheStats&)>;

    /// @brief Opens (or creates) the cache at @p config.directory.
    ///
    /// Recovers from a missing or unreadable index by rebuilding it from the blob
    /// files, deletes stale files, and drops index entries whose blob is gone.
    /// Failing to create the directory or to write the index is fatal.
    [[nodiscard]] static auto open(CacheConfig config) -> Result<std::unique_ptr<CacheEngine>>;

    ~CacheEngine();

    CacheEngine(const CacheEngine&) = delete;
    CacheEngine& operator=(const CacheEngine&) = delete;

    /// @brief Reads the blob for @p key and refreshes its access time.
    ///
    /// A missing or unreadable blob is a miss; its index entry is dropped.
    [[nodiscard]] auto get(std::string_view key) -> std::optional<AudioBlob>;

    /// @brief Like get() but without reading the blob. Counts as a hit.
    [[nodiscard]] auto lookup(std::string_view key) -> std::optional<CacheEntry>;

    /// @brief Returns true if the index holds @p key. Does not touch the entry.
    [[nodiscard]] auto contains(std::string_view key) const -> bool;

    /// @brief Metadata for @p key without touching it.
    [[nodiscard]] auto entry(std::string_view key) const -> std::optional<CacheEntry>;

    /// @brief Stores @p blob under @p key, replacing an existing blob, then evicts if needed.
    ///
    /// The blob is written to a temporary file and renamed into place, so readers
    /// never observe a partial file. The freshly written entry is never evicted by
    /// the eviction pass this call triggers.
    [[nodiscard]] auto put(std::string_view key, std::span<const std::uint8_t> blob) -> Result<CacheEntry>;

    /// @brief Increments the pin count of @p key. Pinned entries are never evicted.
    ///
    /// A key may be pinned before it is stored.
    void pin(std::string_view key);

    /// @brief Decrements the pin count of @p key. Unpinning an unpinned key is a no-op.
    void unpin(std::string_view key);

    [[nodiscard]] auto pinCount(std::string_view key) const -> int;

    /// @brief Runs an eviction pass.
    ///
    /// Does nothing while the total size is within the limit. Otherwise removes
    /// unpinned entries, least recently used first, until the total is at most
    /// EvictionTargetRatio of the limit or no unpinned entry is left.
    /// @return The number of removed entries.
    auto evict() -> std::size_t;

    /// @brief Re-encodes unpinned high-resolution WAV blobs as 16-bit PCM. Keys never change.
    [[nodiscard]] auto compress() -> CompressStats;

    /// @brief Entries that were never hit and are not pinned.
    [[nodiscard]] auto unusedStats() const -> EntryTally;

    /// @brief Removes the entries reported by unusedStats().
    auto removeUnused() -> EntryTally;

    /// @brief Removes every blob and resets the index and all pins.
    auto clear() -> EntryTally;

    /// @brief Changes the size limit and re-runs eviction.
    void setLimit(std::uint64_t limitBytes);

    [[nodiscard]] auto stats() const -> CacheStats;

    /// @brief Writes a pending index save now.
    [[nodiscard]] auto flush() -> VoidResult;

    [[nodiscard]] auto directory() const -> const std::filesystem::path&;

    [[nodiscard]] auto blobPath(std::string_view key) const -> std::filesystem::path;

    /// @brief Installs the callback invoked after the total size or item count changed.
    ///
    /// Called on the mutating thread, outside of the cache lock.
    void onSizeChanged(SizeChangedCallback callback);

    struct Impl;

  private:
    explicit CacheEngine(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> _impl;
};

} // namespace chatvox
