// SPDX-License-Identifier: Apache-2.0
#include "CacheEngine.hpp"

#include <audio/WavCodec.hpp>
#include <core/Hash.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <format>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <vector>

namespace chatvox
{

namespace
{

    constexpr auto IndexFileName = std::string_view { "index.json" };
    constexpr auto TempExtension = std::string_view { ".tmp" };

    auto readFile(const std::filesystem::path& path) -> Result<AudioBlob>
    {
        auto file = std::ifstream(path, std::ios::binary);
        if (!file)
            return makeError(ErrorCode::IoError, std::format("Cannot open {}", path.string()));

        auto blob = AudioBlob(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
        if (file.bad())
            return makeError(ErrorCode::IoError, std::format("Cannot read {}", path.string()));
        return blob;
    }

    /// @brief Writes @p bytes next to @p path and renames the result over it.
    auto writeFileAtomically(const std::filesystem::path& path, std::span<const std::uint8_t> bytes)
        -> VoidResult
    {
        auto tempPath = path;
        tempPath += TempExtension;

        {
            auto file = std::ofstream(tempPath, std::ios::binary | std::ios::trunc);
            if (!file)
                return makeError(ErrorCode::IoError, std::format("Cannot create {}", tempPath.string()));
            file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
            file.flush();
            if (!file)
                return makeError(ErrorCode::IoError, std::format("Cannot write {}", tempPath.string()));
        }

        auto ec = std::error_code {};
        std::filesystem::rename(tempPath, path, ec);
        if (ec)
        {
            std::filesystem::remove(tempPath, ec);
            return makeError(ErrorCode::IoError, std::format("Cannot move {} into place", path.string()));
        }
        return {};
    }

    auto asBytes(std::string_view text) -> std::span<const std::uint8_t>
    {
        return { reinterpret_cast<const std::uint8_t*>(text.data()), text.size() };
    }

} // namespace

struct CacheEngine::Impl
{
    CacheConfig config;
    std::filesystem::path indexPath;

    mutable std::shared_mutex mutex;
    CacheIndex index;
    std::map<std::string, int, std::less<>> pins;
    std::map<std::string, std::uint64_t, std::less<>> touchOrder; ///< LRU order; larger is more recent.
    std::uint64_t nextTouch = 1;
    std::uint64_t totalBytes = 0;
    std::atomic<bool> dirty = false;

    std::mutex callbackMutex;
    SizeChangedCallback sizeChanged;

    std::mutex writeMutex; ///< Serializes index snapshots and file writes; taken before `mutex`.

    std::mutex saveMutex;
    std::condition_variable_any saveCv;
    std::optional<std::chrono::steady_clock::time_point> saveDue;
    std::jthread saver;

    // {{{ helpers expecting `mutex` to be held

    void touch(const std::string& key) { touchOrder[key] = nextTouch++; }

    [[nodiscard]] auto pinsOf(std::string_view key) const -> int
    {
        auto const it = pins.find(key);
        return it != pins.end() ? it->second : 0;
    }

    [[nodiscard]] auto withPins(CacheEntry entry) const -> CacheEntry
    {
        entry.pinCount = pinsOf(entry.key);
        return entry;
    }

    [[nodiscard]] auto currentStats() const -> CacheStats
    {
        auto const pinned = std::ranges::count_if(index, [this](auto const& item) { return pinsOf(item.first) > 0; });
        return CacheStats {
            .totalBytes = totalBytes,
            .limitBytes = config.limitBytes,
            .itemCount = index.size(),
            .pinnedCount = static_cast<std::size_t>(pinned),
        };
    }

    /// @brief Drops @p key from the index and deletes its blob file.
    void remove(CacheIndex::iterator it)
    {
        auto ec = std::error_code {};
        std::filesystem::remove(it->second.path, ec);
        if (ec)
            log::warning("Cache: cannot delete blob {}: {}", it->first, ec.message());

        totalBytes -= std::min(totalBytes, it->second.sizeBytes);
        touchOrder.erase(it->first);
        index.erase(it);
        dirty = true;
    }

    /// @brief Index says the blob exists, the filesystem disagrees: forget the entry.
    void selfHeal(CacheIndex::iterator it, std::string_view reason)
    {
        log::warning("Cache: dropping entry {} ({})", it->first, reason);
        totalBytes -= std::min(totalBytes, it->second.sizeBytes);
        touchOrder.erase(it->first);
        index.erase(it);
        dirty = true;
    }

    auto evictLocked(std::string_view protectedKey) -> std::size_t
    {
        if (totalBytes <= config.limitBytes)
            return 0;

        auto const target = static_cast<double>(config.limitBytes) * EvictionTargetRatio;

        auto candidates = std::vector<std::pair<std::uint64_t, std::string>> {};
        for (auto const& [key, entry]: index)
        {
            if (key == protectedKey || pinsOf(key) > 0)
                continue;
            candidates.emplace_back(touchOrder[key], key);
        }
        std::ranges::sort(candidates);

        auto removed = std::size_t { 0 };
        auto const before = totalBytes;
        for (auto const& [order, key]: candidates)
        {
            if (static_cast<double>(totalBytes) <= target)
                break;
            if (auto const it = index.find(key); it != index.end())
            {
                log::debug("Cache: evicting {} ({} bytes)", key, it->second.sizeBytes);
                remove(it);
                ++removed;
            }
        }

        if (static_cast<double>(totalBytes) > target)
            log::warning("Cache: {} bytes still above eviction target of {:.0f} bytes, remaining entries are pinned",
                         totalBytes,
                         target);
        if (removed)
            log::info("Cache: evicted {} entries, {} -> {} bytes", removed, before, totalBytes);
        return removed;
    }

    // }}}

    void notifySizeChanged(const CacheStats& stats)
    {
        auto callback = SizeChangedCallback {};
        {
            auto lock = std::lock_guard(callbackMutex);
            callback = sizeChanged;
        }
        if (callback)
            callback(stats);
    }

    void scheduleSave()
    {
        {
            auto lock = std::lock_guard(saveMutex);
            if (saveDue)
                return;
            saveDue = std::chrono::steady_clock::now() + config.saveDebounce;
        }
        saveCv.notify_one();
    }

    /// @brief Writes the index. Serializing under `writeMutex` keeps an older snapshot from
    /// landing on disk after a newer one.
    auto saveIndex() -> VoidResult
    {
        auto writeLock = std::lock_guard(writeMutex);
        auto content = std::string {};
        {
            auto lock = std::shared_lock(mutex);
            content = serializeIndex(index).dump(2);
            dirty = false;
        }

        auto result = writeFileAtomically(indexPath, asBytes(content));
        if (!result)
        {
            dirty = true;
            return makeError(ErrorCode::CacheError, std::format("Saving cache index: {}", result.error().message));
        }
        log::trace("Cache index saved ({} bytes)", content.size());
        return {};
    }

    /// @brief Debounced saver: the first mutation arms a deadline, later ones ride along.
    void runSaver(const std::stop_token& stopToken)
    {
        auto lock = std::unique_lock(saveMutex);
        while (!stopToken.stop_requested())
        {
            saveCv.wait(lock, stopToken, [this] { return saveDue.has_value(); });
            if (stopToken.stop_requested())
                return;

            auto const due = *saveDue;
            if (saveCv.wait_until(lock, stopToken, due, [this] { return !saveDue.has_value(); }))
                continue; // flushed by someone else
            if (stopToken.stop_requested())
                return;

            saveDue.reset();
            lock.unlock();
            if (auto result = saveIndex(); !result)
                log::error("{}", result.error());
            lock.lock();
        }
    }

    void markMutated()
    {
        if (dirty)
            scheduleSave();
    }
};

CacheEngine::CacheEngine(std::unique_ptr<Impl> impl): _impl(std::move(impl))
{
}

CacheEngine::~CacheEngine()
{
    if (_impl->saver.joinable())
    {
        _impl->saver.request_stop();
        _impl->saver.join();
    }

    if (_impl->dirty)
        if (auto result = _impl->saveIndex(); !result)
            log::error("Cache: final index save failed: {}", result.error());
}

auto CacheEngine::open(CacheConfig config) -> Result<std::unique_ptr<CacheEngine>>
{
    auto ec = std::error_code {};
    std::filesystem::create_directories(config.directory, ec);
    if (ec)
        return makeError(ErrorCode::CacheError,
                         std::format("Cannot create cache directory '{}': {}", config.directory.string(), ec.message()));

    auto impl = std::make_unique<Impl>();
    impl->config = std::move(config);
    auto const& dir = impl->config.directory;
    impl->indexPath = dir / IndexFileName;

    // Load the index; anything unreadable is rebuilt from the blobs on disk.
    auto loaded = Result<CacheIndex> {};
    if (std::filesystem::exists(impl->indexPath, ec))
    {
        auto content = readFile(impl->indexPath);
        if (content)
            loaded = parseIndex(
                std::string_view(reinterpret_cast<const char*>(content->data()), content->size()), dir);
        else
            loaded = std::unexpected(content.error());
        if (!loaded)
            log::warning("Cache index unreadable, rebuilding: {}", loaded.error());
    }
    else
    {
        loaded = makeError(ErrorCode::IndexCorrupted, "no index file");
    }

    if (!loaded)
    {
        loaded = rebuildIndex(dir);
        if (!loaded)
            return std::unexpected(loaded.error());
        impl->dirty = true;
    }
    impl->index = std::move(*loaded);

    // Delete everything in the directory that is not an indexed blob.
    auto stale = std::vector<std::filesystem::path> {};
    for (auto const& file: std::filesystem::directory_iterator(dir, ec))
    {
        auto const& path = file.path();
        auto typeError = std::error_code {};
        if (path.filename() == IndexFileName || !file.is_regular_file(typeError))
            continue;

        if (path.extension() == BlobExtension && impl->index.contains(path.stem().string()))
            continue;
        stale.push_back(path);
    }
    if (ec)
        return makeError(ErrorCode::CacheError,
                         std::format("Cannot scan cache directory '{}': {}", dir.string(), ec.message()));

    for (auto const& path: stale)
    {
        log::info("Cache: deleting stale file {}", path.filename().string());
        std::filesystem::remove(path, ec);
        if (ec)
            log::warning("Cache: cannot delete {}: {}", path.string(), ec.message());
    }

    // Drop entries whose blob vanished; trust the file system for sizes.
    for (auto it = impl->index.begin(); it != impl->index.end();)
    {
        auto const size = std::filesystem::file_size(it->second.path, ec);
        auto const missing = static_cast<bool>(ec);
        if (missing)
        {
            log::warning("Cache: blob for {} is missing, dropping entry", it->first);
            it = impl->index.erase(it);
            impl->dirty = true;
            continue;
        }
        if (size != it->second.sizeBytes)
        {
            it->second.sizeBytes = size;
            impl->dirty = true;
        }
        impl->totalBytes += size;
        ++it;
    }

    // Seed the LRU order from the persisted access times.
    auto byAccess = std::vector<const CacheEntry*> {};
    for (auto const& [key, entry]: impl->index)
        byAccess.push_back(&entry);
    std::ranges::sort(byAccess, {}, [](const CacheEntry* e) { return e->lastAccessTime; });
    for (auto const* entry: byAccess)
        impl->touch(entry->key);

    // The index file must be writable before the pipeline may start.
    if (auto result = impl->saveIndex(); !result)
        return std::unexpected(result.error());

    auto engine = std::unique_ptr<CacheEngine>(new CacheEngine(std::move(impl)));
    auto* self = engine->_impl.get();
    self->saver = std::jthread([self](const std::stop_token& token) { self->runSaver(token); });

    log::info("Cache opened at {} ({} entries, {} bytes, limit {} bytes)",
              dir.string(),
              self->index.size(),
              self->totalBytes,
              self->config.limitBytes);

    engine->evict();
    return engine;
}

auto CacheEngine::get(std::string_view key) -> std::optional<AudioBlob>
{
    auto blob = std::optional<AudioBlob> {};
    auto stats = std::optional<CacheStats> {};
    {
        auto lock = std::unique_lock(_impl->mutex);
        auto const it = _impl->index.find(key);
        if (it == _impl->index.end())
            return std::nullopt;

        if (auto content = readFile(it->second.path); content)
        {
            it->second.lastAccessTime = Clock::now();
            ++it->second.hitCount;
            _impl->touch(it->first);
            _impl->dirty = true;
            blob = std::move(*content);
        }
        else
        {
            _impl->selfHeal(it, content.error().message);
            stats = _impl->currentStats();
        }
    }

    _impl->markMutated();
    if (stats)
        _impl->notifySizeChanged(*stats);
    return blob;
}

auto CacheEngine::lookup(std::string_view key) -> std::optional<CacheEntry>
{
    auto result = std::optional<CacheEntry> {};
    auto stats = std::optional<CacheStats> {};
    {
        auto lock = std::unique_lock(_impl->mutex);
        auto const it = _impl->index.find(key);
        if (it == _impl->index.end())
            return std::nullopt;

        auto ec = std::error_code {};
        if (std::filesystem::is_regular_file(it->second.path, ec))
        {
            it->second.lastAccessTime = Clock::now();
            ++it->second.hitCount;
            _impl->touch(it->first);
            _impl->dirty = true;
            result = _impl->withPins(it->second);
        }
        else
        {
            _impl->selfHeal(it, "blob file missing");
            stats = _impl->currentStats();
        }
    }

    _impl->markMutated();
    if (stats)
        _impl->notifySizeChanged(*stats);
    return result;
}

auto CacheEngine::contains(std::string_view key) const -> bool
{
    auto lock = std::shared_lock(_impl->mutex);
    return _impl->index.contains(key);
}

auto CacheEngine::entry(std::string_view key) const -> std::optional<CacheEntry>
{
    auto lock = std::shared_lock(_impl->mutex);
    if (auto const it = _impl->index.find(key); it != _impl->index.end())
        return _impl->withPins(it->second);
    return std::nullopt;
}

auto CacheEngine::put(std::string_view key, std::span<const std::uint8_t> blob) -> Result<CacheEntry>
{
    if (!isSha256Hex(key))
        return makeError(ErrorCode::InvalidArgument, std::format("Not a cache key: '{}'", key));
    if (blob.empty())
        return makeError(ErrorCode::InvalidArgument, std::format("Refusing to cache empty blob for {}", key));

    auto stored = CacheEntry {};
    auto stats = CacheStats {};
    {
        auto lock = std::unique_lock(_impl->mutex);
        auto const path = blobPathFor(_impl->config.directory, key);
        if (auto written = writeFileAtomically(path, blob); !written)
            return makeError(ErrorCode::CacheError, std::format("Storing {}: {}", key, written.error().message));

        auto const now = Clock::now();
        auto [it, inserted] = _impl->index.try_emplace(std::string(key));
        auto& entry = it->second;
        if (inserted)
        {
            entry.key = std::string(key);
            entry.path = path;
            entry.createdTime = now;
        }
        else
        {
            _impl->totalBytes -= std::min(_impl->totalBytes, entry.sizeBytes);
        }
        entry.sizeBytes = blob.size();
        entry.lastAccessTime = now;
        _impl->totalBytes += entry.sizeBytes;
        _impl->touch(it->first);
        _impl->dirty = true;

        stored = _impl->withPins(entry);
        _impl->evictLocked(key);
        stats = _impl->currentStats();
    }

    log::debug("Cache: stored {} ({} bytes)", key, blob.size());
    _impl->markMutated();
    _impl->notifySizeChanged(stats);
    return stored;
}

void CacheEngine::pin(std::string_view key)
{
    auto lock = std::unique_lock(_impl->mutex);
    auto const it = _impl->pins.find(key);
    if (it != _impl->pins.end())
        ++it->second;
    else
        _impl->pins.emplace(std::string(key), 1);
}

void CacheEngine::unpin(std::string_view key)
{
    auto lock = std::unique_lock(_impl->mutex);
    auto const it = _impl->pins.find(key);
    if (it == _impl->pins.end())
        return;
    if (--it->second <= 0)
        _impl->pins.erase(it);
}

auto CacheEngine::pinCount(std::string_view key) const -> int
{
    auto lock = std::shared_lock(_impl->mutex);
    return _impl->pinsOf(key);
}

auto CacheEngine::evict() -> std::size_t
{
    auto removed = std::size_t { 0 };
    auto stats = CacheStats {};
    {
        auto lock = std::unique_lock(_impl->mutex);
        removed = _impl->evictLocked({});
        stats = _impl->currentStats();
    }

    if (removed)
    {
        _impl->markMutated();
        _impl->notifySizeChanged(stats);
    }
    return removed;
}

auto CacheEngine::compress() -> CompressStats
{
    auto keys = std::vector<std::string> {};
    {
        auto lock = std::shared_lock(_impl->mutex);
        for (auto const& [key, entry]: _impl->index)
            keys.push_back(key);
    }

    auto result = CompressStats {};
    for (auto const& key: keys)
    {
        auto lock = std::unique_lock(_impl->mutex);
        auto const it = _impl->index.find(key);
        if (it == _impl->index.end() || _impl->pinsOf(key) > 0)
            continue;

        auto blob = readFile(it->second.path);
        if (!blob)
        {
            log::warning("Cache compress: {}: {}", key, blob.error());
            continue;
        }

        auto reencoded = wav::reencodeToPcm16(*blob);
        if (!reencoded)
        {
            log::debug("Cache compress: leaving {} as is: {}", key, reencoded.error().message);
            continue;
        }
        if (!reencoded->has_value())
            continue;

        if (auto written = writeFileAtomically(it->second.path, **reencoded); !written)
        {
            log::warning("Cache compress: {}: {}", key, written.error());
            continue;
        }

        result.bytesBefore += it->second.sizeBytes;
        result.bytesAfter += (*reencoded)->size();
        ++result.reencoded;

        _impl->totalBytes -= std::min(_impl->totalBytes, it->second.sizeBytes);
        it->second.sizeBytes = (*reencoded)->size();
        _impl->totalBytes += it->second.sizeBytes;
        _impl->dirty = true;
    }

    log::info("Cache compress: re-encoded {} blobs, {} -> {} bytes",
              result.reencoded,
              result.bytesBefore,
              result.bytesAfter);

    if (result.reencoded)
    {
        _impl->markMutated();
        _impl->notifySizeChanged(stats());
    }
    return result;
}

auto CacheEngine::unusedStats() const -> EntryTally
{
    auto lock = std::shared_lock(_impl->mutex);
    auto tally = EntryTally {};
    for (auto const& [key, entry]: _impl->index)
    {
        if (entry.hitCount == 0 && _impl->pinsOf(key) == 0)
        {
            ++tally.count;
            tally.bytes += entry.sizeBytes;
        }
    }
    return tally;
}

auto CacheEngine::removeUnused() -> EntryTally
{
    auto tally = EntryTally {};
    auto stats = CacheStats {};
    {
        auto lock = std::unique_lock(_impl->mutex);
        for (auto it = _impl->index.begin(); it != _impl->index.end();)
        {
            auto const next = std::next(it);
            if (it->second.hitCount == 0 && _impl->pinsOf(it->first) == 0)
            {
                ++tally.count;
                tally.bytes += it->second.sizeBytes;
                _impl->remove(it);
            }
            it = next;
        }
        stats = _impl->currentStats();
    }

    log::info("Cache: removed {} unused entries ({} bytes)", tally.count, tally.bytes);
    if (tally.count)
    {
        _impl->markMutated();
        _impl->notifySizeChanged(stats);
    }
    return tally;
}

auto CacheEngine::clear() -> EntryTally
{
    auto tally = EntryTally {};
    auto stats = CacheStats {};
    {
        auto lock = std::unique_lock(_impl->mutex);
        tally.count = _impl->index.size();
        tally.bytes = _impl->totalBytes;
        while (!_impl->index.empty())
            _impl->remove(_impl->index.begin());
        _impl->pins.clear();
        _impl->touchOrder.clear();
        _impl->totalBytes = 0;
        _impl->dirty = true;
        stats = _impl->currentStats();
    }

    log::info("Cache cleared ({} entries, {} bytes)", tally.count, tally.bytes);
    _impl->markMutated();
    _impl->notifySizeChanged(stats);
    return tally;
}

void CacheEngine::setLimit(std::uint64_t limitBytes)
{
    auto stats = CacheStats {};
    {
        auto lock = std::unique_lock(_impl->mutex);
        _impl->config.limitBytes = limitBytes;
        _impl->evictLocked({});
        stats = _impl->currentStats();
    }

    log::info("Cache limit set to {} bytes", limitBytes);
    _impl->markMutated();
    _impl->notifySizeChanged(stats);
}

auto CacheEngine::stats() const -> CacheStats
{
    auto lock = std::shared_lock(_impl->mutex);
    return _impl->currentStats();
}

auto CacheEngine::flush() -> VoidResult
{
    {
        auto lock = std::lock_guard(_impl->saveMutex);
        _impl->saveDue.reset();
    }
    _impl->saveCv.notify_all();

    if (!_impl->dirty)
        return {};
    return _impl->saveIndex();
}

auto CacheEngine::directory() const -> const std::filesystem::path&
{
    return _impl->config.directory;
}

auto CacheEngine::blobPath(std::string_view key) const -> std::filesystem::path
{
    return blobPathFor(_impl->config.directory, key);
}

void CacheEngine::onSizeChanged(SizeChangedCallback callback)
{
    auto lock = std::lock_guard(_impl->callbackMutex);
    _impl->sizeChanged = std::move(callback);
}

} // namespace chatvox
