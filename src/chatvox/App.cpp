// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <audio/MiniaudioAudioSink.hpp>
#include <audio/PiperSynthesisClient.hpp>
#include <cache/CacheEngine.hpp>
#include <chat/ConsoleChatSource.hpp>
#include <chat/MessageFilter.hpp>
#include <core/Log.hpp>
#include <core/StringUtils.hpp>
#include <pipeline/Pipeline.hpp>

#include <charconv>
#include <chrono>
#include <format>
#include <optional>
#include <print>
#include <string>
#include <thread>

namespace chatvox
{

namespace
{

    constexpr auto DrainPollInterval = std::chrono::milliseconds { 100 };

    /// @brief Splits "verb rest" at the first space.
    auto splitCommand(std::string_view command) -> std::pair<std::string_view, std::string_view>
    {
        command = trim(command);
        auto const space = command.find(' ');
        if (space == std::string_view::npos)
            return { command, {} };
        return { command.substr(0, space), trim(command.substr(space + 1)) };
    }

    auto parseInt(std::string_view text) -> std::optional<int>
    {
        auto value = 0;
        auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc {} || ptr != text.data() + text.size())
            return std::nullopt;
        return value;
    }

} // namespace

struct App::Impl
{
    AppConfig config;
    std::unique_ptr<CacheEngine> cache;
    std::unique_ptr<PiperSynthesisClient> synthesisClient;
    std::unique_ptr<MiniaudioAudioSink> audioSink;
    std::unique_ptr<Pipeline> pipeline;
    std::unique_ptr<MessageFilter> filter;

    void printStatus() const
    {
        auto const counts = pipeline->queue().counts();
        auto const stats = cache->stats();
        std::println("queued: {}  synthesizing: {}  ready: {}  active: {}",
                     counts.pending,
                     counts.synthesizing,
                     counts.ready,
                     counts.total);
        std::println("cache: {} entries, {:.1f} of {:.1f} MB, {} pinned",
                     stats.itemCount,
                     static_cast<double>(stats.totalBytes) / (1024.0 * 1024.0),
                     static_cast<double>(stats.limitBytes) / (1024.0 * 1024.0),
                     stats.pinnedCount);
    }

    /// @brief Waits until every accepted message finished.
    void drain()
    {
        while (pipeline->queue().counts().total > 0)
            std::this_thread::sleep_for(DrainPollInterval);
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

App::~App()
{
    if (_impl->pipeline)
        _impl->pipeline->stop();
}

auto App::openCache() -> VoidResult
{
    if (_impl->cache)
        return {};

    auto cache = CacheEngine::open(toCacheConfig(_impl->config));
    if (!cache)
        return std::unexpected(cache.error());
    _impl->cache = std::move(*cache);
    return {};
}

auto App::initialize() -> VoidResult
{
    auto& config = _impl->config;

    if (auto result = openCache(); !result)
        return result;

    auto const voicesDir = config.synthesis.voicesDir.empty() ? defaultVoicesDir() : config.synthesis.voicesDir;
    _impl->synthesisClient = std::make_unique<PiperSynthesisClient>(PiperClientConfig {
        .voicesDir = voicesDir,
        .espeakDataPath = config.synthesis.espeakDataPath,
    });

    auto const voices = _impl->synthesisClient->availableVoices();
    if (voices.empty())
        return makeError(ErrorCode::ConfigError, std::format("No piper voice models found in {}", voicesDir));

    if (config.voice.defaultVoice.empty())
    {
        config.voice.defaultVoice = voices.front();
        log::info("No default voice configured, using {}", config.voice.defaultVoice);
    }

    _impl->audioSink = std::make_unique<MiniaudioAudioSink>();
    _impl->pipeline = std::make_unique<Pipeline>(
        *_impl->cache, *_impl->synthesisClient, *_impl->audioSink, toPipelineConfig(config));

    if (!_impl->pipeline->queue().resolveVoice(config.voice.defaultVoice))
        return makeError(ErrorCode::ConfigError,
                         std::format("Default voice '{}' is not available in {}", config.voice.defaultVoice, voicesDir));

    _impl->filter = std::make_unique<MessageFilter>(_impl->pipeline->queue(), toFilterRules(config));

    _impl->pipeline->setCacheSizeChangedCallback([](const CacheStats& stats) {
        log::debug("Cache size: {} bytes in {} entries (limit {})", stats.totalBytes, stats.itemCount, stats.limitBytes);
    });

    log::info("Application initialized successfully ({} voice(s), default {})", voices.size(), config.voice.defaultVoice);
    return {};
}

auto App::run(std::istream& input) -> int
{
    _impl->pipeline->start();

    auto source = ConsoleChatSource(input, *_impl->filter, [this](std::string_view command) { handleCommand(command); });
    auto const lines = source.run();

    log::info("Input finished after {} chat line(s), waiting for playback to complete", lines);
    _impl->drain();
    _impl->pipeline->stop();

    if (auto result = _impl->cache->flush(); !result)
    {
        log::error("Failed to save cache index: {}", result.error());
        return 1;
    }
    return 0;
}

void App::handleCommand(std::string_view command)
{
    auto& pipeline = *_impl->pipeline;
    auto const [verb, args] = splitCommand(command);

    if (verb == "skip")
        pipeline.skipCurrent();
    else if (verb == "skipall" || verb == "clear")
        pipeline.skipAll();
    else if (verb == "status")
        _impl->printStatus();
    else if (verb == "clearcache")
        clearCache();
    else if (verb == "compress")
        compressCache();
    else if (verb == "volume")
    {
        if (auto const percent = parseInt(args))
            pipeline.setGlobalVolume(*percent);
        else
            log::warning("Usage: /volume <percent>");
    }
    else if (verb == "voicevolume")
    {
        auto const [voice, value] = splitCommand(args);
        if (auto const percent = parseInt(value); percent && !voice.empty())
            pipeline.setVoiceVolume(voice, *percent);
        else
            log::warning("Usage: /voicevolume <voice> <percent>");
    }
    else if (verb == "batch")
    {
        if (auto const size = parseInt(args); size && *size > 0)
            pipeline.setBatchSize(static_cast<std::size_t>(*size));
        else
            log::warning("Usage: /batch <1-6>");
    }
    else if (verb == "delay")
    {
        if (auto const ms = parseInt(args); ms && *ms >= 0)
            pipeline.setPlaybackDelay(std::chrono::milliseconds(*ms));
        else
            log::warning("Usage: /delay <milliseconds>");
    }
    else if (verb == "requeue")
    {
        auto const id = parseInt(args);
        if (!id || *id <= 0)
        {
            log::warning("Usage: /requeue <message id>");
            return;
        }
        if (auto result = pipeline.queue().requeue(static_cast<MessageId>(*id)); !result)
            log::warning("Cannot requeue: {}", result.error());
    }
    else
        log::warning("Unknown command '/{}'", verb);
}

void App::clearCache()
{
    auto const removed = _impl->cache->clear();
    std::println("Removed {} cached clip(s), {} bytes", removed.count, removed.bytes);
}

void App::compressCache()
{
    auto const stats = _impl->cache->compress();
    std::println("Re-encoded {} clip(s): {} -> {} bytes", stats.reencoded, stats.bytesBefore, stats.bytesAfter);
}

} // namespace chatvox
