// SPDX-License-Identifier: Apache-2.0
#include "PlaybackController.hpp"

#include <cache/CacheEngine.hpp>
#include <core/Log.hpp>
#include <pipeline/AudioSink.hpp>
#include <pipeline/VoiceQueueManager.hpp>

#include <algorithm>

namespace chatvox
{

PlaybackController::PlaybackController(VoiceQueueManager& queue,
                                       CacheEngine& cache,
                                       AudioSink& sink,
                                       PlaybackConfig config):
    _queue(queue), _cache(cache), _sink(sink), _config(std::move(config))
{
}

auto PlaybackController::tryPlayNext() -> bool
{
    if (isPlaying())
        return false;

    {
        auto lock = std::lock_guard(_mutex);
        auto const now = std::chrono::steady_clock::now();
        if (!_skipDelay && _lastPlaybackEnd && now - *_lastPlaybackEnd < _config.delay)
            return false;
    }

    auto next = _queue.nextPlayable();
    if (!next)
        return false;

    auto const id = next->id;
    auto const& key = next->cacheKey;

    // From here on skipCurrent() applies to this message.
    auto stopToken = std::stop_token {};
    {
        auto lock = std::lock_guard(_mutex);
        _skipDelay = false;
        _playbackStop = std::stop_source {};
        stopToken = _playbackStop.get_token();
        _current = id;
    }

    // Pin first so the entry cannot be evicted between the lookup and the read.
    _cache.pin(key);
    auto playing = _queue.update(id, MessageEvent::StartPlayback);
    if (!playing)
    {
        _cache.unpin(key);
        {
            auto lock = std::lock_guard(_mutex);
            _current = 0;
        }
        log::warning("Cannot start playback: {}", playing.error());
        return false;
    }

    auto blob = _cache.get(key);
    if (!blob && playing->audioFallback)
        blob = *playing->audioFallback;

    auto error = std::optional<std::string> {};
    if (!blob)
    {
        error = "Audio not available";
        log::error("Message #{}: no audio in cache ({}) or memory", id, key);
    }
    else if (stopToken.stop_requested())
    {
        log::info("Message #{} skipped before playback started", id);
    }
    else
    {
        auto started = PlaybackCallback {};
        {
            auto lock = std::lock_guard(_callbackMutex);
            started = _started;
        }
        if (started)
            started(*playing);

        log::info("Playing message #{} from {} ({}): \"{}\"", id, playing->username, playing->voice, playing->displayText());
        if (auto played = _sink.play(*blob, effectiveVolume(playing->voice), stopToken); !played)
        {
            error = played.error().message;
            log::error("Message #{}: playback failed: {}", id, played.error());
        }
    }

    _cache.unpin(key);
    auto const finished = finish(id, std::move(error));

    auto callback = PlaybackCallback {};
    {
        auto lock = std::lock_guard(_callbackMutex);
        callback = _finished;
    }
    if (callback && finished)
        callback(*finished);
    return true;
}

auto PlaybackController::finish(MessageId id, std::optional<std::string> error) -> std::optional<QueuedMessage>
{
    {
        auto lock = std::lock_guard(_mutex);
        _lastPlaybackEnd = std::chrono::steady_clock::now();
        _current = 0;
    }

    auto done = _queue.update(id, MessageEvent::Finish, [&](QueuedMessage& m) { m.error = std::move(error); });
    if (!done)
    {
        log::warning("Cannot finish playback: {}", done.error());
        return std::nullopt;
    }
    return *done;
}

void PlaybackController::skipCurrent()
{
    auto lock = std::lock_guard(_mutex);
    _skipDelay = true;
    if (auto const id = _current.load(); id != 0)
    {
        log::info("Skipping playback of message #{}", id);
        _playbackStop.request_stop();
    }
}

auto PlaybackController::currentMessage() const -> std::optional<MessageId>
{
    if (auto const id = _current.load(); id != 0)
        return id;
    return std::nullopt;
}

void PlaybackController::setDelay(std::chrono::milliseconds delay)
{
    auto lock = std::lock_guard(_mutex);
    _config.delay = std::clamp(delay, std::chrono::milliseconds::zero(), MaxPlaybackDelay);
}

auto PlaybackController::delay() const -> std::chrono::milliseconds
{
    auto lock = std::lock_guard(_mutex);
    return _config.delay;
}

void PlaybackController::setVolume(int percent)
{
    auto lock = std::lock_guard(_mutex);
    _config.volumePercent = std::clamp(percent, 0, 100);
}

auto PlaybackController::volume() const -> int
{
    auto lock = std::lock_guard(_mutex);
    return _config.volumePercent;
}

void PlaybackController::setVoiceVolume(std::string_view voice, int percent)
{
    auto lock = std::lock_guard(_mutex);
    _config.voiceVolumes.insert_or_assign(std::string(voice), std::clamp(percent, 0, 100));
}

auto PlaybackController::effectiveVolume(std::string_view voice) const -> float
{
    auto lock = std::lock_guard(_mutex);
    auto voicePercent = 100;
    if (auto const it = _config.voiceVolumes.find(voice); it != _config.voiceVolumes.end())
        voicePercent = it->second;
    return static_cast<float>(_config.volumePercent) / 100.0f * static_cast<float>(voicePercent) / 100.0f;
}

void PlaybackController::setPlaybackStartedCallback(PlaybackCallback callback)
{
    auto lock = std::lock_guard(_callbackMutex);
    _started = std::move(callback);
}

void PlaybackController::setPlaybackFinishedCallback(PlaybackCallback callback)
{
    auto lock = std::lock_guard(_callbackMutex);
    _finished = std::move(callback);
}

} // namespace chatvox
