// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <pipeline/Message.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace chatvox
{

class AudioSink;
class CacheEngine;
class VoiceQueueManager;

constexpr auto MaxPlaybackDelay = std::chrono::milliseconds { 300'000 };

struct PlaybackConfig
{
    /// @brief Pause between the end of one message and the start of the next.
    std::chrono::milliseconds delay { 5000 };

    /// @brief Global volume in percent (0-100).
    int volumePercent = 100;

    /// @brief Per-voice volume in percent (0-100). Voices not listed play at 100%.
    std::map<std::string, int, std::less<>> voiceVolumes;
};

/// @brief Called when a message starts or finishes playing.
using PlaybackCallback = std::function<void(const QueuedMessage& message)>;

/// @brief Plays Ready messages one at a time, strictly in arrival order.
///
/// A message never plays while an older message is still waiting for audio, so
/// a slow voice holds back faster ones instead of being overtaken.
class PlaybackController
{
  public:
    PlaybackController(VoiceQueueManager& queue, CacheEngine& cache, AudioSink& sink, PlaybackConfig config);

    PlaybackController(const PlaybackController&) = delete;
    PlaybackController& operator=(const PlaybackController&) = delete;

    /// @brief Plays the next message if its turn has come and the delay has elapsed.
    ///
    /// Blocks for the duration of the playback.
    /// @return true if a message was taken off the queue.
    auto tryPlayNext() -> bool;

    /// @brief Interrupts the current playback, also when the audio has not reached the sink yet.
    ///
    /// The next message may start without delay.
    void skipCurrent();

    [[nodiscard]] auto isPlaying() const -> bool { return _current.load() != 0; }

    /// @brief Id of the message being played, if any.
    [[nodiscard]] auto currentMessage() const -> std::optional<MessageId>;

    void setDelay(std::chrono::milliseconds delay);
    [[nodiscard]] auto delay() const -> std::chrono::milliseconds;

    void setVolume(int percent);
    [[nodiscard]] auto volume() const -> int;

    void setVoiceVolume(std::string_view voice, int percent);

    /// @brief Linear gain for @p voice: global percent times voice percent.
    [[nodiscard]] auto effectiveVolume(std::string_view voice) const -> float;

    void setPlaybackStartedCallback(PlaybackCallback callback);
    void setPlaybackFinishedCallback(PlaybackCallback callback);

  private:
    auto finish(MessageId id, std::optional<std::string> error) -> std::optional<QueuedMessage>;

    VoiceQueueManager& _queue;
    CacheEngine& _cache;
    AudioSink& _sink;

    mutable std::mutex _mutex;
    PlaybackConfig _config;
    std::optional<std::chrono::steady_clock::time_point> _lastPlaybackEnd;
    bool _skipDelay = false;
    std::stop_source _playbackStop; ///< One per playback; triggered by skipCurrent().

    std::atomic<MessageId> _current { 0 };

    std::mutex _callbackMutex;
    PlaybackCallback _started;
    PlaybackCallback _finished;
};

} // namespace chatvox
