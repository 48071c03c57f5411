// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cache/CacheEngine.hpp>
#include <pipeline/PlaybackController.hpp>
#include <pipeline/SynthesisScheduler.hpp>
#include <pipeline/VoiceQueueManager.hpp>

#include <chrono>
#include <memory>
#include <string_view>

namespace chatvox
{

class AudioSink;
class SynthesisClient;

struct PipelineConfig
{
    QueueSettings queue;
    SchedulerConfig scheduler;
    PlaybackConfig playback;

    /// @brief Interval of both the synthesis and the playback cycle.
    std::chrono::milliseconds cycleInterval { 100 };
};

/// @brief Wires queue, scheduler, cache and playback together and runs both cycles.
///
/// The synthesis cycle and the playback cycle each run on their own thread and
/// never overlap with themselves. State changes wake the cycle that can act on
/// them, so the interval only bounds the latency of time-based decisions.
class Pipeline
{
  public:
    Pipeline(CacheEngine& cache, SynthesisClient& client, AudioSink& sink, PipelineConfig config);
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    void start();

    /// @brief Stops both cycles. Playback in progress is interrupted.
    void stop();

    [[nodiscard]] auto isRunning() const -> bool;

    /// @brief Enqueues a chat message; see VoiceQueueManager::enqueue().
    auto enqueue(std::string_view username, std::string_view platform, std::string_view text, bool requireVoice = false)
        -> QueuedMessage;

    void skipCurrent();

    /// @brief Skips every queued message, cancels synthesis and interrupts playback.
    void skipAll();

    auto clearCache() -> EntryTally;
    auto compressCache() -> CompressStats;

    void setVoiceVolume(std::string_view voice, int percent);
    void setGlobalVolume(int percent);
    void setBatchSize(std::size_t size);
    void setPlaybackDelay(std::chrono::milliseconds delay);

    [[nodiscard]] auto queue() -> VoiceQueueManager&;
    [[nodiscard]] auto scheduler() -> SynthesisScheduler&;
    [[nodiscard]] auto playback() -> PlaybackController&;
    [[nodiscard]] auto cache() -> CacheEngine&;

    void setQueueChangedCallback(QueueChangedCallback callback);
    void setStateChangedCallback(StateChangedCallback callback);
    void setCacheSizeChangedCallback(CacheEngine::SizeChangedCallback callback);

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace chatvox
