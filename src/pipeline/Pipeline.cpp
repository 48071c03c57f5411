// SPDX-License-Identifier: Apache-2.0
#include "Pipeline.hpp"

#include <core/Log.hpp>
#include <core/RecurringTask.hpp>
#include <pipeline/AudioSink.hpp>
#include <pipeline/SynthesisClient.hpp>

#include <mutex>

namespace chatvox
{

struct Pipeline::Impl
{
    CacheEngine& cache;
    VoiceQueueManager queue;
    SynthesisScheduler scheduler;
    PlaybackController playback;

    std::mutex callbackMutex;
    QueueChangedCallback queueChanged;
    StateChangedCallback stateChanged;

    RecurringTask synthesisTask;
    RecurringTask playbackTask;

    Impl(CacheEngine& cache, SynthesisClient& client, AudioSink& sink, PipelineConfig config):
        cache(cache),
        queue(std::move(config.queue)),
        scheduler(queue, cache, client, std::move(config.scheduler)),
        playback(queue, cache, sink, std::move(config.playback)),
        synthesisTask("Synthesis cycle", config.cycleInterval, [this] { scheduler.runCycle(); }),
        playbackTask("Playback cycle", config.cycleInterval, [this] { playback.tryPlayNext(); })
    {
        queue.setQueueChangedCallback([this] {
            synthesisTask.wake();
            auto callback = QueueChangedCallback {};
            {
                auto lock = std::lock_guard(callbackMutex);
                callback = queueChanged;
            }
            if (callback)
                callback();
        });

        queue.setStateChangedCallback([this](const QueuedMessage& message, MessageState previous) {
            // A finished batch frees its voice; Ready or terminal messages may unblock playback.
            if (message.state == MessageState::Ready || isTerminal(message.state))
            {
                playbackTask.wake();
                synthesisTask.wake();
            }
            auto callback = StateChangedCallback {};
            {
                auto lock = std::lock_guard(callbackMutex);
                callback = stateChanged;
            }
            if (callback)
                callback(message, previous);
        });

        queue.setInvalidVoiceCallback([](std::string_view username, std::string_view voice) {
            log::warning("{} asked for unknown voice '{}'", username, voice);
        });
    }
};

Pipeline::Pipeline(CacheEngine& cache, SynthesisClient& client, AudioSink& sink, PipelineConfig config):
    _impl(std::make_unique<Impl>(cache, client, sink, std::move(config)))
{
    _impl->queue.setKnownVoices(client.availableVoices());
}

Pipeline::~Pipeline()
{
    stop();
    // Late completions call back into the tasks; settle them while the tasks still exist.
    _impl->scheduler.cancelInFlight();
    _impl->scheduler.waitIdle();
}

void Pipeline::start()
{
    _impl->synthesisTask.start();
    _impl->playbackTask.start();
    log::info("Pipeline started");
}

void Pipeline::stop()
{
    if (!isRunning())
        return;

    _impl->playback.skipCurrent();
    _impl->synthesisTask.stop();
    _impl->playbackTask.stop();
    log::info("Pipeline stopped");
}

auto Pipeline::isRunning() const -> bool
{
    return _impl->synthesisTask.isRunning() || _impl->playbackTask.isRunning();
}

auto Pipeline::enqueue(std::string_view username, std::string_view platform, std::string_view text, bool requireVoice)
    -> QueuedMessage
{
    return _impl->queue.enqueue(username, platform, text, requireVoice);
}

void Pipeline::skipCurrent()
{
    _impl->playback.skipCurrent();
    _impl->playbackTask.wake();
}

void Pipeline::skipAll()
{
    _impl->queue.skipAll();
    _impl->scheduler.cancelInFlight();
    _impl->playback.skipCurrent();
    _impl->playbackTask.wake();
}

auto Pipeline::clearCache() -> EntryTally
{
    return _impl->cache.clear();
}

auto Pipeline::compressCache() -> CompressStats
{
    return _impl->cache.compress();
}

void Pipeline::setVoiceVolume(std::string_view voice, int percent)
{
    _impl->playback.setVoiceVolume(voice, percent);
}

void Pipeline::setGlobalVolume(int percent)
{
    _impl->playback.setVolume(percent);
}

void Pipeline::setBatchSize(std::size_t size)
{
    _impl->scheduler.setBatchSize(size);
}

void Pipeline::setPlaybackDelay(std::chrono::milliseconds delay)
{
    _impl->playback.setDelay(delay);
}

auto Pipeline::queue() -> VoiceQueueManager&
{
    return _impl->queue;
}

auto Pipeline::scheduler() -> SynthesisScheduler&
{
    return _impl->scheduler;
}

auto Pipeline::playback() -> PlaybackController&
{
    return _impl->playback;
}

auto Pipeline::cache() -> CacheEngine&
{
    return _impl->cache;
}

void Pipeline::setQueueChangedCallback(QueueChangedCallback callback)
{
    auto lock = std::lock_guard(_impl->callbackMutex);
    _impl->queueChanged = std::move(callback);
}

void Pipeline::setStateChangedCallback(StateChangedCallback callback)
{
    auto lock = std::lock_guard(_impl->callbackMutex);
    _impl->stateChanged = std::move(callback);
}

void Pipeline::setCacheSizeChangedCallback(CacheEngine::SizeChangedCallback callback)
{
    _impl->cache.onSizeChanged(std::move(callback));
}

} // namespace chatvox
