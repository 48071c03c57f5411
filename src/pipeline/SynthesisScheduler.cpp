// SPDX-License-Identifier: Apache-2.0
#include "SynthesisScheduler.hpp"

#include <cache/CacheEngine.hpp>
#include <core/Log.hpp>
#include <pipeline/SynthesisClient.hpp>
#include <pipeline/VoiceQueueManager.hpp>

#include <algorithm>
#include <format>
#include <set>

namespace chatvox
{

SynthesisScheduler::SynthesisScheduler(VoiceQueueManager& queue,
                                       CacheEngine& cache,
                                       SynthesisClient& client,
                                       SchedulerConfig config):
    _queue(queue),
    _cache(cache),
    _client(client),
    _config(std::move(config)),
    _batchSize(std::clamp(_config.batchSize, MinBatchSize, MaxBatchSize))
{
    _config.maxConcurrency = std::max<std::size_t>(_config.maxConcurrency, 1);
}

SynthesisScheduler::~SynthesisScheduler()
{
    {
        auto lock = std::lock_guard(_mutex);
        ++_epoch;
        for (auto& request: _inFlight)
            request.stopSource.request_stop();
    }
    waitIdle();
}

void SynthesisScheduler::runCycle()
{
    reapFinished();
    expireWaiting();

    if (!_serverAvailable)
        return;

    while (true)
    {
        auto busyVoices = std::set<std::string, std::less<>> {};
        {
            auto lock = std::lock_guard(_mutex);
            if (_inFlight.size() >= _config.maxConcurrency)
                return;
            for (auto const& request: _inFlight)
                busyVoices.insert(request.voice);
        }

        auto batch = _queue.takeBatch(_batchSize, _config.maxBatchTextLength, busyVoices);
        if (batch.empty())
            return;

        dispatch(std::move(batch));
    }
}

void SynthesisScheduler::dispatch(std::vector<QueuedMessage> batch)
{
    auto const voice = batch.front().voice;
    auto misses = std::vector<QueuedMessage> {};

    for (auto& message: batch)
    {
        // Same key already being produced: wait for it instead of synthesizing twice.
        // The queue update runs unlocked because it invokes state callbacks.
        if (registerWaiter(message))
        {
            if (auto result = _queue.update(message.id, MessageEvent::AwaitDuplicate); !result)
            {
                // Either the source already resolved this waiter, or the message left the queue.
                log::debug("{}", result.error());
                if (auto const current = _queue.find(message.id); !current || isTerminal(current->state))
                    dropWaiter(message);
            }
            continue;
        }

        if (_cache.lookup(message.cacheKey))
        {
            auto result =
                _queue.update(message.id, MessageEvent::AudioReady, [](QueuedMessage& m) { m.wasCacheHit = true; });
            if (result)
                log::debug("Message #{} served from cache ({})", message.id, message.cacheKey);
            else
                log::debug("{}", result.error());
            continue;
        }

        if (auto result = _queue.update(message.id, MessageEvent::StartSynthesis); !result)
        {
            log::debug("{}", result.error());
            continue;
        }

        {
            auto lock = std::lock_guard(_mutex);
            _waiters.try_emplace(message.cacheKey);
        }
        misses.push_back(std::move(message));
    }

    if (misses.empty())
        return;

    auto started = BatchStartedCallback {};
    {
        auto lock = std::lock_guard(_callbackMutex);
        started = _batchStarted;
    }
    if (started)
        started(voice, misses.size());

    log::info("Synthesizing {} message(s) for voice {}", misses.size(), voice);

    auto lock = std::lock_guard(_mutex);
    auto request = InFlight {
        .epoch = _epoch,
        .voice = voice,
        .messages = std::move(misses),
    };
    request.done = std::async(std::launch::async,
                              [this,
                               epoch = request.epoch,
                               voice,
                               messages = request.messages,
                               token = request.stopSource.get_token()] {
                                  auto requests = std::vector<SynthesisRequest> {};
                                  requests.reserve(messages.size());
                                  for (auto const& m: messages)
                                      requests.push_back({ .text = m.text, .voice = m.voice, .params = m.params });

                                  auto result = Result<std::vector<AudioBlob>> {};
                                  try
                                  {
                                      result = _client.synthesizeBatch(requests, token, _config.timeout);
                                  }
                                  catch (const std::exception& e)
                                  {
                                      result = makeError(ErrorCode::SynthesisError, e.what());
                                  }
                                  complete(epoch, voice, messages, std::move(result));
                              })
                       .share();
    _inFlight.push_back(std::move(request));
}

void SynthesisScheduler::complete(std::uint64_t epoch,
                                  const std::string& voice,
                                  const std::vector<QueuedMessage>& messages,
                                  Result<std::vector<AudioBlob>> result)
{
    {
        auto lock = std::lock_guard(_mutex);
        if (epoch != _epoch)
        {
            log::info("Discarding synthesis result for {} cancelled message(s) of voice {}", messages.size(), voice);
            return;
        }
    }

    if (result && result->size() != messages.size())
        result = makeError(ErrorCode::SynthesisError,
                           std::format("Expected {} audio blobs, received {}", messages.size(), result->size()));

    auto const takeWaiters = [this](const std::string& key) {
        auto lock = std::lock_guard(_mutex);
        auto waiters = std::vector<MessageId> {};
        if (auto const it = _waiters.find(key); it != _waiters.end())
        {
            waiters = std::move(it->second);
            _waiters.erase(it);
        }
        return waiters;
    };

    if (!result)
    {
        log::error("Synthesis of {} message(s) for voice {} failed: {}", messages.size(), voice, result.error());
        for (auto const& message: messages)
        {
            markFailed(message.id, result.error().message);
            for (auto const waiter: takeWaiters(message.cacheKey))
                markFailed(waiter, result.error().message);
        }
    }
    else
    {
        for (auto i = std::size_t { 0 }; i < messages.size(); ++i)
        {
            auto const& message = messages[i];
            auto& blob = (*result)[i];

            auto fallback = std::shared_ptr<const AudioBlob> {};
            if (auto stored = _cache.put(message.cacheKey, blob); !stored)
            {
                log::warning("Message #{}: cannot cache audio, keeping it in memory: {}", message.id, stored.error());
                fallback = std::make_shared<const AudioBlob>(std::move(blob));
            }

            auto ready = _queue.update(
                message.id, MessageEvent::AudioReady, [&](QueuedMessage& m) { m.audioFallback = fallback; });
            if (!ready)
                log::debug("{}", ready.error());

            for (auto const waiter: takeWaiters(message.cacheKey))
            {
                auto resolved = _queue.update(waiter, MessageEvent::AudioReady, [&](QueuedMessage& m) {
                    m.wasCacheHit = true;
                    m.audioFallback = fallback;
                });
                if (!resolved)
                    log::debug("{}", resolved.error());
            }
        }
    }

    auto completed = BatchCompletedCallback {};
    {
        auto lock = std::lock_guard(_callbackMutex);
        completed = _batchCompleted;
    }
    if (completed)
        completed(voice, messages.size(), result.has_value());
}

auto SynthesisScheduler::registerWaiter(const QueuedMessage& message) -> bool
{
    auto lock = std::lock_guard(_mutex);
    auto const waiting = _waiters.find(message.cacheKey);
    if (waiting == _waiters.end())
        return false;
    waiting->second.push_back(message.id);
    return true;
}

void SynthesisScheduler::dropWaiter(const QueuedMessage& message)
{
    auto lock = std::lock_guard(_mutex);
    if (auto const it = _waiters.find(message.cacheKey); it != _waiters.end())
        std::erase(it->second, message.id);
}

void SynthesisScheduler::markFailed(MessageId id, const std::string& reason)
{
    auto result = _queue.update(id, MessageEvent::Fail, [&](QueuedMessage& m) { m.error = reason; });
    if (!result)
        log::debug("{}", result.error());
}

void SynthesisScheduler::reapFinished()
{
    auto lock = std::lock_guard(_mutex);
    std::erase_if(_inFlight, [](const InFlight& request) {
        return request.done.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    });
}

void SynthesisScheduler::expireWaiting()
{
    auto const deadline = Clock::now() - _config.waitingForCacheTimeout;
    for (auto const& message: _queue.snapshot())
    {
        if (message.state != MessageState::WaitingForCache)
            continue;
        auto const since = message.enteredAt(MessageState::WaitingForCache);
        if (!since || *since > deadline)
            continue;

        dropWaiter(message);
        log::warning("Message #{} timed out waiting for duplicate synthesis of {}", message.id, message.cacheKey);
        markFailed(message.id, "Timed out waiting for duplicate synthesis");
    }
}

void SynthesisScheduler::setBatchSize(std::size_t size)
{
    _batchSize = std::clamp(size, MinBatchSize, MaxBatchSize);
    log::info("Synthesis batch size set to {}", _batchSize.load());
}

void SynthesisScheduler::setServerAvailable(bool available)
{
    if (_serverAvailable.exchange(available) != available)
        log::info("Synthesis service {}", available ? "available" : "unavailable");
}

void SynthesisScheduler::cancelInFlight()
{
    auto affected = std::vector<MessageId> {};
    {
        auto lock = std::lock_guard(_mutex);
        ++_epoch;
        for (auto& request: _inFlight)
        {
            request.stopSource.request_stop();
            for (auto const& message: request.messages)
                affected.push_back(message.id);
        }
        for (auto const& [key, waiters]: _waiters)
            affected.insert(affected.end(), waiters.begin(), waiters.end());
        _waiters.clear();
    }

    if (!affected.empty())
        log::info("Cancelling synthesis of {} message(s)", affected.size());
    for (auto const id: affected)
        markFailed(id, "Synthesis cancelled");
}

auto SynthesisScheduler::inFlightCount() const -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    return static_cast<std::size_t>(std::ranges::count_if(_inFlight, [](const InFlight& request) {
        return request.done.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
    }));
}

void SynthesisScheduler::waitIdle()
{
    while (true)
    {
        auto pending = std::vector<std::shared_future<void>> {};
        {
            auto lock = std::lock_guard(_mutex);
            for (auto const& request: _inFlight)
                pending.push_back(request.done);
        }
        if (pending.empty())
            return;

        for (auto const& done: pending)
            done.wait();
        reapFinished();
    }
}

void SynthesisScheduler::setBatchStartedCallback(BatchStartedCallback callback)
{
    auto lock = std::lock_guard(_callbackMutex);
    _batchStarted = std::move(callback);
}

void SynthesisScheduler::setBatchCompletedCallback(BatchCompletedCallback callback)
{
    auto lock = std::lock_guard(_callbackMutex);
    _batchCompleted = std::move(callback);
}

} // namespace chatvox
