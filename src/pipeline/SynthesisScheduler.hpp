// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <pipeline/Message.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <stop_token>
#include <string>
#include <vector>

namespace chatvox
{

class CacheEngine;
class SynthesisClient;
class VoiceQueueManager;

constexpr auto MinBatchSize = std::size_t { 1 };
constexpr auto MaxBatchSize = std::size_t { 6 };

struct SchedulerConfig
{
    std::size_t batchSize = 2;
    std::size_t maxBatchTextLength = 200;
    std::size_t maxConcurrency = 2;
    std::chrono::milliseconds timeout { 300'000 };
    std::chrono::milliseconds waitingForCacheTimeout { 120'000 };
};

/// @brief Called when a batch was handed to the synthesis client.
using BatchStartedCallback = std::function<void(std::string_view voice, std::size_t count)>;

/// @brief Called when a batch finished. Not called for batches discarded after cancellation.
using BatchCompletedCallback = std::function<void(std::string_view voice, std::size_t count, bool success)>;

/// @brief Drives messages from Queued to Ready.
///
/// Each runCycle() takes batches from the voice queues, resolves cache hits
/// directly and sends the misses to the synthesis client on a worker thread.
/// At most one request per voice is in flight, and at most maxConcurrency overall.
/// Messages whose cache key is already being synthesized wait for that request
/// instead of being sent again.
class SynthesisScheduler
{
  public:
    SynthesisScheduler(VoiceQueueManager& queue, CacheEngine& cache, SynthesisClient& client, SchedulerConfig config);
    ~SynthesisScheduler();

    SynthesisScheduler(const SynthesisScheduler&) = delete;
    SynthesisScheduler& operator=(const SynthesisScheduler&) = delete;

    /// @brief One scheduling pass. Never blocks on synthesis.
    void runCycle();

    /// @brief Sets the batch size, clamped to [MinBatchSize, MaxBatchSize].
    void setBatchSize(std::size_t size);
    [[nodiscard]] auto batchSize() const -> std::size_t { return _batchSize.load(); }

    /// @brief While unavailable, runCycle() dispatches nothing.
    void setServerAvailable(bool available);
    [[nodiscard]] auto serverAvailable() const -> bool { return _serverAvailable.load(); }

    /// @brief Cancels in-flight requests; their messages fail and late results are discarded.
    void cancelInFlight();

    [[nodiscard]] auto inFlightCount() const -> std::size_t;

    /// @brief Blocks until no request is in flight.
    void waitIdle();

    void setBatchStartedCallback(BatchStartedCallback callback);
    void setBatchCompletedCallback(BatchCompletedCallback callback);

  private:
    struct InFlight
    {
        std::uint64_t epoch = 0;
        std::string voice;
        std::vector<QueuedMessage> messages;
        std::stop_source stopSource;
        std::shared_future<void> done;
    };

    void reapFinished();
    void expireWaiting();
    void dispatch(std::vector<QueuedMessage> batch);
    void complete(std::uint64_t epoch,
                  const std::string& voice,
                  const std::vector<QueuedMessage>& messages,
                  Result<std::vector<AudioBlob>> result);
    void markFailed(MessageId id, const std::string& reason);

    /// @brief Adds @p message as a waiter if its key is being synthesized right now.
    auto registerWaiter(const QueuedMessage& message) -> bool;
    void dropWaiter(const QueuedMessage& message);

    VoiceQueueManager& _queue;
    CacheEngine& _cache;
    SynthesisClient& _client;
    SchedulerConfig _config;

    std::atomic<std::size_t> _batchSize;
    std::atomic<bool> _serverAvailable = true;

    mutable std::mutex _mutex;
    std::uint64_t _epoch = 0;
    std::vector<InFlight> _inFlight;
    std::map<std::string, std::vector<MessageId>, std::less<>> _waiters; ///< cache key -> duplicates

    std::mutex _callbackMutex;
    BatchStartedCallback _batchStarted;
    BatchCompletedCallback _batchCompleted;
};

} // namespace chatvox
