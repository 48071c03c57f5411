// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <pipeline/Message.hpp>

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace chatvox
{

/// @brief How a voice name is recognized at the start of a chat message.
enum class VoiceExtractionMode : std::uint8_t
{
    Bracket,   ///< "[voice] text"
    FirstWord, ///< "voice text"
};

/// @brief Parses "bracket" or "firstword" (case-insensitive).
[[nodiscard]] auto parseExtractionMode(std::string_view name) -> std::optional<VoiceExtractionMode>;

[[nodiscard]] auto extractionModeName(VoiceExtractionMode mode) -> std::string_view;

struct QueueSettings
{
    std::string defaultVoice;
    VoiceExtractionMode extractionMode = VoiceExtractionMode::Bracket;
    SynthesisParams params;

    /// @brief How many finished messages are kept for lookups.
    std::size_t historyLimit = 100;
};

/// @brief Message counts by lifecycle stage.
struct QueueCounts
{
    std::size_t pending = 0;      ///< Queued
    std::size_t synthesizing = 0; ///< Synthesizing or WaitingForCache
    std::size_t ready = 0;
    std::size_t total = 0; ///< All non-terminal messages
};

/// @brief Called after messages were added to or removed from the queues.
using QueueChangedCallback = std::function<void()>;

/// @brief Called after a message changed state.
using StateChangedCallback = std::function<void(const QueuedMessage& message, MessageState previous)>;

/// @brief Called when a message named a voice the synthesis service does not know.
using InvalidVoiceCallback = std::function<void(std::string_view username, std::string_view voice)>;

/// @brief Owns every message in flight and the per-voice FIFO queues.
///
/// All state transitions go through this class, so they are serialized per
/// message. Callbacks are invoked on the calling thread after the internal lock
/// was released.
class VoiceQueueManager
{
  public:
    explicit VoiceQueueManager(QueueSettings settings);

    VoiceQueueManager(const VoiceQueueManager&) = delete;
    VoiceQueueManager& operator=(const VoiceQueueManager&) = delete;

    /// @brief Creates a message from chat text and appends it to its voice queue.
    ///
    /// The voice is taken from the text (see VoiceExtractionMode) when it names a
    /// known voice, otherwise the default voice is used and the text is kept whole.
    /// The cache key is computed from the current parameters.
    ///
    /// @param requireVoice Skip the message unless the text names a voice.
    /// @return The message. Its state is Skipped (and its id 0) when it was dropped.
    auto enqueue(std::string_view username, std::string_view platform, std::string_view text, bool requireVoice = false)
        -> QueuedMessage;

    /// @brief Like enqueue(), but @p boundVoice replaces the default voice.
    auto enqueueWithBinding(std::string_view username,
                            std::string_view platform,
                            std::string_view text,
                            std::string_view boundVoice) -> QueuedMessage;

    /// @brief Enqueues @p text for @p voice with explicit parameters, bypassing voice extraction.
    auto enqueueManual(std::string_view text, std::string_view voice, const SynthesisParams& params)
        -> QueuedMessage;

    /// @brief Creates a new Queued message with the content of a Failed or Skipped one.
    [[nodiscard]] auto requeue(MessageId id) -> Result<MessageId>;

    /// @brief Removes up to @p maxCount queued messages of one voice from its queue.
    ///
    /// The voice whose oldest message arrived first is chosen, skipping @p busyVoices.
    /// The batch stops before the total TTS length would exceed @p maxTextLength,
    /// but always contains at least one message. The messages stay Queued; the
    /// caller transitions them.
    [[nodiscard]] auto takeBatch(std::size_t maxCount,
                                 std::size_t maxTextLength,
                                 const std::set<std::string, std::less<>>& busyVoices = {})
        -> std::vector<QueuedMessage>;

    /// @brief Applies @p event to message @p id, then lets @p edit amend the message.
    /// @return The updated message, or InvalidTransition / InvalidArgument.
    auto update(MessageId id, MessageEvent event, const std::function<void(QueuedMessage&)>& edit = {})
        -> Result<QueuedMessage>;

    /// @brief The oldest message, provided it is Ready and nothing older is still pending.
    [[nodiscard]] auto nextPlayable() const -> std::optional<QueuedMessage>;

    /// @brief Skips every non-terminal message except the one Playing and empties all queues.
    /// @return The ids of the skipped messages.
    auto skipAll() -> std::vector<MessageId>;

    [[nodiscard]] auto find(MessageId id) const -> std::optional<QueuedMessage>;

    /// @brief All non-terminal messages, in arrival order.
    [[nodiscard]] auto snapshot() const -> std::vector<QueuedMessage>;

    /// @brief Finished messages, oldest first.
    [[nodiscard]] auto history() const -> std::vector<QueuedMessage>;

    [[nodiscard]] auto counts() const -> QueueCounts;

    /// @brief Number of ids waiting in the queue of @p voice.
    [[nodiscard]] auto queueLength(std::string_view voice) const -> std::size_t;

    /// @brief Sets the voices accepted in messages. An empty set accepts every voice.
    void setKnownVoices(std::vector<std::string> voices);
    [[nodiscard]] auto knownVoices() const -> std::vector<std::string>;

    /// @brief Resolves @p voice case-insensitively to its canonical spelling.
    [[nodiscard]] auto resolveVoice(std::string_view voice) const -> std::optional<std::string>;

    void setDefaultVoice(std::string voice);
    void setExtractionMode(VoiceExtractionMode mode);

    /// @brief Parameters captured by messages enqueued from now on.
    void setParams(SynthesisParams params);
    [[nodiscard]] auto params() const -> SynthesisParams;

    void setQueueChangedCallback(QueueChangedCallback callback);
    void setStateChangedCallback(StateChangedCallback callback);
    void setInvalidVoiceCallback(InvalidVoiceCallback callback);

  private:
    struct Notifications
    {
        bool queueChanged = false;
        std::vector<std::pair<QueuedMessage, MessageState>> stateChanges;
        std::optional<std::pair<std::string, std::string>> invalidVoice;
    };

    auto create(std::string_view username,
                std::string_view platform,
                std::string_view text,
                std::optional<std::string_view> boundVoice,
                bool requireVoice) -> QueuedMessage;

    auto admit(QueuedMessage message, Notifications& notes) -> QueuedMessage;
    auto resolveVoiceLocked(std::string_view voice) const -> std::optional<std::string>;
    void retire(std::map<MessageId, QueuedMessage>::iterator it);
    void notify(Notifications notes);

    mutable std::mutex _mutex;
    QueueSettings _settings;
    std::vector<std::string> _knownVoices;
    MessageId _nextId = 1;

    std::map<MessageId, QueuedMessage> _active;
    std::map<std::string, std::deque<MessageId>, std::less<>> _queues;
    std::deque<QueuedMessage> _history;

    std::mutex _callbackMutex;
    QueueChangedCallback _queueChanged;
    StateChangedCallback _stateChanged;
    InvalidVoiceCallback _invalidVoice;
};

} // namespace chatvox
